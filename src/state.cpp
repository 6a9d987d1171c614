#include "procrt/state.hpp"

#include <array>

namespace procrt {

std::optional<ProcessState> next_state(ProcessState from, Transition t) {
    switch (from) {
    case ProcessState::Queued:
        switch (t) {
        case Transition::Start:         return ProcessState::Running;
        case Transition::RequestCancel: return ProcessState::Cancelling;
        case Transition::Fail:          return ProcessState::Failed;
        case Transition::Complete:
        case Transition::FinishCancel:
        case Transition::Pause:
        case Transition::Resume:        return std::nullopt;
        }
        break;
    case ProcessState::Running:
        switch (t) {
        case Transition::Complete:      return ProcessState::Completed;
        case Transition::Fail:          return ProcessState::Failed;
        case Transition::RequestCancel: return ProcessState::Cancelling;
        case Transition::Pause:         return ProcessState::Paused;
        case Transition::Start:
        case Transition::FinishCancel:
        case Transition::Resume:        return std::nullopt;
        }
        break;
    case ProcessState::Paused:
        switch (t) {
        case Transition::Resume:        return ProcessState::Running;
        case Transition::RequestCancel: return ProcessState::Cancelling;
        case Transition::Fail:          return ProcessState::Failed;
        case Transition::Start:
        case Transition::Complete:
        case Transition::FinishCancel:
        case Transition::Pause:         return std::nullopt;
        }
        break;
    case ProcessState::Cancelling:
        switch (t) {
        case Transition::FinishCancel:  return ProcessState::Cancelled;
        case Transition::Start:
        case Transition::Complete:
        case Transition::Fail:
        case Transition::RequestCancel:
        case Transition::Pause:
        case Transition::Resume:        return std::nullopt;
        }
        break;
    case ProcessState::Completed:
    case ProcessState::Failed:
    case ProcessState::Cancelled:
        return std::nullopt;
    }
    return std::nullopt;
}

bool is_terminal(ProcessState s) {
    return s == ProcessState::Completed || s == ProcessState::Failed || s == ProcessState::Cancelled;
}

bool holds_reservation(ProcessState s) { return !is_terminal(s); }

namespace {
constexpr std::array<std::string_view, 7> kStateNames{
    "queued", "running", "paused", "cancelling", "completed", "failed", "cancelled"};
}

std::string_view to_string(ProcessState s) {
    return kStateNames[static_cast<size_t>(s)];
}

std::string_view to_string(Transition t) {
    switch (t) {
    case Transition::Start:         return "start";
    case Transition::Complete:      return "complete";
    case Transition::Fail:          return "fail";
    case Transition::RequestCancel: return "request_cancel";
    case Transition::FinishCancel:  return "finish_cancel";
    case Transition::Pause:         return "pause";
    case Transition::Resume:        return "resume";
    }
    return "unknown";
}

std::optional<ProcessState> parse_state(std::string_view name) {
    for (size_t i = 0; i < kStateNames.size(); ++i) {
        if (kStateNames[i] == name) return static_cast<ProcessState>(i);
    }
    return std::nullopt;
}

} // namespace procrt
