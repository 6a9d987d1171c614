#pragma once
#include <optional>
#include <string_view>

namespace procrt {

enum class ProcessState { Queued, Running, Paused, Cancelling, Completed, Failed, Cancelled };

enum class Transition { Start, Complete, Fail, RequestCancel, FinishCancel, Pause, Resume };

/// The only place legal moves are defined; std::nullopt means the move is illegal.
std::optional<ProcessState> next_state(ProcessState from, Transition t);

bool is_terminal(ProcessState s);
// Queued, Running, Paused and Cancelling records still hold their reservation.
bool holds_reservation(ProcessState s);

std::string_view to_string(ProcessState s);
std::string_view to_string(Transition t);
std::optional<ProcessState> parse_state(std::string_view name);

} // namespace procrt
