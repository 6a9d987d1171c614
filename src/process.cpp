#include "procrt/process.hpp"

#include <array>

namespace procrt {

namespace {
constexpr std::array<std::string_view, kProcessTypeCount> kTypeNames{
    "download", "upload", "delete", "hide", "seek", "install", "uninstall",
    "antivirus", "edit_log", "format", "hack", "bank_hack", "port_scan"};
}

std::string_view to_string(ProcessType t) {
    return kTypeNames[static_cast<size_t>(t)];
}

std::optional<ProcessType> parse_process_type(std::string_view name) {
    for (size_t i = 0; i < kTypeNames.size(); ++i) {
        if (kTypeNames[i] == name) return static_cast<ProcessType>(i);
    }
    return std::nullopt;
}

bool is_transfer(ProcessType t) {
    return t == ProcessType::Download || t == ProcessType::Upload;
}

int64_t to_millis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp from_millis(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace procrt
