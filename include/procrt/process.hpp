#pragma once
#include "resources.hpp"
#include "state.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace procrt {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Seconds = std::chrono::duration<double>;

using ProcessId = uint64_t;
using OwnerId = uint64_t;
using ServerId = uint64_t;

enum class ProcessType {
    Download,
    Upload,
    Delete,
    Hide,
    Seek,
    Install,
    Uninstall,
    Antivirus,
    EditLog,
    Format,
    Hack,
    BankHack,
    PortScan,
};

inline constexpr size_t kProcessTypeCount = 13;

std::string_view to_string(ProcessType t);
std::optional<ProcessType> parse_process_type(std::string_view name);
// File transfers are paced by the network link, everything else by the CPU.
bool is_transfer(ProcessType t);

struct ProcessRecord {
    ProcessId id{};
    OwnerId owner_id{};
    ServerId gateway_server_id{};
    ServerId target_server_id{};
    ProcessType type{ProcessType::Download};
    ProcessState state{ProcessState::Queued};
    Resources reservation{};  // stored verbatim at admission, credited back verbatim
    double progress{0.0};
    double required_work{0.0};
    Timestamp created_at{};
    Timestamp last_checkpoint_at{};
    std::optional<Timestamp> completed_at{};
    Timestamp updated_at{};

    bool done() const { return progress >= required_work; }
};

int64_t to_millis(Timestamp t);
Timestamp from_millis(int64_t ms);

} // namespace procrt
