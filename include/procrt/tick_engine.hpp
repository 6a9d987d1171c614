#pragma once
#include "cancellation.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "store.hpp"
#include "throughput.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace procrt {

enum class TickOutcome {
    Advanced,
    Started,
    Completed,
    Cancelled,
    Failed,
    Paused,
    Skipped,   // terminal record
    NotFound,
    StoreUnavailable,
};

std::string_view to_string(TickOutcome o);

struct TickResult {
    ProcessId process_id{};
    TickOutcome outcome{TickOutcome::Skipped};
    ProcessState state{ProcessState::Queued};
    double progress{0.0};
    std::string message;
};

struct SuspendResult {
    bool ok{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
    ProcessState state{ProcessState::Queued};
};

/// Advances in-flight processes. Every call is one transaction on one record;
/// the record's row lock is held from the first read to commit, so racing
/// calls on the same record serialize and only one of them credits.
class TickEngine {
public:
    TickEngine(Store& store, const ThroughputPolicy& policy, EventBus& events);

    TickResult tick(ProcessId pid, Seconds elapsed, Timestamp now);
    // Elapsed time is taken from the record's own checkpoint.
    TickResult advance_to(ProcessId pid, Timestamp now);

    // Owner-initiated suspension. Pausing first accounts the work done up to now.
    SuspendResult pause(ProcessId pid, OwnerId owner, Timestamp now);
    SuspendResult resume(ProcessId pid, OwnerId owner, Timestamp now);

private:
    TickResult run(ProcessId pid, std::optional<Seconds> elapsed, Timestamp now);
    std::optional<LifecycleEvent> advance(Transaction& txn, ProcessRecord& rec, double seconds, Timestamp now,
                                          TickResult& res);
    SuspendResult suspend(ProcessId pid, OwnerId owner, Transition t, Timestamp now);

    Store& store_;
    const ThroughputPolicy& policy_;
    EventBus& events_;
};

} // namespace procrt
