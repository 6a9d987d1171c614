#pragma once
#include "events.hpp"
#include "store.hpp"

namespace procrt {

// Moves a locked, still-reserving record to the terminal state of `t` and
// credits its reservation to the gateway pool in the same transaction. Throws
// StoreError if the gateway row is gone or the credit would overflow the pool.
LifecycleEvent release_reservation(Transaction& txn, ProcessRecord& rec, Transition t, Timestamp now);

struct CancelAck {
    ProcessId process_id{};
    bool changed{false};  // this call moved the record to Cancelling
};

enum class CompletionOutcome { Cancelled, NotPending, StoreUnavailable };

/// Two-phase cancel. The request phase never waits on a row lock and never
/// reports an error; the completion phase performs the one and only credit.
class CancellationProtocol {
public:
    CancellationProtocol(Store& store, EventBus& events);

    CancelAck request_cancel(ProcessId pid, OwnerId owner, Timestamp now);
    CompletionOutcome complete_cancellation(ProcessId pid, Timestamp now);

private:
    Store& store_;
    EventBus& events_;
};

} // namespace procrt
