#include "procrt/cancellation.hpp"
#include "procrt/reporting.hpp"

#include <stdexcept>

namespace procrt {

LifecycleEvent release_reservation(Transaction& txn, ProcessRecord& rec, Transition t, Timestamp now) {
    auto next = next_state(rec.state, t);
    if (!next || !is_terminal(*next))
        throw std::logic_error("process " + std::to_string(rec.id) + ": " + std::string(to_string(t)) +
                               " is not a releasing transition from " + std::string(to_string(rec.state)));

    auto row = txn.lock_server(rec.gateway_server_id);
    if (!row) throw StoreError("gateway " + std::to_string(rec.gateway_server_id) + " of process " +
                               std::to_string(rec.id) + " is missing");
    if (!row->pool.credit(rec.reservation))
        throw StoreError("credit of process " + std::to_string(rec.id) + " would exceed the total of server " +
                         std::to_string(row->id));
    row->updated_at = now;
    txn.update_server(*row);

    rec.state = *next;
    rec.completed_at = now;
    rec.updated_at = now;
    txn.update_process(rec);

    return LifecycleEvent{rec.id, rec.owner_id, rec.gateway_server_id, rec.state, rec.reservation, now};
}

CancellationProtocol::CancellationProtocol(Store& store, EventBus& events) : store_(store), events_(events) {}

CancelAck CancellationProtocol::request_cancel(ProcessId pid, OwnerId owner, Timestamp now) {
    CancelAck ack{pid, false};
    try {
        auto txn = store_.begin();
        auto rec = txn.lock_process(pid, LockMode::SkipLocked,
                                    [owner](const ProcessRecord& r) { return r.owner_id == owner; });
        if (!rec) {
            reporting::debug("cancel", "process " + std::to_string(pid) + " not visible to owner " +
                                           std::to_string(owner));
            return ack;
        }
        auto next = next_state(rec->state, Transition::RequestCancel);
        if (!next) return ack;

        rec->state = *next;
        rec->updated_at = now;
        txn.update_process(*rec);
        txn.commit();
        ack.changed = true;
        reporting::info("cancel", "process " + std::to_string(pid) + " cancelling");
    } catch (const StoreError& e) {
        reporting::warn("cancel", "process " + std::to_string(pid) + ": " + e.what());
    }
    return ack;
}

CompletionOutcome CancellationProtocol::complete_cancellation(ProcessId pid, Timestamp now) {
    LifecycleEvent evt;
    try {
        auto txn = store_.begin();
        auto rec = txn.lock_process(pid, LockMode::Blocking,
                                    [](const ProcessRecord& r) { return r.state == ProcessState::Cancelling; });
        if (!rec) return CompletionOutcome::NotPending;
        evt = release_reservation(txn, *rec, Transition::FinishCancel, now);
        txn.commit();
    } catch (const StoreError& e) {
        reporting::warn("cancel", "completing process " + std::to_string(pid) + ": " + e.what());
        return CompletionOutcome::StoreUnavailable;
    }
    reporting::info("cancel", "process " + std::to_string(pid) + " cancelled, freed " + evt.freed.to_string());
    events_.publish(evt);
    return CompletionOutcome::Cancelled;
}

} // namespace procrt
