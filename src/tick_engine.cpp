#include "procrt/tick_engine.hpp"
#include "procrt/reporting.hpp"

#include <algorithm>

namespace procrt {

std::string_view to_string(TickOutcome o) {
    switch (o) {
    case TickOutcome::Advanced: return "advanced";
    case TickOutcome::Started: return "started";
    case TickOutcome::Completed: return "completed";
    case TickOutcome::Cancelled: return "cancelled";
    case TickOutcome::Failed: return "failed";
    case TickOutcome::Paused: return "paused";
    case TickOutcome::Skipped: return "skipped";
    case TickOutcome::NotFound: return "not_found";
    case TickOutcome::StoreUnavailable: return "store_unavailable";
    }
    return "unknown";
}

TickEngine::TickEngine(Store& store, const ThroughputPolicy& policy, EventBus& events)
    : store_(store), policy_(policy), events_(events) {}

TickResult TickEngine::tick(ProcessId pid, Seconds elapsed, Timestamp now) {
    return run(pid, elapsed, now);
}

TickResult TickEngine::advance_to(ProcessId pid, Timestamp now) {
    return run(pid, std::nullopt, now);
}

std::optional<LifecycleEvent> TickEngine::advance(Transaction& txn, ProcessRecord& rec, double seconds,
                                                  Timestamp now, TickResult& res) {
    auto gateway = store_.server(rec.gateway_server_id);
    auto target = store_.server(rec.target_server_id);
    if (!gateway || !gateway->online || !target || !target->online) {
        res.outcome = TickOutcome::Failed;
        res.message = "server " + std::to_string(gateway && gateway->online ? rec.target_server_id
                                                                             : rec.gateway_server_id) +
                      " went offline";
        return release_reservation(txn, rec, Transition::Fail, now);
    }

    double gained = policy_.rate(rec.type, rec.reservation) * seconds;
    if (!(gained > 0.0)) gained = 0.0;
    rec.progress = std::min(rec.required_work, rec.progress + gained);
    // Checkpoints only move forward.
    rec.last_checkpoint_at = std::max(rec.last_checkpoint_at, now);
    rec.updated_at = now;
    if (rec.done()) {
        res.outcome = TickOutcome::Completed;
        return release_reservation(txn, rec, Transition::Complete, now);
    }
    txn.update_process(rec);
    return std::nullopt;
}

TickResult TickEngine::run(ProcessId pid, std::optional<Seconds> elapsed, Timestamp now) {
    TickResult res;
    res.process_id = pid;
    std::optional<LifecycleEvent> evt;
    try {
        auto txn = store_.begin();
        auto rec = txn.lock_process(pid, LockMode::Blocking);
        if (!rec) {
            res.outcome = TickOutcome::NotFound;
            res.message = "unknown process";
            return res;
        }
        res.state = rec->state;
        res.progress = rec->progress;
        double seconds = elapsed ? elapsed->count() : Seconds(now - rec->last_checkpoint_at).count();

        switch (rec->state) {
        case ProcessState::Completed:
        case ProcessState::Failed:
        case ProcessState::Cancelled:
            res.outcome = TickOutcome::Skipped;
            return res;
        case ProcessState::Paused:
            res.outcome = TickOutcome::Paused;
            return res;
        case ProcessState::Cancelling:
            // We hold the row, so the completion phase runs here.
            evt = release_reservation(txn, *rec, Transition::FinishCancel, now);
            res.outcome = TickOutcome::Cancelled;
            break;
        case ProcessState::Queued: {
            auto gw = txn.lock_server(rec->gateway_server_id);
            if (!gw || !gw->online || !rec->reservation.fits_in(gw->pool.total)) {
                evt = release_reservation(txn, *rec, Transition::Fail, now);
                res.outcome = TickOutcome::Failed;
                res.message = "gateway " + std::to_string(rec->gateway_server_id) + " cannot hold the reservation";
                break;
            }
            rec->state = *next_state(rec->state, Transition::Start);
            res.outcome = TickOutcome::Started;
            evt = advance(txn, *rec, seconds, now, res);
            break;
        }
        case ProcessState::Running:
            res.outcome = TickOutcome::Advanced;
            evt = advance(txn, *rec, seconds, now, res);
            break;
        }
        txn.commit();
        res.state = rec->state;
        res.progress = rec->progress;
    } catch (const StoreError& e) {
        res.outcome = TickOutcome::StoreUnavailable;
        res.message = e.what();
        reporting::warn("tick", "process " + std::to_string(pid) + ": " + e.what());
        return res;
    }

    reporting::debug("tick", "process " + std::to_string(pid) + " " + std::string(to_string(res.outcome)) +
                                 " progress=" + std::to_string(res.progress));
    if (evt) events_.publish(*evt);
    return res;
}

SuspendResult TickEngine::pause(ProcessId pid, OwnerId owner, Timestamp now) {
    return suspend(pid, owner, Transition::Pause, now);
}

SuspendResult TickEngine::resume(ProcessId pid, OwnerId owner, Timestamp now) {
    return suspend(pid, owner, Transition::Resume, now);
}

SuspendResult TickEngine::suspend(ProcessId pid, OwnerId owner, Transition t, Timestamp now) {
    SuspendResult r;
    std::optional<LifecycleEvent> evt;
    try {
        auto txn = store_.begin();
        auto rec = txn.lock_process(pid, LockMode::Blocking);
        if (!rec) {
            r.error = ErrorKind::InvalidProcess;
            r.message = "unknown process " + std::to_string(pid);
            return r;
        }
        if (rec->owner_id != owner) {
            r.error = ErrorKind::PermissionDenied;
            r.message = "process " + std::to_string(pid) + " is not owned by " + std::to_string(owner);
            return r;
        }
        r.ok = true;
        r.state = rec->state;
        auto next = next_state(rec->state, t);
        if (!next) {
            r.message = "nothing to " + std::string(to_string(t)) + " in state " + std::string(to_string(rec->state));
            return r;
        }

        if (t == Transition::Pause) {
            TickResult accounted;
            evt = advance(txn, *rec, Seconds(now - rec->last_checkpoint_at).count(), now, accounted);
            r.message = accounted.message;
        }
        if (!evt) {
            rec->state = *next;
            rec->last_checkpoint_at = std::max(rec->last_checkpoint_at, now);
            rec->updated_at = now;
            txn.update_process(*rec);
            r.message = std::string(to_string(*next));
        }
        txn.commit();
        r.state = rec->state;
    } catch (const StoreError& e) {
        r.ok = false;
        r.error = ErrorKind::StoreUnavailable;
        r.message = e.what();
        reporting::warn("tick", "suspending process " + std::to_string(pid) + ": " + e.what());
        return r;
    }

    reporting::info("tick", "process " + std::to_string(pid) + " " + std::string(to_string(r.state)));
    if (evt) events_.publish(*evt);
    return r;
}

} // namespace procrt
