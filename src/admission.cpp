#include "procrt/admission.hpp"
#include "procrt/reporting.hpp"

#include <cmath>

namespace procrt {

namespace {
AdmitResult rejected(ErrorKind error, std::string message) {
    AdmitResult r;
    r.error = error;
    r.message = std::move(message);
    reporting::debug("admission", "rejected (" + std::string(to_string(error)) + "): " + r.message);
    return r;
}
}

AdmissionController::AdmissionController(Store& store, const TypeRegistry& types)
    : store_(store), types_(types) {}

AdmitResult AdmissionController::try_admit(const AdmitRequest& req, Timestamp now) {
    if (!std::isfinite(req.difficulty))
        return rejected(ErrorKind::InvalidProcess, "difficulty must be a finite number");
    auto work = types_.required_work(req.type, req.difficulty);
    if (!work) return rejected(ErrorKind::InvalidProcess, "unregistered process type " + std::string(to_string(req.type)));

    auto gateway = store_.server(req.gateway_server_id);
    if (!gateway || !gateway->online)
        return rejected(ErrorKind::InvalidProcess, "gateway " + std::to_string(req.gateway_server_id) + " unavailable");
    auto target = store_.server(req.target_server_id);
    if (!target || !target->online)
        return rejected(ErrorKind::InvalidProcess, "target " + std::to_string(req.target_server_id) + " unavailable");
    if (gateway->owner_id != req.owner_id)
        return rejected(ErrorKind::PermissionDenied, "gateway " + std::to_string(req.gateway_server_id) +
                                                        " is not owned by " + std::to_string(req.owner_id));

    try {
        auto txn = store_.begin();
        auto row = txn.lock_server(req.gateway_server_id);
        if (!row || !row->online)
            return rejected(ErrorKind::InvalidProcess, "gateway " + std::to_string(req.gateway_server_id) + " unavailable");
        if (!row->pool.debit(req.requested))
            return rejected(ErrorKind::ResourceExhausted, "not enough capacity on server " + std::to_string(row->id) +
                                                              ": requested " + req.requested.to_string() +
                                                              ", available " + row->pool.available.to_string());
        row->updated_at = now;
        txn.update_server(*row);

        ProcessRecord rec;
        rec.owner_id = req.owner_id;
        rec.gateway_server_id = req.gateway_server_id;
        rec.target_server_id = req.target_server_id;
        rec.type = req.type;
        rec.state = ProcessState::Queued;
        rec.reservation = req.requested;
        rec.required_work = *work;
        rec.created_at = now;
        rec.last_checkpoint_at = now;
        rec.updated_at = now;
        ProcessId pid = txn.insert_process(rec);
        txn.commit();

        reporting::info("admission", "process " + std::to_string(pid) + " (" + std::string(to_string(req.type)) +
                                         ") on server " + std::to_string(req.gateway_server_id) + " reserved " +
                                         req.requested.to_string());
        AdmitResult r;
        r.ok = true;
        r.message = "admitted";
        r.process_id = pid;
        r.reservation = req.requested;
        return r;
    } catch (const StoreError& e) {
        reporting::warn("admission", std::string("store unavailable: ") + e.what());
        return rejected(ErrorKind::StoreUnavailable, e.what());
    }
}

} // namespace procrt
