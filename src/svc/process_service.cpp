#include "svc/process_service.hpp"

namespace svc {

ProcessService::ProcessService(procrt::Store& store, const procrt::TypeRegistry& types,
                               const procrt::ThroughputPolicy& policy, procrt::EventBus& events)
    : store_(store), admission_(store, types), cancel_(store, events), ticks_(store, policy, events) {}

procrt::AdmitResult ProcessService::create(const CreateRequest& req, procrt::Timestamp now) {
    auto type = procrt::parse_process_type(req.process_type);
    if (!type) {
        procrt::AdmitResult r;
        r.error = procrt::ErrorKind::InvalidProcess;
        r.message = "unknown process type '" + req.process_type + "'";
        return r;
    }
    procrt::AdmitRequest admit;
    admit.owner_id = req.owner_id;
    admit.type = *type;
    admit.gateway_server_id = req.gateway_server_id;
    admit.target_server_id = req.target_server_id;
    admit.requested = req.requested;
    admit.difficulty = req.difficulty;
    return admission_.try_admit(admit, now);
}

procrt::CancelAck ProcessService::cancel(const ProcessRequest& req, procrt::Timestamp now) {
    return cancel_.request_cancel(req.process_id, req.owner_id, now);
}

procrt::SuspendResult ProcessService::pause(const ProcessRequest& req, procrt::Timestamp now) {
    return ticks_.pause(req.process_id, req.owner_id, now);
}

procrt::SuspendResult ProcessService::resume(const ProcessRequest& req, procrt::Timestamp now) {
    return ticks_.resume(req.process_id, req.owner_id, now);
}

QueryResult ProcessService::get(const ProcessRequest& req) const {
    QueryResult r;
    auto rec = store_.process(req.process_id);
    if (!rec) {
        r.error = procrt::ErrorKind::InvalidProcess;
        r.message = "unknown process " + std::to_string(req.process_id);
        return r;
    }
    if (rec->owner_id != req.owner_id) {
        r.error = procrt::ErrorKind::PermissionDenied;
        r.message = "process " + std::to_string(req.process_id) + " is not owned by " + std::to_string(req.owner_id);
        return r;
    }
    r.ok = true;
    r.process = rec;
    return r;
}

std::vector<procrt::ProcessRecord> ProcessService::list(OwnerId owner) const {
    return store_.processes_for_owner(owner);
}

std::optional<procrt::ServerRow> ProcessService::server(ServerId id) const {
    return store_.server(id);
}

std::vector<procrt::AuditViolation> ProcessService::audit() const {
    return store_.audit();
}

} // namespace svc
