#include "svc/requests.hpp"

#include <cmath>

namespace svc {

using nlohmann::json;

uint64_t unsigned_field(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<int64_t>() < 0))
        throw RequestError(std::string("'") + key + "' must be a non-negative integer, got " + v.dump());
    return v.get<uint64_t>();
}

uint64_t unsigned_field(const json& j, const char* key, uint64_t fallback) {
    return j.contains(key) ? unsigned_field(j, key) : fallback;
}

procrt::Resources resources_from_json(const json& j) {
    if (!j.is_object()) throw RequestError("'requested_resources' must be an object, got " + j.dump());
    procrt::Resources r;
    r.cpu = unsigned_field(j, "cpu", 0);
    r.ram = unsigned_field(j, "ram", 0);
    r.hdd = unsigned_field(j, "hdd", 0);
    r.net = unsigned_field(j, "net", 0);
    return r;
}

CreateRequest create_request_from_json(const json& j) {
    CreateRequest req;
    req.owner_id = unsigned_field(j, "owner_id");
    req.process_type = j.at("process_type").get<std::string>();
    req.gateway_server_id = unsigned_field(j, "gateway_server_id");
    req.target_server_id = unsigned_field(j, "target_server_id", req.gateway_server_id);
    if (j.contains("requested_resources")) req.requested = resources_from_json(j.at("requested_resources"));
    if (j.contains("difficulty")) {
        const auto& d = j.at("difficulty");
        if (!d.is_number() || !std::isfinite(d.get<double>()))
            throw RequestError("'difficulty' must be a finite number, got " + d.dump());
        req.difficulty = d.get<double>();
    }
    return req;
}

ProcessRequest process_request_from_json(const json& j) {
    ProcessRequest req;
    req.owner_id = unsigned_field(j, "owner_id");
    req.process_id = unsigned_field(j, "process_id");
    return req;
}

json to_json(const procrt::Resources& r) {
    return json{{"cpu", r.cpu}, {"ram", r.ram}, {"hdd", r.hdd}, {"net", r.net}};
}

json to_json(const procrt::ProcessRecord& rec) {
    json j;
    j["process_id"] = rec.id;
    j["owner_id"] = rec.owner_id;
    j["gateway_server_id"] = rec.gateway_server_id;
    j["target_server_id"] = rec.target_server_id;
    j["process_type"] = std::string(to_string(rec.type));
    j["state"] = std::string(to_string(rec.state));
    j["reservation"] = to_json(rec.reservation);
    j["progress"] = rec.progress;
    j["required_work"] = rec.required_work;
    j["created_at"] = procrt::to_millis(rec.created_at);
    j["last_checkpoint_at"] = procrt::to_millis(rec.last_checkpoint_at);
    j["completed_at"] = rec.completed_at ? json(procrt::to_millis(*rec.completed_at)) : json(nullptr);
    j["updated_at"] = procrt::to_millis(rec.updated_at);
    return j;
}

json to_json(const procrt::ServerRow& row) {
    json j;
    j["server_id"] = row.id;
    j["owner_id"] = row.owner_id;
    j["online"] = row.online;
    j["total"] = to_json(row.pool.total);
    j["available"] = to_json(row.pool.available);
    return j;
}

json to_json(const procrt::LifecycleEvent& evt) {
    json j;
    j["process_id"] = evt.process_id;
    j["owner_id"] = evt.owner_id;
    j["gateway_server_id"] = evt.gateway_server_id;
    j["state"] = std::string(to_string(evt.state));
    j["freed"] = to_json(evt.freed);
    j["at"] = procrt::to_millis(evt.at);
    return j;
}

json error_reply(const std::string& error, const std::string& message) {
    return json{{"status", "error"}, {"error", error}, {"message", message}};
}

json error_reply(procrt::ErrorKind error, const std::string& message) {
    return error_reply(std::string(to_string(error)), message);
}

json to_json(const procrt::AdmitResult& r) {
    if (!r.ok) return error_reply(r.error, r.message);
    return json{{"status", "ok"}, {"process_id", r.process_id}, {"reservation", to_json(r.reservation)}};
}

json to_json(const procrt::CancelAck& ack) {
    return json{{"status", "ok"}, {"process_id", ack.process_id}};
}

json to_json(ProcessId pid, const procrt::SuspendResult& r) {
    if (!r.ok) return error_reply(r.error, r.message);
    return json{{"status", "ok"}, {"process_id", pid}, {"state", std::string(to_string(r.state))}};
}

json to_json(const QueryResult& r) {
    if (!r.ok || !r.process) return error_reply(r.error, r.message);
    return json{{"status", "ok"}, {"process", to_json(*r.process)}};
}

json list_reply(const std::vector<procrt::ProcessRecord>& records) {
    json list = json::array();
    for (const auto& rec : records) list.push_back(to_json(rec));
    return json{{"status", "ok"}, {"processes", list}};
}

json audit_reply(const std::vector<procrt::AuditViolation>& violations) {
    json list = json::array();
    for (const auto& v : violations) {
        list.push_back(json{{"server_id", v.server_id},
                            {"total", to_json(v.total)},
                            {"available", to_json(v.available)},
                            {"reserved", to_json(v.reserved)}});
    }
    return json{{"status", "ok"}, {"consistent", violations.empty()}, {"violations", list}};
}

} // namespace svc
