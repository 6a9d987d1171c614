#pragma once
#include "procrt/admission.hpp"
#include "procrt/cancellation.hpp"
#include "procrt/store.hpp"
#include "procrt/tick_engine.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svc {

using procrt::OwnerId;
using procrt::ProcessId;
using procrt::ServerId;

// The process type travels by name so that an unknown name can be reported
// as InvalidProcess instead of a malformed request.
struct CreateRequest {
    OwnerId owner_id{};
    std::string process_type;
    ServerId gateway_server_id{};
    ServerId target_server_id{};
    procrt::Resources requested{};
    double difficulty{0.0};
};

struct ProcessRequest {
    OwnerId owner_id{};
    ProcessId process_id{};
};

struct QueryResult {
    bool ok{false};
    procrt::ErrorKind error{procrt::ErrorKind::None};
    std::string message;
    std::optional<procrt::ProcessRecord> process;
};

// A field that is present and well typed but out of range, such as a negative
// or fractional resource amount.
class RequestError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Field readers throw nlohmann::json::exception on missing or mistyped fields
// and RequestError on ids or amounts that are not non-negative integers.
// Integer >= 0 only; get<uint64_t>() would wrap -5 and truncate 2.9.
uint64_t unsigned_field(const nlohmann::json& j, const char* key);
uint64_t unsigned_field(const nlohmann::json& j, const char* key, uint64_t fallback);
CreateRequest create_request_from_json(const nlohmann::json& j);
ProcessRequest process_request_from_json(const nlohmann::json& j);
procrt::Resources resources_from_json(const nlohmann::json& j);

nlohmann::json to_json(const procrt::Resources& r);
nlohmann::json to_json(const procrt::ProcessRecord& rec);
nlohmann::json to_json(const procrt::ServerRow& row);
nlohmann::json to_json(const procrt::LifecycleEvent& evt);

// Replies. Every one carries "status": "ok" or "error".
nlohmann::json to_json(const procrt::AdmitResult& r);
nlohmann::json to_json(const procrt::CancelAck& ack);
nlohmann::json to_json(ProcessId pid, const procrt::SuspendResult& r);
nlohmann::json to_json(const QueryResult& r);
nlohmann::json list_reply(const std::vector<procrt::ProcessRecord>& records);
nlohmann::json audit_reply(const std::vector<procrt::AuditViolation>& violations);
nlohmann::json error_reply(procrt::ErrorKind error, const std::string& message);
nlohmann::json error_reply(const std::string& error, const std::string& message);

} // namespace svc
