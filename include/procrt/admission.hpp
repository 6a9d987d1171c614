#pragma once
#include "errors.hpp"
#include "process.hpp"
#include "store.hpp"
#include "type_registry.hpp"
#include <string>

namespace procrt {

struct AdmitRequest {
    OwnerId owner_id{};
    ProcessType type{ProcessType::Download};
    ServerId gateway_server_id{};
    ServerId target_server_id{};
    Resources requested{};
    double difficulty{0.0};  // 0..1 within the type's duration range
};

struct AdmitResult {
    bool ok{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
    ProcessId process_id{};
    Resources reservation{};
};

/// Reserves gateway capacity for a new process. The capacity check, the debit
/// and the insert of the Queued record commit together under the gateway row
/// lock; a request that does not fit is rejected, never queued.
class AdmissionController {
public:
    AdmissionController(Store& store, const TypeRegistry& types);

    AdmitResult try_admit(const AdmitRequest& req, Timestamp now);

private:
    Store& store_;
    const TypeRegistry& types_;
};

} // namespace procrt
