#pragma once
#include "procrt/admission.hpp"
#include "procrt/cancellation.hpp"
#include "procrt/events.hpp"
#include "procrt/store.hpp"
#include "procrt/throughput.hpp"
#include "procrt/tick_engine.hpp"
#include "procrt/type_registry.hpp"
#include "svc/requests.hpp"
#include <optional>
#include <vector>

namespace svc {

/// Inbound surface of the engine for one store: what the game's request
/// handlers call on behalf of an authenticated owner.
class ProcessService {
public:
    ProcessService(procrt::Store& store, const procrt::TypeRegistry& types,
                   const procrt::ThroughputPolicy& policy, procrt::EventBus& events);

    procrt::AdmitResult create(const CreateRequest& req, procrt::Timestamp now);
    // Always acknowledged, whatever the record's owner or state.
    procrt::CancelAck cancel(const ProcessRequest& req, procrt::Timestamp now);
    procrt::SuspendResult pause(const ProcessRequest& req, procrt::Timestamp now);
    procrt::SuspendResult resume(const ProcessRequest& req, procrt::Timestamp now);

    QueryResult get(const ProcessRequest& req) const;
    std::vector<procrt::ProcessRecord> list(OwnerId owner) const;
    std::optional<procrt::ServerRow> server(ServerId id) const;
    std::vector<procrt::AuditViolation> audit() const;

    procrt::TickEngine& ticks() { return ticks_; }
    procrt::CancellationProtocol& cancellation() { return cancel_; }

private:
    procrt::Store& store_;
    procrt::AdmissionController admission_;
    procrt::CancellationProtocol cancel_;
    procrt::TickEngine ticks_;
};

} // namespace svc
