#pragma once
#include "process.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace procrt {

/// Emitted after commit whenever a process reaches Completed, Cancelled or Failed.
struct LifecycleEvent {
    ProcessId process_id{};
    OwnerId owner_id{};
    ServerId gateway_server_id{};
    ProcessState state{ProcessState::Completed};
    Resources freed{};
    Timestamp at{};
};

class EventBus {
public:
    using Handler = std::function<void(const LifecycleEvent&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler h);
    void unsubscribe(SubscriptionId id);

    // Resolves with the terminal event of one process, immediately if it was
    // already published on this bus. A process that ended before the bus
    // existed (recovered from a journal) never resolves; check the store first.
    std::future<LifecycleEvent> wait_for(ProcessId pid);

    void publish(const LifecycleEvent& evt);
    uint64_t published() const;

private:
    mutable std::mutex mu_;
    SubscriptionId next_id_{1};
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    std::unordered_map<ProcessId, std::vector<std::promise<LifecycleEvent>>> waiters_;
    std::unordered_map<ProcessId, LifecycleEvent> finished_;
    uint64_t published_{0};
};

} // namespace procrt
