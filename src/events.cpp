#include "procrt/events.hpp"

#include <algorithm>

namespace procrt {

EventBus::SubscriptionId EventBus::subscribe(Handler h) {
    std::lock_guard<std::mutex> lk(mu_);
    auto id = next_id_++;
    handlers_.emplace_back(id, std::move(h));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    handlers_.end());
}

std::future<LifecycleEvent> EventBus::wait_for(ProcessId pid) {
    std::lock_guard<std::mutex> lk(mu_);
    auto done = finished_.find(pid);
    if (done != finished_.end()) {
        std::promise<LifecycleEvent> ready;
        ready.set_value(done->second);
        return ready.get_future();
    }
    auto& list = waiters_[pid];
    list.emplace_back();
    return list.back().get_future();
}

void EventBus::publish(const LifecycleEvent& evt) {
    std::vector<Handler> handlers;
    std::vector<std::promise<LifecycleEvent>> promises;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++published_;
        finished_[evt.process_id] = evt;
        for (auto& entry : handlers_) handlers.push_back(entry.second);
        auto it = waiters_.find(evt.process_id);
        if (it != waiters_.end()) {
            promises = std::move(it->second);
            waiters_.erase(it);
        }
    }
    // Handlers run outside the lock so they may subscribe or wait themselves.
    for (auto& h : handlers) h(evt);
    for (auto& p : promises) p.set_value(evt);
}

uint64_t EventBus::published() const {
    std::lock_guard<std::mutex> lk(mu_);
    return published_;
}

} // namespace procrt
