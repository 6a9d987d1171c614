#include "procrt/engine.hpp"
#include "procrt/reporting.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

namespace procrt {

std::vector<ProcessId> sweep_order(std::vector<ProcessRecord> active) {
    active.erase(std::remove_if(active.begin(), active.end(),
                                [](const ProcessRecord& r) {
                                    return r.state == ProcessState::Paused || is_terminal(r.state);
                                }),
                 active.end());
    std::sort(active.begin(), active.end(), [](const ProcessRecord& a, const ProcessRecord& b) {
        bool ca = a.state == ProcessState::Cancelling;
        bool cb = b.state == ProcessState::Cancelling;
        if (ca != cb) return ca;
        if (a.last_checkpoint_at != b.last_checkpoint_at) return a.last_checkpoint_at < b.last_checkpoint_at;
        return a.id < b.id;
    });
    std::vector<ProcessId> ids;
    ids.reserve(active.size());
    for (const auto& r : active) ids.push_back(r.id);
    return ids;
}

namespace {

void tally(SweepStats& stats, const TickResult& r) {
    switch (r.outcome) {
    case TickOutcome::Advanced:
    case TickOutcome::Started: ++stats.advanced; break;
    case TickOutcome::Completed: ++stats.completed; break;
    case TickOutcome::Cancelled: ++stats.cancelled; break;
    case TickOutcome::Failed: ++stats.failed; break;
    case TickOutcome::StoreUnavailable: ++stats.store_errors; break;
    default: break;
    }
}

} // namespace

class WorkQueue {
public:
    // False if the id is already waiting.
    bool push(ProcessId id) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_ || !queued_.insert(id).second) return false;
            q_.push_back(id);
        }
        cv_.notify_one();
        return true;
    }
    std::optional<ProcessId> pop_blocking() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
        if (q_.empty()) return std::nullopt;
        auto id = q_.front();
        q_.pop_front();
        queued_.erase(id);
        return id;
    }
    void stop() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stop_ = true;
        }
        cv_.notify_all();
    }
    void reset() {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = false;
    }

private:
    std::deque<ProcessId> q_;
    std::unordered_set<ProcessId> queued_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_{false};
};

class Engine::Impl {
public:
    Impl(Store& store, TickEngine& ticks, EngineOptions opts)
        : store_(store),
          ticks_(ticks),
          opts_(std::move(opts)),
          workers_n_(opts_.workers ? opts_.workers : std::max(1u, std::thread::hardware_concurrency())) {}

    ~Impl() { stop(); }

    void start() {
        if (running_.exchange(true)) return;
        queue_.reset();
        for (unsigned i = 0; i < workers_n_; ++i)
            workers_.emplace_back([this] { worker_loop(); });
        sweeper_ = std::thread([this] { sweep_loop(); });
        reporting::info("engine", "started " + std::to_string(workers_n_) + " workers, tick " +
                                      std::to_string(opts_.tick_interval.count()) + "ms");
    }

    void stop() {
        if (!running_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lk(sweep_mu_);
        }
        sweep_cv_.notify_all();
        if (sweeper_.joinable()) sweeper_.join();
        queue_.stop();
        for (auto& w : workers_)
            if (w.joinable()) w.join();
        workers_.clear();
        reporting::info("engine", "stopped after " + std::to_string(processed_.load()) + " ticks");
    }

    bool running() const { return running_.load(); }

    SweepStats run_once(Timestamp now) {
        SweepStats stats;
        for (auto id : sweep_order(store_.active_processes())) {
            ++stats.scheduled;
            tally(stats, ticks_.advance_to(id, now));
            ++processed_;
        }
        return stats;
    }

    uint64_t processed() const { return processed_.load(); }

private:
    void sweep_loop() {
        while (running_) {
            size_t queued = 0;
            for (auto id : sweep_order(store_.active_processes()))
                if (queue_.push(id)) ++queued;
            if (queued) reporting::debug("engine", "sweep queued " + std::to_string(queued) + " processes");

            std::unique_lock<std::mutex> lk(sweep_mu_);
            sweep_cv_.wait_for(lk, opts_.tick_interval, [&] { return !running_; });
        }
    }

    void worker_loop() {
        while (true) {
            auto id = queue_.pop_blocking();
            if (!id) break;
            ticks_.advance_to(*id, opts_.clock());
            ++processed_;
        }
    }

    Store& store_;
    TickEngine& ticks_;
    EngineOptions opts_;
    unsigned workers_n_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> processed_{0};
    WorkQueue queue_;

    std::vector<std::thread> workers_;
    std::thread sweeper_;
    std::mutex sweep_mu_;
    std::condition_variable sweep_cv_;
};

Engine::Engine(Store& store, TickEngine& ticks, EngineOptions opts)
    : impl_(std::make_unique<Impl>(store, ticks, std::move(opts))) {}

Engine::~Engine() = default;

void Engine::start() { impl_->start(); }
void Engine::stop() { impl_->stop(); }
bool Engine::running() const { return impl_->running(); }
SweepStats Engine::run_once(Timestamp now) { return impl_->run_once(now); }
uint64_t Engine::ticks_processed() const { return impl_->processed(); }

} // namespace procrt
