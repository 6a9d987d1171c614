#pragma once
#include "store.hpp"
#include "tick_engine.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace procrt {

struct EngineOptions {
    unsigned workers{0};  // 0 = hardware concurrency
    std::chrono::milliseconds tick_interval{1000};
    std::function<Timestamp()> clock{[] { return Clock::now(); }};
};

struct SweepStats {
    size_t scheduled{0};
    size_t advanced{0};
    size_t completed{0};
    size_t cancelled{0};
    size_t failed{0};
    size_t store_errors{0};
};

// Sweep order: Cancelling records first, then oldest checkpoint. Paused and
// terminal records are left out.
std::vector<ProcessId> sweep_order(std::vector<ProcessRecord> active);

/// Drives the tick engine from a pool of worker threads. A sweeper thread
/// queues every active process once per tick interval; an id already waiting
/// in the queue is not queued twice.
class Engine {
public:
    Engine(Store& store, TickEngine& ticks, EngineOptions opts = {});
    ~Engine();

    void start();
    // Finishes what is already queued, then joins every thread.
    void stop();
    bool running() const;

    SweepStats run_once(Timestamp now);
    uint64_t ticks_processed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace procrt
