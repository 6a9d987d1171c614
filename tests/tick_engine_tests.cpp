/*
Tick engine tests: progress, completion, failure, suspension and same-record races.
*/
#include "harness.hpp"

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

using namespace procrt;
using testing_support::at;
using testing_support::Harness;
using testing_support::t0;

static int test_completes_after_sixty_seconds(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({5, 0, 0, 0});
    EXPECT(h.store.process(r.process_id)->required_work == 300.0, "300 units of work");
    std::vector<LifecycleEvent> seen;
    h.events.subscribe([&](const LifecycleEvent& e) { seen.push_back(e); });

    for (int s = 1; s < 60; ++s) {
        auto t = h.ticks.tick(r.process_id, Seconds(1.0), at(s));
        EXPECT(t.outcome == (s == 1 ? TickOutcome::Started : TickOutcome::Advanced), "advancing");
        EXPECT(t.progress == 5.0 * s, "5 units per second");
    }
    EXPECT(h.available(1).cpu == 95, "still reserved at 59s");
    auto last = h.ticks.tick(r.process_id, Seconds(1.0), at(60));
    EXPECT(last.outcome == TickOutcome::Completed && last.state == ProcessState::Completed, "completed at 60s");

    auto rec = h.store.process(r.process_id);
    EXPECT(rec->progress == 300.0 && rec->completed_at == at(60), "completion recorded");
    EXPECT(h.available(1).cpu == 100, "credited");
    EXPECT(seen.size() == 1 && seen[0].process_id == r.process_id, "one completion event");

    auto again = h.ticks.tick(r.process_id, Seconds(1.0), at(61));
    EXPECT(again.outcome == TickOutcome::Skipped, "terminal record skipped");
    EXPECT(h.available(1).cpu == 100 && seen.size() == 1, "no second credit");
    return 0;
}

static int test_progress_clamped(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({50, 0, 0, 0});
    auto t = h.ticks.tick(r.process_id, Seconds(3600.0), at(3600));
    EXPECT(t.outcome == TickOutcome::Completed, "one big step completes");
    EXPECT(h.store.process(r.process_id)->progress == 300.0, "progress clamped to required_work");
    return 0;
}

static int test_advance_to_uses_checkpoint(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({2, 0, 0, 0});
    auto t = h.ticks.advance_to(r.process_id, at(10));
    EXPECT(t.outcome == TickOutcome::Started && t.progress == 20.0, "time since admission counts");
    t = h.ticks.advance_to(r.process_id, at(15));
    EXPECT(t.progress == 30.0, "only the new interval is added");
    t = h.ticks.advance_to(r.process_id, at(15));
    EXPECT(t.progress == 30.0, "no time, no work");
    t = h.ticks.advance_to(r.process_id, at(14));
    EXPECT(t.progress == 30.0, "a clock going backwards adds nothing");
    EXPECT(h.store.process(r.process_id)->last_checkpoint_at == at(15), "checkpoint kept at the latest time");
    t = h.ticks.advance_to(r.process_id, at(20));
    EXPECT(t.progress == 40.0, "the interval before the late tick is not counted twice");
    return 0;
}

static int test_late_resume_keeps_checkpoint(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({2, 0, 0, 0});
    h.ticks.advance_to(r.process_id, at(10));
    EXPECT(h.ticks.pause(r.process_id, 1, at(50)).state == ProcessState::Paused, "paused at 50");
    EXPECT(h.store.process(r.process_id)->progress == 100.0, "work up to 50 s");
    EXPECT(h.ticks.resume(r.process_id, 1, at(40)).state == ProcessState::Running, "resume stamped earlier");
    EXPECT(h.store.process(r.process_id)->last_checkpoint_at == at(50), "checkpoint not moved back");
    auto t = h.ticks.advance_to(r.process_id, at(60));
    EXPECT(t.progress == 120.0, "only 50..60 counted after the resume");
    return 0;
}

static int test_unknown_process(void)
{
    Harness h;
    h.seed();
    EXPECT(h.ticks.tick(77, Seconds(1.0), at(1)).outcome == TickOutcome::NotFound, "not found");
    return 0;
}

static int test_target_gone_fails_and_credits(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({20, 100, 0, 0});
    h.ticks.tick(r.process_id, Seconds(1.0), at(1));
    h.store.set_server_online(2, false, at(2));

    std::vector<LifecycleEvent> seen;
    h.events.subscribe([&](const LifecycleEvent& e) { seen.push_back(e); });
    auto t = h.ticks.tick(r.process_id, Seconds(1.0), at(3));
    EXPECT(t.outcome == TickOutcome::Failed, "failed");
    auto rec = h.store.process(r.process_id);
    EXPECT(rec->state == ProcessState::Failed && rec->progress == 20.0, "no progress on failure");
    EXPECT(h.available(1) == (Resources{100, 1000, 1000, 100}), "reservation credited");
    EXPECT(seen.size() == 1 && seen[0].state == ProcessState::Failed, "failure event");
    return 0;
}

static int test_queued_on_offline_gateway_fails(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({20, 0, 0, 0});
    h.store.set_server_online(1, false, at(1));
    auto t = h.ticks.tick(r.process_id, Seconds(1.0), at(2));
    EXPECT(t.outcome == TickOutcome::Failed, "gateway went away before start");
    EXPECT(h.available(1).cpu == 100, "credited to the decommissioned pool");
    EXPECT(h.store.audit().empty(), "conservation");
    return 0;
}

static int test_pause_and_resume(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({10, 0, 0, 0});
    h.ticks.tick(r.process_id, Seconds(5.0), at(5));

    auto denied = h.ticks.pause(r.process_id, 2, at(6));
    EXPECT(!denied.ok && denied.error == ErrorKind::PermissionDenied, "only the owner pauses");
    auto missing = h.ticks.pause(999, 1, at(6));
    EXPECT(!missing.ok && missing.error == ErrorKind::InvalidProcess, "unknown process");

    auto p = h.ticks.pause(r.process_id, 1, at(7));
    EXPECT(p.ok && p.state == ProcessState::Paused, "paused");
    EXPECT(h.store.process(r.process_id)->progress == 70.0, "work up to the pause is kept");
    EXPECT(h.ticks.tick(r.process_id, Seconds(100.0), at(100)).outcome == TickOutcome::Paused, "paused records idle");
    EXPECT(h.store.process(r.process_id)->progress == 70.0, "no progress while paused");
    EXPECT(h.available(1).cpu == 90, "reservation kept while paused");
    EXPECT(h.ticks.pause(r.process_id, 1, at(101)).ok, "pausing twice is a no-op");

    auto res = h.ticks.resume(r.process_id, 1, at(200));
    EXPECT(res.ok && res.state == ProcessState::Running, "resumed");
    auto t = h.ticks.advance_to(r.process_id, at(210));
    EXPECT(t.progress == 170.0, "paused time not counted");
    EXPECT(h.ticks.resume(r.process_id, 1, at(211)).ok, "resuming a running record is a no-op");
    return 0;
}

static int test_pause_can_finish_the_work(void)
{
    Harness h;
    h.seed();
    auto r = h.admit({100, 0, 0, 0});
    h.ticks.tick(r.process_id, Seconds(1.0), at(1));
    auto p = h.ticks.pause(r.process_id, 1, at(10));
    EXPECT(p.ok && p.state == ProcessState::Completed, "work finished before the pause took effect");
    EXPECT(h.available(1).cpu == 100, "credited");
    return 0;
}

static int test_racing_ticks_complete_once(void)
{
    for (int round = 0; round < 20; ++round) {
        Harness h;
        h.seed();
        auto r = h.admit({5, 0, 0, 0});
        h.ticks.tick(r.process_id, Seconds(59.0), at(59));
        std::atomic<int> events{0};
        h.events.subscribe([&](const LifecycleEvent&) { ++events; });

        std::atomic<int> completed{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                if (h.ticks.tick(r.process_id, Seconds(5.0), at(64)).outcome == TickOutcome::Completed) ++completed;
            });
        }
        for (auto& th : threads) th.join();
        EXPECT(completed.load() == 1, "one completion");
        EXPECT(events.load() == 1, "one event");
        EXPECT(h.available(1).cpu == 100, "one credit");
    }
    return 0;
}

int main(void)
{
    if (test_completes_after_sixty_seconds() != 0) return 1;
    if (test_progress_clamped() != 0) return 1;
    if (test_advance_to_uses_checkpoint() != 0) return 1;
    if (test_late_resume_keeps_checkpoint() != 0) return 1;
    if (test_unknown_process() != 0) return 1;
    if (test_target_gone_fails_and_credits() != 0) return 1;
    if (test_queued_on_offline_gateway_fails() != 0) return 1;
    if (test_pause_and_resume() != 0) return 1;
    if (test_pause_can_finish_the_work() != 0) return 1;
    if (test_racing_ticks_complete_once() != 0) return 1;
    return 0;
}
