/*
Admission controller tests.
*/
#include "harness.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <limits>
#include <sys/resource.h>
#include <thread>
#include <vector>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

using namespace procrt;
using testing_support::Harness;
using testing_support::t0;
using testing_support::TempDir;

static int test_exhaustion_scenario(void)
{
    Harness h;
    h.seed({100, 1000, 1000, 100});
    auto first = h.admit({50, 0, 0, 0});
    EXPECT(first.ok && first.error == ErrorKind::None, "first admission");
    EXPECT(first.reservation == (Resources{50, 0, 0, 0}), "reservation echoed");
    EXPECT(h.available(1).cpu == 50, "cpu_available=50");

    auto second = h.admit({60, 0, 0, 0});
    EXPECT(!second.ok && second.error == ErrorKind::ResourceExhausted, "second admission exhausted");
    EXPECT(h.available(1).cpu == 50, "cpu_available unchanged");
    EXPECT(h.store.processes().size() == 1, "no record for the rejected request");
    return 0;
}

static int test_admitted_record(void)
{
    Harness h;
    h.seed();
    AdmitRequest req;
    req.owner_id = 1;
    req.type = ProcessType::Hack;
    req.gateway_server_id = 1;
    req.target_server_id = 2;
    req.requested = {10, 64, 2, 1};
    req.difficulty = 0.5;
    auto r = h.admission.try_admit(req, t0());
    EXPECT(r.ok, "admitted");
    auto rec = h.store.process(r.process_id);
    EXPECT(rec, "record stored");
    EXPECT(rec->state == ProcessState::Queued, "starts queued");
    EXPECT(rec->required_work == 15.0, "work from the type range");
    EXPECT(rec->progress == 0.0 && !rec->completed_at, "fresh");
    EXPECT(rec->created_at == t0() && rec->last_checkpoint_at == t0(), "timestamps");
    EXPECT(rec->reservation == req.requested, "reservation stored verbatim");
    EXPECT(h.store.audit().empty(), "conservation");
    return 0;
}

static int test_zero_request_admitted(void)
{
    Harness h;
    h.seed({0, 0, 0, 0});
    auto r = h.admit({0, 0, 0, 0});
    EXPECT(r.ok, "empty reservation fits an empty pool");
    EXPECT(h.available(1).is_zero(), "pool untouched");
    return 0;
}

static int test_validation(void)
{
    Harness h;
    h.seed();
    auto wrong_owner = h.admit({1, 0, 0, 0}, ProcessType::Download, 2, 1, 2);
    EXPECT(!wrong_owner.ok && wrong_owner.error == ErrorKind::PermissionDenied, "gateway owned by someone else");

    auto no_gateway = h.admit({1, 0, 0, 0}, ProcessType::Download, 1, 9, 2);
    EXPECT(no_gateway.error == ErrorKind::InvalidProcess, "unknown gateway");

    auto no_target = h.admit({1, 0, 0, 0}, ProcessType::Download, 1, 1, 9);
    EXPECT(no_target.error == ErrorKind::InvalidProcess, "unknown target");

    auto unregistered = h.admit({1, 0, 0, 0}, ProcessType::Format);
    EXPECT(unregistered.error == ErrorKind::InvalidProcess, "type without a duration range");

    h.store.set_server_online(2, false, t0());
    auto offline = h.admit({1, 0, 0, 0});
    EXPECT(offline.error == ErrorKind::InvalidProcess, "decommissioned target");

    EXPECT(h.available(1).cpu == 100, "rejections never debit");
    EXPECT(h.store.processes().empty(), "rejections never insert");
    return 0;
}

static int test_non_finite_difficulty_rejected(void)
{
    TempDir dir("admission_nan");
    const auto path = dir.file("procrt.journal");
    ProcessId kept = 0;
    {
        Harness h(StoreOptions{path});
        h.seed();
        AdmitRequest req;
        req.owner_id = 1;
        req.type = ProcessType::Hack;
        req.gateway_server_id = 1;
        req.target_server_id = 2;
        req.requested = {10, 0, 0, 0};
        req.difficulty = std::numeric_limits<double>::quiet_NaN();
        auto nan = h.admission.try_admit(req, t0());
        EXPECT(!nan.ok && nan.error == ErrorKind::InvalidProcess, "nan difficulty rejected");
        req.difficulty = std::numeric_limits<double>::infinity();
        EXPECT(h.admission.try_admit(req, t0()).error == ErrorKind::InvalidProcess, "infinite difficulty rejected");
        EXPECT(h.available(1).cpu == 100, "nothing debited");

        auto ok = h.admit({10, 0, 0, 0});
        EXPECT(ok.ok, "normal admission");
        kept = ok.process_id;
    }
    Harness reopened(StoreOptions{path});
    EXPECT(reopened.store.process(kept), "later commit survives reopen");
    EXPECT(reopened.available(1).cpu == 90, "pool matches the journal");
    return 0;
}

static int test_concurrent_admissions_never_oversubscribe(void)
{
    Harness h;
    h.seed({100, 1000, 1000, 100});
    std::atomic<int> admitted{0};
    std::atomic<int> exhausted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                auto r = h.admit({3, 10, 0, 0});
                if (r.ok) ++admitted;
                else if (r.error == ErrorKind::ResourceExhausted) ++exhausted;
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT(admitted.load() == 33, "exactly floor(100 / 3) admissions");
    EXPECT(exhausted.load() == 80 - 33, "the rest exhausted");
    EXPECT(h.available(1).cpu == 1, "one cpu left");
    EXPECT(h.store.audit().empty(), "conservation under contention");
    return 0;
}

static int test_store_failure_leaves_pool(void)
{
    TempDir dir("admission_store");
    Harness h(StoreOptions{dir.file("procrt.journal")});
    h.seed();
    EXPECT(h.admit({10, 0, 0, 0}).ok, "admit while healthy");

    // Cap the file size at what is already written so the next append fails.
    std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit saved;
    getrlimit(RLIMIT_FSIZE, &saved);
    struct rlimit capped = saved;
    capped.rlim_cur = static_cast<rlim_t>(std::filesystem::file_size(dir.file("procrt.journal")));
    setrlimit(RLIMIT_FSIZE, &capped);
    auto failed = h.admit({20, 0, 0, 0});
    setrlimit(RLIMIT_FSIZE, &saved);

    EXPECT(!failed.ok && failed.error == ErrorKind::StoreUnavailable, "store failure reported");
    EXPECT(h.available(1).cpu == 90, "pool unchanged by the failed admission");
    EXPECT(h.store.processes().size() == 1, "no half-applied insert");

    auto retried = h.admit({20, 0, 0, 0});
    EXPECT(retried.ok, "retry after the store recovers");
    EXPECT(h.available(1).cpu == 70, "retry debits once");

    Harness reopened(StoreOptions{dir.file("procrt.journal")});
    EXPECT(reopened.available(1).cpu == 70, "journal holds exactly the committed admissions");
    EXPECT(reopened.store.processes().size() == 2, "two records");
    return 0;
}

int main(void)
{
    if (test_exhaustion_scenario() != 0) return 1;
    if (test_admitted_record() != 0) return 1;
    if (test_zero_request_admitted() != 0) return 1;
    if (test_validation() != 0) return 1;
    if (test_non_finite_difficulty_rejected() != 0) return 1;
    if (test_concurrent_admissions_never_oversubscribe() != 0) return 1;
    if (test_store_failure_leaves_pool() != 0) return 1;
    return 0;
}
