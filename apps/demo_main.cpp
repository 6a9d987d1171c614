#include "procrt/engine.hpp"
#include "procrt/reporting.hpp"
#include "procrt/store.hpp"
#include "procrt/throughput.hpp"
#include "procrt/type_registry.hpp"
#include "svc/process_service.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <vector>

using namespace procrt;

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--csv-report") reporting::set_csv(true);
        if (a == "--verbose") reporting::set_verbose(true);
    }

    // Short durations so the whole run takes a couple of seconds.
    TypeRegistry types;
    types.register_type({ProcessType::Download, 2.0, 4.0});
    types.register_type({ProcessType::Hack, 1.0, 3.0});
    types.register_type({ProcessType::PortScan, 1.0, 1.0});

    Store store;
    auto now = Clock::now();
    store.put_server(1, 100, {8, 4096, 1000, 100}, now);
    store.put_server(2, 200, {4, 2048, 500, 50}, now);

    EventBus events;
    events.subscribe([](const LifecycleEvent& evt) { reporting::report_event(evt); });
    auto policy = make_typed_policy(1.0, 0.5);
    svc::ProcessService service(store, types, *policy, events);

    EngineOptions opts;
    opts.workers = 2;
    opts.tick_interval = std::chrono::milliseconds(100);
    Engine engine(store, service.ticks(), opts);
    engine.start();

    std::vector<svc::CreateRequest> requests{
        {100, "download", 1, 2, {2, 256, 0, 4}, 0.0},
        {100, "hack", 1, 2, {4, 512, 0, 0}, 0.5},
        {100, "port_scan", 1, 2, {2, 128, 0, 0}, 0.0},
        {100, "hack", 1, 2, {4, 0, 0, 0}, 0.0},  // no room left
    };
    std::vector<std::future<LifecycleEvent>> done;
    ProcessId scan = 0;
    for (const auto& req : requests) {
        auto r = service.create(req, Clock::now());
        std::cout << "create " << req.process_type << ": " << (r.ok ? "ok" : std::string(to_string(r.error)))
                  << " id=" << r.process_id << "\n";
        if (!r.ok) continue;
        done.push_back(events.wait_for(r.process_id));
        if (req.process_type == "port_scan") scan = r.process_id;
    }

    service.cancel({200, scan}, Clock::now());  // wrong owner, ignored
    service.cancel({100, scan}, Clock::now());

    for (auto& f : done) {
        auto evt = f.get();
        std::cout << "process " << evt.process_id << " finished as " << to_string(evt.state) << "\n";
    }
    engine.stop();

    auto server = store.server(1);
    std::cout << "server 1 available " << server->pool.available.to_string() << " of "
              << server->pool.total.to_string() << "\n";
    std::cout << "audit: " << (store.audit().empty() ? "consistent" : "VIOLATED") << "\n";
    return 0;
}
