#include "procrt/engine.hpp"
#include "procrt/reporting.hpp"
#include "procrt/store.hpp"
#include "procrt/throughput.hpp"
#include "procrt/type_registry.hpp"
#include "svc/process_service.hpp"
#include "svc/requests.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using nlohmann::json;
using namespace procrt;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--journal=PATH] [--workers=N] [--tick-ms=N] "
              << "[--server=ID:OWNER:CPU:RAM:HDD:NET]... [--type=NAME:MIN:MAX]...\n";
    std::cout << "  --policy=linear|typed throughput policy (default linear)\n";
    std::cout << "  --cpu-weight=X        work units per second per CPU unit\n";
    std::cout << "  --net-weight=X        work units per second per NET unit\n";
    std::cout << "  --csv-report          emit lifecycle events as CSV (id,state,owner,gateway,cpu,ram,hdd,net,at_ms)\n";
    std::cout << "  --verbose             log every tick\n";
    std::cout << "  --compact-on-exit     snapshot the journal before exiting\n";
    std::cout << "Commands are read from stdin, one JSON object per line, e.g.\n"
              << "  {\"cmd\":\"create\",\"owner_id\":1,\"process_type\":\"download\",\"gateway_server_id\":1,"
              << "\"target_server_id\":2,\"requested_resources\":{\"cpu\":50}}\n"
              << "  cmd: create cancel pause resume get list server audit compact quit\n";
}

unsigned parse_unsigned(const std::string& value, unsigned default_value) {
    unsigned result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return default_value;
        result = result * 10 + static_cast<unsigned>(c - '0');
    }
    return result > 0 ? result : default_value;
}

double parse_double(const std::string& value, double default_value) {
    char* end = nullptr;
    double v = std::strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || !std::isfinite(v)) return default_value;
    return v;
}

std::vector<std::string> split(const std::string& spec, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= spec.size()) {
        auto pos = spec.find(sep, start);
        if (pos == std::string::npos) pos = spec.size();
        parts.push_back(spec.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

struct ServerSpec {
    ServerId id{};
    OwnerId owner{};
    Resources total{};
};

bool parse_server(const std::string& spec, ServerSpec& out) {
    auto parts = split(spec, ':');
    if (parts.size() != 6) return false;
    try {
        out.id = std::stoull(parts[0]);
        out.owner = std::stoull(parts[1]);
        out.total = {std::stoull(parts[2]), std::stoull(parts[3]), std::stoull(parts[4]), std::stoull(parts[5])};
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parse_type(const std::string& spec, TypeSpec& out) {
    auto parts = split(spec, ':');
    if (parts.size() != 3) return false;
    auto type = parse_process_type(parts[0]);
    if (!type) return false;
    out.type = *type;
    out.min_seconds = parse_double(parts[1], -1.0);
    out.max_seconds = parse_double(parts[2], -1.0);
    return TypeRegistry::valid(out);
}

json handle(const json& cmd, svc::ProcessService& service, Store& store, bool& quit) {
    const auto name = cmd.at("cmd").get<std::string>();
    const auto now = Clock::now();
    if (name == "create") return svc::to_json(service.create(svc::create_request_from_json(cmd), now));
    if (name == "cancel") return svc::to_json(service.cancel(svc::process_request_from_json(cmd), now));
    if (name == "pause" || name == "resume") {
        auto req = svc::process_request_from_json(cmd);
        return svc::to_json(req.process_id, name == "pause" ? service.pause(req, now) : service.resume(req, now));
    }
    if (name == "get") return svc::to_json(service.get(svc::process_request_from_json(cmd)));
    if (name == "list") return svc::list_reply(service.list(svc::unsigned_field(cmd, "owner_id")));
    if (name == "server") {
        auto id = svc::unsigned_field(cmd, "server_id");
        auto row = service.server(id);
        if (!row) return svc::error_reply(ErrorKind::InvalidProcess, "unknown server " + std::to_string(id));
        return json{{"status", "ok"}, {"server", svc::to_json(*row)}};
    }
    if (name == "audit") return svc::audit_reply(service.audit());
    if (name == "compact") {
        store.compact();
        return json{{"status", "ok"}, {"commits", store.commits()}};
    }
    if (name == "quit") {
        quit = true;
        return json{{"status", "ok"}};
    }
    return svc::error_reply("invalid_request", "unknown command '" + name + "'");
}

} // namespace

int main(int argc, char** argv) {
    std::string journal_path;
    if (const char* env = std::getenv("PROCRT_JOURNAL")) journal_path = env;
    EngineOptions engine_opts;
    std::vector<ServerSpec> servers;
    std::vector<TypeSpec> type_overrides;
    std::string policy_name = "linear";
    double cpu_weight = 1.0;
    double net_weight = 1.0;
    bool net_weight_set = false;
    bool csv_report = false;
    bool verbose = false;
    bool compact_on_exit = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg.rfind("--journal=", 0) == 0) {
            journal_path = arg.substr(sizeof("--journal=") - 1);
            continue;
        }
        if (arg.rfind("--workers=", 0) == 0) {
            engine_opts.workers = parse_unsigned(arg.substr(sizeof("--workers=") - 1), engine_opts.workers);
            continue;
        }
        if (arg.rfind("--tick-ms=", 0) == 0) {
            auto ms = parse_unsigned(arg.substr(sizeof("--tick-ms=") - 1),
                                     static_cast<unsigned>(engine_opts.tick_interval.count()));
            engine_opts.tick_interval = std::chrono::milliseconds(ms);
            continue;
        }
        if (arg.rfind("--server=", 0) == 0) {
            ServerSpec spec;
            if (!parse_server(arg.substr(sizeof("--server=") - 1), spec)) {
                std::cerr << "Bad server spec: " << arg << "\n";
                return 1;
            }
            servers.push_back(spec);
            continue;
        }
        if (arg.rfind("--type=", 0) == 0) {
            TypeSpec spec;
            if (!parse_type(arg.substr(sizeof("--type=") - 1), spec)) {
                std::cerr << "Bad type spec: " << arg << "\n";
                return 1;
            }
            type_overrides.push_back(spec);
            continue;
        }
        if (arg.rfind("--policy=", 0) == 0) {
            policy_name = arg.substr(sizeof("--policy=") - 1);
            continue;
        }
        if (arg.rfind("--cpu-weight=", 0) == 0) {
            cpu_weight = parse_double(arg.substr(sizeof("--cpu-weight=") - 1), cpu_weight);
            continue;
        }
        if (arg.rfind("--net-weight=", 0) == 0) {
            net_weight = parse_double(arg.substr(sizeof("--net-weight=") - 1), net_weight);
            net_weight_set = true;
            continue;
        }
        if (arg == "--csv-report") {
            csv_report = true;
            continue;
        }
        if (arg == "--verbose") {
            verbose = true;
            continue;
        }
        if (arg == "--compact-on-exit") {
            compact_on_exit = true;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    reporting::set_csv(csv_report);
    reporting::set_verbose(verbose);

    TypeRegistry types;
    register_default_types(types);
    for (const auto& spec : type_overrides) {
        if (!types.register_type(spec)) {
            std::cerr << "Bad type range for " << to_string(spec.type) << "\n";
            return 1;
        }
    }

    std::unique_ptr<ThroughputPolicy> policy;
    if (policy_name == "linear") {
        ThroughputWeights w;
        w.cpu = cpu_weight;
        if (net_weight_set) w.net = net_weight;
        policy = make_linear_policy(w);
    } else if (policy_name == "typed") {
        policy = make_typed_policy(cpu_weight, net_weight);
    } else {
        std::cerr << "Unknown policy: " << policy_name << "\n";
        return 1;
    }

    std::unique_ptr<Store> store;
    try {
        store = std::make_unique<Store>(StoreOptions{journal_path});
        for (const auto& s : servers) {
            if (!store->put_server(s.id, s.owner, s.total, Clock::now()))
                reporting::warn("procd", "server " + std::to_string(s.id) + " has more reserved than " +
                                             s.total.to_string());
        }
    } catch (const StoreError& e) {
        std::cerr << "store: " << e.what() << "\n";
        return 1;
    }

    EventBus events;
    events.subscribe([](const LifecycleEvent& evt) { reporting::report_event(evt); });
    svc::ProcessService service(*store, types, *policy, events);
    Engine engine(*store, service.ticks(), engine_opts);
    engine.start();
    reporting::info("procd", "policy " + policy->name() + ", " + std::to_string(store->servers().size()) +
                                 " servers, " + std::to_string(store->active_processes().size()) + " active processes");

    std::string line;
    bool quit = false;
    while (!quit && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        json reply;
        try {
            reply = handle(json::parse(line), service, *store, quit);
        } catch (const json::exception& e) {
            reply = svc::error_reply("invalid_request", e.what());
        } catch (const svc::RequestError& e) {
            reply = svc::error_reply("invalid_request", e.what());
        } catch (const StoreError& e) {
            reply = svc::error_reply(ErrorKind::StoreUnavailable, e.what());
        }
        reporting::emit(reply.dump());
    }

    engine.stop();
    if (compact_on_exit) {
        try {
            store->compact();
        } catch (const StoreError& e) {
            std::cerr << "compact: " << e.what() << "\n";
            return 1;
        }
    }
    return 0;
}
