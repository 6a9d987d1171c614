/*
Service facade tests: request parsing and JSON replies.
*/
#include "harness.hpp"
#include "svc/process_service.hpp"
#include "svc/requests.hpp"

#include <cstdio>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

using nlohmann::json;
using namespace procrt;
using testing_support::at;
using testing_support::t0;

struct ServiceFixture {
    TypeRegistry types;
    Store store;
    EventBus events;
    LinearThroughput policy;
    svc::ProcessService service{store, types, policy, events};

    ServiceFixture() {
        testing_support::register_test_types(types);
        store.put_server(1, 1, {100, 1000, 1000, 100}, t0());
        store.put_server(2, 2, {100, 1000, 1000, 100}, t0());
    }
};

static json create_cmd(uint64_t owner, const std::string& type, uint64_t cpu)
{
    json j = json::parse(R"({"cmd":"create","gateway_server_id":1,"target_server_id":2})");
    j["owner_id"] = owner;
    j["process_type"] = type;
    j["requested_resources"] = json{{"cpu", cpu}};
    return j;
}

static int test_create_replies(void)
{
    ServiceFixture f;
    auto reply = svc::to_json(f.service.create(svc::create_request_from_json(create_cmd(1, "download", 50)), t0()));
    EXPECT(reply["status"] == "ok", "created");
    EXPECT(reply["process_id"].get<uint64_t>() > 0, "id returned");
    EXPECT(reply["reservation"]["cpu"] == 50 && reply["reservation"]["ram"] == 0, "reservation returned");

    reply = svc::to_json(f.service.create(svc::create_request_from_json(create_cmd(1, "download", 60)), t0()));
    EXPECT(reply["status"] == "error" && reply["error"] == "resource_exhausted", "exhausted");

    reply = svc::to_json(f.service.create(svc::create_request_from_json(create_cmd(1, "ddos", 1)), t0()));
    EXPECT(reply["error"] == "invalid_process", "unknown type name");

    reply = svc::to_json(f.service.create(svc::create_request_from_json(create_cmd(2, "hack", 1)), t0()));
    EXPECT(reply["error"] == "permission_denied", "foreign gateway");
    return 0;
}

static int test_request_parsing(void)
{
    auto req = svc::create_request_from_json(
        json::parse(R"({"owner_id":3,"process_type":"hack","gateway_server_id":4,"difficulty":0.25})"));
    EXPECT(req.target_server_id == 4, "target defaults to the gateway");
    EXPECT(req.requested.is_zero(), "resources default to zero");
    EXPECT(req.difficulty == 0.25, "difficulty");

    bool threw = false;
    try {
        svc::process_request_from_json(json::parse(R"({"process_id":"seven"})"));
    } catch (const json::exception&) {
        threw = true;
    }
    EXPECT(threw, "malformed request raises");
    return 0;
}

static bool create_refused(const char* text)
{
    try {
        svc::create_request_from_json(json::parse(text));
    } catch (const svc::RequestError&) {
        return true;
    }
    return false;
}

static int test_amounts_must_be_unsigned_integers(void)
{
    EXPECT(create_refused(R"({"owner_id":1,"process_type":"hack","gateway_server_id":1,
                              "requested_resources":{"cpu":-5}})"), "negative cpu refused");
    EXPECT(create_refused(R"({"owner_id":1,"process_type":"hack","gateway_server_id":1,
                              "requested_resources":{"ram":2.9}})"), "fractional ram refused");
    EXPECT(create_refused(R"({"owner_id":-1,"process_type":"hack","gateway_server_id":1})"), "negative owner refused");
    EXPECT(create_refused(R"({"owner_id":1,"process_type":"hack","gateway_server_id":1.5})"), "fractional gateway refused");
    EXPECT(create_refused(R"({"owner_id":1,"process_type":"hack","gateway_server_id":1,"target_server_id":-2})"),
           "negative target refused");
    EXPECT(create_refused(R"({"owner_id":1,"process_type":"hack","gateway_server_id":1,
                              "requested_resources":[1,2]})"), "resources must be an object");

    bool refused = false;
    try {
        svc::process_request_from_json(json::parse(R"({"owner_id":1,"process_id":-7})"));
    } catch (const svc::RequestError&) {
        refused = true;
    }
    EXPECT(refused, "negative process id refused");

    json built{{"owner_id", 1}, {"process_type", "hack"}, {"gateway_server_id", 2},
               {"requested_resources", {{"cpu", 3}, {"net", 18446744073709551615ull}}}};
    auto req = svc::create_request_from_json(built);
    EXPECT(req.gateway_server_id == 2 && req.requested.cpu == 3, "signed non-negative values accepted");
    EXPECT(req.requested.net == 18446744073709551615ull, "full unsigned range accepted");
    return 0;
}

static int test_cancel_always_ok(void)
{
    ServiceFixture f;
    auto created = f.service.create(svc::create_request_from_json(create_cmd(1, "download", 10)), t0());

    json expected{{"status", "ok"}, {"process_id", created.process_id}};
    EXPECT(svc::to_json(f.service.cancel({2, created.process_id}, at(1))) == expected, "wrong owner still ok");
    EXPECT(f.store.process(created.process_id)->state == ProcessState::Queued, "wrong owner changed nothing");
    EXPECT(svc::to_json(f.service.cancel({1, created.process_id}, at(1))) == expected, "owner ok");
    EXPECT(svc::to_json(f.service.cancel({1, created.process_id}, at(2))) == expected, "repeat ok");
    EXPECT(svc::to_json(f.service.cancel({1, 999}, at(2)))["status"] == "ok", "unknown ok");
    EXPECT(f.store.process(created.process_id)->state == ProcessState::Cancelling, "cancelling");

    f.service.cancellation().complete_cancellation(created.process_id, at(3));
    EXPECT(f.service.server(1)->pool.available.cpu == 100, "reclaimed");
    return 0;
}

static int test_queries(void)
{
    ServiceFixture f;
    auto a = f.service.create(svc::create_request_from_json(create_cmd(1, "download", 10)), t0());
    f.service.create(svc::create_request_from_json(create_cmd(1, "port_scan", 10)), t0());
    auto other = create_cmd(2, "hack", 10);
    other["gateway_server_id"] = 2;
    other["target_server_id"] = 1;
    f.service.create(svc::create_request_from_json(other), t0());

    auto mine = svc::to_json(f.service.get({1, a.process_id}));
    EXPECT(mine["status"] == "ok" && mine["process"]["state"] == "queued", "get own process");
    EXPECT(mine["process"]["completed_at"].is_null(), "not finished");
    EXPECT(mine["process"]["process_type"] == "download", "type name");

    auto theirs = svc::to_json(f.service.get({2, a.process_id}));
    EXPECT(theirs["error"] == "permission_denied", "someone else's process");
    EXPECT(svc::to_json(f.service.get({1, 4242}))["error"] == "invalid_process", "unknown process");

    auto list = svc::list_reply(f.service.list(1));
    EXPECT(list["processes"].size() == 2, "owner 1 has two");

    auto paused = svc::to_json(a.process_id, f.service.pause({1, a.process_id}, at(1)));
    EXPECT(paused["status"] == "ok" && paused["state"] == "queued", "queued cannot pause, no error");
    f.service.ticks().advance_to(a.process_id, at(1));
    paused = svc::to_json(a.process_id, f.service.pause({1, a.process_id}, at(2)));
    EXPECT(paused["state"] == "paused", "running pauses");
    auto resumed = svc::to_json(a.process_id, f.service.resume({1, a.process_id}, at(3)));
    EXPECT(resumed["state"] == "running", "resumes");
    EXPECT(svc::to_json(a.process_id, f.service.resume({2, a.process_id}, at(3)))["error"] == "permission_denied",
           "foreign resume");

    auto audit = svc::audit_reply(f.service.audit());
    EXPECT(audit["consistent"] == true && audit["violations"].empty(), "audit clean");
    auto server = svc::to_json(*f.service.server(1));
    EXPECT(server["available"]["cpu"] == 80 && server["total"]["cpu"] == 100, "server view");
    return 0;
}

static int test_event_json(void)
{
    LifecycleEvent evt{5, 1, 1, ProcessState::Failed, {1, 2, 3, 4}, at(2)};
    auto j = svc::to_json(evt);
    EXPECT(j["state"] == "failed" && j["freed"]["net"] == 4, "event fields");
    EXPECT(j["at"] == to_millis(at(2)), "event time in ms");
    return 0;
}

int main(void)
{
    if (test_create_replies() != 0) return 1;
    if (test_request_parsing() != 0) return 1;
    if (test_amounts_must_be_unsigned_integers() != 0) return 1;
    if (test_cancel_always_ok() != 0) return 1;
    if (test_queries() != 0) return 1;
    if (test_event_json() != 0) return 1;
    return 0;
}
