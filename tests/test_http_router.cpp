#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <boost/json.hpp>

#include "adapters/api/http/QueryParams.hpp"
#include "adapters/api/http/Router.hpp"
#include "adapters/duckdb/DuckEventLog.hpp"
#include "adapters/duckdb/DuckSequenceCounter.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "core/ConnectionRegistry.hpp"

namespace {

using adapters::api::http::Request;
using adapters::api::http::Response;

Request makeRequest(const std::string& method, const std::string& target, const std::string& body = {}) {
    Request request;
    request.method = method;
    request.target = target;
    adapters::api::http::split_target(target, request.path, request.query);
    request.body = body;
    return request;
}

std::string errorCode(const Response& response) {
    const auto json = boost::json::parse(response.body).as_object();
    const auto* error = json.if_contains("error");
    return error != nullptr && error->is_string() ? std::string(error->as_string().c_str()) : std::string{};
}

}  // namespace

int main() {
    adapters::duckdb::DuckStore duck(":memory:");
    duck.migrate();
    auto log = std::make_shared<adapters::duckdb::DuckEventLog>(duck);
    auto store = std::make_shared<core::EventStore>(log, core::EventStore::Options{});
    auto registry = std::make_shared<core::ConnectionRegistry>();
    auto sequences =
        std::make_shared<core::SequenceService>(std::make_shared<adapters::duckdb::DuckSequenceCounter>(duck));
    auto emitter = std::make_shared<app::EventEmitter>(sequences, store, registry, app::EventEmitter::Options{});
    auto presence = std::make_shared<core::PresenceTracker>();
    adapters::api::http::Router router(emitter, presence);

    if (router.handle(makeRequest("GET", "/healthz")).statusCode != 200) {
        std::cerr << "healthz must answer 200\n";
        return 1;
    }
    auto missing = router.handle(makeRequest("GET", "/nope"));
    if (missing.statusCode != 404 || errorCode(missing) != "not_found") {
        std::cerr << "Unknown route must answer 404\n";
        return 1;
    }

    // Emitting over HTTP allocates consecutive sequence numbers per tenant.
    const std::string body = R"({"tenantId":"acme","eventType":"lead_created","payload":{"id":"L1"}})";
    auto first = router.handle(makeRequest("POST", "/v1/events", body));
    auto second = router.handle(makeRequest("POST", "/v1/events", body));
    if (first.statusCode != 202 || second.statusCode != 202) {
        std::cerr << "POST /v1/events must accept a valid event, got " << first.statusCode << "\n";
        return 1;
    }
    const auto secondJson = boost::json::parse(second.body).as_object();
    if (secondJson.at("sequenceNumber").as_int64() != 2 || secondJson.at("id").as_string().empty()) {
        std::cerr << "Expected the second event to carry sequence 2\n";
        return 1;
    }
    const auto stored = store->getEventsSince("acme", 0, 10);
    if (stored.events.size() != 2 || stored.events[0].payload.as_object().at("id").as_string() != "L1") {
        std::cerr << "Emitted events must be retrievable from the store\n";
        return 1;
    }

    struct BadCase {
        std::string body;
        std::string code;
    };
    const BadCase badCases[] = {
        {"not json", "body_invalid"},
        {R"({"eventType":"lead_created"})", "tenant_required"},
        {R"({"tenantId":"acme","eventType":"lead_exploded"})", "event_type_invalid"},
        {R"({"tenantId":"acme","eventType":"account_locked"})", "body_invalid"},
        {R"({"tenantId":"acme","eventType":"lead_created","userId":5})", "body_invalid"},
    };
    for (const auto& bad : badCases) {
        const auto response = router.handle(makeRequest("POST", "/v1/events", bad.body));
        if (response.statusCode != 400 || errorCode(response) != bad.code) {
            std::cerr << "Expected 400 " << bad.code << " for " << bad.body << ", got " << response.statusCode << ' '
                      << errorCode(response) << "\n";
            return 1;
        }
    }
    const auto lifecycle = router.handle(
        makeRequest("POST", "/v1/events", R"({"tenantId":"acme","eventType":"account_locked","userId":"u1"})"));
    if (lifecycle.statusCode != 202) {
        std::cerr << "Lifecycle event with a user must be accepted\n";
        return 1;
    }

    // Presence lookup.
    presence->trackPresence("acme", "u1", "Ana Lima", "lead", "L1", domain::PresenceSignal::Editing);
    const auto lookup = router.handle(makeRequest("GET", "/v1/presence?tenantId=acme&entityType=lead&entityId=L1"));
    if (lookup.statusCode != 200) {
        std::cerr << "Presence lookup failed with " << lookup.statusCode << "\n";
        return 1;
    }
    const auto lookupJson = boost::json::parse(lookup.body).as_object();
    const auto& users = lookupJson.at("users").as_array();
    if (users.size() != 1 || users[0].as_object().at("userName").as_string() != "Ana Lima" ||
        users[0].as_object().at("action").as_string() != "editing") {
        std::cerr << "Unexpected presence body: " << lookup.body << "\n";
        return 1;
    }
    const auto otherTenant = router.handle(makeRequest("GET", "/v1/presence?tenantId=other&entityType=lead&entityId=L1"));
    if (boost::json::parse(otherTenant.body).as_object().at("users").as_array().size() != 0) {
        std::cerr << "Presence lookup leaked across tenants\n";
        return 1;
    }
    const auto incomplete = router.handle(makeRequest("GET", "/v1/presence?tenantId=acme&entityType=lead"));
    if (incomplete.statusCode != 400 || errorCode(incomplete) != "entity_required") {
        std::cerr << "Presence lookup without entity must be rejected\n";
        return 1;
    }

    // Per-route request counters show up in the metrics document.
    const auto metrics = router.handle(makeRequest("GET", "/metrics"));
    const auto metricsJson = boost::json::parse(metrics.body).as_object();
    const auto& counters = metricsJson.at("counters").as_object();
    const auto* posts = counters.if_contains("http_requests_total{route=POST /v1/events}");
    if (metrics.statusCode != 200 || posts == nullptr || posts->to_number<std::uint64_t>() < 8) {
        std::cerr << "Route counter missing from metrics: " << metrics.body << "\n";
        return 1;
    }

    return 0;
}
