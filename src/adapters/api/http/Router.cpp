#include "adapters/api/http/Router.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <boost/json.hpp>

#include "adapters/api/http/QueryParams.hpp"
#include "common/Metrics.hpp"
#include "logging/Log.h"

namespace adapters::api::http {

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::NET;

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

Response makeJsonResponse(int statusCode, std::string body) {
    Response response;
    response.statusCode = statusCode;
    response.body = std::move(body);
    return response;
}

std::optional<std::string> stringField(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    const auto& str = value->as_string();
    return std::string(str.data(), str.size());
}

}  // namespace

Response json_error(int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());
    return makeJsonResponse(statusCode, boost::json::serialize(payload));
}

Response healthz() { return makeJsonResponse(200, R"({"status":"ok"})"); }

Response metrics() {
    const auto snapshot = tsync::common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }

    boost::json::object gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        gauges[key] = gauge.value;
    }

    boost::json::object latencies;
    for (const auto& [key, latency] : snapshot.latencies) {
        boost::json::object row;
        row["samples"] = latency.samples;
        row["avg_ms"] = latency.averageMs ? boost::json::value(*latency.averageMs) : boost::json::value(nullptr);
        row["p95_ms"] = latency.p95Ms ? boost::json::value(*latency.p95Ms) : boost::json::value(nullptr);
        row["p99_ms"] = latency.p99Ms ? boost::json::value(*latency.p99Ms) : boost::json::value(nullptr);
        latencies[key] = std::move(row);
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["counters"] = std::move(counters);
    payload["gauges"] = std::move(gauges);
    payload["latencies"] = std::move(latencies);
    return makeJsonResponse(200, boost::json::serialize(payload));
}

Router::Router(std::shared_ptr<app::EventEmitter> emitter, std::shared_ptr<const core::PresenceTracker> presence)
    : emitter_(std::move(emitter)), presence_(std::move(presence)) {
    routes_.emplace(makeKey("GET", "/healthz"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/metrics"), [](const Request&) { return metrics(); });
    routes_.emplace(makeKey("POST", "/v1/events"), [this](const Request& request) { return postEvent_(request); });
    routes_.emplace(makeKey("GET", "/v1/presence"), [this](const Request& request) { return getPresence_(request); });
}

Response Router::handle(const Request& request) const {
    const auto key = makeKey(request.method, request.path);
    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        return json_error(404, errors::not_found);
    }

    tsync::common::metrics::Registry::instance().incrementCounter("http_requests_total{route=" + key + "}");
    try {
        return it->second(request);
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "HTTP handler failed route=%s: %s", key.c_str(), ex.what());
        return json_error(500, errors::internal_error);
    }
}

Response Router::postEvent_(const Request& request) const {
    boost::json::error_code ec;
    auto body = boost::json::parse(request.body, ec);
    if (ec || !body.is_object()) {
        return json_error(400, errors::body_invalid);
    }
    const auto& obj = body.as_object();

    const auto tenantId = stringField(obj, "tenantId");
    if (!tenantId || tenantId->empty()) {
        return json_error(400, errors::tenant_required);
    }
    const auto typeText = stringField(obj, "eventType");
    const auto type = typeText ? domain::eventTypeFromString(*typeText) : std::nullopt;
    if (!type) {
        return json_error(400, errors::event_type_invalid);
    }

    std::optional<domain::UserId> userId;
    if (const auto* user = obj.if_contains("userId"); user != nullptr && !user->is_null()) {
        if (!user->is_string()) {
            return json_error(400, errors::body_invalid);
        }
        userId = stringField(obj, "userId");
    }
    if (domain::isSessionLifecycle(*type) && (!userId || userId->empty())) {
        return json_error(400, errors::body_invalid);
    }

    boost::json::value payload = boost::json::object{};
    if (const auto* value = obj.if_contains("payload"); value != nullptr) {
        payload = *value;
    }

    const auto event = emitter_->emit(*tenantId, *type, std::move(payload), std::move(userId));
    if (!event) {
        return json_error(503, errors::emit_failed);
    }

    boost::json::object result;
    result["id"] = event->id;
    result["sequenceNumber"] = event->sequenceNumber;
    return makeJsonResponse(202, boost::json::serialize(result));
}

Response Router::getPresence_(const Request& request) const {
    const auto tenantId = opt_string(request, "tenantId");
    if (!tenantId || tenantId->empty()) {
        return json_error(400, errors::tenant_required);
    }
    const auto entityType = opt_string(request, "entityType");
    const auto entityId = opt_string(request, "entityId");
    if (!entityType || entityType->empty() || !entityId || entityId->empty()) {
        return json_error(400, errors::entity_required);
    }

    boost::json::array users;
    for (const auto& state : presence_->getPresence(*tenantId, *entityType, *entityId)) {
        boost::json::object row;
        row["userId"] = state.userId;
        row["userName"] = state.userName;
        row["action"] = domain::presenceActionToString(state.action);
        row["timestamp"] = state.timestamp;
        users.emplace_back(std::move(row));
    }

    boost::json::object payload;
    payload["entityType"] = *entityType;
    payload["entityId"] = *entityId;
    payload["users"] = std::move(users);
    return makeJsonResponse(200, boost::json::serialize(payload));
}

}  // namespace adapters::api::http
