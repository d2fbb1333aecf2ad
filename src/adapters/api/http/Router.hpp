#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "adapters/api/http/HttpTypes.hpp"
#include "app/EventEmitter.hpp"
#include "core/PresenceTracker.hpp"

namespace adapters::api::http {

namespace errors {
inline constexpr std::string_view tenant_required = "tenant_required";
inline constexpr std::string_view entity_required = "entity_required";
inline constexpr std::string_view event_type_invalid = "event_type_invalid";
inline constexpr std::string_view body_invalid = "body_invalid";
inline constexpr std::string_view emit_failed = "emit_failed";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view internal_error = "internal_error";
}  // namespace errors

Response json_error(int statusCode, std::string_view errorCode);

// Plain HTTP side channel served on the WebSocket port.
class Router {
public:
    Router(std::shared_ptr<app::EventEmitter> emitter, std::shared_ptr<const core::PresenceTracker> presence);

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    Response postEvent_(const Request& request) const;
    Response getPresence_(const Request& request) const;

    std::shared_ptr<app::EventEmitter> emitter_;
    std::shared_ptr<const core::PresenceTracker> presence_;
    std::map<std::string, Handler> routes_;
};

Response healthz();
Response metrics();

}  // namespace adapters::api::http
