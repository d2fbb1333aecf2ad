#pragma once

#include <string>
#include <vector>

#include "domain/Event.hpp"

namespace client {

// Which cached views an applied event makes stale. List keys ("leads") cover
// collection views; detail keys ("lead/<id>") are added when the payload names
// the record.
class InvalidationTable {
public:
    static std::vector<std::string> keysFor(const domain::Event& event);

    // Collection key for the event type, or "session" for lifecycle events.
    static const char* scopeFor(domain::EventType type) noexcept;
};

}  // namespace client
