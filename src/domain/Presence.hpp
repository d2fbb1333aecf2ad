#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "domain/Event.hpp"

namespace domain {

enum class PresenceAction { Viewing, Editing, Idle };

// What a client reports. Heartbeat and Left are signals, not stored states.
enum class PresenceSignal { Viewing, Editing, Idle, Heartbeat, Left };

inline const char* presenceActionToString(PresenceAction action) noexcept {
    switch (action) {
    case PresenceAction::Viewing:
        return "viewing";
    case PresenceAction::Editing:
        return "editing";
    case PresenceAction::Idle:
        return "idle";
    }
    return "viewing";
}

inline const char* presenceSignalToString(PresenceSignal signal) noexcept {
    switch (signal) {
    case PresenceSignal::Viewing:
        return "viewing";
    case PresenceSignal::Editing:
        return "editing";
    case PresenceSignal::Idle:
        return "idle";
    case PresenceSignal::Heartbeat:
        return "heartbeat";
    case PresenceSignal::Left:
        return "left";
    }
    return "viewing";
}

inline std::optional<PresenceSignal> presenceSignalFromString(std::string_view text) noexcept {
    if (text == "viewing") {
        return PresenceSignal::Viewing;
    }
    if (text == "editing") {
        return PresenceSignal::Editing;
    }
    if (text == "idle") {
        return PresenceSignal::Idle;
    }
    if (text == "heartbeat") {
        return PresenceSignal::Heartbeat;
    }
    if (text == "left") {
        return PresenceSignal::Left;
    }
    return std::nullopt;
}

struct PresenceState {
    UserId userId;
    std::string userName;
    PresenceAction action{PresenceAction::Viewing};
    TimestampMs timestamp{0};
};

}  // namespace domain
