#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_engine/session/call_session.hpp"

namespace call_engine::telephony {

enum class EventType {
    CallAnswered,
    PlaybackStarted,
    PlaybackEnded,
    CallHangup,
    Other,
};

struct TelephonyEvent {
    std::string event_id;
    EventType type = EventType::Other;
    std::string type_name;
    std::string call_id;
    // Decoded client_state; the playback unit id for playback events.
    std::optional<std::string> unit_id;
    session::TimePoint occurred_at;
    nlohmann::json payload = nlohmann::json::object();
};

// Parses {"data": {"id", "event_type", "occurred_at", "payload": {...}}}.
// Returns nothing when the envelope is unusable.
std::optional<TelephonyEvent> parse_event(const nlohmann::json& body, session::TimePoint received_at);

// "2024-05-01T12:00:00.123Z" style timestamps.
std::optional<session::TimePoint> parse_iso8601(const std::string& text);

}
