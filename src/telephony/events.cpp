#include "call_engine/telephony/events.hpp"

#include <cstdio>
#include <ctime>

#include "call_engine/utils/base64.hpp"

namespace call_engine::telephony {

namespace {

EventType event_type(const std::string& name) {
    if (name == "call.answered") {
        return EventType::CallAnswered;
    }
    if (name == "call.playback.started") {
        return EventType::PlaybackStarted;
    }
    if (name == "call.playback.ended") {
        return EventType::PlaybackEnded;
    }
    if (name == "call.hangup") {
        return EventType::CallHangup;
    }
    return EventType::Other;
}

}

std::optional<session::TimePoint> parse_iso8601(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    double seconds = 0.0;
    if (std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%lf", &year, &month, &day, &hour, &minute,
                    &seconds) != 6) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    const std::time_t base = timegm(&tm);
    if (base == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    const auto whole = session::Clock::from_time_t(base);
    return whole + std::chrono::duration_cast<session::Clock::duration>(
                       std::chrono::duration<double>(seconds));
}

std::optional<TelephonyEvent> parse_event(const nlohmann::json& body, session::TimePoint received_at) {
    if (!body.is_object() || !body.contains("data") || !body.at("data").is_object()) {
        return std::nullopt;
    }
    const auto& data = body.at("data");
    TelephonyEvent event;
    try {
        event.event_id = data.value("id", std::string());
        event.type_name = data.value("event_type", std::string());
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    event.type = event_type(event.type_name);
    if (data.contains("payload") && data.at("payload").is_object()) {
        event.payload = data.at("payload");
    }
    if (event.payload.contains("call_control_id") && event.payload.at("call_control_id").is_string()) {
        event.call_id = event.payload.at("call_control_id").get<std::string>();
    }
    if (event.call_id.empty()) {
        return std::nullopt;
    }
    if (event.payload.contains("client_state") && event.payload.at("client_state").is_string()) {
        auto decoded = utils::base64_decode(event.payload.at("client_state").get<std::string>());
        if (!decoded.empty()) {
            event.unit_id = std::move(decoded);
        }
    }
    event.occurred_at = received_at;
    if (data.contains("occurred_at") && data.at("occurred_at").is_string()) {
        if (auto parsed = parse_iso8601(data.at("occurred_at").get<std::string>())) {
            event.occurred_at = *parsed;
        }
    }
    if (event.event_id.empty()) {
        // Fall back to a content key so retries still collapse.
        event.event_id = event.type_name + ":" + event.call_id + ":" + event.unit_id.value_or("");
    }
    return event;
}

}
