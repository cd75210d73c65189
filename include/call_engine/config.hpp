#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace call_engine {

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "call_engine";

    int rest_api_port = 8000;
    std::optional<std::string> authorization_token;

    std::string backend_url;
    double backend_request_timeout = 10.0;
    double backend_connect_timeout = 5.0;
    double backend_sock_read_timeout = 10.0;
    std::optional<std::string> default_agent_id;

    std::string telephony_api_url;
    std::optional<std::string> telephony_api_key;
    int provider_max_retries = 2;
    int provider_timeout_ms = 3000;

    std::string llm_url;
    std::optional<std::string> llm_api_key;
    std::string llm_model = "gpt-4o-mini";
    int transition_timeout_ms = 1500;
    int extraction_timeout_ms = 2000;
    int generation_timeout_ms = 6000;

    std::string tts_ws_url;
    std::string tts_voice;
    int tts_max_inflight = 3;
    int tts_timeout_ms = 4000;
    int max_fragment_chars = 160;
    double words_per_second = 2.7;

    std::string store_url;
    int store_ttl_sec = 3600;
    int flag_ttl_sec = 30;
    int session_ready_wait_ms = 3000;

    double silence_timeout_sec = 7.0;
    double hold_on_silence_timeout_sec = 25.0;
    int max_checkins = 2;
    std::string checkin_message = "Are you still there?";
    double checkin_min_gap_sec = 3.0;
    double max_call_duration_sec = 1500.0;
    int silence_tick_ms = 500;
    int playback_stale_grace_ms = 5000;

    int interrupt_min_words = 2;
    int interrupt_grace_ms = 1500;
    int playback_start_buffer_ms = 400;
    double echo_overlap_threshold = 0.3;
    int echo_tail_ms = 1500;
    std::vector<std::string> acknowledgement_words;
    std::vector<std::string> hold_on_phrases;
    bool rambling_guard_enabled = false;
    int rambling_word_threshold = 60;
    std::vector<std::string> rambling_phrases;

    std::vector<std::string> affirmative_prefixes;
    std::vector<std::string> negative_prefixes;

    int history_window = 20;
    int max_node_hops = 8;
    std::string closing_line = "Thanks for your time. Goodbye.";
    std::string fallback_reply = "Sorry, could you say that one more time?";

    static Config load();
    void validate() const;
};

}
