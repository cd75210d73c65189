#include "call_engine/config.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace call_engine {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<std::string> get_env_list(const char* name, const std::vector<std::string>& fallback) {
    const auto raw = get_env_optional(name);
    if (!raw) {
        return fallback;
    }
    return split_csv(*raw);
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        // Real environment wins over .env.
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

const std::vector<std::string> kDefaultAcknowledgements = {
    "yeah", "yes", "okay", "ok", "yep", "sure", "uh-huh", "mhm", "go ahead",
    "right", "alright", "mm-hmm", "uh huh"};

const std::vector<std::string> kDefaultHoldOnPhrases = {
    "hold on", "wait", "one moment", "give me a second", "hang on",
    "just a sec", "one sec", "hold please"};

const std::vector<std::string> kDefaultAffirmatives = {
    "yes", "yeah", "yep", "yup", "sure", "absolutely", "definitely", "of course",
    "correct", "that's right", "sounds good", "ok", "okay", "alright", "go ahead",
    "i am", "i do", "please do"};

const std::vector<std::string> kDefaultNegatives = {
    "no", "nope", "nah", "not really", "not interested", "no thanks", "no thank you",
    "i'm not interested", "i don't", "never"};

const std::vector<std::string> kDefaultRamblingPhrases = {
    "I hear you. Let me address that specifically.",
    "Understood. Just to keep us on track.",
    "I appreciate you sharing that. Let me ask you this."};

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "call_engine");

    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");

    config.backend_url = get_env_str("BACKEND_URL", "");
    config.backend_request_timeout = get_env_double("BACKEND_REQUEST_TIMEOUT", 10.0);
    config.backend_connect_timeout = get_env_double("BACKEND_CONNECT_TIMEOUT", 5.0);
    config.backend_sock_read_timeout = get_env_double("BACKEND_SOCK_READ_TIMEOUT", 10.0);
    config.default_agent_id = get_env_optional("DEFAULT_AGENT_ID");

    config.telephony_api_url = get_env_str("TELEPHONY_API_URL", "https://api.telnyx.com/v2");
    config.telephony_api_key = get_env_optional("TELEPHONY_API_KEY");
    config.provider_max_retries = get_env_int("PROVIDER_MAX_RETRIES", 2);
    config.provider_timeout_ms = get_env_int("PROVIDER_TIMEOUT_MS", 3000);

    config.llm_url = get_env_str("LLM_URL", "https://api.openai.com/v1");
    config.llm_api_key = get_env_optional("LLM_API_KEY");
    config.llm_model = get_env_str("LLM_MODEL", "gpt-4o-mini");
    config.transition_timeout_ms = get_env_int("TRANSITION_TIMEOUT_MS", 1500);
    config.extraction_timeout_ms = get_env_int("EXTRACTION_TIMEOUT_MS", 2000);
    config.generation_timeout_ms = get_env_int("GENERATION_TIMEOUT_MS", 6000);

    config.tts_ws_url = get_env_str("TTS_WS_URL", "");
    config.tts_voice = get_env_str("TTS_VOICE", "");
    config.tts_max_inflight = get_env_int("TTS_MAX_INFLIGHT", 3);
    config.tts_timeout_ms = get_env_int("TTS_TIMEOUT_MS", 4000);
    config.max_fragment_chars = get_env_int("MAX_FRAGMENT_CHARS", 160);
    config.words_per_second = get_env_double("WORDS_PER_SECOND", 2.7);

    config.store_url = get_env_str("STORE_URL", "");
    config.store_ttl_sec = get_env_int("STORE_TTL_SEC", 3600);
    config.flag_ttl_sec = get_env_int("FLAG_TTL_SEC", 30);
    config.session_ready_wait_ms = get_env_int("SESSION_READY_WAIT_MS", 3000);

    config.silence_timeout_sec = get_env_double("SILENCE_TIMEOUT_SEC", 7.0);
    config.hold_on_silence_timeout_sec = get_env_double("HOLD_ON_SILENCE_TIMEOUT_SEC", 25.0);
    config.max_checkins = get_env_int("MAX_CHECKINS", 2);
    config.checkin_message = get_env_str("CHECKIN_MESSAGE", "Are you still there?");
    config.checkin_min_gap_sec = get_env_double("CHECKIN_MIN_GAP_SEC", 3.0);
    config.max_call_duration_sec = get_env_double("MAX_CALL_DURATION_SEC", 1500.0);
    config.silence_tick_ms = get_env_int("SILENCE_TICK_MS", 500);
    config.playback_stale_grace_ms = get_env_int("PLAYBACK_STALE_GRACE_MS", 5000);

    config.interrupt_min_words = get_env_int("INTERRUPT_MIN_WORDS", 2);
    config.interrupt_grace_ms = get_env_int("INTERRUPT_GRACE_MS", 1500);
    config.playback_start_buffer_ms = get_env_int("PLAYBACK_START_BUFFER_MS", 400);
    config.echo_overlap_threshold = get_env_double("ECHO_OVERLAP_THRESHOLD", 0.3);
    config.echo_tail_ms = get_env_int("ECHO_TAIL_MS", 1500);
    config.acknowledgement_words = get_env_list("ACKNOWLEDGEMENT_WORDS", kDefaultAcknowledgements);
    config.hold_on_phrases = get_env_list("HOLD_ON_PHRASES", kDefaultHoldOnPhrases);
    config.rambling_guard_enabled = get_env_bool("RAMBLING_GUARD_ENABLED", false);
    config.rambling_word_threshold = get_env_int("RAMBLING_WORD_THRESHOLD", 60);
    config.rambling_phrases = get_env_list("RAMBLING_PHRASES", kDefaultRamblingPhrases);

    config.affirmative_prefixes = get_env_list("AFFIRMATIVE_PREFIXES", kDefaultAffirmatives);
    config.negative_prefixes = get_env_list("NEGATIVE_PREFIXES", kDefaultNegatives);

    config.history_window = get_env_int("HISTORY_WINDOW", 20);
    config.max_node_hops = get_env_int("MAX_NODE_HOPS", 8);
    config.closing_line = get_env_str("CLOSING_LINE", "Thanks for your time. Goodbye.");
    config.fallback_reply =
        get_env_str("FALLBACK_REPLY", "Sorry, could you say that one more time?");

    return config;
}

void Config::validate() const {
    if (backend_url.empty()) {
        throw std::runtime_error("BACKEND_URL is required");
    }
    if (telephony_api_url.empty()) {
        throw std::runtime_error("TELEPHONY_API_URL is required");
    }
    if (tts_ws_url.empty()) {
        throw std::runtime_error("TTS_WS_URL is required");
    }
    if (rest_api_port <= 0) {
        throw std::runtime_error("REST_API_PORT must be positive");
    }
    if (transition_timeout_ms <= 0 || extraction_timeout_ms <= 0 ||
        generation_timeout_ms <= 0 || tts_timeout_ms <= 0) {
        throw std::runtime_error("timeouts must be positive");
    }
    if (tts_max_inflight <= 0) {
        throw std::runtime_error("TTS_MAX_INFLIGHT must be positive");
    }
    if (max_fragment_chars < 20) {
        throw std::runtime_error("MAX_FRAGMENT_CHARS must be at least 20");
    }
    if (max_checkins < 0) {
        throw std::runtime_error("MAX_CHECKINS must be zero or positive");
    }
    if (silence_timeout_sec <= 0.0 || hold_on_silence_timeout_sec <= 0.0) {
        throw std::runtime_error("silence timeouts must be positive");
    }
    if (silence_tick_ms <= 0) {
        throw std::runtime_error("SILENCE_TICK_MS must be positive");
    }
    if (echo_overlap_threshold <= 0.0 || echo_overlap_threshold > 1.0) {
        throw std::runtime_error("ECHO_OVERLAP_THRESHOLD must be in (0, 1]");
    }
    if (history_window <= 0) {
        throw std::runtime_error("HISTORY_WINDOW must be positive");
    }
    if (provider_max_retries < 0) {
        throw std::runtime_error("PROVIDER_MAX_RETRIES must be zero or positive");
    }
}

}
