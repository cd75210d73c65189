#include "call_engine/session/shared_store.hpp"

#include <httplib.h>

#include <thread>

#include "call_engine/logging.hpp"
#include "call_engine/utils/http.hpp"

namespace call_engine::session {

namespace {

// Every counter write refreshes the hash TTL so an abandoned call's counters expire.
constexpr const char* kIncrementScript =
    "local v = redis.call('HINCRBY', KEYS[1], ARGV[1], 1) "
    "redis.call('EXPIRE', KEYS[1], ARGV[2]) "
    "return v";

constexpr const char* kDecrementFloorScript =
    "local v = redis.call('HINCRBY', KEYS[1], ARGV[1], -1) "
    "if v < 0 then redis.call('HSET', KEYS[1], ARGV[1], 0) v = 0 end "
    "redis.call('EXPIRE', KEYS[1], ARGV[2]) "
    "return v";

constexpr const char* kResetScript =
    "redis.call('HSET', KEYS[1], ARGV[1], 0) "
    "redis.call('EXPIRE', KEYS[1], ARGV[2]) "
    "return 0";

const char* const kKnownFlags[] = {flags::kSessionReady, flags::kCheckinInProgress,
                                   flags::kAgentDoneSpeaking};

}

WebdisSessionStore::WebdisSessionStore(WebdisStoreOptions options)
    : options_(std::move(options)) {
    const auto parts = utils::parse_url(options_.url);
    base_path_ = parts.base_path;
    if (parts.scheme == "https") {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
        throw StoreError("HTTPS store requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    }
    client_ = std::make_unique<httplib::Client>(
        parts.scheme + "://" + parts.host + ":" + std::to_string(parts.port));
    client_->set_connection_timeout(options_.timeout);
    client_->set_read_timeout(options_.timeout);
    client_->set_write_timeout(options_.timeout);
    client_->set_keep_alive(true);
}

WebdisSessionStore::~WebdisSessionStore() = default;

std::string WebdisSessionStore::session_key(const std::string& call_id) const {
    return options_.key_prefix + ":session:" + call_id;
}

std::string WebdisSessionStore::counter_key(const std::string& call_id,
                                            const std::string&) const {
    return options_.key_prefix + ":counters:" + call_id;
}

std::string WebdisSessionStore::flag_key(const std::string& call_id,
                                         const std::string& name) const {
    return options_.key_prefix + ":flag:" + call_id + ":" + name;
}

nlohmann::json WebdisSessionStore::command(const std::string& name,
                                           const std::vector<std::string>& args) {
    std::string path = "/" + name;
    for (const auto& arg : args) {
        path += "/" + utils::url_encode(arg);
    }
    path = utils::join_path(base_path_, path);

    httplib::Result response;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        response = client_->Get(path);
    }
    if (!response) {
        throw StoreError(name + " failed: " + httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        throw StoreError(name + " HTTP " + std::to_string(response->status) + ": " +
                         response->body);
    }
    const auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        throw StoreError(name + " returned invalid JSON");
    }
    return unwrap(name, body);
}

nlohmann::json WebdisSessionStore::unwrap(const std::string& name, const nlohmann::json& body) {
    if (!body.is_object() || !body.contains(name)) {
        throw StoreError("Unexpected store reply for " + name + ": " + body.dump());
    }
    const auto& value = body.at(name);
    // Status and error replies arrive as [ok, "message"].
    if (value.is_array() && value.size() == 2 && value.at(0).is_boolean()) {
        if (!value.at(0).get<bool>()) {
            throw StoreError(name + " error: " + value.at(1).dump());
        }
        return value.at(1);
    }
    return value;
}

int64_t WebdisSessionStore::as_integer(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::exception&) {
            throw StoreError("Non-integer store value: " + value.dump());
        }
    }
    if (value.is_null()) {
        return 0;
    }
    throw StoreError("Non-integer store value: " + value.dump());
}

std::optional<nlohmann::json> WebdisSessionStore::get(const std::string& call_id) {
    const auto fields = command("HGETALL", {session_key(call_id)});
    nlohmann::json descriptor = nlohmann::json::object();
    auto assign = [&descriptor](const std::string& field, const nlohmann::json& raw) {
        const auto text = raw.is_string() ? raw.get<std::string>() : raw.dump();
        const auto parsed = nlohmann::json::parse(text, nullptr, false);
        descriptor[field] = parsed.is_discarded() ? nlohmann::json(text) : parsed;
    };
    if (fields.is_object()) {
        for (const auto& item : fields.items()) {
            assign(item.key(), item.value());
        }
    } else if (fields.is_array()) {
        for (size_t i = 0; i + 1 < fields.size(); i += 2) {
            assign(fields.at(i).get<std::string>(), fields.at(i + 1));
        }
    }
    if (descriptor.empty()) {
        return std::nullopt;
    }
    return descriptor;
}

void WebdisSessionStore::set(const std::string& call_id,
                             const nlohmann::json& partial,
                             std::chrono::seconds ttl) {
    if (!partial.is_object() || partial.empty()) {
        return;
    }
    const auto key = session_key(call_id);
    std::vector<std::string> args{key};
    for (const auto& item : partial.items()) {
        args.push_back(item.key());
        args.push_back(item.value().dump());
    }
    command("HSET", args);
    if (ttl.count() > 0) {
        command("EXPIRE", {key, std::to_string(ttl.count())});
    }
}

int64_t WebdisSessionStore::atomic_increment(const std::string& call_id,
                                             const std::string& counter) {
    return as_integer(command("EVAL", {kIncrementScript, "1", counter_key(call_id, counter),
                                       counter, std::to_string(options_.counter_ttl.count())}));
}

int64_t WebdisSessionStore::atomic_decrement(const std::string& call_id,
                                             const std::string& counter) {
    return as_integer(command("EVAL", {kDecrementFloorScript, "1", counter_key(call_id, counter),
                                       counter, std::to_string(options_.counter_ttl.count())}));
}

int64_t WebdisSessionStore::counter(const std::string& call_id, const std::string& counter) {
    return as_integer(command("HGET", {counter_key(call_id, counter), counter}));
}

void WebdisSessionStore::reset_counter(const std::string& call_id, const std::string& counter) {
    command("EVAL", {kResetScript, "1", counter_key(call_id, counter), counter,
                     std::to_string(options_.counter_ttl.count())});
}

void WebdisSessionStore::set_flag(const std::string& call_id,
                                  const std::string& name,
                                  std::chrono::seconds ttl) {
    command("SET", {flag_key(call_id, name), "1", "EX", std::to_string(ttl.count())});
}

bool WebdisSessionStore::get_flag(const std::string& call_id, const std::string& name) {
    return as_integer(command("EXISTS", {flag_key(call_id, name)})) > 0;
}

void WebdisSessionStore::clear_flag(const std::string& call_id, const std::string& name) {
    command("DEL", {flag_key(call_id, name)});
}

bool WebdisSessionStore::set_flag_if_absent(const std::string& call_id,
                                            const std::string& name,
                                            std::chrono::seconds ttl) {
    const auto reply = command("SET", {flag_key(call_id, name), "1", "NX", "EX",
                                       std::to_string(ttl.count())});
    return !reply.is_null();
}

bool WebdisSessionStore::wait_for_flag(const std::string& call_id,
                                       const std::string& name,
                                       std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (get_flag(call_id, name)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

void WebdisSessionStore::expire(const std::string& call_id) {
    std::vector<std::string> keys{session_key(call_id),
                                  counter_key(call_id, counters::kActivePlaybackCount)};
    for (const auto* flag : kKnownFlags) {
        keys.push_back(flag_key(call_id, flag));
    }
    command("DEL", keys);
    debug("Store entries expired", {kv("call_id", call_id)});
}

}
