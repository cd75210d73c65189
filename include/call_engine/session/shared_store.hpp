#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace httplib {
class Client;
}

namespace call_engine::session {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

namespace flags {
inline constexpr const char* kSessionReady = "sessionReady";
inline constexpr const char* kCheckinInProgress = "checkinInProgress";
inline constexpr const char* kAgentDoneSpeaking = "agentDoneSpeaking";
// Set on hangup after the call's keys are dropped; outlives expire().
inline constexpr const char* kCallEnded = "callEnded";
}

namespace counters {
inline constexpr const char* kActivePlaybackCount = "activePlaybackCount";
}

// Cross-worker view of a call. Only plain JSON is stored; live objects are
// rebuilt from it by whichever worker receives the next event.
class SharedSessionStore {
public:
    virtual ~SharedSessionStore() = default;

    virtual std::optional<nlohmann::json> get(const std::string& call_id) = 0;
    // Shallow-merges partial into the stored descriptor.
    virtual void set(const std::string& call_id,
                     const nlohmann::json& partial,
                     std::chrono::seconds ttl) = 0;

    virtual int64_t atomic_increment(const std::string& call_id, const std::string& counter) = 0;
    // Never goes below zero.
    virtual int64_t atomic_decrement(const std::string& call_id, const std::string& counter) = 0;
    virtual int64_t counter(const std::string& call_id, const std::string& counter) = 0;
    virtual void reset_counter(const std::string& call_id, const std::string& counter) = 0;

    virtual void set_flag(const std::string& call_id,
                          const std::string& name,
                          std::chrono::seconds ttl) = 0;
    virtual bool get_flag(const std::string& call_id, const std::string& name) = 0;
    virtual void clear_flag(const std::string& call_id, const std::string& name) = 0;
    // True only for the caller that created the flag.
    virtual bool set_flag_if_absent(const std::string& call_id,
                                    const std::string& name,
                                    std::chrono::seconds ttl) = 0;
    virtual bool wait_for_flag(const std::string& call_id,
                               const std::string& name,
                               std::chrono::milliseconds timeout) = 0;

    // Drops every key of the call.
    virtual void expire(const std::string& call_id) = 0;
};

class MemorySessionStore : public SharedSessionStore {
public:
    std::optional<nlohmann::json> get(const std::string& call_id) override;
    void set(const std::string& call_id,
             const nlohmann::json& partial,
             std::chrono::seconds ttl) override;
    int64_t atomic_increment(const std::string& call_id, const std::string& counter) override;
    int64_t atomic_decrement(const std::string& call_id, const std::string& counter) override;
    int64_t counter(const std::string& call_id, const std::string& counter) override;
    void reset_counter(const std::string& call_id, const std::string& counter) override;
    void set_flag(const std::string& call_id,
                  const std::string& name,
                  std::chrono::seconds ttl) override;
    bool get_flag(const std::string& call_id, const std::string& name) override;
    void clear_flag(const std::string& call_id, const std::string& name) override;
    bool set_flag_if_absent(const std::string& call_id,
                            const std::string& name,
                            std::chrono::seconds ttl) override;
    bool wait_for_flag(const std::string& call_id,
                       const std::string& name,
                       std::chrono::milliseconds timeout) override;
    void expire(const std::string& call_id) override;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        nlohmann::json descriptor = nlohmann::json::object();
        std::optional<Clock::time_point> descriptor_expires;
        std::map<std::string, int64_t> counters;
        std::map<std::string, Clock::time_point> flags;
    };

    bool flag_alive(const Entry& entry, const std::string& name) const;

    std::mutex mutex_;
    std::condition_variable flag_cv_;
    std::map<std::string, Entry> entries_;
};

struct WebdisStoreOptions {
    std::string url;
    std::chrono::milliseconds timeout{2000};
    std::string key_prefix = "call_engine";
    std::chrono::milliseconds poll_interval{100};
    std::chrono::seconds counter_ttl{3600};
};

// Redis through a Webdis HTTP gateway: GET /<COMMAND>/<arg>/<arg>, replies
// come back as {"<COMMAND>": value}.
class WebdisSessionStore : public SharedSessionStore {
public:
    explicit WebdisSessionStore(WebdisStoreOptions options);
    ~WebdisSessionStore() override;

    std::optional<nlohmann::json> get(const std::string& call_id) override;
    void set(const std::string& call_id,
             const nlohmann::json& partial,
             std::chrono::seconds ttl) override;
    int64_t atomic_increment(const std::string& call_id, const std::string& counter) override;
    int64_t atomic_decrement(const std::string& call_id, const std::string& counter) override;
    int64_t counter(const std::string& call_id, const std::string& counter) override;
    void reset_counter(const std::string& call_id, const std::string& counter) override;
    void set_flag(const std::string& call_id,
                  const std::string& name,
                  std::chrono::seconds ttl) override;
    bool get_flag(const std::string& call_id, const std::string& name) override;
    void clear_flag(const std::string& call_id, const std::string& name) override;
    bool set_flag_if_absent(const std::string& call_id,
                            const std::string& name,
                            std::chrono::seconds ttl) override;
    bool wait_for_flag(const std::string& call_id,
                       const std::string& name,
                       std::chrono::milliseconds timeout) override;
    void expire(const std::string& call_id) override;

    std::string session_key(const std::string& call_id) const;
    std::string counter_key(const std::string& call_id, const std::string& counter) const;
    std::string flag_key(const std::string& call_id, const std::string& name) const;

private:
    nlohmann::json command(const std::string& name, const std::vector<std::string>& args);
    // Redis reply value of a Webdis response; throws StoreError on errors.
    static nlohmann::json unwrap(const std::string& name, const nlohmann::json& body);
    static int64_t as_integer(const nlohmann::json& value);

    WebdisStoreOptions options_;
    std::string base_path_;
    std::mutex client_mutex_;
    std::unique_ptr<httplib::Client> client_;
};

}
