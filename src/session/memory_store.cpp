#include "call_engine/session/shared_store.hpp"

namespace call_engine::session {

bool MemorySessionStore::flag_alive(const Entry& entry, const std::string& name) const {
    const auto it = entry.flags.find(name);
    return it != entry.flags.end() && it->second > Clock::now();
}

std::optional<nlohmann::json> MemorySessionStore::get(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(call_id);
    if (it == entries_.end() || it->second.descriptor.empty()) {
        return std::nullopt;
    }
    if (it->second.descriptor_expires && *it->second.descriptor_expires <= Clock::now()) {
        it->second.descriptor = nlohmann::json::object();
        return std::nullopt;
    }
    return it->second.descriptor;
}

void MemorySessionStore::set(const std::string& call_id,
                             const nlohmann::json& partial,
                             std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[call_id];
    if (partial.is_object()) {
        for (const auto& item : partial.items()) {
            entry.descriptor[item.key()] = item.value();
        }
    }
    if (ttl.count() > 0) {
        entry.descriptor_expires = Clock::now() + ttl;
    }
}

int64_t MemorySessionStore::atomic_increment(const std::string& call_id,
                                             const std::string& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++entries_[call_id].counters[counter];
}

int64_t MemorySessionStore::atomic_decrement(const std::string& call_id,
                                             const std::string& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& value = entries_[call_id].counters[counter];
    if (value > 0) {
        --value;
    }
    return value;
}

int64_t MemorySessionStore::counter(const std::string& call_id, const std::string& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto entry = entries_.find(call_id);
    if (entry == entries_.end()) {
        return 0;
    }
    const auto it = entry->second.counters.find(counter);
    return it == entry->second.counters.end() ? 0 : it->second;
}

void MemorySessionStore::reset_counter(const std::string& call_id, const std::string& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[call_id].counters[counter] = 0;
}

void MemorySessionStore::set_flag(const std::string& call_id,
                                  const std::string& name,
                                  std::chrono::seconds ttl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[call_id].flags[name] = Clock::now() + ttl;
    }
    flag_cv_.notify_all();
}

bool MemorySessionStore::get_flag(const std::string& call_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(call_id);
    return it != entries_.end() && flag_alive(it->second, name);
}

void MemorySessionStore::clear_flag(const std::string& call_id, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(call_id);
    if (it != entries_.end()) {
        it->second.flags.erase(name);
    }
}

bool MemorySessionStore::set_flag_if_absent(const std::string& call_id,
                                            const std::string& name,
                                            std::chrono::seconds ttl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[call_id];
        if (flag_alive(entry, name)) {
            return false;
        }
        entry.flags[name] = Clock::now() + ttl;
    }
    flag_cv_.notify_all();
    return true;
}

bool MemorySessionStore::wait_for_flag(const std::string& call_id,
                                       const std::string& name,
                                       std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return flag_cv_.wait_for(lock, timeout, [&]() {
        const auto it = entries_.find(call_id);
        return it != entries_.end() && flag_alive(it->second, name);
    });
}

void MemorySessionStore::expire(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(call_id);
}

}
