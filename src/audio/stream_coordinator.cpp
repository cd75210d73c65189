#include "call_engine/audio/stream_coordinator.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

#include "call_engine/logging.hpp"
#include "call_engine/metrics.hpp"
#include "call_engine/utils/async.hpp"
#include "call_engine/utils/text.hpp"

namespace call_engine::audio {

namespace {

std::string random_prefix() {
    std::random_device device;
    std::ostringstream out;
    out << std::hex << std::setw(8) << std::setfill('0') << device();
    return out.str();
}

}

std::string playback_ended_flag(const std::string& unit_id) {
    return "playbackEnded:" + unit_id;
}

std::optional<int64_t> record_playback_ended(session::SharedSessionStore& store,
                                             const std::string& call_id,
                                             const std::string& unit_id,
                                             std::chrono::seconds flag_ttl) {
    if (!store.set_flag_if_absent(call_id, playback_ended_flag(unit_id), flag_ttl)) {
        return std::nullopt;
    }
    const auto remaining =
        store.atomic_decrement(call_id, session::counters::kActivePlaybackCount);
    if (remaining == 0) {
        store.set_flag(call_id, session::flags::kAgentDoneSpeaking, flag_ttl);
    }
    return remaining;
}

AudioStreamCoordinator::AudioStreamCoordinator(
    std::shared_ptr<session::CallSession> session,
    std::shared_ptr<session::SharedSessionStore> store,
    std::shared_ptr<tts::SpeechSynthesizer> synthesizer,
    std::shared_ptr<telephony::TelephonyProvider> provider,
    StreamOptions options)
    : session_(std::move(session)),
      store_(std::move(store)),
      synthesizer_(std::move(synthesizer)),
      provider_(std::move(provider)),
      options_(options),
      unit_prefix_(random_prefix()),
      segmenter_(options.max_fragment_chars) {}

void AudioStreamCoordinator::open() {
    synthesizer_->connect();
}

void AudioStreamCoordinator::close() {
    cancel();
    synthesizer_->close();
}

uint64_t AudioStreamCoordinator::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

uint64_t AudioStreamCoordinator::begin_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    segmenter_.reset();
    turn_text_.clear();
    turn_units_.clear();
    next_sequence_ = 0;
    turn_started_ = std::chrono::steady_clock::now();
    return epoch_;
}

void AudioStreamCoordinator::append_text(const std::string& delta) {
    if (delta.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        turn_text_ += delta;
        session_->set_last_agent_text(turn_text_);
        for (const auto& fragment : segmenter_.push(delta)) {
            enqueue_locked(fragment);
        }
    }
    maybe_start_synthesis();
    pump();
}

std::vector<PlaybackUnit> AudioStreamCoordinator::finish_turn() {
    uint64_t turn_epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        turn_epoch = epoch_;
        for (const auto& fragment : segmenter_.flush()) {
            enqueue_locked(fragment);
        }
    }
    maybe_start_synthesis();
    pump();

    std::unique_lock<std::mutex> lock(mutex_);
    turn_cv_.wait(lock, [&]() { return epoch_ != turn_epoch || outstanding_ == 0; });
    if (epoch_ != turn_epoch) {
        return {};
    }
    if (!turn_units_.empty()) {
        turn_units_.back().is_last = true;
    }
    return turn_units_;
}

std::vector<PlaybackUnit> AudioStreamCoordinator::stream_content(const std::string& text) {
    begin_turn();
    append_text(text);
    return finish_turn();
}

void AudioStreamCoordinator::cancel() {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        for (auto& fragment : queue_) {
            fragment.canceled->store(true);
        }
        for (auto& task : pending_) {
            task.canceled->store(true);
        }
        queue_.clear();
        pending_.clear();
        outstanding_ = 0;
        segmenter_.reset();
        turn_text_.clear();
        turn_units_.clear();
        turn_started_.reset();
        removed = session_->clear_playback(session::Clock::now());
        // Late ended events for these units must not touch the counter again.
        try {
            for (const auto& unit_id : removed) {
                store_->set_flag(session_->call_id(), playback_ended_flag(unit_id),
                                 options_.flag_ttl);
            }
            store_->reset_counter(session_->call_id(), session::counters::kActivePlaybackCount);
        } catch (const session::StoreError& ex) {
            warn("Playback counter reset failed", {kv("call_id", session_->call_id()),
                                                   kv("error", ex.what())});
        }
    }
    turn_cv_.notify_all();

    Metrics::instance().increment("playback_cancel", removed.empty() ? "idle" : "playing");
    info("Playback cancelled", {kv("call_id", session_->call_id()),
                                kv("units", removed.size())});
    if (removed.empty()) {
        return;
    }
    try {
        provider_->stop_playback(session_->call_id());
    } catch (const telephony::TelephonyError& ex) {
        warn("Playback stop failed", {kv("call_id", session_->call_id()),
                                      kv("error", ex.what())});
    }
}

bool AudioStreamCoordinator::on_playback_started(const std::string& unit_id,
                                                 session::TimePoint at) {
    const bool known = session_->confirm_playback_started(unit_id, at);
    if (known) {
        store_->clear_flag(session_->call_id(), session::flags::kAgentDoneSpeaking);
    }
    debug("Playback started", {kv("call_id", session_->call_id()),
                               kv("unit_id", unit_id),
                               kv("known", known)});
    return known;
}

bool AudioStreamCoordinator::on_playback_ended(const std::string& unit_id,
                                               session::TimePoint at) {
    const auto remaining =
        record_playback_ended(*store_, session_->call_id(), unit_id, options_.flag_ttl);
    // A duplicate may still be news to this worker when another one handled it.
    const bool ended_here = session_->end_playback(unit_id, at);
    if (!remaining) {
        Metrics::instance().increment("playback_ended", "duplicate");
        debug("Duplicate playback end", {kv("call_id", session_->call_id()),
                                         kv("unit_id", unit_id)});
        return false;
    }
    Metrics::instance().increment("playback_ended", ended_here ? "local" : "remote");
    debug("Playback ended", {kv("call_id", session_->call_id()),
                             kv("unit_id", unit_id),
                             kv("remaining", *remaining)});
    return true;
}

void AudioStreamCoordinator::enqueue_locked(const std::string& text) {
    if (utils::normalize_text(text).empty()) {
        return;
    }
    const auto sequence = next_sequence_++;
    const auto unit_number = next_unit_number_++;
    auto canceled = std::make_shared<std::atomic<bool>>(false);
    auto synthesizer = synthesizer_;
    const auto timeout = options_.synthesis_timeout;
    auto task = std::make_shared<std::packaged_task<std::optional<std::string>()>>(
        [synthesizer, unit_number, text, timeout, canceled]() -> std::optional<std::string> {
            if (canceled->load()) {
                return std::nullopt;
            }
            return synthesizer->synthesize(static_cast<int64_t>(unit_number), text, timeout);
        });
    queue_.push_back({epoch_, sequence, unit_number, text, task->get_future().share(), canceled});
    pending_.push_back({task, canceled});
    ++outstanding_;
}

void AudioStreamCoordinator::maybe_start_synthesis() {
    std::vector<PendingSynthesis> to_start;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto max_inflight = static_cast<size_t>(std::max(1, options_.max_inflight));
        while (inflight_ < max_inflight && !pending_.empty()) {
            auto task = std::move(pending_.front());
            pending_.pop_front();
            if (task.canceled->load()) {
                continue;
            }
            ++inflight_;
            to_start.push_back(std::move(task));
        }
    }

    for (auto& task : to_start) {
        utils::run_async([self = shared_from_this(), task_ptr = task.task]() {
            (*task_ptr)();
            self->on_synthesis_finished();
        });
    }
}

void AudioStreamCoordinator::on_synthesis_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inflight_ > 0) {
            --inflight_;
        }
    }
    pump();
    maybe_start_synthesis();
}

void AudioStreamCoordinator::pump() {
    // One dispatcher at a time keeps hand-off in generation order.
    std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
    while (true) {
        Fragment fragment;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.empty()) {
                return;
            }
            auto& front = queue_.front();
            if (front.audio.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                return;
            }
            fragment = front;
            queue_.pop_front();
        }

        std::optional<std::string> audio;
        try {
            audio = fragment.audio.get();
        } catch (const std::exception& ex) {
            warn("Synthesis failed", {kv("call_id", session_->call_id()),
                                      kv("seq", fragment.sequence),
                                      kv("error", ex.what())});
        }

        if (!audio || audio->empty() || fragment.canceled->load()) {
            if (!fragment.canceled->load()) {
                Metrics::instance().increment("synthesis", "dropped");
                warn("Fragment dropped without audio", {kv("call_id", session_->call_id()),
                                                        kv("seq", fragment.sequence)});
            }
        } else {
            try {
                dispatch(fragment, std::move(*audio));
            } catch (const session::StoreError& ex) {
                error("Playback accounting failed", {kv("call_id", session_->call_id()),
                                                     kv("seq", fragment.sequence),
                                                     kv("error", ex.what())});
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fragment.epoch == epoch_ && outstanding_ > 0) {
                --outstanding_;
            }
        }
        turn_cv_.notify_all();
    }
}

void AudioStreamCoordinator::dispatch(const Fragment& fragment, std::string audio_base64) {
    const auto& call_id = session_->call_id();
    PlaybackUnit unit;
    unit.call_id = call_id;
    unit.unit_id = make_unit_id(fragment.epoch, fragment.unit_number);
    unit.sequence = fragment.sequence;
    unit.text = fragment.text;
    unit.estimated_duration = estimate_duration(fragment.text);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fragment.epoch != epoch_) {
            return;
        }
        const auto now = session::Clock::now();
        const auto snapshot = session_->snapshot();
        auto start = now;
        if (snapshot.expected_playback_end && *snapshot.expected_playback_end > start) {
            start = *snapshot.expected_playback_end;
        }
        unit.is_first = turn_units_.empty();
        session_->begin_playback(unit.unit_id, start + unit.estimated_duration);
        store_->atomic_increment(call_id, session::counters::kActivePlaybackCount);
        store_->clear_flag(call_id, session::flags::kAgentDoneSpeaking);
        if (unit.is_first && turn_started_) {
            const auto elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - *turn_started_);
            Metrics::instance().observe_latency("first_audio", elapsed.count());
        }
        turn_units_.push_back(unit);
    }

    try {
        provider_->start_playback(call_id, audio_base64, unit.unit_id);
        Metrics::instance().increment("playback_units", "started");
        debug("Playback unit handed off", {kv("call_id", call_id),
                                           kv("unit_id", unit.unit_id),
                                           kv("seq", unit.sequence),
                                           kv("chars", unit.text.size())});
    } catch (const telephony::TelephonyError& ex) {
        Metrics::instance().increment("playback_units", "failed");
        warn("Playback hand-off failed", {kv("call_id", call_id),
                                          kv("unit_id", unit.unit_id),
                                          kv("error", ex.what())});
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_->end_playback(unit.unit_id, session::Clock::now())) {
            record_playback_ended(*store_, call_id, unit.unit_id, options_.flag_ttl);
        }
        turn_units_.erase(std::remove_if(turn_units_.begin(), turn_units_.end(),
                                         [&](const PlaybackUnit& item) {
                                             return item.unit_id == unit.unit_id;
                                         }),
                          turn_units_.end());
        return;
    }

    bool cancelled_meanwhile = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_meanwhile = fragment.epoch != epoch_;
    }
    if (cancelled_meanwhile) {
        // The stop issued by cancel() may have raced ahead of this start.
        try {
            provider_->stop_playback(call_id);
        } catch (const telephony::TelephonyError& ex) {
            warn("Playback stop failed", {kv("call_id", call_id), kv("error", ex.what())});
        }
    }
}

std::chrono::milliseconds AudioStreamCoordinator::estimate_duration(const std::string& text) const {
    const auto words = static_cast<double>(std::max<size_t>(1, utils::count_words(text)));
    const double rate = options_.words_per_second > 0.0 ? options_.words_per_second : 2.7;
    const auto millis = static_cast<int64_t>(words / rate * 1000.0);
    return std::chrono::milliseconds(std::max<int64_t>(500, millis));
}

std::string AudioStreamCoordinator::make_unit_id(uint64_t epoch, uint64_t unit_number) const {
    return unit_prefix_ + "-" + std::to_string(epoch) + "-" + std::to_string(unit_number);
}

}
