#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_engine/audio/segmenter.hpp"
#include "call_engine/session/call_session.hpp"
#include "call_engine/session/shared_store.hpp"
#include "call_engine/telephony/provider.hpp"
#include "call_engine/tts/synth_client.hpp"

namespace call_engine::audio {

struct PlaybackUnit {
    std::string call_id;
    std::string unit_id;
    int64_t sequence = 0;
    bool is_first = false;
    bool is_last = false;
    std::string text;
    std::chrono::milliseconds estimated_duration{0};
    std::optional<session::TimePoint> started_at;
};

struct StreamOptions {
    size_t max_fragment_chars = 160;
    int max_inflight = 3;
    std::chrono::milliseconds synthesis_timeout{4000};
    double words_per_second = 2.7;
    std::chrono::seconds flag_ttl{30};
};

std::string playback_ended_flag(const std::string& unit_id);

// Dedups a playback-ended event through the store and releases its share of
// the counter. Returns the counter after the decrement, or nothing for a
// duplicate. Sets agentDoneSpeaking when the counter reaches zero.
std::optional<int64_t> record_playback_ended(session::SharedSessionStore& store,
                                             const std::string& call_id,
                                             const std::string& unit_id,
                                             std::chrono::seconds flag_ttl);

// Turns agent text into ordered playback. Fragments are synthesized ahead
// with bounded parallelism and handed to the provider strictly in order.
// Create through std::make_shared; workers hold a reference while running.
class AudioStreamCoordinator : public std::enable_shared_from_this<AudioStreamCoordinator> {
public:
    AudioStreamCoordinator(std::shared_ptr<session::CallSession> session,
                           std::shared_ptr<session::SharedSessionStore> store,
                           std::shared_ptr<tts::SpeechSynthesizer> synthesizer,
                           std::shared_ptr<telephony::TelephonyProvider> provider,
                           StreamOptions options);

    void open();
    void close();

    uint64_t begin_turn();
    void append_text(const std::string& delta);
    // Flushes the turn and waits until every fragment is handed off or dropped.
    std::vector<PlaybackUnit> finish_turn();
    std::vector<PlaybackUnit> stream_content(const std::string& text);

    // Drops queued fragments, clears in-flight playback and stops the provider.
    void cancel();

    bool on_playback_started(const std::string& unit_id, session::TimePoint at);
    bool on_playback_ended(const std::string& unit_id, session::TimePoint at);

    uint64_t epoch() const;

private:
    struct Fragment {
        uint64_t epoch = 0;
        int64_t sequence = 0;
        // Call-wide, never reused; names the unit and its synthesis request.
        uint64_t unit_number = 0;
        std::string text;
        std::shared_future<std::optional<std::string>> audio;
        std::shared_ptr<std::atomic<bool>> canceled;
    };

    struct PendingSynthesis {
        std::shared_ptr<std::packaged_task<std::optional<std::string>()>> task;
        std::shared_ptr<std::atomic<bool>> canceled;
    };

    void enqueue_locked(const std::string& text);
    void maybe_start_synthesis();
    void on_synthesis_finished();
    void pump();
    void dispatch(const Fragment& fragment, std::string audio_base64);
    std::chrono::milliseconds estimate_duration(const std::string& text) const;
    std::string make_unit_id(uint64_t epoch, uint64_t unit_number) const;

    std::shared_ptr<session::CallSession> session_;
    std::shared_ptr<session::SharedSessionStore> store_;
    std::shared_ptr<tts::SpeechSynthesizer> synthesizer_;
    std::shared_ptr<telephony::TelephonyProvider> provider_;
    StreamOptions options_;
    std::string unit_prefix_;

    mutable std::mutex mutex_;
    std::condition_variable turn_cv_;
    std::mutex dispatch_mutex_;
    TextSegmenter segmenter_;
    uint64_t epoch_ = 0;
    int64_t next_sequence_ = 0;
    uint64_t next_unit_number_ = 0;
    size_t outstanding_ = 0;
    std::string turn_text_;
    std::vector<PlaybackUnit> turn_units_;
    std::optional<std::chrono::steady_clock::time_point> turn_started_;
    std::deque<Fragment> queue_;
    std::deque<PendingSynthesis> pending_;
    size_t inflight_ = 0;
};

}
