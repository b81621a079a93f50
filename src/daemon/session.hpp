#pragma once

#include "capture_acquirer.hpp"
#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"
#include "preferences.hpp"
#include "recording_encoder.hpp"
#include "storage/chunk_store.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

enum class SessionState { Idle, Negotiating, Capturing, Stopping };

const char* to_string(SessionState state);

struct StopResult {
    std::optional<EncodedAudio> audio; // empty: nothing was recorded
    uint32_t surface_id = 0;
    std::string surface_title;
};

// Owns the live stream, the chunked recorder and the chunk sequence. Only one
// session exists per daemon. Constructing a Session restores whatever a
// previous run left in the chunk store.
class Session {
public:
    using NegotiateCallback = std::function<void(std::expected<CaptureHandle, std::string>)>;
    using StartCallback = std::function<void(std::expected<void, std::string>)>;
    using StopCallback = std::function<void(std::expected<StopResult, std::string>)>;

    struct Options {
        std::chrono::milliseconds timeslice{100};
    };

    Session(CaptureHost& host, CaptureAcquirer& acquirer, ChunkStore& store,
            PreferenceStore& prefs, Scheduler& scheduler, Options opts);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Negotiates a stream token. With no surface the host's active one is used.
    void start_capture(std::optional<uint32_t> surface_id, NegotiateCallback cb);
    void start_recording(const std::string& stream_token, StartCallback cb);
    void stop(StopCallback cb);

    // Encodes the chunks held so far without ending anything. Empty when
    // there are none.
    std::expected<std::optional<EncodedAudio>, std::string> peek();

    // Chunk recorded by a client-side recorder.
    void add_chunk(Chunk chunk);

    void clear();

    // Host teardown: releases everything, produces no result, keeps the
    // persisted snapshot for the next run.
    void suspend();

    SessionState state() const { return state_; }
    bool is_recording() const;
    bool has_recording();
    double recording_duration() const;
    const std::vector<Chunk>& chunks() const { return chunks_; }
    const std::optional<CaptureFormat>& format() const { return format_; }
    const std::string& storage_warning() const { return storage_warning_; }
    size_t recorder_faults() const { return recorder_faults_; }

private:
    void on_recorder_data(uint64_t generation, Chunk chunk);
    void on_recorder_error(const std::string& message);
    void finish_stop();
    void collect_idle(StopCallback cb);
    std::expected<std::optional<EncodedAudio>, std::string>
        encode_chunks(std::span<const Chunk> chunks);
    CaptureFormat effective_format();
    void persist_snapshot();
    void note_store_error(const StoreError& err);
    void release_capture();
    void reset_recording();

    CaptureHost& host_;
    CaptureAcquirer& acquirer_;
    ChunkStore& store_;
    PreferenceStore& prefs_;
    Scheduler& scheduler_;
    Options opts_;

    SessionState state_ = SessionState::Idle;
    bool acquiring_ = false;
    // Bumped whenever pending continuations must be ignored.
    uint64_t negotiation_gen_ = 0;
    uint64_t recording_gen_ = 0;
    // Set by a clear that lands while a stop is in flight.
    bool discard_data_ = false;

    std::optional<CaptureHandle> handle_;
    std::unique_ptr<CaptureStream> stream_;
    std::unique_ptr<ChunkedRecorder> recorder_;
    std::vector<Chunk> chunks_;
    std::vector<Chunk> pre_stop_snapshot_;
    StopCallback pending_stop_;

    std::optional<CaptureFormat> format_;
    std::optional<int64_t> started_at_ms_;
    std::chrono::steady_clock::time_point record_start_;
    std::string storage_warning_;
    size_t recorder_faults_ = 0;
};
