#include "session.hpp"

#include <print>

namespace {

int64_t epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Capturing: return "capturing";
        case SessionState::Stopping: return "stopping";
    }
    return "unknown";
}

Session::Session(CaptureHost& host, CaptureAcquirer& acquirer, ChunkStore& store,
                 PreferenceStore& prefs, Scheduler& scheduler, Options opts)
    : host_(host), acquirer_(acquirer), store_(store), prefs_(prefs),
      scheduler_(scheduler), opts_(opts) {
    if (auto stored = store_.load_chunks()) {
        chunks_ = std::move(*stored);
    }
    auto meta = store_.load_metadata();
    format_ = meta.format;
    started_at_ms_ = meta.start_time_ms;

    if (!chunks_.empty()) {
        std::println(stderr, "session: restored {} chunks from a previous run", chunks_.size());
    }
}

Session::~Session() {
    recorder_.reset();
    if (stream_) {
        if (auto r = stream_->stop_tracks(); !r) {
            std::println(stderr, "session: stopping tracks failed: {}", r.error());
        }
        if (auto r = stream_->release_graph(); !r) {
            std::println(stderr, "session: releasing audio graph failed: {}", r.error());
        }
    }
}

void Session::start_capture(std::optional<uint32_t> surface_id, NegotiateCallback cb) {
    if (state_ == SessionState::Capturing || state_ == SessionState::Stopping) {
        cb(std::unexpected(std::string("already recording")));
        return;
    }
    if (acquiring_) {
        cb(std::unexpected(std::string("capture negotiation already in progress")));
        return;
    }

    uint32_t target = 0;
    if (surface_id) {
        target = *surface_id;
    } else {
        auto active = host_.active_surface();
        if (!active) {
            cb(std::unexpected(std::string("No active tab found")));
            return;
        }
        target = active->id;
    }

    // A granted but unused handle is superseded by the new negotiation.
    handle_.reset();
    state_ = SessionState::Negotiating;
    acquiring_ = true;

    uint64_t generation = negotiation_gen_;
    acquirer_.acquire(target, [this, generation, cb = std::move(cb)](
                                  std::expected<CaptureHandle, CaptureError> result) {
        if (generation != negotiation_gen_) {
            cb(std::unexpected(std::string("capture cancelled")));
            return;
        }
        acquiring_ = false;
        if (!result) {
            std::println(stderr, "session: acquisition failed: {}", result.error().message);
            state_ = SessionState::Idle;
            cb(std::unexpected(result.error().message));
            return;
        }
        handle_ = *result;
        cb(std::move(*result));
    });
}

void Session::start_recording(const std::string& stream_token, StartCallback cb) {
    if (state_ == SessionState::Capturing || state_ == SessionState::Stopping) {
        cb(std::unexpected(std::string("already recording")));
        return;
    }
    if (acquiring_) {
        cb(std::unexpected(std::string("capture negotiation still in progress")));
        return;
    }

    auto prefs = prefs_.load();
    CaptureFormat requested{prefs.sample_rate, prefs.channels()};

    state_ = SessionState::Negotiating;
    auto stream = host_.open_stream(stream_token, requested);
    if (!stream) {
        std::println(stderr, "session: could not open stream: {}", stream.error());
        state_ = SessionState::Idle;
        handle_.reset();
        cb(std::unexpected(stream.error()));
        return;
    }

    uint64_t generation = ++recording_gen_;
    auto recorder = (*stream)->create_recorder();
    RecorderEvents events{
        .on_data = [this, generation](Chunk c) { on_recorder_data(generation, std::move(c)); },
        .on_error = [this, generation](const std::string& msg) {
            if (generation == recording_gen_) on_recorder_error(msg);
        },
        .on_stop = [this, generation]() {
            if (generation == recording_gen_) finish_stop();
        },
    };

    if (!recorder || !recorder->start(opts_.timeslice, std::move(events))) {
        std::println(stderr, "session: recorder failed to start");
        if (auto r = (*stream)->stop_tracks(); !r) {
            std::println(stderr, "session: stopping tracks failed: {}", r.error());
        }
        if (auto r = (*stream)->release_graph(); !r) {
            std::println(stderr, "session: releasing audio graph failed: {}", r.error());
        }
        state_ = SessionState::Idle;
        handle_.reset();
        cb(std::unexpected(std::string("failed to start recorder")));
        return;
    }

    chunks_.clear();
    pre_stop_snapshot_.clear();
    storage_warning_.clear();
    recorder_faults_ = 0;
    discard_data_ = false;

    stream_ = std::move(*stream);
    recorder_ = std::move(recorder);
    format_ = stream_->format();
    started_at_ms_ = epoch_ms();
    record_start_ = std::chrono::steady_clock::now();

    if (!handle_ || handle_->stream_token != stream_token) {
        handle_ = CaptureHandle{
            .surface_id = stream_->surface_id(),
            .stream_token = stream_token,
            .acquired_at = std::chrono::system_clock::now(),
            .title = {},
        };
        for (auto& s : host_.surfaces()) {
            if (s.id == handle_->surface_id) handle_->title = s.title;
        }
    }

    if (auto r = store_.put_session_start(*started_at_ms_, *format_); !r) {
        note_store_error(r.error());
    }

    state_ = SessionState::Capturing;
    cb({});
}

void Session::stop(StopCallback cb) {
    if (state_ == SessionState::Stopping) {
        cb(std::unexpected(std::string("stop already in progress")));
        return;
    }
    if (state_ != SessionState::Capturing) {
        collect_idle(std::move(cb));
        return;
    }

    state_ = SessionState::Stopping;
    pending_stop_ = std::move(cb);

    // Flush the partial interval first so it is not lost.
    if (recorder_->is_recording()) {
        recorder_->request_data();
    }
    // Something may clear the live sequence before the stop ack arrives.
    pre_stop_snapshot_ = chunks_;
    recorder_->stop();
}

void Session::finish_stop() {
    if (state_ != SessionState::Stopping) return;

    std::expected<StopResult, std::string> result = StopResult{};
    if (handle_) {
        result->surface_id = handle_->surface_id;
        result->surface_title = handle_->title;
    }

    auto encoded = encode_chunks(chunks_);
    if (encoded && !*encoded && !pre_stop_snapshot_.empty()) {
        std::println(stderr, "session: assembled recording is empty, retrying from pre-stop snapshot");
        encoded = encode_chunks(pre_stop_snapshot_);
    }

    if (!encoded) {
        std::println(stderr, "session: encoding failed, keeping chunks: {}", encoded.error());
        result = std::unexpected(encoded.error());
    } else if (*encoded) {
        result->audio = std::move(**encoded);
    } else {
        std::println(stderr, "session: stop produced no audio");
    }

    release_capture();
    if (result) {
        reset_recording();
        if (!store_.clear_session()) {
            std::println(stderr, "session: failed to clear persisted recording");
        }
    } else {
        handle_.reset();
        pre_stop_snapshot_.clear();
    }
    state_ = SessionState::Idle;

    auto cb = std::move(pending_stop_);
    pending_stop_ = nullptr;
    if (cb) cb(std::move(result));
}

void Session::collect_idle(StopCallback cb) {
    if (acquiring_) {
        ++negotiation_gen_;
        acquiring_ = false;
    }

    std::expected<StopResult, std::string> result = StopResult{};
    auto encoded = encode_chunks(chunks_);
    if (!encoded) {
        cb(std::unexpected(encoded.error()));
        return;
    }
    if (*encoded) result->audio = std::move(**encoded);

    reset_recording();
    if (!store_.clear_session()) {
        std::println(stderr, "session: failed to clear persisted recording");
    }
    state_ = SessionState::Idle;
    cb(std::move(result));
}

std::expected<std::optional<EncodedAudio>, std::string> Session::peek() {
    return encode_chunks(chunks_);
}

void Session::add_chunk(Chunk chunk) {
    if (chunk.empty()) return;

    if (!format_) {
        format_ = effective_format();
        if (auto r = store_.put_format(*format_); !r) note_store_error(r.error());
    }
    chunks_.push_back(std::move(chunk));
    persist_snapshot();
}

void Session::clear() {
    ++negotiation_gen_;
    acquiring_ = false;

    switch (state_) {
        case SessionState::Capturing:
            ++recording_gen_;
            if (recorder_->is_recording()) recorder_->stop();
            release_capture();
            state_ = SessionState::Idle;
            break;
        case SessionState::Stopping:
            // The pending stop still resolves, from its pre-stop snapshot.
            discard_data_ = true;
            break;
        case SessionState::Negotiating:
            state_ = SessionState::Idle;
            break;
        case SessionState::Idle:
            break;
    }

    chunks_.clear();
    started_at_ms_.reset();
    storage_warning_.clear();
    if (state_ != SessionState::Stopping) {
        handle_.reset();
        format_.reset();
    }

    if (!store_.clear_session()) {
        std::println(stderr, "session: failed to clear persisted recording");
    }
}

void Session::suspend() {
    ++negotiation_gen_;
    ++recording_gen_;
    acquiring_ = false;

    if (recorder_ && recorder_->is_recording()) {
        recorder_->stop();
    }
    release_capture();
    handle_.reset();
    state_ = SessionState::Idle;

    if (pending_stop_) {
        auto cb = std::move(pending_stop_);
        pending_stop_ = nullptr;
        cb(std::unexpected(std::string("session suspended")));
    }
}

bool Session::is_recording() const {
    return state_ == SessionState::Capturing || state_ == SessionState::Stopping;
}

bool Session::has_recording() {
    if (!chunks_.empty()) return true;
    auto stored = store_.load_chunks();
    return stored && !stored->empty();
}

double Session::recording_duration() const {
    if (state_ != SessionState::Capturing) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}

void Session::on_recorder_data(uint64_t generation, Chunk chunk) {
    if (generation != recording_gen_ || discard_data_ || chunk.empty()) return;
    if (state_ != SessionState::Capturing && state_ != SessionState::Stopping) return;

    chunks_.push_back(std::move(chunk));
    persist_snapshot();
}

void Session::on_recorder_error(const std::string& message) {
    ++recorder_faults_;
    std::println(stderr, "session: recorder error (recording continues): {}", message);
}

std::expected<std::optional<EncodedAudio>, std::string>
Session::encode_chunks(std::span<const Chunk> chunks) {
    auto pcm = recording::concat(chunks);
    if (pcm.empty()) return std::optional<EncodedAudio>{};

    auto encoded = recording::encode(pcm, effective_format(), prefs_.load());
    if (!encoded) return std::unexpected(encoded.error());
    return std::optional<EncodedAudio>{std::move(*encoded)};
}

CaptureFormat Session::effective_format() {
    if (format_) return *format_;
    auto prefs = prefs_.load();
    return CaptureFormat{prefs.sample_rate, prefs.channels()};
}

void Session::persist_snapshot() {
    if (auto r = store_.put_chunks(chunks_); !r) {
        note_store_error(r.error());
    }
}

void Session::note_store_error(const StoreError& err) {
    if (err.kind == StoreErrorKind::QuotaExceeded) {
        if (storage_warning_.empty()) {
            std::println(stderr, "session: {}; recording continues in memory only", err.message);
        }
        storage_warning_ = "storage quota exceeded, recording is no longer persisted";
        return;
    }
    std::println(stderr, "session: persisting recording failed: {}", err.message);
}

void Session::release_capture() {
    if (recorder_) {
        // We may be inside one of the recorder's own callbacks; let it finish
        // before the recorder is destroyed.
        std::shared_ptr<ChunkedRecorder> retired(std::move(recorder_));
        scheduler_.post([retired] {});
    }
    if (stream_) {
        if (auto r = stream_->stop_tracks(); !r) {
            std::println(stderr, "session: stopping tracks failed: {}", r.error());
        }
        if (auto r = stream_->release_graph(); !r) {
            std::println(stderr, "session: releasing audio graph failed: {}", r.error());
        }
        stream_.reset();
    }
}

void Session::reset_recording() {
    chunks_.clear();
    pre_stop_snapshot_.clear();
    handle_.reset();
    format_.reset();
    started_at_ms_.reset();
    storage_warning_.clear();
    discard_data_ = false;
}
