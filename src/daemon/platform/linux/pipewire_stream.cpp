#include "platform/linux/pipewire_stream.hpp"

#include "platform/linux/pipewire_host.hpp"

#include <format>
#include <print>
#include <spa/utils/result.h>

PipeWireStream::PipeWireStream(PipeWireHost& host, uint32_t surface_id, CaptureFormat format,
                               size_t ring_bytes)
    : host_(host), surface_id_(surface_id), format_(format), ring_(ring_bytes) {}

PipeWireStream::~PipeWireStream() {
    if (auto r = release_graph(); !r) {
        std::println(stderr, "audio: {}", r.error());
    }
}

std::expected<void, std::string> PipeWireStream::connect(uint64_t target_serial) {
    auto* loop = host_.thread_loop();
    pw_thread_loop_lock(loop);

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Production",
        PW_KEY_NODE_NAME, "tapedeck",
        PW_KEY_APP_NAME, "tapedeck",
        nullptr
    );
    pw_properties_set(props, PW_KEY_TARGET_OBJECT, std::to_string(target_serial).c_str());
    // Stay off the default device if the target disappears.
    pw_properties_set(props, PW_KEY_NODE_DONT_RECONNECT, "true");

    stream_ = pw_stream_new(host_.core(), "tapedeck-capture", props);
    if (!stream_) {
        pw_thread_loop_unlock(loop);
        return std::unexpected(std::string("failed to create capture stream"));
    }
    pw_stream_add_listener(stream_, &listener_, &stream_events_, this);

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = format_.sample_rate,
        .channels = format_.channels
    );
    if (format_.channels == 1) {
        info.position[0] = SPA_AUDIO_CHANNEL_MONO;
    } else {
        info.position[0] = SPA_AUDIO_CHANNEL_FL;
        info.position[1] = SPA_AUDIO_CHANNEL_FR;
    }
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        spa_hook_remove(&listener_);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_unlock(loop);
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    connected_ = true;
    pw_thread_loop_unlock(loop);
    return {};
}

std::unique_ptr<ChunkedRecorder> PipeWireStream::create_recorder() {
    if (!stream_) return nullptr;
    return std::make_unique<PipeWireRecorder>(*this, host_.scheduler());
}

std::expected<void, std::string> PipeWireStream::stop_tracks() {
    if (!stream_ || !connected_) return {};

    pw_thread_loop_lock(host_.thread_loop());
    int ret = pw_stream_disconnect(stream_);
    pw_thread_loop_unlock(host_.thread_loop());
    connected_ = false;

    if (ret < 0) return std::unexpected(std::format("stream disconnect failed: {}", spa_strerror(ret)));
    return {};
}

std::expected<void, std::string> PipeWireStream::release_graph() {
    if (released_) return {};
    released_ = true;

    if (stream_) {
        pw_thread_loop_lock(host_.thread_loop());
        spa_hook_remove(&listener_);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_unlock(host_.thread_loop());
    }
    connected_ = false;
    host_.release_surface(surface_id_);
    return {};
}

void PipeWireStream::on_process(void* userdata) {
    auto* self = static_cast<PipeWireStream*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && d->chunk->size > 0) {
        auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
        self->ring_.write(data, d->chunk->size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireStream::on_state_changed(void* userdata, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireStream*>(userdata);
    if (state != PW_STREAM_STATE_ERROR) return;

    auto msg = std::format("stream state {} -> {}: {}", pw_stream_state_as_string(old),
                           pw_stream_state_as_string(state), error ? error : "unknown error");
    std::println(stderr, "audio: {}", msg);

    self->host_.scheduler().post([self, alive = self->alive_ref_, msg]() {
        if (alive.expired()) return;
        if (self->error_sink_) self->error_sink_(msg);
    });
}

PipeWireRecorder::PipeWireRecorder(PipeWireStream& stream, Scheduler& scheduler)
    : stream_(stream), scheduler_(scheduler) {}

PipeWireRecorder::~PipeWireRecorder() {
    if (timer_) scheduler_.cancel(timer_);
    if (recording_) stream_.set_error_sink(nullptr);
}

bool PipeWireRecorder::start(std::chrono::milliseconds timeslice, RecorderEvents events) {
    if (recording_) return false;

    events_ = std::move(events);
    timeslice_ = timeslice;
    recording_ = true;
    dropped_seen_ = stream_.ring().dropped();

    stream_.set_error_sink([this](const std::string& msg) {
        if (events_.on_error) events_.on_error(msg);
    });
    timer_ = scheduler_.schedule(timeslice_, [this]() { tick(); });
    return true;
}

void PipeWireRecorder::request_data() {
    if (!recording_) return;
    auto chunk = drain();
    if (!chunk.empty() && events_.on_data) events_.on_data(std::move(chunk));
}

void PipeWireRecorder::stop() {
    if (!recording_) return;
    recording_ = false;

    if (timer_) {
        scheduler_.cancel(timer_);
        timer_ = 0;
    }
    stream_.set_error_sink(nullptr);

    // Last read of the stream; the acknowledgement follows on a later turn.
    auto last = drain();
    scheduler_.post([this, alive = std::weak_ptr<bool>(alive_), last = std::move(last)]() mutable {
        if (alive.expired()) return;
        if (!last.empty() && events_.on_data) events_.on_data(std::move(last));
        if (events_.on_stop) events_.on_stop();
    });
}

void PipeWireRecorder::tick() {
    timer_ = 0;
    auto chunk = drain();
    // Rearm first: on_data may stop us.
    timer_ = scheduler_.schedule(timeslice_, [this]() { tick(); });
    if (!chunk.empty() && events_.on_data) events_.on_data(std::move(chunk));
}

Chunk PipeWireRecorder::drain() {
    auto& ring = stream_.ring();
    size_t dropped = ring.dropped();
    if (dropped > dropped_seen_) {
        auto msg = std::format("ring buffer overflow, {} bytes dropped", dropped - dropped_seen_);
        dropped_seen_ = dropped;
        if (events_.on_error) events_.on_error(msg);
    }
    return ring.drain_frames(stream_.format().frame_bytes());
}
