#pragma once

#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"
#include "ring_buffer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

class PipeWireHost;

// Capture stream linked to one application's playback node. The PipeWire
// data thread writes S16_LE frames into the ring buffer; everything else
// runs on the event loop.
class PipeWireStream : public CaptureStream {
public:
    PipeWireStream(PipeWireHost& host, uint32_t surface_id, CaptureFormat format,
                   size_t ring_bytes);
    ~PipeWireStream() override;

    PipeWireStream(const PipeWireStream&) = delete;
    PipeWireStream& operator=(const PipeWireStream&) = delete;

    std::expected<void, std::string> connect(uint64_t target_serial);

    uint32_t surface_id() const override { return surface_id_; }
    const CaptureFormat& format() const override { return format_; }
    std::unique_ptr<ChunkedRecorder> create_recorder() override;
    std::expected<void, std::string> stop_tracks() override;
    std::expected<void, std::string> release_graph() override;

    RingBuffer& ring() { return ring_; }

    // Receives stream failures on the event loop.
    void set_error_sink(std::function<void(const std::string&)> sink) {
        error_sink_ = std::move(sink);
    }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    PipeWireHost& host_;
    uint32_t surface_id_;
    CaptureFormat format_;
    RingBuffer ring_;

    pw_stream* stream_ = nullptr;
    spa_hook listener_{};
    bool connected_ = false;
    bool released_ = false;

    std::function<void(const std::string&)> error_sink_;
    // Lets tasks posted from the PipeWire thread detect that we are gone.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    const std::weak_ptr<bool> alive_ref_ = alive_;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};

class PipeWireRecorder : public ChunkedRecorder {
public:
    PipeWireRecorder(PipeWireStream& stream, Scheduler& scheduler);
    ~PipeWireRecorder() override;

    PipeWireRecorder(const PipeWireRecorder&) = delete;
    PipeWireRecorder& operator=(const PipeWireRecorder&) = delete;

    bool start(std::chrono::milliseconds timeslice, RecorderEvents events) override;
    void request_data() override;
    void stop() override;
    bool is_recording() const override { return recording_; }

private:
    void tick();
    Chunk drain();

    PipeWireStream& stream_;
    Scheduler& scheduler_;

    RecorderEvents events_;
    std::chrono::milliseconds timeslice_{100};
    Scheduler::TimerId timer_ = 0;
    bool recording_ = false;
    size_t dropped_seen_ = 0;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
