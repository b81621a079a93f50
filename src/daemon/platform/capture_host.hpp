#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using Chunk = std::vector<uint8_t>;

// Interleaved signed 16-bit little-endian PCM.
struct CaptureFormat {
    uint32_t sample_rate = 44100;
    uint16_t channels = 2;

    size_t frame_bytes() const { return static_cast<size_t>(channels) * sizeof(int16_t); }
    bool operator==(const CaptureFormat&) const = default;
};

// An audio-producing unit of the host (an application playback stream).
struct Surface {
    uint32_t id = 0;
    std::string title;
    std::string app;
};

struct RecorderEvents {
    std::function<void(Chunk)> on_data;
    std::function<void(const std::string&)> on_error;
    std::function<void()> on_stop;
};

// Periodically emits buffered audio through on_data instead of one blob at
// the end. Events are delivered on the scheduler loop, in capture order.
class ChunkedRecorder {
public:
    virtual ~ChunkedRecorder() = default;
    virtual bool start(std::chrono::milliseconds timeslice, RecorderEvents events) = 0;
    // Emit whatever is buffered now, without waiting for the next tick.
    virtual void request_data() = 0;
    // Emits the remaining data, then on_stop. After on_stop the recorder no
    // longer touches the stream it was created from.
    virtual void stop() = 0;
    virtual bool is_recording() const = 0;
};

class CaptureStream {
public:
    virtual ~CaptureStream() = default;
    virtual uint32_t surface_id() const = 0;
    virtual const CaptureFormat& format() const = 0;
    virtual std::unique_ptr<ChunkedRecorder> create_recorder() = 0;
    virtual std::expected<void, std::string> stop_tracks() = 0;
    // Tears down the processing graph and gives the surface back to the host.
    virtual std::expected<void, std::string> release_graph() = 0;
};

class CaptureHost {
public:
    using TokenCallback = std::function<void(std::expected<std::string, std::string>)>;

    virtual ~CaptureHost() = default;

    virtual std::vector<Surface> surfaces() = 0;
    virtual std::optional<Surface> active_surface() = 0;

    // Asynchronous; cb runs later on the scheduler loop. Fails with a message
    // containing "active stream" while a live stream holds the surface.
    virtual void request_stream_token(uint32_t surface_id, TokenCallback cb) = 0;

    virtual std::expected<std::unique_ptr<CaptureStream>, std::string>
        open_stream(const std::string& token, const CaptureFormat& format) = 0;
};
