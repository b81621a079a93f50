#pragma once

#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"

#include <cstdint>
#include <mutex>
#include <pipewire/pipewire.h>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Discovers application playback streams ("Stream/Output/Audio" nodes) and
// hands out single-use stream tokens for them. At most one live capture
// stream may hold a surface; giving it back completes asynchronously.
class PipeWireHost : public CaptureHost {
public:
    PipeWireHost(Scheduler& scheduler, uint32_t ring_buffer_seconds);
    ~PipeWireHost() override;

    PipeWireHost(const PipeWireHost&) = delete;
    PipeWireHost& operator=(const PipeWireHost&) = delete;

    bool init();

    std::vector<Surface> surfaces() override;
    std::optional<Surface> active_surface() override;
    void request_stream_token(uint32_t surface_id, TokenCallback cb) override;
    std::expected<std::unique_ptr<CaptureStream>, std::string>
        open_stream(const std::string& token, const CaptureFormat& format) override;

    // Used by PipeWireStream.
    pw_thread_loop* thread_loop() const { return loop_; }
    pw_core* core() const { return core_; }
    Scheduler& scheduler() { return scheduler_; }
    void release_surface(uint32_t surface_id);

    static constexpr const char* conflict_message = "Cannot capture a tab with an active stream.";

private:
    static void on_global(void* userdata, uint32_t id, uint32_t permissions, const char* type,
                          uint32_t version, const spa_dict* props);
    static void on_global_remove(void* userdata, uint32_t id);

    std::optional<uint64_t> node_serial(uint32_t surface_id);
    std::string new_token();

    Scheduler& scheduler_;
    uint32_t ring_buffer_seconds_;

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    spa_hook registry_listener_{};

    struct Node {
        Surface surface;
        uint64_t serial = 0;
    };
    // Written from the PipeWire thread, read from the event loop.
    std::mutex nodes_mutex_;
    std::vector<Node> nodes_; // announcement order

    // Event loop only.
    std::unordered_map<std::string, uint32_t> grants_;
    std::unordered_set<uint32_t> busy_;

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };
};
