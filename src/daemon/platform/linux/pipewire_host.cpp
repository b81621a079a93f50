#include "platform/linux/pipewire_host.hpp"

#include "platform/linux/pipewire_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <print>
#include <random>

PipeWireHost::PipeWireHost(Scheduler& scheduler, uint32_t ring_buffer_seconds)
    : scheduler_(scheduler), ring_buffer_seconds_(ring_buffer_seconds) {
    pw_init(nullptr, nullptr);
}

PipeWireHost::~PipeWireHost() {
    if (loop_) {
        pw_thread_loop_lock(loop_);
        if (registry_) {
            spa_hook_remove(&registry_listener_);
            pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
            registry_ = nullptr;
        }
        if (core_) {
            pw_core_disconnect(core_);
            core_ = nullptr;
        }
        pw_thread_loop_unlock(loop_);
        pw_thread_loop_stop(loop_);
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    pw_deinit();
}

bool PipeWireHost::init() {
    loop_ = pw_thread_loop_new("tapedeck", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        std::println(stderr, "audio: failed to create context");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        std::println(stderr, "audio: thread loop start failed");
        return false;
    }

    pw_thread_loop_lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        pw_thread_loop_unlock(loop_);
        std::println(stderr, "audio: cannot connect to PipeWire: {}", std::strerror(errno));
        return false;
    }
    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);
    pw_thread_loop_unlock(loop_);
    return true;
}

std::vector<Surface> PipeWireHost::surfaces() {
    std::lock_guard lock(nodes_mutex_);
    std::vector<Surface> out;
    out.reserve(nodes_.size());
    for (auto& n : nodes_) out.push_back(n.surface);
    return out;
}

std::optional<Surface> PipeWireHost::active_surface() {
    // The most recently announced playback stream.
    std::lock_guard lock(nodes_mutex_);
    if (nodes_.empty()) return std::nullopt;
    return nodes_.back().surface;
}

void PipeWireHost::request_stream_token(uint32_t surface_id, TokenCallback cb) {
    scheduler_.post([this, surface_id, cb = std::move(cb)]() {
        if (!node_serial(surface_id)) {
            cb(std::unexpected(std::format("No audio stream with id {}", surface_id)));
            return;
        }
        if (busy_.contains(surface_id)) {
            cb(std::unexpected(std::string(conflict_message)));
            return;
        }

        // A newer grant replaces any unused one for the same surface.
        std::erase_if(grants_, [surface_id](const auto& g) { return g.second == surface_id; });
        auto token = new_token();
        grants_[token] = surface_id;
        cb(token);
    });
}

std::expected<std::unique_ptr<CaptureStream>, std::string>
PipeWireHost::open_stream(const std::string& token, const CaptureFormat& format) {
    auto it = grants_.find(token);
    if (it == grants_.end()) {
        return std::unexpected(std::string("Unknown or already used stream token"));
    }
    uint32_t surface_id = it->second;
    grants_.erase(it);

    if (busy_.contains(surface_id)) return std::unexpected(std::string(conflict_message));

    auto serial = node_serial(surface_id);
    if (!serial) {
        return std::unexpected(std::format("Audio stream {} has gone away", surface_id));
    }

    size_t ring_bytes = static_cast<size_t>(format.sample_rate) * format.frame_bytes() *
                        std::max<uint32_t>(ring_buffer_seconds_, 1);
    auto stream = std::make_unique<PipeWireStream>(*this, surface_id, format, ring_bytes);
    if (auto r = stream->connect(*serial); !r) return std::unexpected(r.error());

    busy_.insert(surface_id);
    return std::unique_ptr<CaptureStream>(std::move(stream));
}

void PipeWireHost::release_surface(uint32_t surface_id) {
    scheduler_.post([this, surface_id]() { busy_.erase(surface_id); });
}

std::optional<uint64_t> PipeWireHost::node_serial(uint32_t surface_id) {
    std::lock_guard lock(nodes_mutex_);
    auto it = std::ranges::find_if(nodes_, [surface_id](const Node& n) {
        return n.surface.id == surface_id;
    });
    if (it == nodes_.end()) return std::nullopt;
    return it->serial;
}

std::string PipeWireHost::new_token() {
    static std::mt19937_64 rng{std::random_device{}()};
    return std::format("{:016x}{:016x}", rng(), rng());
}

void PipeWireHost::on_global(void* userdata, uint32_t id, uint32_t /*permissions*/,
                             const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* self = static_cast<PipeWireHost*>(userdata);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
    if (!media_class || std::strcmp(media_class, "Stream/Output/Audio") != 0) return;

    auto lookup = [props](const char* key) -> std::string {
        const char* v = spa_dict_lookup(props, key);
        return v ? v : "";
    };

    Node node;
    node.surface.id = id;
    node.surface.title = lookup(PW_KEY_MEDIA_NAME);
    if (node.surface.title.empty()) node.surface.title = lookup(PW_KEY_NODE_DESCRIPTION);
    node.surface.app = lookup(PW_KEY_APP_NAME);

    auto serial = lookup(PW_KEY_OBJECT_SERIAL);
    node.serial = serial.empty() ? id : std::strtoull(serial.c_str(), nullptr, 10);

    std::lock_guard lock(self->nodes_mutex_);
    self->nodes_.push_back(std::move(node));
}

void PipeWireHost::on_global_remove(void* userdata, uint32_t id) {
    auto* self = static_cast<PipeWireHost*>(userdata);
    std::lock_guard lock(self->nodes_mutex_);
    std::erase_if(self->nodes_, [id](const Node& n) { return n.surface.id == id; });
}
