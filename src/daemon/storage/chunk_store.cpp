#include "chunk_store.hpp"

#include <print>

using json = nlohmann::json;

namespace {

json format_to_json(const CaptureFormat& f) {
    return {{"sampleRate", f.sample_rate}, {"channels", f.channels}};
}

std::optional<CaptureFormat> format_from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    try {
        auto rate = j.value("sampleRate", 0u);
        auto channels = j.value("channels", 0u);
        if (rate == 0 || channels == 0 || channels > 8) return std::nullopt;
        return CaptureFormat{rate, static_cast<uint16_t>(channels)};
    } catch (const json::exception& e) {
        std::println(stderr, "store: bad {}: {}", keys::format, e.what());
        return std::nullopt;
    }
}

json chunks_to_json(std::span<const Chunk> chunks) {
    json arr = json::array();
    for (auto& c : chunks) {
        arr.push_back(json::binary(c));
    }
    return arr;
}

} // namespace

ChunkStore::ChunkStore(KeyValueStore& kv) : kv_(kv) {}

std::expected<void, StoreError> ChunkStore::put_chunks(std::span<const Chunk> chunks) {
    return kv_.put(keys::chunks, chunks_to_json(chunks));
}

std::optional<std::vector<Chunk>> ChunkStore::load_chunks() {
    auto stored = kv_.get(keys::chunks);
    if (!stored) return std::nullopt;
    if (!stored->is_array()) {
        std::println(stderr, "store: {} is not a list, ignoring", keys::chunks);
        return std::nullopt;
    }

    std::vector<Chunk> chunks;
    chunks.reserve(stored->size());
    for (auto& item : *stored) {
        if (item.is_binary()) {
            chunks.push_back(item.get_binary());
        } else if (item.is_array()) {
            // Plain integer lists, as a client would write them.
            try {
                chunks.push_back(item.get<Chunk>());
            } catch (const json::exception& e) {
                std::println(stderr, "store: skipping malformed chunk: {}", e.what());
            }
        } else {
            std::println(stderr, "store: skipping malformed chunk");
        }
    }
    return chunks;
}

std::expected<void, StoreError> ChunkStore::put_stream_grant(const std::string& stream_id,
                                                             uint32_t surface_id) {
    return kv_.put_all({{keys::stream_id, stream_id}, {keys::tab_id, surface_id}});
}

std::expected<void, StoreError> ChunkStore::put_session_start(int64_t start_time_ms,
                                                              const CaptureFormat& format) {
    return kv_.put_all({
        {keys::start_time, start_time_ms},
        {keys::format, format_to_json(format)},
        {keys::chunks, json::array()},
    });
}

std::expected<void, StoreError> ChunkStore::put_format(const CaptureFormat& format) {
    return kv_.put(keys::format, format_to_json(format));
}

SessionMetadata ChunkStore::load_metadata() {
    SessionMetadata meta;
    if (auto v = kv_.get(keys::stream_id); v && v->is_string()) {
        meta.stream_id = v->get<std::string>();
    }
    if (auto v = kv_.get(keys::tab_id); v && v->is_number_unsigned()) {
        meta.tab_id = v->get<uint32_t>();
    }
    if (auto v = kv_.get(keys::start_time); v && v->is_number_integer()) {
        meta.start_time_ms = v->get<int64_t>();
    }
    if (auto v = kv_.get(keys::format)) {
        meta.format = format_from_json(*v);
    }
    return meta;
}

bool ChunkStore::clear_session() {
    return kv_.remove(keys::session);
}
