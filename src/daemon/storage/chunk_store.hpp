#pragma once

#include "platform/capture_host.hpp"
#include "storage/kv_store.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace keys {
inline const std::string stream_id = "recordingStreamId";
inline const std::string tab_id = "recordingTabId";
inline const std::string start_time = "recordingStartTime";
inline const std::string chunks = "recordingChunks";
inline const std::string format = "recordingFormat";
inline const std::string preferences = "preferences";

// Everything that belongs to one recording; removed together.
inline const std::array<std::string, 5> session = {stream_id, tab_id, start_time, chunks, format};
} // namespace keys

struct SessionMetadata {
    std::optional<std::string> stream_id;
    std::optional<uint32_t> tab_id;
    std::optional<int64_t> start_time_ms;
    std::optional<CaptureFormat> format;
};

// Restart-safe mirror of the recording in progress. Every write replaces the
// complete chunk list, so a reader only ever sees a self-consistent snapshot.
class ChunkStore {
public:
    explicit ChunkStore(KeyValueStore& kv);

    std::expected<void, StoreError> put_chunks(std::span<const Chunk> chunks);
    std::optional<std::vector<Chunk>> load_chunks();

    std::expected<void, StoreError> put_stream_grant(const std::string& stream_id,
                                                     uint32_t surface_id);
    // Marks a new recording: start time, PCM format and an empty chunk list.
    std::expected<void, StoreError> put_session_start(int64_t start_time_ms,
                                                      const CaptureFormat& format);
    std::expected<void, StoreError> put_format(const CaptureFormat& format);

    SessionMetadata load_metadata();

    bool clear_session();

private:
    KeyValueStore& kv_;
};
