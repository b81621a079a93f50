#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace protocol {

struct StartCapture {
    std::optional<uint32_t> surface_id;
};
struct StartRecordingWithStream {
    std::string stream_token;
};
struct StopCapture {};
struct GetRecordingState {};
struct GetRecordingData {};
struct ClearRecording {};
struct AddRecordingChunk {
    std::vector<uint8_t> chunk;
};
struct ListSurfaces {};
struct GetPreferences {};
struct SetPreferences {
    nlohmann::json patch;
};
struct ListRecordings {
    int limit = 20;
};
struct GetSavedRecording {
    int64_t id = 0;
};
struct DeleteSavedRecording {
    int64_t id = 0;
};
struct RenameRecording {
    int64_t id = 0;
    std::string name;
};
struct ClearRecordings {};
struct GetStorageUsage {};

using Command = std::variant<StartCapture, StartRecordingWithStream, StopCapture,
                             GetRecordingState, GetRecordingData, ClearRecording,
                             AddRecordingChunk, ListSurfaces, GetPreferences, SetPreferences,
                             ListRecordings, GetSavedRecording, DeleteSavedRecording,
                             RenameRecording, ClearRecordings, GetStorageUsage>;

// Validates a request object and turns it into a Command. The message is
// sent back to the client as the "error" field.
std::expected<Command, std::string> parse_command(const nlohmann::json& request);

nlohmann::json ok(nlohmann::json fields = nlohmann::json::object());
nlohmann::json error(const std::string& message);

// Byte arrays travel as JSON arrays of integers 0..255.
nlohmann::json bytes_to_json(std::span<const uint8_t> bytes);
std::expected<std::vector<uint8_t>, std::string> bytes_from_json(const nlohmann::json& value);

} // namespace protocol
