#include "protocol.hpp"

#include <limits>

namespace protocol {

namespace {

// Integers outside [lo, hi] are rejected rather than narrowed.
std::optional<int64_t> integer_in_range(const nlohmann::json& v, int64_t lo, int64_t hi) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(hi)) return std::nullopt;
        auto n = static_cast<int64_t>(u);
        if (n < lo) return std::nullopt;
        return n;
    }
    if (!v.is_number_integer()) return std::nullopt;
    auto n = v.get<int64_t>();
    if (n < lo || n > hi) return std::nullopt;
    return n;
}

std::expected<int64_t, std::string> required_id(const nlohmann::json& request) {
    auto it = request.find("id");
    std::optional<int64_t> id;
    if (it != request.end()) {
        id = integer_in_range(*it, std::numeric_limits<int64_t>::min(),
                              std::numeric_limits<int64_t>::max());
    }
    if (!id) return std::unexpected(std::string("Recording id required"));
    return *id;
}

} // namespace

std::expected<Command, std::string> parse_command(const nlohmann::json& request) {
    if (!request.is_object()) return std::unexpected(std::string("malformed request"));

    auto cmd_it = request.find("cmd");
    if (cmd_it == request.end() || !cmd_it->is_string()) {
        return std::unexpected(std::string("malformed request"));
    }
    const auto& cmd = cmd_it->get_ref<const std::string&>();

    if (cmd == "start-capture") {
        StartCapture c;
        if (auto it = request.find("surfaceId"); it != request.end() && !it->is_null()) {
            auto id = integer_in_range(*it, 0, std::numeric_limits<uint32_t>::max());
            if (!id) {
                return std::unexpected(std::string("surfaceId must be a non-negative integer"));
            }
            c.surface_id = static_cast<uint32_t>(*id);
        }
        return c;
    }
    if (cmd == "start-recording-with-stream") {
        auto it = request.find("streamToken");
        if (it == request.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            return std::unexpected(std::string("Stream ID required"));
        }
        return StartRecordingWithStream{it->get<std::string>()};
    }
    if (cmd == "stop-capture") return StopCapture{};
    if (cmd == "get-recording-state") return GetRecordingState{};
    if (cmd == "get-recording-data") return GetRecordingData{};
    if (cmd == "clear-recording") return ClearRecording{};
    if (cmd == "add-recording-chunk") {
        auto it = request.find("chunk");
        if (it == request.end()) return std::unexpected(std::string("chunk required"));
        auto bytes = bytes_from_json(*it);
        if (!bytes) return std::unexpected(bytes.error());
        return AddRecordingChunk{std::move(*bytes)};
    }
    if (cmd == "list-surfaces") return ListSurfaces{};
    if (cmd == "get-preferences") return GetPreferences{};
    if (cmd == "set-preferences") {
        auto it = request.find("preferences");
        if (it == request.end() || !it->is_object()) {
            return std::unexpected(std::string("preferences object required"));
        }
        return SetPreferences{*it};
    }
    if (cmd == "list-recordings") {
        ListRecordings c;
        if (auto it = request.find("limit"); it != request.end()) {
            auto limit = integer_in_range(*it, 1, std::numeric_limits<int>::max());
            if (!limit) {
                return std::unexpected(std::string("limit must be a positive integer"));
            }
            c.limit = static_cast<int>(*limit);
        }
        return c;
    }
    if (cmd == "get-saved-recording") {
        auto id = required_id(request);
        if (!id) return std::unexpected(id.error());
        return GetSavedRecording{*id};
    }
    if (cmd == "delete-saved-recording") {
        auto id = required_id(request);
        if (!id) return std::unexpected(id.error());
        return DeleteSavedRecording{*id};
    }
    if (cmd == "rename-recording") {
        auto id = required_id(request);
        if (!id) return std::unexpected(id.error());
        auto it = request.find("name");
        if (it == request.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            return std::unexpected(std::string("name required"));
        }
        return RenameRecording{*id, it->get<std::string>()};
    }
    if (cmd == "clear-recordings") return ClearRecordings{};
    if (cmd == "get-storage-usage") return GetStorageUsage{};

    return std::unexpected("unknown command: " + cmd);
}

nlohmann::json ok(nlohmann::json fields) {
    fields["success"] = true;
    return fields;
}

nlohmann::json error(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

nlohmann::json bytes_to_json(std::span<const uint8_t> bytes) {
    auto arr = nlohmann::json::array();
    auto& vec = arr.get_ref<nlohmann::json::array_t&>();
    vec.reserve(bytes.size());
    for (uint8_t b : bytes) vec.emplace_back(b);
    return arr;
}

std::expected<std::vector<uint8_t>, std::string> bytes_from_json(const nlohmann::json& value) {
    if (!value.is_array()) return std::unexpected(std::string("byte array expected"));

    std::vector<uint8_t> out;
    out.reserve(value.size());
    for (auto& v : value) {
        if (!v.is_number_unsigned() || v.get<uint64_t>() > 255) {
            return std::unexpected(std::string("byte values must be integers 0..255"));
        }
        out.push_back(static_cast<uint8_t>(v.get<uint64_t>()));
    }
    return out;
}

} // namespace protocol
