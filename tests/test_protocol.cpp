#include <catch2/catch_test_macros.hpp>

#include "protocol.hpp"

#include <nlohmann/json.hpp>
#include <variant>

using json = nlohmann::json;

namespace {

template <typename T>
T parse_as(const json& request) {
    auto cmd = protocol::parse_command(request);
    REQUIRE(cmd.has_value());
    REQUIRE(std::holds_alternative<T>(*cmd));
    return std::get<T>(*cmd);
}

std::string parse_error(const json& request) {
    auto cmd = protocol::parse_command(request);
    REQUIRE_FALSE(cmd.has_value());
    return cmd.error();
}

} // namespace

TEST_CASE("protocol::parse_command", "[protocol]") {

    SECTION("StartCapture") {
        REQUIRE_FALSE(parse_as<protocol::StartCapture>({{"cmd", "start-capture"}}).surface_id);
        REQUIRE(parse_as<protocol::StartCapture>({{"cmd", "start-capture"}, {"surfaceId", nullptr}})
                    .surface_id == std::nullopt);
        REQUIRE(parse_as<protocol::StartCapture>({{"cmd", "start-capture"}, {"surfaceId", 42}})
                    .surface_id == 42u);
        REQUIRE(parse_error({{"cmd", "start-capture"}, {"surfaceId", -1}}) ==
                "surfaceId must be a non-negative integer");
        REQUIRE(parse_error({{"cmd", "start-capture"}, {"surfaceId", "42"}}) ==
                "surfaceId must be a non-negative integer");
        // 2^32 + 42 is not narrowed to 42.
        REQUIRE(parse_error({{"cmd", "start-capture"}, {"surfaceId", 4294967338ull}}) ==
                "surfaceId must be a non-negative integer");
        REQUIRE(parse_as<protocol::StartCapture>({{"cmd", "start-capture"}, {"surfaceId", 4294967295ull}})
                    .surface_id == 4294967295u);
    }

    SECTION("StartRecordingWithStream") {
        auto c = parse_as<protocol::StartRecordingWithStream>(
            {{"cmd", "start-recording-with-stream"}, {"streamToken", "abc"}});
        REQUIRE(c.stream_token == "abc");

        REQUIRE(parse_error({{"cmd", "start-recording-with-stream"}}) == "Stream ID required");
        REQUIRE(parse_error({{"cmd", "start-recording-with-stream"}, {"streamToken", ""}}) ==
                "Stream ID required");
        REQUIRE(parse_error({{"cmd", "start-recording-with-stream"}, {"streamToken", 5}}) ==
                "Stream ID required");
    }

    SECTION("CommandsWithoutArguments") {
        parse_as<protocol::StopCapture>({{"cmd", "stop-capture"}});
        parse_as<protocol::GetRecordingState>({{"cmd", "get-recording-state"}});
        parse_as<protocol::GetRecordingData>({{"cmd", "get-recording-data"}});
        parse_as<protocol::ClearRecording>({{"cmd", "clear-recording"}});
        parse_as<protocol::ListSurfaces>({{"cmd", "list-surfaces"}});
        parse_as<protocol::GetPreferences>({{"cmd", "get-preferences"}});
    }

    SECTION("AddRecordingChunk") {
        auto c = parse_as<protocol::AddRecordingChunk>(
            {{"cmd", "add-recording-chunk"}, {"chunk", {0, 128, 255}}});
        REQUIRE(c.chunk == std::vector<uint8_t>{0, 128, 255});

        REQUIRE(parse_error({{"cmd", "add-recording-chunk"}}) == "chunk required");
        REQUIRE(parse_error({{"cmd", "add-recording-chunk"}, {"chunk", "AAEC"}}) ==
                "byte array expected");
        REQUIRE(parse_error({{"cmd", "add-recording-chunk"}, {"chunk", {1, 256}}}) ==
                "byte values must be integers 0..255");
        REQUIRE(parse_error({{"cmd", "add-recording-chunk"}, {"chunk", {1, -1}}}) ==
                "byte values must be integers 0..255");
    }

    SECTION("SetPreferences") {
        auto c = parse_as<protocol::SetPreferences>(
            {{"cmd", "set-preferences"}, {"preferences", {{"format", "ogg"}}}});
        REQUIRE(c.patch["format"] == "ogg");
        REQUIRE(parse_error({{"cmd", "set-preferences"}, {"preferences", "ogg"}}) ==
                "preferences object required");
    }

    SECTION("Library") {
        REQUIRE(parse_as<protocol::ListRecordings>({{"cmd", "list-recordings"}}).limit == 20);
        REQUIRE(parse_as<protocol::ListRecordings>({{"cmd", "list-recordings"}, {"limit", 5}}).limit == 5);
        REQUIRE(parse_error({{"cmd", "list-recordings"}, {"limit", 0}}) ==
                "limit must be a positive integer");
        REQUIRE(parse_error({{"cmd", "list-recordings"}, {"limit", 4294967301ull}}) ==
                "limit must be a positive integer");
        REQUIRE(parse_error({{"cmd", "get-saved-recording"}, {"id", 18446744073709551615ull}}) ==
                "Recording id required");

        REQUIRE(parse_as<protocol::GetSavedRecording>({{"cmd", "get-saved-recording"}, {"id", 7}}).id == 7);
        REQUIRE(parse_as<protocol::DeleteSavedRecording>({{"cmd", "delete-saved-recording"}, {"id", 8}}).id == 8);
        REQUIRE(parse_error({{"cmd", "get-saved-recording"}}) == "Recording id required");
        REQUIRE(parse_error({{"cmd", "delete-saved-recording"}, {"id", "8"}}) == "Recording id required");

        auto r = parse_as<protocol::RenameRecording>(
            {{"cmd", "rename-recording"}, {"id", 3}, {"name", "Take 2"}});
        REQUIRE(r.id == 3);
        REQUIRE(r.name == "Take 2");
        REQUIRE(parse_error({{"cmd", "rename-recording"}, {"id", 3}}) == "name required");
        REQUIRE(parse_error({{"cmd", "rename-recording"}, {"name", "x"}}) == "Recording id required");

        parse_as<protocol::ClearRecordings>({{"cmd", "clear-recordings"}});
        parse_as<protocol::GetStorageUsage>({{"cmd", "get-storage-usage"}});
    }

    SECTION("MalformedAndUnknown") {
        REQUIRE(parse_error(json::array({1, 2})) == "malformed request");
        REQUIRE(parse_error(json("stop-capture")) == "malformed request");
        REQUIRE(parse_error({{"cmd", 3}}) == "malformed request");
        REQUIRE(parse_error({{"action", "stop-capture"}}) == "malformed request");
        REQUIRE(parse_error({{"cmd", "fast-forward"}}) == "unknown command: fast-forward");
    }
}

TEST_CASE("protocol responses", "[protocol]") {
    SECTION("Ok") {
        REQUIRE(protocol::ok() == json{{"success", true}});
        auto r = protocol::ok({{"hasData", false}});
        REQUIRE(r["success"] == true);
        REQUIRE(r["hasData"] == false);
    }

    SECTION("Error") {
        auto r = protocol::error("Recording not found");
        REQUIRE(r["success"] == false);
        REQUIRE(r["error"] == "Recording not found");
    }

    SECTION("BytesToJson") {
        std::vector<uint8_t> bytes = {0, 1, 255};
        REQUIRE(protocol::bytes_to_json(bytes) == json::array({0, 1, 255}));
        REQUIRE(protocol::bytes_to_json({}).empty());
    }
}
