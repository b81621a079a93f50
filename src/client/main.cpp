#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Exit codes: 1 for usage and daemon errors, 2 when no response arrived.
constexpr int exit_error = 1;
constexpr int exit_no_response = 2;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--surface ID]        Record an application's audio output");
    std::println(stderr, "  stop [-o FILE]              Stop and collect the recording");
    std::println(stderr, "  status                      Show recording state");
    std::println(stderr, "  data [-o FILE]              Fetch the recording so far without stopping");
    std::println(stderr, "  clear                       Discard the current recording");
    std::println(stderr, "  push FILE                   Append raw s16le PCM as a chunk");
    std::println(stderr, "  surfaces                    List capturable audio streams");
    std::println(stderr, "  prefs [key=value ...]       Show or change recording preferences");
    std::println(stderr, "  list [--limit N]            List saved recordings");
    std::println(stderr, "  get ID -o FILE              Export a saved recording");
    std::println(stderr, "  delete ID                   Delete a saved recording");
    std::println(stderr, "  rename ID NAME              Rename a saved recording");
    std::println(stderr, "  clear-library               Delete every saved recording");
    std::println(stderr, "  usage                       Show storage usage");
}

std::optional<int64_t> parse_id(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

// "true"/"false" become booleans, integers become numbers, anything else a string.
json parse_pref_value(const std::string& s) {
    if (s == "true") return true;
    if (s == "false") return false;
    if (auto n = parse_id(s)) return *n;
    return s;
}

bool write_bytes(const std::string& path, const json& arr) {
    std::vector<char> bytes;
    bytes.reserve(arr.size());
    for (auto& b : arr) bytes.push_back(static_cast<char>(b.get<uint8_t>()));

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "Cannot write {}", path);
        return false;
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return f.good();
}

std::optional<json> read_chunk(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(f)),
                                     std::istreambuf_iterator<char>());
    json arr = json::array();
    for (auto b : bytes) arr.push_back(b);
    return arr;
}

class DaemonConnection {
public:
    explicit DaemonConnection(std::string endpoint) : endpoint_(std::move(endpoint)) {}

    bool connect() {
        if (client_.connect(endpoint_)) return true;
        std::println(stderr, "Failed to connect to daemon at {}", endpoint_);
        std::println(stderr, "Is tapedeckd running?");
        return false;
    }

    // Sends one request. On failure prints the reason and sets exit_code.
    std::optional<json> request(const json& cmd, int& exit_code, int timeout_ms = 30000) {
        if (!client_.send(cmd)) {
            std::println(stderr, "Failed to send command");
            exit_code = exit_no_response;
            return std::nullopt;
        }

        json response;
        switch (client_.recv(response, timeout_ms)) {
            case RecvStatus::Ok:
                break;
            case RecvStatus::Timeout:
                std::println(stderr, "No response from daemon (timeout)");
                exit_code = exit_no_response;
                return std::nullopt;
            case RecvStatus::Disconnected:
                std::println(stderr, "Daemon closed the connection without responding");
                exit_code = exit_no_response;
                return std::nullopt;
            case RecvStatus::Malformed:
                std::println(stderr, "Malformed response from daemon");
                exit_code = exit_no_response;
                return std::nullopt;
        }

        if (!response.value("success", false)) {
            std::println(stderr, "Error: {}", response.value("error", "unknown error"));
            exit_code = exit_error;
            return std::nullopt;
        }
        return response;
    }

private:
    std::string endpoint_;
    UnixSocketClient client_;
};

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return exit_error;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string output_path;
    std::optional<uint32_t> surface;
    int limit = 20;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--surface" && i + 1 < argc) {
            auto id = parse_id(argv[++i]);
            if (!id || *id < 0 || *id > std::numeric_limits<uint32_t>::max()) {
                std::println(stderr, "Invalid surface id");
                return exit_error;
            }
            surface = static_cast<uint32_t>(*id);
        } else if (arg == "--limit" && i + 1 < argc) {
            auto n = parse_id(argv[++i]);
            if (!n || *n <= 0 || *n > std::numeric_limits<int>::max()) {
                std::println(stderr, "Invalid limit");
                return exit_error;
            }
            limit = static_cast<int>(*n);
        } else {
            positional.push_back(arg);
        }
    }

    DaemonConnection daemon(platform::ipc_endpoint());
    int rc = 0;

    auto need_id = [&]() -> std::optional<int64_t> {
        if (positional.empty()) {
            std::println(stderr, "{} needs a recording id", command);
            return std::nullopt;
        }
        auto id = parse_id(positional[0]);
        if (!id) std::println(stderr, "Invalid recording id: {}", positional[0]);
        return id;
    };

    if (command == "start") {
        if (!daemon.connect()) return exit_error;
        json cmd = {{"cmd", "start-capture"}};
        if (surface) cmd["surfaceId"] = *surface;
        auto granted = daemon.request(cmd, rc);
        if (!granted) return rc;

        auto token = (*granted)["streamToken"].get<std::string>();
        auto started = daemon.request(
            {{"cmd", "start-recording-with-stream"}, {"streamToken", token}}, rc);
        if (!started) return rc;
        std::println("Recording surface {}", (*granted)["surfaceId"].get<uint32_t>());

    } else if (command == "stop") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "stop-capture"}}, rc, 120000);
        if (!resp) return rc;

        if (!resp->value("hasData", false)) {
            std::println("Stopped, nothing was recorded");
            return 0;
        }
        std::println("Stopped: {:.1f}s {} ({} bytes)", resp->value("durationS", 0.0),
                     resp->value("format", ""), (*resp)["audioBytes"].size());
        if (resp->value("fallbackApplied", false)) {
            std::println("Note: {} is not available, saved as {}",
                         resp->value("requestedFormat", ""), resp->value("format", ""));
        }
        if (resp->contains("recordingId")) {
            std::println("Saved to library as #{}", (*resp)["recordingId"].get<int64_t>());
        }
        if (!output_path.empty()) {
            if (!write_bytes(output_path, (*resp)["audioBytes"])) return exit_error;
            std::println("Wrote {}", output_path);
        }

    } else if (command == "status") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "get-recording-state"}}, rc);
        if (!resp) return rc;

        std::println("State: {}", resp->value("state", "unknown"));
        if (resp->contains("durationS")) {
            std::println("Recording duration: {:.1f}s", (*resp)["durationS"].get<double>());
        }
        std::println("Recording held: {}", resp->value("hasRecording", false) ? "yes" : "no");
        if (resp->contains("storageWarning")) {
            std::println("Warning: {}", (*resp)["storageWarning"].get<std::string>());
        }

    } else if (command == "data") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "get-recording-data"}}, rc, 120000);
        if (!resp) return rc;

        if (!resp->value("hasData", false)) {
            std::println("No recording data");
            return 0;
        }
        std::println("{} bytes of {}", (*resp)["audioBytes"].size(), resp->value("mimeType", ""));
        if (!output_path.empty()) {
            if (!write_bytes(output_path, (*resp)["audioBytes"])) return exit_error;
            std::println("Wrote {}", output_path);
        }

    } else if (command == "clear") {
        if (!daemon.connect()) return exit_error;
        if (!daemon.request({{"cmd", "clear-recording"}}, rc)) return rc;
        std::println("Cleared");

    } else if (command == "push") {
        if (positional.empty()) {
            std::println(stderr, "push needs a file");
            return exit_error;
        }
        auto chunk = read_chunk(positional[0]);
        if (!chunk) {
            std::println(stderr, "Cannot read {}", positional[0]);
            return exit_error;
        }
        if (!daemon.connect()) return exit_error;
        if (!daemon.request({{"cmd", "add-recording-chunk"}, {"chunk", *chunk}}, rc)) return rc;
        std::println("Added {} bytes", chunk->size());

    } else if (command == "surfaces") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "list-surfaces"}}, rc);
        if (!resp) return rc;

        for (auto& s : (*resp)["surfaces"]) {
            std::println("{:>6}  {}  [{}]", s.value("id", 0u), s.value("title", ""),
                         s.value("app", ""));
        }

    } else if (command == "prefs") {
        if (!daemon.connect()) return exit_error;
        json cmd = {{"cmd", "get-preferences"}};
        if (!positional.empty()) {
            json patch = json::object();
            for (auto& kv : positional) {
                auto eq = kv.find('=');
                if (eq == std::string::npos) {
                    std::println(stderr, "Expected key=value, got {}", kv);
                    return exit_error;
                }
                patch[kv.substr(0, eq)] = parse_pref_value(kv.substr(eq + 1));
            }
            cmd = {{"cmd", "set-preferences"}, {"preferences", patch}};
        }
        auto resp = daemon.request(cmd, rc);
        if (!resp) return rc;

        for (auto& [key, value] : (*resp)["preferences"].items()) {
            std::println("{} = {}", key, value.dump());
        }

    } else if (command == "list") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "list-recordings"}, {"limit", limit}}, rc);
        if (!resp) return rc;

        for (auto& r : (*resp)["recordings"]) {
            std::println("#{} [{}] {} ({:.1f}s, {}, {} bytes)", r.value("id", 0),
                         r.value("timestamp", ""), r.value("name", ""),
                         r.value("duration", 0.0), r.value("channelMode", ""),
                         r.value("sizeBytes", 0));
        }

    } else if (command == "get") {
        auto id = need_id();
        if (!id) return exit_error;
        if (output_path.empty()) {
            std::println(stderr, "get needs -o FILE");
            return exit_error;
        }
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "get-saved-recording"}, {"id", *id}}, rc, 120000);
        if (!resp) return rc;
        if (!write_bytes(output_path, (*resp)["audioBytes"])) return exit_error;
        std::println("Wrote {}", output_path);

    } else if (command == "delete") {
        auto id = need_id();
        if (!id) return exit_error;
        if (!daemon.connect()) return exit_error;
        if (!daemon.request({{"cmd", "delete-saved-recording"}, {"id", *id}}, rc)) return rc;
        std::println("Deleted #{}", *id);

    } else if (command == "rename") {
        auto id = need_id();
        if (!id) return exit_error;
        if (positional.size() < 2) {
            std::println(stderr, "rename needs a new name");
            return exit_error;
        }
        if (!daemon.connect()) return exit_error;
        if (!daemon.request({{"cmd", "rename-recording"}, {"id", *id}, {"name", positional[1]}},
                             rc)) {
            return rc;
        }
        std::println("Renamed #{}", *id);

    } else if (command == "clear-library") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "clear-recordings"}}, rc);
        if (!resp) return rc;
        std::println("Deleted {} recordings", resp->value("removed", 0));

    } else if (command == "usage") {
        if (!daemon.connect()) return exit_error;
        auto resp = daemon.request({{"cmd", "get-storage-usage"}}, rc);
        if (!resp) return rc;
        std::println("State store: {} of {} bytes", resp->value("used", 0),
                     resp->value("quota", 0));
        std::println("Library: {} recordings, {} bytes", resp->value("recordingCount", 0),
                     resp->value("libraryBytes", 0));

    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return exit_error;
    }

    return 0;
}
