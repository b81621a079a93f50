#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("initial_grace_ms")) cfg.capture.initial_grace_ms = c["initial_grace_ms"].get<uint32_t>();
            if (c.contains("conflict_grace_ms")) cfg.capture.conflict_grace_ms = c["conflict_grace_ms"].get<uint32_t>();
            if (c.contains("chunk_interval_ms")) cfg.capture.chunk_interval_ms = c["chunk_interval_ms"].get<uint32_t>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("ring_buffer_seconds")) cfg.audio.ring_buffer_seconds = a["ring_buffer_seconds"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("quota_bytes")) cfg.storage.quota_bytes = s["quota_bytes"].get<size_t>();
            if (s.contains("state_db")) cfg.storage.state_db = s["state_db"].get<std::string>();
            if (s.contains("library_db")) cfg.storage.library_db = s["library_db"].get<std::string>();
        }

        if (j.contains("library")) {
            auto& l = j["library"];
            if (l.contains("autosave")) cfg.library.autosave = l["autosave"].get<bool>();
        }

        if (j.contains("preferences")) {
            auto prefs = Preferences::merge(cfg.preferences, j["preferences"]);
            if (prefs) {
                cfg.preferences = *prefs;
            } else {
                std::println(stderr, "config: {}, keeping default preferences", prefs.error());
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.capture.chunk_interval_ms == 0) {
        std::println(stderr, "config: chunk_interval_ms must be positive, using 100");
        cfg.capture.chunk_interval_ms = 100;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
