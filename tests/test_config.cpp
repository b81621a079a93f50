#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "tapedeck_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        REQUIRE(fd >= 0);
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.capture.initial_grace_ms == 100);
        REQUIRE(cfg.capture.conflict_grace_ms == 500);
        REQUIRE(cfg.capture.chunk_interval_ms == 100);
        REQUIRE(cfg.audio.ring_buffer_seconds == 10);
        REQUIRE(cfg.storage.quota_bytes == 10 * 1024 * 1024);
        REQUIRE(cfg.storage.state_db.empty());
        REQUIRE(cfg.library.autosave);
        REQUIRE(cfg.preferences.format == "wav");
        REQUIRE(cfg.preferences.sample_rate == 44100);
        REQUIRE(cfg.preferences.channel_mode == "stereo");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "capture": { "initial_grace_ms": 50, "conflict_grace_ms": 250, "chunk_interval_ms": 500 },
            "audio": { "ring_buffer_seconds": 4 },
            "storage": { "quota_bytes": 1048576, "state_db": "/var/tmp/s.db", "library_db": "/var/tmp/l.db" },
            "library": { "autosave": false },
            "preferences": { "channelMode": "mono", "sampleRate": "48000", "bitDepth": 24 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.capture.initial_grace_ms == 50);
        REQUIRE(cfg.capture.conflict_grace_ms == 250);
        REQUIRE(cfg.capture.chunk_interval_ms == 500);
        REQUIRE(cfg.audio.ring_buffer_seconds == 4);
        REQUIRE(cfg.storage.quota_bytes == 1048576);
        REQUIRE(cfg.storage.state_db == "/var/tmp/s.db");
        REQUIRE(cfg.storage.library_db == "/var/tmp/l.db");
        REQUIRE_FALSE(cfg.library.autosave);
        REQUIRE(cfg.preferences.channel_mode == "mono");
        REQUIRE(cfg.preferences.sample_rate == 48000);
        REQUIRE(cfg.preferences.bit_depth == 24);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "capture": { "chunk_interval_ms": 250 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.capture.chunk_interval_ms == 250);
        // Other fields retain defaults
        REQUIRE(cfg.capture.initial_grace_ms == 100);
        REQUIRE(cfg.storage.quota_bytes == 10 * 1024 * 1024);
        REQUIRE(cfg.library.autosave);
    }

    SECTION("InvalidPreferencesKeepDefaults") {
        TmpFile f(R"({ "preferences": { "channelMode": "surround", "format": "mp3" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.preferences.channel_mode == "stereo");
        REQUIRE(cfg.preferences.format == "wav");
    }

    SECTION("ZeroChunkIntervalRejected") {
        TmpFile f(R"({ "capture": { "chunk_interval_ms": 0 } })");
        REQUIRE(Config::load(f.path).capture.chunk_interval_ms == 100);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.capture.chunk_interval_ms == 100);
        REQUIRE(cfg.preferences.sample_rate == 44100);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/tapedeck_test_nonexistent_config_file.json");
        REQUIRE(cfg.capture.initial_grace_ms == 100);
    }
}
