#pragma once

#include "preferences.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Capture {
        uint32_t initial_grace_ms = 100;
        uint32_t conflict_grace_ms = 500;
        uint32_t chunk_interval_ms = 100;
    } capture;

    struct Audio {
        // Headroom between the PipeWire thread and the next chunk cut.
        uint32_t ring_buffer_seconds = 10;
    } audio;

    struct Storage {
        size_t quota_bytes = 10 * 1024 * 1024;
        // Empty means <data_dir>/state.db and <data_dir>/library.db.
        std::string state_db;
        std::string library_db;
    } storage;

    struct Library {
        bool autosave = true;
    } library;

    // Defaults for anything the preference store does not hold.
    Preferences preferences;

    static Config load(const std::string& path);
    static Config load_default();
};
