#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SavedRecording {
    int64_t id = 0;
    std::string name;
    std::string timestamp;
    double duration = 0.0;
    std::string format;
    std::string channel_mode;
    std::string mime_type;
    size_t size_bytes = 0;
};

struct LibraryUsage {
    size_t count = 0;
    size_t audio_bytes = 0;
};

// Archive of finished recordings, newest first.
class RecordingLibrary {
public:
    RecordingLibrary();
    ~RecordingLibrary();

    RecordingLibrary(const RecordingLibrary&) = delete;
    RecordingLibrary& operator=(const RecordingLibrary&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Returns the new row id. id, timestamp and size_bytes of `meta` are ignored.
    std::optional<int64_t> insert(const SavedRecording& meta, std::span<const uint8_t> audio);

    std::vector<SavedRecording> recent(int limit = 20);

    std::optional<SavedRecording> get(int64_t id);
    std::optional<std::vector<uint8_t>> audio(int64_t id);

    // False when no such recording exists.
    bool remove(int64_t id);
    bool rename(int64_t id, const std::string& name);

    // Deletes every recording. Returns how many were removed.
    std::optional<size_t> clear();
    std::optional<LibraryUsage> usage();

private:
    bool create_tables();
    SavedRecording read_row(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* audio_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
    sqlite3_stmt* rename_stmt_ = nullptr;
    sqlite3_stmt* clear_stmt_ = nullptr;
    sqlite3_stmt* usage_stmt_ = nullptr;
};
