#include "recording_library.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* columns =
    "id, timestamp, name, duration, format, channel_mode, mime_type, length(audio)";

} // namespace

RecordingLibrary::RecordingLibrary() = default;

RecordingLibrary::~RecordingLibrary() {
    close();
}

bool RecordingLibrary::open(const std::string& path) {
    if (path != ":memory:") {
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    std::string recent_sql =
        std::string("SELECT ") + columns + " FROM recordings ORDER BY id DESC LIMIT ?";
    std::string get_sql = std::string("SELECT ") + columns + " FROM recordings WHERE id = ?";

    struct { const char* sql; sqlite3_stmt** stmt; } stmts[] = {
        {"INSERT INTO recordings (name, duration, format, channel_mode, mime_type, audio) "
         "VALUES (?, ?, ?, ?, ?, ?)", &insert_stmt_},
        {recent_sql.c_str(), &recent_stmt_},
        {get_sql.c_str(), &get_stmt_},
        {"SELECT audio FROM recordings WHERE id = ?", &audio_stmt_},
        {"DELETE FROM recordings WHERE id = ?", &remove_stmt_},
        {"UPDATE recordings SET name = ? WHERE id = ?", &rename_stmt_},
        {"DELETE FROM recordings", &clear_stmt_},
        {"SELECT count(*), coalesce(sum(length(audio)), 0) FROM recordings", &usage_stmt_},
    };
    for (auto& s : stmts) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
            close();
            return false;
        }
    }
    return true;
}

void RecordingLibrary::close() {
    for (auto* stmt : {&insert_stmt_, &recent_stmt_, &get_stmt_, &audio_stmt_,
                       &remove_stmt_, &rename_stmt_, &clear_stmt_, &usage_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<int64_t> RecordingLibrary::insert(const SavedRecording& meta,
                                                std::span<const uint8_t> audio) {
    if (!insert_stmt_) return std::nullopt;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, meta.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 2, meta.duration);
    sqlite3_bind_text(insert_stmt_, 3, meta.format.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 4, meta.channel_mode.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 5, meta.mime_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(insert_stmt_, 6, audio.data(), static_cast<int>(audio.size()),
                      SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert recording failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<SavedRecording> RecordingLibrary::recent(int limit) {
    std::vector<SavedRecording> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }
    sqlite3_reset(recent_stmt_);
    return entries;
}

std::optional<SavedRecording> RecordingLibrary::get(int64_t id) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_int64(get_stmt_, 1, id);
    std::optional<SavedRecording> out;
    if (sqlite3_step(get_stmt_) == SQLITE_ROW) {
        out = read_row(get_stmt_);
    }
    sqlite3_reset(get_stmt_);
    return out;
}

std::optional<std::vector<uint8_t>> RecordingLibrary::audio(int64_t id) {
    if (!audio_stmt_) return std::nullopt;

    sqlite3_reset(audio_stmt_);
    sqlite3_bind_int64(audio_stmt_, 1, id);
    std::optional<std::vector<uint8_t>> out;
    if (sqlite3_step(audio_stmt_) == SQLITE_ROW) {
        auto* p = static_cast<const uint8_t*>(sqlite3_column_blob(audio_stmt_, 0));
        int n = sqlite3_column_bytes(audio_stmt_, 0);
        out.emplace();
        if (p && n > 0) out->assign(p, p + n);
    }
    sqlite3_reset(audio_stmt_);
    return out;
}

bool RecordingLibrary::remove(int64_t id) {
    if (!remove_stmt_) return false;

    sqlite3_reset(remove_stmt_);
    sqlite3_bind_int64(remove_stmt_, 1, id);
    int rc = sqlite3_step(remove_stmt_);
    sqlite3_reset(remove_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: delete recording failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool RecordingLibrary::rename(int64_t id, const std::string& name) {
    if (!rename_stmt_) return false;

    sqlite3_reset(rename_stmt_);
    sqlite3_bind_text(rename_stmt_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(rename_stmt_, 2, id);
    int rc = sqlite3_step(rename_stmt_);
    sqlite3_reset(rename_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: rename recording failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

std::optional<size_t> RecordingLibrary::clear() {
    if (!clear_stmt_) return std::nullopt;

    sqlite3_reset(clear_stmt_);
    int rc = sqlite3_step(clear_stmt_);
    sqlite3_reset(clear_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: clear recordings failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

std::optional<LibraryUsage> RecordingLibrary::usage() {
    if (!usage_stmt_) return std::nullopt;

    sqlite3_reset(usage_stmt_);
    std::optional<LibraryUsage> out;
    if (sqlite3_step(usage_stmt_) == SQLITE_ROW) {
        out = LibraryUsage{
            .count = static_cast<size_t>(sqlite3_column_int64(usage_stmt_, 0)),
            .audio_bytes = static_cast<size_t>(sqlite3_column_int64(usage_stmt_, 1)),
        };
    } else {
        std::println(stderr, "db: usage query failed: {}", sqlite3_errmsg(db_));
    }
    sqlite3_reset(usage_stmt_);
    return out;
}

SavedRecording RecordingLibrary::read_row(sqlite3_stmt* stmt) {
    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    SavedRecording r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.timestamp = get_text(stmt, 1);
    r.name = get_text(stmt, 2);
    r.duration = sqlite3_column_double(stmt, 3);
    r.format = get_text(stmt, 4);
    r.channel_mode = get_text(stmt, 5);
    r.mime_type = get_text(stmt, 6);
    r.size_bytes = static_cast<size_t>(sqlite3_column_int64(stmt, 7));
    return r;
}

bool RecordingLibrary::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recordings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            name TEXT NOT NULL,
            duration REAL,
            format TEXT,
            channel_mode TEXT,
            mime_type TEXT,
            audio BLOB NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
