#include "kv_store.hpp"

#include <filesystem>
#include <format>
#include <print>
#include <vector>

namespace fs = std::filesystem;

KeyValueStore::KeyValueStore(size_t quota_bytes) : quota_bytes_(quota_bytes) {}

KeyValueStore::~KeyValueStore() {
    close();
}

bool KeyValueStore::open(const std::string& path) {
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

    // WAL keeps readers from ever seeing a half-written snapshot.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* put_sql = "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)";
    const char* get_sql = "SELECT value FROM kv WHERE key = ?";
    const char* remove_sql = "DELETE FROM kv WHERE key = ?";
    const char* usage_sql = "SELECT COALESCE(SUM(length(key) + length(value)), 0) FROM kv";

    struct { const char* sql; sqlite3_stmt** stmt; } stmts[] = {
        {put_sql, &put_stmt_},
        {get_sql, &get_stmt_},
        {remove_sql, &remove_stmt_},
        {usage_sql, &usage_stmt_},
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

void KeyValueStore::close() {
    for (auto* stmt : {&put_stmt_, &get_stmt_, &remove_stmt_, &usage_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::expected<void, StoreError> KeyValueStore::put(const std::string& key,
                                                   const nlohmann::json& value) {
    return put_all(nlohmann::json{{key, value}});
}

std::expected<void, StoreError> KeyValueStore::put_all(const nlohmann::json& entries) {
    if (!db_) return std::unexpected(StoreError{StoreErrorKind::Io, "store not open"});
    if (!entries.is_object()) {
        return std::unexpected(StoreError{StoreErrorKind::Io, "entries must be an object"});
    }

    struct Encoded {
        std::string key;
        std::vector<uint8_t> value;
    };
    std::vector<Encoded> encoded;
    for (auto& [key, value] : entries.items()) {
        encoded.push_back({key, nlohmann::json::to_cbor(value)});
    }

    if (!exec("BEGIN IMMEDIATE")) {
        return std::unexpected(StoreError{StoreErrorKind::Io, sqlite3_errmsg(db_)});
    }

    // Charge the new values against the quota as if the old ones were gone.
    size_t replaced = 0;
    size_t incoming = 0;
    for (auto& e : encoded) {
        incoming += e.key.size() + e.value.size();
        sqlite3_reset(get_stmt_);
        sqlite3_bind_text(get_stmt_, 1, e.key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(get_stmt_) == SQLITE_ROW) {
            replaced += e.key.size() + static_cast<size_t>(sqlite3_column_bytes(get_stmt_, 0));
        }
    }
    sqlite3_reset(get_stmt_);

    size_t used = total_bytes();
    if (used - replaced + incoming > quota_bytes_) {
        exec("ROLLBACK");
        return std::unexpected(StoreError{
            StoreErrorKind::QuotaExceeded,
            std::format("quota exceeded: {} bytes needed, {} allowed",
                        used - replaced + incoming, quota_bytes_)});
    }

    for (auto& e : encoded) {
        sqlite3_reset(put_stmt_);
        sqlite3_bind_text(put_stmt_, 1, e.key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(put_stmt_, 2, e.value.data(), static_cast<int>(e.value.size()),
                          SQLITE_TRANSIENT);
        if (sqlite3_step(put_stmt_) != SQLITE_DONE) {
            std::string msg = sqlite3_errmsg(db_);
            std::println(stderr, "db: put {} failed: {}", e.key, msg);
            sqlite3_reset(put_stmt_);
            exec("ROLLBACK");
            return std::unexpected(StoreError{StoreErrorKind::Io, msg});
        }
    }
    sqlite3_reset(put_stmt_);

    if (!exec("COMMIT")) {
        std::string msg = sqlite3_errmsg(db_);
        exec("ROLLBACK");
        return std::unexpected(StoreError{StoreErrorKind::Io, msg});
    }
    return {};
}

std::optional<nlohmann::json> KeyValueStore::get(const std::string& key) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_text(get_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(get_stmt_) != SQLITE_ROW) {
        sqlite3_reset(get_stmt_);
        return std::nullopt;
    }

    auto* p = static_cast<const uint8_t*>(sqlite3_column_blob(get_stmt_, 0));
    int n = sqlite3_column_bytes(get_stmt_, 0);
    std::vector<uint8_t> bytes(p, p + n);
    sqlite3_reset(get_stmt_);

    auto value = nlohmann::json::from_cbor(bytes, true, false);
    if (value.is_discarded()) {
        std::println(stderr, "db: value for {} is corrupt, ignoring", key);
        return std::nullopt;
    }
    return value;
}

bool KeyValueStore::remove(std::span<const std::string> keys) {
    if (!db_) return false;
    if (!exec("BEGIN IMMEDIATE")) return false;

    for (auto& key : keys) {
        sqlite3_reset(remove_stmt_);
        sqlite3_bind_text(remove_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(remove_stmt_) != SQLITE_DONE) {
            std::println(stderr, "db: remove {} failed: {}", key, sqlite3_errmsg(db_));
            sqlite3_reset(remove_stmt_);
            exec("ROLLBACK");
            return false;
        }
    }
    sqlite3_reset(remove_stmt_);
    return exec("COMMIT");
}

size_t KeyValueStore::total_bytes() {
    if (!usage_stmt_) return 0;
    sqlite3_reset(usage_stmt_);
    size_t used = 0;
    if (sqlite3_step(usage_stmt_) == SQLITE_ROW) {
        used = static_cast<size_t>(sqlite3_column_int64(usage_stmt_, 0));
    }
    sqlite3_reset(usage_stmt_);
    return used;
}

bool KeyValueStore::create_tables() {
    return exec(R"(
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value BLOB NOT NULL
        );
    )");
}

bool KeyValueStore::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: {} failed: {}", sql, err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
