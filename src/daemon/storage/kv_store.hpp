#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <sqlite3.h>
#include <string>

enum class StoreErrorKind { QuotaExceeded, Io };

struct StoreError {
    StoreErrorKind kind;
    std::string message;
};

// Process-wide key-value area with a byte quota shared by all keys.
// Values are stored as CBOR so binary payloads stay compact.
class KeyValueStore {
public:
    static constexpr size_t default_quota_bytes = 10 * 1024 * 1024;

    explicit KeyValueStore(size_t quota_bytes = default_quota_bytes);
    ~KeyValueStore();

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    // Accepts ":memory:" for a private in-memory database.
    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::expected<void, StoreError> put(const std::string& key, const nlohmann::json& value);

    // Writes every member of `entries` (a JSON object) in one transaction.
    // Either all are written or none; a quota failure leaves old values.
    std::expected<void, StoreError> put_all(const nlohmann::json& entries);

    std::optional<nlohmann::json> get(const std::string& key);

    // Removing absent keys is not an error.
    bool remove(std::span<const std::string> keys);

    // Bytes charged against the quota: key length plus encoded value length.
    size_t total_bytes();
    size_t quota() const { return quota_bytes_; }

private:
    bool create_tables();
    bool exec(const char* sql);

    size_t quota_bytes_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* put_stmt_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
    sqlite3_stmt* usage_stmt_ = nullptr;
};
