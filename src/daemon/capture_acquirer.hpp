#pragma once

#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"
#include "storage/chunk_store.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>

struct CaptureHandle {
    uint32_t surface_id = 0;
    std::string stream_token;
    std::chrono::system_clock::time_point acquired_at;
    std::string title;
};

enum class CaptureErrorKind { StreamConflict, NoStreamAvailable };

struct CaptureError {
    CaptureErrorKind kind;
    std::string message;
};

// Obtains an exclusive stream token for a surface. The host releases the
// previous stream on a surface asynchronously, so the first request waits a
// short grace period, and a conflict is retried exactly once after a longer
// one. Worst case: initial_grace + conflict_grace + two host round trips.
class CaptureAcquirer {
public:
    struct Options {
        std::chrono::milliseconds initial_grace{100};
        std::chrono::milliseconds conflict_grace{500};
    };

    using Callback = std::function<void(std::expected<CaptureHandle, CaptureError>)>;

    CaptureAcquirer(CaptureHost& host, Scheduler& scheduler, ChunkStore& store, Options opts);

    void acquire(uint32_t surface_id, Callback cb);

    static bool is_conflict(const std::string& host_error);

private:
    void request(uint32_t surface_id, bool is_retry, Callback cb);
    void on_token(uint32_t surface_id, bool is_retry, Callback cb,
                  std::expected<std::string, std::string> token);

    CaptureHost& host_;
    Scheduler& scheduler_;
    ChunkStore& store_;
    Options opts_;
};
