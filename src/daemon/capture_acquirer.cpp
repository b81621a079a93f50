#include "capture_acquirer.hpp"

#include <print>

CaptureAcquirer::CaptureAcquirer(CaptureHost& host, Scheduler& scheduler, ChunkStore& store,
                                 Options opts)
    : host_(host), scheduler_(scheduler), store_(store), opts_(opts) {}

bool CaptureAcquirer::is_conflict(const std::string& host_error) {
    return host_error.find("active stream") != std::string::npos;
}

void CaptureAcquirer::acquire(uint32_t surface_id, Callback cb) {
    scheduler_.schedule(opts_.initial_grace, [this, surface_id, cb = std::move(cb)]() mutable {
        request(surface_id, false, std::move(cb));
    });
}

void CaptureAcquirer::request(uint32_t surface_id, bool is_retry, Callback cb) {
    host_.request_stream_token(
        surface_id,
        [this, surface_id, is_retry, cb = std::move(cb)](
            std::expected<std::string, std::string> token) mutable {
            on_token(surface_id, is_retry, std::move(cb), std::move(token));
        });
}

void CaptureAcquirer::on_token(uint32_t surface_id, bool is_retry, Callback cb,
                               std::expected<std::string, std::string> token) {
    if (!token) {
        if (is_conflict(token.error())) {
            if (!is_retry) {
                std::println(stderr, "acquirer: surface {} still has an active stream, retrying in {}ms",
                             surface_id, opts_.conflict_grace.count());
                scheduler_.schedule(opts_.conflict_grace,
                                    [this, surface_id, cb = std::move(cb)]() mutable {
                                        request(surface_id, true, std::move(cb));
                                    });
                return;
            }
            cb(std::unexpected(CaptureError{CaptureErrorKind::StreamConflict, token.error()}));
            return;
        }
        cb(std::unexpected(CaptureError{CaptureErrorKind::NoStreamAvailable, token.error()}));
        return;
    }

    if (token->empty()) {
        cb(std::unexpected(CaptureError{CaptureErrorKind::NoStreamAvailable,
                                        "Failed to get media stream ID"}));
        return;
    }

    CaptureHandle handle{
        .surface_id = surface_id,
        .stream_token = *token,
        .acquired_at = std::chrono::system_clock::now(),
        .title = {},
    };
    for (auto& s : host_.surfaces()) {
        if (s.id == surface_id) {
            handle.title = s.title;
            break;
        }
    }

    // The token is handed to a later step, possibly on another connection.
    if (auto r = store_.put_stream_grant(handle.stream_token, surface_id); !r) {
        std::println(stderr, "acquirer: could not persist stream grant: {}", r.error().message);
    }

    cb(std::move(handle));
}
