#pragma once

#include "platform/capture_host.hpp"
#include "platform/scheduler.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Scheduler with virtual time. Nothing runs until the test drives it.
class ManualScheduler : public Scheduler {
public:
    void post(Task task) override { posted_.push_back(std::move(task)); }

    TimerId schedule(std::chrono::milliseconds delay, Task task) override {
        TimerId id = next_id_++;
        timers_[id] = {now_ + delay, std::move(task)};
        return id;
    }

    void cancel(TimerId id) override { timers_.erase(id); }

    // Runs posted tasks, including ones they post, until none are left.
    void run_posted() {
        while (!posted_.empty()) {
            auto task = std::move(posted_.front());
            posted_.pop_front();
            task();
        }
    }

    // Moves virtual time forward, firing timers in deadline order.
    void advance(std::chrono::milliseconds d) {
        auto target = now_ + d;
        while (true) {
            run_posted();
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline <= target &&
                    (next == timers_.end() || it->second.deadline < next->second.deadline)) {
                    next = it;
                }
            }
            if (next == timers_.end()) break;
            now_ = next->second.deadline;
            auto task = std::move(next->second.task);
            timers_.erase(next);
            task();
        }
        now_ = target;
        run_posted();
    }

    std::chrono::milliseconds now() const { return now_; }
    size_t pending_timers() const { return timers_.size(); }
    size_t pending_posts() const { return posted_.size(); }

private:
    struct Timer {
        std::chrono::milliseconds deadline;
        Task task;
    };

    std::chrono::milliseconds now_{0};
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
};

class FakeCaptureHost;

// Hands out data only when the test says so.
class FakeRecorder : public ChunkedRecorder {
public:
    FakeRecorder(FakeCaptureHost& host, Scheduler& scheduler);
    ~FakeRecorder() override;

    bool start(std::chrono::milliseconds timeslice, RecorderEvents events) override {
        if (fail_start) return false;
        timeslice_ = timeslice;
        events_ = std::move(events);
        recording_ = true;
        return true;
    }

    // Delivers whatever was buffered with buffer().
    void request_data() override {
        ++request_calls;
        flush();
    }

    void stop() override {
        ++stop_calls;
        recording_ = false;
        if (!auto_ack) return;
        scheduler_.post([this]() { ack(); });
    }

    bool is_recording() const override { return recording_; }

    // Test side
    void emit(Chunk c) { events_.on_data(std::move(c)); }
    void fail(const std::string& msg) { events_.on_error(msg); }
    void buffer(Chunk c) { buffered_.push_back(std::move(c)); }
    void ack() {
        flush();
        if (events_.on_stop) events_.on_stop();
    }
    std::chrono::milliseconds timeslice() const { return timeslice_; }

    bool fail_start = false;
    bool auto_ack = true;
    int request_calls = 0;
    int stop_calls = 0;

private:
    void flush() {
        auto pending = std::move(buffered_);
        buffered_.clear();
        for (auto& c : pending) events_.on_data(std::move(c));
    }

    FakeCaptureHost& host_;
    Scheduler& scheduler_;
    RecorderEvents events_;
    std::vector<Chunk> buffered_;
    std::chrono::milliseconds timeslice_{0};
    bool recording_ = false;
};

class FakeCaptureStream : public CaptureStream {
public:
    FakeCaptureStream(FakeCaptureHost& host, uint32_t surface_id, CaptureFormat format)
        : host_(host), surface_id_(surface_id), format_(format) {}

    uint32_t surface_id() const override { return surface_id_; }
    const CaptureFormat& format() const override { return format_; }
    std::unique_ptr<ChunkedRecorder> create_recorder() override;
    std::expected<void, std::string> stop_tracks() override;
    std::expected<void, std::string> release_graph() override;

private:
    FakeCaptureHost& host_;
    uint32_t surface_id_;
    CaptureFormat format_;
};

class FakeCaptureHost : public CaptureHost {
public:
    explicit FakeCaptureHost(Scheduler& scheduler) : scheduler_(scheduler) {}

    std::vector<Surface> surfaces() override { return surface_list; }
    std::optional<Surface> active_surface() override { return active; }

    // Replies on a later scheduler turn, from token_replies or "token-N".
    void request_stream_token(uint32_t surface_id, TokenCallback cb) override {
        ++token_requests;
        requested_surfaces.push_back(surface_id);
        std::expected<std::string, std::string> reply =
            "token-" + std::to_string(token_requests);
        if (!token_replies.empty()) {
            reply = token_replies.front();
            token_replies.pop_front();
        }
        if (reply) grants[*reply] = surface_id;
        scheduler_.post([cb = std::move(cb), reply]() { cb(reply); });
    }

    std::expected<std::unique_ptr<CaptureStream>, std::string>
    open_stream(const std::string& token, const CaptureFormat& format) override {
        ++open_calls;
        opened_format = format;
        if (open_error) return std::unexpected(*open_error);
        uint32_t surface = grants.contains(token) ? grants[token] : 0;
        return std::unique_ptr<CaptureStream>(
            std::make_unique<FakeCaptureStream>(*this, surface, format));
    }

    Scheduler& scheduler() { return scheduler_; }

    std::vector<Surface> surface_list;
    std::optional<Surface> active;
    std::deque<std::expected<std::string, std::string>> token_replies;
    std::map<std::string, uint32_t> grants;
    std::optional<std::string> open_error;
    std::optional<std::string> release_error;
    bool fail_recorder_start = false;

    int token_requests = 0;
    std::vector<uint32_t> requested_surfaces;
    int open_calls = 0;
    std::optional<CaptureFormat> opened_format;
    int track_stops = 0;
    int graph_releases = 0;
    int recorders_alive = 0;
    FakeRecorder* recorder = nullptr; // most recent, null once destroyed

private:
    Scheduler& scheduler_;
};

inline FakeRecorder::FakeRecorder(FakeCaptureHost& host, Scheduler& scheduler)
    : host_(host), scheduler_(scheduler) {
    ++host_.recorders_alive;
    host_.recorder = this;
}

inline FakeRecorder::~FakeRecorder() {
    --host_.recorders_alive;
    if (host_.recorder == this) host_.recorder = nullptr;
}

inline std::unique_ptr<ChunkedRecorder> FakeCaptureStream::create_recorder() {
    auto rec = std::make_unique<FakeRecorder>(host_, host_.scheduler());
    rec->fail_start = host_.fail_recorder_start;
    return rec;
}

inline std::expected<void, std::string> FakeCaptureStream::stop_tracks() {
    ++host_.track_stops;
    return {};
}

inline std::expected<void, std::string> FakeCaptureStream::release_graph() {
    ++host_.graph_releases;
    if (host_.release_error) return std::unexpected(*host_.release_error);
    return {};
}

// Mono 16-bit PCM with a recognizable ramp.
inline Chunk pcm_chunk(size_t bytes, uint8_t seed = 0) {
    Chunk c(bytes);
    for (size_t i = 0; i < bytes; ++i) c[i] = static_cast<uint8_t>(seed + i);
    return c;
}
