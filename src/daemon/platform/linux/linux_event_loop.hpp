#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/pipewire_host.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

class LinuxEventLoop : public Scheduler {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point deadline;
        Task task;
    };

    int next_timeout_ms() const;
    void run_due_timers();
    void run_posted();
    void handle_client(int fd);
    DaemonCore::Reply make_reply(int fd);
    void drop_client(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Scheduler state (constructed before anything that posts)
    std::mutex posted_mutex_;
    std::vector<Task> posted_;
    int wake_fd_ = -1;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_ = 1;

    // Platform implementations (constructed before core_)
    PipeWireHost capture_host_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    // Replies can outlive a connection; a reused fd gets a new serial.
    std::unordered_map<int, uint64_t> client_serials_;
    uint64_t next_serial_ = 1;

    std::atomic<bool> running_{false};
};
