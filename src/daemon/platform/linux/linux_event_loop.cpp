#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      capture_host_(*this, config_.audio.ring_buffer_seconds),
      core_(config_, verbose_, *this, capture_host_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

bool LinuxEventLoop::init() {
    // Wakeup for tasks posted from other threads
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (!capture_host_.init()) {
        std::println(stderr, "PipeWire is not available");
        return false;
    }
    log("PipeWire connected");

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (state store, library, recovery)
    if (!core_.init()) return false;

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(wake_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        run_posted();
        run_due_timers();

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == wake_fd_) {
                uint64_t val;
                if (::read(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
                        ipc_server_.close_client(client_fd);
                        continue;
                    }
                    client_serials_[client_fd] = next_serial_++;
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown: the recording stays persisted for the next start.
    core_.shutdown();
    for (int i = 0; i < 8; ++i) {
        {
            std::lock_guard lock(posted_mutex_);
            if (posted_.empty()) break;
        }
        run_posted();
    }
}

void LinuxEventLoop::post(Task task) {
    {
        std::lock_guard lock(posted_mutex_);
        posted_.push_back(std::move(task));
    }
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    }
}

Scheduler::TimerId LinuxEventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = next_timer_++;
    timers_[id] = Timer{.deadline = Clock::now() + delay, .task = std::move(task)};
    return id;
}

void LinuxEventLoop::cancel(TimerId id) {
    timers_.erase(id);
}

int LinuxEventLoop::next_timeout_ms() const {
    if (timers_.empty()) return -1;

    auto earliest = std::ranges::min_element(timers_, {}, [](const auto& t) {
        return t.second.deadline;
    })->second.deadline;
    auto now = Clock::now();
    if (earliest <= now) return 0;
    return static_cast<int>(
        std::chrono::ceil<std::chrono::milliseconds>(earliest - now).count());
}

void LinuxEventLoop::run_due_timers() {
    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (auto& [id, t] : timers_) {
        if (t.deadline <= now) due.emplace_back(t.deadline, id);
    }
    std::ranges::sort(due);

    for (auto& [deadline, id] : due) {
        // An earlier timer may have cancelled this one.
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        auto task = std::move(it->second.task);
        timers_.erase(it);
        task();
    }
}

void LinuxEventLoop::run_posted() {
    std::vector<Task> tasks;
    {
        std::lock_guard lock(posted_mutex_);
        tasks.swap(posted_);
    }
    for (auto& task : tasks) {
        task();
    }
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        core_.handle_command(cmd, make_reply(fd));
    }

    if (!open) drop_client(fd);
}

DaemonCore::Reply LinuxEventLoop::make_reply(int fd) {
    // Serials start at 1, so 0 never matches a live connection.
    auto found = client_serials_.find(fd);
    uint64_t serial = found != client_serials_.end() ? found->second : 0;
    return [this, fd, serial](nlohmann::json response) {
        auto it = client_serials_.find(fd);
        if (it == client_serials_.end() || it->second != serial) {
            log("Client disconnected before its reply was ready");
            return;
        }
        if (!ipc_server_.send_response(fd, response)) {
            drop_client(fd);
        }
    };
}

void LinuxEventLoop::drop_client(int fd) {
    if (client_serials_.erase(fd) == 0) return;
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tapedeck] {}", msg);
    }
}
