#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// Single-threaded cooperative task queue. Every continuation in the daemon
// (grace timers, recorder ticks, host replies) runs through one of these.
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~Scheduler() = default;

    // Safe to call from any thread. Tasks run in FIFO order on the loop thread.
    virtual void post(Task task) = 0;

    // Loop thread only.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancel(TimerId id) = 0;
};
