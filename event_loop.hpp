#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

/// EventLoop
/// One logical thread of execution. Every task runs to completion
/// before the next starts, so state touched only from loop tasks
/// needs no further locking. Device and transport threads hand work
/// over with post().
///
/// The loop either owns a worker thread (start/stop) or is pumped by
/// the caller with runPending(), which is how the tests drive it.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task (FIFO). Safe from any thread.
    void post(Task task);

    /// Queue a task to run once `delay` has elapsed.
    TimerId postDelayed(std::chrono::milliseconds delay, Task task);

    /// Disarm a delayed task. False if it already ran or was cancelled.
    /// A due timer that has been taken for the current pass but not yet
    /// run is still disarmed.
    bool cancel(TimerId id);

    /// Spawn the worker thread. No-op if already running.
    void start();

    /// Stop and join the worker. Queued work is discarded. Idempotent.
    void stop();

    bool isRunning() const { return running_; }
    bool isLoopThread() const;

    /// Run every queued task and every due timer once, inline.
    size_t runPending();

    /// runPending() until nothing is ready.
    size_t runUntilIdle();

    size_t pendingTasks() const;
    size_t pendingTimers() const;

private:
    struct Timer {
        TimerId id;
        Clock::time_point due;
        Task task;
    };

    // Taken for one pass. timerId is 0 for posted tasks.
    struct Ready {
        TimerId timerId;
        Task task;
    };

    void threadMain();
    std::vector<Ready> takeReady(Clock::time_point now);
    bool claimTimer(TimerId id);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::vector<Timer> timers_;
    std::set<TimerId> takenTimers_;   // due, taken, not yet run
    TimerId nextTimerId_ = 1;

    std::thread worker_;
    std::atomic<std::thread::id> workerId_{};
    std::atomic<bool> running_{false};
};
