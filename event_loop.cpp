#include "event_loop.hpp"
#include "logger.hpp"

#include <algorithm>
#include <exception>

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = nextTimerId_++;
        timers_.push_back({id, Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(timers_.begin(), timers_.end(),
                           [id](const Timer& t) { return t.id == id; });
    if (it != timers_.end()) {
        timers_.erase(it);
        return true;
    }
    // Already taken by the running pass; it checks claimTimer() first
    return takenTimers_.erase(id) > 0;
}

bool EventLoop::isLoopThread() const {
    return running_ && std::this_thread::get_id() == workerId_.load();
}

size_t EventLoop::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
}

size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return timers_.size();
}

// Caller must not hold mtx_.
std::vector<EventLoop::Ready> EventLoop::takeReady(Clock::time_point now) {
    std::vector<Ready> ready;
    std::lock_guard<std::mutex> lock(mtx_);

    while (!tasks_.empty()) {
        ready.push_back({0, std::move(tasks_.front())});
        tasks_.pop_front();
    }

    // Due timers in due order
    std::stable_sort(timers_.begin(), timers_.end(),
                     [](const Timer& a, const Timer& b) { return a.due < b.due; });
    auto firstNotDue = std::find_if(timers_.begin(), timers_.end(),
                                    [now](const Timer& t) { return t.due > now; });
    for (auto it = timers_.begin(); it != firstNotDue; ++it) {
        takenTimers_.insert(it->id);
        ready.push_back({it->id, std::move(it->task)});
    }
    timers_.erase(timers_.begin(), firstNotDue);
    return ready;
}

// False when an earlier task of the same pass cancelled the timer.
bool EventLoop::claimTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return takenTimers_.erase(id) > 0;
}

size_t EventLoop::runPending() {
    auto ready = takeReady(Clock::now());
    size_t ran = 0;
    for (auto& item : ready) {
        if (item.timerId != 0 && !claimTimer(item.timerId)) continue;
        ran++;
        try {
            item.task();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", std::string("Task threw: ") + e.what());
        }
    }
    return ran;
}

size_t EventLoop::runUntilIdle() {
    size_t total = 0;
    for (size_t n = runPending(); n > 0; n = runPending()) {
        total += n;
    }
    return total;
}

void EventLoop::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&EventLoop::threadMain, this);
    LOG_DEBUG("EventLoop", "Worker started");
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        tasks_.clear();
        timers_.clear();
        takenTimers_.clear();
    }
    workerId_.store(std::thread::id{});
    LOG_DEBUG("EventLoop", "Worker stopped");
}

void EventLoop::threadMain() {
    // Published before the first task can ask isLoopThread()
    workerId_.store(std::this_thread::get_id());

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            if (tasks_.empty()) {
                if (timers_.empty()) {
                    cv_.wait(lock, [this] { return !running_ || !tasks_.empty() || !timers_.empty(); });
                } else {
                    auto next = std::min_element(timers_.begin(), timers_.end(),
                                                 [](const Timer& a, const Timer& b) { return a.due < b.due; })->due;
                    // Any notify re-evaluates: a newer timer may be due sooner.
                    cv_.wait_until(lock, next);
                }
            }
        }
        if (!running_) break;
        runPending();
    }
}
