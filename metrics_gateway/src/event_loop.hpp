#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_set>

// Single-threaded cooperative scheduler. Posted tasks and expired timers run
// one at a time on the loop thread, so state touched only from loop tasks
// needs no locking.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void start();
    void stop();
    bool is_running() const;

    // Runs task on the next tick.
    void post(Task task);

    TimerId schedule_after(std::chrono::milliseconds delay, Task task);

    // Returns false when the timer already fired or was cancelled.
    bool cancel(TimerId id);

    bool in_loop_thread() const;

private:
    struct TimerKey {
        Clock::time_point deadline;
        TimerId id;

        bool operator<(const TimerKey& other) const {
            if (deadline != other.deadline) return deadline < other.deadline;
            return id < other.id;
        }
    };

    void run();
    void run_task(const Task& task);

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> tasks_;
    std::map<TimerKey, Task> timers_;
    std::unordered_set<TimerId> armed_;
    TimerId next_timer_id_;
    std::atomic<bool> running_;
    std::thread thread_;
};
