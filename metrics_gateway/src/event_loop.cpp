#include "event_loop.hpp"
#include <spdlog/spdlog.h>

EventLoop::EventLoop() : next_timer_id_(1), running_(false) {}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::start() {
    if (running_) {
        spdlog::warn("Event loop already running");
        return;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        run();
    });
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wakeup_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!tasks_.empty() || !timers_.empty()) {
        spdlog::debug("Event loop stopped with {} tasks and {} timers pending",
                      tasks_.size(), timers_.size());
    }
    tasks_.clear();
    timers_.clear();
    armed_.clear();
}

bool EventLoop::is_running() const {
    return running_;
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    wakeup_.notify_one();
}

EventLoop::TimerId EventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(TimerKey{Clock::now() + delay, id}, std::move(task));
        armed_.insert(id);
    }
    wakeup_.notify_one();
    return id;
}

bool EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_.erase(id) == 0) {
        return false;
    }

    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.id == id) {
            timers_.erase(it);
            break;
        }
    }
    return true;
}

bool EventLoop::in_loop_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void EventLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        // Move expired timers behind the tasks already queued
        auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first.deadline <= now) {
            auto node = timers_.extract(timers_.begin());
            armed_.erase(node.key().id);
            tasks_.push_back(std::move(node.mapped()));
        }

        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();

            lock.unlock();
            run_task(task);
            lock.lock();
            continue;
        }

        if (timers_.empty()) {
            wakeup_.wait(lock);
        } else {
            wakeup_.wait_until(lock, timers_.begin()->first.deadline);
        }
    }
}

void EventLoop::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Event loop task failed: {}", e.what());
    }
}
