#include "event_loop.h"
#include "logger.h"
#include <boost/asio/post.hpp>
#include <algorithm>

// Event loop module logging macros
#define LOG_LOOP_ERROR(message) LOG_ERROR("loop", message)

namespace peerdrop {

EventLoop::EventLoop()
    : work_(boost::asio::make_work_guard(io_)),
      next_timer_id_(1) {
}

EventLoop::~EventLoop() {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        for (auto& entry : timers_) {
            entry.second->cancel();
        }
        timers_.clear();
    }
    work_.reset();
    io_.stop();
}

void EventLoop::post(Task task) {
    boost::asio::post(io_, [this, task = std::move(task)]() {
        run_task(task);
    });
}

EventLoop::TimerId EventLoop::post_delayed(std::chrono::milliseconds delay, Task task) {
    auto timer = std::make_shared<boost::asio::steady_timer>(io_);
    timer->expires_after(delay);

    TimerId id;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        id = next_timer_id_++;
        timers_[id] = timer;
    }

    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        bool still_pending;
        {
            std::lock_guard<std::mutex> lock(timers_mutex_);
            still_pending = timers_.erase(id) > 0;
        }
        if (ec == boost::asio::error::operation_aborted || !still_pending) {
            return;
        }
        run_task(task);
    });

    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    std::shared_ptr<boost::asio::steady_timer> timer;
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            return false;
        }
        timer = it->second;
        timers_.erase(it);
    }
    timer->cancel();
    return true;
}

void EventLoop::run() {
    restart_if_stopped();
    io_.run();
}

void EventLoop::stop() {
    io_.stop();
}

size_t EventLoop::poll() {
    restart_if_stopped();
    return io_.poll();
}

size_t EventLoop::run_for(std::chrono::milliseconds duration) {
    restart_if_stopped();
    return io_.run_for(duration);
}

bool EventLoop::run_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    restart_if_stopped();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(10));
        io_.run_one_for(slice);
        if (io_.stopped()) {
            io_.restart();
        }
    }
    return predicate();
}

size_t EventLoop::pending_timer_count() const {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    return timers_.size();
}

void EventLoop::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_LOOP_ERROR("Task threw: " << e.what());
    }
}

void EventLoop::restart_if_stopped() {
    if (io_.stopped()) {
        io_.restart();
    }
}

} // namespace peerdrop
