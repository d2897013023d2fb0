#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace peerdrop {

/**
 * Single-threaded task loop that owns all state of one endpoint.
 *
 * Transport threads never touch endpoint state directly; they post()
 * closures here. Tasks run in FIFO order on whichever thread drives the
 * loop (run(), poll(), run_for() or run_until()). Exceptions thrown by a
 * task are logged and do not stop the loop.
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * Queue a task. Safe to call from any thread.
     */
    void post(Task task);

    /**
     * Run a task once after a delay.
     * @return Id usable with cancel_timer()
     */
    TimerId post_delayed(std::chrono::milliseconds delay, Task task);

    /**
     * Cancel a pending delayed task.
     * @return true if the timer was pending and is now cancelled
     */
    bool cancel_timer(TimerId id);

    /**
     * Run tasks until stop() is called.
     */
    void run();

    /**
     * Make run() return. Safe to call from any thread.
     */
    void stop();

    /**
     * Run every task that is ready now, without blocking.
     * @return Number of tasks run
     */
    size_t poll();

    /**
     * Run tasks for the given duration.
     * @return Number of tasks run
     */
    size_t run_for(std::chrono::milliseconds duration);

    /**
     * Run tasks until predicate() holds or the timeout expires.
     * @return Final value of predicate()
     */
    bool run_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

    size_t pending_timer_count() const;

private:
    void run_task(const Task& task);
    void restart_if_stopped();

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;

    mutable std::mutex timers_mutex_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    TimerId next_timer_id_;
};

} // namespace peerdrop
