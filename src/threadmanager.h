#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace peerdrop {

/**
 * Owns the background threads of a component (accept loops, per-connection
 * readers, channel writers) and joins them on shutdown.
 *
 * Thread bodies run inside a guard that logs escaping exceptions, so no
 * exception ever leaves a managed thread. Long-lived owners such as the relay
 * server call reap_finished_threads() to release threads of closed
 * connections without waiting for shutdown.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a thread running body. Refused once shutdown was requested.
     * @param name Descriptive name for logging
     * @return true if the thread was started
     */
    bool start_managed_thread(const std::string& name, std::function<void()> body);

    /**
     * Mark shutdown as requested; later start_managed_thread() calls are refused.
     * Owners still have to unblock their threads (close sockets, set flags).
     */
    void shutdown_all_threads();

    /**
     * Join every managed thread. A thread joining itself is detached instead.
     */
    void join_all_active_threads();

    /**
     * Join the threads whose body has already returned.
     * @return Number of threads released
     */
    size_t reap_finished_threads();

    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

private:
    struct ManagedThread {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static void join_thread(ManagedThread& managed);

    std::vector<ManagedThread> threads_;
    mutable std::mutex threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace peerdrop
