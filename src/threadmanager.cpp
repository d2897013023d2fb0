#include "threadmanager.h"
#include "logger.h"
#include <exception>
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace peerdrop {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
}

ThreadManager::~ThreadManager() {
    join_all_active_threads();
}

bool ThreadManager::start_managed_thread(const std::string& name, std::function<void()> body) {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Not starting " << name << ": shutdown in progress");
        return false;
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([name, finished, body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Thread " << name << " terminated by exception: " << e.what());
        }
        finished->store(true);
    });

    threads_.push_back(ManagedThread{name, std::move(thread), finished});
    LOG_THREAD_DEBUG("Started " << name << " (" << threads_.size() << " managed)");
    return true;
}

void ThreadManager::shutdown_all_threads() {
    if (!shutdown_requested_.exchange(true)) {
        LOG_THREAD_DEBUG("Shutdown requested");
    }
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> to_join;
    {
        // Join outside the lock, an exiting thread may still try to start another
        std::lock_guard<std::mutex> lock(threads_mutex_);
        to_join.swap(threads_);
    }
    if (to_join.empty()) {
        return;
    }

    LOG_THREAD_DEBUG("Joining " << to_join.size() << " managed threads");
    for (auto& managed : to_join) {
        join_thread(managed);
    }
}

size_t ThreadManager::reap_finished_threads() {
    std::vector<ManagedThread> finished;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (auto it = threads_.begin(); it != threads_.end();) {
            if (it->finished->load()) {
                finished.push_back(std::move(*it));
                it = threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& managed : finished) {
        join_thread(managed);
    }
    return finished.size();
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    return threads_.size();
}

void ThreadManager::join_thread(ManagedThread& managed) {
    if (!managed.thread.joinable()) {
        return;
    }
    if (managed.thread.get_id() == std::this_thread::get_id()) {
        // Joining ourselves would deadlock
        managed.thread.detach();
        return;
    }
    try {
        managed.thread.join();
    } catch (const std::system_error& e) {
        LOG_THREAD_ERROR("Failed to join " << managed.name << ": " << e.what());
    }
}

} // namespace peerdrop
