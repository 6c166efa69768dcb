// ============================================================================
// callback_pool.cpp: implementation for callback_pool.hpp
// ============================================================================

#include "xmmrpc/callback_pool.hpp"
#include "xmmrpc/log.hpp"

#include <exception>

namespace xmmrpc {

void CallbackPool::start(size_t workers) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_) return;
    running_ = true;
    if (workers == 0) workers = 1;
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        workers_.emplace_back(&CallbackPool::worker_main, this);
}

bool CallbackPool::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void CallbackPool::stop() {
    std::vector<std::thread> joining;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
        joining.swap(workers_);
    }
    cv_.notify_all();
    for (auto& t : joining) {
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();                      // stop() called from inside a callback
        } else if (t.joinable()) {
            t.join();
        }
    }
}

bool CallbackPool::running() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return running_;
}

void CallbackPool::worker_main() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) return;      // stopped and drained
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_event(LogLevel::Error, "callback_threw", std::string("what=") + e.what());
        } catch (...) {
            log_event(LogLevel::Error, "callback_threw", "what=unknown");
        }
    }
}

} // namespace xmmrpc
