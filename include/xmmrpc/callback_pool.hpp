#pragma once
/**
 * @file callback_pool.hpp
 * @brief Small fixed worker pool that runs completion callbacks off the reader thread.
 *
 * @details
 * The reader loop must never wait on user code. It posts each completion as a task
 * and moves on to the next frame; the workers pick tasks up in FIFO order. With
 * more than one worker, callbacks of different transactions may finish in any order.
 *
 * stop() lets already queued tasks run, then joins. Tasks posted after stop() are
 * refused (post returns false).
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace xmmrpc {

class CallbackPool {
public:
    using Task = std::function<void()>;

    CallbackPool() = default;
    ~CallbackPool() { stop(); }

    CallbackPool(const CallbackPool&) = delete;
    CallbackPool& operator=(const CallbackPool&) = delete;

    /// Launch @p workers threads (at least one). No-op when already running.
    void start(size_t workers);

    /// Queue a task. Returns false when the pool is not running.
    bool post(Task task);

    /// Drain the queue and join all workers.
    void stop();

    bool running() const;

private:
    void worker_main();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::vector<std::thread> workers_;
    bool running_{false};
};

} // namespace xmmrpc
