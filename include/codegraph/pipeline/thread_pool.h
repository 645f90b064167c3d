#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace codegraph::pipeline {

/**
 * @brief Fixed set of worker threads over one FIFO queue.
 *
 * stop() refuses new work, lets the workers drain what is already queued,
 * then joins them. The destructor calls stop().
 */
class ThreadPool {
public:
    /// Zero picks the hardware concurrency.
    explicit ThreadPool(std::size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue f and return a future for its result. Exceptions thrown by
     * f arrive through the future.
     * @throws std::runtime_error when the pool is stopping
     */
    template <typename F> auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    /// Fire and forget. @return false when the pool is stopping
    template <typename F> bool post(F&& f);

    void stop();

    [[nodiscard]] std::size_t size() const noexcept { return threadCount_; }

private:
    bool push(std::function<void()> task);
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::size_t threadCount_ = 0;
    std::vector<std::jthread> workers_;
};

template <typename F> auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    // std::function needs a copyable callable, so the task lives behind a shared_ptr.
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    auto future = task->get_future();
    if (!push([task] { (*task)(); }))
        throw std::runtime_error("Thread pool is stopping");
    return future;
}

template <typename F> bool ThreadPool::post(F&& f) {
    return push(std::function<void()>(std::forward<F>(f)));
}

} // namespace codegraph::pipeline
