#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace usync {

/**
 * @brief Fixed-size worker pool used for parallel file hashing
 *
 * Tasks run in FIFO order on whichever worker frees up first.
 * The destructor drains the queue before joining.
 */
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>>;

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

template<typename F>
auto ThreadPool::submit(F&& task) -> std::future<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;

    auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
    std::future<ReturnType> future = packaged->get_future();
    {
        std::unique_lock lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        tasks_.emplace([packaged]() { (*packaged)(); });
    }
    cv_.notify_one();
    return future;
}

} // namespace usync
