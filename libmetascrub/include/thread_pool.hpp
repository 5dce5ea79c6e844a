/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by ProcessorExecutor.
 */

#ifndef METASCRUB_THREAD_POOL_HPP
#define METASCRUB_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool for executing file jobs concurrently.
 *
 * @details Workers are std::jthread, joined on destruction. Tasks receive
 * the worker's std::stop_token so a long job can notice an interrupt
 * between files.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /// Requests stop; the jthread members join on destruction.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a callable taking a std::stop_token.
     * @return Future for the task result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /// Blocks until every enqueued task has finished or been discarded.
    void wait_idle();

    /**
     * @brief Discards queued tasks and signals running ones to stop.
     */
    void request_stop();

private:
    /// Body of each worker: pops and runs jobs until stop.
    void run_worker(const std::stop_token& st);

    /// Pops the next job, or returns false when the worker should exit.
    bool next_job(const std::stop_token& st, std::function<void(std::stop_token)>& job);

    /// Drops queued jobs; queue_mutex_ must be held. Returns the number dropped.
    size_t discard_queued_locked();

    std::mutex queue_mutex_;                ///< Protects tasks_, stop_ and pending_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ drops to zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};                     ///< Tasks enqueued or running
    std::vector<std::jthread> workers_;
};

#endif // METASCRUB_THREAD_POOL_HPP
