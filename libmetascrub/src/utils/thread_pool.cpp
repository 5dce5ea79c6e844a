#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace {

// Decrements the in-flight counter once a job has left the worker, even if it threw.
class JobCompletion {
public:
    JobCompletion(size_t& pending, std::mutex& mutex, std::condition_variable& idle)
        : pending_(pending), mutex_(mutex), idle_(idle) {}

    ~JobCompletion() {
        std::lock_guard lock(mutex_);
        if (pending_ > 0) --pending_;
        idle_.notify_all();
    }

    JobCompletion(const JobCompletion&) = delete;
    JobCompletion& operator=(const JobCompletion&) = delete;

private:
    size_t& pending_;
    std::mutex& mutex_;
    std::condition_variable& idle_;
};

} // namespace

ThreadPool::ThreadPool(unsigned threads) {
    threads = std::max(threads, 1u);
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { run_worker(st); });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(threads) + " worker(s)", "pool");
}

bool ThreadPool::next_job(const std::stop_token& st, std::function<void(std::stop_token)>& job) {
    std::unique_lock lock(queue_mutex_);
    while (tasks_.empty()) {
        if (stop_ || st.stop_requested()) return false;
        condition_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
    }
    if (st.stop_requested()) return false;
    job = std::move(tasks_.front());
    tasks_.pop();
    return true;
}

void ThreadPool::run_worker(const std::stop_token& st) {
    std::function<void(std::stop_token)> job;
    while (next_job(st, job)) {
        JobCompletion completion{pending_, queue_mutex_, idle_cv_};
        try {
            job(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Job failed outside the executor: ") + e.what(), "pool");
        }
        job = nullptr;
    }
}

size_t ThreadPool::discard_queued_locked() {
    const size_t dropped = tasks_.size();
    std::queue<std::function<void(std::stop_token)>>().swap(tasks_);
    pending_ = pending_ > dropped ? pending_ - dropped : 0;
    return dropped;
}

void ThreadPool::request_stop() {
    size_t dropped = 0;
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        dropped = discard_queued_locked();
    }
    if (dropped > 0) {
        Logger::log(LogLevel::Debug, "Discarded " + std::to_string(dropped) + " queued job(s)", "pool");
    }
    condition_.notify_all();
    idle_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_ == 0 && tasks_.empty(); });
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}
