#pragma once

/**
 * ThreadPool.hpp
 *
 * Named, fixed-size worker pool.
 * With one worker the pool is a serial queue: jobs run one at a time in
 * the order they were posted. DownloadEngine uses it that way as its
 * dispatch context; HttpTransport runs transfers on a wider pool.
 */

#include "Logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace tether::core {

class ThreadPool {
public:
    using Job = std::function<void()>;

    /**
     * @param numThreads Worker count (0 = hardware concurrency)
     * @param name Used in log lines
     */
    explicit ThreadPool(size_t numThreads = 0, std::string name = "pool")
        : m_name(std::move(name)) {

        if (numThreads == 0) {
            numThreads = std::max(1u, std::thread::hardware_concurrency());
        }

        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back(&ThreadPool::workerLoop, this);
        }

        LOG_DEBUG("Pool '{}' started with {} worker(s)", m_name, numThreads);
    }

    /**
     * Stops accepting jobs, runs what is already queued, then joins.
     */
    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wakeup.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job whose result nobody waits for. An exception escaping
     * the job is logged.
     * @return false if the pool is shutting down and the job was dropped
     */
    bool post(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return false;
            }
            m_queue.push_back(std::move(job));
        }
        m_wakeup.notify_one();
        return true;
    }

    /**
     * Queue a job and get its result (or exception) through a future.
     * @throws std::runtime_error if the pool is shutting down
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {

        using Result = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        auto future = task->get_future();

        if (!post([task]() { (*task)(); })) {
            throw std::runtime_error("ThreadPool '" + m_name + "' is shutting down");
        }
        return future;
    }

    size_t size() const { return m_workers.size(); }

    const std::string& name() const { return m_name; }

    /**
     * Block until nothing is queued or running. Must not be called from
     * one of this pool's workers.
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_queue.empty() && m_running == 0; });
    }

    bool isWorkerThread() const {
        const auto self = std::this_thread::get_id();
        for (const auto& worker : m_workers) {
            if (worker.get_id() == self) return true;
        }
        return false;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(m_mutex);

        while (true) {
            m_wakeup.wait(lock, [this] { return m_stopping || !m_queue.empty(); });

            if (m_queue.empty()) {
                return; // stopping and drained
            }

            Job job = std::move(m_queue.front());
            m_queue.pop_front();
            ++m_running;

            lock.unlock();
            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("Job in pool '{}' threw: {}", m_name, e.what());
            }
            lock.lock();

            --m_running;
            if (m_queue.empty() && m_running == 0) {
                m_idle.notify_all();
            }
        }
    }

private:
    std::string m_name;
    std::vector<std::thread> m_workers;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::condition_variable m_idle;
    std::deque<Job> m_queue;
    size_t m_running{0};
    bool m_stopping{false};
};

} // namespace tether::core
