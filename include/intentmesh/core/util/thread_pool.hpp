/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used for dispatch and for serialized service mailboxes.
 *
 * A pool with a single worker executes its tasks strictly in submission order,
 * which is how services serialize access to their own state.
 */
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace intentmesh {

    /**
     * @class ThreadPool
     * @brief Thread pool for asynchronous task execution.
     */
    class ThreadPool {
    public:
        /**
         * @brief Constructor for ThreadPool.
         * @param thread_count Number of worker threads to create. If 0, uses hardware concurrency.
         * @param name Name used in log messages
         */
        explicit ThreadPool(size_t thread_count = 0, std::string name = "ThreadPool");

        /**
         * @brief Waits for queued tasks to drain and joins the workers.
         */
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Add a task to the thread pool.
         *
         * Exceptions thrown by the task are stored in the returned future.
         * @param task Function to execute
         * @return Future containing the result of the task
         * @throws std::runtime_error if the pool has been joined
         */
        template<typename F, typename... Args>
        auto add(F&& task, Args&&... args) -> std::future<decltype(task(args...))>;

        /**
         * @brief Add a fire-and-forget task. Exceptions are logged.
         * @param task Function to execute
         */
        void post(std::function<void()> task);

        /**
         * @brief Stop accepting tasks, drain the queue and join all workers.
         */
        void join();

        size_t getThreadCount() const { return threads_.size(); }

        /**
         * @brief Get the number of queued, not yet started tasks.
         */
        size_t getPendingTaskCount() const;

        /**
         * @brief True when called from one of this pool's workers.
         */
        bool isWorkerThread() const;

    private:
        void workerFunction();
        void enqueue(std::function<void()> task);

        std::string name_;
        std::vector<std::thread> threads_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_{ false };
    };

    template<typename F, typename... Args>
    auto ThreadPool::add(F&& task, Args&&... args) -> std::future<decltype(task(args...))> {
        using return_type = decltype(task(args...));

        auto packaged_task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(task), std::forward<Args>(args)...)
        );

        std::future<return_type> result = packaged_task->get_future();
        enqueue([packaged_task]() { (*packaged_task)(); });
        return result;
    }

} // namespace intentmesh
