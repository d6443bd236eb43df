#include "intentmesh/core/util/thread_pool.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <algorithm>

namespace intentmesh {

    ThreadPool::ThreadPool(size_t thread_count, std::string name)
        : name_(std::move(name)) {
        if (thread_count == 0) {
            thread_count = std::thread::hardware_concurrency();
            if (thread_count == 0) {
                thread_count = 2;
            }
        }

        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&ThreadPool::workerFunction, this);
        }
    }

    ThreadPool::~ThreadPool() {
        join();
    }

    void ThreadPool::enqueue(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("[" + name_ + "] pool is stopped");
            }
            tasks_.emplace(std::move(task));
        }
        condition_.notify_one();
    }

    void ThreadPool::post(std::function<void()> task) {
        enqueue([name = name_, task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& ex) {
                LOG_ERROR("[" + name + "] task failed: " + std::string(ex.what()));
            }
        });
    }

    void ThreadPool::join() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_.notify_all();

        for (auto& thread : threads_) {
            if (!thread.joinable()) continue;
            if (thread.get_id() == std::this_thread::get_id())
                thread.detach();   // joined from our own worker
            else
                thread.join();
        }

        threads_.clear();
    }

    size_t ThreadPool::getPendingTaskCount() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    bool ThreadPool::isWorkerThread() const {
        auto self = std::this_thread::get_id();
        return std::any_of(threads_.begin(), threads_.end(),
            [self](const std::thread& t) { return t.get_id() == self; });
    }

    void ThreadPool::workerFunction() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this] {
                    return stop_ || !tasks_.empty();
                });

                // drain before exiting
                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            // packaged tasks store their exception in the future, posted tasks log it
            task();
        }
    }

} // namespace intentmesh
