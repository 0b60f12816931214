#ifndef MODLINT_PARALLEL_HPP
#define MODLINT_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Fixed-size worker pool with caller-side task stealing.
 *
 * ThreadPool runs posted tasks on a fixed set of worker threads. A thread
 * that is waiting for results produced by the pool (the graph coordinator)
 * should not park: it calls try_run_pending_task() to execute one queued
 * task itself, and yields when the queue is empty.
 */

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace modlint::parallel {

    /**
     * Number of hardware threads, or 1 if detection fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = hardware concurrency).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Queues a fire-and-forget task.
         *
         * The task must not throw; results and failures travel through
         * whatever channel the task was given.
         */
        void post(std::function<void()> task) {
            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot post to stopped thread pool");
                }
                tasks_.push(std::move(task));
            }
            condition_.notify_one();
        }

        /**
         * Runs one queued task on the calling thread.
         *
         * @return false if the queue was empty.
         */
        bool try_run_pending_task() {
            std::function<void()> task;
            {
                std::unique_lock lock(queue_mutex_);
                if (tasks_.empty()) {
                    return false;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
            return true;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Polls until done() is true, running pool tasks on the calling thread
     * while waiting and yielding when there is nothing to run.
     */
    template<typename Done>
    void help_until(ThreadPool& pool, Done&& done) {
        while (!done()) {
            if (!pool.try_run_pending_task()) {
                std::this_thread::yield();
            }
        }
    }

}  // namespace modlint::parallel

#endif // MODLINT_PARALLEL_HPP
