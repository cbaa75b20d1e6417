#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <cstddef>

namespace ChunkVault {

    /**
     * @brief Fixed-size worker thread pool.
     *
     * Used by composition: the UploadOrchestrator owns one pool for whole-file
     * runs and another for parallel chunk pushes, so a run never waits on a
     * worker it is itself occupying. TimedRemoteCall owns a third for calls
     * made under a deadline.
     */
    class ThreadPool {
    public:
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task for execution.
         * @return std::future holding the task's return value.
         *
         * Tasks enqueued after shutdown() are dropped; their futures report
         * std::future_errc::broken_promise.
         */
        template<typename F>
        auto enqueue(F&& func) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using ReturnType = std::invoke_result_t<std::decay_t<F>>;
            using TaskType = std::packaged_task<ReturnType()>;

            auto task = std::make_shared<TaskType>(std::forward<F>(func));
            std::future<ReturnType> fut = task->get_future();

            post([task]() {
                (*task)();
            });

            return fut;
        }

        /**
         * @brief Stop accepting work, drain the queue and join all workers.
         */
        void shutdown();

        std::size_t size() const { return threadCount_; }

    private:
        void workerLoop();
        void post(std::function<void()> task);

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        std::size_t threadCount_{0};
        bool stopping_{false};
    };

} // namespace ChunkVault
