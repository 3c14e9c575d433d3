#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace lanwatch::discovery
{
    // Fixed set of threads draining one job queue. Jobs still queued when
    // Stop() is called are run before the threads exit.
    class TaskPool
    {
    private:
        std::vector<std::thread> threads_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<std::function<void()>> job_queue_;
        std::atomic<bool> running_;
        size_t size_;

        void ProcessLoop();

    public:
        explicit TaskPool(size_t threads);
        ~TaskPool();

        TaskPool(const TaskPool &) = delete;
        TaskPool &operator=(const TaskPool &) = delete;

        void Start();
        void Stop();
        bool IsRunning() const { return running_; }

        // Exceptions thrown by the job surface through the future
        template <typename F>
        auto Submit(F job) -> std::future<std::invoke_result_t<F>>
        {
            using Result = std::invoke_result_t<F>;
            auto task = std::make_shared<std::packaged_task<Result()>>(std::move(job));
            std::future<Result> future = task->get_future();

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                job_queue_.push([task]()
                                { (*task)(); });
            }
            queue_cv_.notify_one();
            return future;
        }
    };
}
