#include "TaskPool.hpp"

#include <iostream>

namespace lanwatch::discovery
{
    TaskPool::TaskPool(size_t threads) : running_(false), size_(threads == 0 ? 1 : threads) {}

    TaskPool::~TaskPool()
    {
        Stop();
    }

    void TaskPool::Start()
    {
        if (running_)
            return;

        running_ = true;
        threads_.reserve(size_);
        for (size_t i = 0; i < size_; ++i)
            threads_.emplace_back(&TaskPool::ProcessLoop, this);
    }

    void TaskPool::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                return;
            running_ = false;
        }
        queue_cv_.notify_all();

        for (auto &thread : threads_)
        {
            if (thread.joinable())
                thread.join();
        }
        threads_.clear();
    }

    void TaskPool::ProcessLoop()
    {
        while (true)
        {
            std::function<void()> current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            // packaged_task stores the job's exception in its future
            current_job();
        }
    }
}
