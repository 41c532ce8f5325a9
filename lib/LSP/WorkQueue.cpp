//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the background work queue.
///
//===----------------------------------------------------------------------===//

#include "fabls/LSP/WorkQueue.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace fabls::lsp
{

class WorkQueue::Impl final
{
public:
    Impl()
        : worker_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
    }

    bool post(WorkItem item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return false;
            }
            queue_.push_back(std::move(item));
            ++outstanding_;
        }
        workAvailable_.notify_one();
        return true;
    }

    void waitIdle()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return outstanding_ == 0; });
    }

    std::size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
        }
        workAvailable_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

private:
    void run()
    {
        while (true)
        {
            WorkItem item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                workAvailable_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
            }

            if (item)
            {
                item();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --outstanding_;
                if (outstanding_ == 0)
                {
                    idle_.notify_all();
                }
            }
        }
    }

    mutable std::mutex      mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::deque<WorkItem>    queue_;
    std::size_t             outstanding_{0};
    bool                    stopping_{false};
    std::thread             worker_;
};

WorkQueue::WorkQueue()
    : impl_(std::make_unique<Impl>())
{
}

WorkQueue::~WorkQueue() = default;

bool WorkQueue::post(WorkItem item)
{
    return impl_->post(std::move(item));
}

void WorkQueue::waitIdle()
{
    impl_->waitIdle();
}

std::size_t WorkQueue::pending() const
{
    return impl_->pending();
}

void WorkQueue::shutdown()
{
    impl_->shutdown();
}

}  // namespace fabls::lsp
