//===----------------------------------------------------------------------===//
//
// Part of the fabls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Single-threaded FIFO background worker.
///
/// The server posts workspace refreshes here so that the message loop keeps
/// answering queries while config files are scanned and sources are indexed.
///
//===----------------------------------------------------------------------===//
#ifndef FABLS_LSP_WORK_QUEUE_H
#define FABLS_LSP_WORK_QUEUE_H

#include <cstddef>
#include <functional>
#include <memory>

namespace fabls::lsp
{

using WorkItem = std::function<void()>;

/// @brief Runs posted jobs one at a time, in posting order, on its own thread.
class WorkQueue final
{
public:
    WorkQueue();
    ~WorkQueue();

    WorkQueue(const WorkQueue&)            = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// @brief Enqueues `item`.
    /// @return `false` after @ref shutdown.
    [[nodiscard]] bool post(WorkItem item);

    /// @brief Blocks until every posted job has finished.
    void waitIdle();

    /// @brief Returns the number of jobs queued or running.
    [[nodiscard]] std::size_t pending() const;

    /// @brief Finishes queued jobs, then stops the worker. Idempotent.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace fabls::lsp

#endif  // FABLS_LSP_WORK_QUEUE_H
