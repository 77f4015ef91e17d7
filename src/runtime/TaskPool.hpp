// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace vosklink
{

/// @brief A fixed set of worker threads draining a FIFO task queue.
///
/// Tasks run in submission order per worker; with more than one worker, tasks may
/// run concurrently. shutdown() lets queued tasks finish, then joins the workers.
class TaskPool
{
  public:
    using Task = std::function<void()>;

    /// @brief Starts @p threads workers (at least one).
    /// @param name Pool name used in log messages.
    TaskPool(std::string name, std::size_t threads);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// @brief Enqueues @p task.
    /// @return Success, or PoolShutdown once shutdown() has been called.
    [[nodiscard]] auto submit(Task task) -> VoidResult;

    /// @brief Enqueues @p fn and returns a future for its return value.
    template <typename Fn>
    [[nodiscard]] auto async(Fn fn) -> Result<std::future<std::invoke_result_t<Fn>>>
    {
        using R = std::invoke_result_t<Fn>;

        // std::function needs a copyable callable, so the task is shared.
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        auto future = task->get_future();

        auto submitted = submit([task] { (*task)(); });
        if (!submitted)
            return std::unexpected(submitted.error());
        return future;
    }

    /// @brief Stops accepting work, runs what is queued and joins the workers. Idempotent.
    ///
    /// When called from one of the pool's own tasks, that worker is not joined; it
    /// finishes its current task and exits on its own, keeping the pool state alive
    /// until then.
    void shutdown();

    [[nodiscard]] auto name() const -> const std::string&;
    [[nodiscard]] auto threadCount() const -> std::size_t;

    /// @brief Returns true if the calling thread is one of this pool's workers.
    [[nodiscard]] auto isWorkerThread() const -> bool;

  private:
    struct Impl;

    // Co-owned by every worker thread.
    std::shared_ptr<Impl> _impl;
};

} // namespace vosklink
