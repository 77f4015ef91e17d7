// SPDX-License-Identifier: Apache-2.0
#include "TaskPool.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace vosklink
{

struct TaskPool::Impl
{
    std::string name;
    std::vector<std::jthread> workers;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> queue;
    bool shutdownRequested = false;

    /// @brief Worker loop: runs tasks until shutdown is requested and the queue is drained.
    void run()
    {
        while (true)
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, [this] { return !queue.empty() || shutdownRequested; });

                if (queue.empty())
                    return;

                task = std::move(queue.front());
                queue.pop_front();
            }

            try
            {
                task();
            }
            catch (const std::exception& e)
            {
                log::error("{}: task failed: {}", name, e.what());
            }
        }
    }
};

TaskPool::TaskPool(std::string name, std::size_t threads): _impl(std::make_shared<Impl>())
{
    _impl->name = std::move(name);

    auto const count = std::max<std::size_t>(threads, 1);
    _impl->workers.reserve(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _impl->workers.emplace_back([impl = _impl] { impl->run(); });

    log::debug("{}: started {} worker(s)", _impl->name, count);
}

TaskPool::~TaskPool()
{
    shutdown();
}

auto TaskPool::submit(Task task) -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return makeError(ErrorCode::PoolShutdown, std::format("{} is shut down", _impl->name));
        _impl->queue.push_back(std::move(task));
    }
    _impl->cv.notify_one();
    return {};
}

void TaskPool::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->shutdownRequested = true;
    }
    _impl->cv.notify_all();

    for (auto& worker: _impl->workers)
    {
        if (!worker.joinable())
            continue;
        if (worker.get_id() == std::this_thread::get_id())
            worker.detach(); // holds its own reference to the pool state
        else
            worker.join();
    }

    log::debug("{}: shut down", _impl->name);
}

auto TaskPool::name() const -> const std::string&
{
    return _impl->name;
}

auto TaskPool::threadCount() const -> std::size_t
{
    return _impl->workers.size();
}

auto TaskPool::isWorkerThread() const -> bool
{
    auto const self = std::this_thread::get_id();
    return std::ranges::any_of(_impl->workers, [self](const std::jthread& t) { return t.get_id() == self; });
}

} // namespace vosklink
