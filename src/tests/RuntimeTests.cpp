// SPDX-License-Identifier: Apache-2.0
#include <runtime/Dispatcher.hpp>
#include <runtime/TaskPool.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace vosklink;

TEST_CASE("TaskPool runs submitted work and returns values", "[pool]")
{
    auto pool = TaskPool("test-pool", 2);
    CHECK(pool.threadCount() == 2);

    auto future = pool.async([] { return 6 * 7; });
    REQUIRE(future.has_value());
    CHECK(future->get() == 42);
}

TEST_CASE("TaskPool runs at least one worker", "[pool]")
{
    auto pool = TaskPool("tiny-pool", 0);
    CHECK(pool.threadCount() == 1);
}

TEST_CASE("TaskPool drains queued work on shutdown", "[pool]")
{
    auto counter = std::atomic<int> { 0 };
    {
        auto pool = TaskPool("drain-pool", 1);
        for (auto i = 0; i < 50; ++i)
            REQUIRE(pool.submit([&counter] { counter.fetch_add(1); }).has_value());
        pool.shutdown();
    }
    CHECK(counter.load() == 50);
}

TEST_CASE("TaskPool refuses work after shutdown", "[pool]")
{
    auto pool = TaskPool("closed-pool", 1);
    pool.shutdown();
    pool.shutdown(); // idempotent

    auto result = pool.submit([] {});
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::PoolShutdown);

    auto future = pool.async([] { return 1; });
    REQUIRE(!future.has_value());
    CHECK(future.error().code == ErrorCode::PoolShutdown);
}

TEST_CASE("TaskPool can be shut down and destroyed from inside its own task", "[pool]")
{
    auto pool = std::make_unique<TaskPool>("self-stop-pool", 2);
    auto stopped = std::promise<void> {};
    auto finished = std::atomic<bool> { false };

    REQUIRE(pool
                ->submit([&pool, &stopped, &finished] {
                    pool->shutdown();
                    stopped.set_value();
                    // Keep running after the owner has destroyed the pool.
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    finished.store(true);
                })
                .has_value());

    stopped.get_future().wait();
    CHECK(pool->submit([] {}).error().code == ErrorCode::PoolShutdown);
    pool.reset();

    while (!finished.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    // Give the detached worker time to return to its queue after the task.
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(finished.load());
}

TEST_CASE("TaskPool identifies its own worker threads", "[pool]")
{
    auto pool = TaskPool("id-pool", 1);
    CHECK(!pool.isWorkerThread());

    auto inside = pool.async([&pool] { return pool.isWorkerThread(); });
    REQUIRE(inside.has_value());
    CHECK(inside->get());
}

TEST_CASE("Only waveform ingestion is CPU-bound", "[dispatcher]")
{
    CHECK(callKindOf(Operation::AcceptWaveform) == CallKind::CpuBound);

    for (auto const op: { Operation::SetLogLevel,
                          Operation::LoadModel,
                          Operation::FindWord,
                          Operation::CreateRecognizer,
                          Operation::SetMaxAlternatives,
                          Operation::SetWords,
                          Operation::SetPartialWords,
                          Operation::GetResult,
                          Operation::GetPartialResult,
                          Operation::GetFinalResult,
                          Operation::ResetRecognizer })
        CHECK(callKindOf(op) == CallKind::Regular);

    CHECK(operationName(Operation::AcceptWaveform) == "accept_waveform");
}

TEST_CASE("Dispatcher keeps CPU-bound work off the regular pool", "[dispatcher]")
{
    auto dispatcher = Dispatcher(DispatcherConfig { .regularThreads = 1, .cpuBoundThreads = 1 });
    auto& regular = dispatcher.pool(CallKind::Regular);
    auto& cpuBound = dispatcher.pool(CallKind::CpuBound);
    CHECK(&regular != &cpuBound);

    auto onCpuPool = dispatcher.run(Operation::AcceptWaveform,
                                    [&] { return cpuBound.isWorkerThread() && !regular.isWorkerThread(); });
    auto onRegularPool = dispatcher.run(Operation::FindWord,
                                        [&] { return regular.isWorkerThread() && !cpuBound.isWorkerThread(); });

    REQUIRE(onCpuPool.has_value());
    REQUIRE(onRegularPool.has_value());
    CHECK(onCpuPool->get());
    CHECK(onRegularPool->get());
}

TEST_CASE("Short calls proceed while the CPU-bound pool is busy", "[dispatcher]")
{
    auto dispatcher = Dispatcher(DispatcherConfig { .regularThreads = 1, .cpuBoundThreads = 1 });

    auto release = std::atomic<bool> { false };
    auto longCall = dispatcher.run(Operation::AcceptWaveform, [&release] {
        while (!release.load())
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return 1;
    });
    auto shortCall = dispatcher.run(Operation::GetPartialResult, [] { return 2; });

    REQUIRE(shortCall.has_value());
    CHECK(shortCall->get() == 2);

    release.store(true);
    REQUIRE(longCall.has_value());
    CHECK(longCall->get() == 1);
}

TEST_CASE("Dispatcher reports shutdown through the returned future", "[dispatcher]")
{
    auto dispatcher = Dispatcher(DispatcherConfig { .regularThreads = 1, .cpuBoundThreads = 1 });
    dispatcher.shutdown();

    auto model = dispatcher.loadModel("/nonexistent").get();
    REQUIRE(!model.has_value());
    CHECK(model.error().code == ErrorCode::PoolShutdown);
}

TEST_CASE("Dispatcher surfaces model load failures", "[dispatcher]")
{
    auto dispatcher = Dispatcher(DispatcherConfig { .regularThreads = 1, .cpuBoundThreads = 1 });

    auto model = dispatcher.loadModel("/nonexistent/vosklink/model").get();
    REQUIRE(!model.has_value());
    CHECK(model.error().code == ErrorCode::ModelLoadFailed);
}
