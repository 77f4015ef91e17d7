// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <thread>

namespace vosklink
{

namespace
{

    auto resolveCpuThreads(std::size_t requested) -> std::size_t
    {
        if (requested > 0)
            return requested;
        return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
    }

    /// @brief Turns a refused submission into an already-completed future.
    template <typename T>
    auto flatten(Result<std::future<Result<T>>> submitted) -> std::future<Result<T>>
    {
        if (submitted)
            return std::move(*submitted);

        auto promise = std::promise<Result<T>> {};
        promise.set_value(std::unexpected(submitted.error()));
        return promise.get_future();
    }

} // namespace

Dispatcher::Dispatcher(const DispatcherConfig& config):
    _regular(std::make_unique<TaskPool>("regular-pool", config.regularThreads)),
    _cpuBound(std::make_unique<TaskPool>("cpu-bound-pool", resolveCpuThreads(config.cpuBoundThreads)))
{
    log::debug("Dispatcher ready ({} regular, {} cpu-bound workers)",
               _regular->threadCount(),
               _cpuBound->threadCount());
}

Dispatcher::~Dispatcher()
{
    shutdown();
}

auto Dispatcher::loadModel(std::string path) -> std::future<Result<std::shared_ptr<Model>>>
{
    return flatten(run(Operation::LoadModel, [path = std::move(path)] { return Model::load(path); }));
}

auto Dispatcher::acceptWaveform(std::shared_ptr<Recognizer> recognizer, std::vector<std::byte> audio)
    -> std::future<Result<WaveformStatus>>
{
    return flatten(run(Operation::AcceptWaveform,
                       [recognizer = std::move(recognizer), audio = std::move(audio)]() -> Result<WaveformStatus> {
                           return recognizer->acceptWaveform(std::span<const std::byte>(audio));
                       }));
}

auto Dispatcher::partialResult(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>
{
    return flatten(run(Operation::GetPartialResult,
                       [recognizer = std::move(recognizer)] { return recognizer->partialResult(); }));
}

auto Dispatcher::result(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>
{
    return flatten(
        run(Operation::GetResult, [recognizer = std::move(recognizer)] { return recognizer->result(); }));
}

auto Dispatcher::finalResult(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>
{
    return flatten(run(Operation::GetFinalResult,
                       [recognizer = std::move(recognizer)] { return recognizer->finalResult(); }));
}

auto Dispatcher::pool(CallKind kind) -> TaskPool&
{
    return kind == CallKind::CpuBound ? *_cpuBound : *_regular;
}

void Dispatcher::shutdown()
{
    _cpuBound->shutdown();
    _regular->shutdown();
}

} // namespace vosklink
