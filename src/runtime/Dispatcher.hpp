// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <runtime/TaskPool.hpp>
#include <speech/Model.hpp>
#include <speech/Recognizer.hpp>

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vosklink
{

/// @brief Boundary operations exposed to a host runtime.
enum class Operation : std::uint8_t
{
    SetLogLevel,
    LoadModel,
    FindWord,
    CreateRecognizer,
    SetMaxAlternatives,
    SetWords,
    SetPartialWords,
    AcceptWaveform,
    GetResult,
    GetPartialResult,
    GetFinalResult,
    ResetRecognizer,
};

/// @brief Scheduling class of an operation.
enum class CallKind : std::uint8_t
{
    /// @brief Short call; may run on a latency-sensitive thread.
    Regular,

    /// @brief Long CPU-bound call; must run on the dedicated CPU-bound pool.
    CpuBound,
};

/// @brief Returns the scheduling class of @p op.
///
/// Audio decoding time grows with chunk length and model size, so waveform
/// ingestion is the only CPU-bound operation.
[[nodiscard]] constexpr auto callKindOf(Operation op) -> CallKind
{
    return op == Operation::AcceptWaveform ? CallKind::CpuBound : CallKind::Regular;
}

[[nodiscard]] constexpr auto operationName(Operation op) -> std::string_view
{
    switch (op)
    {
        case Operation::SetLogLevel: return "set_log_level";
        case Operation::LoadModel: return "load_model";
        case Operation::FindWord: return "find_word";
        case Operation::CreateRecognizer: return "create_recognizer";
        case Operation::SetMaxAlternatives: return "set_max_alternatives";
        case Operation::SetWords: return "set_words";
        case Operation::SetPartialWords: return "set_partial_words";
        case Operation::AcceptWaveform: return "accept_waveform";
        case Operation::GetResult: return "get_result";
        case Operation::GetPartialResult: return "get_partial_result";
        case Operation::GetFinalResult: return "get_final_result";
        case Operation::ResetRecognizer: return "reset_recognizer";
    }
    return "unknown";
}

/// @brief Thread counts of the two dispatcher pools.
struct DispatcherConfig
{
    std::size_t regularThreads = 2;

    /// @brief CPU-bound workers; 0 selects the hardware concurrency.
    std::size_t cpuBoundThreads = 0;
};

/// @brief Routes boundary operations onto a regular pool or a CPU-bound pool.
///
/// The pools are separate so that long decoding work never occupies the threads
/// serving short calls. Every queued call holds shared ownership of the handles it
/// uses, so a handle dropped by its owner is destroyed only after the call returns.
class Dispatcher
{
  public:
    explicit Dispatcher(const DispatcherConfig& config = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// @brief Runs @p fn on the pool matching @p op.
    template <typename Fn>
    [[nodiscard]] auto run(Operation op, Fn fn) -> Result<std::future<std::invoke_result_t<Fn>>>
    {
        return pool(callKindOf(op)).async(std::move(fn));
    }

    /// @brief Loads a model on the regular pool.
    [[nodiscard]] auto loadModel(std::string path) -> std::future<Result<std::shared_ptr<Model>>>;

    /// @brief Feeds @p audio into @p recognizer on the CPU-bound pool.
    [[nodiscard]] auto acceptWaveform(std::shared_ptr<Recognizer> recognizer, std::vector<std::byte> audio)
        -> std::future<Result<WaveformStatus>>;

    /// @brief Reads the partial result of @p recognizer on the regular pool.
    [[nodiscard]] auto partialResult(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>;

    /// @brief Reads the utterance result of @p recognizer on the regular pool.
    [[nodiscard]] auto result(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>;

    /// @brief Flushes @p recognizer and reads its final result on the regular pool.
    [[nodiscard]] auto finalResult(std::shared_ptr<Recognizer> recognizer) -> std::future<Result<std::string>>;

    [[nodiscard]] auto pool(CallKind kind) -> TaskPool&;

    /// @brief Drains and stops both pools. Idempotent.
    void shutdown();

  private:
    std::unique_ptr<TaskPool> _regular;
    std::unique_ptr<TaskPool> _cpuBound;
};

} // namespace vosklink
