// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string_view>

namespace vosklink
{

/// @brief Outcome of feeding one audio chunk into a recognizer.
enum class WaveformStatus : std::int8_t
{
    Continue,       ///< Keep feeding audio; a partial result is available.
    UtteranceEnded, ///< An endpoint was detected; read result() before feeding more.
    Error,          ///< libvosk rejected the chunk. The recognizer stays usable.
};

/// @brief Observed ingestion state of a recognizer.
enum class RecognizerState : std::uint8_t
{
    Idle,
    Accumulating,
    UtteranceBoundary,
};

/// @brief Maps the integer returned by vosk_recognizer_accept_waveform*().
///
/// 1 is an utterance boundary, 0 means continue; every other value is an error.
[[nodiscard]] constexpr auto waveformStatusFromCode(int code) -> WaveformStatus
{
    switch (code)
    {
        case 0: return WaveformStatus::Continue;
        case 1: return WaveformStatus::UtteranceEnded;
        default: return WaveformStatus::Error;
    }
}

/// @brief Returns the tri-state signal value (0, 1 or -1) for @p status.
[[nodiscard]] constexpr auto waveformStatusCode(WaveformStatus status) -> int
{
    switch (status)
    {
        case WaveformStatus::Continue: return 0;
        case WaveformStatus::UtteranceEnded: return 1;
        case WaveformStatus::Error: return -1;
    }
    return -1;
}

[[nodiscard]] constexpr auto waveformStatusName(WaveformStatus status) -> std::string_view
{
    switch (status)
    {
        case WaveformStatus::Continue: return "continue";
        case WaveformStatus::UtteranceEnded: return "utterance_ended";
        case WaveformStatus::Error: return "error";
    }
    return "error";
}

/// @brief Returns the state a recognizer is in after a chunk yielded @p status.
[[nodiscard]] constexpr auto nextState(RecognizerState current, WaveformStatus status) -> RecognizerState
{
    switch (status)
    {
        case WaveformStatus::Continue: return RecognizerState::Accumulating;
        case WaveformStatus::UtteranceEnded: return RecognizerState::UtteranceBoundary;
        case WaveformStatus::Error: return current;
    }
    return current;
}

/// @brief Result accessors, by their effect on the recognizer state.
enum class ResultRead : std::uint8_t
{
    Partial,
    Utterance,
    Flush,
};

/// @brief Returns the state a recognizer is in after its result was read with @p read.
///
/// libvosk finalizes the current utterance when its result is read, so the next chunk
/// starts a fresh one. Partial reads change nothing.
[[nodiscard]] constexpr auto stateAfterRead(RecognizerState current, ResultRead read) -> RecognizerState
{
    switch (read)
    {
        case ResultRead::Partial: return current;
        case ResultRead::Utterance:
        case ResultRead::Flush: return RecognizerState::Idle;
    }
    return current;
}

[[nodiscard]] constexpr auto recognizerStateName(RecognizerState state) -> std::string_view
{
    switch (state)
    {
        case RecognizerState::Idle: return "idle";
        case RecognizerState::Accumulating: return "accumulating";
        case RecognizerState::UtteranceBoundary: return "utterance_boundary";
    }
    return "idle";
}

} // namespace vosklink
