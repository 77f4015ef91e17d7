// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speech/Model.hpp>
#include <speech/WaveformStatus.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

struct VoskRecognizer;

namespace vosklink
{

/// @brief Output-shaping options of a recognizer.
struct RecognizerOptions
{
    /// @brief Number of n-best alternatives in final results; 0 disables alternatives.
    int maxAlternatives = 0;

    /// @brief Include per-word timing and confidence in final results.
    bool words = false;

    /// @brief Include per-word entries in partial results.
    bool partialWords = false;
};

/// @brief A stateful decoding session bound to one Model and one sample rate.
///
/// Audio must be 16-bit signed little-endian mono PCM at exactly the sample rate
/// given at creation; no resampling is performed.
///
/// A recognizer belongs to one logical owner at a time. Calls on the same instance
/// are serialized internally, so release() and the destructor wait for a call that
/// is still running, but interleaving audio from several callers is still a
/// caller bug.
class Recognizer
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    Recognizer(PrivateTag, std::shared_ptr<Model> model, float sampleRate, VoskRecognizer* native);
    ~Recognizer();

    Recognizer(const Recognizer&) = delete;
    Recognizer& operator=(const Recognizer&) = delete;

    /// @brief Creates a recognizer for @p model.
    /// @param model The model to decode with; kept alive by the recognizer.
    /// @param sampleRate Sample rate of the audio that will be supplied, in Hz.
    /// @return The recognizer, InvalidArgument/ResourceReleased for bad input, or
    ///         RecognizerCreationFailed.
    [[nodiscard]] static auto create(std::shared_ptr<Model> model, float sampleRate)
        -> Result<std::shared_ptr<Recognizer>>;

    /// @brief Creates a recognizer and applies @p options before returning it.
    [[nodiscard]] static auto create(std::shared_ptr<Model> model,
                                     float sampleRate,
                                     const RecognizerOptions& options) -> Result<std::shared_ptr<Recognizer>>;

    [[nodiscard]] auto setMaxAlternatives(int maxAlternatives) -> VoidResult;
    [[nodiscard]] auto setWords(bool enabled) -> VoidResult;
    [[nodiscard]] auto setPartialWords(bool enabled) -> VoidResult;

    /// @brief Feeds a chunk of PCM16LE mono bytes.
    ///
    /// The chunk length must be even. Zero-length chunks are forwarded as-is.
    /// A decode error is reported as WaveformStatus::Error, not as a failed Result.
    [[nodiscard]] auto acceptWaveform(std::span<const std::byte> audio) -> Result<WaveformStatus>;

    /// @brief Feeds a chunk of 16-bit samples in host byte order.
    [[nodiscard]] auto acceptWaveform(std::span<const std::int16_t> samples) -> Result<WaveformStatus>;

    /// @brief Returns the JSON result of the utterance that just ended.
    ///
    /// Finalizes the current utterance; the recognizer is Idle afterwards.
    [[nodiscard]] auto result() -> Result<std::string>;

    /// @brief Returns the JSON in-progress hypothesis.
    [[nodiscard]] auto partialResult() -> Result<std::string>;

    /// @brief Flushes buffered audio at end of stream and returns the JSON result.
    [[nodiscard]] auto finalResult() -> Result<std::string>;

    /// @brief Discards in-progress decoding state. Model, sample rate and options are kept.
    [[nodiscard]] auto reset() -> VoidResult;

    /// @brief Frees the native decoding state now. Idempotent.
    void release();

    [[nodiscard]] auto isReleased() const -> bool;
    [[nodiscard]] auto state() const -> RecognizerState;
    [[nodiscard]] auto options() const -> RecognizerOptions;
    [[nodiscard]] auto sampleRate() const -> float { return _sampleRate; }
    [[nodiscard]] auto model() const -> const std::shared_ptr<Model>& { return _model; }

  private:
    [[nodiscard]] auto releasedError() const -> Error;

    template <typename Fn>
    [[nodiscard]] auto readResult(Fn nativeCall, ResultRead read) -> Result<std::string>;

    std::shared_ptr<Model> _model;
    float _sampleRate;

    mutable std::mutex _mutex;
    VoskRecognizer* _native = nullptr;
    RecognizerOptions _options;
    RecognizerState _state = RecognizerState::Idle;
};

} // namespace vosklink
