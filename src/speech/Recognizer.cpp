// SPDX-License-Identifier: Apache-2.0
#include "Recognizer.hpp"

#include <core/Log.hpp>
#include <speech/ArgumentChecks.hpp>

#include <vosk_api.h>

#include <format>
#include <limits>

namespace vosklink
{

namespace
{

    constexpr auto MaxChunkBytes = static_cast<std::size_t>(std::numeric_limits<int>::max());

} // namespace

Recognizer::Recognizer(PrivateTag, std::shared_ptr<Model> model, float sampleRate, VoskRecognizer* native):
    _model(std::move(model)), _sampleRate(sampleRate), _native(native)
{
}

Recognizer::~Recognizer()
{
    release();
}

auto Recognizer::create(std::shared_ptr<Model> model, float sampleRate) -> Result<std::shared_ptr<Recognizer>>
{
    if (!model)
        return makeError(ErrorCode::InvalidArgument, "Cannot create a recognizer without a model");

    if (auto check = checkSampleRate(sampleRate); !check)
        return std::unexpected(check.error());

    auto* native = static_cast<VoskRecognizer*>(nullptr);
    {
        // Hold the model pinned only while libvosk takes its own reference.
        auto access = model->acquire();
        if (!access.model)
            return makeError(ErrorCode::ResourceReleased,
                             std::format("Model {} has been released", model->path()));

        native = vosk_recognizer_new(access.model, sampleRate);
    }

    if (!native)
        return makeError(ErrorCode::RecognizerCreationFailed,
                         std::format("Failed to create recognizer at {} Hz for model {}", sampleRate, model->path()));

    log::debug("Recognizer created at {} Hz", sampleRate);
    return std::make_shared<Recognizer>(PrivateTag {}, std::move(model), sampleRate, native);
}

auto Recognizer::create(std::shared_ptr<Model> model, float sampleRate, const RecognizerOptions& options)
    -> Result<std::shared_ptr<Recognizer>>
{
    auto recognizer = create(std::move(model), sampleRate);
    if (!recognizer)
        return recognizer;

    auto& rec = **recognizer;
    if (options.maxAlternatives != 0)
        if (auto result = rec.setMaxAlternatives(options.maxAlternatives); !result)
            return std::unexpected(result.error());
    if (options.words)
        if (auto result = rec.setWords(true); !result)
            return std::unexpected(result.error());
    if (options.partialWords)
        if (auto result = rec.setPartialWords(true); !result)
            return std::unexpected(result.error());

    return recognizer;
}

auto Recognizer::setMaxAlternatives(int maxAlternatives) -> VoidResult
{
    if (maxAlternatives < 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Max alternatives must not be negative, got {}", maxAlternatives));

    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    vosk_recognizer_set_max_alternatives(_native, maxAlternatives);
    _options.maxAlternatives = maxAlternatives;
    return {};
}

auto Recognizer::setWords(bool enabled) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    vosk_recognizer_set_words(_native, enabled ? 1 : 0);
    _options.words = enabled;
    return {};
}

auto Recognizer::setPartialWords(bool enabled) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    vosk_recognizer_set_partial_words(_native, enabled ? 1 : 0);
    _options.partialWords = enabled;
    return {};
}

auto Recognizer::acceptWaveform(std::span<const std::byte> audio) -> Result<WaveformStatus>
{
    if (audio.size() % 2 != 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("PCM16 chunk must have an even length, got {} bytes", audio.size()));
    if (audio.size() > MaxChunkBytes)
        return makeError(ErrorCode::InvalidArgument, std::format("Audio chunk too large: {} bytes", audio.size()));

    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    auto const code = vosk_recognizer_accept_waveform(
        _native, reinterpret_cast<const char*>(audio.data()), static_cast<int>(audio.size()));

    auto const status = waveformStatusFromCode(code);
    if (status == WaveformStatus::Error)
        log::warning("libvosk rejected a {} byte chunk (code {})", audio.size(), code);

    _state = nextState(_state, status);
    return status;
}

auto Recognizer::acceptWaveform(std::span<const std::int16_t> samples) -> Result<WaveformStatus>
{
    if (samples.size() > MaxChunkBytes)
        return makeError(ErrorCode::InvalidArgument, std::format("Audio chunk too large: {} samples", samples.size()));

    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    auto const code = vosk_recognizer_accept_waveform_s(
        _native, reinterpret_cast<const short*>(samples.data()), static_cast<int>(samples.size()));

    auto const status = waveformStatusFromCode(code);
    if (status == WaveformStatus::Error)
        log::warning("libvosk rejected {} samples (code {})", samples.size(), code);

    _state = nextState(_state, status);
    return status;
}

template <typename Fn>
auto Recognizer::readResult(Fn nativeCall, ResultRead read) -> Result<std::string>
{
    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    // The returned buffer belongs to libvosk and is overwritten by the next call.
    auto const* json = nativeCall(_native);
    if (!json)
        return makeError(ErrorCode::Unknown, "libvosk returned no result");

    auto const previous = _state;
    _state = stateAfterRead(_state, read);
    if (_state != previous)
        log::trace("Recognizer {} -> {}", recognizerStateName(previous), recognizerStateName(_state));

    return std::string(json);
}

auto Recognizer::result() -> Result<std::string>
{
    return readResult(vosk_recognizer_result, ResultRead::Utterance);
}

auto Recognizer::partialResult() -> Result<std::string>
{
    return readResult(vosk_recognizer_partial_result, ResultRead::Partial);
}

auto Recognizer::finalResult() -> Result<std::string>
{
    return readResult(vosk_recognizer_final_result, ResultRead::Flush);
}

auto Recognizer::reset() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return std::unexpected(releasedError());

    vosk_recognizer_reset(_native);
    _state = RecognizerState::Idle;
    return {};
}

void Recognizer::release()
{
    auto lock = std::lock_guard(_mutex);
    if (!_native)
        return;

    vosk_recognizer_free(_native);
    _native = nullptr;
    _state = RecognizerState::Idle;
    log::debug("Recognizer released");
}

auto Recognizer::isReleased() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _native == nullptr;
}

auto Recognizer::state() const -> RecognizerState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto Recognizer::options() const -> RecognizerOptions
{
    auto lock = std::lock_guard(_mutex);
    return _options;
}

auto Recognizer::releasedError() const -> Error
{
    return Error { ErrorCode::ResourceReleased, "Recognizer has been released" };
}

} // namespace vosklink
