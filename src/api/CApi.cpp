// SPDX-License-Identifier: Apache-2.0
#include "vosklink.h"

#include <core/Log.hpp>
#include <speech/ArgumentChecks.hpp>
#include <speech/Model.hpp>
#include <speech/NativeLog.hpp>
#include <speech/Recognizer.hpp>

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <string_view>

static_assert(VOSKLINK_MAX_PATH_LENGTH == vosklink::MaxPathLength);
static_assert(VOSKLINK_MAX_WORD_LENGTH == vosklink::MaxWordLength);

struct vosklink_model
{
    std::shared_ptr<vosklink::Model> model;
};

struct vosklink_recognizer
{
    std::shared_ptr<vosklink::Recognizer> recognizer;

    /// @brief Backing store for the last JSON text handed out.
    std::string json;
};

namespace
{

using vosklink::ErrorCode;

auto toStatus(ErrorCode code) -> vosklink_status
{
    switch (code)
    {
        case ErrorCode::InvalidArgument: return VOSKLINK_ERR_INVALID_ARGUMENT;
        case ErrorCode::ModelLoadFailed: return VOSKLINK_ERR_MODEL_LOAD_FAILED;
        case ErrorCode::RecognizerCreationFailed: return VOSKLINK_ERR_RECOGNIZER_CREATION_FAILED;
        case ErrorCode::ResourceReleased: return VOSKLINK_ERR_RESOURCE_RELEASED;
        default: return VOSKLINK_ERR_UNKNOWN;
    }
}

auto toStatus(const vosklink::VoidResult& result) -> vosklink_status
{
    return result ? VOSKLINK_OK : toStatus(result.error().code);
}

auto bytesOf(const char* data, std::size_t length) -> std::string_view
{
    return data ? std::string_view(data, length) : std::string_view {};
}

/// @brief Runs @p fn, turning an escaping exception into @p fallback.
template <typename T, typename Fn>
auto guarded(std::string_view call, T fallback, Fn fn) noexcept -> T
{
    try
    {
        return fn();
    }
    catch (const std::exception& e)
    {
        try
        {
            vosklink::log::error("{}: {}", call, e.what());
        }
        catch (const std::exception&)
        {
            // Logging itself failed; the status code still reports the failure.
        }
        return fallback;
    }
}

template <typename Fn>
auto storeJson(std::string_view call, vosklink_recognizer* handle, Fn read) -> const char*
{
    if (!handle)
        return nullptr;

    return guarded(call, static_cast<const char*>(nullptr), [&]() -> const char* {
        auto text = read(*handle->recognizer);
        if (!text)
        {
            vosklink::log::warning("{} failed: {}", call, text.error());
            return nullptr;
        }

        handle->json = std::move(*text);
        return handle->json.c_str();
    });
}

} // namespace

extern "C"
{

VOSKLINK_API const char* vosklink_status_name(vosklink_status status)
{
    switch (status)
    {
        case VOSKLINK_OK: return "ok";
        case VOSKLINK_ERR_INVALID_ARGUMENT: return "invalid_argument";
        case VOSKLINK_ERR_MODEL_LOAD_FAILED: return "model_load_failed";
        case VOSKLINK_ERR_RECOGNIZER_CREATION_FAILED: return "recognizer_creation_failed";
        case VOSKLINK_ERR_RESOURCE_RELEASED: return "resource_released";
        case VOSKLINK_ERR_UNKNOWN: return "unknown";
    }
    return "unknown";
}

VOSKLINK_API void vosklink_set_log_level(int level)
{
    guarded("vosklink_set_log_level", 0, [level] {
        vosklink::setNativeLogLevel(level);
        return 0;
    });
}

VOSKLINK_API vosklink_status vosklink_model_load(const char* path, size_t path_len, vosklink_model** out_model)
{
    if (!out_model || (!path && path_len > 0))
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    *out_model = nullptr;

    return guarded("vosklink_model_load", VOSKLINK_ERR_UNKNOWN, [&] {
        auto model = vosklink::Model::load(bytesOf(path, path_len));
        if (!model)
            return toStatus(model.error().code);

        *out_model = new vosklink_model { .model = std::move(*model) };
        return VOSKLINK_OK;
    });
}

VOSKLINK_API vosklink_status vosklink_model_find_word(const vosklink_model* model,
                                                      const char* word,
                                                      size_t word_len,
                                                      int* out_symbol)
{
    if (!model || !out_symbol || (!word && word_len > 0))
        return VOSKLINK_ERR_INVALID_ARGUMENT;

    return guarded("vosklink_model_find_word", VOSKLINK_ERR_UNKNOWN, [&] {
        auto symbol = model->model->findWord(bytesOf(word, word_len));
        if (!symbol)
            return toStatus(symbol.error().code);

        *out_symbol = *symbol;
        return VOSKLINK_OK;
    });
}

VOSKLINK_API void vosklink_model_release(vosklink_model* model)
{
    if (!model)
        return;
    guarded("vosklink_model_release", 0, [model] {
        model->model->release();
        return 0;
    });
}

VOSKLINK_API void vosklink_model_free(vosklink_model* model)
{
    delete model;
}

VOSKLINK_API vosklink_status vosklink_recognizer_create(const vosklink_model* model,
                                                        float sample_rate,
                                                        vosklink_recognizer** out_recognizer)
{
    if (!model || !out_recognizer)
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    *out_recognizer = nullptr;

    return guarded("vosklink_recognizer_create", VOSKLINK_ERR_UNKNOWN, [&] {
        auto recognizer = vosklink::Recognizer::create(model->model, sample_rate);
        if (!recognizer)
            return toStatus(recognizer.error().code);

        *out_recognizer = new vosklink_recognizer { .recognizer = std::move(*recognizer), .json = {} };
        return VOSKLINK_OK;
    });
}

VOSKLINK_API vosklink_status vosklink_recognizer_set_max_alternatives(vosklink_recognizer* recognizer,
                                                                      int max_alternatives)
{
    if (!recognizer)
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    return guarded("vosklink_recognizer_set_max_alternatives", VOSKLINK_ERR_UNKNOWN, [&] {
        return toStatus(recognizer->recognizer->setMaxAlternatives(max_alternatives));
    });
}

VOSKLINK_API vosklink_status vosklink_recognizer_set_words(vosklink_recognizer* recognizer, int enabled)
{
    if (!recognizer)
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    return guarded("vosklink_recognizer_set_words", VOSKLINK_ERR_UNKNOWN, [&] {
        return toStatus(recognizer->recognizer->setWords(enabled != 0));
    });
}

VOSKLINK_API vosklink_status vosklink_recognizer_set_partial_words(vosklink_recognizer* recognizer, int enabled)
{
    if (!recognizer)
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    return guarded("vosklink_recognizer_set_partial_words", VOSKLINK_ERR_UNKNOWN, [&] {
        return toStatus(recognizer->recognizer->setPartialWords(enabled != 0));
    });
}

VOSKLINK_API vosklink_status vosklink_recognizer_accept_waveform(vosklink_recognizer* recognizer,
                                                                 const void* data,
                                                                 size_t length,
                                                                 int* out_signal)
{
    if (!recognizer || !out_signal || (!data && length > 0))
        return VOSKLINK_ERR_INVALID_ARGUMENT;

    return guarded("vosklink_recognizer_accept_waveform", VOSKLINK_ERR_UNKNOWN, [&] {
        auto const audio = std::span<const std::byte>(static_cast<const std::byte*>(data), data ? length : 0);
        auto status = recognizer->recognizer->acceptWaveform(audio);
        if (!status)
            return toStatus(status.error().code);

        *out_signal = vosklink::waveformStatusCode(*status);
        return VOSKLINK_OK;
    });
}

VOSKLINK_API const char* vosklink_recognizer_result(vosklink_recognizer* recognizer)
{
    return storeJson("vosklink_recognizer_result", recognizer, [](vosklink::Recognizer& rec) { return rec.result(); });
}

VOSKLINK_API const char* vosklink_recognizer_partial_result(vosklink_recognizer* recognizer)
{
    return storeJson("vosklink_recognizer_partial_result", recognizer, [](vosklink::Recognizer& rec) { return rec.partialResult(); });
}

VOSKLINK_API const char* vosklink_recognizer_final_result(vosklink_recognizer* recognizer)
{
    return storeJson("vosklink_recognizer_final_result", recognizer, [](vosklink::Recognizer& rec) { return rec.finalResult(); });
}

VOSKLINK_API vosklink_status vosklink_recognizer_reset(vosklink_recognizer* recognizer)
{
    if (!recognizer)
        return VOSKLINK_ERR_INVALID_ARGUMENT;
    return guarded("vosklink_recognizer_reset", VOSKLINK_ERR_UNKNOWN, [&] {
        return toStatus(recognizer->recognizer->reset());
    });
}

VOSKLINK_API void vosklink_recognizer_release(vosklink_recognizer* recognizer)
{
    if (!recognizer)
        return;
    guarded("vosklink_recognizer_release", 0, [recognizer] {
        recognizer->recognizer->release();
        return 0;
    });
}

VOSKLINK_API void vosklink_recognizer_free(vosklink_recognizer* recognizer)
{
    delete recognizer;
}

} // extern "C"
