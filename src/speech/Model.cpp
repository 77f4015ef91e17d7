// SPDX-License-Identifier: Apache-2.0
#include "Model.hpp"

#include <core/Log.hpp>
#include <speech/ArgumentChecks.hpp>

#include <vosk_api.h>

#include <format>

namespace vosklink
{

Model::Model(PrivateTag, std::string path, VoskModel* native): _path(std::move(path)), _native(native)
{
}

Model::~Model()
{
    release();
}

auto Model::load(std::string_view path) -> Result<std::shared_ptr<Model>>
{
    if (auto check = checkNativeString(path, MaxPathLength, "Model path"); !check)
        return std::unexpected(check.error());

    auto pathStr = std::string(path);
    log::debug("Loading Vosk model from {}", pathStr);

    auto* native = vosk_model_new(pathStr.c_str());
    if (!native)
        return makeError(ErrorCode::ModelLoadFailed, std::format("Failed to load Vosk model: {}", pathStr));

    log::info("Vosk model loaded: {}", pathStr);
    return std::make_shared<Model>(PrivateTag {}, std::move(pathStr), native);
}

auto Model::findWord(std::string_view word) const -> Result<int>
{
    if (auto check = checkNativeString(word, MaxWordLength, "Word"); !check)
        return std::unexpected(check.error());

    auto access = acquire();
    if (!access.model)
        return makeError(ErrorCode::ResourceReleased, std::format("Model {} has been released", _path));

    auto const wordStr = std::string(word);
    return vosk_model_find_word(access.model, wordStr.c_str());
}

void Model::release()
{
    auto lock = std::unique_lock(_mutex);
    if (!_native)
        return;

    vosk_model_free(_native);
    _native = nullptr;
    log::debug("Vosk model released: {}", _path);
}

auto Model::isReleased() const -> bool
{
    auto lock = std::shared_lock(_mutex);
    return _native == nullptr;
}

auto Model::path() const -> const std::string&
{
    return _path;
}

auto Model::acquire() const -> NativeAccess
{
    auto lock = std::shared_lock(_mutex);
    auto* native = _native;
    return NativeAccess { .lock = std::move(lock), .model = native };
}

} // namespace vosklink
