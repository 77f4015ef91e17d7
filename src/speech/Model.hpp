// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

struct VoskModel;

namespace vosklink
{

class Recognizer;

/// @brief A loaded Vosk model: acoustic model, language model and vocabulary graph.
///
/// Models are immutable once loaded and may be shared by any number of recognizers
/// and threads. Ownership is shared: every Recognizer keeps its Model alive.
/// The native model is freed exactly once, either by release() or when the last
/// owner goes away.
class Model
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    Model(PrivateTag, std::string path, VoskModel* native);
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    /// @brief Loads a model from a directory.
    /// @param path Model directory, at most MaxPathLength bytes.
    /// @return The loaded model, InvalidArgument for a malformed path, or ModelLoadFailed.
    [[nodiscard]] static auto load(std::string_view path) -> Result<std::shared_ptr<Model>>;

    /// @brief Looks up @p word in the model's vocabulary.
    /// @return The symbol id (>= 0), or -1 if the word is unknown.
    [[nodiscard]] auto findWord(std::string_view word) const -> Result<int>;

    /// @brief Frees the native model now. Idempotent.
    ///
    /// Waits for concurrent findWord() calls to return. Recognizers created earlier
    /// keep working because libvosk reference-counts the model internally.
    void release();

    [[nodiscard]] auto isReleased() const -> bool;

    /// @brief Returns the directory the model was loaded from.
    [[nodiscard]] auto path() const -> const std::string&;

  private:
    friend class Recognizer;

    /// @brief Native pointer pinned against release() for the lifetime of the lock.
    struct NativeAccess
    {
        std::shared_lock<std::shared_mutex> lock;
        VoskModel* model = nullptr;
    };

    [[nodiscard]] auto acquire() const -> NativeAccess;

    std::string _path;
    mutable std::shared_mutex _mutex;
    VoskModel* _native = nullptr;
};

} // namespace vosklink
