// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vosklink
{

/// @brief Timing and confidence of one recognized word, times in seconds.
struct WordTiming
{
    std::string word;
    double start = 0.0;
    double end = 0.0;
    double conf = 1.0;
};

/// @brief One n-best hypothesis, present when max alternatives is non-zero.
struct Alternative
{
    std::string text;
    double confidence = 0.0;
    std::vector<WordTiming> words;
};

/// @brief Decoded result()/finalResult() payload.
struct FinalResult
{
    /// @brief Recognized text; with alternatives enabled, the text of the best one.
    std::string text;

    /// @brief Per-word entries, filled when word timing is enabled.
    std::vector<WordTiming> words;

    /// @brief N-best list, filled when max alternatives is non-zero.
    std::vector<Alternative> alternatives;

    [[nodiscard]] auto hasWords() const -> bool { return !words.empty(); }
    [[nodiscard]] auto hasAlternatives() const -> bool { return !alternatives.empty(); }
};

/// @brief Decoded partialResult() payload.
struct PartialResult
{
    std::string partial;

    /// @brief Per-word entries, filled when partial word timing is enabled.
    std::vector<WordTiming> words;
};

/// @brief Parses the JSON returned by Recognizer::result() or Recognizer::finalResult().
///
/// Accepts {"text"}, {"result": [...], "text"} and {"alternatives": [...]}.
/// @return The decoded result, or ResultParseError for malformed JSON or a non-object document.
[[nodiscard]] auto parseFinalResult(std::string_view json) -> Result<FinalResult>;

/// @brief Parses the JSON returned by Recognizer::partialResult().
///
/// Accepts {"partial"} and {"partial", "partial_result": [...]}.
[[nodiscard]] auto parsePartialResult(std::string_view json) -> Result<PartialResult>;

} // namespace vosklink
