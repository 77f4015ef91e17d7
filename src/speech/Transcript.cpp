// SPDX-License-Identifier: Apache-2.0
#include "Transcript.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

namespace vosklink
{

namespace
{

    auto parseObject(std::string_view text) -> Result<nlohmann::json>
    {
        auto parsed = json::parse(text, ErrorCode::ResultParseError);
        if (!parsed)
            return parsed;
        if (!parsed->is_object())
            return makeError(ErrorCode::ResultParseError, "Recognizer result is not a JSON object");
        return parsed;
    }

    auto parseWords(const nlohmann::json& obj, std::string_view key) -> std::vector<WordTiming>
    {
        auto words = std::vector<WordTiming> {};

        auto const it = obj.find(key);
        if (it == obj.end() || !it->is_array())
            return words;

        words.reserve(it->size());
        for (auto const& entry: *it)
        {
            if (!entry.is_object())
                continue;

            words.push_back(WordTiming {
                .word = json::getStringOr(entry, "word", ""),
                .start = json::getDoubleOr(entry, "start", 0.0),
                .end = json::getDoubleOr(entry, "end", 0.0),
                .conf = json::getDoubleOr(entry, "conf", 1.0),
            });
        }
        return words;
    }

} // namespace

auto parseFinalResult(std::string_view text) -> Result<FinalResult>
{
    auto parsed = parseObject(text);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    auto result = FinalResult {
        .text = json::getStringOr(root, "text", ""),
        .words = parseWords(root, "result"),
        .alternatives = {},
    };

    if (auto const it = root.find("alternatives"); it != root.end() && it->is_array())
    {
        for (auto const& entry: *it)
        {
            if (!entry.is_object())
                continue;

            result.alternatives.push_back(Alternative {
                .text = json::getStringOr(entry, "text", ""),
                .confidence = json::getDoubleOr(entry, "confidence", 0.0),
                .words = parseWords(entry, "result"),
            });
        }

        if (!result.alternatives.empty() && result.text.empty())
            result.text = result.alternatives.front().text;
    }

    return result;
}

auto parsePartialResult(std::string_view text) -> Result<PartialResult>
{
    auto parsed = parseObject(text);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    return PartialResult {
        .partial = json::getStringOr(root, "partial", ""),
        .words = parseWords(root, "partial_result"),
    };
}

} // namespace vosklink
