// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/WavReader.hpp>
#include <speech/Model.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vosklink::test
{

/// @brief Reads an environment variable, treating empty values as unset.
inline auto env(const char* name) -> std::optional<std::string>
{
    auto const* value = std::getenv(name);
    if (!value || *value == '\0')
        return std::nullopt;
    return std::string(value);
}

/// @brief Returns the fixture model, loading it once per test run.
///
/// Skips the calling test when VOSKLINK_TEST_MODEL is not set.
inline auto fixtureModel() -> std::shared_ptr<Model>
{
    auto const path = env("VOSKLINK_TEST_MODEL");
    if (!path)
        SKIP("VOSKLINK_TEST_MODEL is not set");

    static auto cached = std::shared_ptr<Model> {};
    if (!cached)
    {
        auto loaded = Model::load(*path);
        REQUIRE(loaded.has_value());
        cached = std::move(*loaded);
    }
    return cached;
}

/// @brief Returns the fixture speech recording.
///
/// Skips the calling test when VOSKLINK_TEST_AUDIO is not set.
inline auto fixtureAudio() -> PcmAudio
{
    auto const path = env("VOSKLINK_TEST_AUDIO");
    if (!path)
        SKIP("VOSKLINK_TEST_AUDIO is not set");

    auto audio = readAudioFile(*path, 16000);
    REQUIRE(audio.has_value());
    return std::move(*audio);
}

/// @brief Returns @p samples zero samples as PCM16LE bytes.
inline auto silence(std::size_t samples) -> std::vector<std::byte>
{
    return std::vector<std::byte>(samples * 2, std::byte { 0 });
}

/// @brief Returns a 16 kHz mono WAV image holding @p samples.
inline auto makeWav(const std::vector<std::int16_t>& samples,
                    std::uint32_t sampleRate = 16000,
                    std::uint16_t channels = 1,
                    std::uint16_t bitsPerSample = 16) -> std::vector<std::byte>
{
    auto out = std::vector<std::byte> {};
    auto put = [&out](std::uint32_t value, int bytes) {
        for (auto i = 0; i < bytes; ++i)
            out.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
    };
    auto tag = [&out](const char* text) {
        for (auto i = 0; i < 4; ++i)
            out.push_back(static_cast<std::byte>(text[i]));
    };

    auto const dataSize = static_cast<std::uint32_t>(samples.size() * 2);
    tag("RIFF");
    put(36 + dataSize, 4);
    tag("WAVE");
    tag("fmt ");
    put(16, 4);
    put(1, 2);
    put(channels, 2);
    put(sampleRate, 4);
    put(sampleRate * channels * bitsPerSample / 8, 4);
    put(static_cast<std::uint32_t>(channels * bitsPerSample / 8), 2);
    put(bitsPerSample, 2);
    tag("data");
    put(dataSize, 4);
    for (auto const sample: samples)
        put(static_cast<std::uint16_t>(sample), 2);
    return out;
}

} // namespace vosklink::test
