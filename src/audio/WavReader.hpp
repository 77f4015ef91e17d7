// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace vosklink
{

/// @brief PCM16LE mono audio ready to be fed into a recognizer.
struct PcmAudio
{
    std::uint32_t sampleRate = 0;
    std::vector<std::byte> bytes;

    [[nodiscard]] auto sampleCount() const -> std::size_t { return bytes.size() / 2; }
};

/// @brief Decodes a RIFF/WAVE image holding 16-bit PCM mono audio.
/// @return The data chunk and sample rate, or AudioFormatError.
[[nodiscard]] auto decodeWav(std::span<const std::byte> image) -> Result<PcmAudio>;

/// @brief Reads a WAV file, or a headerless raw PCM16LE file when the name does not end in ".wav".
/// @param path File to read.
/// @param rawSampleRate Sample rate assumed for raw files.
[[nodiscard]] auto readAudioFile(std::string_view path, std::uint32_t rawSampleRate) -> Result<PcmAudio>;

} // namespace vosklink
