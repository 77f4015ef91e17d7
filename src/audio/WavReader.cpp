// SPDX-License-Identifier: Apache-2.0
#include "WavReader.hpp"

#include <core/Log.hpp>

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <string>

namespace vosklink
{

namespace
{

    constexpr auto PcmFormatTag = std::uint16_t { 1 };

    auto readLe16(std::span<const std::byte> data, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>(std::to_integer<unsigned>(data[offset])
                                          | (std::to_integer<unsigned>(data[offset + 1]) << 8));
    }

    auto readLe32(std::span<const std::byte> data, std::size_t offset) -> std::uint32_t
    {
        return static_cast<std::uint32_t>(readLe16(data, offset))
               | (static_cast<std::uint32_t>(readLe16(data, offset + 2)) << 16);
    }

    auto hasTag(std::span<const std::byte> data, std::size_t offset, std::string_view tag) -> bool
    {
        return offset + tag.size() <= data.size() && std::memcmp(data.data() + offset, tag.data(), tag.size()) == 0;
    }

    auto formatError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::AudioFormatError, std::move(message));
    }

} // namespace

auto decodeWav(std::span<const std::byte> image) -> Result<PcmAudio>
{
    if (image.size() < 12 || !hasTag(image, 0, "RIFF") || !hasTag(image, 8, "WAVE"))
        return formatError("Not a RIFF/WAVE file");

    auto audio = PcmAudio {};
    auto haveFormat = false;
    auto offset = std::size_t { 12 };

    while (offset + 8 <= image.size())
    {
        auto const chunkSize = static_cast<std::size_t>(readLe32(image, offset + 4));
        auto const body = offset + 8;
        if (chunkSize > image.size() - body)
            return formatError(std::format("Truncated chunk at offset {}", offset));

        if (hasTag(image, offset, "fmt "))
        {
            if (chunkSize < 16)
                return formatError("fmt chunk too short");

            auto const formatTag = readLe16(image, body);
            auto const channels = readLe16(image, body + 2);
            auto const bitsPerSample = readLe16(image, body + 14);
            audio.sampleRate = readLe32(image, body + 4);

            if (formatTag != PcmFormatTag)
                return formatError(std::format("Unsupported WAV encoding {}, expected PCM", formatTag));
            if (channels != 1)
                return formatError(std::format("Expected mono audio, got {} channels", channels));
            if (bitsPerSample != 16)
                return formatError(std::format("Expected 16-bit samples, got {}", bitsPerSample));
            if (audio.sampleRate == 0)
                return formatError("WAV sample rate is zero");

            haveFormat = true;
        }
        else if (hasTag(image, offset, "data"))
        {
            if (!haveFormat)
                return formatError("data chunk precedes fmt chunk");

            auto const usable = chunkSize - chunkSize % 2;
            auto const first = image.begin() + static_cast<std::ptrdiff_t>(body);
            audio.bytes.assign(first, first + static_cast<std::ptrdiff_t>(usable));
            return audio;
        }

        // Chunks are word aligned.
        offset = body + chunkSize + chunkSize % 2;
    }

    return formatError("WAV file has no data chunk");
}

auto readAudioFile(std::string_view path, std::uint32_t rawSampleRate) -> Result<PcmAudio>
{
    auto const pathStr = std::string(path);
    auto file = std::ifstream(pathStr, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open audio file: {}", path));

    auto raw = std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    auto const bytes = std::as_bytes(std::span<const char>(raw));

    if (path.ends_with(".wav") || path.ends_with(".WAV"))
    {
        auto decoded = decodeWav(bytes);
        if (decoded)
            log::debug("{}: {} Hz, {} samples", path, decoded->sampleRate, decoded->sampleCount());
        return decoded;
    }

    auto audio = PcmAudio { .sampleRate = rawSampleRate, .bytes = {} };
    audio.bytes.assign(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - bytes.size() % 2));
    return audio;
}

} // namespace vosklink
