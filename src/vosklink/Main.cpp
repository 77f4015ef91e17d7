// SPDX-License-Identifier: Apache-2.0
#include <audio/WavReader.hpp>
#include <core/Log.hpp>
#include <runtime/Dispatcher.hpp>
#include <speech/Model.hpp>
#include <speech/Recognizer.hpp>
#include <speech/Transcript.hpp>
#include <vosklink/Config.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <format>
#include <optional>
#include <print>
#include <vector>

namespace
{

/// @brief Prints one result payload, raw or as plain text.
void printResult(std::string_view label, const std::string& json, bool raw)
{
    if (raw)
    {
        std::println("[{}] {}", label, json);
        return;
    }

    auto parsed = vosklink::parseFinalResult(json);
    if (!parsed)
    {
        vosklink::log::warning("Unreadable {} result: {}", label, parsed.error().message);
        return;
    }

    if (!parsed->text.empty())
        std::println("[{}] {}", label, parsed->text);

    for (auto const& word: parsed->words)
        std::println("    {:>8.2f} {:>8.2f} {:>5.2f}  {}", word.start, word.end, word.conf, word.word);
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "vosklink-transcribe - offline speech recognition with Vosk" };

    auto modelPath = std::string {};
    auto audioPath = std::string {};
    auto configPath = std::string {};
    auto sampleRate = 0.0f;
    auto chunkSize = std::size_t { 0 };
    auto maxAlternatives = -1;
    auto words = false;
    auto partialWords = false;
    auto showPartials = false;
    auto raw = false;
    auto nativeLogLevel = std::optional<int> {};
    auto verbose = false;

    app.add_option("-m,--model", modelPath, "Path to the Vosk model directory");
    app.add_option("audio", audioPath, "16-bit mono WAV file, or raw PCM16LE")->required()->check(CLI::ExistingFile);
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-r,--sample-rate", sampleRate, "Sample rate of raw PCM input in Hz");
    app.add_option("--chunk-size", chunkSize, "Bytes fed per acceptWaveform call");
    app.add_option("--max-alternatives", maxAlternatives, "Number of n-best alternatives");
    app.add_option("--native-log-level", nativeLogLevel, "libvosk log level (-1 silent, 0 default, >0 verbose)");
    app.add_flag("-w,--words", words, "Include word timings in results");
    app.add_flag("--partial-words", partialWords, "Include word entries in partial results");
    app.add_flag("-p,--partials", showPartials, "Print partial hypotheses while decoding");
    app.add_flag("--json", raw, "Print raw JSON results");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    auto configResult = configPath.empty() ? vosklink::loadConfig() : vosklink::loadConfigFromFile(configPath);
    if (!configResult)
    {
        vosklink::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.modelPath = modelPath;
    if (sampleRate > 0.0f)
        config.recognizer.sampleRate = sampleRate;
    if (chunkSize > 0)
        config.recognizer.chunkSize = chunkSize + chunkSize % 2;
    if (maxAlternatives >= 0)
        config.recognizer.options.maxAlternatives = maxAlternatives;
    if (words)
        config.recognizer.options.words = true;
    if (partialWords)
        config.recognizer.options.partialWords = true;
    if (nativeLogLevel)
        config.nativeLogLevel = *nativeLogLevel;
    if (verbose)
        config.logLevel = vosklink::log::Level::Debug;

    vosklink::initialize(config);

    if (config.modelPath.empty())
    {
        vosklink::log::error("No model directory given (--model or \"modelPath\" in config)");
        return 1;
    }

    auto audio = vosklink::readAudioFile(audioPath, static_cast<std::uint32_t>(config.recognizer.sampleRate));
    if (!audio)
    {
        vosklink::log::error("{}", audio.error().message);
        return 1;
    }

    auto dispatcher = vosklink::Dispatcher(config.dispatcher);

    auto model = dispatcher.loadModel(config.modelPath).get();
    if (!model)
    {
        vosklink::log::error("{} ({})", model.error().message, vosklink::errorCodeName(model.error().code));
        return 1;
    }

    auto recognizer = vosklink::Recognizer::create(
        *model, static_cast<float>(audio->sampleRate), config.recognizer.options);
    if (!recognizer)
    {
        vosklink::log::error("{} ({})",
                             recognizer.error().message,
                             vosklink::errorCodeName(recognizer.error().code));
        return 1;
    }

    vosklink::log::info("Decoding {} bytes at {} Hz", audio->bytes.size(), audio->sampleRate);

    auto const& bytes = audio->bytes;
    auto const step = config.recognizer.chunkSize;
    for (auto offset = std::size_t { 0 }; offset < bytes.size(); offset += step)
    {
        auto const end = std::min(bytes.size(), offset + step);
        auto chunk = std::vector<std::byte>(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                            bytes.begin() + static_cast<std::ptrdiff_t>(end));

        auto status = dispatcher.acceptWaveform(*recognizer, std::move(chunk)).get();
        if (!status)
        {
            vosklink::log::error("accept_waveform failed: {}", status.error().message);
            return 1;
        }

        switch (*status)
        {
            case vosklink::WaveformStatus::UtteranceEnded: {
                auto text = dispatcher.result(*recognizer).get();
                if (!text)
                {
                    vosklink::log::error("result failed: {}", text.error().message);
                    return 1;
                }
                printResult("utterance", *text, raw);
                break;
            }
            case vosklink::WaveformStatus::Continue: {
                if (!showPartials)
                    break;
                auto text = dispatcher.partialResult(*recognizer).get();
                if (!text)
                {
                    vosklink::log::warning("partial_result failed: {}", text.error().message);
                    break;
                }
                auto partial = vosklink::parsePartialResult(*text);
                if (raw)
                    std::println("[partial] {}", *text);
                else if (partial && !partial->partial.empty())
                    std::println("[partial] {}", partial->partial);
                break;
            }
            case vosklink::WaveformStatus::Error:
                vosklink::log::warning("Chunk at offset {} could not be decoded", offset);
                break;
        }
    }

    auto flushed = dispatcher.finalResult(*recognizer).get();
    if (!flushed)
    {
        vosklink::log::error("final_result failed: {}", flushed.error().message);
        return 1;
    }

    printResult("final", *flushed, raw);
    return 0;
}
