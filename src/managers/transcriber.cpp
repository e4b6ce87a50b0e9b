#include "transcriber.hpp"
#include "session_log.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

CommandTranscriber::CommandTranscriber(TranscribeConfig config, int timeout_ms)
    : config_(std::move(config)), timeout_ms_(timeout_ms) {}

Result<std::string> CommandTranscriber::transcribe(const std::string& audio_bytes) {
    if (audio_bytes.empty()) return Result<std::string>::Err("empty audio");

    auto path = platform::temp_file("agentmux_audio", ".mp4");
    {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            return Result<std::string>::Err("cannot write " + path.string());
        }
        out.write(audio_bytes.data(), static_cast<std::streamsize>(audio_bytes.size()));
    }

    auto args = config_.args;
    args.push_back(path.string());
    auto r = platform::run_command(config_.command, args, timeout_ms_);
    agentmux_log_cmd("transcribe", config_.command, r);

    std::error_code ec;
    std::filesystem::remove(path, ec);

    if (r.failed()) {
        return Result<std::string>::Err(fmt::format("transcription exited with {}", r.exit_code));
    }
    std::string text = trimmed(r.stdout_data);
    if (text.empty()) return Result<std::string>::Err("empty transcription");
    return Result<std::string>::Ok(text);
}
