#pragma once

#include <string>
#include <core/types.hpp>

// Speech to text for voice notes attached to chat messages.
class Transcriber {
public:
    virtual ~Transcriber() = default;
    virtual Result<std::string> transcribe(const std::string& audio_bytes) = 0;
};

// Writes the audio to a temp file and runs an external command on it
// (by default the agent CLI in print mode). The file path is appended
// as the last argument.
class CommandTranscriber : public Transcriber {
public:
    explicit CommandTranscriber(TranscribeConfig config, int timeout_ms = 60000);

    Result<std::string> transcribe(const std::string& audio_bytes) override;

private:
    TranscribeConfig config_;
    int timeout_ms_;
};
