#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

class SessionController;
class Transcriber;

struct Attachment {
    std::string mime_type;    // "audio/mp4", "image/png", ...
    std::string data;
};

// Raw chat message as the chat adapter sees it.
struct InboundMessage {
    std::string channel;            // channel name, selects the repository
    std::string conversation_id;    // thread key
    std::string text;
    std::string target;             // reply address for the sink
    std::string request_id;         // id of this message
    std::vector<Attachment> attachments;
};

enum class RouteOutcome {
    Ignored,          // nothing left to say after cleanup
    UnknownChannel,
    Submitted,        // text sent to the agent
    StartFailed,
    Decided,          // y/n forwarded to a pending prompt
    NothingToDecide,
    Terminated,
};

const char* route_outcome_name(RouteOutcome outcome);

// Text after mention and flag removal, plus the mode the flags asked for.
struct ParsedText {
    std::string text;
    SessionMode mode = SessionMode::Normal;
};

// "<@U123> fix it --auto" → {"fix it", Auto}
ParsedText parse_message_text(const std::string& raw);

// Turns chat messages into controller commands.
class MessageRouter {
public:
    // transcriber may be null: audio attachments are then ignored.
    MessageRouter(const Config& config, SessionController& controller,
                  Transcriber* transcriber = nullptr);

    RouteOutcome route(const InboundMessage& message);

private:
    std::string transcribe_attachments(const InboundMessage& message);

    const Config& config_;
    SessionController& controller_;
    Transcriber* transcriber_;
};
