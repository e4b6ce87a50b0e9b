#include "message_router.hpp"
#include "session_controller.hpp"
#include "session_log.hpp"
#include "transcriber.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <regex>

const char* route_outcome_name(RouteOutcome outcome) {
    switch (outcome) {
        case RouteOutcome::Ignored:         return "ignored";
        case RouteOutcome::UnknownChannel:  return "unknown channel";
        case RouteOutcome::Submitted:       return "submitted";
        case RouteOutcome::StartFailed:     return "start failed";
        case RouteOutcome::Decided:         return "decided";
        case RouteOutcome::NothingToDecide: return "nothing to decide";
        case RouteOutcome::Terminated:      return "terminated";
    }
    return "unknown";
}

ParsedText parse_message_text(const std::string& raw) {
    static const std::regex mention_re(R"(<@[A-Z0-9]+>)", std::regex::icase);
    static const std::regex dangerous_re(R"(--(dangerous|yolo)\b)", std::regex::icase);
    static const std::regex auto_re(R"(--auto\b)", std::regex::icase);
    static const std::regex flag_re(R"(--(dangerous|yolo|auto)\b)", std::regex::icase);
    static const std::regex spaces_re(R"([ \t]{2,})");

    ParsedText out;
    std::string text = std::regex_replace(raw, mention_re, "");

    if (std::regex_search(text, dangerous_re)) {
        out.mode = SessionMode::Dangerous;
    } else if (std::regex_search(text, auto_re)) {
        out.mode = SessionMode::Auto;
    }

    text = std::regex_replace(text, flag_re, "");
    text = std::regex_replace(text, spaces_re, " ");
    out.text = trimmed(text);
    return out;
}

MessageRouter::MessageRouter(const Config& config, SessionController& controller,
                             Transcriber* transcriber)
    : config_(config), controller_(controller), transcriber_(transcriber) {}

std::string MessageRouter::transcribe_attachments(const InboundMessage& message) {
    std::string spoken;
    if (!transcriber_) return spoken;

    for (const auto& a : message.attachments) {
        if (!starts_with(a.mime_type, "audio/")) continue;
        auto r = transcriber_->transcribe(a.data);
        if (r.is_err()) {
            agentmux_log(fmt::format("router: transcription for {} failed: {}",
                                     message.conversation_id, r.error));
            continue;
        }
        if (!spoken.empty()) spoken += " ";
        spoken += r.value;
    }
    return spoken;
}

RouteOutcome MessageRouter::route(const InboundMessage& message) {
    const ChannelConfig* channel = config_.find_channel(message.channel);
    if (!channel) {
        agentmux_log(fmt::format("router: no repository bound to channel '{}'", message.channel));
        return RouteOutcome::UnknownChannel;
    }

    ParsedText parsed = parse_message_text(message.text);

    // Short replies steer an existing session instead of being typed into it.
    if (controller_.registry().find(message.conversation_id)) {
        std::string word = to_lower(parsed.text);
        if (word == "y" || word == "yes" || word == "n" || word == "no") {
            bool accept = word[0] == 'y';
            return controller_.decide(message.conversation_id, accept)
                ? RouteOutcome::Decided : RouteOutcome::NothingToDecide;
        }
        if (word == "end" || word == "/end") {
            controller_.terminate(message.conversation_id);
            return RouteOutcome::Terminated;
        }
    }

    std::string spoken = transcribe_attachments(message);
    if (!spoken.empty()) {
        parsed.text = parsed.text.empty() ? spoken : parsed.text + " " + spoken;
    }
    if (parsed.text.empty()) return RouteOutcome::Ignored;

    StartRequest req;
    req.conversation_id = message.conversation_id;
    req.working_dir = channel->working_dir;
    req.session_prefix = channel->prefix;
    req.text = parsed.text;
    req.mode = parsed.mode;
    req.target = message.target;
    req.request_id = message.request_id;

    auto r = controller_.start_or_continue(req);
    if (r.is_err()) {
        agentmux_log(fmt::format("router: {} not submitted: {}", message.conversation_id, r.error));
        return RouteOutcome::StartFailed;
    }
    return RouteOutcome::Submitted;
}
