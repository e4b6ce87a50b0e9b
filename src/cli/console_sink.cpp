#include "console_sink.hpp"
#include "theme.hpp"

std::string render_delivery(const Delivery& delivery) {
    std::string out;
    for (size_t i = 0; i < delivery.chunks.size(); ++i) {
        if (i > 0) out += "\n---\n";
        out += delivery.chunks[i];
    }
    return out;
}

static std::string format_delivery(const Delivery& delivery) {
    std::string title = fmt::format("{} [{}]", delivery.conversation_id,
                                    delivery_kind_name(delivery.kind));
    std::string out = "\n";
    switch (delivery.kind) {
        case DeliveryKind::Response:
            out += theme::ok(title);
            break;
        case DeliveryKind::DecisionPrompt:
            out += theme::info(title + "  reply 'yes " + delivery.conversation_id +
                               "' or 'no " + delivery.conversation_id + "'");
            break;
        case DeliveryKind::Failure:
            out += theme::fail(title);
            break;
        case DeliveryKind::Superseded:
            out += theme::log(title);
            break;
    }

    std::string body = render_delivery(delivery);
    size_t start = 0;
    while (start <= body.size()) {
        size_t nl = body.find('\n', start);
        if (nl == std::string::npos) nl = body.size();
        out += "      " + body.substr(start, nl - start) + "\n";
        start = nl + 1;
    }
    return out;
}

ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::deliver(const Delivery& delivery) {
    std::string text = format_delivery(delivery);
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_) {
        pending_ += text;
        return;
    }
    out_ << text;
    out_.flush();
}

void ConsoleSink::hold_output(bool held) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = held;
    }
    if (!held) flush_pending();
}

bool ConsoleSink::flush_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) return false;
    out_ << pending_;
    out_.flush();
    pending_.clear();
    return true;
}
