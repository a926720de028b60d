#include "smtp_message.hpp"
#include "smtp_commands.hpp"

#include <ctime>
#include <format>
#include <iomanip>
#include <locale>
#include <sstream>

namespace mailprobe::smtp {

namespace {

// Bare CR and bare LF both become CRLF
std::string normalize_line_endings(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 16);

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out += "\r\n";
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else if (c == '\n') {
            out += "\r\n";
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace

std::string generate_message_id(std::string_view host, std::chrono::system_clock::time_point now) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
    std::string domain = command::sanitize(host);
    if (domain.empty()) {
        domain = "smtpprobe.local";
    }
    return std::format("{}.smtpprobe@{}", nanos, domain);
}

std::string format_rfc5322_date(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S %z");
    return ss.str();
}

ComposedMessage compose_message(std::string_view from,
                                const std::vector<std::string>& to,
                                std::string_view subject,
                                std::string_view body,
                                std::string_view host,
                                std::chrono::system_clock::time_point now) {
    ComposedMessage message;
    message.message_id = generate_message_id(host, now);

    std::string recipients;
    for (const auto& addr : to) {
        if (!recipients.empty()) recipients += ", ";
        recipients += command::sanitize(addr);
    }

    std::string& out = message.content;
    out += "Message-ID: <" + message.message_id + ">\r\n";
    out += "Date: " + format_rfc5322_date(now) + "\r\n";
    out += "From: " + command::sanitize(from) + "\r\n";
    out += "To: " + recipients + "\r\n";
    out += "Subject: " + command::sanitize(subject) + "\r\n";
    out += "\r\n";
    out += normalize_line_endings(body);
    return message;
}

std::string dot_stuff(std::string_view content) {
    std::string normalized = normalize_line_endings(content);
    std::string out;
    out.reserve(normalized.size() + 8);

    bool line_start = true;
    for (size_t i = 0; i < normalized.size(); ++i) {
        char c = normalized[i];
        if (line_start && c == '.') {
            out += '.';
        }
        out += c;
        line_start = (c == '\n');
    }

    if (!out.empty() && !(out.size() >= 2 && out.compare(out.size() - 2, 2, "\r\n") == 0)) {
        out += "\r\n";
    }
    out += ".\r\n";
    return out;
}

}  // namespace mailprobe::smtp
