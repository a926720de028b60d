#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace mailprobe::smtp {

struct ComposedMessage {
    std::string message_id;  // without angle brackets
    std::string content;     // headers, blank line, body; CRLF line endings
};

// "<unix-nanoseconds>.smtpprobe@<host>"
std::string generate_message_id(std::string_view host,
                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// RFC 5322 date-time in local time, e.g. "Tue, 02 Jan 2024 15:04:05 +0100".
std::string format_rfc5322_date(std::chrono::system_clock::time_point when);

// Headers are Message-ID, Date, From, To, Subject in that order. Header
// values lose any CR/LF; body line endings are normalised to CRLF.
ComposedMessage compose_message(std::string_view from,
                                const std::vector<std::string>& to,
                                std::string_view subject,
                                std::string_view body,
                                std::string_view host,
                                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// DATA payload: CRLF normalisation, RFC 5321 dot-stuffing, "\r\n.\r\n" terminator.
std::string dot_stuff(std::string_view content);

}  // namespace mailprobe::smtp
