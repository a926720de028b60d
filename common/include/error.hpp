#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mailprobe {

enum class ErrorKind {
    ConnectionRefused,
    Timeout,
    ProtocolViolation,
    STARTTLSNotAdvertised,
    HandshakeFailed,
    NoCompatibleMechanism,
    AuthenticationFailed,
    TransactionRejected,
    CommandRejected,
    ConnectionClosed
};

// Protocol step an error is attributed to.
enum class Step {
    None,
    Connect,
    Greeting,
    EHLO,
    STARTTLS,
    AUTH,
    MailTransaction,
    Quit
};

std::string_view to_string(ErrorKind kind);
std::string_view to_string(Step step);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string message);
    Error(ErrorKind kind, std::string message, int reply_code, std::string reply_text);

    ErrorKind kind() const { return kind_; }
    Step step() const { return step_; }
    const std::string& message() const { return message_; }

    // 0 when no reply was received
    int reply_code() const { return reply_code_; }
    const std::string& reply_text() const { return reply_text_; }

    // Copy of this error attributed to `step`. An already attributed error keeps its step.
    Error with_step(Step step) const;

private:
    Error(ErrorKind kind, Step step, std::string message, int reply_code, std::string reply_text);

    static std::string render(Step step, const std::string& message,
                              int reply_code, const std::string& reply_text);

    ErrorKind kind_;
    Step step_ = Step::None;
    std::string message_;
    int reply_code_ = 0;
    std::string reply_text_;
};

}  // namespace mailprobe
