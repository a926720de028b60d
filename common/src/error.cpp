#include "error.hpp"

namespace mailprobe {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionRefused:     return "ConnectionRefused";
        case ErrorKind::Timeout:               return "Timeout";
        case ErrorKind::ProtocolViolation:     return "ProtocolViolation";
        case ErrorKind::STARTTLSNotAdvertised: return "STARTTLSNotAdvertised";
        case ErrorKind::HandshakeFailed:       return "HandshakeFailed";
        case ErrorKind::NoCompatibleMechanism: return "NoCompatibleMechanism";
        case ErrorKind::AuthenticationFailed:  return "AuthenticationFailed";
        case ErrorKind::TransactionRejected:   return "TransactionRejected";
        case ErrorKind::CommandRejected:       return "CommandRejected";
        case ErrorKind::ConnectionClosed:      return "ConnectionClosed";
    }
    return "Unknown";
}

std::string_view to_string(Step step) {
    switch (step) {
        case Step::None:            return "";
        case Step::Connect:         return "connect";
        case Step::Greeting:        return "greeting";
        case Step::EHLO:            return "EHLO";
        case Step::STARTTLS:        return "STARTTLS";
        case Step::AUTH:            return "AUTH";
        case Step::MailTransaction: return "MAIL transaction";
        case Step::Quit:            return "QUIT";
    }
    return "";
}

Error::Error(ErrorKind kind, std::string message)
    : Error(kind, std::move(message), 0, "") {
}

Error::Error(ErrorKind kind, std::string message, int reply_code, std::string reply_text)
    : Error(kind, Step::None, std::move(message), reply_code, std::move(reply_text)) {
}

Error::Error(ErrorKind kind, Step step, std::string message, int reply_code, std::string reply_text)
    : std::runtime_error(render(step, message, reply_code, reply_text))
    , kind_(kind)
    , step_(step)
    , message_(std::move(message))
    , reply_code_(reply_code)
    , reply_text_(std::move(reply_text)) {
}

Error Error::with_step(Step step) const {
    if (step_ != Step::None) {
        return *this;
    }
    return Error(kind_, step, message_, reply_code_, reply_text_);
}

std::string Error::render(Step step, const std::string& message,
                          int reply_code, const std::string& reply_text) {
    std::string out;
    if (step != Step::None) {
        out += to_string(step);
        out += " failed: ";
    }
    out += message;
    if (reply_code != 0) {
        out += " (" + std::to_string(reply_code);
        if (!reply_text.empty()) {
            out += " " + reply_text;
        }
        out += ")";
    }
    return out;
}

}  // namespace mailprobe
