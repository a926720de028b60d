#include "smtp_response.hpp"
#include "error.hpp"

#include <cctype>
#include <format>

namespace mailprobe::smtp {

namespace {

std::string printable(const std::string& line) {
    constexpr size_t MAX_SHOWN = 64;
    std::string shown = line.size() > MAX_SHOWN ? line.substr(0, MAX_SHOWN) + "..." : line;
    for (char& c : shown) {
        if (!std::isprint(static_cast<unsigned char>(c))) c = '?';
    }
    return shown;
}

}  // namespace

std::string SMTPResponse::message() const {
    std::string text;
    for (const auto& line : lines) {
        if (!text.empty()) text += ' ';
        text += line;
    }
    return text;
}

ResponseParser::Status ResponseParser::feed(const std::string& line) {
    if (complete_) {
        reset();
    }

    if (line.size() < 3 ||
        !std::isdigit(static_cast<unsigned char>(line[0])) ||
        !std::isdigit(static_cast<unsigned char>(line[1])) ||
        !std::isdigit(static_cast<unsigned char>(line[2]))) {
        throw Error(ErrorKind::ProtocolViolation,
                    std::format("Malformed reply line '{}'", printable(line)));
    }

    int code = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
    if (code < 200 || code > 599) {
        throw Error(ErrorKind::ProtocolViolation,
                    std::format("Reply code {} out of range", code));
    }

    bool final_line = true;
    std::string text;
    if (line.size() > 3) {
        char sep = line[3];
        if (sep == '-') {
            final_line = false;
        } else if (sep != ' ') {
            throw Error(ErrorKind::ProtocolViolation,
                        std::format("Bad separator in reply line '{}'", printable(line)));
        }
        text = line.substr(4);
    }

    if (!current_.lines.empty() && code != current_.code) {
        throw Error(ErrorKind::ProtocolViolation,
                    std::format("Reply code changed from {} to {} within one reply",
                                current_.code, code));
    }

    current_.code = code;
    current_.lines.push_back(std::move(text));

    if (final_line) {
        complete_ = true;
        return Status::Complete;
    }
    return Status::NeedMore;
}

SMTPResponse ResponseParser::take() {
    SMTPResponse response = std::move(current_);
    reset();
    return response;
}

void ResponseParser::reset() {
    current_ = SMTPResponse{};
    complete_ = false;
}

SMTPResponse read_response(net::Connection& conn,
                           std::chrono::milliseconds timeout,
                           const LineObserver& on_line) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ResponseParser parser;

    for (size_t count = 0; count < MAX_RESPONSE_LINES; ++count) {
        std::string line = conn.read_line(deadline);
        if (on_line) {
            on_line(line);
        }
        if (parser.feed(line) == ResponseParser::Status::Complete) {
            return parser.take();
        }
    }

    throw Error(ErrorKind::ProtocolViolation,
                std::format("Reply exceeds {} lines", MAX_RESPONSE_LINES));
}

}  // namespace mailprobe::smtp
