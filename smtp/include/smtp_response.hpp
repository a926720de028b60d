#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "net/connection.hpp"

namespace mailprobe::smtp {

struct SMTPResponse {
    int code = 0;
    std::vector<std::string> lines;  // text after "<code><sep>", in order

    bool is_multiline() const { return lines.size() > 1; }
    bool is_positive() const { return code >= 200 && code < 300; }
    bool is_intermediate() const { return code >= 300 && code < 400; }
    bool is_transient_failure() const { return code >= 400 && code < 500; }
    bool is_permanent_failure() const { return code >= 500 && code < 600; }

    // All text segments joined with a single space
    std::string message() const;
    // First line of text, as logged and reported
    std::string first_line() const { return lines.empty() ? std::string() : lines.front(); }
};

// Incremental reply parser. Each line is "<code>-text" (continuation) or
// "<code> text" / "<code>" (final); codes must be 200..599 and agree
// across one reply. Violations throw Error(ProtocolViolation).
class ResponseParser {
public:
    enum class Status {
        NeedMore,
        Complete
    };

    Status feed(const std::string& line);

    // The completed reply; the parser is ready for the next one afterwards.
    SMTPResponse take();

    bool in_progress() const { return !current_.lines.empty() && !complete_; }
    void reset();

private:
    SMTPResponse current_;
    bool complete_ = false;
};

using LineObserver = std::function<void(const std::string&)>;

constexpr size_t MAX_RESPONSE_LINES = 512;

// Reads one complete reply. The whole reply shares a single deadline.
SMTPResponse read_response(net::Connection& conn,
                           std::chrono::milliseconds timeout,
                           const LineObserver& on_line = {});

}  // namespace mailprobe::smtp
