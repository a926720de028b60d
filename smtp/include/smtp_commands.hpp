#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace mailprobe::smtp {

// Reply codes the client acts on
namespace reply {
    constexpr int SERVICE_READY = 220;           // greeting, STARTTLS go-ahead
    constexpr int AUTH_CONTINUE = 334;
    constexpr int START_MAIL_INPUT = 354;

    // EHLO answers that trigger the HELO fallback
    constexpr int SYNTAX_ERROR = 500;
    constexpr int COMMAND_NOT_IMPLEMENTED = 502;
    constexpr int PARAM_NOT_IMPLEMENTED = 504;
}

// Client command lines. Every builder returns a CRLF-terminated line and
// strips CR and LF from caller-supplied text before interpolating it.
namespace command {
    // Drops every CR and LF byte.
    std::string sanitize(std::string_view text);

    std::string ehlo(std::string_view hostname);
    std::string helo(std::string_view hostname);
    std::string mail_from(std::string_view address, std::string_view params = {});
    std::string rcpt_to(std::string_view address);
    std::string data();
    std::string auth(std::string_view mechanism, std::string_view initial_response = {});
    std::string starttls();
    std::string rset();
    std::string quit();

    // Bare line, used for SASL continuation responses.
    std::string line(std::string_view text);
}

// Email address parsing
struct EmailAddress {
    std::string display_name;
    std::string local_part;
    std::string domain;
    std::string full_address;

    // Accepts "user@example.com", "<user@example.com>" and
    // "Display Name <user@example.com>". An empty "<>" is the null sender.
    static std::optional<EmailAddress> parse(const std::string& str);

    bool is_null() const { return full_address.empty(); }
    std::string to_string() const { return local_part + "@" + domain; }
};

}  // namespace mailprobe::smtp
