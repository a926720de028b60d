#include "smtp_commands.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace mailprobe::smtp {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string terminate(std::string line) {
    line += "\r\n";
    return line;
}

}  // namespace

namespace command {

std::string sanitize(std::string_view text) {
    std::string clean;
    clean.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(clean),
                 [](char c) { return c != '\r' && c != '\n'; });
    return clean;
}

std::string ehlo(std::string_view hostname) {
    return terminate("EHLO " + sanitize(hostname));
}

std::string helo(std::string_view hostname) {
    return terminate("HELO " + sanitize(hostname));
}

std::string mail_from(std::string_view address, std::string_view params) {
    std::string line = "MAIL FROM:<" + sanitize(address) + ">";
    if (!params.empty()) {
        line += " " + sanitize(params);
    }
    return terminate(std::move(line));
}

std::string rcpt_to(std::string_view address) {
    return terminate("RCPT TO:<" + sanitize(address) + ">");
}

std::string data() {
    return terminate("DATA");
}

std::string auth(std::string_view mechanism, std::string_view initial_response) {
    std::string line = "AUTH " + sanitize(mechanism);
    if (!initial_response.empty()) {
        line += " " + sanitize(initial_response);
    }
    return terminate(std::move(line));
}

std::string starttls() {
    return terminate("STARTTLS");
}

std::string rset() {
    return terminate("RSET");
}

std::string quit() {
    return terminate("QUIT");
}

std::string line(std::string_view text) {
    return terminate(sanitize(text));
}

}  // namespace command

std::optional<EmailAddress> EmailAddress::parse(const std::string& str) {
    if (str.find_first_of("\r\n") != std::string::npos) {
        return std::nullopt;
    }

    EmailAddress addr;
    std::string email = str;

    // Extract email from angle brackets if present
    auto start = email.find('<');
    auto end = email.rfind('>');
    if (start != std::string::npos) {
        if (end == std::string::npos || end < start) {
            return std::nullopt;
        }
        addr.display_name = trim(email.substr(0, start));
        if (addr.display_name.size() >= 2 &&
            addr.display_name.front() == '"' && addr.display_name.back() == '"') {
            addr.display_name = addr.display_name.substr(1, addr.display_name.size() - 2);
        }
        email = email.substr(start + 1, end - start - 1);
    } else if (end != std::string::npos) {
        return std::nullopt;
    }

    email = trim(email);

    if (email.empty()) {
        // Allow null sender <>
        if (start != std::string::npos) {
            return addr;
        }
        return std::nullopt;
    }

    auto at = email.rfind('@');
    if (at == std::string::npos || at == 0 || at == email.length() - 1) {
        return std::nullopt;
    }

    addr.local_part = email.substr(0, at);
    addr.domain = email.substr(at + 1);

    if (addr.domain.find_first_of(" \t<>@,;") != std::string::npos ||
        addr.local_part.find_first_of(" \t<>,;") != std::string::npos ||
        addr.domain.front() == '.' || addr.domain.back() == '.') {
        return std::nullopt;
    }

    addr.full_address = email;
    return addr;
}

}  // namespace mailprobe::smtp
