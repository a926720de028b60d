#include "exchange_detector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <regex>

namespace mailprobe::smtp {

namespace {

constexpr std::array<std::string_view, 9> EXCHANGE_EXTENSIONS = {
    "X-EXPS", "X-ANONYMOUSTLS", "XEXCH50", "X-EXCH50", "XRDST",
    "X-LINK2STATE", "XSHADOW", "XSHADOWREQUEST", "XPROXYFROM"
};

constexpr std::array<std::string_view, 5> EXCHANGE_NOTES = {
    "Exchange typically restricts relay for unauthenticated connections",
    "Authentication usually requires TLS on port 587 (run -action teststarttls first)",
    "Exchange Online requires modern authentication (OAuth 2.0) for most mailboxes",
    "On-premises Exchange needs a receive connector that permits relay from this host",
    "Anonymous relay is disabled by default"
};

struct BuildVersion {
    std::string_view prefix;
    std::string_view name;
};

// Most specific prefix first
constexpr std::array<BuildVersion, 7> BUILD_VERSIONS = {{
    {"15.2.", "Exchange 2019"},
    {"15.1.", "Exchange 2016"},
    {"15.0.", "Exchange 2013"},
    {"14.", "Exchange 2010"},
    {"8.", "Exchange 2007"},
    {"6.5.", "Exchange 2003"},
    {"6.0.", "Exchange 2000"},
}};

std::string to_lower(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

double megabytes(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace

ExchangeInfo ExchangeDetector::detect(std::string_view banner, const CapabilitySet& caps) {
    ExchangeInfo info;
    std::string lower = to_lower(banner);
    std::string text(banner);

    bool banner_match = lower.find("microsoft esmtp mail service") != std::string::npos ||
                        lower.find("microsoft exchange") != std::string::npos;
    bool online = lower.find(".outlook.com") != std::string::npos;
    bool extension_match = std::any_of(EXCHANGE_EXTENSIONS.begin(), EXCHANGE_EXTENSIONS.end(),
        [&caps](std::string_view ext) { return caps.has(ext); });

    if (!banner_match && !online && !extension_match) {
        return info;
    }
    info.is_exchange = true;

    static const std::regex build_re(R"(Version:\s*(\d+\.\d+\.\d+(?:\.\d+)?))", std::regex::icase);
    static const std::regex product_re(R"(Microsoft Exchange Server (\d{4}))", std::regex::icase);
    static const std::regex paren_re(R"(\((\d+\.\d+\.\d+(?:\.\d+)?))");

    std::smatch match;
    if (std::regex_search(text, match, build_re) || std::regex_search(text, match, paren_re)) {
        info.build = match[1].str();
        info.version = version_for_build(info.build);
    } else if (std::regex_search(text, match, product_re)) {
        info.version = "Exchange " + match[1].str();
    } else if (online) {
        info.version = "Exchange Online";
    }

    info.notes = capability_notes(caps);
    for (auto note : EXCHANGE_NOTES) {
        info.notes.emplace_back(note);
    }
    return info;
}

std::string ExchangeDetector::version_for_build(std::string_view build) {
    for (const auto& entry : BUILD_VERSIONS) {
        if (build.substr(0, entry.prefix.size()) == entry.prefix) {
            return std::format("{} ({})", entry.name, build);
        }
    }
    return std::format("Exchange ({})", build);
}

std::vector<std::string> ExchangeDetector::capability_notes(const CapabilitySet& caps) {
    std::vector<std::string> notes;

    if (auto limit = caps.max_size(); limit && *limit > 0) {
        notes.push_back(std::format("Maximum message size: {} bytes ({:.2f} MB)",
                                    *limit, megabytes(*limit)));
    }

    auto mechanisms = caps.auth_mechanisms();
    if (!mechanisms.empty()) {
        std::string joined;
        for (const auto& m : mechanisms) {
            if (!joined.empty()) joined += ", ";
            joined += m;
        }
        notes.push_back("Supported authentication: " + joined);
    }

    if (caps.supports_starttls()) {
        notes.emplace_back("STARTTLS is supported");
    } else {
        notes.emplace_back("STARTTLS is not offered; the connection stays in plaintext");
    }
    if (caps.supports_8bitmime()) {
        notes.emplace_back("8-bit MIME is supported");
    }
    if (caps.supports_pipelining()) {
        notes.emplace_back("Command pipelining is supported");
    }
    return notes;
}

std::vector<std::string> ExchangeDetector::recommendations(uint16_t port, const CapabilitySet& caps) {
    std::vector<std::string> advice;
    bool has_auth = !caps.auth_mechanisms().empty();

    switch (port) {
        case 25:
            advice.emplace_back("Port 25 is normally server-to-server relay");
            if (has_auth) {
                advice.emplace_back("Authentication on port 25 usually requires STARTTLS first");
            }
            break;
        case 587:
            advice.emplace_back("Port 587 is message submission and requires authentication");
            if (!caps.supports_starttls()) {
                advice.emplace_back("Port 587 should offer STARTTLS before authentication");
            }
            break;
        case 465:
            advice.emplace_back("Port 465 is SMTP over implicit TLS");
            break;
        default:
            break;
    }

    if (has_auth && !caps.supports_starttls() &&
        !caps.supports_auth("CRAM-MD5") && !caps.supports_auth("NTLM")) {
        advice.emplace_back("Only cleartext mechanisms are offered and there is no STARTTLS");
    }

    if (auto limit = caps.max_size(); limit && *limit > 0 && *limit < 10 * 1024 * 1024) {
        advice.push_back(std::format("Message size limit is small ({:.2f} MB)", megabytes(*limit)));
    }
    return advice;
}

}  // namespace mailprobe::smtp
