#include "smtp_auth.hpp"
#include "smtp_commands.hpp"
#include "auth/sasl.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace mailprobe::smtp {

namespace {

constexpr std::array<AuthMechanism, 3> PREFERENCE = {
    AuthMechanism::CramMD5, AuthMechanism::Login, AuthMechanism::Plain
};

// LOGIN exchanges are two challenges; anything longer is cancelled.
constexpr int MAX_LOGIN_CHALLENGES = 3;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string offered_mechanisms(const CapabilitySet& caps) {
    std::string offered;
    for (const auto& m : caps.auth_mechanisms()) {
        if (!offered.empty()) offered += " ";
        offered += m;
    }
    return offered;
}

// Abort a SASL exchange (RFC 4954 section 4) and return the server's answer.
SMTPResponse cancel(const AuthExchange& exchange) {
    return exchange(command::line("*"), false);
}

}  // namespace

std::string_view to_string(AuthMechanism mechanism) {
    switch (mechanism) {
        case AuthMechanism::Plain:   return "PLAIN";
        case AuthMechanism::Login:   return "LOGIN";
        case AuthMechanism::CramMD5: return "CRAM-MD5";
    }
    return "PLAIN";
}

std::optional<AuthMechanism> parse_mechanism(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "PLAIN") return AuthMechanism::Plain;
    if (upper == "LOGIN") return AuthMechanism::Login;
    if (upper == "CRAM-MD5") return AuthMechanism::CramMD5;
    return std::nullopt;
}

AuthMechanism AuthNegotiator::select_mechanism(const CapabilitySet& caps,
                                               std::optional<AuthMechanism> requested) {
    if (!caps.has("AUTH") || caps.params("AUTH").empty()) {
        throw Error(ErrorKind::NoCompatibleMechanism, "Server does not advertise AUTH");
    }

    if (requested) {
        if (caps.supports_auth(to_string(*requested))) {
            return *requested;
        }
        throw Error(ErrorKind::NoCompatibleMechanism,
                    std::string(to_string(*requested)) + " is not advertised (server offers " +
                    offered_mechanisms(caps) + ")");
    }

    for (auto mechanism : PREFERENCE) {
        if (caps.supports_auth(to_string(mechanism))) {
            return mechanism;
        }
    }

    throw Error(ErrorKind::NoCompatibleMechanism,
                "No supported mechanism among " + offered_mechanisms(caps));
}

AuthMechanism AuthNegotiator::select_mechanism(const CapabilitySet& caps, std::string_view requested) {
    if (requested.empty() || to_lower(std::string(requested)) == "auto") {
        return select_mechanism(caps, std::nullopt);
    }

    auto mechanism = parse_mechanism(requested);
    if (!mechanism) {
        throw Error(ErrorKind::NoCompatibleMechanism,
                    "Unsupported authentication mechanism " + std::string(requested));
    }
    return select_mechanism(caps, mechanism);
}

AuthResult AuthNegotiator::authenticate(const AuthExchange& exchange,
                                        AuthMechanism mechanism,
                                        const std::string& username,
                                        const std::string& password) {
    SMTPResponse final_reply;
    switch (mechanism) {
        case AuthMechanism::Plain:
            final_reply = plain(exchange, username, password);
            break;
        case AuthMechanism::Login:
            final_reply = login(exchange, username, password);
            break;
        case AuthMechanism::CramMD5:
            final_reply = cram_md5(exchange, username, password);
            break;
    }

    AuthResult result;
    result.mechanism = mechanism;
    result.success = final_reply.is_positive();
    result.reply_code = final_reply.code;
    result.server_message = final_reply.message();
    return result;
}

SMTPResponse AuthNegotiator::plain(const AuthExchange& exchange,
                                   const std::string& username, const std::string& password) {
    std::string initial = sasl::plain_initial_response(username, password);

    SMTPResponse reply = exchange(command::auth("PLAIN", initial), true);
    if (reply.code != reply::AUTH_CONTINUE) {
        return reply;
    }

    // Server ignored the inline response and asked again with an empty challenge
    reply = exchange(command::line(initial), true);
    if (reply.code == reply::AUTH_CONTINUE) {
        return cancel(exchange);
    }
    return reply;
}

SMTPResponse AuthNegotiator::login(const AuthExchange& exchange,
                                   const std::string& username, const std::string& password) {
    SMTPResponse reply = exchange(command::auth("LOGIN"), false);

    for (int step = 0; reply.code == reply::AUTH_CONTINUE; ++step) {
        if (step >= MAX_LOGIN_CHALLENGES) {
            return cancel(exchange);
        }

        // Prompts are normally base64 "Username:" / "Password:"; fall back to
        // the step order when the server sends something else.
        auto prompt = sasl::base64_decode(reply.first_line());
        std::string lowered = to_lower(prompt.value_or(""));

        bool wants_password;
        if (lowered.find("username") != std::string::npos ||
            lowered.find("user name") != std::string::npos) {
            wants_password = false;
        } else if (lowered.find("password") != std::string::npos) {
            wants_password = true;
        } else {
            wants_password = step > 0;
        }

        const std::string& answer = wants_password ? password : username;
        reply = exchange(command::line(sasl::base64_encode(answer)), true);
    }

    return reply;
}

SMTPResponse AuthNegotiator::cram_md5(const AuthExchange& exchange,
                                      const std::string& username, const std::string& password) {
    SMTPResponse reply = exchange(command::auth("CRAM-MD5"), false);
    if (reply.code != reply::AUTH_CONTINUE) {
        return reply;
    }

    auto answer = sasl::cram_md5_response(reply.first_line(), username, password);
    if (!answer) {
        SMTPResponse cancelled = cancel(exchange);
        throw Error(ErrorKind::ProtocolViolation, "CRAM-MD5 challenge is not valid base64",
                    cancelled.code, cancelled.message());
    }

    reply = exchange(command::line(*answer), true);
    if (reply.code == reply::AUTH_CONTINUE) {
        return cancel(exchange);
    }
    return reply;
}

}  // namespace mailprobe::smtp
