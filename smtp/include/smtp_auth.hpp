#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "capabilities.hpp"
#include "smtp_response.hpp"

namespace mailprobe::smtp {

enum class AuthMechanism {
    Plain,
    Login,
    CramMD5
};

std::string_view to_string(AuthMechanism mechanism);
std::optional<AuthMechanism> parse_mechanism(std::string_view name);

struct AuthResult {
    AuthMechanism mechanism = AuthMechanism::Plain;
    bool success = false;
    int reply_code = 0;
    std::string server_message;
};

// Sends one command line and returns the server's reply. Lines flagged
// `sensitive` carry credentials and must never be logged verbatim.
using AuthExchange = std::function<SMTPResponse(const std::string& line, bool sensitive)>;

// SASL client for PLAIN (RFC 4616), LOGIN and CRAM-MD5 (RFC 2195).
// Precondition: the caller has already upgraded to TLS when the server offers
// STARTTLS; the negotiator does not check the channel.
class AuthNegotiator {
public:
    // `requested` unset picks the strongest advertised mechanism,
    // CRAM-MD5 > LOGIN > PLAIN. Throws Error(NoCompatibleMechanism).
    static AuthMechanism select_mechanism(const CapabilitySet& caps,
                                          std::optional<AuthMechanism> requested = std::nullopt);

    // "auto" (or empty) or a mechanism name, as given on the command line.
    static AuthMechanism select_mechanism(const CapabilitySet& caps, std::string_view requested);

    // A rejection is reported in AuthResult; transport errors propagate.
    static AuthResult authenticate(const AuthExchange& exchange,
                                   AuthMechanism mechanism,
                                   const std::string& username,
                                   const std::string& password);

private:
    static SMTPResponse plain(const AuthExchange& exchange,
                              const std::string& username, const std::string& password);
    static SMTPResponse login(const AuthExchange& exchange,
                              const std::string& username, const std::string& password);
    static SMTPResponse cram_md5(const AuthExchange& exchange,
                                 const std::string& username, const std::string& password);
};

}  // namespace mailprobe::smtp
