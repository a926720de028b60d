#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "capabilities.hpp"
#include "config.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "net/connection.hpp"
#include "smtp_auth.hpp"
#include "smtp_response.hpp"
#include "tls_diagnostics.hpp"

namespace mailprobe::smtp {

enum class SessionState {
    Connected,      // greeting received
    Greeted,        // after EHLO/HELO
    TLSActive,      // after STARTTLS, before the mandatory re-EHLO
    Authenticated,  // after AUTH success
    InTransaction,  // between MAIL FROM and the end of DATA
    Closed
};

std::string_view to_string(SessionState state);

struct SessionOptions {
    std::chrono::milliseconds timeout{30000};       // per round trip, connect and handshake
    std::chrono::milliseconds quit_timeout{2000};   // bound on waiting for the QUIT reply
    StartTLSPolicy starttls = StartTLSPolicy::Auto;
    tls::TLSOptions tls;                             // server_name defaults to the host
    bool implicit_tls = false;                       // SMTPS: handshake before the greeting
    std::string local_hostname = "smtpprobe.local";
};

struct SendResult {
    int reply_code = 0;
    std::string message_id;
    std::string reply_text;
};

// Client side of one SMTP conversation. Owns its connection; every exit path
// closes it exactly once. Not safe for concurrent use.
//
// Errors are mailprobe::Error attributed to the failing Step. A timeout
// leaves the session Closed and every later call fails with ErrorKind::Timeout.
class SMTPSession {
public:
    // Connects, performs the implicit TLS handshake when configured and reads
    // the greeting.
    static std::unique_ptr<SMTPSession> connect(const std::string& host, uint16_t port,
                                                SessionOptions options,
                                                std::shared_ptr<Logger> logger);

    SMTPSession(std::unique_ptr<net::Connection> connection,
                SessionOptions options,
                std::shared_ptr<Logger> logger);
    ~SMTPSession();

    SMTPSession(const SMTPSession&) = delete;
    SMTPSession& operator=(const SMTPSession&) = delete;

    // Implicit TLS (if enabled) and the 220 greeting. Called by connect().
    const SMTPResponse& start();

    // EHLO, falling back to HELO when EHLO is not implemented. Replaces the
    // capability set.
    const CapabilitySet& negotiate();
    const CapabilitySet& negotiate(const std::string& local_hostname);

    // STARTTLS and handshake. Fails with STARTTLSNotAdvertised without
    // sending anything when the last EHLO did not offer it. The caller must
    // negotiate() again afterwards.
    //
    // The no-argument form uses SessionOptions::tls. The other overlays the
    // given server name, minimum version and verification policy on it; an
    // empty server name keeps the configured one.
    const tls::TLSReport& upgrade_tls();
    const tls::TLSReport& upgrade_tls(const std::string& server_name,
                                      tls::TLSVersion min_version,
                                      bool skip_verify);

    // Upgrades first when policy allows and STARTTLS is offered, then runs the
    // SASL exchange. `mechanism` is "auto" or a mechanism name.
    AuthResult authenticate(std::string_view mechanism,
                            const std::string& username,
                            const std::string& password);

    SendResult send_message(const std::string& from,
                            const std::vector<std::string>& to,
                            const std::string& subject,
                            const std::string& body);

    // Best-effort QUIT, then closes the connection. Idempotent.
    void close() noexcept;

    SessionState state() const { return state_; }
    bool is_closed() const { return state_ == SessionState::Closed; }
    bool is_tls() const { return connection_ && connection_->is_tls(); }
    bool is_authenticated() const { return authenticated_; }
    bool used_helo() const { return used_helo_; }

    const SMTPResponse& greeting() const { return greeting_; }
    std::string banner() const { return greeting_.first_line(); }
    const CapabilitySet& capabilities() const { return capabilities_; }
    const std::optional<tls::TLSReport>& tls_report() const { return tls_report_; }
    const SessionOptions& options() const { return options_; }

private:
    template<typename Fn>
    auto run_step(Step step, Fn&& fn) -> decltype(fn());

    void check_usable() const;
    void handle_failure(const Error& error) noexcept;

    void write_line(const std::string& line, bool sensitive, std::chrono::milliseconds timeout);
    SMTPResponse read_reply(std::chrono::milliseconds timeout);
    SMTPResponse send_command(const std::string& line, bool sensitive = false);

    const tls::TLSReport& upgrade_tls(const tls::TLSOptions& tls_options);
    const tls::TLSReport& run_handshake(const tls::TLSOptions& tls_options);
    void secure_channel();
    void ensure_greeted();
    void reset_transaction();
    void log_report(const tls::TLSReport& report);

    std::unique_ptr<net::Connection> connection_;
    SessionOptions options_;
    std::shared_ptr<Logger> logger_;

    SessionState state_ = SessionState::Connected;
    bool authenticated_ = false;
    bool timed_out_ = false;
    bool used_helo_ = false;

    SMTPResponse greeting_;
    CapabilitySet capabilities_;
    std::optional<tls::TLSReport> tls_report_;
};

}  // namespace mailprobe::smtp
