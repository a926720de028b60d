#include "smtp_session.hpp"
#include "smtp_commands.hpp"
#include "smtp_message.hpp"
#include "redact.hpp"

#include <format>
#include <stdexcept>

namespace mailprobe::smtp {

namespace {

std::string strip_crlf(const std::string& line) {
    auto end = line.find_last_not_of("\r\n");
    return end == std::string::npos ? std::string() : line.substr(0, end + 1);
}

// "AUTH PLAIN AHVz..." -> "AUTH PLAIN ****"; bare SASL answers -> "****"
std::string redact_command(const std::string& line) {
    std::string text = strip_crlf(line);
    if (text.rfind("AUTH ", 0) == 0) {
        auto space = text.find(' ', 5);
        if (space != std::string::npos) {
            return text.substr(0, space) + " ****";
        }
        return text;
    }
    return "****";
}

}  // namespace

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Connected:     return "Connected";
        case SessionState::Greeted:       return "Greeted";
        case SessionState::TLSActive:     return "TLSActive";
        case SessionState::Authenticated: return "Authenticated";
        case SessionState::InTransaction: return "InTransaction";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

std::unique_ptr<SMTPSession> SMTPSession::connect(const std::string& host, uint16_t port,
                                                  SessionOptions options,
                                                  std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = Logger::null();
    }
    if (options.tls.server_name.empty()) {
        options.tls.server_name = host;
    }

    LOG_INFO_FMT(*logger, "Connecting to {}:{}{}", host, port, options.implicit_tls ? " (implicit TLS)" : "");

    std::unique_ptr<net::Connection> connection;
    try {
        connection = net::TcpConnection::connect(host, port, options.timeout);
    } catch (const Error& e) {
        throw e.with_step(Step::Connect);
    }
    LOG_DEBUG_FMT(*logger, "Connected to {}", connection->remote_address());

    auto session = std::make_unique<SMTPSession>(std::move(connection), std::move(options), std::move(logger));
    session->start();
    return session;
}

SMTPSession::SMTPSession(std::unique_ptr<net::Connection> connection,
                         SessionOptions options,
                         std::shared_ptr<Logger> logger)
    : connection_(std::move(connection))
    , options_(std::move(options))
    , logger_(logger ? std::move(logger) : Logger::null()) {
    if (!connection_) {
        throw std::invalid_argument("SMTPSession requires a connection");
    }
}

SMTPSession::~SMTPSession() {
    close();
}

template<typename Fn>
auto SMTPSession::run_step(Step step, Fn&& fn) -> decltype(fn()) {
    try {
        check_usable();
        return fn();
    } catch (const Error& e) {
        handle_failure(e);
        throw e.with_step(step);
    }
}

void SMTPSession::check_usable() const {
    if (state_ != SessionState::Closed) {
        return;
    }
    if (timed_out_) {
        throw Error(ErrorKind::Timeout, "Session was closed after a timeout");
    }
    throw Error(ErrorKind::ConnectionClosed, "Session is closed");
}

void SMTPSession::handle_failure(const Error& error) noexcept {
    switch (error.kind()) {
        case ErrorKind::Timeout:
            timed_out_ = true;
            [[fallthrough]];
        case ErrorKind::ConnectionClosed:
        case ErrorKind::ProtocolViolation:
        case ErrorKind::HandshakeFailed:
            close();
            break;
        default:
            break;
    }
}

const SMTPResponse& SMTPSession::start() {
    if (greeting_.code != 0) {
        throw std::logic_error("Greeting has already been read");
    }

    if (options_.implicit_tls) {
        run_step(Step::Connect, [this]() -> const tls::TLSReport& {
            return run_handshake(options_.tls);
        });
    }

    return run_step(Step::Greeting, [this]() -> const SMTPResponse& {
        SMTPResponse reply = read_reply(options_.timeout);
        if (reply.code != reply::SERVICE_READY) {
            throw Error(ErrorKind::CommandRejected, "Server refused the session",
                        reply.code, reply.message());
        }
        greeting_ = std::move(reply);
        LOG_INFO_FMT(*logger_, "Banner: {}", greeting_.first_line());
        return greeting_;
    });
}

const CapabilitySet& SMTPSession::negotiate() {
    return negotiate(options_.local_hostname);
}

const CapabilitySet& SMTPSession::negotiate(const std::string& local_hostname) {
    return run_step(Step::EHLO, [&]() -> const CapabilitySet& {
        if (greeting_.code == 0) {
            throw std::logic_error("EHLO sent before the greeting was read");
        }
        if (state_ == SessionState::InTransaction) {
            throw std::logic_error("EHLO sent inside a mail transaction");
        }

        // Nothing from a previous EHLO survives, in particular across STARTTLS
        capabilities_.clear();
        used_helo_ = false;

        SMTPResponse reply = send_command(command::ehlo(local_hostname));
        if (reply.is_positive()) {
            capabilities_ = CapabilitySet::parse(reply);
        } else if (reply.code == reply::SYNTAX_ERROR ||
                   reply.code == reply::COMMAND_NOT_IMPLEMENTED ||
                   reply.code == reply::PARAM_NOT_IMPLEMENTED) {
            LOG_INFO_FMT(*logger_, "EHLO not supported ({}), falling back to HELO", reply.code);
            SMTPResponse helo = send_command(command::helo(local_hostname));
            if (!helo.is_positive()) {
                throw Error(ErrorKind::CommandRejected, "Server rejected HELO",
                            helo.code, helo.message());
            }
            capabilities_ = CapabilitySet::parse(helo);
            used_helo_ = true;
        } else {
            throw Error(ErrorKind::CommandRejected, "Server rejected EHLO",
                        reply.code, reply.message());
        }

        state_ = authenticated_ ? SessionState::Authenticated : SessionState::Greeted;
        LOG_DEBUG_FMT(*logger_, "Capabilities: {}", capabilities_.to_string());
        return capabilities_;
    });
}

const tls::TLSReport& SMTPSession::upgrade_tls() {
    return upgrade_tls(options_.tls);
}

const tls::TLSReport& SMTPSession::upgrade_tls(const std::string& server_name,
                                               tls::TLSVersion min_version,
                                               bool skip_verify) {
    tls::TLSOptions tls_options = options_.tls;
    if (!server_name.empty()) {
        tls_options.server_name = server_name;
    }
    tls_options.min_version = min_version;
    tls_options.skip_verify = skip_verify;
    return upgrade_tls(tls_options);
}

const tls::TLSReport& SMTPSession::upgrade_tls(const tls::TLSOptions& tls_options) {
    return run_step(Step::STARTTLS, [&]() -> const tls::TLSReport& {
        if (is_tls()) {
            throw std::logic_error("TLS is already active");
        }
        // Before EHLO, or after STARTTLS and before the new EHLO, nothing is advertised
        if (!capabilities_.supports_starttls()) {
            throw Error(ErrorKind::STARTTLSNotAdvertised, "Server does not advertise STARTTLS");
        }
        if (state_ != SessionState::Greeted) {
            throw std::logic_error(std::format("STARTTLS is not allowed in state {}", to_string(state_)));
        }

        SMTPResponse reply = send_command(command::starttls());
        if (reply.code != reply::SERVICE_READY) {
            throw Error(ErrorKind::CommandRejected, "Server refused STARTTLS",
                        reply.code, reply.message());
        }

        capabilities_.clear();
        const auto& report = run_handshake(tls_options);
        state_ = SessionState::TLSActive;
        return report;
    });
}

const tls::TLSReport& SMTPSession::run_handshake(const tls::TLSOptions& tls_options) {
    LOG_DEBUG_FMT(*logger_, "Starting TLS handshake with {} (minimum {})",
                  tls_options.server_name, tls::to_string(tls_options.min_version));

    tls_report_ = tls::TLSDiagnostics::upgrade(*connection_, tls_options, options_.timeout);
    log_report(*tls_report_);

    std::string failure = tls_report_->verification_failure(tls_options);
    if (!failure.empty()) {
        throw Error(ErrorKind::HandshakeFailed, failure);
    }
    return *tls_report_;
}

void SMTPSession::log_report(const tls::TLSReport& report) {
    const auto& conn = report.connection;
    LOG_INFO_FMT(*logger_, "TLS established: {}, {} ({} bits, {})",
                 tls::to_string(conn.version), conn.cipher_name, conn.cipher_bits,
                 tls::to_string(conn.strength));

    for (const auto& cert : report.chain) {
        LOG_DEBUG_FMT(*logger_, "Certificate {} issued by {}: {}",
                      cert.subject, cert.issuer, tls::to_string(cert.status));
    }
    for (const auto& warning : report.warnings) {
        if (warning.severity == tls::Severity::Warn) {
            LOG_WARNING_FMT(*logger_, "[{}] {}", tls::to_string(warning.category), warning.message);
        } else {
            LOG_INFO_FMT(*logger_, "[{}] {}", tls::to_string(warning.category), warning.message);
        }
    }
}

void SMTPSession::ensure_greeted() {
    if (state_ == SessionState::Connected || state_ == SessionState::TLSActive) {
        negotiate();
    }
}

void SMTPSession::secure_channel() {
    if (is_tls() || options_.starttls == StartTLSPolicy::Disabled) {
        return;
    }

    if (!capabilities_.supports_starttls()) {
        if (options_.starttls == StartTLSPolicy::Required) {
            throw Error(ErrorKind::STARTTLSNotAdvertised,
                        "STARTTLS is required but the server does not advertise it")
                .with_step(Step::STARTTLS);
        }
        return;
    }

    upgrade_tls();
    negotiate();
}

AuthResult SMTPSession::authenticate(std::string_view mechanism,
                                     const std::string& username,
                                     const std::string& password) {
    return run_step(Step::AUTH, [&]() {
        if (authenticated_) {
            throw std::logic_error("Session is already authenticated");
        }

        ensure_greeted();
        secure_channel();
        if (!is_tls()) {
            LOG_WARNING(*logger_, "Authenticating over a plaintext connection");
        }

        AuthMechanism selected = AuthNegotiator::select_mechanism(capabilities_, mechanism);
        LOG_INFO_FMT(*logger_, "Authenticating as {} using {}",
                     mask_username(username), to_string(selected));

        AuthResult result = AuthNegotiator::authenticate(
            [this](const std::string& line, bool sensitive) {
                return send_command(line, sensitive);
            },
            selected, username, password);

        if (result.success) {
            authenticated_ = true;
            state_ = SessionState::Authenticated;
            LOG_INFO_FMT(*logger_, "Authentication succeeded ({})", result.reply_code);
        } else {
            LOG_WARNING_FMT(*logger_, "Authentication rejected: {} {}",
                            result.reply_code, result.server_message);
        }
        return result;
    });
}

SendResult SMTPSession::send_message(const std::string& from,
                                     const std::vector<std::string>& to,
                                     const std::string& subject,
                                     const std::string& body) {
    return run_step(Step::MailTransaction, [&]() {
        if (state_ == SessionState::InTransaction) {
            throw std::logic_error("A mail transaction is already in progress");
        }

        auto sender = EmailAddress::parse(from);
        if (!sender) {
            throw std::invalid_argument("Invalid sender address: " + from);
        }
        std::vector<std::string> recipients;
        for (const auto& addr : to) {
            auto parsed = EmailAddress::parse(addr);
            if (!parsed || parsed->is_null()) {
                throw std::invalid_argument("Invalid recipient address: " + addr);
            }
            recipients.push_back(parsed->full_address);
        }
        if (recipients.empty()) {
            throw std::invalid_argument("At least one recipient is required");
        }

        ensure_greeted();
        secure_channel();

        ComposedMessage message = compose_message(from, to, subject, body, options_.local_hostname);
        std::string payload = dot_stuff(message.content);

        std::string params;
        if (capabilities_.has("SIZE")) {
            auto limit = capabilities_.max_size();
            if (limit && *limit > 0 && message.content.size() > *limit) {
                throw Error(ErrorKind::TransactionRejected,
                            std::format("Message is {} bytes, server accepts at most {}",
                                        message.content.size(), *limit));
            }
            params = std::format("SIZE={}", message.content.size());
        }

        SessionState resume = state_;
        state_ = SessionState::InTransaction;

        auto rejected = [&](const std::string& what, const SMTPResponse& reply) {
            reset_transaction();
            if (state_ != SessionState::Closed) {
                state_ = resume;
            }
            return Error(ErrorKind::TransactionRejected, "Server rejected " + what,
                         reply.code, reply.message());
        };

        SMTPResponse reply = send_command(command::mail_from(sender->full_address, params));
        if (!reply.is_positive()) {
            throw rejected("MAIL FROM", reply);
        }

        for (const auto& rcpt : recipients) {
            reply = send_command(command::rcpt_to(rcpt));
            if (!reply.is_positive()) {
                throw rejected("RCPT TO <" + rcpt + ">", reply);
            }
        }

        reply = send_command(command::data());
        if (reply.code != reply::START_MAIL_INPUT) {
            throw rejected("DATA", reply);
        }

        LOG_TRACE_FMT(*logger_, ">>> [message data, {} bytes]", payload.size());
        connection_->write(payload, options_.timeout);

        reply = read_reply(options_.timeout);
        if (!reply.is_positive()) {
            throw rejected("message data", reply);
        }

        state_ = resume;
        LOG_INFO_FMT(*logger_, "Message <{}> accepted: {} {}",
                     message.message_id, reply.code, reply.message());
        return SendResult{reply.code, message.message_id, reply.message()};
    });
}

void SMTPSession::reset_transaction() {
    try {
        SMTPResponse reply = send_command(command::rset());
        if (!reply.is_positive()) {
            LOG_DEBUG_FMT(*logger_, "RSET answered {} {}", reply.code, reply.message());
        }
    } catch (const Error& e) {
        LOG_DEBUG_FMT(*logger_, "RSET failed: {}", e.what());
        handle_failure(e);
    }
}

void SMTPSession::close() noexcept {
    if (state_ == SessionState::Closed) {
        return;
    }
    state_ = SessionState::Closed;

    if (!connection_->is_open()) {
        return;
    }

    // The reply to QUIT is informational; do not wait past quit_timeout for it
    try {
        write_line(command::quit(), false, options_.quit_timeout);
        read_reply(options_.quit_timeout);
    } catch (const Error& e) {
        LOG_DEBUG_FMT(*logger_, "{}", e.with_step(Step::Quit).what());
    } catch (const std::exception& e) {
        LOG_DEBUG_FMT(*logger_, "QUIT failed: {}", e.what());
    }

    connection_->close();
    LOG_DEBUG(*logger_, "Connection closed");
}

void SMTPSession::write_line(const std::string& line, bool sensitive, std::chrono::milliseconds timeout) {
    if (logger_->enabled(LogLevel::Trace)) {
        LOG_TRACE_FMT(*logger_, ">>> {}", sensitive ? redact_command(line) : strip_crlf(line));
    }
    connection_->write(line, timeout);
}

SMTPResponse SMTPSession::read_reply(std::chrono::milliseconds timeout) {
    return read_response(*connection_, timeout, [this](const std::string& line) {
        LOG_TRACE_FMT(*logger_, "<<< {}", line);
    });
}

SMTPResponse SMTPSession::send_command(const std::string& line, bool sensitive) {
    write_line(line, sensitive, options_.timeout);
    return read_reply(options_.timeout);
}

}  // namespace mailprobe::smtp
