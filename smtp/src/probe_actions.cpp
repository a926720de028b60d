#include "probe_actions.hpp"
#include "smtp_commands.hpp"
#include "redact.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

namespace mailprobe::smtp {

namespace {

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += separator;
        out += item;
    }
    return out;
}

std::string format_utc(tls::Clock::time_point when) {
    auto time = tls::Clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

template<typename Set>
std::string join_usages(const Set& usages) {
    std::vector<std::string> names;
    for (auto usage : usages) {
        names.emplace_back(tls::to_string(usage));
    }
    return join(names, ", ");
}

void fill_tls_fields(std::map<std::string, std::string>& fields, const tls::TLSReport& report) {
    fields["TLS_Version"] = tls::to_string(report.connection.version);
    fields["Cipher_Suite"] = report.connection.cipher_name;

    if (!report.chain.empty()) {
        const auto& leaf = report.chain.front();
        fields["Cert_Subject"] = leaf.subject;
        fields["Cert_Issuer"] = leaf.issuer;
        fields["Cert_Valid_From"] = format_utc(leaf.not_before);
        fields["Cert_Valid_To"] = format_utc(leaf.not_after);
        fields["Cert_SANs"] = join(leaf.sans, "; ");
        fields["Verification_Status"] = tls::to_string(leaf.status);
    }

    std::vector<std::string> warnings;
    for (const auto& w : report.warnings) {
        warnings.push_back(std::format("{}: {}", tls::to_string(w.category), w.message));
    }
    fields["Warnings"] = join(warnings, "; ");
}

bool has_whitespace(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

std::optional<ProbeAction> parse_action(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "testconnect") return ProbeAction::TestConnect;
    if (lower == "teststarttls") return ProbeAction::TestStartTLS;
    if (lower == "testauth") return ProbeAction::TestAuth;
    if (lower == "sendmail") return ProbeAction::SendMail;
    return std::nullopt;
}

std::string_view to_string(ProbeAction action) {
    switch (action) {
        case ProbeAction::TestConnect:  return "testconnect";
        case ProbeAction::TestStartTLS: return "teststarttls";
        case ProbeAction::TestAuth:     return "testauth";
        case ProbeAction::SendMail:     return "sendmail";
    }
    return "testconnect";
}

std::optional<std::string> validate_config(Config& config, ProbeAction action) {
    if (!config.problems().empty()) {
        return config.problems().front();
    }

    auto& server = config.server();
    auto& tls = config.tls();

    if (tls.smtps && tls.starttls == StartTLSPolicy::Required) {
        return "SMTPS and forced STARTTLS cannot be used together";
    }
    if (tls.smtps && server.port == 25) {
        server.port = 465;
    }

    if (server.host.empty()) {
        return "host is required (-host)";
    }
    if (has_whitespace(server.host)) {
        return "invalid host: " + command::sanitize(server.host);
    }
    if (server.port == 0) {
        return "port must be between 1 and 65535";
    }
    if (tls.max_version && *tls.max_version < tls.min_version) {
        return "maximum TLS version is below the minimum";
    }

    const auto& auth = config.auth();
    const auto& message = config.message();

    switch (action) {
        case ProbeAction::TestConnect:
        case ProbeAction::TestStartTLS:
            break;

        case ProbeAction::TestAuth:
            if (auth.username.empty()) return "testauth requires -username";
            if (auth.password.empty()) return "testauth requires -password";
            break;

        case ProbeAction::SendMail:
            if (message.from.empty()) return "sendmail requires -from";
            if (!EmailAddress::parse(message.from)) {
                return "invalid sender address: " + message.from;
            }
            if (message.to.empty()) return "sendmail requires -to";
            for (const auto& addr : message.to) {
                auto parsed = EmailAddress::parse(addr);
                if (!parsed || parsed->is_null()) {
                    return "invalid recipient address: " + addr;
                }
            }
            if (message.subject.empty()) return "sendmail requires -subject";
            if (!auth.username.empty() && auth.password.empty()) {
                return "-username requires -password";
            }
            break;
    }

    return std::nullopt;
}

SessionOptions session_options(const Config& config) {
    SessionOptions options;
    options.timeout = config.server().timeout;
    options.starttls = config.tls().starttls;
    options.implicit_tls = config.tls().smtps;
    options.local_hostname = config.server().ehlo_name;

    options.tls.server_name = config.server().host;
    options.tls.min_version = config.tls().min_version;
    options.tls.max_version = config.tls().max_version;
    options.tls.skip_verify = config.tls().skip_verify;
    options.tls.ca_file = config.tls().ca_file;
    return options;
}

ProbeRunner::ProbeRunner(const Config& config, std::shared_ptr<Logger> logger, std::ostream& out)
    : config_(config)
    , logger_(logger ? std::move(logger) : Logger::null())
    , out_(out)
    , factory_([](const std::string& host, uint16_t port, const SessionOptions& options,
                  std::shared_ptr<Logger> log) {
          return SMTPSession::connect(host, port, options, std::move(log));
      }) {
}

std::vector<std::string> ProbeRunner::audit_columns(ProbeAction action) {
    switch (action) {
        case ProbeAction::TestConnect:
            return {"Action", "Status", "Server", "Port", "Connected", "Banner",
                    "Capabilities", "Exchange_Detected", "Error"};
        case ProbeAction::TestStartTLS:
            return {"Action", "Status", "Server", "Port", "STARTTLS_Available",
                    "TLS_Version", "Cipher_Suite", "Cert_Subject", "Cert_Issuer",
                    "Cert_Valid_From", "Cert_Valid_To", "Cert_SANs",
                    "Verification_Status", "Warnings", "Error"};
        case ProbeAction::TestAuth:
            return {"Action", "Status", "Server", "Port", "Username",
                    "Auth_Mechanisms_Available", "Auth_Method_Used", "Auth_Result", "Error"};
        case ProbeAction::SendMail:
            return {"Action", "Status", "Server", "Port", "From", "To",
                    "Subject", "SMTP_Response_Code", "Message_ID", "Error"};
    }
    return {};
}

ActionOutcome ProbeRunner::run(ProbeAction action) {
    ActionOutcome outcome;
    outcome.action = action;

    const auto& server = config_.server();
    Fields fields{
        {"Action", std::string(to_string(action))},
        {"Server", server.host},
        {"Port", std::to_string(server.port)},
    };

    LOG_INFO_FMT(*logger_, "Running {} against {}:{}", to_string(action), server.host, server.port);

    try {
        switch (action) {
            case ProbeAction::TestConnect:  test_connect(fields); break;
            case ProbeAction::TestStartTLS: test_starttls(fields); break;
            case ProbeAction::TestAuth:     test_auth(fields); break;
            case ProbeAction::SendMail:     send_mail(fields); break;
        }
        outcome.success = true;
        fields["Status"] = "SUCCESS";
    } catch (const Error& e) {
        outcome.error = e;
        fields["Status"] = "FAILURE";
        fields["Error"] = e.what();
        if (action == ProbeAction::SendMail && e.reply_code() != 0) {
            fields["SMTP_Response_Code"] = std::to_string(e.reply_code());
        }
        LOG_ERROR_FMT(*logger_, "{}: {}", to_string(action), e.what());
        out_ << "\nFAILED: " << e.what() << "\n";
    } catch (const std::exception& e) {
        fields["Status"] = "FAILURE";
        fields["Error"] = e.what();
        LOG_ERROR_FMT(*logger_, "{}: {}", to_string(action), e.what());
        out_ << "\nFAILED: " << e.what() << "\n";
    }

    record(action, fields);
    return outcome;
}

std::unique_ptr<SMTPSession> ProbeRunner::open_session(Fields& fields) {
    const auto& server = config_.server();
    auto session = factory_(server.host, server.port, session_options(config_), logger_);

    fields["Connected"] = "true";
    fields["Banner"] = session->banner();

    out_ << "Connected to " << server.host << ":" << server.port
         << (session->is_tls() ? " (implicit TLS)" : "") << "\n"
         << "Banner: " << session->banner() << "\n";
    return session;
}

void ProbeRunner::test_connect(Fields& fields) {
    fields["Connected"] = "false";
    fields["Exchange_Detected"] = "false";

    auto session = open_session(fields);
    const auto& caps = session->negotiate();
    fields["Capabilities"] = caps.to_string();

    if (session->used_helo()) {
        out_ << "\nServer does not support EHLO; HELO accepted\n";
    } else {
        print_capabilities(caps, "Server capabilities");
    }

    auto info = ExchangeDetector::detect(session->banner(), caps);
    if (info.is_exchange) {
        fields["Exchange_Detected"] = "true";
        print_exchange(info);

        auto advice = ExchangeDetector::recommendations(config_.server().port, caps);
        if (!advice.empty()) {
            out_ << "\nExchange recommendations:\n";
            for (const auto& line : advice) {
                out_ << "  - " << line << "\n";
            }
        }
    }

    session->close();
    out_ << "\nConnectivity test completed successfully\n";
}

void ProbeRunner::test_starttls(Fields& fields) {
    fields["STARTTLS_Available"] = "unknown";

    auto session = open_session(fields);
    try {
        if (session->is_tls()) {
            fields["STARTTLS_Available"] = "n/a (SMTPS)";
        } else {
            const auto& caps = session->negotiate();
            fields["STARTTLS_Available"] = caps.supports_starttls() ? "true" : "false";
            out_ << "STARTTLS advertised: " << (caps.supports_starttls() ? "yes" : "no") << "\n";
            session->upgrade_tls();
        }
    } catch (const Error&) {
        // A refused certificate still produced a report worth showing
        if (session->tls_report()) {
            fill_tls_fields(fields, *session->tls_report());
            print_tls_report(*session->tls_report());
        }
        throw;
    }

    const auto& report = *session->tls_report();
    fill_tls_fields(fields, report);
    print_tls_report(report);

    const auto& caps = session->negotiate();
    print_capabilities(caps, "Capabilities over TLS");

    session->close();
    out_ << "\nTLS test completed successfully\n";
}

void ProbeRunner::test_auth(Fields& fields) {
    const auto& auth = config_.auth();
    fields["Username"] = mask_username(auth.username);
    fields["Auth_Result"] = "FAILURE";

    auto session = open_session(fields);
    const auto& caps = session->negotiate();
    fields["Auth_Mechanisms_Available"] = join(caps.auth_mechanisms(), " ");

    AuthResult result = session->authenticate(auth.method, auth.username, auth.password);

    // The mechanism list may have changed across STARTTLS
    fields["Auth_Mechanisms_Available"] = join(session->capabilities().auth_mechanisms(), " ");
    fields["Auth_Method_Used"] = to_string(result.mechanism);

    out_ << "\nAuthentication (" << to_string(result.mechanism) << ", user "
         << mask_username(auth.username) << (session->is_tls() ? ", over TLS" : ", plaintext")
         << "): " << result.reply_code << " " << result.server_message << "\n";

    if (!result.success) {
        throw Error(ErrorKind::AuthenticationFailed, "Server rejected the credentials",
                    result.reply_code, result.server_message).with_step(Step::AUTH);
    }
    fields["Auth_Result"] = "SUCCESS";

    session->close();
    out_ << "\nAuthentication test completed successfully\n";
}

void ProbeRunner::send_mail(Fields& fields) {
    const auto& auth = config_.auth();
    const auto& message = config_.message();
    fields["From"] = message.from;
    fields["To"] = join(message.to, ", ");
    fields["Subject"] = message.subject;

    out_ << "From:    " << message.from << "\n"
         << "To:      " << join(message.to, ", ") << "\n"
         << "Subject: " << message.subject << "\n\n";

    auto session = open_session(fields);
    session->negotiate();

    if (!auth.username.empty()) {
        AuthResult result = session->authenticate(auth.method, auth.username, auth.password);
        if (!result.success) {
            throw Error(ErrorKind::AuthenticationFailed, "Server rejected the credentials",
                        result.reply_code, result.server_message).with_step(Step::AUTH);
        }
        out_ << "Authenticated as " << mask_username(auth.username)
             << " using " << to_string(result.mechanism) << "\n";
    }

    SendResult sent = session->send_message(message.from, message.to, message.subject, message.body);
    fields["SMTP_Response_Code"] = std::to_string(sent.reply_code);
    fields["Message_ID"] = sent.message_id;

    out_ << "Message accepted: " << sent.reply_code << " " << sent.reply_text << "\n"
         << "Message-ID: <" << sent.message_id << ">\n";

    session->close();
    out_ << "\nMessage sent successfully\n";
}

void ProbeRunner::record(ProbeAction action, const Fields& fields) {
    if (!audit_ || !audit_->is_open()) {
        return;
    }

    auto columns = audit_columns(action);
    if (audit_->needs_header() && !audit_->write_header(columns)) {
        LOG_WARNING_FMT(*logger_, "Audit log: {}", audit_->last_error());
        return;
    }

    std::vector<std::string> row;
    row.reserve(columns.size());
    for (const auto& column : columns) {
        auto it = fields.find(column);
        row.push_back(it != fields.end() ? it->second : std::string());
    }

    if (!audit_->write_row(row)) {
        LOG_WARNING_FMT(*logger_, "Audit log: {}", audit_->last_error());
    }
}

void ProbeRunner::print_capabilities(const CapabilitySet& caps, std::string_view title) {
    out_ << "\n" << title << ":\n";
    if (caps.empty()) {
        out_ << "  (none)\n";
        return;
    }
    for (const auto& cap : caps) {
        out_ << "  " << cap.name;
        for (const auto& param : cap.params) {
            out_ << " " << param;
        }
        out_ << "\n";
    }
}

void ProbeRunner::print_tls_report(const tls::TLSReport& report) {
    const auto& conn = report.connection;
    out_ << "\nTLS connection:\n"
         << "  Version:      " << tls::to_string(conn.version) << "\n"
         << std::format("  Cipher suite: {} (0x{:04X}), {} bits, {}\n",
                        conn.cipher_name, conn.cipher_suite_id, conn.cipher_bits,
                        tls::to_string(conn.strength))
         << "  Server name:  " << conn.server_name << "\n";

    out_ << "\nCertificate chain:\n";
    for (size_t i = 0; i < report.chain.size(); ++i) {
        const auto& cert = report.chain[i];
        out_ << "  [" << i << "] " << cert.subject << "\n"
             << "      Issuer:    " << cert.issuer << "\n"
             << "      Serial:    " << cert.serial_number << "\n"
             << "      Valid:     " << format_utc(cert.not_before)
             << " to " << format_utc(cert.not_after) << "\n";
        if (!cert.sans.empty()) {
            out_ << "      SANs:      " << join(cert.sans, ", ") << "\n";
        }
        out_ << "      Key:       " << cert.public_key_algorithm << " " << cert.public_key_bits
             << " bits, signed with " << cert.signature_algorithm << "\n";
        if (!cert.key_usage.empty()) {
            out_ << "      Usage:     " << join_usages(cert.key_usage) << "\n";
        }
        if (!cert.ext_key_usage.empty()) {
            out_ << "      Ext usage: " << join_usages(cert.ext_key_usage) << "\n";
        }
        out_ << "      Status:    " << tls::to_string(cert.status) << "\n";
    }

    out_ << "\nChain trusted: " << (report.chain_trusted ? "yes" : "no");
    if (!report.chain_trusted && !report.verify_error.empty()) {
        out_ << " (" << report.verify_error << ")";
    }
    out_ << "\n";

    if (!report.warnings.empty()) {
        out_ << "\nWarnings:\n";
        for (const auto& w : report.warnings) {
            out_ << "  [" << tls::to_string(w.severity) << "] "
                 << tls::to_string(w.category) << ": " << w.message << "\n";
        }
    }
    if (!report.recommendations.empty()) {
        out_ << "\nRecommendations:\n";
        for (const auto& advice : report.recommendations) {
            out_ << "  - " << advice << "\n";
        }
    }
}

void ProbeRunner::print_exchange(const ExchangeInfo& info) {
    out_ << "\nMicrosoft Exchange detected\n"
         << "  Version: " << info.version << "\n";

    if (!info.notes.empty()) {
        out_ << "\nExchange notes:\n";
        for (const auto& note : info.notes) {
            out_ << "  - " << note << "\n";
        }
    }
}

}  // namespace mailprobe::smtp
