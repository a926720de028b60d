#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "audit_log.hpp"
#include "config.hpp"
#include "error.hpp"
#include "exchange_detector.hpp"
#include "logger.hpp"
#include "smtp_session.hpp"

namespace mailprobe::smtp {

enum class ProbeAction {
    TestConnect,
    TestStartTLS,
    TestAuth,
    SendMail
};

// "testconnect", "teststarttls", "testauth", "sendmail" (case-insensitive)
std::optional<ProbeAction> parse_action(std::string_view name);
std::string_view to_string(ProbeAction action);

// First configuration problem for `action`, or nullopt. Moves SMTPS from
// the default port 25 to 465.
std::optional<std::string> validate_config(Config& config, ProbeAction action);

SessionOptions session_options(const Config& config);

struct ActionOutcome {
    ProbeAction action = ProbeAction::TestConnect;
    bool success = false;
    std::optional<Error> error;
};

using SessionFactory = std::function<std::unique_ptr<SMTPSession>(
    const std::string& host, uint16_t port, const SessionOptions& options,
    std::shared_ptr<Logger> logger)>;

// Runs one action as a fixed sequence of session calls, prints the
// diagnostics to `out` and records one audit row.
class ProbeRunner {
public:
    ProbeRunner(const Config& config, std::shared_ptr<Logger> logger, std::ostream& out);

    // Replaces SMTPSession::connect, for driving the runner over other transports.
    void set_session_factory(SessionFactory factory) { factory_ = std::move(factory); }
    void set_audit_log(CsvAuditLog* audit) { audit_ = audit; }

    ActionOutcome run(ProbeAction action);

    static std::vector<std::string> audit_columns(ProbeAction action);

private:
    using Fields = std::map<std::string, std::string>;

    void test_connect(Fields& fields);
    void test_starttls(Fields& fields);
    void test_auth(Fields& fields);
    void send_mail(Fields& fields);

    std::unique_ptr<SMTPSession> open_session(Fields& fields);
    void record(ProbeAction action, const Fields& fields);

    void print_capabilities(const CapabilitySet& caps, std::string_view title);
    void print_tls_report(const tls::TLSReport& report);
    void print_exchange(const ExchangeInfo& info);

    const Config& config_;
    std::shared_ptr<Logger> logger_;
    std::ostream& out_;
    SessionFactory factory_;
    CsvAuditLog* audit_ = nullptr;
};

}  // namespace mailprobe::smtp
