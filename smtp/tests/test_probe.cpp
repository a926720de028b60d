#include <catch2/catch_test_macros.hpp>
#include "probe_actions.hpp"
#include "audit_log.hpp"
#include "scripted_connection.hpp"

#include <fstream>
#include <sstream>

#include <sys/stat.h>

using namespace mailprobe;
using namespace mailprobe::smtp;
using mailprobe::testing::Script;
using mailprobe::testing::ScriptedConnection;
using mailprobe::testing::TempDirectory;

namespace {

const std::string GREETING = "220 mail.example.com ESMTP ready\r\n";
const std::string EHLO_PLAIN = "250-mail.example.com\r\n250-STARTTLS\r\n250-AUTH PLAIN LOGIN\r\n250 SIZE 35882577\r\n";
const std::string EHLO_TLS = "250-mail.example.com\r\n250-AUTH PLAIN LOGIN CRAM-MD5\r\n250 8BITMIME\r\n";
const std::string EHLO_NO_TLS = "250-mail.example.com\r\n250-AUTH PLAIN LOGIN\r\n250 SIZE 100000\r\n";

Config make_config(const std::string& action) {
    Config config;
    config.set("server.action", action);
    config.set("server.host", "mail.example.com");
    return config;
}

SessionFactory scripted_factory(const std::shared_ptr<Script>& script) {
    return [script](const std::string&, uint16_t, const SessionOptions& options,
                    std::shared_ptr<Logger> logger) {
        auto session = std::make_unique<SMTPSession>(std::make_unique<ScriptedConnection>(script),
                                                     options, std::move(logger));
        session->start();
        return session;
    };
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

}  // namespace

TEST_CASE("Action names", "[probe]") {
    REQUIRE(parse_action("testconnect") == ProbeAction::TestConnect);
    REQUIRE(parse_action("TestStartTLS") == ProbeAction::TestStartTLS);
    REQUIRE(parse_action("TESTAUTH") == ProbeAction::TestAuth);
    REQUIRE(parse_action("sendmail") == ProbeAction::SendMail);
    REQUIRE_FALSE(parse_action("relaytest").has_value());
    REQUIRE(to_string(ProbeAction::SendMail) == "sendmail");
}

TEST_CASE("Configuration validation", "[probe][config]") {
    SECTION("Valid connectivity test") {
        auto config = make_config("testconnect");
        REQUIRE_FALSE(validate_config(config, ProbeAction::TestConnect).has_value());
    }

    SECTION("Host is required") {
        Config config;
        REQUIRE(validate_config(config, ProbeAction::TestConnect) == "host is required (-host)");
    }

    SECTION("Parse problems are reported first") {
        Config config;
        config.set("server.port", "99999");
        auto problem = validate_config(config, ProbeAction::TestConnect);
        REQUIRE(problem.has_value());
        REQUIRE(problem->find("server.port") != std::string::npos);
    }

    SECTION("SMTPS moves the default port") {
        auto config = make_config("testconnect");
        config.set("tls.smtps", "true");
        REQUIRE_FALSE(validate_config(config, ProbeAction::TestConnect).has_value());
        REQUIRE(config.server().port == 465);

        auto explicit_port = make_config("testconnect");
        explicit_port.set("tls.smtps", "true");
        explicit_port.set("server.port", "2465");
        REQUIRE_FALSE(validate_config(explicit_port, ProbeAction::TestConnect).has_value());
        REQUIRE(explicit_port.server().port == 2465);
    }

    SECTION("SMTPS and forced STARTTLS conflict") {
        auto config = make_config("teststarttls");
        config.set("tls.smtps", "true");
        config.set("tls.starttls", "required");
        REQUIRE(validate_config(config, ProbeAction::TestStartTLS).has_value());
    }

    SECTION("Credentials for testauth") {
        auto config = make_config("testauth");
        REQUIRE(validate_config(config, ProbeAction::TestAuth) == "testauth requires -username");
        config.set("auth.username", "user");
        REQUIRE(validate_config(config, ProbeAction::TestAuth) == "testauth requires -password");
        config.set("auth.password", "pass");
        REQUIRE_FALSE(validate_config(config, ProbeAction::TestAuth).has_value());
    }

    SECTION("Addresses for sendmail") {
        auto config = make_config("sendmail");
        REQUIRE(validate_config(config, ProbeAction::SendMail) == "sendmail requires -from");

        config.set("message.from", "probe@example.com");
        REQUIRE(validate_config(config, ProbeAction::SendMail) == "sendmail requires -to");

        config.set("message.to", "a@example.com, not-an-address");
        REQUIRE(validate_config(config, ProbeAction::SendMail) ==
                "invalid recipient address: not-an-address");

        config.set("message.to", "a@example.com, b@example.com");
        REQUIRE_FALSE(validate_config(config, ProbeAction::SendMail).has_value());

        config.set("auth.username", "user");
        REQUIRE(validate_config(config, ProbeAction::SendMail) == "-username requires -password");
    }

    SECTION("TLS version range") {
        auto config = make_config("teststarttls");
        config.set("tls.min_version", "1.3");
        config.tls().max_version = tls::TLSVersion::TLS1_2;
        REQUIRE(validate_config(config, ProbeAction::TestStartTLS).has_value());
    }
}

TEST_CASE("Session options from configuration", "[probe][config]") {
    auto config = make_config("teststarttls");
    config.set("server.timeout", "12");
    config.set("server.ehlo_name", "probe.example.net");
    config.set("tls.starttls", "disabled");
    config.set("tls.version", "1.3");
    config.set("tls.skip_verify", "yes");

    auto options = session_options(config);
    REQUIRE(options.timeout == std::chrono::seconds(12));
    REQUIRE(options.local_hostname == "probe.example.net");
    REQUIRE(options.starttls == StartTLSPolicy::Disabled);
    REQUIRE(options.tls.server_name == "mail.example.com");
    REQUIRE(options.tls.min_version == tls::TLSVersion::TLS1_3);
    REQUIRE(options.tls.max_version == tls::TLSVersion::TLS1_3);
    REQUIRE(options.tls.skip_verify);
    REQUIRE_FALSE(options.implicit_tls);
}

TEST_CASE("Probe actions", "[probe]") {
    auto script = std::make_shared<Script>();
    script->handshake = testing::good_handshake("mail.example.com");
    std::ostringstream out;

    TempDirectory temp;
    CsvAuditLog audit;

    SECTION("Connectivity test against Exchange") {
        auto config = make_config("testconnect");
        script->reply("220 EX01.contoso.com Microsoft ESMTP MAIL Service ready at Mon, 1 Jan 2024 "
                      "Version: 15.2.1118.7\r\n" + EHLO_PLAIN + "221 Bye\r\n");

        REQUIRE(audit.open(temp.path(), "testconnect"));
        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory(scripted_factory(script));
        runner.set_audit_log(&audit);

        auto outcome = runner.run(ProbeAction::TestConnect);
        REQUIRE(outcome.success);
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE(script->sent("QUIT\r\n"));

        std::string text = out.str();
        REQUIRE(text.find("Server capabilities:") != std::string::npos);
        REQUIRE(text.find("  AUTH PLAIN LOGIN") != std::string::npos);
        REQUIRE(text.find("Microsoft Exchange detected") != std::string::npos);
        REQUIRE(text.find("Exchange 2019 (15.2.1118.7)") != std::string::npos);
        REQUIRE(text.find("Connectivity test completed successfully") != std::string::npos);

        audit.close();
        std::string csv = read_file(audit.path());
        REQUIRE(csv.rfind("Timestamp,Action,Status,Server,Port,Connected,Banner,"
                          "Capabilities,Exchange_Detected,Error\r\n", 0) == 0);
        REQUIRE(csv.find(",testconnect,SUCCESS,mail.example.com,25,true,\"EX01.contoso.com") != std::string::npos);
        REQUIRE(csv.find(",true,\r\n") != std::string::npos);
    }

    SECTION("Connection failure is recorded") {
        auto config = make_config("testconnect");
        REQUIRE(audit.open(temp.path(), "testconnect"));

        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory([](const std::string&, uint16_t, const SessionOptions&,
                                      std::shared_ptr<Logger>) -> std::unique_ptr<SMTPSession> {
            throw Error(ErrorKind::ConnectionRefused, "Cannot connect to mail.example.com:25")
                .with_step(Step::Connect);
        });
        runner.set_audit_log(&audit);

        auto outcome = runner.run(ProbeAction::TestConnect);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind() == ErrorKind::ConnectionRefused);
        REQUIRE(out.str().find("FAILED: connect failed: Cannot connect") != std::string::npos);

        audit.close();
        std::string csv = read_file(audit.path());
        REQUIRE(csv.find(",testconnect,FAILURE,mail.example.com,25,false,,,false,"
                         "connect failed: Cannot connect to mail.example.com:25\r\n") != std::string::npos);
    }

    SECTION("Failures outside the protocol are still recorded") {
        auto config = make_config("testconnect");
        REQUIRE(audit.open(temp.path(), "testconnect"));

        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory([](const std::string&, uint16_t, const SessionOptions&,
                                      std::shared_ptr<Logger>) -> std::unique_ptr<SMTPSession> {
            throw std::invalid_argument("SMTPSession requires a connection");
        });
        runner.set_audit_log(&audit);

        auto outcome = runner.run(ProbeAction::TestConnect);
        REQUIRE_FALSE(outcome.success);
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE(out.str().find("FAILED: SMTPSession requires a connection") != std::string::npos);

        audit.close();
        std::string csv = read_file(audit.path());
        REQUIRE(csv.find(",testconnect,FAILURE,mail.example.com,25,false,,,false,"
                         "SMTPSession requires a connection\r\n") != std::string::npos);
    }

    SECTION("STARTTLS test prints the report and re-negotiates") {
        auto config = make_config("teststarttls");
        script->reply(GREETING + EHLO_PLAIN + "220 Go ahead\r\n" + EHLO_TLS + "221 Bye\r\n");

        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory(scripted_factory(script));

        auto outcome = runner.run(ProbeAction::TestStartTLS);
        REQUIRE(outcome.success);

        std::string text = out.str();
        REQUIRE(text.find("STARTTLS advertised: yes") != std::string::npos);
        REQUIRE(text.find("TLS_AES_256_GCM_SHA384 (0x1302), 256 bits") != std::string::npos);
        REQUIRE(text.find("Certificate chain:") != std::string::npos);
        REQUIRE(text.find("Capabilities over TLS:") != std::string::npos);
        REQUIRE(text.find("  AUTH PLAIN LOGIN CRAM-MD5") != std::string::npos);
    }

    SECTION("Refused certificate still shows the report") {
        auto config = make_config("teststarttls");
        script->handshake = testing::good_handshake("other.example.org");
        script->reply(GREETING + EHLO_PLAIN + "220 Go ahead\r\n");

        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory(scripted_factory(script));

        auto outcome = runner.run(ProbeAction::TestStartTLS);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind() == ErrorKind::HandshakeFailed);
        REQUIRE(outcome.error->step() == Step::STARTTLS);

        std::string text = out.str();
        REQUIRE(text.find("Certificate chain:") != std::string::npos);
        REQUIRE(text.find("CERT_HOSTNAME") != std::string::npos);
        REQUIRE(text.find("FAILED: STARTTLS failed: certificate does not match server name "
                          "mail.example.com") != std::string::npos);
    }

    SECTION("Rejected credentials fail the auth test") {
        auto config = make_config("testauth");
        config.set("tls.starttls", "disabled");
        config.set("auth.username", "user@example.com");
        config.set("auth.password", "wrong");
        script->reply(GREETING + EHLO_NO_TLS +
                      "535 5.7.8 Authentication credentials invalid\r\n221 Bye\r\n");

        REQUIRE(audit.open(temp.path(), "testauth"));
        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory(scripted_factory(script));
        runner.set_audit_log(&audit);

        auto outcome = runner.run(ProbeAction::TestAuth);
        REQUIRE_FALSE(outcome.success);
        REQUIRE(outcome.error->kind() == ErrorKind::AuthenticationFailed);
        REQUIRE(outcome.error->reply_code() == 535);
        REQUIRE(out.str().find("plaintext") != std::string::npos);

        audit.close();
        std::string csv = read_file(audit.path());
        REQUIRE(csv.find("us****om") != std::string::npos);
        REQUIRE(csv.find("user@example.com") == std::string::npos);
        REQUIRE(csv.find("wrong") == std::string::npos);
        REQUIRE(csv.find(",LOGIN,FAILURE,") != std::string::npos);
    }

    SECTION("Send mail reports the message id") {
        auto config = make_config("sendmail");
        config.set("message.from", "probe@example.com");
        config.set("message.to", "a@example.com");
        config.set("message.subject", "Probe");
        config.set("tls.starttls", "disabled");
        script->reply(GREETING + EHLO_NO_TLS +
                      "250 OK\r\n250 OK\r\n354 Go ahead\r\n250 2.0.0 Queued\r\n221 Bye\r\n");

        ProbeRunner runner(config, nullptr, out);
        runner.set_session_factory(scripted_factory(script));

        auto outcome = runner.run(ProbeAction::SendMail);
        REQUIRE(outcome.success);

        std::string text = out.str();
        REQUIRE(text.find("Message accepted: 250 2.0.0 Queued") != std::string::npos);
        REQUIRE(text.find("Message-ID: <") != std::string::npos);
        REQUIRE(script->sent("RCPT TO:<a@example.com>\r\n"));
    }
}

TEST_CASE("CSV audit log", "[probe][audit]") {
    SECTION("Field quoting") {
        REQUIRE(CsvAuditLog::escape("plain") == "plain");
        REQUIRE(CsvAuditLog::escape("a,b") == "\"a,b\"");
        REQUIRE(CsvAuditLog::escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
        REQUIRE(CsvAuditLog::escape("two\r\nlines") == "\"two\r\nlines\"");
        REQUIRE(CsvAuditLog::escape("") == "");
    }

    SECTION("File name carries the action and the day") {
        auto name = CsvAuditLog::file_name("testauth");
        REQUIRE(name.rfind("_smtpprobe_testauth_", 0) == 0);
        REQUIRE(name.size() == std::string("_smtpprobe_testauth_2024-01-01.csv").size());
        REQUIRE(name.substr(name.size() - 4) == ".csv");
    }

    SECTION("Owner-only file, header written once") {
        TempDirectory temp;
        std::vector<std::string> columns = {"Action", "Status"};

        {
            CsvAuditLog audit;
            REQUIRE(audit.open(temp.path(), "testconnect"));
            REQUIRE(audit.needs_header());
            REQUIRE(audit.write_header(columns));
            REQUIRE(audit.write_row({"testconnect", "SUCCESS"}));
        }

        CsvAuditLog audit;
        REQUIRE(audit.open(temp.path(), "testconnect"));
        REQUIRE_FALSE(audit.needs_header());
        REQUIRE(audit.write_row({"testconnect", "FAILURE"}));
        audit.close();

        struct stat st{};
        REQUIRE(::stat(audit.path().c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);

        std::string csv = read_file(audit.path());
        REQUIRE(csv.find("Timestamp,Action,Status\r\n") == 0);
        REQUIRE(csv.find("Timestamp", 1) == std::string::npos);
        REQUIRE(csv.find(",testconnect,SUCCESS\r\n") != std::string::npos);
        REQUIRE(csv.find(",testconnect,FAILURE\r\n") != std::string::npos);
    }

    SECTION("Writing before open fails without throwing") {
        CsvAuditLog audit;
        REQUIRE_FALSE(audit.write_row({"x"}));
        REQUIRE_FALSE(audit.last_error().empty());
    }
}
