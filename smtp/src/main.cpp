#include "probe_actions.hpp"
#include "audit_log.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char* VERSION = "1.0.0";

const std::map<std::string, std::string> VALUE_FLAGS = {
    {"action", "server.action"},
    {"host", "server.host"},
    {"port", "server.port"},
    {"timeout", "server.timeout"},
    {"ehlo", "server.ehlo_name"},
    {"username", "auth.username"},
    {"password", "auth.password"},
    {"authmethod", "auth.method"},
    {"from", "message.from"},
    {"to", "message.to"},
    {"subject", "message.subject"},
    {"body", "message.body"},
    {"tlsversion", "tls.version"},
    {"mintls", "tls.min_version"},
    {"cafile", "tls.ca_file"},
    {"loglevel", "log.level"},
    {"logfile", "log.file"},
    {"csvdir", "log.csv_dir"},
};

const std::map<std::string, std::pair<std::string, std::string>> SWITCH_FLAGS = {
    {"starttls", {"tls.starttls", "required"}},
    {"nostarttls", {"tls.starttls", "disabled"}},
    {"smtps", {"tls.smtps", "true"}},
    {"skipverify", {"tls.skip_verify", "true"}},
    {"verbose", {"log.verbose", "true"}},
    {"csv", {"log.csv", "true"}},
    {"nocsv", {"log.csv", "false"}},
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " -action <action> -host <host> [options]\n"
              << "\nActions:\n"
              << "  testconnect     Connect, EHLO, list capabilities, detect Exchange\n"
              << "  teststarttls    STARTTLS (or SMTPS) with certificate and cipher diagnostics\n"
              << "  testauth        Authenticate with PLAIN, LOGIN or CRAM-MD5\n"
              << "  sendmail        Send a test message\n"
              << "\nOptions:\n"
              << "  -host <name>          SMTP server (env SMTPHOST)\n"
              << "  -port <n>             Port, default 25 (env SMTPPORT)\n"
              << "  -timeout <seconds>    Per-operation timeout, default 30 (env SMTPTIMEOUT)\n"
              << "  -ehlo <name>          Name sent with EHLO, default smtpprobe.local\n"
              << "  -username <user>      (env SMTPUSERNAME)\n"
              << "  -password <secret>    (env SMTPPASSWORD)\n"
              << "  -authmethod <name>    auto, PLAIN, LOGIN, CRAM-MD5 (env SMTPAUTHMETHOD)\n"
              << "  -from <address>       Sender for sendmail (env SMTPFROM)\n"
              << "  -to <a,b,...>         Recipients for sendmail (env SMTPTO)\n"
              << "  -subject <text>       Default \"SMTP Test\" (env SMTPSUBJECT)\n"
              << "  -body <text>          (env SMTPBODY)\n"
              << "  -starttls             Fail unless STARTTLS is available\n"
              << "  -nostarttls           Never upgrade to TLS\n"
              << "  -smtps                Implicit TLS, port 465 unless -port is given\n"
              << "  -skipverify           Do not reject untrusted or mismatched certificates\n"
              << "  -tlsversion <v>       Exact TLS version: 1.0, 1.1, 1.2, 1.3\n"
              << "  -mintls <v>           Minimum TLS version, default 1.2\n"
              << "  -cafile <path>        Trust anchors instead of the system store\n"
              << "  -config <file>        INI configuration file\n"
              << "  -verbose              Protocol trace\n"
              << "  -loglevel <level>     trace, debug, info, warning, error\n"
              << "  -logfile <path>       Also log to a file\n"
              << "  -csvdir <dir>         Directory for the CSV audit log (default temp)\n"
              << "  -csv / -nocsv         Write the CSV audit log (default) or skip it\n"
              << "  -version              Show version information\n"
              << "  -help                 Show this help message\n"
              << "\nFlags override the config file, which overrides SMTP* environment variables.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace mailprobe;

    std::string config_file;
    std::vector<std::pair<std::string, std::string>> overrides;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string name = arg.substr(std::min(arg.find_first_not_of('-'), arg.size()));

        if (name == "h" || name == "help") {
            print_usage(argv[0]);
            return 0;
        } else if (name == "v" || name == "version") {
            std::cout << "smtpprobe v" << VERSION << "\n";
            return 0;
        } else if (name == "c" || name == "config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return 2;
            }
            config_file = argv[++i];
        } else if (auto flag = SWITCH_FLAGS.find(name); flag != SWITCH_FLAGS.end()) {
            overrides.push_back(flag->second);
        } else if (auto value = VALUE_FLAGS.find(name); value != VALUE_FLAGS.end()) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return 2;
            }
            overrides.emplace_back(value->second, argv[++i]);
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    Config config;
    if (!config_file.empty() && !config.load(config_file)) {
        for (const auto& problem : config.problems()) {
            std::cerr << "Configuration error: " << problem << "\n";
        }
        return 2;
    }
    for (const auto& [key, value] : overrides) {
        config.set(key, value);
    }
    config.apply_environment();

    if (config.server().action.empty()) {
        std::cerr << "Configuration error: -action is required\n";
        print_usage(argv[0]);
        return 2;
    }
    auto action = smtp::parse_action(config.server().action);
    if (!action) {
        std::cerr << "Configuration error: invalid action '" << config.server().action
                  << "' (testconnect, teststarttls, testauth, sendmail)\n";
        return 2;
    }
    if (auto problem = smtp::validate_config(config, *action)) {
        std::cerr << "Configuration error: " << *problem << "\n";
        return 2;
    }

    const auto& log = config.log();
    LoggerOptions log_options;
    log_options.level = log.verbose ? LogLevel::Trace : log.level;
    log_options.console = log.console;
    log_options.file = log.file;
    log_options.max_file_size = log.max_file_size;
    log_options.max_files = log.max_files;
    auto logger = Logger::create(log_options);

    smtp::CsvAuditLog audit;
    if (log.csv) {
        if (audit.open(log.csv_dir, smtp::to_string(*action))) {
            std::cout << "Logging to: " << audit.path().string() << "\n\n";
        } else {
            LOG_WARNING_FMT(*logger, "CSV audit log disabled: {}", audit.last_error());
        }
    }

    try {
        smtp::ProbeRunner runner(config, logger, std::cout);
        runner.set_audit_log(&audit);

        auto outcome = runner.run(*action);
        return outcome.success ? 0 : 1;
    } catch (const std::exception& e) {
        LOG_FATAL_FMT(*logger, "Probe error: {}", e.what());
        return 1;
    }
}
