#pragma once

#include <string>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <vector>
#include <cstdint>

#include "logger.hpp"
#include "tls_diagnostics.hpp"

namespace mailprobe {

enum class StartTLSPolicy {
    Auto,      // upgrade whenever the server advertises STARTTLS
    Required,  // fail when it is not advertised
    Disabled   // stay in plaintext
};

std::optional<StartTLSPolicy> parse_starttls_policy(std::string_view text);
std::string_view to_string(StartTLSPolicy policy);

struct ServerSettings {
    std::string action;
    std::string host;
    uint16_t port = 25;
    std::chrono::seconds timeout{30};
    std::string ehlo_name = "smtpprobe.local";
};

struct TLSSettings {
    StartTLSPolicy starttls = StartTLSPolicy::Auto;
    bool smtps = false;
    bool skip_verify = false;
    tls::TLSVersion min_version = tls::TLSVersion::TLS1_2;
    std::optional<tls::TLSVersion> max_version;
    std::filesystem::path ca_file;
};

struct AuthSettings {
    std::string username;
    std::string password;
    std::string method = "auto";
};

struct MessageSettings {
    std::string from;
    std::vector<std::string> to;
    std::string subject = "SMTP Test";
    std::string body = "This is a test message from smtpprobe";
};

struct LogSettings {
    LogLevel level = LogLevel::Info;
    bool console = true;
    std::filesystem::path file;
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
    bool verbose = false;
    bool csv = true;
    std::filesystem::path csv_dir;  // empty: system temp directory
};

// Probe settings. Sources are layered by the caller: INI file, then
// environment for anything the file left unset, then command-line flags.
class Config {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    Config() = default;

    bool load(const std::filesystem::path& config_file);
    bool load_from_string(const std::string& content);

    // Applies SMTP* environment variables to settings not assigned yet.
    void apply_environment(const EnvLookup& lookup = system_environment);
    static std::optional<std::string> system_environment(const std::string& name);

    // Assigns "section.key". Values that do not parse are recorded in problems().
    bool set(const std::string& key, const std::string& value);
    bool is_set(const std::string& key) const { return assigned_.count(key) > 0; }

    // Configuration errors found while loading, in the order they were found.
    const std::vector<std::string>& problems() const { return problems_; }

    const ServerSettings& server() const { return server_; }
    const TLSSettings& tls() const { return tls_; }
    const AuthSettings& auth() const { return auth_; }
    const MessageSettings& message() const { return message_; }
    const LogSettings& log() const { return log_; }

    ServerSettings& server() { return server_; }
    TLSSettings& tls() { return tls_; }
    AuthSettings& auth() { return auth_; }
    MessageSettings& message() { return message_; }
    LogSettings& log() { return log_; }

private:
    bool parse_section(const std::string& section, const std::string& key, const std::string& value);
    void add_problem(const std::string& section, const std::string& key, const std::string& value);

    ServerSettings server_;
    TLSSettings tls_;
    AuthSettings auth_;
    MessageSettings message_;
    LogSettings log_;

    std::set<std::string> assigned_;
    std::vector<std::string> problems_;
};

}  // namespace mailprobe
