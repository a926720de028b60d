#include "config.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace mailprobe {

namespace {

const std::array<std::pair<const char*, const char*>, 15> ENVIRONMENT_KEYS = {{
    {"SMTPACTION", "server.action"},
    {"SMTPHOST", "server.host"},
    {"SMTPPORT", "server.port"},
    {"SMTPTIMEOUT", "server.timeout"},
    {"SMTPUSERNAME", "auth.username"},
    {"SMTPPASSWORD", "auth.password"},
    {"SMTPAUTHMETHOD", "auth.method"},
    {"SMTPFROM", "message.from"},
    {"SMTPTO", "message.to"},
    {"SMTPSUBJECT", "message.subject"},
    {"SMTPBODY", "message.body"},
    {"SMTPSTARTTLS", "tls.starttls"},
    {"SMTPSMTPS", "tls.smtps"},
    {"SMTPTLSVERSION", "tls.version"},
    {"SMTPSKIPVERIFY", "tls.skip_verify"},
}};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<bool> to_bool(const std::string& v) {
    std::string lower = to_lower(v);
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") return true;
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") return false;
    return std::nullopt;
}

std::optional<int64_t> to_int(const std::string& v) {
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (ec != std::errc() || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return result;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

std::optional<StartTLSPolicy> parse_starttls_policy(std::string_view text) {
    std::string lower = to_lower(std::string(text));
    if (lower == "auto") return StartTLSPolicy::Auto;
    if (lower == "required" || lower == "require" || lower == "force") return StartTLSPolicy::Required;
    if (lower == "disabled" || lower == "disable" || lower == "off") return StartTLSPolicy::Disabled;

    // Boolean form, as in -starttls / SMTPSTARTTLS=true
    if (auto flag = to_bool(lower)) {
        return *flag ? StartTLSPolicy::Required : StartTLSPolicy::Auto;
    }
    return std::nullopt;
}

std::string_view to_string(StartTLSPolicy policy) {
    switch (policy) {
        case StartTLSPolicy::Auto:     return "auto";
        case StartTLSPolicy::Required: return "required";
        case StartTLSPolicy::Disabled: return "disabled";
    }
    return "auto";
}

bool Config::load(const std::filesystem::path& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        problems_.push_back("Cannot open config file " + config_file.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    std::string current_section;
    bool ok = true;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = to_lower(trim(line.substr(1, line.length() - 2)));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            problems_.push_back("Malformed config line: " + line);
            ok = false;
            continue;
        }

        std::string key = to_lower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from value
        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        if (!parse_section(current_section, key, value)) {
            ok = false;
        }
    }

    return ok;
}

void Config::apply_environment(const EnvLookup& lookup) {
    for (const auto& [variable, key] : ENVIRONMENT_KEYS) {
        if (is_set(key)) continue;

        auto value = lookup(variable);
        if (value && !value->empty()) {
            set(key, *value);
        }
    }
}

std::optional<std::string> Config::system_environment(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

bool Config::set(const std::string& key, const std::string& value) {
    auto dot = key.find('.');
    if (dot == std::string::npos) {
        problems_.push_back("Unknown setting: " + key);
        return false;
    }
    return parse_section(to_lower(key.substr(0, dot)), to_lower(key.substr(dot + 1)), value);
}

void Config::add_problem(const std::string& section, const std::string& key, const std::string& value) {
    problems_.push_back("Invalid value for " + section + "." + key + ": '" + value + "'");
}

bool Config::parse_section(const std::string& section, const std::string& key,
                           const std::string& value) {
    auto invalid = [&]() {
        add_problem(section, key, value);
        return false;
    };

    if (section == "server") {
        if (key == "action") {
            server_.action = to_lower(value);
        } else if (key == "host") {
            server_.host = value;
        } else if (key == "port") {
            auto port = to_int(value);
            if (!port || *port < 1 || *port > 65535) return invalid();
            server_.port = static_cast<uint16_t>(*port);
        } else if (key == "timeout") {
            auto seconds = to_int(value);
            if (!seconds || *seconds <= 0) return invalid();
            server_.timeout = std::chrono::seconds(*seconds);
        } else if (key == "ehlo_name") {
            server_.ehlo_name = value;
        } else {
            return invalid();
        }
    } else if (section == "tls" || section == "ssl") {
        if (key == "starttls") {
            auto policy = parse_starttls_policy(value);
            if (!policy) return invalid();
            tls_.starttls = *policy;
        } else if (key == "smtps") {
            auto flag = to_bool(value);
            if (!flag) return invalid();
            tls_.smtps = *flag;
        } else if (key == "skip_verify") {
            auto flag = to_bool(value);
            if (!flag) return invalid();
            tls_.skip_verify = *flag;
        } else if (key == "min_version") {
            auto version = tls::parse_tls_version(value);
            if (!version) return invalid();
            tls_.min_version = *version;
        } else if (key == "version") {
            // Exact version: pins both ends of the range
            auto version = tls::parse_tls_version(value);
            if (!version) return invalid();
            tls_.min_version = *version;
            tls_.max_version = *version;
        } else if (key == "ca_file") {
            tls_.ca_file = value;
        } else {
            return invalid();
        }
    } else if (section == "auth") {
        if (key == "username") {
            auth_.username = value;
        } else if (key == "password") {
            auth_.password = value;
        } else if (key == "method") {
            auth_.method = value;
        } else {
            return invalid();
        }
    } else if (section == "message") {
        if (key == "from") {
            message_.from = value;
        } else if (key == "to") {
            message_.to = split_list(value);
        } else if (key == "subject") {
            message_.subject = value;
        } else if (key == "body") {
            message_.body = value;
        } else {
            return invalid();
        }
    } else if (section == "log" || section == "logging") {
        if (key == "level") {
            auto level = parse_log_level(value);
            if (!level) return invalid();
            log_.level = *level;
        } else if (key == "file") {
            log_.file = value;
        } else if (key == "console") {
            auto flag = to_bool(value);
            if (!flag) return invalid();
            log_.console = *flag;
        } else if (key == "max_file_size") {
            auto size = to_int(value);
            if (!size || *size <= 0) return invalid();
            log_.max_file_size = static_cast<size_t>(*size);
        } else if (key == "max_files") {
            auto count = to_int(value);
            if (!count || *count <= 0) return invalid();
            log_.max_files = static_cast<size_t>(*count);
        } else if (key == "verbose") {
            auto flag = to_bool(value);
            if (!flag) return invalid();
            log_.verbose = *flag;
        } else if (key == "csv") {
            auto flag = to_bool(value);
            if (!flag) return invalid();
            log_.csv = *flag;
        } else if (key == "csv_dir") {
            log_.csv_dir = value;
        } else {
            return invalid();
        }
    } else {
        return invalid();
    }

    assigned_.insert(section == "ssl" ? "tls." + key :
                     section == "logging" ? "log." + key :
                     section + "." + key);
    return true;
}

}  // namespace mailprobe
