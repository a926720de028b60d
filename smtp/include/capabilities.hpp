#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "smtp_response.hpp"

namespace mailprobe::smtp {

struct Capability {
    std::string name;
    std::vector<std::string> params;
};

// Extensions advertised in one EHLO reply. Keywords keep the order the server
// declared them in and are looked up case-insensitively. Unknown keywords are
// kept as-is. A new EHLO always produces a new set.
class CapabilitySet {
public:
    using const_iterator = std::vector<Capability>::const_iterator;

    CapabilitySet() = default;

    // Line 0 is the greeting text, the rest are "KEYWORD [param ...]".
    static CapabilitySet parse(const std::vector<std::string>& lines);
    static CapabilitySet parse(const SMTPResponse& ehlo_response) { return parse(ehlo_response.lines); }

    const std::string& greeting() const { return greeting_; }
    bool empty() const { return capabilities_.empty(); }
    size_t size() const { return capabilities_.size(); }

    bool has(std::string_view name) const;
    const Capability* find(std::string_view name) const;
    // Empty when the keyword is absent or carries no parameters
    const std::vector<std::string>& params(std::string_view name) const;

    bool supports_auth(std::string_view mechanism) const;
    std::vector<std::string> auth_mechanisms() const;
    bool supports_starttls() const { return has("STARTTLS"); }
    bool supports_pipelining() const { return has("PIPELINING"); }
    bool supports_8bitmime() const { return has("8BITMIME"); }

    // SIZE limit in bytes: nullopt when SIZE is not advertised, 0 when no limit is given.
    std::optional<uint64_t> max_size() const;

    // "STARTTLS, AUTH PLAIN LOGIN, SIZE 35882577"
    std::string to_string() const;

    const_iterator begin() const { return capabilities_.begin(); }
    const_iterator end() const { return capabilities_.end(); }

    void clear();

private:
    void add(std::string name, std::vector<std::string> params);

    std::string greeting_;
    std::vector<Capability> capabilities_;
    std::unordered_map<std::string, size_t> index_;  // upper-cased keyword
};

}  // namespace mailprobe::smtp
