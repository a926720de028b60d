#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "capabilities.hpp"

namespace mailprobe::smtp {

struct ExchangeInfo {
    bool is_exchange = false;
    std::string version = "Unknown";  // e.g. "Exchange 2019 (15.2.1118.7)"
    std::string build;                // raw build number when the banner carries one
    std::vector<std::string> notes;   // advisory only
};

// Recognises Microsoft Exchange from the greeting banner and its private
// EHLO extensions. Detection never changes how the session behaves.
class ExchangeDetector {
public:
    static ExchangeInfo detect(std::string_view banner, const CapabilitySet& caps);

    // "15.1.2507.6" -> "Exchange 2016 (15.1.2507.6)"
    static std::string version_for_build(std::string_view build);

    // What the capability set says about the server, in Exchange terms.
    static std::vector<std::string> capability_notes(const CapabilitySet& caps);

    // Port and mechanism advice for submitting through Exchange.
    static std::vector<std::string> recommendations(uint16_t port, const CapabilitySet& caps);
};

}  // namespace mailprobe::smtp
