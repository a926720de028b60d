#include "capabilities.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace mailprobe::smtp {

namespace {

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

const std::vector<std::string>& no_params() {
    static const std::vector<std::string> empty;
    return empty;
}

}  // namespace

CapabilitySet CapabilitySet::parse(const std::vector<std::string>& lines) {
    CapabilitySet set;
    if (lines.empty()) {
        return set;
    }

    set.greeting_ = lines.front();

    for (size_t i = 1; i < lines.size(); ++i) {
        std::istringstream iss(lines[i]);
        std::string keyword;
        if (!(iss >> keyword)) continue;

        std::vector<std::string> params;
        std::string param;
        while (iss >> param) {
            params.push_back(param);
        }

        // Legacy "AUTH=PLAIN LOGIN" form
        auto eq = keyword.find('=');
        if (eq != std::string::npos && iequals(keyword.substr(0, eq), "AUTH")) {
            std::string first = keyword.substr(eq + 1);
            if (!first.empty()) {
                params.insert(params.begin(), first);
            }
            keyword = keyword.substr(0, eq);
        }

        set.add(std::move(keyword), std::move(params));
    }

    return set;
}

void CapabilitySet::add(std::string name, std::vector<std::string> params) {
    std::string key = to_upper(name);

    auto it = index_.find(key);
    if (it == index_.end()) {
        index_.emplace(std::move(key), capabilities_.size());
        capabilities_.push_back({std::move(name), std::move(params)});
        return;
    }

    // Repeated keyword (typically AUTH and AUTH=): merge parameters
    auto& existing = capabilities_[it->second].params;
    for (auto& p : params) {
        bool seen = std::any_of(existing.begin(), existing.end(),
                                [&](const std::string& e) { return iequals(e, p); });
        if (!seen) {
            existing.push_back(std::move(p));
        }
    }
}

bool CapabilitySet::has(std::string_view name) const {
    return index_.count(to_upper(name)) > 0;
}

const Capability* CapabilitySet::find(std::string_view name) const {
    auto it = index_.find(to_upper(name));
    if (it == index_.end()) {
        return nullptr;
    }
    return &capabilities_[it->second];
}

const std::vector<std::string>& CapabilitySet::params(std::string_view name) const {
    const Capability* cap = find(name);
    return cap ? cap->params : no_params();
}

bool CapabilitySet::supports_auth(std::string_view mechanism) const {
    const auto& mechanisms = params("AUTH");
    return std::any_of(mechanisms.begin(), mechanisms.end(),
                       [&](const std::string& m) { return iequals(m, mechanism); });
}

std::vector<std::string> CapabilitySet::auth_mechanisms() const {
    std::vector<std::string> mechanisms;
    for (const auto& m : params("AUTH")) {
        mechanisms.push_back(to_upper(m));
    }
    return mechanisms;
}

std::optional<uint64_t> CapabilitySet::max_size() const {
    const Capability* cap = find("SIZE");
    if (!cap) {
        return std::nullopt;
    }
    if (cap->params.empty()) {
        return 0;
    }

    const std::string& value = cap->params.front();
    uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), size);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return 0;
    }
    return size;
}

std::string CapabilitySet::to_string() const {
    std::string out;
    for (const auto& cap : capabilities_) {
        if (!out.empty()) out += ", ";
        out += cap.name;
        for (const auto& p : cap.params) {
            out += " " + p;
        }
    }
    return out;
}

void CapabilitySet::clear() {
    greeting_.clear();
    capabilities_.clear();
    index_.clear();
}

}  // namespace mailprobe::smtp
