#include "redact.hpp"

namespace mailprobe {

namespace {

constexpr std::string_view MASK = "****";

std::string mask(std::string_view value) {
    if (value.size() <= 4) {
        return std::string(MASK);
    }
    std::string out;
    out.reserve(8);
    out.append(value.substr(0, 2));
    out.append(MASK);
    out.append(value.substr(value.size() - 2));
    return out;
}

}  // namespace

std::string mask_password(std::string_view password) {
    return mask(password);
}

std::string mask_username(std::string_view username) {
    return mask(username);
}

}  // namespace mailprobe
