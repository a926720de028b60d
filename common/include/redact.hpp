#pragma once

#include <string>
#include <string_view>

namespace mailprobe {

// Credential masking for anything that ends up in logs, reports or CSV rows.
// Values of at most 4 characters collapse to "****", longer ones keep the
// first and last two characters.
std::string mask_password(std::string_view password);
std::string mask_username(std::string_view username);

}  // namespace mailprobe
