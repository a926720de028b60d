#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mailprobe::sasl {

// Single-line base64 (no embedded newlines), as SMTP AUTH expects.
std::string base64_encode(std::string_view data);

// Returns std::nullopt when `encoded` is not well-formed base64.
// Surrounding whitespace is ignored; an empty input decodes to "".
std::optional<std::string> base64_decode(std::string_view encoded);

// Lowercase hex HMAC-MD5 digest.
std::string hmac_md5_hex(std::string_view key, std::string_view data);

// RFC 4616 initial response: base64("\0" user "\0" password), no authzid.
std::string plain_initial_response(std::string_view username, std::string_view password);

// RFC 2195 answer to a base64 challenge: base64(user " " hex(HMAC-MD5(password, challenge))).
// std::nullopt if the challenge does not decode.
std::optional<std::string> cram_md5_response(std::string_view challenge,
                                             std::string_view username,
                                             std::string_view password);

}  // namespace mailprobe::sasl
