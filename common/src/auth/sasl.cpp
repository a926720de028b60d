#include "auth/sasl.hpp"
#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace mailprobe::sasl {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' ||
                          s.front() == '\r' || s.front() == '\n')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

// BIO_f_base64 silently skips garbage, so the shape is checked up front.
bool well_formed(std::string_view s) {
    if (s.size() % 4 != 0) return false;

    size_t padding = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(c)) return false;
    }
    return padding <= 2;
}

}  // namespace

std::string base64_encode(std::string_view data) {
    if (data.empty()) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* buffer;
    BIO_get_mem_ptr(bio, &buffer);

    std::string result(buffer->data, buffer->length);
    BIO_free_all(bio);

    return result;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
    encoded = trim(encoded);
    if (encoded.empty()) return std::string();
    if (!well_formed(encoded)) return std::nullopt;

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::vector<char> decoded(encoded.size());
    int len = BIO_read(bio, decoded.data(), static_cast<int>(decoded.size()));
    BIO_free_all(bio);

    if (len < 0) {
        return std::nullopt;
    }
    return std::string(decoded.data(), static_cast<size_t>(len));
}

std::string hmac_md5_hex(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_md5(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &digest_len);

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string plain_initial_response(std::string_view username, std::string_view password) {
    std::string raw;
    raw.reserve(username.size() + password.size() + 2);
    raw.push_back('\0');
    raw.append(username);
    raw.push_back('\0');
    raw.append(password);
    return base64_encode(raw);
}

std::optional<std::string> cram_md5_response(std::string_view challenge,
                                             std::string_view username,
                                             std::string_view password) {
    auto decoded = base64_decode(challenge);
    if (!decoded || decoded->empty()) {
        return std::nullopt;
    }

    std::string answer(username);
    answer += ' ';
    answer += hmac_md5_hex(password, *decoded);
    return base64_encode(answer);
}

}  // namespace mailprobe::sasl
