#include "tls_diagnostics.hpp"
#include "error.hpp"
#include "net/connection.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <climits>
#include <ctime>
#include <format>

#include <boost/asio/ip/address.hpp>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

namespace mailprobe::tls {

namespace {

namespace ip = boost::asio::ip;

constexpr std::array<std::string_view, 10> WEAK_CIPHER_TOKENS = {
    "NULL", "EXPORT", "EXP-", "RC4", "RC2", "DES", "ANON", "ADH", "AECDH", "MD5"
};

constexpr auto EXPIRY_WARNING_WINDOW = std::chrono::hours(24 * 30);
constexpr int MIN_RSA_BITS = 2048;

std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool is_ip_address(const std::string& host) {
    boost::system::error_code ec;
    ip::make_address(host, ec);
    return !ec;
}

// Exact match, or a "*." pattern covering exactly one leftmost label.
bool dns_name_matches(const std::string& pattern, const std::string& host) {
    if (pattern == host) return true;

    if (pattern.size() < 3 || pattern[0] != '*' || pattern[1] != '.') {
        return false;
    }
    std::string_view suffix(pattern);
    suffix.remove_prefix(1);  // ".example.com"
    if (suffix.find('.', 1) == std::string_view::npos) {
        return false;  // "*.com"
    }
    if (host.size() <= suffix.size()) return false;
    if (host.compare(host.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    std::string_view label(host.data(), host.size() - suffix.size());
    return label.find('.') == std::string_view::npos;
}

std::string certificate_label(const CertificateInfo& cert) {
    return cert.common_name.empty() ? cert.subject : cert.common_name;
}

std::string name_to_string(const X509_NAME* name) {
    if (!name) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return "";
    X509_NAME_print_ex(bio, name, 0, XN_FLAG_RFC2253);

    BUF_MEM* buffer;
    BIO_get_mem_ptr(bio, &buffer);
    std::string result(buffer->data, buffer->length);
    BIO_free(bio);
    return result;
}

std::string common_name_of(const X509_NAME* name) {
    if (!name) return "";

    int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (idx < 0) return "";

    const ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0 || !utf8) return "";

    std::string cn(reinterpret_cast<const char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return cn;
}

std::string serial_to_string(const ASN1_INTEGER* serial) {
    if (!serial) return "";

    BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
    if (!bn) return "";

    std::string result;
    if (char* hex = BN_bn2hex(bn)) {
        result = hex;
        OPENSSL_free(hex);
    }
    BN_free(bn);
    return result;
}

Clock::time_point to_time_point(const ASN1_TIME* time) {
    std::tm tm{};
    if (!time || ASN1_TIME_to_tm(time, &tm) != 1) {
        return Clock::time_point{};
    }
    return Clock::from_time_t(timegm(&tm));
}

std::vector<std::string> subject_alt_names(X509* cert) {
    std::vector<std::string> names;

    auto* gens = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!gens) return names;

    for (int i = 0; i < sk_GENERAL_NAME_num(gens); ++i) {
        const GENERAL_NAME* gen = sk_GENERAL_NAME_value(gens, i);
        if (!gen) continue;

        if (gen->type == GEN_DNS) {
            const ASN1_STRING* dns = gen->d.dNSName;
            names.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                               static_cast<size_t>(ASN1_STRING_length(dns)));
        } else if (gen->type == GEN_IPADD) {
            const ASN1_STRING* addr = gen->d.iPAddress;
            const unsigned char* data = ASN1_STRING_get0_data(addr);
            int len = ASN1_STRING_length(addr);
            if (len == 4) {
                ip::address_v4::bytes_type bytes;
                std::copy(data, data + 4, bytes.begin());
                names.push_back(ip::address_v4(bytes).to_string());
            } else if (len == 16) {
                ip::address_v6::bytes_type bytes;
                std::copy(data, data + 16, bytes.begin());
                names.push_back(ip::address_v6(bytes).to_string());
            }
        }
    }

    GENERAL_NAMES_free(gens);
    return names;
}

std::set<KeyUsage> key_usage_of(X509* cert) {
    std::set<KeyUsage> usage;
    uint32_t bits = X509_get_key_usage(cert);
    if (bits == UINT32_MAX) return usage;  // extension absent

    if (bits & KU_DIGITAL_SIGNATURE) usage.insert(KeyUsage::DigitalSignature);
    if (bits & KU_NON_REPUDIATION) usage.insert(KeyUsage::ContentCommitment);
    if (bits & KU_KEY_ENCIPHERMENT) usage.insert(KeyUsage::KeyEncipherment);
    if (bits & KU_DATA_ENCIPHERMENT) usage.insert(KeyUsage::DataEncipherment);
    if (bits & KU_KEY_AGREEMENT) usage.insert(KeyUsage::KeyAgreement);
    if (bits & KU_KEY_CERT_SIGN) usage.insert(KeyUsage::CertSign);
    if (bits & KU_CRL_SIGN) usage.insert(KeyUsage::CRLSign);
    if (bits & KU_ENCIPHER_ONLY) usage.insert(KeyUsage::EncipherOnly);
    if (bits & KU_DECIPHER_ONLY) usage.insert(KeyUsage::DecipherOnly);
    return usage;
}

std::set<ExtKeyUsage> ext_key_usage_of(X509* cert) {
    std::set<ExtKeyUsage> usage;
    uint32_t bits = X509_get_extended_key_usage(cert);
    if (bits == UINT32_MAX) return usage;

    if (bits & XKU_SSL_SERVER) usage.insert(ExtKeyUsage::ServerAuth);
    if (bits & XKU_SSL_CLIENT) usage.insert(ExtKeyUsage::ClientAuth);
    if (bits & XKU_CODE_SIGN) usage.insert(ExtKeyUsage::CodeSigning);
    if (bits & XKU_SMIME) usage.insert(ExtKeyUsage::EmailProtection);
    if (bits & XKU_TIMESTAMP) usage.insert(ExtKeyUsage::TimeStamping);
    if (bits & XKU_OCSP_SIGN) usage.insert(ExtKeyUsage::OCSPSigning);
    if (bits & XKU_ANYEKU) usage.insert(ExtKeyUsage::Any);
    return usage;
}

std::string public_key_algorithm_name(int type) {
    switch (type) {
        case EVP_PKEY_RSA:
        case EVP_PKEY_RSA_PSS: return "RSA";
        case EVP_PKEY_EC:      return "ECDSA";
        case EVP_PKEY_DSA:     return "DSA";
        case EVP_PKEY_ED25519: return "Ed25519";
        case EVP_PKEY_ED448:   return "Ed448";
    }
    const char* sn = OBJ_nid2sn(type);
    return sn ? sn : "unknown";
}

TLSVersion version_from_protocol(int version) {
    switch (version) {
        case TLS1_VERSION:   return TLSVersion::TLS1_0;
        case TLS1_1_VERSION: return TLSVersion::TLS1_1;
        case TLS1_2_VERSION: return TLSVersion::TLS1_2;
        case TLS1_3_VERSION: return TLSVersion::TLS1_3;
    }
    return TLSVersion::Unknown;
}

}  // namespace

std::string_view to_string(TLSVersion version) {
    switch (version) {
        case TLSVersion::TLS1_0:  return "TLS 1.0";
        case TLSVersion::TLS1_1:  return "TLS 1.1";
        case TLSVersion::TLS1_2:  return "TLS 1.2";
        case TLSVersion::TLS1_3:  return "TLS 1.3";
        case TLSVersion::Unknown: return "unknown";
    }
    return "unknown";
}

std::string_view to_string(CipherStrength strength) {
    switch (strength) {
        case CipherStrength::Weak:   return "WEAK";
        case CipherStrength::Medium: return "MEDIUM";
        case CipherStrength::Strong: return "STRONG";
    }
    return "WEAK";
}

std::string_view to_string(VerificationStatus status) {
    switch (status) {
        case VerificationStatus::Valid:            return "VALID";
        case VerificationStatus::Expired:          return "EXPIRED";
        case VerificationStatus::NotYetValid:      return "NOT_YET_VALID";
        case VerificationStatus::HostnameMismatch: return "HOSTNAME_MISMATCH";
        case VerificationStatus::SelfSigned:       return "SELF_SIGNED";
        case VerificationStatus::UnknownAuthority: return "UNKNOWN_AUTHORITY";
    }
    return "UNKNOWN_AUTHORITY";
}

std::string_view to_string(KeyUsage usage) {
    switch (usage) {
        case KeyUsage::DigitalSignature:  return "Digital Signature";
        case KeyUsage::ContentCommitment: return "Content Commitment";
        case KeyUsage::KeyEncipherment:   return "Key Encipherment";
        case KeyUsage::DataEncipherment:  return "Data Encipherment";
        case KeyUsage::KeyAgreement:      return "Key Agreement";
        case KeyUsage::CertSign:          return "Certificate Sign";
        case KeyUsage::CRLSign:           return "CRL Sign";
        case KeyUsage::EncipherOnly:      return "Encipher Only";
        case KeyUsage::DecipherOnly:      return "Decipher Only";
    }
    return "";
}

std::string_view to_string(ExtKeyUsage usage) {
    switch (usage) {
        case ExtKeyUsage::ServerAuth:      return "Server Authentication";
        case ExtKeyUsage::ClientAuth:      return "Client Authentication";
        case ExtKeyUsage::CodeSigning:     return "Code Signing";
        case ExtKeyUsage::EmailProtection: return "Email Protection";
        case ExtKeyUsage::TimeStamping:    return "Time Stamping";
        case ExtKeyUsage::OCSPSigning:     return "OCSP Signing";
        case ExtKeyUsage::Any:             return "Any";
    }
    return "";
}

std::string_view to_string(WarningCategory category) {
    switch (category) {
        case WarningCategory::TLSVersion:     return "TLS_VERSION";
        case WarningCategory::CipherStrength: return "CIPHER_STRENGTH";
        case WarningCategory::CertExpiry:     return "CERT_EXPIRY";
        case WarningCategory::CertHostname:   return "CERT_HOSTNAME";
        case WarningCategory::CertSelfSigned: return "CERT_SELFSIGNED";
        case WarningCategory::KeyStrength:    return "KEY_STRENGTH";
    }
    return "";
}

std::string_view to_string(Severity severity) {
    return severity == Severity::Warn ? "WARN" : "INFO";
}

std::optional<TLSVersion> parse_tls_version(std::string_view text) {
    std::string v = to_lower(text);
    if (v.rfind("tlsv", 0) == 0) {
        v.erase(0, 4);
    } else if (v.rfind("tls", 0) == 0) {
        v.erase(0, 3);
    }
    while (!v.empty() && v.front() == ' ') v.erase(0, 1);

    if (v == "1.0" || v == "1") return TLSVersion::TLS1_0;
    if (v == "1.1") return TLSVersion::TLS1_1;
    if (v == "1.2") return TLSVersion::TLS1_2;
    if (v == "1.3") return TLSVersion::TLS1_3;
    return std::nullopt;
}

bool is_weak_cipher(std::string_view cipher_name, int bits) {
    if (cipher_name.empty() || bits < 128) return true;

    std::string upper = to_upper(cipher_name);
    return std::any_of(WEAK_CIPHER_TOKENS.begin(), WEAK_CIPHER_TOKENS.end(),
                       [&](std::string_view token) { return contains(upper, token); });
}

CipherStrength classify_cipher(TLSVersion version, std::string_view cipher_name, int bits) {
    if (is_weak_cipher(cipher_name, bits)) {
        return CipherStrength::Weak;
    }

    std::string upper = to_upper(cipher_name);
    if (version == TLSVersion::TLS1_3 ||
        upper.rfind("TLS_AES_", 0) == 0 || upper.rfind("TLS_CHACHA20_", 0) == 0) {
        return CipherStrength::Strong;
    }

    bool forward_secret = contains(upper, "DHE") || contains(upper, "EDH");
    bool aead = contains(upper, "GCM") || contains(upper, "CHACHA20") || contains(upper, "CCM");
    return (forward_secret && aead) ? CipherStrength::Strong : CipherStrength::Medium;
}

bool hostname_matches(const CertificateInfo& cert, std::string_view host) {
    std::string h = to_lower(host);
    if (!h.empty() && h.back() == '.') h.pop_back();
    if (h.empty()) return false;

    bool ip = is_ip_address(h);

    if (!cert.sans.empty()) {
        for (const auto& san : cert.sans) {
            std::string pattern = to_lower(san);
            if (ip ? pattern == h : dns_name_matches(pattern, h)) {
                return true;
            }
        }
        return false;
    }

    if (ip || cert.common_name.empty()) return false;
    return dns_name_matches(to_lower(cert.common_name), h);
}

void evaluate_chain(std::vector<CertificateInfo>& chain,
                    std::string_view server_name,
                    bool verify,
                    bool chain_trusted,
                    Clock::time_point now) {
    for (size_t i = 0; i < chain.size(); ++i) {
        auto& cert = chain[i];
        bool leaf = i == 0;
        bool last = i + 1 == chain.size();

        if (now >= cert.not_after) {
            cert.status = VerificationStatus::Expired;
        } else if (now < cert.not_before) {
            cert.status = VerificationStatus::NotYetValid;
        } else if (leaf && !server_name.empty() && !hostname_matches(cert, server_name)) {
            cert.status = VerificationStatus::HostnameMismatch;
        } else if (last && cert.is_self_issued()) {
            cert.status = VerificationStatus::SelfSigned;
        } else if (verify && !chain_trusted) {
            cert.status = VerificationStatus::UnknownAuthority;
        } else {
            cert.status = VerificationStatus::Valid;
        }
    }
}

std::vector<Warning> generate_warnings(const TLSConnectionInfo& connection,
                                       const std::vector<CertificateInfo>& chain,
                                       Clock::time_point now) {
    std::vector<Warning> warnings;

    if (connection.version == TLSVersion::TLS1_0 || connection.version == TLSVersion::TLS1_1) {
        warnings.push_back({WarningCategory::TLSVersion,
                            std::format("Server negotiated deprecated protocol {}",
                                        to_string(connection.version)),
                            Severity::Warn});
    }

    if (is_weak_cipher(connection.cipher_name, connection.cipher_bits)) {
        warnings.push_back({WarningCategory::CipherStrength,
                            std::format("Weak cipher suite negotiated: {} ({} bits)",
                                        connection.cipher_name.empty() ? "unknown" : connection.cipher_name,
                                        connection.cipher_bits),
                            Severity::Warn});
    }

    for (const auto& cert : chain) {
        auto remaining = cert.not_after - now;
        auto days = std::chrono::duration_cast<std::chrono::hours>(remaining).count() / 24;

        if (now >= cert.not_after) {
            warnings.push_back({WarningCategory::CertExpiry,
                                std::format("Certificate '{}' expired {} days ago",
                                            certificate_label(cert), -days),
                                Severity::Warn});
        } else if (remaining <= EXPIRY_WARNING_WINDOW) {
            warnings.push_back({WarningCategory::CertExpiry,
                                std::format("Certificate '{}' expires in {} days",
                                            certificate_label(cert), days),
                                Severity::Warn});
        }
    }

    if (!chain.empty()) {
        const auto& leaf = chain.front();
        if (!connection.server_name.empty() && !hostname_matches(leaf, connection.server_name)) {
            warnings.push_back({WarningCategory::CertHostname,
                                std::format("Certificate '{}' does not match server name '{}'",
                                            certificate_label(leaf), connection.server_name),
                                Severity::Warn});
        }
        if (leaf.is_self_issued()) {
            warnings.push_back({WarningCategory::CertSelfSigned,
                                std::format("Certificate '{}' is self-signed", certificate_label(leaf)),
                                Severity::Info});
        }
    }

    for (const auto& cert : chain) {
        if (cert.public_key_algorithm == "RSA" && cert.public_key_bits < MIN_RSA_BITS) {
            warnings.push_back({WarningCategory::KeyStrength,
                                std::format("Certificate '{}' uses a {}-bit RSA key (minimum {})",
                                            certificate_label(cert), cert.public_key_bits, MIN_RSA_BITS),
                                Severity::Warn});
        }
    }

    return warnings;
}

std::vector<std::string> recommendations(const TLSConnectionInfo& connection) {
    std::vector<std::string> advice;

    switch (connection.version) {
        case TLSVersion::TLS1_0:
        case TLSVersion::TLS1_1:
            advice.emplace_back("Upgrade the server to TLS 1.2 or later and disable TLS 1.0/1.1");
            break;
        case TLSVersion::TLS1_2:
            advice.emplace_back("Consider enabling TLS 1.3 on the server");
            break;
        default:
            break;
    }

    switch (connection.strength) {
        case CipherStrength::Weak:
            advice.emplace_back("Disable weak cipher suites (NULL, EXPORT, RC4, DES/3DES, anonymous)");
            break;
        case CipherStrength::Medium:
            advice.emplace_back("Prefer AEAD cipher suites with forward secrecy (ECDHE with AES-GCM or ChaCha20-Poly1305)");
            break;
        case CipherStrength::Strong:
            break;
    }

    return advice;
}

std::string TLSReport::verification_failure(const TLSOptions& options) const {
    if (options.skip_verify) return "";

    if (chain.empty()) {
        return "server presented no certificate";
    }
    if (!chain_trusted) {
        return "certificate verification failed: " +
               (verify_error.empty() ? std::string("untrusted chain") : verify_error);
    }
    if (chain.front().status == VerificationStatus::HostnameMismatch) {
        return "certificate does not match server name " + connection.server_name;
    }
    return "";
}

CertificateInfo certificate_from_x509(X509* cert) {
    CertificateInfo info;
    if (!cert) return info;

    info.subject = name_to_string(X509_get_subject_name(cert));
    info.common_name = common_name_of(X509_get_subject_name(cert));
    info.issuer = name_to_string(X509_get_issuer_name(cert));
    info.serial_number = serial_to_string(X509_get0_serialNumber(cert));
    info.not_before = to_time_point(X509_get0_notBefore(cert));
    info.not_after = to_time_point(X509_get0_notAfter(cert));
    info.sans = subject_alt_names(cert);
    info.key_usage = key_usage_of(cert);
    info.ext_key_usage = ext_key_usage_of(cert);

    const char* sig = OBJ_nid2ln(X509_get_signature_nid(cert));
    info.signature_algorithm = sig ? sig : "unknown";

    if (EVP_PKEY* key = X509_get0_pubkey(cert)) {
        info.public_key_algorithm = public_key_algorithm_name(EVP_PKEY_base_id(key));
        info.public_key_bits = EVP_PKEY_bits(key);
    }

    return info;
}

HandshakeResult inspect(SSL* ssl, std::string_view server_name) {
    HandshakeResult result;
    auto& info = result.connection;

    info.version = version_from_protocol(SSL_version(ssl));
    info.server_name = std::string(server_name);

    if (const SSL_CIPHER* cipher = SSL_get_current_cipher(ssl)) {
        info.cipher_suite_id = SSL_CIPHER_get_protocol_id(cipher);
        const char* standard = SSL_CIPHER_standard_name(cipher);
        info.cipher_name = standard ? standard : SSL_CIPHER_get_name(cipher);
        info.cipher_bits = SSL_CIPHER_get_bits(cipher, nullptr);
    }
    info.strength = classify_cipher(info.version, info.cipher_name, info.cipher_bits);

    if (STACK_OF(X509)* chain = SSL_get_peer_cert_chain(ssl)) {
        for (int i = 0; i < sk_X509_num(chain); ++i) {
            result.chain.push_back(certificate_from_x509(sk_X509_value(chain, i)));
        }
    }

    long verify = SSL_get_verify_result(ssl);
    result.chain_trusted = !result.chain.empty() && verify == X509_V_OK;
    if (verify != X509_V_OK) {
        result.verify_error = X509_verify_cert_error_string(verify);
    }

    return result;
}

TLSReport TLSDiagnostics::upgrade(net::Connection& conn,
                                  const TLSOptions& options,
                                  std::chrono::milliseconds timeout,
                                  Clock::time_point now) {
    return analyze(conn.start_tls(options, timeout), options, now);
}

TLSReport TLSDiagnostics::analyze(HandshakeResult handshake,
                                  const TLSOptions& options,
                                  Clock::time_point now) {
    TLSReport report;
    report.connection = std::move(handshake.connection);
    if (report.connection.server_name.empty()) {
        report.connection.server_name = options.server_name;
    }
    report.connection.strength = classify_cipher(report.connection.version,
                                                  report.connection.cipher_name,
                                                  report.connection.cipher_bits);

    report.chain = std::move(handshake.chain);
    report.chain_trusted = handshake.chain_trusted;
    report.verify_error = std::move(handshake.verify_error);

    evaluate_chain(report.chain, report.connection.server_name,
                   !options.skip_verify, report.chain_trusted, now);
    report.warnings = generate_warnings(report.connection, report.chain, now);
    report.recommendations = recommendations(report.connection);
    return report;
}

}  // namespace mailprobe::tls
