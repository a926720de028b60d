#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/x509.h>

namespace mailprobe::net {
class Connection;
}

namespace mailprobe::tls {

using Clock = std::chrono::system_clock;

enum class TLSVersion {
    TLS1_0,
    TLS1_1,
    TLS1_2,
    TLS1_3,
    Unknown
};

enum class CipherStrength {
    Weak,
    Medium,
    Strong
};

enum class VerificationStatus {
    Valid,
    Expired,
    NotYetValid,
    HostnameMismatch,
    SelfSigned,
    UnknownAuthority
};

enum class KeyUsage {
    DigitalSignature,
    ContentCommitment,
    KeyEncipherment,
    DataEncipherment,
    KeyAgreement,
    CertSign,
    CRLSign,
    EncipherOnly,
    DecipherOnly
};

enum class ExtKeyUsage {
    ServerAuth,
    ClientAuth,
    CodeSigning,
    EmailProtection,
    TimeStamping,
    OCSPSigning,
    Any
};

enum class WarningCategory {
    TLSVersion,
    CipherStrength,
    CertExpiry,
    CertHostname,
    CertSelfSigned,
    KeyStrength
};

enum class Severity {
    Info,
    Warn
};

struct TLSOptions {
    std::string server_name;
    TLSVersion min_version = TLSVersion::TLS1_2;
    std::optional<TLSVersion> max_version;
    bool skip_verify = false;
    std::filesystem::path ca_file;  // empty: system trust store
};

struct TLSConnectionInfo {
    TLSVersion version = TLSVersion::Unknown;
    uint16_t cipher_suite_id = 0;
    std::string cipher_name;
    int cipher_bits = 0;
    CipherStrength strength = CipherStrength::Weak;
    std::string server_name;
};

struct CertificateInfo {
    std::string subject;
    std::string common_name;
    std::string issuer;
    std::string serial_number;
    Clock::time_point not_before;
    Clock::time_point not_after;
    std::vector<std::string> sans;  // DNS names and IP addresses
    std::set<KeyUsage> key_usage;
    std::set<ExtKeyUsage> ext_key_usage;
    std::string signature_algorithm;
    std::string public_key_algorithm;
    int public_key_bits = 0;
    VerificationStatus status = VerificationStatus::Valid;

    bool is_self_issued() const { return !subject.empty() && subject == issuer; }
};

struct Warning {
    WarningCategory category;
    std::string message;
    Severity severity;
};

// What the transport learned from a completed handshake, before analysis.
struct HandshakeResult {
    TLSConnectionInfo connection;
    std::vector<CertificateInfo> chain;  // leaf first
    bool chain_trusted = false;
    std::string verify_error;
};

struct TLSReport {
    TLSConnectionInfo connection;
    std::vector<CertificateInfo> chain;
    std::vector<Warning> warnings;
    std::vector<std::string> recommendations;
    bool chain_trusted = false;
    std::string verify_error;

    // Reason the upgrade must be refused when verification is enabled, empty otherwise.
    std::string verification_failure(const TLSOptions& options) const;
};

std::string_view to_string(TLSVersion version);
std::string_view to_string(CipherStrength strength);
std::string_view to_string(VerificationStatus status);
std::string_view to_string(KeyUsage usage);
std::string_view to_string(ExtKeyUsage usage);
std::string_view to_string(WarningCategory category);
std::string_view to_string(Severity severity);

// Accepts "1.0" .. "1.3", optionally prefixed with "TLS" / "TLSv".
std::optional<TLSVersion> parse_tls_version(std::string_view text);

// Cipher names may be IANA ("TLS_RSA_WITH_RC4_128_SHA") or OpenSSL style ("RC4-SHA").
bool is_weak_cipher(std::string_view cipher_name, int bits);
CipherStrength classify_cipher(TLSVersion version, std::string_view cipher_name, int bits);

// RFC 6125 style: SAN entries first (single leftmost wildcard label), the
// subject CN only when the certificate carries no SAN. Case-insensitive.
bool hostname_matches(const CertificateInfo& cert, std::string_view host);

// Assigns VerificationStatus to every element, by priority:
// expired, not yet valid, hostname mismatch (leaf), self-signed (last element),
// unknown authority (verification enabled and chain untrusted).
void evaluate_chain(std::vector<CertificateInfo>& chain,
                    std::string_view server_name,
                    bool verify,
                    bool chain_trusted,
                    Clock::time_point now);

std::vector<Warning> generate_warnings(const TLSConnectionInfo& connection,
                                       const std::vector<CertificateInfo>& chain,
                                       Clock::time_point now);

std::vector<std::string> recommendations(const TLSConnectionInfo& connection);

// OpenSSL extraction
CertificateInfo certificate_from_x509(X509* cert);
HandshakeResult inspect(SSL* ssl, std::string_view server_name);

class TLSDiagnostics {
public:
    // Runs the handshake on `conn` and analyses the result. Throws
    // Error(HandshakeFailed) when the handshake does not complete.
    static TLSReport upgrade(net::Connection& conn,
                             const TLSOptions& options,
                             std::chrono::milliseconds timeout,
                             Clock::time_point now = Clock::now());

    static TLSReport analyze(HandshakeResult handshake,
                             const TLSOptions& options,
                             Clock::time_point now);
};

}  // namespace mailprobe::tls
