#include "ssl_context.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mailprobe {

namespace {

int protocol_constant(tls::TLSVersion version) {
    switch (version) {
        case tls::TLSVersion::TLS1_0: return TLS1_VERSION;
        case tls::TLSVersion::TLS1_1: return TLS1_1_VERSION;
        case tls::TLSVersion::TLS1_2: return TLS1_2_VERSION;
        case tls::TLSVersion::TLS1_3: return TLS1_3_VERSION;
        case tls::TLSVersion::Unknown: break;
    }
    return 0;
}

}  // namespace

SSLContext::SSLContext()
    : context_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
    context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3
    );
}

SSLContext::~SSLContext() = default;

SSLContext::SSLContext(SSLContext&& other) noexcept
    : context_(std::move(other.context_))
    , initialized_(other.initialized_)
    , last_error_(std::move(other.last_error_)) {
    other.initialized_ = false;
}

SSLContext& SSLContext::operator=(SSLContext&& other) noexcept {
    if (this != &other) {
        context_ = std::move(other.context_);
        initialized_ = other.initialized_;
        last_error_ = std::move(other.last_error_);
        other.initialized_ = false;
    }
    return *this;
}

bool SSLContext::set_protocol_range(tls::TLSVersion min_version,
                                    std::optional<tls::TLSVersion> max_version) {
    if (!context_) {
        set_error("SSL context not initialized");
        return false;
    }

    SSL_CTX* ctx = context_->native_handle();

    int min_proto = protocol_constant(min_version);
    if (min_proto == 0 || SSL_CTX_set_min_proto_version(ctx, min_proto) != 1) {
        set_error("Unsupported minimum TLS version");
        return false;
    }

    if (max_version) {
        int max_proto = protocol_constant(*max_version);
        if (max_proto == 0 || max_proto < min_proto ||
            SSL_CTX_set_max_proto_version(ctx, max_proto) != 1) {
            set_error("Unsupported maximum TLS version");
            return false;
        }
    }

    // OpenSSL 3 refuses TLS 1.0/1.1 above security level 0
    if (min_proto < TLS1_2_VERSION) {
        SSL_CTX_set_security_level(ctx, 0);
    }
    return true;
}

bool SSLContext::load_ca_file(const std::filesystem::path& ca_file) {
    if (!context_) {
        set_error("SSL context not initialized");
        return false;
    }

    boost::system::error_code ec;
    context_->load_verify_file(ca_file.string(), ec);
    if (ec) {
        set_error("Failed to load CA file " + ca_file.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool SSLContext::load_default_verify_paths() {
    if (!context_) {
        set_error("SSL context not initialized");
        return false;
    }

    boost::system::error_code ec;
    context_->set_default_verify_paths(ec);
    if (ec) {
        set_error("Failed to load system trust store: " + ec.message());
        return false;
    }
    return true;
}

bool SSLContext::set_ciphers(const std::string& cipher_list) {
    if (!context_) return false;

    if (SSL_CTX_set_cipher_list(context_->native_handle(), cipher_list.c_str()) != 1) {
        set_error("Invalid cipher list: " + cipher_list);
        return false;
    }
    return true;
}

void SSLContext::set_error(const std::string& msg) {
    last_error_ = msg;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        last_error_ += std::string(" [") + buf + "]";
    }
}

SSLContext SSLContext::create_client_context(const tls::TLSOptions& options) {
    SSLContext ctx;

    if (!ctx.set_protocol_range(options.min_version, options.max_version)) {
        return ctx;
    }

    if (options.min_version < tls::TLSVersion::TLS1_2) {
        if (!ctx.set_ciphers("DEFAULT:@SECLEVEL=0")) {
            return ctx;
        }
    }

    if (!options.ca_file.empty()) {
        if (!ctx.load_ca_file(options.ca_file)) {
            return ctx;
        }
    } else if (!options.skip_verify) {
        if (!ctx.load_default_verify_paths()) {
            return ctx;
        }
    }

    // The chain is still verified with verify_none. The result is read back
    // after the handshake so an untrusted server can be reported, not just refused.
    ctx.context_->set_verify_mode(ssl::verify_none);
    ctx.initialized_ = true;

    return ctx;
}

}  // namespace mailprobe
