#pragma once

#include <memory>
#include <optional>
#include <string>
#include <filesystem>

#include <boost/asio/ssl.hpp>

#include "tls_diagnostics.hpp"

namespace mailprobe {

namespace ssl = boost::asio::ssl;

// Client-side OpenSSL context. Configuration failures are recorded in
// last_error() and leave is_initialized() false.
class SSLContext {
public:
    SSLContext();
    ~SSLContext();

    SSLContext(const SSLContext&) = delete;
    SSLContext& operator=(const SSLContext&) = delete;
    SSLContext(SSLContext&&) noexcept;
    SSLContext& operator=(SSLContext&&) noexcept;

    bool set_protocol_range(tls::TLSVersion min_version,
                            std::optional<tls::TLSVersion> max_version = std::nullopt);
    bool load_ca_file(const std::filesystem::path& ca_file);
    bool load_default_verify_paths();

    bool set_ciphers(const std::string& cipher_list);

    bool is_initialized() const { return initialized_; }
    std::string last_error() const { return last_error_; }

    ssl::context& native() { return *context_; }
    const ssl::context& native() const { return *context_; }

    static SSLContext create_client_context(const tls::TLSOptions& options);

private:
    void set_error(const std::string& msg);

    std::unique_ptr<ssl::context> context_;
    bool initialized_ = false;
    std::string last_error_;
};

}  // namespace mailprobe
