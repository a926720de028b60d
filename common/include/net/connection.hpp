#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "ssl_context.hpp"
#include "tls_diagnostics.hpp"

namespace mailprobe::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
namespace ssl = asio::ssl;

using Deadline = std::chrono::steady_clock::time_point;

// Blocking, line-oriented client transport. Every operation is bounded by a
// timeout or deadline; on expiry the socket is closed and Error(Timeout) is thrown.
class Connection {
public:
    virtual ~Connection() = default;

    // One CRLF-terminated line without its terminator.
    virtual std::string read_line(Deadline deadline) = 0;
    virtual void write(const std::string& data, std::chrono::milliseconds timeout) = 0;

    // In-place TLS client handshake over the open socket.
    virtual tls::HandshakeResult start_tls(const tls::TLSOptions& options,
                                           std::chrono::milliseconds timeout) = 0;

    virtual void close() noexcept = 0;
    virtual bool is_open() const = 0;
    virtual bool is_tls() const = 0;
    virtual std::string remote_address() const = 0;
};

class TcpConnection : public Connection {
public:
    using PlainSocket = tcp::socket;
    using SSLSocket = ssl::stream<tcp::socket>;
    using Socket = std::variant<PlainSocket, SSLSocket>;

    static constexpr size_t MAX_LINE_LENGTH = 64 * 1024;

    // Resolves and connects. Throws Error(ConnectionRefused) or Error(Timeout).
    static std::unique_ptr<TcpConnection> connect(const std::string& host, uint16_t port,
                                                  std::chrono::milliseconds timeout);

    TcpConnection();
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    std::string read_line(Deadline deadline) override;
    void write(const std::string& data, std::chrono::milliseconds timeout) override;
    tls::HandshakeResult start_tls(const tls::TLSOptions& options,
                                   std::chrono::milliseconds timeout) override;

    void close() noexcept override;
    bool is_open() const override;
    bool is_tls() const override { return std::holds_alternative<SSLSocket>(socket_); }
    std::string remote_address() const override;

private:
    void run_until_complete(std::chrono::steady_clock::duration timeout, const char* what);
    tcp::socket& lowest_layer();
    const tcp::socket& lowest_layer() const;

    asio::io_context io_context_;
    std::unique_ptr<SSLContext> ssl_context_;
    Socket socket_;
    asio::streambuf read_buffer_;
};

}  // namespace mailprobe::net
