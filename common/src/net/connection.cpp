#include "net/connection.hpp"
#include "error.hpp"

#include <format>

#include <openssl/ssl.h>

namespace mailprobe::net {

namespace {

using std::chrono::steady_clock;

bool is_ip_address(const std::string& host) {
    boost::system::error_code ec;
    asio::ip::make_address(host, ec);
    return !ec;
}

}  // namespace

TcpConnection::TcpConnection()
    : socket_(std::in_place_type<PlainSocket>, io_context_)
    , read_buffer_(MAX_LINE_LENGTH) {
}

TcpConnection::~TcpConnection() {
    close();
}

std::unique_ptr<TcpConnection> TcpConnection::connect(const std::string& host, uint16_t port,
                                                      std::chrono::milliseconds timeout) {
    auto conn = std::make_unique<TcpConnection>();
    auto& io = conn->io_context_;
    auto start = steady_clock::now();

    tcp::resolver resolver(io);
    boost::system::error_code ec;
    tcp::resolver::results_type endpoints;

    resolver.async_resolve(host, std::to_string(port),
        [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
            ec = e;
            endpoints = std::move(results);
        });

    io.run_for(timeout);
    if (!io.stopped()) {
        resolver.cancel();
        io.run();
        throw Error(ErrorKind::Timeout, std::format("Timed out resolving {}", host));
    }
    if (ec) {
        throw Error(ErrorKind::ConnectionRefused,
                    std::format("Cannot resolve {}: {}", host, ec.message()));
    }

    asio::async_connect(std::get<PlainSocket>(conn->socket_), endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) {
            ec = e;
        });
    conn->run_until_complete(timeout - (steady_clock::now() - start), "connecting");

    if (ec) {
        throw Error(ErrorKind::ConnectionRefused,
                    std::format("Cannot connect to {}:{}: {}", host, port, ec.message()));
    }

    return conn;
}

void TcpConnection::run_until_complete(steady_clock::duration timeout, const char* what) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Closing aborts the pending operation; drain its handler before throwing
        close();
        io_context_.run();
        throw Error(ErrorKind::Timeout, std::format("Timed out {}", what));
    }
}

std::string TcpConnection::read_line(Deadline deadline) {
    if (!is_open()) {
        throw Error(ErrorKind::ConnectionClosed, "Connection is closed");
    }

    boost::system::error_code ec;
    std::size_t length = 0;
    auto handler = [&](const boost::system::error_code& e, std::size_t n) {
        ec = e;
        length = n;
    };

    std::visit([&](auto& socket) {
        asio::async_read_until(socket, read_buffer_, "\r\n", handler);
    }, socket_);
    run_until_complete(deadline - steady_clock::now(), "waiting for server reply");

    if (ec == asio::error::not_found) {
        close();
        throw Error(ErrorKind::ProtocolViolation,
                    std::format("Server line exceeds {} bytes", MAX_LINE_LENGTH));
    }
    if (ec) {
        close();
        throw Error(ErrorKind::ConnectionClosed,
                    std::format("Connection lost while reading: {}", ec.message()));
    }

    auto begin = asio::buffers_begin(read_buffer_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length));
    read_buffer_.consume(length);

    // read_until counts the delimiter
    line.resize(line.size() - 2);
    return line;
}

void TcpConnection::write(const std::string& data, std::chrono::milliseconds timeout) {
    if (!is_open()) {
        throw Error(ErrorKind::ConnectionClosed, "Connection is closed");
    }

    boost::system::error_code ec;
    auto handler = [&](const boost::system::error_code& e, std::size_t) {
        ec = e;
    };

    std::visit([&](auto& socket) {
        asio::async_write(socket, asio::buffer(data), handler);
    }, socket_);
    run_until_complete(timeout, "sending command");

    if (ec) {
        close();
        throw Error(ErrorKind::ConnectionClosed,
                    std::format("Connection lost while writing: {}", ec.message()));
    }
}

tls::HandshakeResult TcpConnection::start_tls(const tls::TLSOptions& options,
                                              std::chrono::milliseconds timeout) {
    if (!is_open()) {
        throw Error(ErrorKind::ConnectionClosed, "Connection is closed");
    }
    if (is_tls()) {
        throw Error(ErrorKind::ProtocolViolation, "TLS is already active");
    }

    // Anything queued before the handshake was sent in plaintext and could
    // be replayed as if it came over TLS
    if (read_buffer_.size() > 0) {
        close();
        throw Error(ErrorKind::ProtocolViolation,
                    "Server sent data ahead of the TLS handshake");
    }

    auto context = std::make_unique<SSLContext>(SSLContext::create_client_context(options));
    if (!context->is_initialized()) {
        close();
        throw Error(ErrorKind::HandshakeFailed, "TLS setup failed: " + context->last_error());
    }
    ssl_context_ = std::move(context);

    PlainSocket plain = std::move(std::get<PlainSocket>(socket_));
    auto& stream = socket_.emplace<SSLSocket>(std::move(plain), ssl_context_->native());

    if (!options.server_name.empty() && !is_ip_address(options.server_name)) {
        if (SSL_set_tlsext_host_name(stream.native_handle(), options.server_name.c_str()) != 1) {
            close();
            throw Error(ErrorKind::HandshakeFailed,
                        "Cannot set SNI host name " + options.server_name);
        }
    }

    boost::system::error_code ec;
    stream.async_handshake(ssl::stream_base::client,
        [&](const boost::system::error_code& e) {
            ec = e;
        });
    run_until_complete(timeout, "during TLS handshake");

    if (ec) {
        std::string reason = ec.message();
        close();
        throw Error(ErrorKind::HandshakeFailed, "TLS handshake failed: " + reason);
    }

    return tls::inspect(stream.native_handle(), options.server_name);
}

void TcpConnection::close() noexcept {
    boost::system::error_code ec;
    auto& socket = lowest_layer();
    if (socket.is_open()) {
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

bool TcpConnection::is_open() const {
    return lowest_layer().is_open();
}

std::string TcpConnection::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = lowest_layer().remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return std::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

tcp::socket& TcpConnection::lowest_layer() {
    if (auto* plain = std::get_if<PlainSocket>(&socket_)) {
        return *plain;
    }
    return std::get<SSLSocket>(socket_).next_layer();
}

const tcp::socket& TcpConnection::lowest_layer() const {
    if (const auto* plain = std::get_if<PlainSocket>(&socket_)) {
        return *plain;
    }
    return std::get<SSLSocket>(socket_).next_layer();
}

}  // namespace mailprobe::net
