#include <catch2/catch_test_macros.hpp>
#include "smtp_session.hpp"
#include "error.hpp"

#include <boost/asio.hpp>

#include <functional>
#include <mutex>
#include <thread>

using namespace mailprobe;
using namespace mailprobe::smtp;

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

// Single-connection SMTP responder on 127.0.0.1. Each command line is passed
// to `respond`; an empty answer means "stay silent". Message data after a
// 354 is collected up to the lone dot and answered with 250.
class LoopbackServer {
public:
    using Responder = std::function<std::string(const std::string& line)>;

    LoopbackServer(std::string greeting, Responder respond)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , socket_(io_)
        , greeting_(std::move(greeting))
        , respond_(std::move(respond)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        acceptor_.close(ec);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    std::string message_data() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_;
    }

    // Waits for the client to hang up.
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void serve() {
        boost::system::error_code ec;
        acceptor_.accept(socket_, ec);
        if (ec) return;

        if (!send(greeting_)) return;

        asio::streambuf buffer;
        bool in_data = false;

        while (true) {
            asio::read_until(socket_, buffer, "\r\n", ec);
            if (ec) return;

            std::istream in(&buffer);
            std::string line;
            std::getline(in, line);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (in_data) {
                if (line == ".") {
                    in_data = false;
                    if (!send("250 2.0.0 Ok: queued as 4F2A1\r\n")) return;
                } else {
                    std::lock_guard<std::mutex> lock(mutex_);
                    data_ += line + "\r\n";
                }
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                commands_.push_back(line);
            }

            std::string reply = respond_(line);
            if (reply.empty()) continue;
            if (!send(reply)) return;

            if (reply.rfind("354", 0) == 0) {
                in_data = true;
            } else if (line == "QUIT") {
                return;
            }
        }
    }

    bool send(const std::string& text) {
        boost::system::error_code ec;
        asio::write(socket_, asio::buffer(text), ec);
        return !ec;
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::string greeting_;
    Responder respond_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> commands_;
    std::string data_;
};

std::string postfix_like(const std::string& line) {
    if (line.rfind("EHLO ", 0) == 0) {
        return "250-mx.example.test\r\n250-PIPELINING\r\n250-SIZE 10240000\r\n"
               "250-AUTH PLAIN LOGIN\r\n250 8BITMIME\r\n";
    }
    if (line.rfind("AUTH PLAIN ", 0) == 0) return "235 2.7.0 Authentication successful\r\n";
    if (line.rfind("MAIL FROM:", 0) == 0) return "250 2.1.0 Ok\r\n";
    if (line.rfind("RCPT TO:<nobody@", 0) == 0) return "550 5.1.1 Recipient address rejected\r\n";
    if (line.rfind("RCPT TO:", 0) == 0) return "250 2.1.5 Ok\r\n";
    if (line == "DATA") return "354 End data with <CR><LF>.<CR><LF>\r\n";
    if (line == "RSET") return "250 2.0.0 Ok\r\n";
    if (line == "QUIT") return "221 2.0.0 Bye\r\n";
    return "502 5.5.2 Error: command not recognized\r\n";
}

SessionOptions loopback_options() {
    SessionOptions options;
    options.timeout = std::chrono::seconds(5);
    options.quit_timeout = std::chrono::milliseconds(500);
    options.local_hostname = "probe.example.test";
    return options;
}

}  // namespace

TEST_CASE("Plaintext session over TCP", "[integration][session]") {
    LoopbackServer server("220 mx.example.test ESMTP Postfix\r\n", postfix_like);

    auto session = SMTPSession::connect("127.0.0.1", server.port(), loopback_options(), nullptr);
    REQUIRE(session->banner() == "mx.example.test ESMTP Postfix");

    const auto& caps = session->negotiate();
    REQUIRE(caps.supports_pipelining());
    REQUIRE(caps.max_size() == 10240000u);
    REQUIRE_FALSE(caps.supports_starttls());

    auto auth = session->authenticate("PLAIN", "probe@example.test", "secret");
    REQUIRE(auth.success);
    REQUIRE(auth.reply_code == 235);

    SECTION("Message accepted") {
        auto sent = session->send_message("probe@example.test", {"postmaster@example.test"},
                                          "Loopback", "line one\n.line two");
        REQUIRE(sent.reply_code == 250);
        REQUIRE(sent.reply_text == "2.0.0 Ok: queued as 4F2A1");

        session->close();
        server.join();

        auto commands = server.commands();
        REQUIRE(commands.size() == 6);
        REQUIRE(commands[0] == "EHLO probe.example.test");
        REQUIRE(commands[1] == "AUTH PLAIN AHByb2JlQGV4YW1wbGUudGVzdABzZWNyZXQ=");
        REQUIRE(commands[2].rfind("MAIL FROM:<probe@example.test> SIZE=", 0) == 0);
        REQUIRE(commands[3] == "RCPT TO:<postmaster@example.test>");
        REQUIRE(commands[4] == "DATA");
        REQUIRE(commands[5] == "QUIT");

        auto data = server.message_data();
        REQUIRE(data.find("Subject: Loopback\r\n") != std::string::npos);
        REQUIRE(data.find("\r\n\r\nline one\r\n..line two\r\n") != std::string::npos);
    }

    SECTION("Recipient refused") {
        try {
            session->send_message("probe@example.test", {"nobody@example.test"}, "Loopback", "x");
            FAIL("send_message should have thrown");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::TransactionRejected);
            REQUIRE(e.reply_code() == 550);
        }
        REQUIRE_FALSE(session->is_closed());

        session->close();
        server.join();

        auto commands = server.commands();
        REQUIRE(commands.back() == "QUIT");
        REQUIRE(commands[commands.size() - 2] == "RSET");
    }
}

TEST_CASE("Silent server times out", "[integration][timeout]") {
    LoopbackServer server("220 slow.example.test ESMTP\r\n", [](const std::string& line) {
        return line == "QUIT" ? std::string("221 Bye\r\n") : std::string();
    });

    auto options = loopback_options();
    options.timeout = std::chrono::milliseconds(300);
    auto session = SMTPSession::connect("127.0.0.1", server.port(), options, nullptr);

    auto started = std::chrono::steady_clock::now();
    try {
        session->negotiate();
        FAIL("negotiate should have timed out");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Timeout);
        REQUIRE(e.step() == Step::EHLO);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
    REQUIRE(session->is_closed());

    try {
        session->negotiate();
        FAIL("a timed out session must stay closed");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Timeout);
    }

    session.reset();
    server.join();
}

TEST_CASE("Nothing listening", "[integration][connect]") {
    uint16_t port;
    {
        asio::io_context io;
        tcp::acceptor probe(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = probe.local_endpoint().port();
    }

    try {
        SMTPSession::connect("127.0.0.1", port, loopback_options(), nullptr);
        FAIL("connect should have failed");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::ConnectionRefused);
        REQUIRE(e.step() == Step::Connect);
    }
}
