#include <catch2/catch_test_macros.hpp>
#include "smtp_commands.hpp"
#include "smtp_response.hpp"
#include "smtp_message.hpp"
#include "capabilities.hpp"
#include "error.hpp"
#include "scripted_connection.hpp"

using namespace mailprobe;
using namespace mailprobe::smtp;

TEST_CASE("SMTP command building", "[smtp][commands]") {
    SECTION("EHLO and HELO") {
        REQUIRE(command::ehlo("client.example.com") == "EHLO client.example.com\r\n");
        REQUIRE(command::helo("client.example.com") == "HELO client.example.com\r\n");
    }

    SECTION("MAIL FROM with and without parameters") {
        REQUIRE(command::mail_from("sender@example.com") == "MAIL FROM:<sender@example.com>\r\n");
        REQUIRE(command::mail_from("sender@example.com", "SIZE=1024") ==
                "MAIL FROM:<sender@example.com> SIZE=1024\r\n");
        REQUIRE(command::mail_from("") == "MAIL FROM:<>\r\n");
    }

    SECTION("RCPT TO") {
        REQUIRE(command::rcpt_to("recipient@example.com") == "RCPT TO:<recipient@example.com>\r\n");
    }

    SECTION("AUTH with and without initial response") {
        REQUIRE(command::auth("LOGIN") == "AUTH LOGIN\r\n");
        REQUIRE(command::auth("PLAIN", "AHVzZXIAcGFzcw==") == "AUTH PLAIN AHVzZXIAcGFzcw==\r\n");
    }

    SECTION("Argument-less commands") {
        REQUIRE(command::data() == "DATA\r\n");
        REQUIRE(command::starttls() == "STARTTLS\r\n");
        REQUIRE(command::rset() == "RSET\r\n");
        REQUIRE(command::quit() == "QUIT\r\n");
    }

    SECTION("CR and LF are stripped from interpolated text") {
        REQUIRE(command::ehlo("evil\r\nRCPT TO:<x@y>") == "EHLO evilRCPT TO:<x@y>\r\n");
        REQUIRE(command::rcpt_to("a@b.com\r\nDATA") == "RCPT TO:<a@b.comDATA>\r\n");
        REQUIRE(command::mail_from("a@b.com\n") == "MAIL FROM:<a@b.com>\r\n");
        REQUIRE(command::line("abc\rdef") == "abcdef\r\n");
    }

    SECTION("Every command is a single CRLF-terminated line") {
        for (const auto& line : {command::ehlo("x\r\ny"), command::auth("PLAIN", "a\nb"),
                                 command::rcpt_to("\r\n")}) {
            REQUIRE(line.size() >= 2);
            REQUIRE(line.substr(line.size() - 2) == "\r\n");
            REQUIRE(line.find_first_of("\r\n") == line.size() - 2);
        }
    }
}

TEST_CASE("Email address parsing", "[smtp][email]") {
    SECTION("Simple email address") {
        auto addr = EmailAddress::parse("user@example.com");
        REQUIRE(addr.has_value());
        REQUIRE(addr->local_part == "user");
        REQUIRE(addr->domain == "example.com");
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("Email in angle brackets") {
        auto addr = EmailAddress::parse("<user@example.com>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->full_address == "user@example.com");
    }

    SECTION("Display name form") {
        auto addr = EmailAddress::parse("\"Probe Sender\" <probe@example.com>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->display_name == "Probe Sender");
        REQUIRE(addr->full_address == "probe@example.com");
    }

    SECTION("Null sender") {
        auto addr = EmailAddress::parse("<>");
        REQUIRE(addr.has_value());
        REQUIRE(addr->is_null());
    }

    SECTION("Invalid addresses") {
        REQUIRE_FALSE(EmailAddress::parse("userexample.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("@example.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("user@").has_value());
        REQUIRE_FALSE(EmailAddress::parse("user@.example.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("user@example.com\r\nRCPT TO:<x@y>").has_value());
        REQUIRE_FALSE(EmailAddress::parse("<user@example.com").has_value());
        REQUIRE_FALSE(EmailAddress::parse("").has_value());
    }
}

TEST_CASE("Response parser", "[smtp][response]") {
    ResponseParser parser;

    SECTION("Single line reply") {
        REQUIRE(parser.feed("250 OK") == ResponseParser::Status::Complete);
        auto reply = parser.take();
        REQUIRE(reply.code == 250);
        REQUIRE(reply.lines == std::vector<std::string>{"OK"});
        REQUIRE(reply.is_positive());
        REQUIRE_FALSE(reply.is_multiline());
    }

    SECTION("Multi-line reply keeps every segment in order") {
        REQUIRE(parser.feed("250-mail.example.com Hello") == ResponseParser::Status::NeedMore);
        REQUIRE(parser.in_progress());
        REQUIRE(parser.feed("250-STARTTLS") == ResponseParser::Status::NeedMore);
        REQUIRE(parser.feed("250 SIZE 35882577") == ResponseParser::Status::Complete);

        auto reply = parser.take();
        REQUIRE(reply.code == 250);
        REQUIRE(reply.lines.size() == 3);
        REQUIRE(reply.lines[0] == "mail.example.com Hello");
        REQUIRE(reply.lines[2] == "SIZE 35882577");
        REQUIRE(reply.message() == "mail.example.com Hello STARTTLS SIZE 35882577");
    }

    SECTION("Bare code is a final line") {
        REQUIRE(parser.feed("354") == ResponseParser::Status::Complete);
        auto reply = parser.take();
        REQUIRE(reply.code == 354);
        REQUIRE(reply.is_intermediate());
        REQUIRE(reply.lines == std::vector<std::string>{""});
    }

    SECTION("Reply classes") {
        parser.feed("451 Try later");
        REQUIRE(parser.take().is_transient_failure());
        parser.feed("550 No such user");
        REQUIRE(parser.take().is_permanent_failure());
    }

    SECTION("Malformed lines are protocol violations") {
        auto violation = [&](const std::string& line) {
            ResponseParser p;
            try {
                p.feed(line);
            } catch (const Error& e) {
                return e.kind() == ErrorKind::ProtocolViolation;
            }
            return false;
        };

        REQUIRE(violation("25"));
        REQUIRE(violation("abc Hello"));
        REQUIRE(violation("250+Hello"));
        REQUIRE(violation("199 Too low"));
        REQUIRE(violation("600 Too high"));
        REQUIRE(violation(""));
    }

    SECTION("Code change inside one reply is rejected") {
        parser.feed("250-first");
        try {
            parser.feed("251 second");
            FAIL("expected a protocol violation");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::ProtocolViolation);
        }
    }

    SECTION("Parser is reusable after take") {
        parser.feed("220 ready");
        parser.take();
        REQUIRE_FALSE(parser.in_progress());
        parser.feed("221 bye");
        REQUIRE(parser.take().code == 221);
    }
}

TEST_CASE("Reading replies from a connection", "[smtp][response]") {
    auto script = std::make_shared<testing::Script>();
    testing::ScriptedConnection conn(script);

    SECTION("Observer sees every raw line") {
        script->reply("250-one\r\n250-two\r\n250 three");
        std::vector<std::string> seen;
        auto reply = read_response(conn, std::chrono::seconds(5),
                                   [&](const std::string& line) { seen.push_back(line); });
        REQUIRE(reply.lines.size() == 3);
        REQUIRE(seen == std::vector<std::string>{"250-one", "250-two", "250 three"});
    }

    SECTION("Consecutive replies are read one at a time") {
        script->reply("220 hello\r\n250 OK");
        REQUIRE(read_response(conn, std::chrono::seconds(5)).code == 220);
        REQUIRE(read_response(conn, std::chrono::seconds(5)).code == 250);
    }

    SECTION("Disconnect mid-reply surfaces as connection closed") {
        script->reply("250-partial");
        script->when_exhausted = ErrorKind::ConnectionClosed;
        try {
            read_response(conn, std::chrono::seconds(5));
            FAIL("expected an error");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::ConnectionClosed);
        }
    }

    SECTION("Endless continuation lines are cut off") {
        for (size_t i = 0; i < MAX_RESPONSE_LINES + 1; ++i) {
            script->server_lines.push_back("250-again");
        }
        try {
            read_response(conn, std::chrono::seconds(5));
            FAIL("expected a protocol violation");
        } catch (const Error& e) {
            REQUIRE(e.kind() == ErrorKind::ProtocolViolation);
        }
    }
}

TEST_CASE("Capability parsing", "[smtp][capabilities]") {
    SECTION("EHLO reply from a typical submission server") {
        ResponseParser parser;
        parser.feed("250-mail.example.com Hello");
        parser.feed("250-STARTTLS");
        parser.feed("250-AUTH PLAIN LOGIN");
        parser.feed("250 SIZE 35882577");
        auto caps = CapabilitySet::parse(parser.take());

        REQUIRE(caps.greeting() == "mail.example.com Hello");
        REQUIRE(caps.size() == 3);
        REQUIRE(caps.has("STARTTLS"));
        REQUIRE(caps.params("AUTH") == std::vector<std::string>{"PLAIN", "LOGIN"});
        REQUIRE(caps.params("SIZE") == std::vector<std::string>{"35882577"});
        REQUIRE(caps.max_size() == 35882577u);
        REQUIRE(caps.to_string() == "STARTTLS, AUTH PLAIN LOGIN, SIZE 35882577");
    }

    SECTION("Lookups are case-insensitive and keep declaration order") {
        auto caps = CapabilitySet::parse({"host", "pipelining", "8BITMIME", "Auth cram-md5"});
        REQUIRE(caps.has("PIPELINING"));
        REQUIRE(caps.supports_pipelining());
        REQUIRE(caps.supports_8bitmime());
        REQUIRE(caps.supports_auth("CRAM-MD5"));
        REQUIRE(caps.auth_mechanisms() == std::vector<std::string>{"CRAM-MD5"});

        std::vector<std::string> names;
        for (const auto& cap : caps) names.push_back(cap.name);
        REQUIRE(names == std::vector<std::string>{"pipelining", "8BITMIME", "Auth"});
    }

    SECTION("Unknown keywords are kept") {
        auto caps = CapabilitySet::parse({"host", "X-FUTURE-EXT a b", "XRDST"});
        REQUIRE(caps.has("X-FUTURE-EXT"));
        REQUIRE(caps.params("x-future-ext").size() == 2);
        REQUIRE(caps.params("XRDST").empty());
    }

    SECTION("Keywords with high-bit bytes are indexed byte for byte") {
        auto caps = CapabilitySet::parse({"h\xC3\xB4te", "X-\xC3\xA9TENDU on", "\xFF\xFE", "STARTTLS"});
        REQUIRE(caps.size() == 3);
        REQUIRE(caps.has("x-\xC3\xA9tendu"));
        REQUIRE(caps.params("X-\xC3\xA9TENDU") == std::vector<std::string>{"on"});
        REQUIRE(caps.has("\xFF\xFE"));
        REQUIRE(caps.supports_starttls());
    }

    SECTION("Legacy AUTH= line merges with AUTH") {
        auto caps = CapabilitySet::parse({"host", "AUTH LOGIN PLAIN", "AUTH=LOGIN PLAIN"});
        REQUIRE(caps.size() == 1);
        REQUIRE(caps.params("AUTH") == std::vector<std::string>{"LOGIN", "PLAIN"});
    }

    SECTION("SIZE without a limit") {
        auto caps = CapabilitySet::parse({"host", "SIZE"});
        REQUIRE(caps.max_size() == 0u);
        REQUIRE_FALSE(CapabilitySet::parse({"host"}).max_size().has_value());
    }

    SECTION("Missing keyword has no parameters") {
        auto caps = CapabilitySet::parse({"host"});
        REQUIRE(caps.empty());
        REQUIRE(caps.params("AUTH").empty());
        REQUIRE_FALSE(caps.supports_auth("PLAIN"));
        REQUIRE(caps.find("AUTH") == nullptr);
    }
}

TEST_CASE("Message composition", "[smtp][message]") {
    auto now = std::chrono::system_clock::now();

    SECTION("Headers come in a fixed order before the body") {
        auto message = compose_message("Probe <probe@example.com>",
                                       {"a@example.com", "b@example.com"},
                                       "Hello", "Line one\nLine two", "client.example.com", now);
        const auto& text = message.content;

        auto id = text.find("Message-ID: <" + message.message_id + ">\r\n");
        auto date = text.find("\r\nDate: ");
        auto from = text.find("\r\nFrom: Probe <probe@example.com>\r\n");
        auto to = text.find("\r\nTo: a@example.com, b@example.com\r\n");
        auto subject = text.find("\r\nSubject: Hello\r\n\r\n");

        REQUIRE(id == 0);
        REQUIRE(date != std::string::npos);
        REQUIRE(from != std::string::npos);
        REQUIRE(to != std::string::npos);
        REQUIRE(subject != std::string::npos);
        REQUIRE(id < date);
        REQUIRE(date < from);
        REQUIRE(from < to);
        REQUIRE(to < subject);
        REQUIRE(text.substr(subject + 11) == "Hello\r\n\r\nLine one\r\nLine two");
    }

    SECTION("Header values cannot inject headers") {
        auto message = compose_message("a@example.com", {"b@example.com"},
                                       "Hi\r\nBcc: victim@example.com", "", "h", now);
        REQUIRE(message.content.find("\r\nBcc:") == std::string::npos);
        REQUIRE(message.content.find("Subject: HiBcc: victim@example.com\r\n") != std::string::npos);
    }

    SECTION("Message id carries the host") {
        auto id = generate_message_id("client.example.com", now);
        REQUIRE(id.find(".smtpprobe@client.example.com") != std::string::npos);
        REQUIRE(generate_message_id("", now).find("@smtpprobe.local") != std::string::npos);
    }

    SECTION("Date is RFC 5322 shaped") {
        auto date = format_rfc5322_date(now);
        // "Tue, 02 Jan 2024 15:04:05 +0100"
        REQUIRE(date.size() == 31);
        REQUIRE(date[3] == ',');
        REQUIRE((date[26] == '+' || date[26] == '-'));
    }
}

TEST_CASE("DATA payload encoding", "[smtp][message]") {
    SECTION("Leading dots are doubled") {
        REQUIRE(dot_stuff(".hidden\r\nvisible\r\n.\r\n") == "..hidden\r\nvisible\r\n..\r\n.\r\n");
    }

    SECTION("Bare line feeds become CRLF") {
        REQUIRE(dot_stuff("a\nb\rc") == "a\r\nb\r\nc\r\n.\r\n");
    }

    SECTION("Terminator is appended exactly once") {
        REQUIRE(dot_stuff("body\r\n") == "body\r\n.\r\n");
        REQUIRE(dot_stuff("body") == "body\r\n.\r\n");
        REQUIRE(dot_stuff("") == ".\r\n");
    }
}
