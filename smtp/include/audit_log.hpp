#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace mailprobe::smtp {

// Append-only CSV record of probe runs, one file per action and day:
// "<dir>/_smtpprobe_<action>_<YYYY-MM-DD>.csv", owner read/write only.
// Every row starts with a "Timestamp" column. Purely an observer: write
// failures are reported through the return value and never affect a probe.
class CsvAuditLog {
public:
    using Clock = std::chrono::system_clock;

    CsvAuditLog() = default;
    ~CsvAuditLog();

    CsvAuditLog(const CsvAuditLog&) = delete;
    CsvAuditLog& operator=(const CsvAuditLog&) = delete;

    static std::string file_name(std::string_view action, Clock::time_point now = Clock::now());

    // Empty `directory` means the system temp directory.
    bool open(const std::filesystem::path& directory, std::string_view action,
              Clock::time_point now = Clock::now());
    void close();

    bool is_open() const { return stream_.is_open(); }
    // True when the file was empty at open time and still needs a header.
    bool needs_header() const { return needs_header_; }
    const std::filesystem::path& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

    bool write_header(const std::vector<std::string>& columns);
    bool write_row(const std::vector<std::string>& fields, Clock::time_point now = Clock::now());

    // RFC 4180 quoting: fields holding a comma, quote, CR or LF are quoted
    // and embedded quotes doubled.
    static std::string escape(std::string_view field);

private:
    bool write_record(const std::vector<std::string>& fields);

    std::filesystem::path path_;
    std::ofstream stream_;
    bool needs_header_ = false;
    std::string last_error_;
};

}  // namespace mailprobe::smtp
