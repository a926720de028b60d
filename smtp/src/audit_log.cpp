#include "audit_log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace mailprobe::smtp {

namespace {

std::string format_local(CsvAuditLog::Clock::time_point when, const char* pattern) {
    auto time = CsvAuditLog::Clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

}  // namespace

CsvAuditLog::~CsvAuditLog() {
    close();
}

std::string CsvAuditLog::file_name(std::string_view action, Clock::time_point now) {
    return "_smtpprobe_" + std::string(action) + "_" + format_local(now, "%Y-%m-%d") + ".csv";
}

bool CsvAuditLog::open(const std::filesystem::path& directory, std::string_view action,
                       Clock::time_point now) {
    close();

    std::error_code ec;
    std::filesystem::path dir = directory;
    if (dir.empty()) {
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            last_error_ = "No temp directory: " + ec.message();
            return false;
        }
    }

    path_ = dir / file_name(action, now);

    // Create with 0600 before the stream opens it, so the file never exists
    // with wider permissions
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        last_error_ = "Cannot create " + path_.string() + ": " + std::strerror(errno);
        return false;
    }
    ::close(fd);

    std::filesystem::permissions(path_,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);

    auto size = std::filesystem::file_size(path_, ec);
    needs_header_ = !ec && size == 0;

    stream_.open(path_, std::ios::app);
    if (!stream_.is_open()) {
        last_error_ = "Cannot open " + path_.string();
        return false;
    }
    return true;
}

void CsvAuditLog::close() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

bool CsvAuditLog::write_header(const std::vector<std::string>& columns) {
    std::vector<std::string> header;
    header.reserve(columns.size() + 1);
    header.emplace_back("Timestamp");
    header.insert(header.end(), columns.begin(), columns.end());

    if (!write_record(header)) {
        return false;
    }
    needs_header_ = false;
    return true;
}

bool CsvAuditLog::write_row(const std::vector<std::string>& fields, Clock::time_point now) {
    std::vector<std::string> row;
    row.reserve(fields.size() + 1);
    row.push_back(format_local(now, "%Y-%m-%d %H:%M:%S"));
    row.insert(row.end(), fields.begin(), fields.end());
    return write_record(row);
}

bool CsvAuditLog::write_record(const std::vector<std::string>& fields) {
    if (!stream_.is_open()) {
        last_error_ = "Audit log is not open";
        return false;
    }

    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) stream_ << ',';
        stream_ << escape(fields[i]);
    }
    stream_ << "\r\n";
    stream_.flush();

    if (!stream_) {
        last_error_ = "Write to " + path_.string() + " failed";
        return false;
    }
    return true;
}

std::string CsvAuditLog::escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace mailprobe::smtp
