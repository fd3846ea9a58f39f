#include "logger.h"
#include <cstdarg>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <chrono>

namespace piping {
namespace core {

Logger::~Logger() noexcept {
    close_output_file();
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default:              return "?????";
    }
}

void Logger::format_timestamp(char* buf, size_t size) noexcept {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<int>(ms.count()));
}

void Logger::log(LogLevel level, const char* tag, const char* file, int line,
                 const char* fmt, ...) noexcept {
    if (!enabled(level)) {
        return;
    }

    char message_buf[4096];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message_buf, sizeof(message_buf), fmt, args);
    va_end(args);

    char timestamp_buf[32];
    format_timestamp(timestamp_buf, sizeof(timestamp_buf));

    const char* filename = strrchr(file, '/');
    filename = filename ? filename + 1 : file;

    std::lock_guard<std::mutex> lock(output_mutex_);
    fprintf(output_file_, "%s [%s] [%s] %s (%s:%d)\n",
            timestamp_buf,
            level_to_string(level),
            tag,
            message_buf,
            filename,
            line);
    fflush(output_file_);
}

std::optional<LogLevel> Logger::parse_level(std::string_view text) noexcept {
    char lowered[16];
    if (text.empty() || text.size() >= sizeof(lowered)) {
        return std::nullopt;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        lowered[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    std::string_view name(lowered, text.size());

    if (name == "debug" || name == "trace") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "off" || name == "none") return LogLevel::NONE;
    return std::nullopt;
}

bool Logger::configure_from_env() noexcept {
    set_level(LogLevel::INFO);

    const char* value = std::getenv(kLogLevelEnv);
    if (!value || value[0] == '\0') {
        return true;
    }

    auto level = parse_level(value);
    if (!level) {
        return false;
    }
    set_level(*level);
    return true;
}

bool Logger::set_output_file(const char* path) noexcept {
    if (!path) {
        close_output_file();
        return true;
    }

    FILE* new_file = fopen(path, "a");
    if (!new_file) {
        return false;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);

    if (owns_file_ && output_file_ != stderr) {
        fclose(output_file_);
    }

    output_file_ = new_file;
    owns_file_ = true;

    return true;
}

void Logger::close_output_file() noexcept {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (owns_file_ && output_file_ != stderr) {
        fclose(output_file_);
    }

    output_file_ = stderr;
    owns_file_ = false;
}

} // namespace core
} // namespace piping
