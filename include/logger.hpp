//
// Created by Sanger Steel on 10/19/26.
//

#pragma once
#include <format>
#include <string>
#include <string_view>

enum LogLevel {
    NOTSET,
    ERROR,
    INFO,
    DEBUG,
};

LogLevel log_level_from_string(std::string_view name);

std::string_view log_level_name(LogLevel level);

// Writes whole lines to a file descriptor. "stderr" and "stdout" map to the
// standard streams, anything else is opened as a file in append mode.
class LogSink {
public:
    explicit LogSink(const std::string& filename);

    ~LogSink();

    LogSink(const LogSink&) = delete;

    LogSink& operator=(const LogSink&) = delete;

    void write(std::string_view message);

    void reopen(const std::string& filename);

private:
    int fd;
    bool owns_fd = false;

    void close_owned();
};

struct LoggingContext {
    LogLevel level;
    LogSink sink;

    LoggingContext(const std::string& filename, LogLevel level);

    ~LoggingContext() = default;

    void set_level(LogLevel new_level);

    void debug(std::string message);

    void debug(std::string message_fmt, std::string message);

    void info(std::string message);

    // Never returns: every fatal condition in the pipeline goes through here.
    [[noreturn]] void error(std::string message) const;
};


extern LoggingContext Logger;
