//
// Created by Sanger Steel on 10/19/26.
//

#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>

LogLevel log_level_from_string(std::string_view name) {
    if (name == "none" || name == "notset") {
        return NOTSET;
    }
    if (name == "error") {
        return ERROR;
    }
    if (name == "info") {
        return INFO;
    }
    if (name == "debug") {
        return DEBUG;
    }
    Logger.error(std::format("Unknown log level: {}", name));
}

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case NOTSET:
            return "none";
        case ERROR:
            return "error";
        case INFO:
            return "info";
        case DEBUG:
            return "debug";
    }
    return "?";
}

LogSink::LogSink(const std::string& filename) : fd(STDERR_FILENO) {
    reopen(filename);
}

LogSink::~LogSink() {
    close_owned();
}

void LogSink::close_owned() {
    if (owns_fd) {
        close(fd);
        owns_fd = false;
    }
}

void LogSink::reopen(const std::string& filename) {
    close_owned();
    if (filename == "stderr") {
        fd = STDERR_FILENO;
        return;
    }
    if (filename == "stdout") {
        fd = STDOUT_FILENO;
        return;
    }
    int opened = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (opened == -1) {
        fd = STDERR_FILENO;
        throw std::runtime_error(std::format("Could not open log file '{}': {}", filename, std::strerror(errno)));
    }
    fd = opened;
    owns_fd = true;
}

void LogSink::write(std::string_view message) {
    auto to_write = std::format("{}\n", message);
    size_t written = 0;
    while (written < to_write.size()) {
        auto n = ::write(fd, to_write.data() + written, to_write.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // Nowhere left to report a failing log sink.
            return;
        }
        written += static_cast<size_t>(n);
    }
}

LoggingContext::LoggingContext(const std::string& filename, LogLevel level) : level(level), sink(filename) {
}

void LoggingContext::set_level(LogLevel new_level) {
    level = new_level;
}

void LoggingContext::debug(std::string message) {
    if (level >= DEBUG) {
        sink.write(std::format("DEBUG: {}", std::move(message)));
    }
}

void LoggingContext::debug(std::string message_fmt, std::string message) {
    if (level >= DEBUG) {
        auto msg = std::vformat(message_fmt, std::make_format_args(message));
        sink.write(std::format("DEBUG: {}", msg));
    }
}

void LoggingContext::info(std::string message) {
    if (level >= INFO) {
        sink.write(std::format("INFO: {}", std::move(message)));
    }
}

void LoggingContext::error(std::string message) const {
    throw std::runtime_error(std::format("ERROR: {}", std::move(message)));
}
