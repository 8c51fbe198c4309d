/* structuredlog.h - Structured logging for the PKGER backend core
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Every component logs through LOG(level)...emit(). An entry carries the
 * component, the owning session, the package source and the tool
 * invocation details next to the message, and goes to
 *
 *   - a bounded in-memory history (always on),
 *   - stderr in readable form (unless disabled),
 *   - an optional JSON lines file.
 *
 * Secrets (elevation credentials) must never be passed to any of these
 * functions.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _STRUCTUREDLOG_H_
#define _STRUCTUREDLOG_H_

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <chrono>
#include <mutex>
#include <atomic>
#include <memory>
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstdint>

namespace Pkger {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

inline const char* logLevelToString(LogLevel level) {
    static const char* const names[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    int index = static_cast<int>(level);
    return (index >= 0 && index <= 4) ? names[index] : "UNKNOWN";
}

// Case-insensitive; "warning" is accepted for WARN
inline LogLevel logLevelFromString(const std::string& name,
                                   LogLevel fallback = LogLevel::INFO) {
    std::string upper;
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    for (int i = 0; i <= 4; ++i) {
        if (upper == logLevelToString(static_cast<LogLevel>(i))) {
            return static_cast<LogLevel>(i);
        }
    }
    return fallback;
}

// ============================================================================
// Entries
// ============================================================================

struct LogEntry {
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    LogLevel level = LogLevel::INFO;
    std::string message;

    std::string component;          // Runner, Cache, Resolver, Orchestrator, ...
    uint64_t sessionId = 0;         // 0 = not part of a session
    std::string source;             // Official, AUR, Installed
    std::string operation;
    std::string packageName;

    // Tool invocation
    int exitCode = 0;
    std::string errorCode;          // errorKindToString() of the failure
    std::string output;             // Tail of the tool output
    std::chrono::milliseconds duration{0};

    std::map<std::string, std::string> fields;
};

namespace LogFormat {

inline void appendJsonString(std::ostream& out, const std::string& s)
{
    out << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c < 0x20) {
                    out << "\\u00" << std::hex << std::setfill('0') << std::setw(2)
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << static_cast<char>(c);
                }
        }
    }
    out << '"';
}

/**
 * One JSON object per entry, UTC timestamp with milliseconds. Empty
 * context fields are left out.
 */
inline std::string jsonLine(const LogEntry& e)
{
    std::ostringstream out;

    std::time_t secs = std::chrono::system_clock::to_time_t(e.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        e.timestamp.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);

    out << "{\"ts\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << "Z\"";
    out << ",\"level\":\"" << logLevelToString(e.level) << '"';

    auto text = [&out](const char* key, const std::string& value) {
        if (!value.empty()) {
            out << ",\"" << key << "\":";
            appendJsonString(out, value);
        }
    };

    text("component", e.component);
    if (e.sessionId != 0) {
        out << ",\"session\":" << e.sessionId;
    }
    text("source", e.source);
    text("operation", e.operation);
    text("package", e.packageName);
    out << ",\"message\":";
    appendJsonString(out, e.message);
    text("errorKind", e.errorCode);
    if (e.exitCode != 0) {
        out << ",\"exitCode\":" << e.exitCode;
    }
    if (e.duration.count() > 0) {
        out << ",\"durationMs\":" << e.duration.count();
    }
    text("output", e.output);
    for (const auto& [key, value] : e.fields) {
        out << ',';
        appendJsonString(out, key);
        out << ':';
        appendJsonString(out, value);
    }
    out << '}';
    return out.str();
}

// "12:04:31 WARN  Cache[Official] #3 refresh: message (exit 1, EXIT_ERROR, 120ms)"
inline std::string readable(const LogEntry& e)
{
    std::ostringstream out;

    std::time_t secs = std::chrono::system_clock::to_time_t(e.timestamp);
    std::tm local{};
    localtime_r(&secs, &local);
    out << std::put_time(&local, "%H:%M:%S") << ' '
        << std::left << std::setw(5) << logLevelToString(e.level) << ' ';

    out << (e.component.empty() ? "pkger" : e.component);
    if (!e.source.empty()) {
        out << '[' << e.source << ']';
    }
    if (e.sessionId != 0) {
        out << " #" << e.sessionId;
    }
    if (!e.operation.empty()) {
        out << ' ' << e.operation;
    }
    if (!e.packageName.empty()) {
        out << " (" << e.packageName << ')';
    }
    out << ": " << e.message;

    std::vector<std::string> extra;
    if (e.exitCode != 0) {
        extra.push_back("exit " + std::to_string(e.exitCode));
    }
    if (!e.errorCode.empty()) {
        extra.push_back(e.errorCode);
    }
    if (e.duration.count() > 0) {
        extra.push_back(std::to_string(e.duration.count()) + "ms");
    }
    if (!extra.empty()) {
        out << " (";
        for (size_t i = 0; i < extra.size(); ++i) {
            out << (i ? ", " : "") << extra[i];
        }
        out << ')';
    }
    return out.str();
}

} // namespace LogFormat

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

/**
 * FileSink - Appends JSON lines; the file is opened once
 */
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path) : _file(path, std::ios::app) {}

    bool isOpen() const { return _file.is_open(); }

    void write(const LogEntry& entry) override {
        _file << LogFormat::jsonLine(entry) << '\n';
    }

    void flush() override { _file.flush(); }

private:
    std::ofstream _file;
};

class ConsoleSink : public LogSink {
public:
    void write(const LogEntry& entry) override {
        std::cerr << LogFormat::readable(entry) << '\n';
    }

    void flush() override { std::cerr.flush(); }
};

/**
 * MemorySink - The most recent entries, oldest dropped first
 */
class MemorySink : public LogSink {
public:
    explicit MemorySink(size_t capacity = 1000) : _capacity(capacity) {}

    void write(const LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_entries.size() == _capacity) {
            _entries.pop_front();
        }
        _entries.push_back(entry);
    }

    // Up to count newest entries (0 = all), oldest first
    std::vector<LogEntry> recent(size_t count = 0) const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t skip = (count == 0 || count >= _entries.size()) ? 0 : _entries.size() - count;
        return std::vector<LogEntry>(_entries.begin() + skip, _entries.end());
    }

    std::vector<LogEntry> forSession(uint64_t sessionId) const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<LogEntry> matching;
        for (const auto& entry : _entries) {
            if (entry.sessionId == sessionId) {
                matching.push_back(entry);
            }
        }
        return matching;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.clear();
    }

private:
    size_t _capacity;
    mutable std::mutex _mutex;
    std::deque<LogEntry> _entries;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Logger - Process-wide dispatcher
 *
 * Entries below the minimum level are dropped before any sink sees them.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setMinLevel(LogLevel level) { _minLevel = level; }
    LogLevel minLevel() const { return _minLevel; }

    void setConsoleEnabled(bool enabled) { _consoleEnabled = enabled; }

    void addSink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(_mutex);
        _extraSinks.push_back(std::move(sink));
    }

    // False if the file cannot be opened for appending
    bool addFileSink(const std::string& path) {
        auto sink = std::make_shared<FileSink>(path);
        if (!sink->isOpen()) {
            return false;
        }
        addSink(std::move(sink));
        return true;
    }

    MemorySink& memory() { return _memory; }

    void log(const LogEntry& entry) {
        if (entry.level < _minLevel) {
            return;
        }
        std::lock_guard<std::mutex> lock(_mutex);
        _memory.write(entry);
        if (_consoleEnabled) {
            _console.write(entry);
        }
        for (auto& sink : _extraSinks) {
            sink->write(entry);
        }
        if (entry.level >= LogLevel::ERROR) {
            for (auto& sink : _extraSinks) {
                sink->flush();
            }
        }
    }

    void log(LogLevel level, const std::string& message) {
        LogEntry entry;
        entry.level = level;
        entry.message = message;
        log(entry);
    }

    void flush() {
        std::lock_guard<std::mutex> lock(_mutex);
        _console.flush();
        for (auto& sink : _extraSinks) {
            sink->flush();
        }
    }

private:
    Logger() = default;

    std::mutex _mutex;
    std::atomic<LogLevel> _minLevel{LogLevel::INFO};
    std::atomic<bool> _consoleEnabled{true};
    MemorySink _memory;
    ConsoleSink _console;
    std::vector<std::shared_ptr<LogSink>> _extraSinks;
};

// ============================================================================
// Builder
// ============================================================================

/**
 * LogBuilder - Fills one entry field by field, then emit()s it
 *
 *   LOG(LogLevel::WARN).component("Cache").source("AUR").message("...").emit();
 */
class LogBuilder {
public:
    explicit LogBuilder(LogLevel level) { _entry.level = level; }

    LogBuilder& message(const std::string& text) { _entry.message = text; return *this; }
    LogBuilder& component(const std::string& name) { _entry.component = name; return *this; }
    LogBuilder& session(uint64_t id) { _entry.sessionId = id; return *this; }
    LogBuilder& source(const std::string& name) { _entry.source = name; return *this; }
    LogBuilder& operation(const std::string& name) { _entry.operation = name; return *this; }
    LogBuilder& package(const std::string& name) { _entry.packageName = name; return *this; }
    LogBuilder& exitCode(int code) { _entry.exitCode = code; return *this; }
    LogBuilder& errorCode(const std::string& kind) { _entry.errorCode = kind; return *this; }
    LogBuilder& output(const std::string& tail) { _entry.output = tail; return *this; }
    LogBuilder& duration(std::chrono::milliseconds d) { _entry.duration = d; return *this; }

    LogBuilder& field(const std::string& key, const std::string& value) {
        _entry.fields[key] = value;
        return *this;
    }

    void emit() { Logger::instance().log(_entry); }

private:
    LogEntry _entry;
};

/**
 * ScopedLogTimer - Logs "<what> completed" with the elapsed time when the
 * scope ends, or "<what> failed: <error>" at WARN after fail().
 */
class ScopedLogTimer {
public:
    ScopedLogTimer(LogLevel level,
                   const std::string& component,
                   const std::string& what,
                   const std::string& source = "")
        : _level(level)
        , _component(component)
        , _what(what)
        , _source(source)
        , _start(std::chrono::steady_clock::now())
    {}

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

    ~ScopedLogTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - _start);

        LogBuilder(_error.empty() ? _level : LogLevel::WARN)
            .component(_component)
            .source(_source)
            .operation(_what)
            .errorCode(_errorKind)
            .duration(elapsed)
            .message(_error.empty() ? _what + " completed" : _what + " failed: " + _error)
            .emit();
    }

    void fail(const std::string& error, const std::string& errorKind = "") {
        _error = error.empty() ? "unknown error" : error;
        _errorKind = errorKind;
    }

private:
    LogLevel _level;
    std::string _component;
    std::string _what;
    std::string _source;
    std::chrono::steady_clock::time_point _start;
    std::string _error;
    std::string _errorKind;
};

#define LOG(level) Pkger::LogBuilder(level)

#define LOG_DEBUG(msg) Pkger::Logger::instance().log(Pkger::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  Pkger::Logger::instance().log(Pkger::LogLevel::INFO, msg)
#define LOG_WARN(msg)  Pkger::Logger::instance().log(Pkger::LogLevel::WARN, msg)
#define LOG_ERROR(msg) Pkger::Logger::instance().log(Pkger::LogLevel::ERROR, msg)
#define LOG_FATAL(msg) Pkger::Logger::instance().log(Pkger::LogLevel::FATAL, msg)

} // namespace Pkger

#endif // _STRUCTUREDLOG_H_

// vim:ts=4:sw=4:et
