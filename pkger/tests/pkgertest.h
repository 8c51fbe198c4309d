/* pkgertest.h - Test macros and scripted tool fakes
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Tests register themselves through the TEST macro and run during static
 * initialisation; main() only prints the totals. ScriptedRunner stands in
 * for pacman/yay/pactree: each rule matches a command line prefix and
 * replays canned output.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PKGERTEST_H_
#define _PKGERTEST_H_

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <chrono>
#include <utility>
#include <atomic>
#include <memory>

#include "processrunner.h"
#include "metadatasource.h"
#include "metadatacache.h"
#include "structuredlog.h"

// ============================================================================
// Test Utilities
// ============================================================================

inline int g_testsPassed = 0;
inline int g_testsFailed = 0;

#define TEST(name) \
    void test_##name(); \
    struct Test_##name { \
        Test_##name() { \
            std::cout << "Running test: " << #name << "... "; \
            try { \
                test_##name(); \
                std::cout << "PASSED" << std::endl; \
                g_testsPassed++; \
            } catch (const std::exception& e) { \
                std::cout << "FAILED: " << e.what() << std::endl; \
                g_testsFailed++; \
            } \
        } \
    } test_instance_##name; \
    void test_##name()

#define ASSERT_TRUE(x) \
    if (!(x)) throw std::runtime_error(std::string("Assertion failed: ") + #x)

#define ASSERT_FALSE(x) \
    if ((x)) throw std::runtime_error(std::string("Assertion failed: NOT ") + #x)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        std::ostringstream ss; \
        ss << "Assertion failed: " << #a << " == " << #b << " (got " << (a) << " != " << (b) << ")"; \
        throw std::runtime_error(ss.str()); \
    }

#define ASSERT_NE(a, b) \
    if ((a) == (b)) { \
        std::ostringstream ss; \
        ss << "Assertion failed: " << #a << " != " << #b << " (both " << (a) << ")"; \
        throw std::runtime_error(ss.str()); \
    }

#define ASSERT_GT(a, b) \
    if (!((a) > (b))) { \
        std::ostringstream ss; \
        ss << "Assertion failed: " << #a << " > " << #b << " (got " << (a) << " <= " << (b) << ")"; \
        throw std::runtime_error(ss.str()); \
    }

inline int reportResults()
{
    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << g_testsPassed << std::endl;
    std::cout << "Failed: " << g_testsFailed << std::endl;
    return g_testsFailed > 0 ? 1 : 0;
}

// Keep test output readable; failures still show in the memory sink
inline bool quietLogging()
{
    Pkger::Logger::instance().setConsoleEnabled(false);
    return true;
}

inline const bool g_quietLogging = quietLogging();

namespace PkgerTest {

// ============================================================================
// Canned Tool Output
// ============================================================================

/**
 * Render one "Key : Value" block in pacman -Si/-Qi layout.
 */
inline std::string infoBlock(const std::vector<std::pair<std::string, std::string>>& fields)
{
    std::string block;
    for (const auto& [key, value] : fields) {
        std::string padded = key;
        padded.resize(16, ' ');
        block += padded + ": " + value + "\n";
    }
    return block + "\n";
}

struct ScriptedCommand {
    std::vector<std::string> stdoutLines;
    std::vector<std::string> stderrLines;
    int exitCode = 0;
    int delayMs = 0;            // Run time; cancellable in 10 ms steps
    std::string requiredInput;  // If set, any other stdin fails like a wrong password
};

inline ScriptedCommand lines(const std::string& text, int exitCode = 0)
{
    ScriptedCommand cmd;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        cmd.stdoutLines.push_back(line);
    }
    cmd.exitCode = exitCode;
    return cmd;
}

/**
 * ScriptedRunner - IProcessRunner that replays canned output
 *
 * The rule with the longest matching prefix of "program arg1 arg2..."
 * wins. Commands without a rule fail to launch, like a missing binary.
 */
class ScriptedRunner : public Pkger::IProcessRunner {
public:
    void on(const std::string& prefix, ScriptedCommand cmd)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _rules[prefix] = std::move(cmd);
    }

    Pkger::ExitStatus run(const Pkger::CommandSpec& spec,
                          const Pkger::LineCallback& onLine,
                          const Pkger::CancelToken& cancel) override
    {
        std::string commandLine = spec.toString();
        ScriptedCommand cmd;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _calls.push_back(commandLine);
            _inputs.push_back(std::string(spec.input));

            size_t best = 0;
            for (const auto& [prefix, rule] : _rules) {
                if (commandLine.compare(0, prefix.size(), prefix) == 0 &&
                    prefix.size() >= best) {
                    best = prefix.size();
                    cmd = rule;
                    found = true;
                }
            }
        }

        if (!spec.input.empty() && spec.onInputWritten) {
            spec.onInputWritten();
        }

        if (!found) {
            return Pkger::ExitStatus::LaunchFailed("No such file or directory: " + spec.program);
        }

        RunningGuard running(*this);

        if (!cmd.requiredInput.empty() && std::string(spec.input) != cmd.requiredInput) {
            if (onLine) onLine(Pkger::OutputStream::STDERR, "Sorry, try again.");
            return Pkger::ExitStatus::Exited(1);
        }

        for (const auto& line : cmd.stdoutLines) {
            if (onLine && !line.empty()) onLine(Pkger::OutputStream::STDOUT, line);
        }
        for (const auto& line : cmd.stderrLines) {
            if (onLine && !line.empty()) onLine(Pkger::OutputStream::STDERR, line);
        }

        for (int waited = 0; waited < cmd.delayMs; waited += 10) {
            if (cancel.isCancelled()) {
                Pkger::ExitStatus status;
                status.kind = Pkger::ExitStatus::Kind::CANCELLED;
                return status;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        return Pkger::ExitStatus::Exited(cmd.exitCode);
    }

    std::vector<std::string> calls() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _calls;
    }

    std::vector<std::string> inputs() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _inputs;
    }

    // Number of recorded calls starting with prefix
    size_t count(const std::string& prefix) const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for (const auto& call : _calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    // Most commands that were ever running at the same time
    int maxConcurrent() const { return _maxRunning; }

    void clearCalls()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _calls.clear();
        _inputs.clear();
    }

private:
    struct RunningGuard {
        explicit RunningGuard(ScriptedRunner& owner) : _owner(owner)
        {
            int now = ++_owner._running;
            int seen = _owner._maxRunning;
            while (now > seen && !_owner._maxRunning.compare_exchange_weak(seen, now)) {}
        }
        ~RunningGuard() { --_owner._running; }

        ScriptedRunner& _owner;
    };

    std::atomic<int> _running{0};
    std::atomic<int> _maxRunning{0};
    mutable std::mutex _mutex;
    std::map<std::string, ScriptedCommand> _rules;
    std::vector<std::string> _calls;
    std::vector<std::string> _inputs;
};

// ============================================================================
// Fake Metadata Sources
// ============================================================================

inline Pkger::PackageRecord record(const std::string& name,
                                   const std::string& version,
                                   Pkger::PackageSource source,
                                   const std::string& repository = "")
{
    Pkger::PackageRecord rec(name, version, source);
    switch (source) {
        case Pkger::PackageSource::INSTALLED: rec.repository = "local"; break;
        case Pkger::PackageSource::AUR:       rec.repository = "aur"; break;
        case Pkger::PackageSource::OFFICIAL:
            rec.repository = repository.empty() ? "extra" : repository;
            break;
    }
    rec.lastRefreshed = std::chrono::system_clock::now();
    return rec;
}

/**
 * FakeSource - MetadataSource over an editable in-memory package list
 */
class FakeSource : public Pkger::MetadataSource {
public:
    explicit FakeSource(Pkger::PackageSource source) : _source(source) {}

    Pkger::PackageSource source() const override { return _source; }

    void put(const Pkger::PackageRecord& rec)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _records[rec.name] = rec;
    }

    void erase(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _records.erase(name);
    }

    void replaceAll(const std::vector<Pkger::PackageRecord>& records)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _records.clear();
        for (const auto& rec : records) {
            _records[rec.name] = rec;
        }
    }

    void setFailing(bool failing) { _failing = failing; }

    Pkger::FetchResult fetchAll(const Pkger::CancelToken&) override
    {
        ++fetchAllCount;
        Pkger::FetchResult fetch;
        if (_failing) {
            fetch.result = Pkger::OperationResult::Failure(
                Pkger::ErrorKind::EXIT_ERROR, "database lock present", "error: failed", 1);
            return fetch;
        }
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& [name, rec] : _records) {
            fetch.records.push_back(rec);
        }
        fetch.result = Pkger::OperationResult::Success();
        return fetch;
    }

    Pkger::FetchResult fetchNames(const std::vector<std::string>& names,
                                  const Pkger::CancelToken&) override
    {
        ++fetchNamesCount;
        Pkger::FetchResult fetch;
        if (_failing) {
            fetch.result = Pkger::OperationResult::Failure(
                Pkger::ErrorKind::EXIT_ERROR, "database lock present", "error: failed", 1);
            return fetch;
        }
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& name : names) {
            auto it = _records.find(name);
            if (it != _records.end()) {
                fetch.records.push_back(it->second);
            }
        }
        fetch.result = Pkger::OperationResult::Success();
        return fetch;
    }

    std::atomic<int> fetchAllCount{0};
    std::atomic<int> fetchNamesCount{0};

private:
    Pkger::PackageSource _source;
    std::atomic<bool> _failing{false};
    std::mutex _mutex;
    std::map<std::string, Pkger::PackageRecord> _records;
};

/**
 * FakeSources - One FakeSource per package source, ready to hand to a
 * MetadataCache. The cache owns the sources; the raw pointers stay valid
 * for the cache's lifetime.
 */
struct FakeSources {
    FakeSource* installed = nullptr;
    FakeSource* official = nullptr;
    FakeSource* aur = nullptr;
    Pkger::MetadataCache::SourceMap map;

    FakeSources()
    {
        auto i = std::make_unique<FakeSource>(Pkger::PackageSource::INSTALLED);
        auto o = std::make_unique<FakeSource>(Pkger::PackageSource::OFFICIAL);
        auto a = std::make_unique<FakeSource>(Pkger::PackageSource::AUR);
        installed = i.get();
        official = o.get();
        aur = a.get();
        map[Pkger::PackageSource::INSTALLED] = std::move(i);
        map[Pkger::PackageSource::OFFICIAL] = std::move(o);
        map[Pkger::PackageSource::AUR] = std::move(a);
    }
};

} // namespace PkgerTest

#endif // _PKGERTEST_H_

// vim:ts=4:sw=4:et
