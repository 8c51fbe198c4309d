/* processrunner.h - Launching external package tools
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Every pacman, yay, pactree, sudo and pkexec invocation of the backend
 * goes through an IProcessRunner. Commands are fixed argument vectors and
 * are never passed through a shell.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _PROCESSRUNNER_H_
#define _PROCESSRUNNER_H_

#include "pkgtypes.h"

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <atomic>
#include <functional>
#include <chrono>

namespace Pkger {

// ============================================================================
// Cancellation
// ============================================================================

/**
 * CancelToken - Shared cooperative cancellation flag
 *
 * Copies share the same flag. A default-constructed token is never
 * cancelled unless cancel() is called on it or one of its copies.
 */
class CancelToken {
public:
    CancelToken() : _flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { _flag->store(true); }
    bool isCancelled() const { return _flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> _flag;
};

// ============================================================================
// Command Description
// ============================================================================

/**
 * CommandSpec - One external command and how to run it
 *
 * The optional input is written to the child's stdin right after launch,
 * followed by a newline when appendNewline is set, and stdin is then
 * closed. onInputWritten fires immediately after the write so the owner
 * of the bytes (a Credential) can wipe them.
 */
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;

    std::string_view input;
    bool appendNewline = true;
    std::function<void()> onInputWritten;

    // Extra environment for the child; LC_ALL=C keeps tool output parseable
    std::map<std::string, std::string> environment = {{"LC_ALL", "C"}};

    int timeoutSeconds = 0;             // 0 = no timeout
    int graceMs = 5000;                 // SIGTERM -> SIGKILL delay

    CommandSpec() = default;
    CommandSpec(const std::string& _program, const std::vector<std::string>& _args)
        : program(_program), args(_args)
    {}

    // "program arg1 arg2" for logs (never includes the input)
    std::string toString() const;
};

/**
 * ExitStatus - How a command ended
 */
struct ExitStatus {
    enum class Kind {
        LAUNCH_FAILED,      // fork/exec failed, error holds the reason
        EXITED,             // exitCode holds the status
        SIGNALED,           // exitCode is 128 + signal number
        CANCELLED,
        TIMED_OUT
    };

    Kind kind = Kind::LAUNCH_FAILED;
    int exitCode = -1;
    std::string error;

    bool exited() const { return kind == Kind::EXITED; }
    bool ok() const { return kind == Kind::EXITED && exitCode == 0; }

    static ExitStatus Exited(int code) {
        ExitStatus s;
        s.kind = Kind::EXITED;
        s.exitCode = code;
        return s;
    }

    static ExitStatus LaunchFailed(const std::string& error) {
        ExitStatus s;
        s.kind = Kind::LAUNCH_FAILED;
        s.error = error;
        return s;
    }
};

const char* exitKindToString(ExitStatus::Kind kind);

// Called once per complete output line, in the order lines arrive
using LineCallback = std::function<void(OutputStream stream, const std::string& line)>;

// ============================================================================
// Runner Interface
// ============================================================================

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * Run a command to completion, delivering output line by line.
     *
     * Blocks the calling thread. Non-zero exit codes are not errors at this
     * level; the caller decides what a code means.
     *
     * @param spec    Command, arguments, input and limits
     * @param onLine  Receives each stdout/stderr line (may be empty)
     * @param cancel  Checked between output chunks
     */
    virtual ExitStatus run(const CommandSpec& spec,
                           const LineCallback& onLine,
                           const CancelToken& cancel) = 0;
};

/**
 * ProcessRunner - fork/exec implementation of IProcessRunner
 *
 * The child gets its own process group so that helpers it spawns (yay
 * runs makepkg and sudo) receive the termination signals too. SIGPIPE is
 * ignored process-wide on first use so a child that exits before reading
 * its stdin cannot kill the caller.
 */
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner();

    ExitStatus run(const CommandSpec& spec,
                   const LineCallback& onLine,
                   const CancelToken& cancel) override;
};

// ============================================================================
// Output Helpers
// ============================================================================

/**
 * OutputTail - Keeps the last N lines seen
 */
class OutputTail {
public:
    explicit OutputTail(size_t maxLines = 20) : _maxLines(maxLines) {}

    void add(const std::string& line);
    std::vector<std::string> lines() const;
    std::string joined() const;

private:
    size_t _maxLines;
    std::deque<std::string> _lines;
};

/**
 * CommandOutput - Fully captured result of a short command
 */
struct CommandOutput {
    ExitStatus status;
    std::vector<std::string> stdoutLines;
    std::vector<std::string> stderrLines;

    std::string stdoutText() const;
    std::string stderrText() const;
};

/**
 * Translate how a command ended into the error taxonomy. A zero exit is
 * success; launch failures, cancellation, timeouts and non-zero exits map
 * to LAUNCH_ERROR, CANCELLED, TIMEOUT and EXIT_ERROR.
 */
OperationResult resultFromStatus(const ExitStatus& status,
                                 const std::string& what,
                                 const std::vector<std::string>& tail = {});

/**
 * Run a command and collect its output, logging the invocation with its
 * duration under the given component.
 */
CommandOutput captureCommand(IProcessRunner& runner,
                             const CommandSpec& spec,
                             const std::string& component,
                             const CancelToken& cancel = CancelToken());

} // namespace Pkger

#endif // _PROCESSRUNNER_H_

// vim:ts=4:sw=4:et
