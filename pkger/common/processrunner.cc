/* processrunner.cc - Launching external package tools
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "processrunner.h"
#include "structuredlog.h"

#include <cerrno>
#include <cstring>
#include <csignal>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace Pkger {

using namespace std;

const char* exitKindToString(ExitStatus::Kind kind)
{
    switch (kind) {
        case ExitStatus::Kind::LAUNCH_FAILED: return "launch-failed";
        case ExitStatus::Kind::EXITED:        return "exited";
        case ExitStatus::Kind::SIGNALED:      return "signaled";
        case ExitStatus::Kind::CANCELLED:     return "cancelled";
        case ExitStatus::Kind::TIMED_OUT:     return "timed-out";
    }
    return "unknown";
}

string CommandSpec::toString() const
{
    string s = program;
    for (const auto& arg : args) {
        s += " ";
        s += arg;
    }
    return s;
}

// ============================================================================
// Pipe Reading
// ============================================================================

namespace {

const int kPollIntervalMs = 100;

/**
 * One output pipe of the child with its unfinished line
 */
struct OutputChannel {
    int fd = -1;
    OutputStream stream = OutputStream::STDOUT;
    string partial;

    bool isOpen() const { return fd >= 0; }

    void closeFd() {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    void deliver(const LineCallback& onLine, const string& line) {
        if (onLine && !line.empty()) {
            onLine(stream, line);
        }
    }

    // pacman redraws progress with '\r', so it ends a line as well
    void append(const char* data, size_t len, const LineCallback& onLine) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];
            if (c == '\n' || c == '\r') {
                deliver(onLine, partial);
                partial.clear();
            } else {
                partial += c;
            }
        }
    }

    // Read everything currently available; closes the channel on EOF
    void drain(const LineCallback& onLine) {
        char buffer[4096];
        while (fd >= 0) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                append(buffer, static_cast<size_t>(n), onLine);
            } else if (n == 0) {
                closeFd();
            } else if (errno == EINTR) {
                continue;
            } else {
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    closeFd();
                }
                break;
            }
        }
    }

    void flush(const LineCallback& onLine) {
        if (!partial.empty()) {
            deliver(onLine, partial);
            partial.clear();
        }
    }
};

void closePipe(int fds[2])
{
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

bool writeAll(int fd, const char* data, size_t len)
{
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

vector<string> buildEnvironment(const map<string, string>& overrides)
{
    vector<string> env;
    for (char** e = environ; e && *e; ++e) {
        string entry(*e);
        string key = entry.substr(0, entry.find('='));
        if (overrides.find(key) == overrides.end()) {
            env.push_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

void ignoreSigpipe()
{
    static once_flag flag;
    call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

} // namespace

// ============================================================================
// ProcessRunner
// ============================================================================

ProcessRunner::ProcessRunner()
{
    ignoreSigpipe();
}

ExitStatus ProcessRunner::run(const CommandSpec& spec,
                              const LineCallback& onLine,
                              const CancelToken& cancel)
{
    if (spec.program.empty()) {
        return ExitStatus::LaunchFailed("No command specified");
    }

    // Everything the child needs is prepared before fork
    vector<string> argvStrings;
    argvStrings.push_back(spec.program);
    argvStrings.insert(argvStrings.end(), spec.args.begin(), spec.args.end());

    vector<char*> cargs;
    for (auto& arg : argvStrings) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    vector<string> envStrings = buildEnvironment(spec.environment);
    vector<char*> cenv;
    for (auto& entry : envStrings) {
        cenv.push_back(const_cast<char*>(entry.c_str()));
    }
    cenv.push_back(nullptr);

    // Create pipes; O_CLOEXEC so children forked by other threads never
    // inherit them
    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    int stderrPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};

    if (pipe2(stdinPipe, O_CLOEXEC) != 0 ||
        pipe2(stdoutPipe, O_CLOEXEC) != 0 ||
        pipe2(stderrPipe, O_CLOEXEC) != 0 ||
        pipe2(execPipe, O_CLOEXEC) != 0) {
        string reason = string("Failed to create pipe: ") + strerror(errno);
        closePipe(stdinPipe);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        closePipe(execPipe);
        return ExitStatus::LaunchFailed(reason);
    }

    pid_t pid = fork();

    if (pid < 0) {
        string reason = string("Failed to fork process: ") + strerror(errno);
        closePipe(stdinPipe);
        closePipe(stdoutPipe);
        closePipe(stderrPipe);
        closePipe(execPipe);
        return ExitStatus::LaunchFailed(reason);
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        dup2(stdinPipe[0], STDIN_FILENO);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);

        signal(SIGPIPE, SIG_DFL);

        execvpe(cargs[0], cargs.data(), cenv.data());

        // If we get here, exec failed; report errno to the parent
        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);

    close(stdinPipe[0]);
    close(stdoutPipe[1]);
    close(stderrPipe[1]);
    close(execPipe[1]);

    // The exec pipe closes on successful exec, or carries errno on failure
    int execErrno = 0;
    ssize_t got;
    do {
        got = read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    close(execPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        close(stdinPipe[1]);
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        waitpid(pid, nullptr, 0);
        return ExitStatus::LaunchFailed(spec.program + ": " + strerror(execErrno));
    }

    // One-shot input, then EOF
    if (!spec.input.empty()) {
        bool written = writeAll(stdinPipe[1], spec.input.data(), spec.input.size());
        if (written && spec.appendNewline) {
            written = writeAll(stdinPipe[1], "\n", 1);
        }
        if (!written) {
            LOG(LogLevel::DEBUG)
                .component("ProcessRunner")
                .field("command", spec.program)
                .message("Child closed stdin before input was written")
                .emit();
        }
    }
    if (spec.onInputWritten) {
        spec.onInputWritten();
    }
    close(stdinPipe[1]);

    OutputChannel channels[2];
    channels[0].fd = stdoutPipe[0];
    channels[0].stream = OutputStream::STDOUT;
    channels[1].fd = stderrPipe[0];
    channels[1].stream = OutputStream::STDERR;

    for (auto& ch : channels) {
        fcntl(ch.fd, F_SETFL, fcntl(ch.fd, F_GETFL) | O_NONBLOCK);
    }

    auto startTime = chrono::steady_clock::now();
    bool cancelled = false;
    bool timedOut = false;
    bool reaped = false;
    int status = 0;

    // A throwing line callback must not leave the child running or its
    // pipes open; kill the group, reap it and pass the exception on.
    try {
        while (true) {
            if (cancel.isCancelled()) {
                cancelled = true;
                break;
            }

            if (spec.timeoutSeconds > 0) {
                auto elapsed = chrono::steady_clock::now() - startTime;
                if (elapsed >= chrono::seconds(spec.timeoutSeconds)) {
                    timedOut = true;
                    break;
                }
            }

            pollfd fds[2];
            nfds_t count = 0;
            for (auto& ch : channels) {
                if (ch.isOpen()) {
                    fds[count].fd = ch.fd;
                    fds[count].events = POLLIN;
                    fds[count].revents = 0;
                    ++count;
                }
            }

            if (count > 0) {
                int ret = poll(fds, count, kPollIntervalMs);
                if (ret > 0) {
                    for (auto& ch : channels) {
                        ch.drain(onLine);
                    }
                }
            } else {
                this_thread::sleep_for(chrono::milliseconds(kPollIntervalMs));
            }

            // Check if child has exited
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w > 0) {
                reaped = true;
                break;
            }
        }

        if (cancelled || timedOut) {
            // Terminate the whole group, escalate after the grace period
            kill(-pid, SIGTERM);

            auto termTime = chrono::steady_clock::now();
            while (!reaped) {
                for (auto& ch : channels) {
                    ch.drain(onLine);
                }
                if (waitpid(pid, &status, WNOHANG) > 0) {
                    reaped = true;
                    break;
                }
                if (chrono::steady_clock::now() - termTime >= chrono::milliseconds(spec.graceMs)) {
                    LOG(LogLevel::WARN)
                        .component("ProcessRunner")
                        .field("command", spec.program)
                        .message("Child ignored SIGTERM, sending SIGKILL")
                        .emit();
                    kill(-pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    reaped = true;
                    break;
                }
                this_thread::sleep_for(chrono::milliseconds(kPollIntervalMs / 2));
            }
        }

        // Read any remaining data
        for (auto& ch : channels) {
            ch.drain(onLine);
            ch.flush(onLine);
            ch.closeFd();
        }
    } catch (...) {
        if (!reaped) {
            kill(-pid, SIGKILL);
            waitpid(pid, &status, 0);
        }
        for (auto& ch : channels) {
            ch.closeFd();
        }
        LOG(LogLevel::ERROR)
            .component("ProcessRunner")
            .field("command", spec.program)
            .message("Output handler failed, child killed")
            .emit();
        throw;
    }

    ExitStatus result;
    if (cancelled) {
        result.kind = ExitStatus::Kind::CANCELLED;
        result.error = "Cancelled";
    } else if (timedOut) {
        result.kind = ExitStatus::Kind::TIMED_OUT;
        result.error = "Command timed out after " + to_string(spec.timeoutSeconds) + " seconds";
    } else if (WIFEXITED(status)) {
        result.kind = ExitStatus::Kind::EXITED;
    } else {
        result.kind = ExitStatus::Kind::SIGNALED;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    return result;
}

// ============================================================================
// Output Helpers
// ============================================================================

void OutputTail::add(const string& line)
{
    if (_maxLines == 0) return;
    _lines.push_back(line);
    while (_lines.size() > _maxLines) {
        _lines.pop_front();
    }
}

vector<string> OutputTail::lines() const
{
    return vector<string>(_lines.begin(), _lines.end());
}

string OutputTail::joined() const
{
    string s;
    for (const auto& line : _lines) {
        if (!s.empty()) s += "\n";
        s += line;
    }
    return s;
}

namespace {

string joinLines(const vector<string>& lines)
{
    string s;
    for (const auto& line : lines) {
        s += line;
        s += "\n";
    }
    return s;
}

} // namespace

string CommandOutput::stdoutText() const
{
    return joinLines(stdoutLines);
}

string CommandOutput::stderrText() const
{
    return joinLines(stderrLines);
}

OperationResult resultFromStatus(const ExitStatus& status,
                                 const string& what,
                                 const vector<string>& tail)
{
    OperationResult result;
    string details;
    for (const auto& line : tail) {
        if (!details.empty()) details += "\n";
        details += line;
    }

    switch (status.kind) {
        case ExitStatus::Kind::LAUNCH_FAILED:
            result = OperationResult::Failure(ErrorKind::LAUNCH_ERROR,
                what + " could not be started: " + status.error, details, -1);
            break;
        case ExitStatus::Kind::CANCELLED:
            result = OperationResult::Failure(ErrorKind::CANCELLED,
                what + " was cancelled", details, status.exitCode);
            break;
        case ExitStatus::Kind::TIMED_OUT:
            result = OperationResult::Failure(ErrorKind::TIMEOUT,
                what + ": " + status.error, details, status.exitCode);
            break;
        case ExitStatus::Kind::SIGNALED:
            result = OperationResult::Failure(ErrorKind::EXIT_ERROR,
                what + " was killed by signal " + to_string(status.exitCode - 128),
                details, status.exitCode);
            break;
        case ExitStatus::Kind::EXITED:
            if (status.exitCode == 0) {
                result = OperationResult::Success(what + " completed successfully");
            } else {
                result = OperationResult::Failure(ErrorKind::EXIT_ERROR,
                    what + " failed with code " + to_string(status.exitCode),
                    details, status.exitCode);
            }
            break;
    }
    result.outputTail = tail;
    return result;
}

CommandOutput captureCommand(IProcessRunner& runner,
                             const CommandSpec& spec,
                             const string& component,
                             const CancelToken& cancel)
{
    CommandOutput output;
    auto start = chrono::steady_clock::now();

    output.status = runner.run(spec, [&output](OutputStream stream, const string& line) {
        if (stream == OutputStream::STDERR) {
            output.stderrLines.push_back(line);
        } else {
            output.stdoutLines.push_back(line);
        }
    }, cancel);

    auto elapsed = chrono::duration_cast<chrono::milliseconds>(
        chrono::steady_clock::now() - start);

    LOG(output.status.kind == ExitStatus::Kind::LAUNCH_FAILED ? LogLevel::WARN : LogLevel::DEBUG)
        .component(component)
        .operation("exec")
        .field("command", spec.toString())
        .field("status", exitKindToString(output.status.kind))
        .field("lines", to_string(output.stdoutLines.size()))
        .exitCode(output.status.exitCode)
        .errorCode(output.status.error)
        .duration(elapsed)
        .message("Command finished")
        .emit();

    return output;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
