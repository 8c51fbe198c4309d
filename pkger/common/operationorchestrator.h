/* operationorchestrator.h - Sessions for mutating package operations
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Every mutating request becomes a session with its own thread:
 *
 *   Idle -> Queued -> Planning -> AwaitingCredential -> Executing
 *        -> Finalizing -> Succeeded | Failed | Cancelled
 *
 * A single write lock serialises sessions. Under the queue policy a
 * session waits in Queued until the lock is free (FIFO); under the reject
 * policy a second request fails at submit with OPERATION_IN_PROGRESS.
 *
 * Read-only queries do not go through here; use QueryEngine.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _OPERATIONORCHESTRATOR_H_
#define _OPERATIONORCHESTRATOR_H_

#include "pkgtypes.h"
#include "configuration.h"
#include "processrunner.h"
#include "credentialbroker.h"
#include "metadatacache.h"
#include "dependencyresolver.h"

#include <map>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <optional>
#include <chrono>
#include <functional>

#include <sys/types.h>

namespace Pkger {

using SessionHandle = uint64_t;

// ============================================================================
// Event Stream
// ============================================================================

/**
 * EventLog - Ordered event history of one session
 *
 * Shared between the session thread and any number of EventStreams.
 */
class EventLog {
public:
    void append(Event event);
    void close();

    bool closed() const;
    size_t size() const;

    // Event at index, waiting up to timeout for it to arrive
    std::optional<Event> waitFor(size_t index, std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex _mutex;
    mutable std::condition_variable _cv;
    std::vector<Event> _events;
    uint64_t _nextSequence = 1;
    bool _closed = false;
};

/**
 * EventStream - One subscriber's cursor into a session's events
 *
 * A stream starts at the first event of the session, so subscribing after
 * submit() loses nothing. The stream ends after the OUTCOME event.
 */
class EventStream {
public:
    EventStream() = default;
    explicit EventStream(std::shared_ptr<EventLog> log) : _log(std::move(log)) {}

    /**
     * Next event, or nullopt if none arrived within timeout or the stream
     * has ended.
     */
    std::optional<Event> next(std::chrono::milliseconds timeout = std::chrono::milliseconds(100));

    // Events available right now, without waiting
    std::vector<Event> drain();

    // True once every event, including the outcome, has been read
    bool finished() const;

    bool valid() const { return _log != nullptr; }

private:
    std::shared_ptr<EventLog> _log;
    size_t _cursor = 0;
};

// ============================================================================
// Write Lock
// ============================================================================

/**
 * WriteLock - The "an operation is running" flag, with a FIFO of waiters
 */
class WriteLock {
public:
    bool tryAcquire(SessionHandle id);

    // Wait for the lock in arrival order; false if cancelled first
    bool acquire(SessionHandle id, const CancelToken& cancel);

    void release(SessionHandle id);

    std::optional<SessionHandle> holder() const;
    size_t waiting() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::optional<SessionHandle> _holder;
    std::deque<SessionHandle> _queue;
};

// ============================================================================
// Orchestrator
// ============================================================================

class OperationOrchestrator {
public:
    OperationOrchestrator(IProcessRunner& runner,
                          MetadataCache& cache,
                          CredentialBroker& broker,
                          const Configuration& config);

    // Cancels every live session and joins its thread
    ~OperationOrchestrator();

    OperationOrchestrator(const OperationOrchestrator&) = delete;
    OperationOrchestrator& operator=(const OperationOrchestrator&) = delete;

    /**
     * Start a session for a mutating request. Never blocks on another
     * session; the returned handle is always valid.
     */
    SessionHandle submit(const OperationRequest& request);

    // Event stream from the first event of the session; invalid for unknown handles
    EventStream subscribe(SessionHandle handle);

    /**
     * Request cancellation. Immediate while Queued or AwaitingCredential,
     * signal based while Executing.
     *
     * @return false for unknown or already finished sessions
     */
    bool cancel(SessionHandle handle);

    // Block until the session is terminal; false on timeout or unknown handle
    bool wait(SessionHandle handle,
              std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    std::optional<SessionState> state(SessionHandle handle) const;
    std::optional<SessionOutcome> outcome(SessionHandle handle) const;

    // Forget a finished session; false if unknown or still running
    bool release(SessionHandle handle);

    // Answer a CREDENTIAL_REQUEST event
    bool supplyCredential(SessionHandle handle, std::string secret);
    bool denyCredential(SessionHandle handle);

    // Handles of sessions not yet terminal
    std::vector<SessionHandle> activeSessions() const;

    /**
     * Replace the effective uid lookup (geteuid() by default). Elevation
     * is skipped entirely for uid 0. Set before the first submit().
     */
    void setEffectiveUidSource(std::function<uid_t()> source);

private:
    struct Session {
        SessionHandle id = 0;
        OperationRequest request;
        CancelToken cancel;
        std::shared_ptr<EventLog> events = std::make_shared<EventLog>();

        mutable std::mutex mutex;
        std::condition_variable doneCv;
        SessionState state = SessionState::IDLE;
        std::optional<SessionOutcome> outcome;
        bool holdsLock = false;
        bool reachedExecuting = false;

        std::thread worker;
    };

    /**
     * One command of the execution phase
     */
    struct CommandStep {
        CommandSpec spec;
        std::string description;
        bool usesCredential = false;
    };

    std::shared_ptr<Session> find(SessionHandle handle) const;

    void runSession(std::shared_ptr<Session> session);
    SessionOutcome drive(Session& session, Plan& plan, Credential& credential);

    std::vector<CommandStep> buildCommands(const OperationRequest& request,
                                           const Plan& plan,
                                           bool haveCredential) const;
    CommandStep privileged(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& description,
                           bool haveCredential) const;
    CommandStep unprivileged(const std::string& program,
                             const std::vector<std::string>& args,
                             const std::string& description) const;

    bool runningAsRoot() const;
    bool needsCredential(const OperationRequest& request) const;
    OperationResult authenticate(Session& session, Credential& credential);
    void invalidateCache(const OperationRequest& request, const Plan& plan);

    void setState(Session& session, SessionState state);
    void emit(Session& session, Event event);
    void finish(Session& session, SessionOutcome outcome);

    IProcessRunner& _runner;
    MetadataCache& _cache;
    CredentialBroker& _broker;
    Configuration _config;
    DependencyResolver _resolver;
    WriteLock _writeLock;
    std::function<uid_t()> _effectiveUid;

    mutable std::mutex _mutex;
    std::map<SessionHandle, std::shared_ptr<Session>> _sessions;
    SessionHandle _nextHandle = 1;
};

/**
 * Outcome for a failed step result; CANCELLED and CREDENTIAL_DENIED map to
 * a Cancelled outcome, everything else to Failed.
 */
SessionOutcome outcomeFromResult(const OperationResult& result);

} // namespace Pkger

#endif // _OPERATIONORCHESTRATOR_H_

// vim:ts=4:sw=4:et
