/* operationorchestrator.cc - Sessions for mutating package operations
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "operationorchestrator.h"
#include "outputparsers.h"
#include "structuredlog.h"

#include <algorithm>

#include <unistd.h>

using namespace std;

namespace Pkger {

// ============================================================================
// EventLog / EventStream
// ============================================================================

void EventLog::append(Event event)
{
    {
        lock_guard<mutex> lock(_mutex);
        if (_closed) {
            return;
        }
        event.sequence = _nextSequence++;
        if (event.timestamp == chrono::system_clock::time_point()) {
            event.timestamp = chrono::system_clock::now();
        }
        bool last = event.type == EventType::OUTCOME;
        _events.push_back(std::move(event));
        if (last) {
            _closed = true;
        }
    }
    _cv.notify_all();
}

void EventLog::close()
{
    {
        lock_guard<mutex> lock(_mutex);
        _closed = true;
    }
    _cv.notify_all();
}

bool EventLog::closed() const
{
    lock_guard<mutex> lock(_mutex);
    return _closed;
}

size_t EventLog::size() const
{
    lock_guard<mutex> lock(_mutex);
    return _events.size();
}

optional<Event> EventLog::waitFor(size_t index, chrono::milliseconds timeout) const
{
    unique_lock<mutex> lock(_mutex);
    _cv.wait_for(lock, timeout, [&]() { return index < _events.size() || _closed; });
    if (index < _events.size()) {
        return _events[index];
    }
    return nullopt;
}

optional<Event> EventStream::next(chrono::milliseconds timeout)
{
    if (!_log) {
        return nullopt;
    }
    optional<Event> event = _log->waitFor(_cursor, timeout);
    if (event) {
        ++_cursor;
    }
    return event;
}

vector<Event> EventStream::drain()
{
    vector<Event> events;
    while (auto event = next(chrono::milliseconds(0))) {
        events.push_back(std::move(*event));
    }
    return events;
}

bool EventStream::finished() const
{
    return !_log || (_log->closed() && _cursor >= _log->size());
}

// ============================================================================
// WriteLock
// ============================================================================

bool WriteLock::tryAcquire(SessionHandle id)
{
    lock_guard<mutex> lock(_mutex);
    if (_holder || !_queue.empty()) {
        return false;
    }
    _holder = id;
    return true;
}

bool WriteLock::acquire(SessionHandle id, const CancelToken& cancel)
{
    unique_lock<mutex> lock(_mutex);
    _queue.push_back(id);

    while (true) {
        if (cancel.isCancelled()) {
            _queue.erase(find(_queue.begin(), _queue.end(), id));
            _cv.notify_all();
            return false;
        }
        if (!_holder && _queue.front() == id) {
            _queue.pop_front();
            _holder = id;
            return true;
        }
        // Wake periodically to notice cancellation
        _cv.wait_for(lock, chrono::milliseconds(100));
    }
}

void WriteLock::release(SessionHandle id)
{
    {
        lock_guard<mutex> lock(_mutex);
        if (_holder != id) {
            return;
        }
        _holder.reset();
    }
    _cv.notify_all();
}

optional<SessionHandle> WriteLock::holder() const
{
    lock_guard<mutex> lock(_mutex);
    return _holder;
}

size_t WriteLock::waiting() const
{
    lock_guard<mutex> lock(_mutex);
    return _queue.size();
}

// ============================================================================
// Outcomes
// ============================================================================

SessionOutcome outcomeFromResult(const OperationResult& result)
{
    SessionOutcome outcome;
    if (result.success) {
        outcome.kind = OutcomeKind::SUCCEEDED;
    } else if (result.error == ErrorKind::CANCELLED ||
               result.error == ErrorKind::CREDENTIAL_DENIED) {
        outcome.kind = OutcomeKind::CANCELLED;
    } else {
        outcome.kind = OutcomeKind::FAILED;
    }
    outcome.error = result.error;
    outcome.summary = result.message;
    outcome.details = result.details;
    outcome.exitCode = result.exitCode;
    outcome.outputTail = result.outputTail;
    return outcome;
}

// ============================================================================
// Orchestrator
// ============================================================================

OperationOrchestrator::OperationOrchestrator(IProcessRunner& runner,
                                             MetadataCache& cache,
                                             CredentialBroker& broker,
                                             const Configuration& config)
    : _runner(runner)
    , _cache(cache)
    , _broker(broker)
    , _config(config)
    , _resolver(runner, cache, config)
    , _effectiveUid([]() { return geteuid(); })
{
}

OperationOrchestrator::~OperationOrchestrator()
{
    vector<shared_ptr<Session>> sessions;
    {
        lock_guard<mutex> lock(_mutex);
        for (auto& [id, session] : _sessions) {
            sessions.push_back(session);
        }
    }

    for (auto& session : sessions) {
        session->cancel.cancel();
        _broker.abort(session->id);
    }

    for (auto& session : sessions) {
        thread worker;
        {
            lock_guard<mutex> lock(session->mutex);
            worker = std::move(session->worker);
        }
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void OperationOrchestrator::setEffectiveUidSource(function<uid_t()> source)
{
    _effectiveUid = std::move(source);
}

shared_ptr<OperationOrchestrator::Session> OperationOrchestrator::find(SessionHandle handle) const
{
    lock_guard<mutex> lock(_mutex);
    auto it = _sessions.find(handle);
    return (it != _sessions.end()) ? it->second : nullptr;
}

SessionHandle OperationOrchestrator::submit(const OperationRequest& request)
{
    auto session = make_shared<Session>();
    session->request = request;
    {
        lock_guard<mutex> lock(_mutex);
        session->id = _nextHandle++;
        _sessions[session->id] = session;
    }

    LOG(LogLevel::INFO)
        .component("Orchestrator")
        .operation(operationKindToString(request.kind))
        .session(session->id)
        .message("Submitted " + request.describe())
        .emit();

    if (_config.mutationPolicy == MutationPolicy::REJECT) {
        if (!_writeLock.tryAcquire(session->id)) {
            SessionOutcome rejected;
            rejected.kind = OutcomeKind::FAILED;
            rejected.error = ErrorKind::OPERATION_IN_PROGRESS;
            rejected.summary = "Another package operation is in progress";
            finish(*session, std::move(rejected));
            return session->id;
        }
        session->holdsLock = true;
    }

    lock_guard<mutex> lock(session->mutex);
    session->worker = thread(&OperationOrchestrator::runSession, this, session);
    return session->id;
}

EventStream OperationOrchestrator::subscribe(SessionHandle handle)
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return EventStream();
    }
    return EventStream(session->events);
}

bool OperationOrchestrator::cancel(SessionHandle handle)
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return false;
    }
    {
        lock_guard<mutex> lock(session->mutex);
        if (isTerminalState(session->state)) {
            return false;
        }
    }

    LOG(LogLevel::INFO)
        .component("Orchestrator")
        .session(handle)
        .message("Cancellation requested")
        .emit();

    session->cancel.cancel();
    _broker.abort(handle);
    return true;
}

bool OperationOrchestrator::wait(SessionHandle handle, chrono::milliseconds timeout)
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return false;
    }

    unique_lock<mutex> lock(session->mutex);
    auto done = [&]() { return isTerminalState(session->state); };
    if (timeout == chrono::milliseconds::max()) {
        session->doneCv.wait(lock, done);
        return true;
    }
    return session->doneCv.wait_for(lock, timeout, done);
}

optional<SessionState> OperationOrchestrator::state(SessionHandle handle) const
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return nullopt;
    }
    lock_guard<mutex> lock(session->mutex);
    return session->state;
}

optional<SessionOutcome> OperationOrchestrator::outcome(SessionHandle handle) const
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return nullopt;
    }
    lock_guard<mutex> lock(session->mutex);
    return session->outcome;
}

bool OperationOrchestrator::release(SessionHandle handle)
{
    shared_ptr<Session> session = find(handle);
    if (!session) {
        return false;
    }

    thread worker;
    {
        lock_guard<mutex> lock(session->mutex);
        if (!isTerminalState(session->state)) {
            return false;
        }
        worker = std::move(session->worker);
    }
    if (worker.joinable()) {
        worker.join();
    }

    lock_guard<mutex> lock(_mutex);
    _sessions.erase(handle);
    return true;
}

bool OperationOrchestrator::supplyCredential(SessionHandle handle, string secret)
{
    return _broker.supply(handle, std::move(secret));
}

bool OperationOrchestrator::denyCredential(SessionHandle handle)
{
    return _broker.deny(handle);
}

vector<SessionHandle> OperationOrchestrator::activeSessions() const
{
    vector<shared_ptr<Session>> sessions;
    {
        lock_guard<mutex> lock(_mutex);
        for (const auto& [id, session] : _sessions) {
            sessions.push_back(session);
        }
    }

    vector<SessionHandle> active;
    for (const auto& session : sessions) {
        lock_guard<mutex> lock(session->mutex);
        if (!isTerminalState(session->state)) {
            active.push_back(session->id);
        }
    }
    return active;
}

// ============================================================================
// Session Thread
// ============================================================================

void OperationOrchestrator::runSession(shared_ptr<Session> session)
{
    Session& s = *session;

    if (!s.holdsLock) {
        setState(s, SessionState::QUEUED);
        if (!_writeLock.acquire(s.id, s.cancel)) {
            SessionOutcome cancelled;
            cancelled.kind = OutcomeKind::CANCELLED;
            cancelled.error = ErrorKind::CANCELLED;
            cancelled.summary = "Cancelled while waiting for another operation";
            finish(s, std::move(cancelled));
            return;
        }
        lock_guard<mutex> lock(s.mutex);
        s.holdsLock = true;
    }

    ScopedLogTimer timer(LogLevel::INFO, "Orchestrator",
                         operationKindToString(s.request.kind));

    Plan plan;
    Credential credential;
    SessionOutcome result;
    {
        ScopedCredential guard(credential);
        try {
            result = drive(s, plan, credential);
        } catch (const exception& e) {
            LOG(LogLevel::ERROR)
                .component("Orchestrator")
                .session(s.id)
                .message(string("Session aborted: ") + e.what())
                .emit();
            result.kind = OutcomeKind::FAILED;
            result.error = ErrorKind::EXIT_ERROR;
            result.summary = string("Internal error: ") + e.what();
            result.plan = plan;
        }

        bool executed;
        {
            lock_guard<mutex> lock(s.mutex);
            executed = s.reachedExecuting;
        }
        if (executed) {
            setState(s, SessionState::FINALIZING);
            credential.release();
            invalidateCache(s.request, plan);
        }
    }

    if (!result.succeeded()) {
        timer.fail(result.summary, errorKindToString(result.error));
    }

    _writeLock.release(s.id);
    finish(s, std::move(result));
}

SessionOutcome OperationOrchestrator::drive(Session& s, Plan& plan, Credential& credential)
{
    const OperationRequest& request = s.request;

    // === Planning ===
    setState(s, SessionState::PLANNING);

    OperationResult valid = _resolver.validate(request);
    if (!valid.success) {
        return outcomeFromResult(valid);
    }

    PlanResult planned = _resolver.plan(request, s.cancel);
    plan = planned.plan;

    for (const auto& warning : plan.warnings) {
        Event event;
        event.type = EventType::LOG;
        event.message = warning;
        emit(s, std::move(event));
    }

    if (!planned.result.success) {
        SessionOutcome failed = outcomeFromResult(planned.result);
        failed.plan = plan;
        return failed;
    }

    {
        Event event;
        event.type = EventType::LOG;
        event.message = "Plan: " + to_string(plan.toInstall.size()) + " to install, " +
                        to_string(plan.toRemove.size()) + " to remove";
        emit(s, std::move(event));
    }

    if (request.kind == OperationKind::ORPHAN_CLEAN && plan.toRemove.empty()) {
        SessionOutcome nothing = outcomeFromResult(
            OperationResult::Success("No orphan packages to remove"));
        nothing.plan = plan;
        return nothing;
    }

    if (s.cancel.isCancelled()) {
        SessionOutcome cancelled = outcomeFromResult(
            OperationResult::Failure(ErrorKind::CANCELLED, "Operation cancelled"));
        cancelled.plan = plan;
        return cancelled;
    }

    // === Elevation ===
    bool haveCredential = false;
    if (needsCredential(request)) {
        setState(s, SessionState::AWAITING_CREDENTIAL);

        OperationResult auth = authenticate(s, credential);
        if (!auth.success) {
            SessionOutcome stopped = outcomeFromResult(auth);
            stopped.plan = plan;
            return stopped;
        }
        haveCredential = true;
    }

    // === Executing ===
    vector<CommandStep> steps = buildCommands(request, plan, haveCredential);

    size_t lastCredentialStep = steps.size();
    for (size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].usesCredential) {
            lastCredentialStep = i;
        }
    }

    {
        lock_guard<mutex> lock(s.mutex);
        s.reachedExecuting = true;
    }
    setState(s, SessionState::EXECUTING);

    OutputTail tail(static_cast<size_t>(max(_config.outputTailLines, 1)));

    for (size_t i = 0; i < steps.size(); ++i) {
        CommandStep& step = steps[i];
        if (step.usesCredential) {
            step.spec.input = credential.reveal();
            if (i == lastCredentialStep) {
                step.spec.onInputWritten = [&credential]() { credential.release(); };
            }
        }

        LOG(LogLevel::INFO)
            .component("Orchestrator")
            .session(s.id)
            .operation(step.description)
            .message("Running " + step.spec.toString())
            .emit();

        ExitStatus status = _runner.run(step.spec,
            [&](OutputStream stream, const string& line) {
                tail.add(line);
                LineClass cls = classifyOutputLine(line);

                Event event;
                event.type = cls.isProgress ? EventType::PROGRESS : EventType::LOG;
                event.message = line;
                event.stream = stream;
                event.percent = cls.percent;
                emit(s, std::move(event));
            },
            s.cancel);

        if (!status.ok()) {
            SessionOutcome failed = outcomeFromResult(
                resultFromStatus(status, step.description, tail.lines()));
            failed.plan = plan;
            return failed;
        }
    }

    SessionOutcome done;
    done.kind = OutcomeKind::SUCCEEDED;
    done.summary = request.describe() + " completed successfully";
    done.outputTail = tail.lines();
    done.plan = plan;
    return done;
}

// ============================================================================
// Command Construction
// ============================================================================

bool OperationOrchestrator::runningAsRoot() const
{
    return _effectiveUid && _effectiveUid() == 0;
}

bool OperationOrchestrator::needsCredential(const OperationRequest& request) const
{
    return request.requiresElevation &&
           _config.elevation == ElevationMode::SUDO &&
           !runningAsRoot();
}

/**
 * Ask for the password and check it with "sudo -k -S -v" before anything
 * runs. A rejected password is asked again up to credentialAttempts times;
 * running out of attempts ends the session as CREDENTIAL_DENIED.
 */
OperationResult OperationOrchestrator::authenticate(Session& s, Credential& credential)
{
    const int attempts = max(_config.credentialAttempts, 1);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        string prompt = "Authentication is required to " + s.request.describe();
        if (attempt > 1) {
            prompt = "Authentication failed, try again (" + to_string(attempt) + "/" +
                     to_string(attempts) + "). " + prompt;
        }

        CredentialBroker::AcquireResult acquired = _broker.acquire(
            s.id, prompt, s.cancel, [&]() {
                Event event;
                event.type = EventType::CREDENTIAL_REQUEST;
                event.message = prompt;
                emit(s, std::move(event));
            });
        if (!acquired.result.success) {
            return acquired.result;
        }
        credential = std::move(acquired.credential);

        // -k ignores a cached timestamp so the password is always checked
        CommandSpec check(_config.sudoPath, {"-k", "-S", "-p", "", "-v"});
        check.input = credential.reveal();
        check.timeoutSeconds = _config.queryTimeoutSeconds;
        check.graceMs = _config.cancelGraceMs;

        ExitStatus status = _runner.run(check, nullptr, s.cancel);
        if (status.ok()) {
            LOG(LogLevel::INFO)
                .component("Credentials")
                .session(s.id)
                .message("Credential accepted")
                .emit();
            return OperationResult::Success();
        }

        credential.release();

        if (status.kind == ExitStatus::Kind::CANCELLED || s.cancel.isCancelled()) {
            return OperationResult::Failure(ErrorKind::CANCELLED, "Operation cancelled");
        }
        if (!status.exited()) {
            return resultFromStatus(status, "sudo -v", {});
        }

        LOG(LogLevel::WARN)
            .component("Credentials")
            .session(s.id)
            .field("attempt", to_string(attempt))
            .message("Credential rejected by sudo")
            .emit();

        Event event;
        event.type = EventType::LOG;
        event.message = "Authentication failed";
        emit(s, std::move(event));
    }

    return OperationResult::Failure(ErrorKind::CREDENTIAL_DENIED,
        "Authentication failed after " + to_string(attempts) + " attempts");
}

OperationOrchestrator::CommandStep OperationOrchestrator::privileged(
    const string& program,
    const vector<string>& args,
    const string& description,
    bool haveCredential) const
{
    CommandStep step;
    step.description = description;

    if (runningAsRoot() || _config.elevation == ElevationMode::NONE) {
        step.spec = CommandSpec(program, args);
    } else if (_config.elevation == ElevationMode::PKEXEC) {
        step.spec = CommandSpec(_config.pkexecPath, {program});
        step.spec.args.insert(step.spec.args.end(), args.begin(), args.end());
    } else if (haveCredential) {
        // Password on stdin, always read (-k), no prompt text in the output
        step.spec = CommandSpec(_config.sudoPath, {"-k", "-S", "-p", "", program});
        step.spec.args.insert(step.spec.args.end(), args.begin(), args.end());
        step.usesCredential = true;
    } else {
        step.spec = CommandSpec(_config.sudoPath, {"-n", program});
        step.spec.args.insert(step.spec.args.end(), args.begin(), args.end());
    }

    step.spec.timeoutSeconds = _config.operationTimeoutSeconds;
    step.spec.graceMs = _config.cancelGraceMs;
    return step;
}

OperationOrchestrator::CommandStep OperationOrchestrator::unprivileged(
    const string& program,
    const vector<string>& args,
    const string& description) const
{
    CommandStep step;
    step.description = description;
    step.spec = CommandSpec(program, args);
    step.spec.timeoutSeconds = _config.operationTimeoutSeconds;
    step.spec.graceMs = _config.cancelGraceMs;
    return step;
}

vector<OperationOrchestrator::CommandStep> OperationOrchestrator::buildCommands(
    const OperationRequest& request,
    const Plan& plan,
    bool haveCredential) const
{
    vector<CommandStep> steps;
    const string& pacman = _config.pacmanPath;
    const string& helper = _config.aurHelperPath;

    auto withNames = [](vector<string> args, const vector<string>& names) {
        args.insert(args.end(), names.begin(), names.end());
        return args;
    };

    // The helper runs unprivileged and calls sudo itself. Its first sudo
    // reads the password from the helper's stdin; --sudoloop makes that
    // happen up front and keeps the timestamp, which sudo ties to the
    // helper's pid when there is no tty, valid for the later calls.
    auto helperSteps = [&](vector<string> args, const string& description) {
        bool feedSecret = false;
        if (!runningAsRoot() && _config.elevation == ElevationMode::SUDO && haveCredential) {
            args.insert(args.begin(), {"--sudoflags=-S", "--sudoloop"});
            feedSecret = true;
        } else if (!runningAsRoot() && _config.elevation == ElevationMode::PKEXEC) {
            args.insert(args.begin(), {"--sudo", _config.pkexecPath});
        }
        CommandStep step = unprivileged(helper, args, description);
        step.usesCredential = feedSecret;
        steps.push_back(std::move(step));
    };

    TargetSplit split = _resolver.splitTargets(request);

    switch (request.kind) {
        case OperationKind::INSTALL:
            if (!split.official.empty()) {
                steps.push_back(privileged(pacman,
                    withNames({"-S", "--needed", "--noconfirm"}, split.official),
                    "pacman -S", haveCredential));
            }
            if (!split.aur.empty()) {
                helperSteps(withNames({"-S", "--aur", "--noconfirm"}, split.aur),
                            helper + " -S");
            }
            break;

        case OperationKind::REINSTALL:
        case OperationKind::UPDATE_SELECTED:
            if (!split.official.empty()) {
                steps.push_back(privileged(pacman,
                    withNames({"-S", "--noconfirm"}, split.official),
                    "pacman -S", haveCredential));
            }
            if (!split.aur.empty()) {
                helperSteps(withNames({"-S", "--aur", "--noconfirm"}, split.aur),
                            helper + " -S");
            }
            break;

        case OperationKind::REMOVE:
            steps.push_back(privileged(pacman,
                withNames({"-R", "--noconfirm"}, request.targetNames()),
                "pacman -R", haveCredential));
            break;

        case OperationKind::UPDATE_ALL:
            if (_config.aurEnabled && _config.aurUpdates) {
                helperSteps({"-Syu", "--noconfirm"}, helper + " -Syu");
            } else {
                steps.push_back(privileged(pacman, {"-Syu", "--noconfirm"},
                    "pacman -Syu", haveCredential));
            }
            break;

        case OperationKind::CACHE_CLEAN:
            steps.push_back(privileged(pacman, {"-Sc", "--noconfirm"},
                "pacman -Sc", haveCredential));
            break;

        case OperationKind::ORPHAN_CLEAN: {
            vector<string> orphans;
            for (const auto& p : plan.toRemove) {
                orphans.push_back(p.name);
            }
            steps.push_back(privileged(pacman,
                withNames({"-Rns", "--noconfirm"}, orphans),
                "pacman -Rns", haveCredential));
            break;
        }

        case OperationKind::INSTALL_LOCAL_FILE:
            steps.push_back(privileged(pacman, {"-U", "--noconfirm", request.localFile},
                "pacman -U", haveCredential));
            break;

        case OperationKind::SYNC_DATABASES:
            steps.push_back(privileged(pacman, {"-Syy"}, "pacman -Syy", haveCredential));
            break;
    }

    return steps;
}

// ============================================================================
// Finalizing
// ============================================================================

void OperationOrchestrator::invalidateCache(const OperationRequest& request, const Plan& plan)
{
    vector<PackageSource> refreshed;

    switch (request.kind) {
        case OperationKind::UPDATE_ALL:
            _cache.invalidateAll();
            refreshed = allPackageSources();
            break;

        case OperationKind::SYNC_DATABASES:
            _cache.invalidate(PackageSource::OFFICIAL);
            refreshed = {PackageSource::OFFICIAL};
            break;

        case OperationKind::CACHE_CLEAN:
            break;

        default: {
            set<string> names = plan.touchedNames();
            for (const auto& name : request.targetNames()) {
                names.insert(name);
            }

            // Install reasons, "Required By" and orphan status change on
            // packages outside the plan as well
            _cache.invalidate(PackageSource::INSTALLED);
            _cache.invalidate(PackageSource::OFFICIAL, names);
            _cache.invalidate(PackageSource::AUR, names);
            refreshed = allPackageSources();
            break;
        }
    }

    for (PackageSource source : refreshed) {
        _cache.scheduleRefresh(source);
    }

    LOG(LogLevel::DEBUG)
        .component("Orchestrator")
        .operation(operationKindToString(request.kind))
        .field("sources", to_string(refreshed.size()))
        .message("Cache invalidated after operation")
        .emit();
}

// ============================================================================
// State and Events
// ============================================================================

void OperationOrchestrator::setState(Session& s, SessionState state)
{
    {
        lock_guard<mutex> lock(s.mutex);
        s.state = state;
    }

    LOG(LogLevel::DEBUG)
        .component("Orchestrator")
        .session(s.id)
        .field("state", sessionStateToString(state))
        .message("Session state changed")
        .emit();

    Event event;
    event.type = EventType::STATE_CHANGED;
    event.state = state;
    event.message = sessionStateToString(state);
    emit(s, std::move(event));
}

void OperationOrchestrator::emit(Session& s, Event event)
{
    event.sessionId = s.id;
    s.events->append(std::move(event));
}

void OperationOrchestrator::finish(Session& s, SessionOutcome outcome)
{
    SessionState terminal = SessionState::FAILED;
    switch (outcome.kind) {
        case OutcomeKind::SUCCEEDED: terminal = SessionState::SUCCEEDED; break;
        case OutcomeKind::FAILED:    terminal = SessionState::FAILED;    break;
        case OutcomeKind::CANCELLED: terminal = SessionState::CANCELLED; break;
    }

    LOG(outcome.succeeded() ? LogLevel::INFO : LogLevel::WARN)
        .component("Orchestrator")
        .operation(operationKindToString(s.request.kind))
        .session(s.id)
        .errorCode(errorKindToString(outcome.error))
        .exitCode(outcome.exitCode)
        .message(outcome.summary)
        .emit();

    {
        Event event;
        event.type = EventType::STATE_CHANGED;
        event.state = terminal;
        event.message = sessionStateToString(terminal);
        emit(s, std::move(event));
    }
    {
        Event event;
        event.type = EventType::OUTCOME;
        event.message = outcome.summary;
        event.outcome = outcome;
        emit(s, std::move(event));
    }

    {
        lock_guard<mutex> lock(s.mutex);
        s.outcome = std::move(outcome);
        s.state = terminal;
    }
    s.doneCv.notify_all();
}

} // namespace Pkger

// vim:ts=4:sw=4:et
