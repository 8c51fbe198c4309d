/* pkgtypes.cc - Core types shared by the PKGER backend
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "pkgtypes.h"

#include <sstream>

namespace Pkger {

std::string dependencyName(const std::string& entry)
{
    size_t end = entry.find_first_of("<>=: ");
    std::string name = (end == std::string::npos) ? entry : entry.substr(0, end);
    return name;
}

// ============================================================================
// Enum Strings
// ============================================================================

const char* operationKindToString(OperationKind kind)
{
    switch (kind) {
        case OperationKind::INSTALL:            return "install";
        case OperationKind::REMOVE:             return "remove";
        case OperationKind::REINSTALL:          return "reinstall";
        case OperationKind::UPDATE_ALL:         return "system update";
        case OperationKind::UPDATE_SELECTED:    return "apply updates";
        case OperationKind::CACHE_CLEAN:        return "cache cleaning";
        case OperationKind::ORPHAN_CLEAN:       return "remove orphans";
        case OperationKind::INSTALL_LOCAL_FILE: return "local package installation";
        case OperationKind::SYNC_DATABASES:     return "database sync";
    }
    return "unknown";
}

const char* errorKindToString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NONE:                   return "None";
        case ErrorKind::LAUNCH_ERROR:           return "LaunchError";
        case ErrorKind::EXIT_ERROR:             return "ExitError";
        case ErrorKind::UNRESOLVABLE_CONFLICT:  return "UnresolvableConflict";
        case ErrorKind::OPERATION_IN_PROGRESS:  return "OperationInProgress";
        case ErrorKind::CREDENTIAL_DENIED:      return "CredentialDenied";
        case ErrorKind::PARSE_ERROR:            return "ParseError";
        case ErrorKind::VALIDATION_ERROR:       return "ValidationError";
        case ErrorKind::TIMEOUT:                return "Timeout";
        case ErrorKind::CANCELLED:              return "Cancelled";
    }
    return "Unknown";
}

const char* sessionStateToString(SessionState state)
{
    switch (state) {
        case SessionState::IDLE:                return "Idle";
        case SessionState::QUEUED:              return "Queued";
        case SessionState::PLANNING:            return "Planning";
        case SessionState::AWAITING_CREDENTIAL: return "AwaitingCredential";
        case SessionState::EXECUTING:           return "Executing";
        case SessionState::FINALIZING:          return "Finalizing";
        case SessionState::SUCCEEDED:           return "Succeeded";
        case SessionState::FAILED:              return "Failed";
        case SessionState::CANCELLED:           return "Cancelled";
    }
    return "Unknown";
}

const char* outcomeKindToString(OutcomeKind kind)
{
    switch (kind) {
        case OutcomeKind::SUCCEEDED: return "Succeeded";
        case OutcomeKind::FAILED:    return "Failed";
        case OutcomeKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

const char* eventTypeToString(EventType type)
{
    switch (type) {
        case EventType::STATE_CHANGED:      return "state";
        case EventType::PROGRESS:           return "progress";
        case EventType::LOG:                return "log";
        case EventType::CREDENTIAL_REQUEST: return "credential";
        case EventType::OUTCOME:            return "outcome";
    }
    return "unknown";
}

// ============================================================================
// OperationRequest
// ============================================================================

OperationRequest OperationRequest::install(const std::set<PackageTarget>& targets)
{
    OperationRequest r;
    r.kind = OperationKind::INSTALL;
    r.targets = targets;
    return r;
}

OperationRequest OperationRequest::remove(const std::set<std::string>& names)
{
    OperationRequest r;
    r.kind = OperationKind::REMOVE;
    for (const auto& name : names) {
        r.targets.insert({name, PackageSource::INSTALLED});
    }
    return r;
}

OperationRequest OperationRequest::reinstall(const std::set<PackageTarget>& targets)
{
    OperationRequest r;
    r.kind = OperationKind::REINSTALL;
    r.targets = targets;
    return r;
}

OperationRequest OperationRequest::updateAll()
{
    OperationRequest r;
    r.kind = OperationKind::UPDATE_ALL;
    return r;
}

OperationRequest OperationRequest::updateSelected(const std::set<PackageTarget>& targets)
{
    OperationRequest r;
    r.kind = OperationKind::UPDATE_SELECTED;
    r.targets = targets;
    return r;
}

OperationRequest OperationRequest::cacheClean()
{
    OperationRequest r;
    r.kind = OperationKind::CACHE_CLEAN;
    return r;
}

OperationRequest OperationRequest::orphanClean()
{
    OperationRequest r;
    r.kind = OperationKind::ORPHAN_CLEAN;
    return r;
}

OperationRequest OperationRequest::installLocalFile(const std::string& path)
{
    OperationRequest r;
    r.kind = OperationKind::INSTALL_LOCAL_FILE;
    r.localFile = path;
    return r;
}

OperationRequest OperationRequest::syncDatabases()
{
    OperationRequest r;
    r.kind = OperationKind::SYNC_DATABASES;
    return r;
}

bool OperationRequest::hasAurTargets() const
{
    for (const auto& t : targets) {
        if (t.source == PackageSource::AUR) return true;
    }
    return false;
}

std::vector<std::string> OperationRequest::targetNames() const
{
    std::vector<std::string> names;
    for (const auto& t : targets) {
        names.push_back(t.name);
    }
    return names;
}

std::vector<std::string> OperationRequest::targetNames(PackageSource source) const
{
    std::vector<std::string> names;
    for (const auto& t : targets) {
        if (t.source == source) {
            names.push_back(t.name);
        }
    }
    return names;
}

std::string OperationRequest::describe() const
{
    std::ostringstream ss;
    ss << operationKindToString(kind);
    if (kind == OperationKind::INSTALL_LOCAL_FILE) {
        ss << " (" << localFile << ")";
    } else if (!targets.empty()) {
        ss << " (";
        bool first = true;
        for (const auto& t : targets) {
            if (!first) ss << ", ";
            ss << t.name;
            first = false;
        }
        ss << ")";
    }
    return ss.str();
}

// ============================================================================
// Plan
// ============================================================================

std::set<std::string> Plan::touchedNames() const
{
    std::set<std::string> names;
    for (const auto& p : toInstall) names.insert(p.name);
    for (const auto& p : toRemove) names.insert(p.name);
    return names;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
