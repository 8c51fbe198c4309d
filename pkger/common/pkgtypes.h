/* pkgtypes.h - Core types shared by the PKGER backend
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

/*
 * PKGER Backend Core
 * ==================
 *
 * The presentation layer never talks to pacman/yay/pactree directly. It
 * talks to the backend core, which is layered as:
 *
 *   OperationOrchestrator   (mutating requests, sessions, event streams)
 *       ├── DependencyResolver  (dry-run planning)
 *       ├── CredentialBroker    (elevation secrets)
 *       └── MetadataCache       (per-source immutable snapshots)
 *               └── MetadataSource  (Official / AUR / Installed fetchers)
 *   QueryEngine             (read-only search/details over snapshots)
 *   IProcessRunner          (every external tool invocation)
 *
 * This header holds the value types that flow between those layers.
 */

#ifndef _PKGTYPES_H_
#define _PKGTYPES_H_

#include <string>
#include <vector>
#include <set>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>

namespace Pkger {

// ============================================================================
// Package Sources
// ============================================================================

enum class PackageSource {
    OFFICIAL,
    AUR,
    INSTALLED
};

inline const char* packageSourceToString(PackageSource source) {
    switch (source) {
        case PackageSource::OFFICIAL:  return "Official";
        case PackageSource::AUR:       return "AUR";
        case PackageSource::INSTALLED: return "Installed";
    }
    return "Unknown";
}

// All sources in precedence order for "current state" (Installed first)
inline std::vector<PackageSource> allPackageSources() {
    return { PackageSource::INSTALLED, PackageSource::OFFICIAL, PackageSource::AUR };
}

// ============================================================================
// Package Record
// ============================================================================

enum class InstallReason {
    UNKNOWN,
    EXPLICIT,
    DEPENDENCY
};

/**
 * PackageRecord - One package as reported by one source
 *
 * Records are plain values. The cache hands out copies, so nothing a
 * caller does to a record can reach cache state.
 *
 * Dependency entries keep their version constraint ("glibc>=2.38");
 * use dependencyName() to compare names.
 */
struct PackageRecord {
    // === Identity ===
    std::string name;
    PackageSource source = PackageSource::OFFICIAL;

    // === Versioning ===
    std::string version;
    std::string availableVersion;   // Newest Official/AUR version (merged view)

    // === Description ===
    std::string repository;         // core, extra, multilib, aur, local
    std::string description;
    std::optional<std::string> homepage;
    std::vector<std::string> licenses;

    // === Size Information ===
    int64_t size = 0;                       // Download size in bytes
    std::optional<int64_t> installedSize;   // In bytes

    // === Relations ===
    std::vector<std::string> dependencies;
    std::set<std::string> reverseDependencies;  // Filled by QueryEngine::details
    std::vector<std::string> conflicts;
    std::vector<std::string> provides;

    // === State ===
    InstallReason installReason = InstallReason::UNKNOWN;
    bool isOrphan = false;
    bool isOutdated = false;
    std::chrono::system_clock::time_point lastRefreshed;

    PackageRecord() = default;

    PackageRecord(const std::string& _name,
                  const std::string& _version,
                  PackageSource _source)
        : name(_name), source(_source), version(_version)
    {}

    bool isInstalled() const { return source == PackageSource::INSTALLED; }

    std::string getDisplayVersion() const {
        if (isOutdated && !availableVersion.empty()) {
            return version + " -> " + availableVersion;
        }
        return version;
    }

    // Unique key "name:Source" for deduplication across sources
    std::string getUniqueKey() const {
        return name + ":" + packageSourceToString(source);
    }
};

/**
 * Strip a version constraint or description from a dependency entry:
 *   "glibc>=2.38" -> "glibc", "python: for scripts" -> "python"
 */
std::string dependencyName(const std::string& entry);

// ============================================================================
// Operation Requests
// ============================================================================

enum class OperationKind {
    INSTALL,
    REMOVE,
    REINSTALL,
    UPDATE_ALL,
    UPDATE_SELECTED,
    CACHE_CLEAN,
    ORPHAN_CLEAN,
    INSTALL_LOCAL_FILE,
    SYNC_DATABASES
};

const char* operationKindToString(OperationKind kind);

/**
 * PackageTarget - Identity of a package an operation acts on
 */
struct PackageTarget {
    std::string name;
    PackageSource source = PackageSource::OFFICIAL;

    bool operator<(const PackageTarget& other) const {
        if (name != other.name) return name < other.name;
        return source < other.source;
    }
    bool operator==(const PackageTarget& other) const {
        return name == other.name && source == other.source;
    }
};

/**
 * OperationRequest - What the presentation layer asks the orchestrator to do
 *
 * Use the named constructors; they set requiresElevation the way the
 * corresponding pacman/yay command needs it.
 */
struct OperationRequest {
    OperationKind kind = OperationKind::INSTALL;
    std::set<PackageTarget> targets;
    std::string localFile;              // INSTALL_LOCAL_FILE only
    bool requiresElevation = true;

    static OperationRequest install(const std::set<PackageTarget>& targets);
    static OperationRequest remove(const std::set<std::string>& names);
    static OperationRequest reinstall(const std::set<PackageTarget>& targets);
    static OperationRequest updateAll();
    static OperationRequest updateSelected(const std::set<PackageTarget>& targets);
    static OperationRequest cacheClean();
    static OperationRequest orphanClean();
    static OperationRequest installLocalFile(const std::string& path);
    static OperationRequest syncDatabases();

    bool hasAurTargets() const;
    std::vector<std::string> targetNames() const;
    std::vector<std::string> targetNames(PackageSource source) const;

    // Short description for logs and outcome summaries
    std::string describe() const;
};

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    NONE,
    LAUNCH_ERROR,           // Tool missing or not executable
    EXIT_ERROR,             // Tool ran and failed
    UNRESOLVABLE_CONFLICT,  // Planning found a conflict the tool won't solve
    OPERATION_IN_PROGRESS,  // Another mutating session holds the write lock
    CREDENTIAL_DENIED,      // User declined elevation
    PARSE_ERROR,            // Unexpected tool output shape
    VALIDATION_ERROR,       // Bad request (missing file, unknown target)
    TIMEOUT,
    CANCELLED
};

const char* errorKindToString(ErrorKind kind);

/**
 * OperationResult - Result of any backend step
 *
 * Backend methods do not throw; failures travel back in this structure.
 */
struct OperationResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;                // Human-readable summary
    std::string details;                // Tool lines explaining the failure
    int exitCode = 0;
    std::vector<std::string> outputTail;

    static OperationResult Success(const std::string& msg = "") {
        OperationResult r;
        r.success = true;
        r.message = msg;
        return r;
    }

    static OperationResult Failure(ErrorKind kind,
                                   const std::string& msg,
                                   const std::string& details = "",
                                   int code = 1) {
        OperationResult r;
        r.success = false;
        r.error = kind;
        r.message = msg;
        r.details = details;
        r.exitCode = code;
        return r;
    }
};

// ============================================================================
// Sessions, States and Outcomes
// ============================================================================

enum class SessionState {
    IDLE,
    QUEUED,
    PLANNING,
    AWAITING_CREDENTIAL,
    EXECUTING,
    FINALIZING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* sessionStateToString(SessionState state);

inline bool isTerminalState(SessionState state) {
    return state == SessionState::SUCCEEDED ||
           state == SessionState::FAILED ||
           state == SessionState::CANCELLED;
}

enum class OutcomeKind {
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* outcomeKindToString(OutcomeKind kind);

/**
 * Plan - What a mutating request would change, from the tool's dry run
 */
struct PlannedPackage {
    std::string name;
    std::string version;
};

struct Plan {
    std::vector<PlannedPackage> toInstall;
    std::vector<PlannedPackage> toRemove;
    std::vector<std::string> conflicts;
    std::vector<std::string> warnings;

    bool empty() const { return toInstall.empty() && toRemove.empty(); }

    // Every package name the plan touches
    std::set<std::string> touchedNames() const;
};

/**
 * SessionOutcome - Terminal result of an operation session
 */
struct SessionOutcome {
    OutcomeKind kind = OutcomeKind::FAILED;
    ErrorKind error = ErrorKind::NONE;
    std::string summary;
    std::string details;
    int exitCode = 0;
    std::vector<std::string> outputTail;
    Plan plan;

    bool succeeded() const { return kind == OutcomeKind::SUCCEEDED; }
};

// ============================================================================
// Events
// ============================================================================

enum class EventType {
    STATE_CHANGED,
    PROGRESS,
    LOG,
    CREDENTIAL_REQUEST,
    OUTCOME
};

const char* eventTypeToString(EventType type);

enum class OutputStream {
    NONE,
    STDOUT,
    STDERR
};

/**
 * Event - One item of a session's event stream
 *
 * Sequence numbers start at 1 and increase by one per event of a session.
 */
struct Event {
    EventType type = EventType::LOG;
    uint64_t sessionId = 0;
    uint64_t sequence = 0;
    std::chrono::system_clock::time_point timestamp;

    std::string message;
    OutputStream stream = OutputStream::NONE;
    std::optional<int> percent;         // PROGRESS only
    SessionState state = SessionState::IDLE;    // STATE_CHANGED only
    std::optional<SessionOutcome> outcome;      // OUTCOME only
};

} // namespace Pkger

#endif // _PKGTYPES_H_

// vim:ts=4:sw=4:et
