/* metadatacache.h - Per-source package snapshots with background refresh
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * The cache keeps one immutable CacheSnapshot per PackageSource. A refresh
 * builds a complete new snapshot off to the side and swaps the pointer in
 * under a short lock, so readers always see either the old or the new
 * snapshot and never wait for a tool to finish.
 *
 * Merged identity is a read-time join: the Installed record describes the
 * current state, Official/AUR records supply availableVersion and with it
 * isOutdated.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _METADATACACHE_H_
#define _METADATACACHE_H_

#include "pkgtypes.h"
#include "configuration.h"
#include "metadatasource.h"
#include "processrunner.h"
#include "workerpool.h"

#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace Pkger {

// ============================================================================
// Snapshots
// ============================================================================

/**
 * CacheSnapshot - Immutable name -> record map for one source
 */
struct CacheSnapshot {
    PackageSource source = PackageSource::OFFICIAL;
    uint64_t generation = 0;                        // 0 = never loaded
    std::chrono::system_clock::time_point timestamp;
    std::map<std::string, PackageRecord> records;

    const PackageRecord* find(const std::string& name) const {
        auto it = records.find(name);
        return (it != records.end()) ? &it->second : nullptr;
    }

    size_t size() const { return records.size(); }
    bool loaded() const { return generation != 0; }
};

using SnapshotPtr = std::shared_ptr<const CacheSnapshot>;

/**
 * SnapshotSet - One consistent view across all three sources
 */
struct SnapshotSet {
    SnapshotPtr installed;
    SnapshotPtr official;
    SnapshotPtr aur;

    const SnapshotPtr& get(PackageSource source) const;

    /**
     * Merged record for a name, or nullopt if no source knows it.
     * The Installed record wins; availableVersion is the highest
     * Official/AUR version and isOutdated compares the two.
     */
    std::optional<PackageRecord> merged(const std::string& name) const;
};

// ============================================================================
// Cache
// ============================================================================

struct RefreshResult {
    OperationResult result;
    SnapshotPtr snapshot;       // The current snapshot (old one on failure)
};

class MetadataCache {
public:
    using SourceMap = std::map<PackageSource, std::unique_ptr<MetadataSource>>;

    /**
     * @param sources             One fetcher per source (missing sources stay empty)
     * @param config              Staleness threshold, worker count
     * @param backgroundRefresh   Reads schedule refreshes of stale sources
     */
    MetadataCache(SourceMap sources,
                  const Configuration& config,
                  bool backgroundRefresh = true);

    // Standard pacman/yay sources run through the given runner
    MetadataCache(IProcessRunner& runner, const Configuration& config);

    ~MetadataCache();

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    // === Refresh ===

    /**
     * Fetch the whole source and publish a new snapshot. On failure the
     * previous snapshot stays current and the failure is logged.
     */
    RefreshResult refresh(PackageSource source,
                          const CancelToken& cancel = CancelToken());

    // Refresh every source that is stale (whole or per entry), synchronously
    OperationResult refreshStale(const CancelToken& cancel = CancelToken());

    // Queue a background refresh of the source if none is running
    void scheduleRefresh(PackageSource source);

    // Schedule refreshes for every stale source (no-op without background refresh)
    void scheduleStaleRefreshes();

    // Block until no background refresh is queued or running
    void waitForBackgroundRefreshes();

    // === Invalidation ===

    void invalidate(PackageSource source);
    void invalidate(PackageSource source, const std::set<std::string>& names);
    void invalidateAll();

    /**
     * Add or replace records in a source without a full refresh (AUR
     * search discovery). Publishes a new generation.
     */
    void mergeRecords(PackageSource source, const std::vector<PackageRecord>& records);

    // === Reads (never block on a refresh) ===

    SnapshotPtr snapshot(PackageSource source) const;
    SnapshotSet snapshots() const;

    // Merged record; schedules background refreshes for stale sources
    std::optional<PackageRecord> get(const std::string& name);

    bool isStale(PackageSource source) const;
    std::set<std::string> staleNames(PackageSource source) const;

    WorkerPool& workerPool() { return *_pool; }

private:
    struct SourceState {
        SnapshotPtr snapshot;
        bool invalid = false;                   // Whole source must be refetched
        std::set<std::string> staleNames;       // Entries to re-query
        bool refreshScheduled = false;
        std::unique_ptr<std::mutex> refreshMutex = std::make_unique<std::mutex>();
    };

    RefreshResult refreshNames(PackageSource source, const CancelToken& cancel);
    RefreshResult refreshIfStale(PackageSource source, const CancelToken& cancel);
    bool isStaleLocked(const SourceState& state) const;
    void publish(PackageSource source, std::map<std::string, PackageRecord> records);

    SourceMap _sources;
    Configuration _config;
    bool _backgroundRefresh;

    mutable std::mutex _mutex;
    std::condition_variable _backgroundCv;
    std::map<PackageSource, SourceState> _states;
    uint64_t _lastGeneration = 0;
    size_t _backgroundInFlight = 0;

    CancelToken _shutdown;
    std::unique_ptr<WorkerPool> _pool;
};

} // namespace Pkger

#endif // _METADATACACHE_H_

// vim:ts=4:sw=4:et
