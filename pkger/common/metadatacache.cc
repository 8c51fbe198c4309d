/* metadatacache.cc - Per-source package snapshots with background refresh
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "metadatacache.h"
#include "versioncompare.h"
#include "structuredlog.h"

#include <algorithm>

using namespace std;

namespace Pkger {

// ============================================================================
// SnapshotSet
// ============================================================================

const SnapshotPtr& SnapshotSet::get(PackageSource source) const
{
    switch (source) {
        case PackageSource::INSTALLED: return installed;
        case PackageSource::OFFICIAL:  return official;
        case PackageSource::AUR:       return aur;
    }
    return official;
}

optional<PackageRecord> SnapshotSet::merged(const string& name) const
{
    const PackageRecord* inst = installed ? installed->find(name) : nullptr;
    const PackageRecord* off = official ? official->find(name) : nullptr;
    const PackageRecord* foreign = aur ? aur->find(name) : nullptr;

    if (!inst && !off && !foreign) {
        return nullopt;
    }

    PackageRecord rec = inst ? *inst : (off ? *off : *foreign);

    string available;
    if (off) {
        available = off->version;
    }
    if (foreign && (available.empty() || vercmp(foreign->version, available) > 0)) {
        available = foreign->version;
    }

    rec.availableVersion = available;
    rec.isOutdated = inst && !available.empty() && vercmp(inst->version, available) < 0;

    // pacman -Qi has no download size
    if (inst && rec.size == 0 && off) {
        rec.size = off->size;
    }

    return rec;
}

// ============================================================================
// Construction
// ============================================================================

namespace {

MetadataCache::SourceMap defaultSources(IProcessRunner& runner, const Configuration& config)
{
    MetadataCache::SourceMap sources;
    for (PackageSource source : allPackageSources()) {
        sources[source] = createMetadataSource(source, runner, config);
    }
    return sources;
}

} // namespace

MetadataCache::MetadataCache(SourceMap sources,
                             const Configuration& config,
                             bool backgroundRefresh)
    : _sources(std::move(sources))
    , _config(config)
    , _backgroundRefresh(backgroundRefresh)
{
    for (PackageSource source : allPackageSources()) {
        auto empty = make_shared<CacheSnapshot>();
        empty->source = source;
        _states[source].snapshot = empty;
    }
    _pool = make_unique<WorkerPool>(static_cast<size_t>(max(1, config.workerThreads)));
}

MetadataCache::MetadataCache(IProcessRunner& runner, const Configuration& config)
    : MetadataCache(defaultSources(runner, config), config, true)
{
}

MetadataCache::~MetadataCache()
{
    _shutdown.cancel();
    _pool.reset();
}

// ============================================================================
// Refresh
// ============================================================================

void MetadataCache::publish(PackageSource source, map<string, PackageRecord> records)
{
    auto snap = make_shared<CacheSnapshot>();
    snap->source = source;
    snap->timestamp = chrono::system_clock::now();
    snap->records = std::move(records);

    uint64_t generation;
    {
        lock_guard<mutex> lock(_mutex);
        generation = ++_lastGeneration;
        snap->generation = generation;
        _states[source].snapshot = snap;
    }

    LOG(LogLevel::INFO)
        .component("Cache")
        .source(packageSourceToString(source))
        .field("generation", to_string(generation))
        .field("packages", to_string(snap->size()))
        .message("Published snapshot")
        .emit();
}

RefreshResult MetadataCache::refresh(PackageSource source, const CancelToken& cancel)
{
    auto fetcher = _sources.find(source);
    if (fetcher == _sources.end() || !fetcher->second) {
        return {OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                    string("No metadata source for ") + packageSourceToString(source)),
                snapshot(source)};
    }

    mutex* refreshMutex;
    bool savedInvalid;
    set<string> savedNames;
    {
        lock_guard<mutex> lock(_mutex);
        refreshMutex = _states[source].refreshMutex.get();
    }

    lock_guard<mutex> refreshLock(*refreshMutex);
    {
        // Invalidations arriving while we fetch stay pending
        lock_guard<mutex> lock(_mutex);
        SourceState& state = _states[source];
        savedInvalid = state.invalid;
        savedNames.swap(state.staleNames);
        state.invalid = false;
    }

    ScopedLogTimer timer(LogLevel::INFO, "Cache", "refresh", packageSourceToString(source));

    FetchResult fetch = fetcher->second->fetchAll(cancel);
    if (!fetch.result.success) {
        {
            lock_guard<mutex> lock(_mutex);
            SourceState& state = _states[source];
            state.invalid = state.invalid || savedInvalid;
            state.staleNames.insert(savedNames.begin(), savedNames.end());
        }
        timer.fail(fetch.result.message, errorKindToString(fetch.result.error));

        LOG(LogLevel::WARN)
            .component("Cache")
            .source(packageSourceToString(source))
            .errorCode(errorKindToString(fetch.result.error))
            .output(fetch.result.details)
            .message("Refresh failed, keeping previous snapshot")
            .emit();
        return {fetch.result, snapshot(source)};
    }

    map<string, PackageRecord> records;
    for (auto& rec : fetch.records) {
        // First occurrence wins (repository priority order)
        records.emplace(rec.name, std::move(rec));
    }
    publish(source, std::move(records));

    return {fetch.result, snapshot(source)};
}

RefreshResult MetadataCache::refreshNames(PackageSource source, const CancelToken& cancel)
{
    auto fetcher = _sources.find(source);
    if (fetcher == _sources.end() || !fetcher->second) {
        return {OperationResult::Success(), snapshot(source)};
    }

    mutex* refreshMutex;
    {
        lock_guard<mutex> lock(_mutex);
        refreshMutex = _states[source].refreshMutex.get();
    }
    lock_guard<mutex> refreshLock(*refreshMutex);

    set<string> names;
    {
        lock_guard<mutex> lock(_mutex);
        names.swap(_states[source].staleNames);
    }
    if (names.empty()) {
        return {OperationResult::Success(), snapshot(source)};
    }

    ScopedLogTimer timer(LogLevel::DEBUG, "Cache", "refresh-entries", packageSourceToString(source));

    FetchResult fetch = fetcher->second->fetchNames(
        vector<string>(names.begin(), names.end()), cancel);
    if (!fetch.result.success) {
        {
            lock_guard<mutex> lock(_mutex);
            _states[source].staleNames.insert(names.begin(), names.end());
        }
        timer.fail(fetch.result.message, errorKindToString(fetch.result.error));
        return {fetch.result, snapshot(source)};
    }

    // Patch a copy: drop every re-queried name, then add what still exists
    SnapshotPtr current = snapshot(source);
    map<string, PackageRecord> records = current->records;
    for (const auto& name : names) {
        records.erase(name);
    }
    for (auto& rec : fetch.records) {
        records[rec.name] = std::move(rec);
    }
    publish(source, std::move(records));

    return {fetch.result, snapshot(source)};
}

RefreshResult MetadataCache::refreshIfStale(PackageSource source, const CancelToken& cancel)
{
    bool whole;
    bool entries;
    {
        lock_guard<mutex> lock(_mutex);
        const SourceState& state = _states[source];
        entries = !state.staleNames.empty();
        whole = state.invalid || !state.snapshot->loaded() ||
                (isStaleLocked(state) && !entries);
    }

    if (whole) {
        return refresh(source, cancel);
    }
    if (entries) {
        return refreshNames(source, cancel);
    }
    return {OperationResult::Success(), snapshot(source)};
}

OperationResult MetadataCache::refreshStale(const CancelToken& cancel)
{
    OperationResult overall = OperationResult::Success("Cache up to date");

    for (PackageSource source : allPackageSources()) {
        if (_sources.find(source) == _sources.end() || !isStale(source)) {
            continue;
        }
        RefreshResult r = refreshIfStale(source, cancel);
        if (!r.result.success && overall.success) {
            overall = r.result;
        }
    }
    return overall;
}

void MetadataCache::scheduleRefresh(PackageSource source)
{
    if (_sources.find(source) == _sources.end()) {
        return;
    }

    {
        lock_guard<mutex> lock(_mutex);
        SourceState& state = _states[source];
        if (state.refreshScheduled) {
            return;
        }
        state.refreshScheduled = true;
        ++_backgroundInFlight;
    }

    LOG(LogLevel::DEBUG)
        .component("Cache")
        .source(packageSourceToString(source))
        .message("Background refresh scheduled")
        .emit();

    _pool->submit([this, source]() {
        refreshIfStale(source, _shutdown);

        lock_guard<mutex> lock(_mutex);
        _states[source].refreshScheduled = false;
        --_backgroundInFlight;
        _backgroundCv.notify_all();
    });
}

void MetadataCache::waitForBackgroundRefreshes()
{
    unique_lock<mutex> lock(_mutex);
    _backgroundCv.wait(lock, [this]() { return _backgroundInFlight == 0; });
}

void MetadataCache::scheduleStaleRefreshes()
{
    if (!_backgroundRefresh) {
        return;
    }
    for (PackageSource source : allPackageSources()) {
        if (_sources.find(source) != _sources.end() && isStale(source)) {
            scheduleRefresh(source);
        }
    }
}

// ============================================================================
// Invalidation
// ============================================================================

void MetadataCache::invalidate(PackageSource source)
{
    {
        lock_guard<mutex> lock(_mutex);
        _states[source].invalid = true;
    }
    LOG(LogLevel::DEBUG)
        .component("Cache")
        .source(packageSourceToString(source))
        .message("Source invalidated")
        .emit();
}

void MetadataCache::invalidate(PackageSource source, const set<string>& names)
{
    if (names.empty()) {
        return;
    }
    {
        lock_guard<mutex> lock(_mutex);
        _states[source].staleNames.insert(names.begin(), names.end());
    }
    LOG(LogLevel::DEBUG)
        .component("Cache")
        .source(packageSourceToString(source))
        .field("count", to_string(names.size()))
        .message("Entries invalidated")
        .emit();
}

void MetadataCache::invalidateAll()
{
    for (PackageSource source : allPackageSources()) {
        invalidate(source);
    }
}

void MetadataCache::mergeRecords(PackageSource source, const vector<PackageRecord>& records)
{
    if (records.empty()) {
        return;
    }

    mutex* refreshMutex;
    {
        lock_guard<mutex> lock(_mutex);
        refreshMutex = _states[source].refreshMutex.get();
    }
    lock_guard<mutex> refreshLock(*refreshMutex);

    map<string, PackageRecord> merged = snapshot(source)->records;
    bool changed = false;
    for (const auto& rec : records) {
        auto it = merged.find(rec.name);
        // A same-version entry from a full query carries more detail
        if (it != merged.end() && it->second.version == rec.version) {
            continue;
        }
        merged[rec.name] = rec;
        changed = true;
    }

    if (changed) {
        publish(source, std::move(merged));
    }
}

// ============================================================================
// Reads
// ============================================================================

SnapshotPtr MetadataCache::snapshot(PackageSource source) const
{
    lock_guard<mutex> lock(_mutex);
    return _states.at(source).snapshot;
}

SnapshotSet MetadataCache::snapshots() const
{
    lock_guard<mutex> lock(_mutex);
    SnapshotSet view;
    view.installed = _states.at(PackageSource::INSTALLED).snapshot;
    view.official = _states.at(PackageSource::OFFICIAL).snapshot;
    view.aur = _states.at(PackageSource::AUR).snapshot;
    return view;
}

optional<PackageRecord> MetadataCache::get(const string& name)
{
    scheduleStaleRefreshes();
    return snapshots().merged(name);
}

bool MetadataCache::isStaleLocked(const SourceState& state) const
{
    if (state.invalid || !state.staleNames.empty() || !state.snapshot->loaded()) {
        return true;
    }
    if (_config.stalenessSeconds > 0) {
        auto age = chrono::system_clock::now() - state.snapshot->timestamp;
        return age > chrono::seconds(_config.stalenessSeconds);
    }
    return false;
}

bool MetadataCache::isStale(PackageSource source) const
{
    lock_guard<mutex> lock(_mutex);
    return isStaleLocked(_states.at(source));
}

set<string> MetadataCache::staleNames(PackageSource source) const
{
    lock_guard<mutex> lock(_mutex);
    return _states.at(source).staleNames;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
