/* queryengine.cc - Read-only search and details over cache snapshots
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "queryengine.h"
#include "structuredlog.h"

#include <algorithm>
#include <cctype>

using namespace std;

namespace Pkger {

namespace {

string toLower(const string& s)
{
    string lower = s;
    transform(lower.begin(), lower.end(), lower.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return lower;
}

} // namespace

// ============================================================================
// Sorting
// ============================================================================

vector<PackageRecord> sortRecords(vector<PackageRecord> records, SortKey key, bool descending)
{
    auto tieBreak = [](const PackageRecord& a, const PackageRecord& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.source < b.source;
    };

    auto less = [&](const PackageRecord& a, const PackageRecord& b) {
        switch (key) {
            case SortKey::NAME:
                break;
            case SortKey::REPOSITORY:
                if (a.repository != b.repository) return a.repository < b.repository;
                break;
            case SortKey::SIZE:
                if (a.size != b.size) return a.size < b.size;
                break;
            case SortKey::INSTALLED_SIZE: {
                int64_t sa = a.installedSize.value_or(0);
                int64_t sb = b.installedSize.value_or(0);
                if (sa != sb) return sa < sb;
                break;
            }
        }
        return tieBreak(a, b);
    };

    if (descending) {
        stable_sort(records.begin(), records.end(),
                    [&](const PackageRecord& a, const PackageRecord& b) { return less(b, a); });
    } else {
        stable_sort(records.begin(), records.end(), less);
    }
    return records;
}

// ============================================================================
// SearchResults
// ============================================================================

SearchResults::SearchResults(SnapshotSet snapshots,
                             const vector<PackageSource>& sources,
                             const string& term,
                             const SearchFilters& filters)
    : _snapshots(std::move(snapshots))
    , _term(toLower(term))
    , _filters(filters)
{
    for (PackageSource source : sources) {
        const SnapshotPtr& snap = _snapshots.get(source);
        if (snap) {
            _order.push_back(snap);
            _searchesInstalled = _searchesInstalled || source == PackageSource::INSTALLED;
        }
    }
}

optional<PackageRecord> SearchResults::accept(const PackageRecord& rec) const
{
    if (!_term.empty()) {
        string name = toLower(rec.name);
        if (_filters.exactName) {
            if (name != _term) return nullopt;
        } else {
            bool hit = name.find(_term) != string::npos;
            if (!hit && _filters.searchDescription) {
                hit = toLower(rec.description).find(_term) != string::npos;
            }
            if (!hit) return nullopt;
        }
    }

    if (!_filters.repositories.empty() && !_filters.repositories.count(rec.repository)) {
        return nullopt;
    }

    const PackageRecord* inst = _snapshots.installed ? _snapshots.installed->find(rec.name) : nullptr;

    if (_filters.installedOnly && !inst) {
        return nullopt;
    }
    if (_filters.orphanOnly && (!inst || !inst->isOrphan)) {
        return nullopt;
    }

    optional<PackageRecord> merged;
    if (inst || _filters.outdatedOnly) {
        merged = _snapshots.merged(rec.name);
    }
    if (_filters.outdatedOnly && !(merged && merged->isOutdated)) {
        return nullopt;
    }

    // Only installed packages can be outdated, so the filter yields the
    // merged installed record once, whichever source matched it
    if (_filters.outdatedOnly) {
        if (rec.source != PackageSource::INSTALLED && _searchesInstalled) {
            return nullopt;
        }
        return merged;
    }

    if (rec.source == PackageSource::INSTALLED && merged) {
        return merged;
    }

    PackageRecord out = rec;
    out.availableVersion = rec.version;
    out.isOutdated = false;
    return out;
}

SearchResults::iterator::iterator(const SearchResults* owner)
    : _owner(owner)
{
    advance();
}

SearchResults::iterator& SearchResults::iterator::operator++()
{
    advance();
    return *this;
}

void SearchResults::iterator::advance()
{
    _current.reset();
    if (!_owner) {
        return;
    }

    size_t limit = _owner->_filters.limit;
    if (limit > 0 && _yielded >= limit) {
        _owner = nullptr;
        return;
    }

    while (_sourceIndex < _owner->_order.size()) {
        const auto& records = _owner->_order[_sourceIndex]->records;
        if (!_started) {
            _pos = records.begin();
            _started = true;
        }

        while (_pos != records.end()) {
            const PackageRecord& rec = _pos->second;
            ++_pos;
            if (auto accepted = _owner->accept(rec)) {
                _current = std::move(accepted);
                ++_yielded;
                return;
            }
        }

        ++_sourceIndex;
        _started = false;
    }

    _owner = nullptr;
}

vector<PackageRecord> SearchResults::collect() const
{
    vector<PackageRecord> out;
    for (const auto& rec : *this) {
        out.push_back(rec);
    }
    return out;
}

// ============================================================================
// QueryEngine
// ============================================================================

QueryEngine::QueryEngine(MetadataCache& cache,
                         IProcessRunner& runner,
                         const Configuration& config)
    : _cache(cache)
    , _runner(runner)
    , _config(config)
{
}

SearchResults QueryEngine::search(const string& term,
                                  const vector<PackageSource>& sources,
                                  const SearchFilters& filters)
{
    _cache.scheduleStaleRefreshes();

    LOG(LogLevel::DEBUG)
        .component("Query")
        .operation("search")
        .field("term", term)
        .message("Search over current snapshots")
        .emit();

    return SearchResults(_cache.snapshots(), sources, term, filters);
}

future<vector<PackageRecord>> QueryEngine::searchAsync(const string& term,
                                                       const vector<PackageSource>& sources,
                                                       const SearchFilters& filters)
{
    SearchResults results = search(term, sources, filters);
    return _cache.workerPool().submit([results]() { return results.collect(); });
}

optional<PackageRecord> QueryEngine::details(const string& name)
{
    _cache.scheduleStaleRefreshes();

    SnapshotSet view = _cache.snapshots();
    optional<PackageRecord> rec = view.merged(name);
    if (!rec) {
        return nullopt;
    }

    // Reverse dependencies come from the snapshot the record was taken from
    const SnapshotPtr& snap = view.get(rec->source);
    if (snap) {
        rec->reverseDependencies = computeReverseDependencies(*snap, name);
    }
    return rec;
}

vector<PackageRecord> QueryEngine::listUpdates()
{
    SnapshotSet view = _cache.snapshots();
    vector<PackageRecord> updates;
    for (const auto& [name, installed] : view.installed->records) {
        auto merged = view.merged(name);
        if (merged && merged->isOutdated) {
            updates.push_back(*merged);
        }
    }
    return updates;
}

vector<PackageRecord> QueryEngine::listOrphans()
{
    SnapshotSet view = _cache.snapshots();
    vector<PackageRecord> orphans;
    for (const auto& [name, installed] : view.installed->records) {
        if (installed.isOrphan) {
            auto merged = view.merged(name);
            orphans.push_back(merged ? *merged : installed);
        }
    }
    return orphans;
}

map<string, vector<string>> QueryEngine::listRepositories()
{
    map<string, vector<string>> repos;
    SnapshotPtr official = _cache.snapshot(PackageSource::OFFICIAL);
    for (const auto& [name, rec] : official->records) {
        repos[rec.repository].push_back(name);
    }
    return repos;
}

DependencyTreeResult QueryEngine::dependencyTree(const string& name,
                                                 bool reverse,
                                                 const CancelToken& cancel)
{
    DependencyTreeResult tree;

    if (!isValidPackageName(name)) {
        tree.result = OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            "Invalid package name: " + name);
        return tree;
    }

    CommandSpec spec(_config.pactreePath, {});
    if (reverse) {
        spec.args.push_back("-r");
    }
    spec.args.push_back(name);
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "Query", cancel);
    if (!out.status.ok()) {
        tree.result = resultFromStatus(out.status, "pactree", out.stderrLines);
        return tree;
    }

    tree.nodes = parseDependencyTree(out.stdoutText());
    if (tree.nodes.empty()) {
        tree.result = OperationResult::Failure(ErrorKind::PARSE_ERROR,
            "pactree printed no tree for " + name, out.stdoutText());
        return tree;
    }

    tree.result = OperationResult::Success(
        to_string(tree.nodes.size()) + " nodes");
    return tree;
}

DiscoveryResult QueryEngine::discoverAur(const string& term, const CancelToken& cancel)
{
    DiscoveryResult discovery;

    if (!_config.aurEnabled) {
        discovery.result = OperationResult::Success("AUR support disabled");
        return discovery;
    }
    if (trimString(term).empty()) {
        discovery.result = OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            "AUR search needs a search term");
        return discovery;
    }

    CommandSpec spec(_config.aurHelperPath, {"-Ssa", term});
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "Query", cancel);

    // Exit 1 without output means no hits
    bool noHits = out.status.exited() && out.status.exitCode == 1 && out.stdoutLines.empty();
    if (!out.status.ok() && !noHits) {
        discovery.result = resultFromStatus(out.status,
            _config.aurHelperPath + " -Ssa", out.stderrLines);
        return discovery;
    }

    for (auto& hit : parseSearchResults(out.stdoutText())) {
        if (hit.record.source == PackageSource::AUR) {
            discovery.records.push_back(std::move(hit.record));
        }
    }

    _cache.mergeRecords(PackageSource::AUR, discovery.records);

    LOG(LogLevel::INFO)
        .component("Query")
        .operation("discover")
        .source("AUR")
        .field("term", term)
        .field("hits", to_string(discovery.records.size()))
        .message("AUR search merged into cache")
        .emit();

    discovery.result = OperationResult::Success(
        to_string(discovery.records.size()) + " AUR packages found");
    return discovery;
}

future<DiscoveryResult> QueryEngine::discoverAurAsync(const string& term)
{
    return _cache.workerPool().submit([this, term]() { return discoverAur(term); });
}

set<string> QueryEngine::computeReverseDependencies(const CacheSnapshot& snapshot,
                                                    const string& name)
{
    set<string> dependents;
    for (const auto& [candidate, rec] : snapshot.records) {
        for (const auto& dep : rec.dependencies) {
            if (dependencyName(dep) == name) {
                dependents.insert(candidate);
                break;
            }
        }
    }
    return dependents;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
