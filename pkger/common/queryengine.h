/* queryengine.h - Read-only search and details over cache snapshots
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Queries never go through the orchestrator and never wait for a refresh.
 * They read whatever snapshots are current when the query starts; a
 * SearchResults range keeps those snapshots alive while it is iterated.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _QUERYENGINE_H_
#define _QUERYENGINE_H_

#include "pkgtypes.h"
#include "metadatacache.h"
#include "processrunner.h"
#include "configuration.h"
#include "outputparsers.h"

#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <iterator>
#include <future>

namespace Pkger {

// ============================================================================
// Search Filters and Sorting
// ============================================================================

struct SearchFilters {
    std::set<std::string> repositories;     // Empty = any repository
    bool installedOnly = false;
    bool orphanOnly = false;
    bool outdatedOnly = false;
    bool searchDescription = true;
    bool exactName = false;
    size_t limit = 0;                       // 0 = unlimited
};

enum class SortKey {
    NAME,
    REPOSITORY,
    SIZE,
    INSTALLED_SIZE
};

/**
 * Return the records ordered by key; ties are broken by name, then source.
 */
std::vector<PackageRecord> sortRecords(std::vector<PackageRecord> records,
                                       SortKey key,
                                       bool descending = false);

// ============================================================================
// Lazy Search Results
// ============================================================================

/**
 * SearchResults - Input range that filters snapshot records on the fly
 *
 *   for (const PackageRecord& rec : engine.search("firefox", {OFFICIAL})) ...
 *
 * Installed records come back merged (availableVersion, isOutdated).
 * With outdatedOnly every hit is the merged installed record.
 */
class SearchResults {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PackageRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const PackageRecord*;
        using reference = const PackageRecord&;

        iterator() = default;

        reference operator*() const { return *_current; }
        pointer operator->() const { return &*_current; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const {
            return atEnd() == other.atEnd();
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class SearchResults;
        explicit iterator(const SearchResults* owner);

        bool atEnd() const { return _owner == nullptr; }
        void advance();

        const SearchResults* _owner = nullptr;
        size_t _sourceIndex = 0;
        std::map<std::string, PackageRecord>::const_iterator _pos;
        bool _started = false;
        std::optional<PackageRecord> _current;
        size_t _yielded = 0;
    };

    SearchResults(SnapshotSet snapshots,
                  const std::vector<PackageSource>& sources,
                  const std::string& term,
                  const SearchFilters& filters);

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    // Drain the range into a vector
    std::vector<PackageRecord> collect() const;

private:
    std::optional<PackageRecord> accept(const PackageRecord& rec) const;

    SnapshotSet _snapshots;
    std::vector<SnapshotPtr> _order;
    bool _searchesInstalled = false;
    std::string _term;              // Lower-cased
    SearchFilters _filters;
};

// ============================================================================
// Query Engine
// ============================================================================

struct DependencyTreeResult {
    OperationResult result;
    std::vector<DependencyTreeNode> nodes;
};

struct DiscoveryResult {
    OperationResult result;
    std::vector<PackageRecord> records;
};

class QueryEngine {
public:
    QueryEngine(MetadataCache& cache,
                IProcessRunner& runner,
                const Configuration& config);

    /**
     * Search the current snapshots. An empty term matches everything.
     * Stale sources are refreshed in the background; this call never waits.
     */
    SearchResults search(const std::string& term,
                         const std::vector<PackageSource>& sources = allPackageSources(),
                         const SearchFilters& filters = SearchFilters());

    // Same search collected on the cache's worker pool
    std::future<std::vector<PackageRecord>> searchAsync(
        const std::string& term,
        const std::vector<PackageSource>& sources = allPackageSources(),
        const SearchFilters& filters = SearchFilters());

    /**
     * Merged record with reverse dependencies filled in, or nullopt if no
     * source knows the name.
     */
    std::optional<PackageRecord> details(const std::string& name);

    // Installed packages with a newer Official/AUR version, by name
    std::vector<PackageRecord> listUpdates();

    // Installed dependency packages nothing requires, by name
    std::vector<PackageRecord> listOrphans();

    // Repository -> package names from the Official snapshot
    std::map<std::string, std::vector<std::string>> listRepositories();

    // pactree [-r] <name>
    DependencyTreeResult dependencyTree(const std::string& name,
                                        bool reverse = false,
                                        const CancelToken& cancel = CancelToken());

    /**
     * Search the AUR through the helper (yay -Ssa) and merge the hits into
     * the AUR snapshot so later searches see them.
     */
    DiscoveryResult discoverAur(const std::string& term,
                                const CancelToken& cancel = CancelToken());

    std::future<DiscoveryResult> discoverAurAsync(const std::string& term);

    /**
     * Names in the snapshot whose dependency lists mention name (version
     * constraints ignored).
     */
    static std::set<std::string> computeReverseDependencies(const CacheSnapshot& snapshot,
                                                            const std::string& name);

private:
    MetadataCache& _cache;
    IProcessRunner& _runner;
    Configuration _config;
};

} // namespace Pkger

#endif // _QUERYENGINE_H_

// vim:ts=4:sw=4:et
