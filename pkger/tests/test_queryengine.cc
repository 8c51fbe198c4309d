/* test_queryengine.cc - Tests for search, details and tool-backed queries
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "pkgertest.h"
#include "queryengine.h"

#include <algorithm>
#include <set>

using namespace std;
using namespace Pkger;
using namespace PkgerTest;

namespace {

Configuration testConfig()
{
    Configuration config;
    config.stalenessSeconds = 0;
    config.workerThreads = 1;
    return config;
}

/**
 * A small system: firefox installed but outdated, an orphaned libnotify,
 * an up-to-date vim and a foreign AUR package.
 */
struct Fixture {
    Configuration config = testConfig();
    ScriptedRunner runner;
    unique_ptr<MetadataCache> cache;
    unique_ptr<QueryEngine> engine;

    Fixture()
    {
        FakeSources fakes;

        PackageRecord firefox = record("firefox", "128.0-1", PackageSource::INSTALLED);
        firefox.description = "Fast, Private & Safe Web Browser";
        firefox.dependencies = {"dbus-glib", "gtk3>=3.24", "nss"};
        firefox.installReason = InstallReason::EXPLICIT;

        PackageRecord libnotify = record("libnotify", "0.8.3-1", PackageSource::INSTALLED);
        libnotify.installReason = InstallReason::DEPENDENCY;
        libnotify.isOrphan = true;

        PackageRecord nss = record("nss", "3.102-1", PackageSource::INSTALLED);
        nss.installReason = InstallReason::DEPENDENCY;
        nss.installedSize = 8 * 1024 * 1024;

        PackageRecord vim = record("vim", "9.1-1", PackageSource::INSTALLED);
        vim.installReason = InstallReason::EXPLICIT;
        vim.installedSize = 4 * 1024 * 1024;

        PackageRecord yay = record("yay-bin", "12.3.4-1", PackageSource::INSTALLED);
        yay.installReason = InstallReason::EXPLICIT;

        fakes.installed->replaceAll({firefox, libnotify, nss, vim, yay});

        PackageRecord firefoxSync = record("firefox", "129.0-1", PackageSource::OFFICIAL);
        firefoxSync.description = "Fast, Private & Safe Web Browser";
        firefoxSync.dependencies = firefox.dependencies;
        firefoxSync.size = 70 * 1024 * 1024;

        PackageRecord thunderbird = record("thunderbird", "128.0-1", PackageSource::OFFICIAL);
        thunderbird.description = "Standalone mail and news reader from mozilla.org";
        thunderbird.dependencies = {"nss>=3.100"};
        thunderbird.size = 60 * 1024 * 1024;

        PackageRecord linux = record("linux", "6.10.0-1", PackageSource::OFFICIAL, "core");
        linux.size = 140 * 1024 * 1024;

        fakes.official->replaceAll({
            firefoxSync,
            thunderbird,
            linux,
            record("nss", "3.102-1", PackageSource::OFFICIAL),
            record("vim", "9.1-1", PackageSource::OFFICIAL),
            record("libnotify", "0.8.3-1", PackageSource::OFFICIAL),
        });

        PackageRecord nightly = record("firefox-nightly", "131.0a1-1", PackageSource::AUR);
        nightly.description = "Nightly build of firefox";
        fakes.aur->replaceAll({nightly, record("yay-bin", "12.3.5-1", PackageSource::AUR)});

        cache = make_unique<MetadataCache>(std::move(fakes.map), config, false);
        cache->refreshStale();
        engine = make_unique<QueryEngine>(*cache, runner, config);
    }
};

vector<string> names(const vector<PackageRecord>& records)
{
    vector<string> out;
    for (const auto& rec : records) {
        out.push_back(rec.name + ":" + packageSourceToString(rec.source));
    }
    return out;
}

bool contains(const vector<string>& list, const string& item)
{
    return find(list.begin(), list.end(), item) != list.end();
}

} // namespace

// ============================================================================
// Search
// ============================================================================

TEST(search_spans_all_sources)
{
    Fixture f;
    vector<PackageRecord> hits = f.engine->search("firefox").collect();
    vector<string> found = names(hits);

    ASSERT_EQ(hits.size(), 3u);
    ASSERT_TRUE(contains(found, "firefox:Installed"));
    ASSERT_TRUE(contains(found, "firefox:Official"));
    ASSERT_TRUE(contains(found, "firefox-nightly:AUR"));

    // Installed first, and merged
    ASSERT_EQ(found[0], "firefox:Installed");
    ASSERT_TRUE(hits[0].isOutdated);
    ASSERT_EQ(hits[0].availableVersion, "129.0-1");
}

TEST(search_is_case_insensitive_and_covers_descriptions)
{
    Fixture f;
    vector<string> byName = names(f.engine->search("FireFox", {PackageSource::OFFICIAL}).collect());
    ASSERT_EQ(byName.size(), 1u);

    vector<string> byDescription = names(
        f.engine->search("mozilla.org", {PackageSource::OFFICIAL}).collect());
    ASSERT_EQ(byDescription.size(), 1u);
    ASSERT_EQ(byDescription[0], "thunderbird:Official");

    SearchFilters namesOnly;
    namesOnly.searchDescription = false;
    ASSERT_TRUE(f.engine->search("mozilla.org", {PackageSource::OFFICIAL}, namesOnly)
                    .collect().empty());
}

TEST(empty_term_matches_everything)
{
    Fixture f;
    ASSERT_EQ(f.engine->search("", {PackageSource::INSTALLED}).collect().size(), 5u);
}

TEST(search_filters)
{
    Fixture f;

    SearchFilters installed;
    installed.installedOnly = true;
    vector<string> inst = names(f.engine->search("firefox", allPackageSources(), installed).collect());
    ASSERT_EQ(inst.size(), 2u);
    ASSERT_FALSE(contains(inst, "firefox-nightly:AUR"));

    SearchFilters orphans;
    orphans.orphanOnly = true;
    vector<string> orph = names(f.engine->search("", {PackageSource::INSTALLED}, orphans).collect());
    ASSERT_EQ(orph.size(), 1u);
    ASSERT_EQ(orph[0], "libnotify:Installed");

    SearchFilters outdated;
    outdated.outdatedOnly = true;
    vector<string> out = names(f.engine->search("", {PackageSource::INSTALLED}, outdated).collect());
    ASSERT_EQ(out.size(), 2u);
    ASSERT_TRUE(contains(out, "firefox:Installed"));
    ASSERT_TRUE(contains(out, "yay-bin:Installed"));

    SearchFilters core;
    core.repositories = {"core"};
    vector<string> repo = names(f.engine->search("", {PackageSource::OFFICIAL}, core).collect());
    ASSERT_EQ(repo.size(), 1u);
    ASSERT_EQ(repo[0], "linux:Official");

    SearchFilters exact;
    exact.exactName = true;
    vector<string> ex = names(f.engine->search("firefox", allPackageSources(), exact).collect());
    ASSERT_EQ(ex.size(), 2u);
    ASSERT_FALSE(contains(ex, "firefox-nightly:AUR"));

    SearchFilters limited;
    limited.limit = 2;
    ASSERT_EQ(f.engine->search("", allPackageSources(), limited).collect().size(), 2u);
}

TEST(outdated_filter_returns_merged_installed_records)
{
    Fixture f;
    SearchFilters outdated;
    outdated.outdatedOnly = true;

    vector<PackageRecord> official = f.engine->search("", {PackageSource::OFFICIAL}, outdated).collect();
    ASSERT_EQ(official.size(), 1u);
    ASSERT_EQ(official[0].name, "firefox");
    ASSERT_TRUE(official[0].source == PackageSource::INSTALLED);
    ASSERT_TRUE(official[0].isOutdated);
    ASSERT_EQ(official[0].version, "128.0-1");
    ASSERT_EQ(official[0].availableVersion, "129.0-1");

    // Each outdated package appears once even when several sources match it
    vector<PackageRecord> everywhere = f.engine->search("", allPackageSources(), outdated).collect();
    vector<string> found = names(everywhere);
    ASSERT_EQ(found.size(), 2u);
    ASSERT_TRUE(contains(found, "firefox:Installed"));
    ASSERT_TRUE(contains(found, "yay-bin:Installed"));
    for (const auto& rec : everywhere) {
        ASSERT_TRUE(rec.isOutdated);
    }
}

TEST(search_results_outlive_refresh)
{
    Fixture f;
    SearchResults results = f.engine->search("", {PackageSource::OFFICIAL});
    f.cache->invalidateAll();
    f.cache->refreshStale();

    size_t count = 0;
    for (const PackageRecord& rec : results) {
        ASSERT_FALSE(rec.name.empty());
        ++count;
    }
    ASSERT_EQ(count, 6u);
}

TEST(search_async_collects_on_pool)
{
    Fixture f;
    auto pending = f.engine->searchAsync("thunder", {PackageSource::OFFICIAL});
    vector<PackageRecord> hits = pending.get();
    ASSERT_EQ(hits.size(), 1u);
    ASSERT_EQ(hits[0].name, "thunderbird");
}

// ============================================================================
// Sorting
// ============================================================================

TEST(sort_by_size_and_repository)
{
    Fixture f;
    vector<PackageRecord> official = f.engine->search("", {PackageSource::OFFICIAL}).collect();

    vector<PackageRecord> bySize = sortRecords(official, SortKey::SIZE, true);
    ASSERT_EQ(bySize[0].name, "linux");
    ASSERT_EQ(bySize[1].name, "firefox");

    vector<PackageRecord> byRepo = sortRecords(official, SortKey::REPOSITORY);
    ASSERT_EQ(byRepo[0].repository, "core");

    // Equal sizes fall back to the name
    vector<PackageRecord> byName = sortRecords(official, SortKey::NAME);
    ASSERT_EQ(byName.front().name, "firefox");
    ASSERT_EQ(byName.back().name, "vim");
}

TEST(sort_by_installed_size)
{
    Fixture f;
    vector<PackageRecord> installed = f.engine->search("", {PackageSource::INSTALLED}).collect();
    vector<PackageRecord> sorted = sortRecords(installed, SortKey::INSTALLED_SIZE, true);
    ASSERT_EQ(sorted[0].name, "nss");
    ASSERT_EQ(sorted[1].name, "vim");
}

// ============================================================================
// Details and Listings
// ============================================================================

TEST(details_fill_reverse_dependencies)
{
    Fixture f;
    auto nss = f.engine->details("nss");
    ASSERT_TRUE(nss.has_value());
    ASSERT_TRUE(nss->source == PackageSource::INSTALLED);
    ASSERT_TRUE(nss->reverseDependencies.count("firefox") == 1);
    // thunderbird is not installed, so it does not hold nss
    ASSERT_TRUE(nss->reverseDependencies.count("thunderbird") == 0);

    // Every reverse dependency lists the package as a dependency
    for (const auto& dependent : nss->reverseDependencies) {
        auto rec = f.engine->details(dependent);
        ASSERT_TRUE(rec.has_value());
        bool listed = false;
        for (const auto& dep : rec->dependencies) {
            listed = listed || dependencyName(dep) == "nss";
        }
        ASSERT_TRUE(listed);
    }
}

TEST(details_of_uninstalled_package_use_official_snapshot)
{
    Fixture f;
    auto thunderbird = f.engine->details("thunderbird");
    ASSERT_TRUE(thunderbird.has_value());
    ASSERT_TRUE(thunderbird->source == PackageSource::OFFICIAL);
    ASSERT_TRUE(thunderbird->reverseDependencies.empty());

    ASSERT_FALSE(f.engine->details("no-such-package").has_value());
}

TEST(list_updates_and_orphans)
{
    Fixture f;
    vector<PackageRecord> updates = f.engine->listUpdates();
    ASSERT_EQ(updates.size(), 2u);
    ASSERT_EQ(updates[0].name, "firefox");
    ASSERT_EQ(updates[1].name, "yay-bin");
    ASSERT_EQ(updates[1].availableVersion, "12.3.5-1");

    vector<PackageRecord> orphans = f.engine->listOrphans();
    ASSERT_EQ(orphans.size(), 1u);
    ASSERT_EQ(orphans[0].name, "libnotify");
}

TEST(list_repositories_groups_official_packages)
{
    Fixture f;
    auto repos = f.engine->listRepositories();
    ASSERT_EQ(repos.size(), 2u);
    ASSERT_EQ(repos["core"].size(), 1u);
    ASSERT_EQ(repos["extra"].size(), 5u);
}

TEST(reverse_dependencies_are_symmetric_for_every_pair)
{
    Fixture f;
    for (PackageSource source : {PackageSource::INSTALLED, PackageSource::OFFICIAL}) {
        SnapshotPtr snap = f.cache->snapshot(source);
        ASSERT_TRUE(snap->loaded());

        set<string> candidates;
        for (const auto& [name, rec] : snap->records) {
            candidates.insert(name);
            for (const auto& dep : rec.dependencies) {
                candidates.insert(dependencyName(dep));
            }
        }

        size_t edges = 0;
        for (const auto& target : candidates) {
            set<string> rdeps = QueryEngine::computeReverseDependencies(*snap, target);
            for (const auto& [name, rec] : snap->records) {
                bool depends = false;
                for (const auto& dep : rec.dependencies) {
                    depends = depends || dependencyName(dep) == target;
                }
                ASSERT_EQ(depends, rdeps.count(name) == 1);
                if (depends) ++edges;
            }
            // Nothing outside the snapshot shows up
            for (const auto& dependent : rdeps) {
                ASSERT_TRUE(snap->find(dependent) != nullptr);
            }
        }
        ASSERT_GT(edges, 0u);
    }
}

TEST(reverse_dependencies_ignore_constraints)
{
    CacheSnapshot snap;
    PackageRecord a("a", "1-1", PackageSource::INSTALLED);
    a.dependencies = {"glibc>=2.38"};
    PackageRecord b("b", "1-1", PackageSource::INSTALLED);
    b.dependencies = {"glibc-locales"};
    snap.records["a"] = a;
    snap.records["b"] = b;

    set<string> rdeps = QueryEngine::computeReverseDependencies(snap, "glibc");
    ASSERT_EQ(rdeps.size(), 1u);
    ASSERT_TRUE(rdeps.count("a") == 1);
}

// ============================================================================
// Tool-backed Queries
// ============================================================================

TEST(dependency_tree_runs_pactree)
{
    Fixture f;
    f.runner.on("pactree firefox", lines(
        "firefox\n"
        "├─dbus-glib\n"
        "│ └─glib2\n"
        "└─nss\n"));

    DependencyTreeResult tree = f.engine->dependencyTree("firefox");
    ASSERT_TRUE(tree.result.success);
    ASSERT_EQ(tree.nodes.size(), 4u);
    ASSERT_EQ(tree.nodes[2].depth, 2);

    f.runner.on("pactree -r nss", lines("nss\n└─firefox\n"));
    DependencyTreeResult reverse = f.engine->dependencyTree("nss", true);
    ASSERT_TRUE(reverse.result.success);
    ASSERT_EQ(reverse.nodes[1].name, "firefox");
}

TEST(dependency_tree_rejects_bad_names_without_running)
{
    Fixture f;
    DependencyTreeResult tree = f.engine->dependencyTree("--help");
    ASSERT_TRUE(tree.result.error == ErrorKind::VALIDATION_ERROR);
    ASSERT_TRUE(f.runner.calls().empty());
}

TEST(dependency_tree_reports_tool_failure)
{
    Fixture f;
    ScriptedCommand missing;
    missing.stderrLines = {"error: package 'nope' not found"};
    missing.exitCode = 1;
    f.runner.on("pactree nope", missing);

    DependencyTreeResult tree = f.engine->dependencyTree("nope");
    ASSERT_FALSE(tree.result.success);
    ASSERT_TRUE(tree.result.error == ErrorKind::EXIT_ERROR);
}

TEST(dependency_tree_without_pactree_is_launch_error)
{
    Fixture f;
    DependencyTreeResult tree = f.engine->dependencyTree("firefox");
    ASSERT_TRUE(tree.result.error == ErrorKind::LAUNCH_ERROR);
}

TEST(aur_discovery_merges_into_cache)
{
    Fixture f;
    f.runner.on("yay -Ssa", lines(
        "aur/paru 2.0.3-1 (+1200 20.00)\n"
        "    Feature packed AUR helper\n"
        "aur/paru-bin 2.0.3-1 (+300 5.00)\n"
        "    Feature packed AUR helper (binary)\n"));

    DiscoveryResult discovery = f.engine->discoverAur("paru");
    ASSERT_TRUE(discovery.result.success);
    ASSERT_EQ(discovery.records.size(), 2u);
    ASSERT_EQ(f.runner.count("yay -Ssa paru"), 1u);

    vector<string> found = names(f.engine->search("paru", {PackageSource::AUR}).collect());
    ASSERT_EQ(found.size(), 2u);
}

TEST(aur_discovery_without_hits)
{
    Fixture f;
    f.runner.on("yay -Ssa", lines("", 1));
    DiscoveryResult discovery = f.engine->discoverAur("zzzz");
    ASSERT_TRUE(discovery.result.success);
    ASSERT_TRUE(discovery.records.empty());
}

TEST(aur_discovery_respects_disabled_aur)
{
    Fixture f;
    f.config.aurEnabled = false;
    QueryEngine engine(*f.cache, f.runner, f.config);
    DiscoveryResult discovery = engine.discoverAur("paru");
    ASSERT_TRUE(discovery.result.success);
    ASSERT_TRUE(f.runner.calls().empty());
}

int main()
{
    cout << endl << "=== Query Engine Tests ===" << endl;
    return reportResults();
}

// vim:ts=4:sw=4:et
