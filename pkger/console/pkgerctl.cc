/* pkgerctl.cc - Console front-end for the PKGER backend core
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "configuration.h"
#include "credentialbroker.h"
#include "metadatacache.h"
#include "operationorchestrator.h"
#include "processrunner.h"
#include "queryengine.h"
#include "structuredlog.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>
#include <set>
#include <csignal>

#include <string.h>
#include <unistd.h>

using namespace std;
using namespace Pkger;

namespace {

volatile sig_atomic_t g_interrupted = 0;

void onInterrupt(int)
{
    g_interrupted = 1;
}

void print_help(const char* program_name)
{
    printf("pkgerctl - pacman/yay front-end on the PKGER backend\n\n");
    printf("Usage: %s [OPTIONS] <command> [ARGS]\n\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <file>     Use a specific configuration file\n");
    printf("  -d, --debug             Log to the console at DEBUG level\n");
    printf("  -h, --help              Show this help message\n");
    printf("  -v, --version           Show version\n\n");
    printf("Queries:\n");
    printf("  search <term> [--aur] [--installed] [--outdated] [--orphans]\n");
    printf("         [--repo <name>] [--exact] [--sort name|repo|size|isize] [--desc]\n");
    printf("  info <package>          Details including reverse dependencies\n");
    printf("  tree <package> [-r]     Dependency tree (reverse with -r)\n");
    printf("  updates                 Installed packages with newer versions\n");
    printf("  orphans                 Unneeded dependency packages\n");
    printf("  repos                   Repositories and package counts\n\n");
    printf("Operations:\n");
    printf("  install [--aur] <pkg>...\n");
    printf("  reinstall <pkg>...\n");
    printf("  remove <pkg>...\n");
    printf("  update <pkg>...         Update selected packages\n");
    printf("  upgrade                 Update everything\n");
    printf("  install-file <path>     Install a local .pkg.tar.* file\n");
    printf("  clean-cache             Remove old packages from the cache\n");
    printf("  clean-orphans           Remove orphan packages\n");
    printf("  sync                    Refresh the repository databases\n\n");
    printf("Configuration:\n");
    printf("  config                  Show the effective configuration\n");
    printf("  config <key> <value>    Change and save a setting\n");
}

void print_version()
{
    printf("pkgerctl version 0.1.0\n");
}

optional<Credential> askPassword(const string& prompt)
{
    string text = prompt + "\n[sudo] password: ";
    char* entered = getpass(text.c_str());
    if (!entered) {
        return nullopt;
    }
    size_t len = strlen(entered);
    Credential credential(entered, len);
    explicit_bzero(entered, len);
    if (credential.empty()) {
        return nullopt;
    }
    return optional<Credential>(std::move(credential));
}

void printRecord(const PackageRecord& rec)
{
    printf("%s/%s %s%s\n",
           rec.repository.c_str(),
           rec.name.c_str(),
           rec.getDisplayVersion().c_str(),
           rec.isInstalled() ? " [installed]" : "");
    if (!rec.description.empty()) {
        printf("    %s\n", rec.description.c_str());
    }
}

void printList(const char* label, const vector<string>& values)
{
    printf("%-16s: ", label);
    if (values.empty()) {
        printf("None\n");
        return;
    }
    for (size_t i = 0; i < values.size(); ++i) {
        printf("%s%s", i ? "  " : "", values[i].c_str());
    }
    printf("\n");
}

void printDetails(const PackageRecord& rec)
{
    printf("%-16s: %s\n", "Name", rec.name.c_str());
    printf("%-16s: %s\n", "Version", rec.version.c_str());
    if (!rec.availableVersion.empty() && rec.availableVersion != rec.version) {
        printf("%-16s: %s\n", "Available", rec.availableVersion.c_str());
    }
    printf("%-16s: %s\n", "Source", packageSourceToString(rec.source));
    printf("%-16s: %s\n", "Repository", rec.repository.c_str());
    printf("%-16s: %s\n", "Description", rec.description.c_str());
    printf("%-16s: %s\n", "URL", rec.homepage.value_or("None").c_str());
    printList("Licenses", rec.licenses);
    printList("Depends On", rec.dependencies);
    printList("Required By", vector<string>(rec.reverseDependencies.begin(),
                                            rec.reverseDependencies.end()));
    printList("Conflicts With", rec.conflicts);
    printList("Provides", rec.provides);
    printf("%-16s: %lld bytes\n", "Download Size", static_cast<long long>(rec.size));
    if (rec.installedSize) {
        printf("%-16s: %lld bytes\n", "Installed Size", static_cast<long long>(*rec.installedSize));
    }
    if (rec.isInstalled()) {
        printf("%-16s: %s\n", "Orphan", rec.isOrphan ? "Yes" : "No");
        printf("%-16s: %s\n", "Outdated", rec.isOutdated ? "Yes" : "No");
    }
}

/**
 * Follow a session's events until its outcome, forwarding Ctrl-C as a
 * cancellation request.
 */
int followSession(OperationOrchestrator& orchestrator, SessionHandle handle)
{
    EventStream events = orchestrator.subscribe(handle);
    bool cancelRequested = false;

    while (!events.finished()) {
        if (g_interrupted && !cancelRequested) {
            fprintf(stderr, "\nCancelling...\n");
            orchestrator.cancel(handle);
            cancelRequested = true;
        }

        optional<Event> event = events.next();
        if (!event) {
            continue;
        }

        switch (event->type) {
            case EventType::STATE_CHANGED:
                printf(":: %s\n", event->message.c_str());
                break;
            case EventType::PROGRESS:
                if (event->percent) {
                    printf("[%3d%%] %s\n", *event->percent, event->message.c_str());
                } else {
                    printf("[....] %s\n", event->message.c_str());
                }
                break;
            case EventType::LOG:
                printf("%s\n", event->message.c_str());
                break;
            case EventType::CREDENTIAL_REQUEST:
                break;
            case EventType::OUTCOME: {
                const SessionOutcome& outcome = *event->outcome;
                printf("\n%s: %s\n", outcomeKindToString(outcome.kind), outcome.summary.c_str());
                if (!outcome.succeeded()) {
                    if (!outcome.details.empty()) {
                        fprintf(stderr, "%s\n", outcome.details.c_str());
                    } else {
                        for (const auto& line : outcome.outputTail) {
                            fprintf(stderr, "  %s\n", line.c_str());
                        }
                    }
                }
                fflush(stdout);
                return outcome.succeeded() ? 0 : 1;
            }
        }
        fflush(stdout);
    }
    return 1;
}

set<PackageTarget> targetsFrom(const vector<string>& names, PackageSource source)
{
    set<PackageTarget> targets;
    for (const auto& name : names) {
        targets.insert({name, source});
    }
    return targets;
}

SortKey sortKeyFromString(const string& s)
{
    if (s == "repo") return SortKey::REPOSITORY;
    if (s == "size") return SortKey::SIZE;
    if (s == "isize") return SortKey::INSTALLED_SIZE;
    return SortKey::NAME;
}

} // namespace

int main(int argc, char* argv[])
{
    string configPath;
    bool debug = false;
    vector<string> args;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--debug") == 0) {
            debug = true;
            continue;
        }
        if ((strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            configPath = argv[++i];
            continue;
        }
        args.push_back(argv[i]);
    }

    if (args.empty()) {
        print_help(argv[0]);
        return 1;
    }

    Configuration config;
    config.load(configPath);
    Logger::instance().setConsoleEnabled(debug);
    config.applyLogging();
    if (debug) {
        Logger::instance().setMinLevel(LogLevel::DEBUG);
    }
    LOG_DEBUG("Configuration from " +
              (configPath.empty() ? Configuration::getDefaultPath() : configPath));

    const string command = args[0];
    vector<string> rest(args.begin() + 1, args.end());

    if (command == "config") {
        if (rest.empty()) {
            for (const auto& [key, value] : config.toMap()) {
                printf("%s=%s\n", key.c_str(), value.c_str());
            }
            return 0;
        }
        if (rest.size() != 2 || !config.set(rest[0], rest[1])) {
            fprintf(stderr, "Error: invalid setting\n");
            return 1;
        }
        if (!config.save(configPath)) {
            fprintf(stderr, "Error: could not write the configuration file\n");
            return 1;
        }
        return 0;
    }

    signal(SIGINT, onInterrupt);

    ProcessRunner runner;
    MetadataCache cache(runner, config);
    QueryEngine queries(cache, runner, config);

    // === Queries ===

    if (command == "search" || command == "info" || command == "updates" ||
        command == "orphans" || command == "repos") {
        OperationResult loaded = cache.refreshStale();
        if (!loaded.success) {
            fprintf(stderr, "Warning: %s\n", loaded.message.c_str());
        }
    }

    if (command == "search") {
        SearchFilters filters;
        string term;
        SortKey sortKey = SortKey::NAME;
        bool descending = false;
        bool discover = false;

        for (size_t i = 0; i < rest.size(); ++i) {
            const string& a = rest[i];
            if (a == "--aur") discover = true;
            else if (a == "--installed") filters.installedOnly = true;
            else if (a == "--outdated") filters.outdatedOnly = true;
            else if (a == "--orphans") filters.orphanOnly = true;
            else if (a == "--exact") filters.exactName = true;
            else if (a == "--desc") descending = true;
            else if (a == "--repo" && i + 1 < rest.size()) filters.repositories.insert(rest[++i]);
            else if (a == "--sort" && i + 1 < rest.size()) sortKey = sortKeyFromString(rest[++i]);
            else term = a;
        }

        if (discover) {
            DiscoveryResult found = queries.discoverAur(term);
            if (!found.result.success) {
                fprintf(stderr, "Warning: %s\n", found.result.message.c_str());
            }
        }

        vector<PackageRecord> records = sortRecords(
            queries.search(term, allPackageSources(), filters).collect(), sortKey, descending);
        for (const auto& rec : records) {
            printRecord(rec);
        }
        return 0;
    }

    if (command == "info") {
        if (rest.empty()) {
            fprintf(stderr, "Error: info needs a package name\n");
            return 1;
        }
        optional<PackageRecord> rec = queries.details(rest[0]);
        if (!rec) {
            fprintf(stderr, "Error: package '%s' not found\n", rest[0].c_str());
            return 1;
        }
        printDetails(*rec);
        return 0;
    }

    if (command == "tree") {
        if (rest.empty()) {
            fprintf(stderr, "Error: tree needs a package name\n");
            return 1;
        }
        bool reverse = rest.size() > 1 && rest[1] == "-r";
        DependencyTreeResult tree = queries.dependencyTree(rest[0], reverse);
        if (!tree.result.success) {
            fprintf(stderr, "Error: %s\n", tree.result.message.c_str());
            return 1;
        }
        for (const auto& node : tree.nodes) {
            printf("%s%s", string(node.depth * 2, ' ').c_str(), node.name.c_str());
            if (!node.provides.empty()) {
                printf(" (provides %s)", node.provides.c_str());
            }
            printf("\n");
        }
        return 0;
    }

    if (command == "updates") {
        for (const auto& rec : queries.listUpdates()) {
            printf("%s %s -> %s\n", rec.name.c_str(), rec.version.c_str(),
                   rec.availableVersion.c_str());
        }
        return 0;
    }

    if (command == "orphans") {
        for (const auto& rec : queries.listOrphans()) {
            printf("%s %s\n", rec.name.c_str(), rec.version.c_str());
        }
        return 0;
    }

    if (command == "repos") {
        for (const auto& [repo, names] : queries.listRepositories()) {
            printf("%-12s %zu packages\n", repo.c_str(), names.size());
        }
        return 0;
    }

    // === Operations ===

    OperationRequest request;
    if (command == "install") {
        PackageSource source = PackageSource::OFFICIAL;
        vector<string> names;
        for (const auto& a : rest) {
            if (a == "--aur") source = PackageSource::AUR;
            else names.push_back(a);
        }
        request = OperationRequest::install(targetsFrom(names, source));
    } else if (command == "reinstall") {
        request = OperationRequest::reinstall(targetsFrom(rest, PackageSource::OFFICIAL));
    } else if (command == "remove") {
        request = OperationRequest::remove(set<string>(rest.begin(), rest.end()));
    } else if (command == "update") {
        // Foreign packages are routed to the helper from the AUR snapshot
        cache.refresh(PackageSource::AUR);
        request = OperationRequest::updateSelected(targetsFrom(rest, PackageSource::INSTALLED));
    } else if (command == "upgrade") {
        request = OperationRequest::updateAll();
    } else if (command == "install-file") {
        request = OperationRequest::installLocalFile(rest.empty() ? "" : rest[0]);
    } else if (command == "clean-cache") {
        request = OperationRequest::cacheClean();
    } else if (command == "clean-orphans") {
        request = OperationRequest::orphanClean();
    } else if (command == "sync") {
        request = OperationRequest::syncDatabases();
    } else {
        fprintf(stderr, "Error: unknown command '%s'\n", command.c_str());
        fprintf(stderr, "Run '%s --help' to see available commands\n", argv[0]);
        return 1;
    }

    CredentialBroker broker;
    broker.setPromptCallback(askPassword);

    OperationOrchestrator orchestrator(runner, cache, broker, config);
    SessionHandle handle = orchestrator.submit(request);
    int status = followSession(orchestrator, handle);
    orchestrator.release(handle);
    return status;
}

// vim:ts=4:sw=4:et
