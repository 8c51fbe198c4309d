/* test_tool_diagnosis.cc - Diagnostics for the host's pacman/yay/pactree
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Checks that the external tools are present and that their output on this
 * machine parses. Missing tools only produce warnings, so the diagnostic
 * passes on hosts that are not Arch based.
 * Run with: ./test_tool_diagnosis
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include <iostream>
#include <chrono>

#include "pkgertest.h"
#include "configuration.h"
#include "processrunner.h"
#include "outputparsers.h"
#include "metadatacache.h"
#include "queryengine.h"

using namespace std;
using namespace Pkger;

// ============================================================================
// Diagnostic Output
// ============================================================================

#define DIAG_PASS "\033[32m[PASS]\033[0m"
#define DIAG_FAIL "\033[31m[FAIL]\033[0m"
#define DIAG_WARN "\033[33m[WARN]\033[0m"
#define DIAG_INFO "\033[34m[INFO]\033[0m"

int g_passCount = 0;
int g_failCount = 0;
int g_warnCount = 0;

void diagPass(const string& msg) {
    cout << DIAG_PASS << " " << msg << endl;
    g_passCount++;
}

void diagFail(const string& msg) {
    cout << DIAG_FAIL << " " << msg << endl;
    g_failCount++;
}

void diagWarn(const string& msg) {
    cout << DIAG_WARN << " " << msg << endl;
    g_warnCount++;
}

void diagInfo(const string& msg) {
    cout << DIAG_INFO << " " << msg << endl;
}

void printHeader(const string& title) {
    cout << endl;
    cout << "===================================================================" << endl;
    cout << "  " << title << endl;
    cout << "===================================================================" << endl;
}

// ============================================================================
// Tool Probes
// ============================================================================

/**
 * Run a tool once and show its exit status and the first lines of output.
 * Returns the captured output; a launch failure leaves status non-EXITED.
 */
CommandOutput probe(ProcessRunner& runner, const CommandSpec& spec)
{
    diagInfo("Command: " + spec.toString());
    CommandOutput out = captureCommand(runner, spec, "Diagnosis");

    cout << "  Status: " << exitKindToString(out.status.kind);
    if (out.status.exited()) {
        cout << " (exit " << out.status.exitCode << ")";
    }
    cout << endl;

    size_t shown = 0;
    for (const auto& line : out.stdoutLines) {
        if (shown++ >= 3) {
            cout << "  ...(" << out.stdoutLines.size() << " lines)" << endl;
            break;
        }
        cout << "  " << line << endl;
    }
    return out;
}

// False if the tool could not be started at all
bool toolPresent(ProcessRunner& runner, const string& program, const string& versionFlag)
{
    CommandSpec spec(program, {versionFlag});
    spec.timeoutSeconds = 10;
    CommandOutput out = probe(runner, spec);
    return out.status.kind != ExitStatus::Kind::LAUNCH_FAILED;
}

// ============================================================================
// pacman
// ============================================================================

bool diagnosePacman(ProcessRunner& runner, const Configuration& config)
{
    printHeader("PACMAN DIAGNOSTICS");

    diagInfo("Step 1: Checking if '" + config.pacmanPath + "' can be started");
    if (!toolPresent(runner, config.pacmanPath, "--version")) {
        diagWarn("pacman not found; this host is not Arch based");
        return false;
    }
    diagPass("pacman found");

    diagInfo("Step 2: Parsing the local database (pacman -Qi)");
    CommandSpec query(config.pacmanPath, {"-Qi"});
    query.timeoutSeconds = config.queryTimeoutSeconds;
    CommandOutput installed = probe(runner, query);
    if (!installed.status.ok()) {
        diagWarn("pacman -Qi failed; the local database may be locked or missing");
    } else {
        vector<PackageRecord> records = parsePackageInfo(installed.stdoutText(),
                                                         PackageSource::INSTALLED);
        if (records.empty() && !installed.stdoutLines.empty()) {
            diagFail("pacman -Qi printed output but no package parsed");
        } else {
            diagPass("Parsed " + to_string(records.size()) + " installed packages");
        }
    }

    diagInfo("Step 3: Listing pending updates (pacman -Qu)");
    CommandSpec updates(config.pacmanPath, {"-Qu"});
    updates.timeoutSeconds = config.queryTimeoutSeconds;
    CommandOutput pending = probe(runner, updates);
    if (pending.status.exited()) {
        diagPass(to_string(parseUpdateList(pending.stdoutText()).size()) + " updates pending");
    } else {
        diagWarn("pacman -Qu did not finish");
    }

    return true;
}

// ============================================================================
// AUR Helper and pactree
// ============================================================================

void diagnoseHelpers(ProcessRunner& runner, const Configuration& config)
{
    printHeader("AUR HELPER AND PACTREE DIAGNOSTICS");

    diagInfo("Step 1: Checking if '" + config.aurHelperPath + "' can be started");
    if (toolPresent(runner, config.aurHelperPath, "--version")) {
        diagPass(config.aurHelperPath + " found");
    } else {
        diagWarn(config.aurHelperPath + " not found; AUR features stay unavailable");
    }

    diagInfo("Step 2: Checking if '" + config.pactreePath + "' can be started");
    if (!toolPresent(runner, config.pactreePath, "--version")) {
        diagWarn("pactree not found; install pacman-contrib for dependency trees");
        return;
    }
    diagPass("pactree found");

    diagInfo("Step 3: Dependency tree of pacman itself");
    CommandSpec tree(config.pactreePath, {"pacman"});
    tree.timeoutSeconds = config.queryTimeoutSeconds;
    CommandOutput out = probe(runner, tree);
    if (!out.status.ok()) {
        diagWarn("pactree pacman failed");
        return;
    }
    vector<DependencyTreeNode> nodes = parseDependencyTree(out.stdoutText());
    if (nodes.empty()) {
        diagFail("pactree printed output but no tree parsed");
    } else {
        diagPass("Parsed " + to_string(nodes.size()) + " dependency tree nodes");
    }
}

// ============================================================================
// Cache
// ============================================================================

void diagnoseCache(ProcessRunner& runner, const Configuration& config)
{
    printHeader("METADATA CACHE DIAGNOSTICS");

    MetadataCache cache(runner, config);

    auto start = chrono::steady_clock::now();
    OperationResult refreshed = cache.refreshStale();
    auto elapsed = chrono::duration_cast<chrono::milliseconds>(
        chrono::steady_clock::now() - start).count();

    for (PackageSource source : allPackageSources()) {
        SnapshotPtr snap = cache.snapshot(source);
        cout << "  " << packageSourceToString(source) << ": "
             << (snap->loaded() ? to_string(snap->size()) + " packages" : "not loaded")
             << endl;
    }
    cout << "  Refresh took " << elapsed << "ms" << endl;

    if (!refreshed.success) {
        diagWarn("Cache refresh incomplete: " + refreshed.message);
        return;
    }
    diagPass("All sources refreshed");

    QueryEngine engine(cache, runner, config);
    size_t updates = engine.listUpdates().size();
    size_t orphans = engine.listOrphans().size();
    diagInfo(to_string(updates) + " outdated, " + to_string(orphans) + " orphaned");
}

// ============================================================================
// Summary
// ============================================================================

void printSummary()
{
    printHeader("DIAGNOSTIC SUMMARY");

    cout << "  Passed: " << g_passCount << endl;
    cout << "  Failed: " << g_failCount << endl;
    cout << "  Warnings: " << g_warnCount << endl;
    cout << endl;

    if (g_failCount == 0) {
        cout << DIAG_PASS << " No parser problems found on this host." << endl;
    } else {
        cout << DIAG_FAIL << " Tool output on this host does not parse. Review the output above." << endl;
    }
}

int main()
{
    cout << endl;
    cout << "PKGER Tool Diagnostic" << endl;

    Configuration config;
    config.queryTimeoutSeconds = 60;

    ProcessRunner runner;
    if (diagnosePacman(runner, config)) {
        diagnoseHelpers(runner, config);
        diagnoseCache(runner, config);
    }
    printSummary();

    return g_failCount > 0 ? 1 : 0;
}

// vim:ts=4:sw=4:et
