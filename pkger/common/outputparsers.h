/* outputparsers.h - Parsing pacman, yay and pactree output
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * All parsers are pure functions over captured text. Commands are run
 * with LC_ALL=C, so the English field names and decimal points below are
 * what the tools print.
 *
 * Parsers never fail hard: lines they do not understand are skipped or
 * handed back as "unrecognised" so callers can degrade to raw text.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _OUTPUTPARSERS_H_
#define _OUTPUTPARSERS_H_

#include "pkgtypes.h"

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>

namespace Pkger {

std::string trimString(const std::string& s);

// Whitespace-separated list; pacman's "None" yields an empty list
std::vector<std::string> splitList(const std::string& value);

// "12.34 MiB" -> bytes
std::optional<int64_t> parseSize(const std::string& value);

// pacman package name rules (no leading '-' or '.')
bool isValidPackageName(const std::string& name);

// ============================================================================
// Package Info Blocks (pacman -Si / -Qi, yay -Si --aur)
// ============================================================================

using InfoBlock = std::map<std::string, std::string>;

/**
 * Split "Key : value" output into one map per package. Wrapped values
 * (indented continuation lines) are joined with a single space.
 */
std::vector<InfoBlock> parseInfoBlocks(const std::string& output);

/**
 * Convert info blocks into records of the given source.
 *
 * Installed records get repository "local", install reason and the
 * orphan flag (dependency install reason, "Required By" and "Optional
 * For" both None). Blocks without a Name are skipped.
 */
std::vector<PackageRecord> parsePackageInfo(
    const std::string& output,
    PackageSource source,
    std::chrono::system_clock::time_point refreshed = std::chrono::system_clock::now());

// ============================================================================
// Search Results (pacman -Ss / -Qs, yay -Ssa)
// ============================================================================

struct SearchHit {
    PackageRecord record;
    bool installed = false;
};

/**
 * Parse search output:
 *   extra/firefox 128.0-1 [installed]
 *       Fast, Private & Safe Web Browser
 *   aur/foo-git 1.0-1 (+12 0.50) [Installed: 0.9-1]
 *       Description
 *
 * Repository "aur" yields AUR records, "local" Installed ones, anything
 * else Official.
 */
std::vector<SearchHit> parseSearchResults(const std::string& output);

// ============================================================================
// Simple Listings
// ============================================================================

// One name per line (pacman -Qtdq, pacman -Qmq)
std::vector<std::string> parseNameList(const std::string& output);

struct UpdateEntry {
    std::string name;
    std::string currentVersion;
    std::string newVersion;
};

// pacman -Qu: "name old -> new" (a trailing "[ignored]" is dropped)
std::vector<UpdateEntry> parseUpdateList(const std::string& output);

struct RepoEntry {
    std::string repository;
    std::string name;
    std::string version;
    bool installed = false;
};

// pacman -Sl: "repo name version [installed]"
std::vector<RepoEntry> parseRepoList(const std::string& output);

struct DependencyTreeNode {
    int depth = 0;
    std::string name;
    std::string provides;       // "bash provides sh" keeps "sh"
};

// pactree (unicode or -a ASCII drawing); depth 0 is the root
std::vector<DependencyTreeNode> parseDependencyTree(const std::string& output);

// ============================================================================
// Dry Runs
// ============================================================================

struct PrintOutput {
    std::vector<PlannedPackage> packages;
    std::vector<std::string> unrecognised;
};

// --print --print-format "%n %v" output
PrintOutput parsePrintOutput(const std::vector<std::string>& lines);

enum class DryRunProblem {
    NONE,
    TARGET_NOT_FOUND,
    CONFLICT
};

struct DryRunDiagnosis {
    DryRunProblem problem = DryRunProblem::NONE;
    std::vector<std::string> lines;     // The tool lines that show the problem
};

/**
 * Look for the failure messages pacman and yay print when a transaction
 * cannot be prepared.
 */
DryRunDiagnosis diagnoseDryRun(const std::vector<std::string>& lines);

// ============================================================================
// Progress Classification
// ============================================================================

struct LineClass {
    bool isProgress = false;
    std::optional<int> percent;
};

/**
 * Classify a line of a running operation:
 *   "(3/10) installing foo"  -> progress 30
 *   "... 45%"                -> progress 45
 *   "downloading ..."        -> progress 50 (stage hint)
 * Everything else is a plain log line.
 */
LineClass classifyOutputLine(const std::string& line);

} // namespace Pkger

#endif // _OUTPUTPARSERS_H_

// vim:ts=4:sw=4:et
