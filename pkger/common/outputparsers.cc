/* outputparsers.cc - Parsing pacman, yay and pactree output
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "outputparsers.h"

#include <sstream>
#include <charconv>
#include <system_error>
#include <regex>
#include <cctype>
#include <cmath>

using namespace std;

namespace Pkger {

namespace {

string toLower(const string& s)
{
    string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

bool startsWith(const string& s, const string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

string field(const InfoBlock& block, const string& key)
{
    auto it = block.find(key);
    return (it != block.end()) ? it->second : string();
}

bool isNone(const string& value)
{
    return value.empty() || value == "None";
}

} // namespace

string trimString(const string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

vector<string> splitList(const string& value)
{
    vector<string> items;
    if (isNone(trimString(value))) {
        return items;
    }
    istringstream iss(value);
    string item;
    while (iss >> item) {
        items.push_back(item);
    }
    return items;
}

optional<int64_t> parseSize(const string& value)
{
    istringstream iss(value);
    double amount = 0;
    string unit;
    if (!(iss >> amount)) {
        return nullopt;
    }
    iss >> unit;

    double factor = 1;
    if (unit.empty() || unit == "B") factor = 1;
    else if (unit == "KiB") factor = 1024.0;
    else if (unit == "MiB") factor = 1024.0 * 1024;
    else if (unit == "GiB") factor = 1024.0 * 1024 * 1024;
    else if (unit == "TiB") factor = 1024.0 * 1024 * 1024 * 1024;
    else return nullopt;

    return static_cast<int64_t>(llround(amount * factor));
}

bool isValidPackageName(const string& name)
{
    static const regex validName("^[a-zA-Z0-9@_+][a-zA-Z0-9@._+-]*$");
    return !name.empty() && name.size() <= 255 && regex_match(name, validName);
}

// ============================================================================
// Package Info Blocks
// ============================================================================

vector<InfoBlock> parseInfoBlocks(const string& output)
{
    vector<InfoBlock> blocks;
    InfoBlock current;
    string lastKey;

    auto finish = [&]() {
        if (!current.empty()) {
            blocks.push_back(current);
            current.clear();
        }
        lastKey.clear();
    };

    istringstream iss(output);
    string line;

    while (getline(iss, line)) {
        if (trimString(line).empty()) {
            finish();
            continue;
        }

        // Wrapped value of the previous key
        if (isspace(static_cast<unsigned char>(line[0]))) {
            if (!lastKey.empty()) {
                string& value = current[lastKey];
                string more = trimString(line);
                value = value.empty() ? more : value + " " + more;
            }
            continue;
        }

        size_t colon = line.find(':');
        if (colon == string::npos) {
            continue;
        }

        string key = trimString(line.substr(0, colon));
        string value = trimString(line.substr(colon + 1));

        // Some outputs omit the blank line between packages
        if (key == "Name" && current.count("Name")) {
            finish();
        }

        current[key] = value;
        lastKey = key;
    }
    finish();

    return blocks;
}

vector<PackageRecord> parsePackageInfo(const string& output,
                                       PackageSource source,
                                       chrono::system_clock::time_point refreshed)
{
    vector<PackageRecord> records;

    /*
     * pacman -Qi output (one block per package):
     * Name            : firefox
     * Version         : 128.0-1
     * Description     : Fast, Private & Safe Web Browser
     * URL             : https://www.mozilla.org/firefox/
     * Licenses        : MPL-2.0
     * Depends On      : dbus-glib  ffmpeg  gtk3  ...
     * Required By     : None
     * Optional For    : None
     * Installed Size  : 254.12 MiB
     * Install Reason  : Explicitly installed
     */

    for (const auto& block : parseInfoBlocks(output)) {
        string name = field(block, "Name");
        if (name.empty()) {
            continue;
        }

        PackageRecord rec(name, field(block, "Version"), source);
        rec.description = field(block, "Description");
        rec.lastRefreshed = refreshed;

        string url = field(block, "URL");
        if (!isNone(url)) {
            rec.homepage = url;
        }

        rec.licenses = splitList(field(block, "Licenses"));
        rec.dependencies = splitList(field(block, "Depends On"));
        rec.conflicts = splitList(field(block, "Conflicts With"));
        rec.provides = splitList(field(block, "Provides"));

        if (auto size = parseSize(field(block, "Download Size"))) {
            rec.size = *size;
        }
        if (auto size = parseSize(field(block, "Installed Size"))) {
            rec.installedSize = *size;
        }

        switch (source) {
            case PackageSource::INSTALLED: {
                rec.repository = "local";

                string reason = field(block, "Install Reason");
                if (reason.find("dependency") != string::npos) {
                    rec.installReason = InstallReason::DEPENDENCY;
                } else if (reason.find("Explicitly") != string::npos) {
                    rec.installReason = InstallReason::EXPLICIT;
                }

                rec.isOrphan = rec.installReason == InstallReason::DEPENDENCY &&
                               isNone(field(block, "Required By")) &&
                               isNone(field(block, "Optional For"));
                break;
            }
            case PackageSource::AUR:
                rec.repository = "aur";
                break;
            case PackageSource::OFFICIAL:
                rec.repository = field(block, "Repository");
                break;
        }

        records.push_back(rec);
    }

    return records;
}

// ============================================================================
// Search Results
// ============================================================================

vector<SearchHit> parseSearchResults(const string& output)
{
    vector<SearchHit> hits;

    istringstream iss(output);
    string line;

    while (getline(iss, line)) {
        if (trimString(line).empty()) continue;

        // Indented line: description of the previous hit
        if (isspace(static_cast<unsigned char>(line[0]))) {
            if (!hits.empty() && hits.back().record.description.empty()) {
                hits.back().record.description = trimString(line);
            }
            continue;
        }

        istringstream lineStream(line);
        string qualified, version;
        lineStream >> qualified >> version;

        size_t slash = qualified.find('/');
        if (slash == string::npos || version.empty()) {
            continue;
        }

        string repo = qualified.substr(0, slash);
        string name = qualified.substr(slash + 1);
        if (!isValidPackageName(name)) {
            continue;
        }

        PackageSource source = PackageSource::OFFICIAL;
        if (repo == "aur") {
            source = PackageSource::AUR;
        } else if (repo == "local") {
            source = PackageSource::INSTALLED;
        }

        SearchHit hit;
        hit.record = PackageRecord(name, version, source);
        hit.record.repository = repo;
        hit.record.lastRefreshed = chrono::system_clock::now();

        string rest;
        getline(lineStream, rest);
        hit.installed = (source == PackageSource::INSTALLED) ||
                        toLower(rest).find("installed") != string::npos;

        hits.push_back(hit);
    }

    return hits;
}

// ============================================================================
// Simple Listings
// ============================================================================

vector<string> parseNameList(const string& output)
{
    vector<string> names;
    istringstream iss(output);
    string line;
    while (getline(iss, line)) {
        istringstream lineStream(line);
        string name;
        if (lineStream >> name) {
            names.push_back(name);
        }
    }
    return names;
}

vector<UpdateEntry> parseUpdateList(const string& output)
{
    vector<UpdateEntry> updates;
    istringstream iss(output);
    string line;
    while (getline(iss, line)) {
        istringstream lineStream(line);
        UpdateEntry entry;
        string arrow;
        if (lineStream >> entry.name >> entry.currentVersion >> arrow >> entry.newVersion &&
            arrow == "->") {
            updates.push_back(entry);
        }
    }
    return updates;
}

vector<RepoEntry> parseRepoList(const string& output)
{
    vector<RepoEntry> entries;
    istringstream iss(output);
    string line;
    while (getline(iss, line)) {
        istringstream lineStream(line);
        RepoEntry entry;
        if (!(lineStream >> entry.repository >> entry.name)) {
            continue;
        }
        lineStream >> entry.version;
        entry.installed = line.find("[installed") != string::npos;
        entries.push_back(entry);
    }
    return entries;
}

vector<DependencyTreeNode> parseDependencyTree(const string& output)
{
    vector<DependencyTreeNode> nodes;

    /*
     * pactree output:
     * firefox
     * ├─dbus-glib
     * │ └─glib2
     * └─bash provides sh
     *
     * Each level of drawing is two glyphs wide ("├─", "│ ", "|-", "`-").
     */

    istringstream iss(output);
    string line;
    while (getline(iss, line)) {
        size_t start = 0;
        int glyphs = 0;
        while (start < line.size()) {
            unsigned char c = static_cast<unsigned char>(line[start]);
            if (c < 0x80 && (isalnum(c) || c == '@' || c == '_' || c == '+' || c == '.')) {
                break;
            }
            // Count UTF-8 lead bytes only
            if ((c & 0xC0) != 0x80) {
                ++glyphs;
            }
            ++start;
        }
        if (start >= line.size()) {
            continue;
        }

        istringstream rest(line.substr(start));
        DependencyTreeNode node;
        node.depth = glyphs / 2;
        rest >> node.name;

        string word;
        if (rest >> word && word == "provides") {
            rest >> node.provides;
        }
        nodes.push_back(node);
    }

    return nodes;
}

// ============================================================================
// Dry Runs
// ============================================================================

PrintOutput parsePrintOutput(const vector<string>& lines)
{
    PrintOutput out;
    for (const auto& raw : lines) {
        string line = trimString(raw);
        if (line.empty()) continue;

        istringstream iss(line);
        string name, version, extra;
        iss >> name >> version;
        bool more = static_cast<bool>(iss >> extra);

        if (!version.empty() && !more && isValidPackageName(name) &&
            !startsWith(line, "::")) {
            out.packages.push_back({name, version});
        } else {
            out.unrecognised.push_back(line);
        }
    }
    return out;
}

DryRunDiagnosis diagnoseDryRun(const vector<string>& lines)
{
    static const vector<string> conflictPatterns = {
        "are in conflict",
        "conflicting dependencies",
        "unresolvable package conflicts",
        "could not satisfy dependencies",
        "unable to satisfy dependency",
        "breaks dependency",
    };
    static const vector<string> notFoundPatterns = {
        "target not found",
        "no aur package found",
        "could not find all required packages",
    };

    DryRunDiagnosis diag;
    bool conflict = false;
    bool notFound = false;

    for (const auto& line : lines) {
        string lower = toLower(line);
        bool matched = false;

        for (const auto& pattern : conflictPatterns) {
            if (lower.find(pattern) != string::npos) {
                conflict = true;
                matched = true;
                break;
            }
        }
        if (!matched) {
            for (const auto& pattern : notFoundPatterns) {
                if (lower.find(pattern) != string::npos) {
                    notFound = true;
                    matched = true;
                    break;
                }
            }
        }

        if (matched || startsWith(lower, "error:") || startsWith(lower, ":: ")) {
            diag.lines.push_back(trimString(line));
        }
    }

    if (conflict) {
        diag.problem = DryRunProblem::CONFLICT;
    } else if (notFound) {
        diag.problem = DryRunProblem::TARGET_NOT_FOUND;
    } else {
        diag.lines.clear();
    }
    return diag;
}

// ============================================================================
// Progress Classification
// ============================================================================

namespace {

const long kMaxStepCount = 1000000;

} // namespace

LineClass classifyOutputLine(const string& line)
{
    LineClass cls;
    string trimmed = trimString(line);
    if (trimmed.empty()) {
        return cls;
    }

    string lower = toLower(trimmed);
    if (startsWith(lower, "error:") || startsWith(lower, "warning:")) {
        return cls;
    }

    // pacman step counter, padded as "( 3/12)" for long transactions
    static const regex counter("^\\(\\s*(\\d+)/(\\d+)\\)");
    smatch m;
    if (regex_search(trimmed, m, counter)) {
        // Counters that do not fit are still progress, just without a percentage
        long step = 0;
        long total = 0;
        string stepText = m[1].str();
        string totalText = m[2].str();
        auto stepParsed = from_chars(stepText.data(), stepText.data() + stepText.size(), step);
        auto totalParsed = from_chars(totalText.data(), totalText.data() + totalText.size(), total);
        cls.isProgress = true;
        if (stepParsed.ec == errc() && totalParsed.ec == errc() &&
            total > 0 && total <= kMaxStepCount && step <= total) {
            cls.percent = static_cast<int>(step * 100 / total);
        }
        return cls;
    }

    static const regex trailingPercent("(\\d{1,3})%\\s*$");
    if (regex_search(trimmed, m, trailingPercent)) {
        int value = stoi(m[1].str());
        if (value <= 100) {
            cls.isProgress = true;
            cls.percent = value;
            return cls;
        }
    }

    // Stage hints; "downloading" must be tested before "loading"
    static const vector<pair<string, optional<int>>> stages = {
        {"downloading", 50},
        {"installing", 75},
        {"upgrading", 75},
        {"removing", 60},
        {"loading", 40},
        {"checking", nullopt},
        {"building", nullopt},
    };
    for (const auto& [keyword, percent] : stages) {
        if (lower.find(keyword) != string::npos) {
            cls.isProgress = true;
            cls.percent = percent;
            return cls;
        }
    }

    return cls;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
