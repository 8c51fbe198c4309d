/* metadatasource.cc - Per-source package metadata fetchers
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "metadatasource.h"
#include "outputparsers.h"
#include "structuredlog.h"

#include <algorithm>

using namespace std;

namespace Pkger {

namespace {

// Keeps argument vectors well below ARG_MAX for large AUR sets
const size_t kNamesPerQuery = 200;

/**
 * Interpret a captured info query. A targeted query (names given) exits
 * non-zero when some names are unknown; the known ones are still printed.
 */
FetchResult interpretInfoOutput(const CommandOutput& out,
                                PackageSource source,
                                bool targeted,
                                const string& what)
{
    FetchResult fetch;
    const ExitStatus& status = out.status;

    bool usable = status.ok() || (targeted && status.exited());
    if (!usable) {
        vector<string> tail = out.stderrLines;
        if (tail.size() > 20) {
            tail.erase(tail.begin(), tail.end() - 20);
        }
        fetch.result = resultFromStatus(status, what, tail);
        return fetch;
    }

    fetch.records = parsePackageInfo(out.stdoutText(), source);

    if (fetch.records.empty() && !targeted && !out.stdoutLines.empty()) {
        fetch.result = OperationResult::Failure(
            ErrorKind::PARSE_ERROR,
            what + " produced output that could not be parsed",
            out.stdoutLines.front());
        return fetch;
    }

    fetch.result = OperationResult::Success(
        to_string(fetch.records.size()) + " packages from " + what);
    return fetch;
}

} // namespace

// ============================================================================
// PacmanInfoSource
// ============================================================================

PacmanInfoSource::PacmanInfoSource(PackageSource source,
                                   IProcessRunner& runner,
                                   const Configuration& config)
    : _source(source)
    , _runner(runner)
    , _config(config)
{
}

FetchResult PacmanInfoSource::fetchAll(const CancelToken& cancel)
{
    return query({}, cancel);
}

FetchResult PacmanInfoSource::fetchNames(const vector<string>& names,
                                         const CancelToken& cancel)
{
    FetchResult combined;
    combined.result = OperationResult::Success();

    for (size_t i = 0; i < names.size(); i += kNamesPerQuery) {
        size_t end = min(names.size(), i + kNamesPerQuery);
        vector<string> chunk(names.begin() + i, names.begin() + end);

        FetchResult part = query(chunk, cancel);
        if (!part.result.success) {
            return part;
        }
        combined.records.insert(combined.records.end(),
                                part.records.begin(), part.records.end());
    }
    return combined;
}

FetchResult PacmanInfoSource::query(const vector<string>& names,
                                    const CancelToken& cancel)
{
    bool installed = (_source == PackageSource::INSTALLED);

    CommandSpec spec(_config.pacmanPath, {installed ? "-Qi" : "-Si"});
    spec.args.insert(spec.args.end(), names.begin(), names.end());
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "MetadataSource", cancel);
    return interpretInfoOutput(out, _source, !names.empty(),
                               installed ? "pacman -Qi" : "pacman -Si");
}

// ============================================================================
// AurSource
// ============================================================================

AurSource::AurSource(IProcessRunner& runner, const Configuration& config)
    : _runner(runner)
    , _config(config)
{
}

FetchResult AurSource::fetchAll(const CancelToken& cancel)
{
    FetchResult fetch;

    if (!_config.aurEnabled) {
        fetch.result = OperationResult::Success("AUR support disabled");
        return fetch;
    }

    // Foreign packages: those not found in any sync database
    CommandSpec spec(_config.pacmanPath, {"-Qmq"});
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "MetadataSource", cancel);

    // Exit 1 without output means there are no foreign packages
    if (out.status.exited() && out.status.exitCode == 1 && out.stdoutLines.empty()) {
        fetch.result = OperationResult::Success("No foreign packages installed");
        return fetch;
    }
    if (!out.status.ok()) {
        fetch.result = resultFromStatus(out.status, "pacman -Qmq", out.stderrLines);
        return fetch;
    }

    vector<string> names = parseNameList(out.stdoutText());
    if (names.empty()) {
        fetch.result = OperationResult::Success("No foreign packages installed");
        return fetch;
    }

    return fetchNames(names, cancel);
}

FetchResult AurSource::fetchNames(const vector<string>& names,
                                  const CancelToken& cancel)
{
    FetchResult combined;
    combined.result = OperationResult::Success();

    if (!_config.aurEnabled || names.empty()) {
        return combined;
    }

    for (size_t i = 0; i < names.size(); i += kNamesPerQuery) {
        size_t end = min(names.size(), i + kNamesPerQuery);

        CommandSpec spec(_config.aurHelperPath, {"-Si", "--aur"});
        spec.args.insert(spec.args.end(), names.begin() + i, names.begin() + end);
        spec.timeoutSeconds = _config.queryTimeoutSeconds;
        spec.graceMs = _config.cancelGraceMs;

        CommandOutput out = captureCommand(_runner, spec, "MetadataSource", cancel);
        FetchResult part = interpretInfoOutput(out, PackageSource::AUR, true,
                                               _config.aurHelperPath + " -Si --aur");
        if (!part.result.success) {
            return part;
        }
        combined.records.insert(combined.records.end(),
                                part.records.begin(), part.records.end());
    }

    combined.result = OperationResult::Success(
        to_string(combined.records.size()) + " AUR packages");
    return combined;
}

// ============================================================================
// Factory
// ============================================================================

unique_ptr<MetadataSource> createMetadataSource(PackageSource source,
                                                IProcessRunner& runner,
                                                const Configuration& config)
{
    switch (source) {
        case PackageSource::OFFICIAL:
        case PackageSource::INSTALLED:
            return make_unique<PacmanInfoSource>(source, runner, config);
        case PackageSource::AUR:
            return make_unique<AurSource>(runner, config);
    }
    return nullptr;
}

} // namespace Pkger

// vim:ts=4:sw=4:et
