/* dependencyresolver.cc - Dry-run planning and conflict checks
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "dependencyresolver.h"
#include "outputparsers.h"
#include "structuredlog.h"

#include <filesystem>
#include <set>

using namespace std;

namespace Pkger {

const vector<string>& localPackageSuffixes()
{
    static const vector<string> suffixes = {
        ".pkg.tar.zst",
        ".pkg.tar.xz",
        ".pkg.tar.gz",
        ".pkg.tar",
    };
    return suffixes;
}

namespace {

bool endsWith(const string& s, const string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

string joinLines(const vector<string>& lines)
{
    string s;
    for (const auto& line : lines) {
        if (!s.empty()) s += "\n";
        s += line;
    }
    return s;
}

void appendPlan(PlanResult& into, const PlanResult& from)
{
    Plan& p = into.plan;
    const Plan& q = from.plan;
    p.toInstall.insert(p.toInstall.end(), q.toInstall.begin(), q.toInstall.end());
    p.toRemove.insert(p.toRemove.end(), q.toRemove.begin(), q.toRemove.end());
    p.conflicts.insert(p.conflicts.end(), q.conflicts.begin(), q.conflicts.end());
    p.warnings.insert(p.warnings.end(), q.warnings.begin(), q.warnings.end());
}

bool needsTargets(OperationKind kind)
{
    return kind == OperationKind::INSTALL ||
           kind == OperationKind::REMOVE ||
           kind == OperationKind::REINSTALL ||
           kind == OperationKind::UPDATE_SELECTED;
}

} // namespace

DependencyResolver::DependencyResolver(IProcessRunner& runner,
                                       MetadataCache& cache,
                                       const Configuration& config)
    : _runner(runner)
    , _cache(cache)
    , _config(config)
{
}

// ============================================================================
// Validation
// ============================================================================

OperationResult DependencyResolver::validate(const OperationRequest& request) const
{
    if (request.kind == OperationKind::INSTALL_LOCAL_FILE) {
        const string& path = request.localFile;
        if (path.empty()) {
            return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                "No package file given");
        }

        error_code ec;
        filesystem::file_status st = filesystem::status(path, ec);
        if (ec || !filesystem::exists(st)) {
            return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                "Package file does not exist: " + path);
        }
        if (!filesystem::is_regular_file(st)) {
            return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                "Not a regular file: " + path);
        }

        bool suffixOk = false;
        for (const auto& suffix : localPackageSuffixes()) {
            if (endsWith(path, suffix)) {
                suffixOk = true;
                break;
            }
        }
        if (!suffixOk) {
            return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                "Not a package file (expected .pkg.tar.zst, .pkg.tar.xz, "
                ".pkg.tar.gz or .pkg.tar): " + path);
        }
        return OperationResult::Success();
    }

    if (needsTargets(request.kind) && request.targets.empty()) {
        return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            string("No packages selected for ") + operationKindToString(request.kind));
    }

    for (const auto& target : request.targets) {
        if (!isValidPackageName(target.name)) {
            return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
                "Invalid package name: " + target.name);
        }
    }

    if (request.kind != OperationKind::REMOVE && !_config.aurEnabled &&
        !splitTargets(request).aur.empty()) {
        return OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            "AUR packages were requested but AUR support is disabled");
    }

    return OperationResult::Success();
}

TargetSplit DependencyResolver::splitTargets(const OperationRequest& request) const
{
    TargetSplit split;
    SnapshotSet view = _cache.snapshots();

    for (const auto& target : request.targets) {
        bool aur = false;
        switch (target.source) {
            case PackageSource::AUR:
                aur = true;
                break;
            case PackageSource::INSTALLED:
                // Foreign packages are known to the AUR snapshot only
                aur = view.aur->find(target.name) != nullptr &&
                      view.official->find(target.name) == nullptr;
                break;
            case PackageSource::OFFICIAL:
                break;
        }

        if (aur && request.kind != OperationKind::REMOVE) {
            split.aur.push_back(target.name);
        } else {
            split.official.push_back(target.name);
        }
    }
    return split;
}

// ============================================================================
// Planning
// ============================================================================

PlanResult DependencyResolver::plan(const OperationRequest& request, const CancelToken& cancel)
{
    ScopedLogTimer timer(LogLevel::INFO, "Resolver", "plan");

    PlanResult planned;
    planned.result = OperationResult::Success("Nothing to check");

    TargetSplit split = splitTargets(request);

    switch (request.kind) {
        case OperationKind::INSTALL:
        case OperationKind::REINSTALL:
        case OperationKind::UPDATE_SELECTED: {
            vector<string> op = {"-S"};
            if (request.kind == OperationKind::INSTALL) {
                op.push_back("--needed");
            }
            if (!split.official.empty()) {
                planned = dryRun(op, split.official, false, cancel);
                if (!planned.result.success) break;
            }
            if (!split.aur.empty()) {
                PlanResult aur = planAur(split.aur, cancel);
                if (!aur.result.success) {
                    appendPlan(aur, planned);
                    planned = aur;
                    break;
                }
                appendPlan(planned, aur);
                planned.result = OperationResult::Success("Plan ready");
            }
            break;
        }

        case OperationKind::REMOVE:
            planned = dryRun({"-R"}, split.official, true, cancel);
            break;

        case OperationKind::UPDATE_ALL:
            planned = dryRun({"-Su"}, {}, false, cancel);
            if (planned.result.success && _config.aurEnabled && _config.aurUpdates) {
                planned.plan.warnings.push_back(
                    "AUR updates are determined by " + _config.aurHelperPath + " during the upgrade");
            }
            break;

        case OperationKind::INSTALL_LOCAL_FILE:
            planned = dryRun({"-U"}, {request.localFile}, false, cancel);
            break;

        case OperationKind::ORPHAN_CLEAN:
            planned = planOrphanClean(cancel);
            break;

        case OperationKind::CACHE_CLEAN:
        case OperationKind::SYNC_DATABASES:
            break;
    }

    if (!planned.result.success) {
        timer.fail(planned.result.message, errorKindToString(planned.result.error));
    }

    LOG(LogLevel::DEBUG)
        .component("Resolver")
        .operation(operationKindToString(request.kind))
        .field("install", to_string(planned.plan.toInstall.size()))
        .field("remove", to_string(planned.plan.toRemove.size()))
        .field("warnings", to_string(planned.plan.warnings.size()))
        .message(planned.result.message)
        .emit();

    return planned;
}

PlanResult DependencyResolver::dryRun(const vector<string>& operation,
                                      const vector<string>& targets,
                                      bool removal,
                                      const CancelToken& cancel)
{
    PlanResult planned;

    CommandSpec spec(_config.pacmanPath, operation);
    spec.args.push_back("--print");
    spec.args.push_back("--print-format");
    spec.args.push_back("%n %v");
    spec.args.insert(spec.args.end(), targets.begin(), targets.end());
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "Resolver", cancel);

    if (out.status.kind != ExitStatus::Kind::EXITED) {
        planned.result = resultFromStatus(out.status, "pacman dry run", out.stderrLines);
        return planned;
    }

    vector<string> all = out.stdoutLines;
    all.insert(all.end(), out.stderrLines.begin(), out.stderrLines.end());

    DryRunDiagnosis diag = diagnoseDryRun(all);
    if (diag.problem == DryRunProblem::CONFLICT) {
        planned.plan.conflicts = diag.lines;
        planned.result = OperationResult::Failure(ErrorKind::UNRESOLVABLE_CONFLICT,
            "The package manager reported a conflict it cannot resolve",
            joinLines(diag.lines), out.status.exitCode);
        planned.result.outputTail = diag.lines;
        return planned;
    }
    if (diag.problem == DryRunProblem::TARGET_NOT_FOUND) {
        planned.result = OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            "Package not found", joinLines(diag.lines), out.status.exitCode);
        planned.result.outputTail = diag.lines;
        return planned;
    }
    if (!out.status.ok()) {
        planned.result = resultFromStatus(out.status, "pacman dry run", out.stderrLines);
        return planned;
    }

    PrintOutput printed = parsePrintOutput(out.stdoutLines);
    if (removal) {
        planned.plan.toRemove = printed.packages;
    } else {
        planned.plan.toInstall = printed.packages;
    }
    planned.plan.warnings = printed.unrecognised;
    for (const auto& line : out.stderrLines) {
        planned.plan.warnings.push_back(trimString(line));
    }

    planned.result = OperationResult::Success("Plan ready");
    return planned;
}

PlanResult DependencyResolver::planAur(const vector<string>& names, const CancelToken& cancel)
{
    PlanResult planned;

    CommandSpec spec(_config.aurHelperPath, {"-Si", "--aur"});
    spec.args.insert(spec.args.end(), names.begin(), names.end());
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "Resolver", cancel);
    if (!out.status.exited()) {
        planned.result = resultFromStatus(out.status, _config.aurHelperPath + " -Si", out.stderrLines);
        return planned;
    }

    vector<PackageRecord> records = parsePackageInfo(out.stdoutText(), PackageSource::AUR);

    set<string> found;
    for (const auto& rec : records) {
        found.insert(rec.name);
    }
    vector<string> missing;
    for (const auto& name : names) {
        if (!found.count(name)) {
            missing.push_back("target not found: " + name);
        }
    }
    if (!missing.empty()) {
        planned.result = OperationResult::Failure(ErrorKind::VALIDATION_ERROR,
            "Package not found in the AUR", joinLines(missing), out.status.exitCode);
        planned.result.outputTail = missing;
        return planned;
    }

    SnapshotSet view = _cache.snapshots();
    set<string> requested(names.begin(), names.end());

    for (const auto& rec : records) {
        planned.plan.toInstall.push_back({rec.name, rec.version});

        for (const auto& entry : rec.conflicts) {
            string other = dependencyName(entry);
            if (other != rec.name && !requested.count(other) && view.installed->find(other)) {
                planned.plan.conflicts.push_back(
                    rec.name + " and " + other + " are in conflict");
            }
        }

        for (const auto& dep : rec.dependencies) {
            string depName = dependencyName(dep);
            if (!view.installed->find(depName) && !view.official->find(depName) &&
                !view.aur->find(depName) && !requested.count(depName)) {
                planned.plan.warnings.push_back(
                    "Dependency " + dep + " of " + rec.name + " is not in the package cache");
            }
        }
    }

    if (!planned.plan.conflicts.empty()) {
        planned.result = OperationResult::Failure(ErrorKind::UNRESOLVABLE_CONFLICT,
            "AUR package conflicts with installed packages",
            joinLines(planned.plan.conflicts));
        planned.result.outputTail = planned.plan.conflicts;
        return planned;
    }

    planned.result = OperationResult::Success("Plan ready");
    return planned;
}

PlanResult DependencyResolver::planOrphanClean(const CancelToken& cancel)
{
    PlanResult planned;

    CommandSpec spec(_config.pacmanPath, {"-Qtdq"});
    spec.timeoutSeconds = _config.queryTimeoutSeconds;
    spec.graceMs = _config.cancelGraceMs;

    CommandOutput out = captureCommand(_runner, spec, "Resolver", cancel);

    // Exit 1 without output: there are no orphans
    if (out.status.exited() && out.status.exitCode == 1 && out.stdoutLines.empty()) {
        planned.result = OperationResult::Success("No orphan packages");
        return planned;
    }
    if (!out.status.ok()) {
        planned.result = resultFromStatus(out.status, "pacman -Qtdq", out.stderrLines);
        return planned;
    }

    vector<string> orphans = parseNameList(out.stdoutText());
    if (orphans.empty()) {
        planned.result = OperationResult::Success("No orphan packages");
        return planned;
    }

    return dryRun({"-Rns"}, orphans, true, cancel);
}

} // namespace Pkger

// vim:ts=4:sw=4:et
