/* dependencyresolver.h - Dry-run planning and conflict checks
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * The resolver does not solve dependencies itself. It asks pacman (or the
 * AUR helper) what a request would do, using --print dry runs, and turns
 * the answer into a Plan. Nothing here changes system state.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _DEPENDENCYRESOLVER_H_
#define _DEPENDENCYRESOLVER_H_

#include "pkgtypes.h"
#include "configuration.h"
#include "metadatacache.h"
#include "processrunner.h"

#include <string>
#include <vector>

namespace Pkger {

struct PlanResult {
    OperationResult result;
    Plan plan;
};

/**
 * TargetSplit - Which targets pacman handles and which go to the AUR helper
 */
struct TargetSplit {
    std::vector<std::string> official;
    std::vector<std::string> aur;
};

// Package file suffixes accepted for local installs
const std::vector<std::string>& localPackageSuffixes();

class DependencyResolver {
public:
    DependencyResolver(IProcessRunner& runner,
                       MetadataCache& cache,
                       const Configuration& config);

    /**
     * Check a request before anything is launched: target names, target
     * presence, AUR availability and the local package file.
     *
     * @return VALIDATION_ERROR on any problem
     */
    OperationResult validate(const OperationRequest& request) const;

    /**
     * Dry-run the request.
     *
     * Conflicts reported by the tool give UNRESOLVABLE_CONFLICT with the
     * tool lines in details and plan.conflicts; unknown targets give
     * VALIDATION_ERROR. Output lines the parser does not understand end
     * up in plan.warnings.
     */
    PlanResult plan(const OperationRequest& request,
                    const CancelToken& cancel = CancelToken());

    /**
     * Installed-source targets of foreign packages belong to the AUR
     * helper; everything else goes to pacman.
     */
    TargetSplit splitTargets(const OperationRequest& request) const;

private:
    PlanResult dryRun(const std::vector<std::string>& operation,
                      const std::vector<std::string>& targets,
                      bool removal,
                      const CancelToken& cancel);
    PlanResult planAur(const std::vector<std::string>& names,
                       const CancelToken& cancel);
    PlanResult planOrphanClean(const CancelToken& cancel);

    IProcessRunner& _runner;
    MetadataCache& _cache;
    Configuration _config;
};

} // namespace Pkger

#endif // _DEPENDENCYRESOLVER_H_

// vim:ts=4:sw=4:et
