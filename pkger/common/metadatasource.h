/* metadatasource.h - Per-source package metadata fetchers
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * A MetadataSource turns the output of one external tool into package
 * records for one PackageSource:
 *
 *   Official   pacman -Si [names]
 *   Installed  pacman -Qi [names]
 *   AUR        pacman -Qmq, then yay -Si --aur <names>
 *
 * To add a source, implement MetadataSource and return it from
 * createMetadataSource(); the cache does not need to change.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _METADATASOURCE_H_
#define _METADATASOURCE_H_

#include "pkgtypes.h"
#include "processrunner.h"
#include "configuration.h"

#include <string>
#include <vector>
#include <memory>

namespace Pkger {

/**
 * FetchResult - Records from one fetch, or why there are none
 */
struct FetchResult {
    OperationResult result;
    std::vector<PackageRecord> records;
};

class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    virtual PackageSource source() const = 0;

    // Every package the source knows about
    virtual FetchResult fetchAll(const CancelToken& cancel) = 0;

    /**
     * Re-query specific packages. Names the tool no longer knows are
     * simply absent from the records; that is not a failure.
     */
    virtual FetchResult fetchNames(const std::vector<std::string>& names,
                                   const CancelToken& cancel) = 0;
};

/**
 * PacmanInfoSource - Official and Installed records from pacman -Si / -Qi
 */
class PacmanInfoSource : public MetadataSource {
public:
    PacmanInfoSource(PackageSource source,
                     IProcessRunner& runner,
                     const Configuration& config);

    PackageSource source() const override { return _source; }

    FetchResult fetchAll(const CancelToken& cancel) override;
    FetchResult fetchNames(const std::vector<std::string>& names,
                           const CancelToken& cancel) override;

private:
    FetchResult query(const std::vector<std::string>& names,
                      const CancelToken& cancel);

    PackageSource _source;
    IProcessRunner& _runner;
    Configuration _config;
};

/**
 * AurSource - Foreign packages described by the AUR helper
 *
 * Only AUR packages that are installed are fetched in bulk; other AUR
 * packages enter the cache through search discovery.
 */
class AurSource : public MetadataSource {
public:
    AurSource(IProcessRunner& runner, const Configuration& config);

    PackageSource source() const override { return PackageSource::AUR; }

    FetchResult fetchAll(const CancelToken& cancel) override;
    FetchResult fetchNames(const std::vector<std::string>& names,
                           const CancelToken& cancel) override;

private:
    IProcessRunner& _runner;
    Configuration _config;
};

std::unique_ptr<MetadataSource> createMetadataSource(PackageSource source,
                                                     IProcessRunner& runner,
                                                     const Configuration& config);

} // namespace Pkger

#endif // _METADATASOURCE_H_

// vim:ts=4:sw=4:et
