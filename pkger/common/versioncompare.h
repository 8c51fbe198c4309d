/* versioncompare.h - pacman version ordering
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * Versions have the form [epoch:]version[-release] and are ordered by
 * libalpm, so the merged view agrees with what pacman itself considers
 * an upgrade.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#ifndef _VERSIONCOMPARE_H_
#define _VERSIONCOMPARE_H_

#include <string>

namespace Pkger {

/**
 * Compare two version strings with alpm_pkg_vercmp().
 *
 * @return negative if a < b, 0 if equal, positive if a > b
 */
int vercmp(const std::string& a, const std::string& b);

inline bool versionLess(const std::string& a, const std::string& b) {
    return vercmp(a, b) < 0;
}

} // namespace Pkger

#endif // _VERSIONCOMPARE_H_

// vim:ts=4:sw=4:et
