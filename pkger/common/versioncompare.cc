/* versioncompare.cc - pacman version ordering
 *
 * Copyright (c) 2025 PKGER Contributors
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the
 * License, or (at your option) any later version.
 */

#include "versioncompare.h"

#include <alpm.h>

namespace Pkger {

int vercmp(const std::string& a, const std::string& b)
{
    int ret = alpm_pkg_vercmp(a.c_str(), b.c_str());
    return (ret > 0) - (ret < 0);
}

} // namespace Pkger

// vim:ts=4:sw=4:et
