/******************************************************************************
 *
 *    This file is part of the Marionette project
 *    Copyright (C) 2024-2026 Marionette contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

// ParamClamp.h — bound tunables to their valid range
//
// Out-of-range configuration is never rejected: each value is pulled to the
// nearest valid bound and the adjustment is logged. Non-finite input has no
// nearest bound and falls back to the lower one.

#pragma once

#include <algorithm>
#include <cmath>

#include "logger.h"

namespace Marionette {

/// Clamp v into [lo, hi]. Returns true if v was changed.
inline bool clampParam(float &v, float lo, float hi, const char *name) {
    if (!std::isfinite(v)) {
        LOG_ERROR("Config: '%s' is not a finite number, using %g", name,
                  static_cast<double>(lo));
        v = lo;
        return true;
    }
    if (v < lo || v > hi) {
        float c = std::clamp(v, lo, hi);
        LOG_INFO("Config: '%s' = %g out of range [%g, %g], clamped to %g",
                 name, static_cast<double>(v), static_cast<double>(lo),
                 static_cast<double>(hi), static_cast<double>(c));
        v = c;
        return true;
    }
    return false;
}

inline bool clampParam(int &v, int lo, int hi, const char *name) {
    if (v < lo || v > hi) {
        int c = std::clamp(v, lo, hi);
        LOG_INFO("Config: '%s' = %d out of range [%d, %d], clamped to %d",
                 name, v, lo, hi, c);
        v = c;
        return true;
    }
    return false;
}

/// Clamp a [minV, maxV] pair into [lo, hi] and make sure minV <= maxV.
/// An inverted pair collapses onto minV.
inline void clampRange(float &minV, float &maxV, float lo, float hi,
                       const char *name) {
    clampParam(minV, lo, hi, name);
    clampParam(maxV, lo, hi, name);
    if (maxV < minV) {
        LOG_INFO("Config: '%s' range inverted (%g > %g), using %g", name,
                 static_cast<double>(minV), static_cast<double>(maxV),
                 static_cast<double>(minV));
        maxV = minV;
    }
}

} // namespace Marionette
