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

// MouthForm.h — collapse a PhonemeVector to a two-parameter mouth
//
// For rigs that only expose "mouth open" and "mouth form" (smile/pout)
// parameters instead of per-vowel blend shapes.

#pragma once

#include <algorithm>

#include "PhonemeTypes.h"

namespace Marionette {

struct MouthForm {
    float open = 0.0f;  // [0, 1]
    float form = 0.0f;  // [-1, 1], +1 spread, -1 rounded
};

inline MouthForm toMouthForm(const PhonemeVector &v) {
    MouthForm m;
    m.open = std::clamp(v.aa + v.oh * 0.8f + v.ou * 0.7f + v.ee * 0.4f + v.ih * 0.3f,
                        0.0f, 1.0f);
    m.form = std::clamp((v.ee * 0.6f + v.ih * 0.4f) - (v.oh * 0.5f + v.ou * 0.7f),
                        -1.0f, 1.0f);
    return m;
}

} // namespace Marionette
