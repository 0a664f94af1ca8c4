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

// PhonemeSmoother.h — the single output smoothing stage
//
// Every strategy's raw targets pass through here, so switching strategy
// never makes the mouth jump.
//
//   Symmetric:  one factor for every channel and direction; silenceFactor
//               replaces it for channels closing while the target is silence.
//   Asymmetric: per-channel attack (rising) / release (falling) factors;
//               while the target is silence the fastest configured factor
//               is used for every channel.

#pragma once

#include <algorithm>

#include "LipSyncParams.h"
#include "MarionetteMath.h"

namespace Marionette {

/// Per-frame factor for channel i moving from current toward target.
inline float smoothingFactor(const SmoothingParams &p, int i, float current,
                             float target, bool silent) {
    if (p.mode == SmoothingMode::Symmetric)
        return (silent && target < current) ? p.silenceFactor : p.factor;

    if (silent) {
        float fastest = p.silenceFactor;
        for (int c = 0; c < PHONEME_COUNT; ++c)
            fastest = std::max({fastest, p.attack[c], p.release[c]});
        return fastest;
    }
    return target > current ? p.attack[i] : p.release[i];
}

/// One smoothing step of dt seconds. Factors are per reference frame and
/// converted with frameBlend().
inline PhonemeVector smoothPhonemes(const PhonemeVector &current,
                                    const PhonemeVector &target, bool silent,
                                    const SmoothingParams &p, float dt) {
    PhonemeVector out;
    for (int i = 0; i < PHONEME_COUNT; ++i) {
        float k = frameBlend(smoothingFactor(p, i, current[i], target[i], silent), dt);
        out[i] = current[i] + (target[i] - current[i]) * k;
    }
    return out;
}

} // namespace Marionette
