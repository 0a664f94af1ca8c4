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

// RandomSource.h — seeded uniform random numbers for procedural motion
//
// Every stochastic decision in the state machine (look-away rolls, blink
// intervals, nod variation) draws from one RandomSource owned by the machine,
// so a fixed seed replays the exact same motion. Tests and the headless
// driver rely on that.

#pragma once

#include <cstdint>
#include <random>

namespace Marionette {

class RandomSource {
public:
    explicit RandomSource(uint32_t seed = 0x6d617269u) : mEngine(seed) {}

    inline void reseed(uint32_t seed) { mEngine.seed(seed); }

    /// Uniform in [0, 1).
    inline float uniform() { return mDist(mEngine); }

    /// Uniform in [lo, hi).
    inline float range(float lo, float hi) { return lo + uniform() * (hi - lo); }

    /// True with probability p (p <= 0 never, p >= 1 always).
    inline bool chance(float p) { return uniform() < p; }

    /// -1 or +1 with equal probability.
    inline float sign() { return uniform() < 0.5f ? -1.0f : 1.0f; }

private:
    std::mt19937 mEngine;
    std::uniform_real_distribution<float> mDist{0.0f, 1.0f};
};

} // namespace Marionette
