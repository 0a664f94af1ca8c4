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

// BlinkCycle.h — spontaneous blinking, independent of conversation state
//
// A timer accumulates toward a randomized threshold. When it is crossed a
// blink plays over BlinkParams::duration with an asymmetric curve:
//
//   closing  (t < closeFraction):  (t / closeFraction)^2            accelerating
//   opening  (t >= closeFraction): ((1 - t) / (1 - closeFraction))^2 decelerating
//
// so the lid snaps shut and eases back open. After a blink completes there is a
// doubleBlinkChance of a second blink following after a short random delay;
// the follow-up never schedules a third.
//
// Usage:
//   BlinkCycle blink;
//   blink.reset(params, rng);
//   ...
//   float amount = blink.update(dt, params, rng);   // 0 = open, 1 = closed

#pragma once

#include <algorithm>

#include "AvatarParams.h"
#include "RandomSource.h"

namespace Marionette {

class BlinkCycle {
public:
    /// Start a fresh cycle with the first blink drawn from the first-blink range.
    inline void reset(const BlinkParams &p, RandomSource &rng) {
        mState = BlinkState();
        mState.nextBlinkAt = rng.range(p.firstBlinkMin, p.firstBlinkMax);
        mAmount = 0.0f;
    }

    /// Advance by dt (sanitized) and return the blink amount in [0, 1].
    inline float update(float dt, const BlinkParams &p, RandomSource &rng) {
        mState.timer += dt;

        if (mState.isBlinking) {
            mState.progress += dt;
            float t = mState.progress / p.duration;
            if (t >= 1.0f) {
                finishBlink(p, rng);
            } else {
                mAmount = curve(t, p.closeFraction);
            }
        } else if (mState.pendingDoubleBlink) {
            mState.doubleBlinkDelay -= dt;
            if (mState.doubleBlinkDelay <= 0.0f) {
                mState.pendingDoubleBlink = false;
                startBlink(true);
            }
        } else if (mState.timer >= mState.nextBlinkAt) {
            mState.nextBlinkAt = rng.range(p.intervalMin, p.intervalMax);
            startBlink(false);
        }

        return mAmount;
    }

    /// Blink now (host request, e.g. an emotion cue). Ignored mid-blink.
    inline void trigger() {
        if (mState.isBlinking) return;
        mState.pendingDoubleBlink = false;
        startBlink(false);
    }

    inline float amount() const { return mAmount; }
    inline bool isBlinking() const { return mState.isBlinking; }
    inline const BlinkState &state() const { return mState; }

    /// Lid closure at normalized blink time t in [0, 1].
    static inline float curve(float t, float closeFraction) {
        t = std::clamp(t, 0.0f, 1.0f);
        if (t < closeFraction) {
            float c = t / closeFraction;
            return c * c;
        }
        float o = (1.0f - t) / (1.0f - closeFraction);
        return o * o;
    }

private:
    inline void startBlink(bool isDouble) {
        mState.timer = 0.0f;
        mState.isBlinking = true;
        mState.progress = 0.0f;
        mState.inDoubleBlink = isDouble;
    }

    inline void finishBlink(const BlinkParams &p, RandomSource &rng) {
        mState.isBlinking = false;
        mState.progress = 0.0f;
        mAmount = 0.0f;

        if (!mState.inDoubleBlink && rng.chance(p.doubleBlinkChance)) {
            mState.pendingDoubleBlink = true;
            mState.doubleBlinkDelay = rng.range(p.doubleDelayMin, p.doubleDelayMax);
        }
        mState.inDoubleBlink = false;
    }

    BlinkState mState;
    float mAmount = 0.0f;
};

} // namespace Marionette
