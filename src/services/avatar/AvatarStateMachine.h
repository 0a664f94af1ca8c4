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

/******************************************************************************
 *
 *    AvatarStateMachine — per-frame procedural head / eye / body / blink pose
 *    for the four conversational states.
 *
 *    Per update(dt):
 *      1. dt is sanitized (NaN / negative -> 0, capped at MAX_FRAME_DT).
 *      2. The blink cycle advances; it ignores ConversationState entirely.
 *      3. Depending on MotionPhase:
 *           Transitioning  — head pulled straight to neutral, eyes follow
 *           MovementLocked — targets pinned at neutral, spring settles
 *           Active         — the state's behavior writes head/eye targets
 *         then the head spring and eye follow integrate toward the targets.
 *      4. Body sway re-rolls a small target on its own timer and eases to it.
 *
 *    Output is avatar-agnostic; see PoseVector for channel meanings.
 *
 *****************************************************************************/

#ifndef __AVATARSTATEMACHINE_H
#define __AVATARSTATEMACHINE_H

#include <cstdint>

#include "AvatarParams.h"
#include "BlinkCycle.h"
#include "RandomSource.h"
#include "StateBehaviors.h"

namespace Marionette {

class AvatarStateMachine {
public:
    /// seed == 0 draws a seed from std::random_device; any other value makes
    /// the motion reproducible.
    explicit AvatarStateMachine(const AvatarParams &params = AvatarParams(),
                                uint32_t seed = 0);

    /// Switch conversational state. No-op when unchanged; otherwise resets all
    /// per-state timers and scratch, retargets head/eyes to neutral and enters
    /// Transitioning.
    void setState(ConversationState state);

    ConversationState getState() const { return mState; }

    /// Advance by dt seconds and return the current pose.
    PoseVector update(float dt);

    // ── Tuning ──

    /// Replace all tunables. Values are clamped into range.
    void setParams(const AvatarParams &params);
    const AvatarParams &params() const { return mParams; }

    // ── Diagnostics (read-only) ──

    MotionPhase phase() const { return mPhase; }

    /// Seconds since the last effective setState() (or construction).
    float stateTime() const { return mStateTime; }

    const HeadSpring &head() const { return mHead; }
    const EyeGaze &eyes() const { return mEyes; }
    float bodyLean() const { return mBodyCurrent; }

    /// Blink cycle; the host may trigger() an explicit blink through it.
    BlinkCycle &blink() { return mBlink; }
    const BlinkCycle &blink() const { return mBlink; }

    void reseed(uint32_t seed) { mRng.reseed(seed); }

private:
    bool centerHead(float dt);
    void updateHeadPhysics(float dt);
    void updateSway(float dt);
    void repairNonFinite();
    PoseVector composePose() const;

    AvatarParams mParams;
    RandomSource mRng;

    ConversationState mState = ConversationState::Idle;
    MotionPhase mPhase = MotionPhase::Active;
    float mStateTime = 0.0f;
    float mTransitionTimer = 0.0f;
    float mLockTimer = 0.0f;

    HeadSpring mHead;
    EyeGaze mEyes;
    BehaviorScratch mScratch;

    float mBodyTimer = 0.0f;
    float mBodyTarget = 0.0f;
    float mBodyCurrent = 0.0f;

    BlinkCycle mBlink;
};

} // namespace Marionette

#endif
