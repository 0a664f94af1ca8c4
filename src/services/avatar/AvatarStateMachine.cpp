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

#include "AvatarStateMachine.h"
#include "SpringIntegrator.h"
#include "logger.h"

#include <cmath>
#include <random>

namespace Marionette {

static uint32_t resolveSeed(uint32_t seed) {
    if (seed != 0)
        return seed;
    std::random_device rd;
    return rd();
}

/*----------------------------------------------------*/
/*----------------- AvatarStateMachine ---------------*/
/*----------------------------------------------------*/
AvatarStateMachine::AvatarStateMachine(const AvatarParams &params, uint32_t seed)
    : mParams(params), mRng(resolveSeed(seed)) {
    sanitizeParams(mParams);
    mBlink.reset(mParams.blink, mRng);
}

//------------------------------------------------------
void AvatarStateMachine::setState(ConversationState state) {
    if (state == mState)
        return;

    LOG_DEBUG("AvatarStateMachine: %s -> %s", conversationStateName(mState),
              conversationStateName(state));

    mState = state;
    mStateTime = 0.0f;

    // Head eases to center before the new behavior starts
    mPhase = MotionPhase::Transitioning;
    mTransitionTimer = 0.0f;
    mLockTimer = 0.0f;
    mHead.target = Vector3(0.0f);
    mEyes.target = Vector2(0.0f);

    mScratch.reset();
}

//------------------------------------------------------
void AvatarStateMachine::setParams(const AvatarParams &params) {
    mParams = params;
    sanitizeParams(mParams);
}

//------------------------------------------------------
PoseVector AvatarStateMachine::update(float rawDt) {
    const float dt = sanitizeDt(rawDt);
    const MotionParams &mp = mParams.motion;

    mBlink.update(dt, mParams.blink, mRng);

    switch (mPhase) {
    case MotionPhase::Transitioning: {
        mTransitionTimer += dt;
        bool centered = centerHead(dt);
        if (centered && mTransitionTimer >= mp.minTransitionTime) {
            mPhase = MotionPhase::MovementLocked;
            mLockTimer = 0.0f;
            mHead.velocity = Vector3(0.0f);
        }
        break;
    }
    case MotionPhase::MovementLocked:
        mLockTimer += dt;
        mHead.target = Vector3(0.0f);
        mEyes.target = Vector2(0.0f);
        updateHeadPhysics(dt);
        lerpEyes(mEyes, mp.lockEyeRate, dt);
        if (mLockTimer >= mp.lockDuration)
            mPhase = MotionPhase::Active;
        break;
    case MotionPhase::Active: {
        MotionTargets targets{mHead.target, mEyes.target};
        stepBehavior(mState, mScratch, mParams, targets, mStateTime, dt, mRng);
        mHead.target = targets.head;
        mEyes.target = targets.eyes;
        updateHeadPhysics(dt);
        lerpEyes(mEyes, mParams.stateMotion(mState).eyeRate, dt);
        break;
    }
    }

    mStateTime += dt;
    updateSway(dt);
    repairNonFinite();

    return composePose();
}

//------------------------------------------------------
bool AvatarStateMachine::centerHead(float dt) {
    const MotionParams &mp = mParams.motion;

    float k = frameBlend(mp.transitionEase, dt);
    mHead.current += (Vector3(0.0f) - mHead.current) * k;
    mHead.velocity *= frameDecay(mp.transitionVelDecay, dt);

    mEyes.target = Vector2(0.0f);
    lerpEyes(mEyes, mp.transitionEase * mp.transitionEyeScale, dt);

    return isCentered(mHead.current, mp.centerEpsilon);
}

//------------------------------------------------------
void AvatarStateMachine::updateHeadPhysics(float dt) {
    const MotionParams &mp = mParams.motion;
    float acc = mp.baseAcceleration * mParams.stateMotion(mState).accelMultiplier;
    integrateSpring(mHead, acc, mp.damping, mp.velocityCap, dt);
}

//------------------------------------------------------
void AvatarStateMachine::updateSway(float dt) {
    const SwayParams &sp = mParams.sway;
    mBodyTimer += dt;
    if (mBodyTimer > sp.interval) {
        mBodyTarget = mRng.range(-sp.range, sp.range);
        mBodyTimer = 0.0f;
    }
    mBodyCurrent += (mBodyTarget - mBodyCurrent) * frameBlend(sp.ease, dt);
}

//------------------------------------------------------
void AvatarStateMachine::repairNonFinite() {
    // Only reachable through non-finite targets; snap back to neutral rather
    // than let a NaN latch into the spring forever.
    if (!isFinite(mHead.current) || !isFinite(mHead.velocity) ||
        !isFinite(mHead.target)) {
        LOG_ERROR("AvatarStateMachine: non-finite head state, resetting to neutral");
        mHead = HeadSpring();
    }
    if (!isFinite(mEyes.current) || !isFinite(mEyes.target)) {
        LOG_ERROR("AvatarStateMachine: non-finite eye state, resetting to neutral");
        mEyes = EyeGaze();
    }
    if (!std::isfinite(mBodyCurrent) || !std::isfinite(mBodyTarget)) {
        mBodyCurrent = 0.0f;
        mBodyTarget = 0.0f;
    }
}

//------------------------------------------------------
PoseVector AvatarStateMachine::composePose() const {
    PoseVector pose;
    pose.headPitch = mHead.current.x;
    pose.headYaw   = mHead.current.y;
    pose.headRoll  = mHead.current.z;
    pose.bodyLean  = mBodyCurrent;
    pose.eyeX      = mEyes.current.x;
    pose.eyeY      = mEyes.current.y;
    pose.blink     = mBlink.amount();
    return pose;
}

} // namespace Marionette
