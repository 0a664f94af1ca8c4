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

#include "StateBehaviors.h"

#include <cmath>

namespace Marionette {

// Upward bias of a thinking look-away, per unit of lookUpBias.
static constexpr float THINKING_UP_BIAS_SCALE = 0.20f;

// Thinking look-away angles span 1.6π starting at -0.3π, which keeps the
// head out of the straight-down quadrant.
static constexpr float THINKING_ANGLE_SPAN  = 1.6f * PI;
static constexpr float THINKING_ANGLE_START = -0.3f * PI;

// Talking eyes drift vertically within this band regardless of eyeRange.
static constexpr float TALKING_EYE_VERTICAL = 0.08f;

/*----------------------------------------------------*/
/*----------------------- Idle -----------------------*/
/*----------------------------------------------------*/
void stepIdle(IdleScratch &s, const IdleParams &p, MotionTargets &t, float dt,
              RandomSource &rng) {
    s.headTimer += dt;

    if (s.lookingAtUser) {
        s.lookAtUserTimer -= dt;
        if (s.lookAtUserTimer <= 0.0f) {
            s.lookingAtUser = false;
            s.headTimer = 0.0f;
        }
        return;
    }

    if (s.headTimer <= p.lookDuration)
        return;

    if (rng.chance(p.lookAtUserChance)) {
        s.lookingAtUser = true;
        s.lookAtUserTimer = rng.range(p.lookAtUserDurationMin, p.lookAtUserDurationMax);
        t.head = Vector3(0.0f);
        t.eyes = Vector2(0.0f);
        s.headTimer = 0.0f;
    } else if (rng.chance(p.lookChangeChance)) {
        // Point on a circle scaled per axis; roll is independent
        float angle = rng.uniform() * TWO_PI;
        float rangeMult = rng.range(0.6f, 1.0f);
        t.head = Vector3(std::sin(angle) * p.headRange.x * rangeMult,
                         std::cos(angle) * p.headRange.y * rangeMult,
                         rng.range(-p.headRange.z, p.headRange.z) * rangeMult);
        t.eyes = Vector2(std::sin(angle) * p.eyeRange,
                         std::cos(angle) * p.eyeRange * 0.4f);
        s.headTimer = 0.0f;
    }
    // Neither roll hit: keep the timer running, the next frame rolls again.
}

/*----------------------------------------------------*/
/*--------------------- Listening --------------------*/
/*----------------------------------------------------*/
void stepListening(ListeningScratch &s, const ListeningParams &p,
                   MotionTargets &t, float stateTime, float dt,
                   RandomSource &rng) {
    s.eyeTimer += dt;

    if (s.sideLook) {
        s.sideLookTimer -= dt;
        if (s.sideLookTimer <= 0.0f) {
            s.sideLook = false;
            t.head.y = 0.0f;
            t.eyes = Vector2(0.0f);
        }
    } else if (rng.chance(p.sideLookChance * dt)) {
        s.sideLook = true;
        s.sideLookTimer = rng.range(p.sideLookDurationMin, p.sideLookDurationMax);
        s.sideDirection = rng.sign();
        t.head.y = p.sideLookHeadTurn * s.sideDirection;
        t.eyes = Vector2(p.sideLookEyeRange * s.sideDirection, 0.0f);
    }

    if (s.sideLook)
        return;

    // Nod cycle depends only on time in state, so it is reproducible
    float cyclePhase = std::fmod(stateTime, p.nodCycleDuration) / p.nodCycleDuration;
    if (cyclePhase < p.nodActivePortion) {
        float nodProgress = cyclePhase / p.nodActivePortion;
        float nodPhase = nodProgress * TWO_PI * static_cast<float>(p.nodCount);
        t.head.x = std::sin(nodPhase) * p.nodIntensity;
    } else {
        t.head.x *= frameDecay(p.nodDecay, dt);
    }

    if (s.eyeTimer > p.eyeMicroInterval) {
        t.eyes = Vector2(rng.range(-p.eyeMicroRange, p.eyeMicroRange),
                         rng.range(-p.eyeMicroRange * 0.5f, p.eyeMicroRange * 0.5f));
        s.eyeTimer = 0.0f;
    }
}

/*----------------------------------------------------*/
/*--------------------- Thinking ---------------------*/
/*----------------------------------------------------*/
void stepThinking(ThinkingScratch &s, const ThinkingParams &p,
                  MotionTargets &t, float dt, RandomSource &rng) {
    s.clock += dt;
    s.headTimer += dt;

    if (s.lookingAtUser) {
        s.lookAtUserTimer -= dt;
        if (s.lookAtUserTimer <= 0.0f) {
            s.lookingAtUser = false;
            s.headTimer = 0.0f;
        }
    } else if (s.headTimer > p.lookDuration) {
        if (rng.chance(p.lookAtUserChance)) {
            s.lookingAtUser = true;
            s.lookAtUserTimer = rng.range(p.lookAtUserDurationMin, p.lookAtUserDurationMax);
            t.eyes = Vector2(0.0f);
            s.pendingHead.schedule(s.clock + p.eyeLeadTime, Vector3(0.0f));
            s.headTimer = 0.0f;
        } else if (rng.chance(p.lookChangeChance)) {
            float angle = rng.uniform() * THINKING_ANGLE_SPAN + THINKING_ANGLE_START;
            float upBias = p.lookUpBias * THINKING_UP_BIAS_SCALE;
            Vector3 newHead(std::sin(angle) * p.headRange.x + upBias,
                            std::cos(angle) * p.headRange.y,
                            rng.range(-p.headRange.z, p.headRange.z));

            // Eyes move now, either along the head direction or off on their own
            if (rng.chance(p.eyeHeadSync)) {
                t.eyes = Vector2(std::sin(angle) * p.eyeRange * p.eyeLeadAmount,
                                 (p.eyeRange * 0.5f + upBias * 2.0f) * p.eyeLeadAmount);
            } else {
                float divergeAngle = rng.uniform() * TWO_PI;
                t.eyes = Vector2(std::sin(divergeAngle) * p.eyeRange * 0.6f,
                                 p.eyeRange * 0.3f);
            }

            s.pendingHead.schedule(s.clock + p.eyeLeadTime, newHead);
            s.headTimer = 0.0f;
        }
    }

    s.pendingHead.consume(s.clock, [&t](const Vector3 &head) { t.head = head; });
}

/*----------------------------------------------------*/
/*---------------------- Talking ---------------------*/
/*----------------------------------------------------*/
void stepTalking(TalkingScratch &s, const TalkingParams &p, MotionTargets &t,
                 float stateTime, float dt, RandomSource &rng) {
    s.eyeTimer += dt;

    if (stateTime >= s.nextNodChange) {
        float freqVar = 1.0f + rng.range(-1.0f, 1.0f) * p.nodFrequencyVariation;
        s.nodFrequency = p.nodFrequency * freqVar;
        float intensityVar = 1.0f + rng.range(-1.0f, 1.0f) * p.nodIntensityVariation;
        s.nodIntensity = p.nodIntensity * intensityVar;
        s.nextNodChange = stateTime + p.nodChangeInterval * rng.range(0.7f, 1.3f);
    }

    // Advance in cycles so a frequency re-roll never makes the phase jump
    s.nodCycle = std::fmod(s.nodCycle + dt * s.nodFrequency, 1.0f);

    if (!rng.chance(p.nodPauseChance)) {
        float rawNod = std::sin(s.nodCycle * TWO_PI);
        float nod = rawNod * rng.range(0.7f, 1.0f);
        t.head.x = nod * s.nodIntensity * p.nodVariation;
    } else {
        t.head.x *= frameDecay(p.nodDecay, dt);
    }

    if (rng.chance(p.tiltChance * dt)) {
        t.head.z = p.tiltIntensity * rng.sign() * rng.range(0.6f, 1.0f);
    }

    if (rng.chance(p.occasionalTurn * dt * 0.5f)) {
        t.head.y = rng.range(-p.turnRange, p.turnRange);
    }

    t.head.y *= frameDecay(p.turnDecay, dt);
    t.head.z *= frameDecay(p.tiltDecay, dt);

    if (s.eyeTimer > p.eyeDriftInterval) {
        t.eyes = Vector2(rng.range(-p.eyeRange * 0.3f, p.eyeRange * 0.3f),
                         rng.range(-TALKING_EYE_VERTICAL, TALKING_EYE_VERTICAL));
        s.eyeTimer = 0.0f;
    }
}

//------------------------------------------------------
void stepBehavior(ConversationState state, BehaviorScratch &scratch,
                  const AvatarParams &params, MotionTargets &targets,
                  float stateTime, float dt, RandomSource &rng) {
    switch (state) {
    case ConversationState::Idle:
        stepIdle(scratch.idle, params.idle, targets, dt, rng);
        break;
    case ConversationState::Listening:
        stepListening(scratch.listening, params.listening, targets, stateTime, dt, rng);
        break;
    case ConversationState::Thinking:
        stepThinking(scratch.thinking, params.thinking, targets, dt, rng);
        break;
    case ConversationState::Talking:
        stepTalking(scratch.talking, params.talking, targets, stateTime, dt, rng);
        break;
    default:
        break;
    }
}

} // namespace Marionette
