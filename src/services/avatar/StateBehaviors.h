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

// StateBehaviors.h — per-state target generators
//
// Each conversational state is a function
//
//   step(scratch, params, targets, stateTime, dt, rng) -> scratch', targets'
//
// over a small mutable scratch struct and an immutable parameter record. The
// functions only decide WHERE the head and eyes should go; the spring and eye
// follow in AvatarStateMachine decide how they get there. Scratch is reset on
// every effective state change, so nothing leaks between states.

#pragma once

#include "AvatarParams.h"
#include "RandomSource.h"
#include "ScheduledEvents.h"

namespace Marionette {

/// Head and eye targets the behaviors write into.
struct MotionTargets {
    Vector3 head{0.0f};   // pitch, yaw, roll
    Vector2 eyes{0.0f};
};

struct IdleScratch {
    float headTimer       = 0.0f;
    bool  lookingAtUser   = false;
    float lookAtUserTimer = 0.0f;
};

struct ListeningScratch {
    float eyeTimer      = 0.0f;
    bool  sideLook      = false;
    float sideLookTimer = 0.0f;
    float sideDirection = 1.0f;
};

struct ThinkingScratch {
    float clock           = 0.0f;  // time in state, drives the lead queue
    float headTimer       = 0.0f;
    bool  lookingAtUser   = false;
    float lookAtUserTimer = 0.0f;
    ScheduledEvents<Vector3> pendingHead;  // head retargets waiting for the eyes
};

struct TalkingScratch {
    float eyeTimer      = 0.0f;
    float nodCycle      = 0.0f;   // nod phase in cycles, wrapped to [0, 1)
    float nodFrequency  = 2.0f;   // current rolled frequency (Hz)
    float nodIntensity  = 0.2f;   // current rolled intensity
    float nextNodChange = 0.0f;   // stateTime at which nod params are re-rolled
};

struct BehaviorScratch {
    IdleScratch      idle;
    ListeningScratch listening;
    ThinkingScratch  thinking;
    TalkingScratch   talking;

    inline void reset() { *this = BehaviorScratch(); }
};

/// Idle: look around on a rolling timer, sometimes hold eye contact.
void stepIdle(IdleScratch &s, const IdleParams &p, MotionTargets &t, float dt,
              RandomSource &rng);

/// Listening: deterministic nod cycle from stateTime with occasional side
/// micro eye jitter.
void stepListening(ListeningScratch &s, const ListeningParams &p,
                   MotionTargets &t, float stateTime, float dt,
                   RandomSource &rng);

/// Thinking: upward-biased look-aways where the head follows the eyes after
/// eyeLeadTime.
void stepThinking(ThinkingScratch &s, const ThinkingParams &p,
                  MotionTargets &t, float dt, RandomSource &rng);

/// Talking: re-rolled nod rate/intensity, tilts and turns that decay.
void stepTalking(TalkingScratch &s, const TalkingParams &p, MotionTargets &t,
                 float stateTime, float dt, RandomSource &rng);

/// Dispatch on state.
void stepBehavior(ConversationState state, BehaviorScratch &scratch,
                  const AvatarParams &params, MotionTargets &targets,
                  float stateTime, float dt, RandomSource &rng);

} // namespace Marionette
