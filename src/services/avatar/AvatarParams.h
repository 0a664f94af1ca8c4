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
 *    AvatarParams — per-state tuning records for the avatar state machine.
 *    Separated from AvatarStateMachine.h so the config loader and the
 *    headless driver can reference records and defaults without pulling in
 *    the implementation.
 *
 *    All records are plain aggregates with their defaults inline; a YAML
 *    override only touches the fields it names. sanitizeParams() clamps every
 *    field into its valid range and is applied on every path that accepts
 *    external values.
 *
 *****************************************************************************/

#ifndef __AVATARPARAMS_H
#define __AVATARPARAMS_H

#include "AvatarTypes.h"
#include "ParamClamp.h"

namespace Marionette {

// ── Per-state behavior records ──

struct IdleParams {
    float lookDuration          = 3.0f;   // seconds between look decisions
    float lookChangeChance      = 0.3f;   // chance of a new random look per decision
    Vector3 headRange{0.20f, 0.12f, 0.15f};  // pitch / yaw / roll extent
    float eyeRange              = 0.5f;
    float lookAtUserChance      = 0.35f;
    float lookAtUserDurationMin = 1.5f;
    float lookAtUserDurationMax = 3.5f;
};

struct ListeningParams {
    float nodIntensity          = 0.30f;
    int   nodCount              = 2;      // nods per active window
    float nodCycleDuration      = 2.5f;   // seconds per nod cycle
    float nodActivePortion      = 0.4f;   // fraction of the cycle spent nodding
    float nodDecay              = 0.9f;   // per-frame pitch-target decay outside the window
    float sideLookChance        = 0.15f;  // per second
    float sideLookDurationMin   = 1.0f;
    float sideLookDurationMax   = 3.0f;
    float sideLookHeadTurn      = 0.10f;
    float sideLookEyeRange      = 0.3f;
    float eyeMicroRange         = 0.08f;
    float eyeMicroInterval      = 2.0f;
};

struct ThinkingParams {
    float lookDuration          = 1.5f;
    float lookChangeChance      = 0.35f;
    Vector3 headRange{0.10f, 0.20f, 0.10f};
    float eyeRange              = 0.5f;
    float lookUpBias            = 0.6f;
    float eyeLeadTime           = 0.10f;  // head follows the eyes after this delay
    float eyeLeadAmount         = 1.1f;   // eye overshoot relative to head direction
    float eyeHeadSync           = 0.8f;   // chance eyes follow the head direction
    float lookAtUserChance      = 0.3f;
    float lookAtUserDurationMin = 1.0f;
    float lookAtUserDurationMax = 2.0f;
};

struct TalkingParams {
    float nodIntensity          = 0.35f;
    float nodFrequency          = 1.8f;   // Hz
    float nodVariation          = 0.6f;
    float nodIntensityVariation = 0.4f;
    float nodFrequencyVariation = 0.5f;
    float nodChangeInterval     = 1.5f;   // seconds, randomized ±30%
    float nodPauseChance        = 0.15f;  // per-frame chance a nod is skipped
    float nodDecay              = 0.9f;
    float tiltChance            = 0.25f;  // per second
    float tiltIntensity         = 0.06f;
    float occasionalTurn        = 0.2f;   // per second, halved
    float turnRange             = 0.03f;
    float turnDecay             = 0.95f;  // per frame
    float tiltDecay             = 0.94f;  // per frame
    float eyeRange              = 0.4f;
    float eyeDriftInterval      = 2.5f;
};

// ── Physics / transition ──

/// Per-state acceleration multiplier and eye interpolation rate.
struct StateMotion {
    float accelMultiplier;
    float eyeRate;  // per-frame exponential factor at REFERENCE_FPS
};

struct MotionParams {
    float baseAcceleration   = 0.001f;
    float damping            = 0.85f;   // velocity retention per reference frame
    StateMotion perState[static_cast<int>(ConversationState::NumStates)] = {
        {1.0f,  0.025f},  // Idle
        {8.0f,  0.03f},   // Listening
        {2.0f,  0.04f},   // Thinking: eyes lead, so they move faster
        {10.0f, 0.025f},  // Talking
    };
    float transitionEase     = 0.08f;   // per-frame centering factor
    float transitionEyeScale = 1.5f;    // eyes center this much faster than the head
    float transitionVelDecay = 0.9f;    // per-frame velocity bleed while centering
    float centerEpsilon      = 0.015f;  // per-axis |head| threshold for "centered"
    float minTransitionTime  = 0.3f;
    float lockDuration       = 0.5f;
    float lockEyeRate        = 0.05f;
    float velocityCap        = 0.5f;    // per-axis spring velocity limit
};

struct BlinkParams {
    float duration          = 0.12f;
    float closeFraction     = 0.4f;   // portion of the blink spent closing
    float firstBlinkMin     = 2.0f;
    float firstBlinkMax     = 5.0f;
    float intervalMin       = 2.5f;
    float intervalMax       = 6.5f;
    float doubleBlinkChance = 0.25f;
    float doubleDelayMin    = 0.08f;
    float doubleDelayMax    = 0.14f;
};

struct SwayParams {
    float interval = 2.8f;   // seconds between target re-rolls
    float range    = 0.04f;  // target drawn from [-range, range]
    float ease     = 0.01f;  // per-frame follow factor
};

struct AvatarParams {
    IdleParams      idle;
    ListeningParams listening;
    ThinkingParams  thinking;
    TalkingParams   talking;
    MotionParams    motion;
    BlinkParams     blink;
    SwayParams      sway;

    inline const StateMotion &stateMotion(ConversationState s) const {
        return motion.perState[static_cast<int>(s)];
    }
};

// ── Clamping ──

inline void sanitizeParams(IdleParams &p) {
    clampParam(p.lookDuration, 0.05f, 60.0f, "idle.look_duration");
    clampParam(p.lookChangeChance, 0.0f, 1.0f, "idle.look_change_chance");
    clampParam(p.headRange.x, 0.0f, 1.5f, "idle.head_range_x");
    clampParam(p.headRange.y, 0.0f, 1.5f, "idle.head_range_y");
    clampParam(p.headRange.z, 0.0f, 1.5f, "idle.head_range_z");
    clampParam(p.eyeRange, 0.0f, 1.0f, "idle.eye_range");
    clampParam(p.lookAtUserChance, 0.0f, 1.0f, "idle.look_at_user_chance");
    clampRange(p.lookAtUserDurationMin, p.lookAtUserDurationMax, 0.0f, 60.0f,
               "idle.look_at_user_duration");
}

inline void sanitizeParams(ListeningParams &p) {
    clampParam(p.nodIntensity, 0.0f, 1.5f, "listening.nod_intensity");
    clampParam(p.nodCount, 0, 8, "listening.nod_count");
    clampParam(p.nodCycleDuration, 0.1f, 30.0f, "listening.nod_cycle_duration");
    clampParam(p.nodActivePortion, 0.0f, 1.0f, "listening.nod_active_portion");
    clampParam(p.nodDecay, 0.0f, 1.0f, "listening.nod_decay");
    clampParam(p.sideLookChance, 0.0f, 10.0f, "listening.side_look_chance");
    clampRange(p.sideLookDurationMin, p.sideLookDurationMax, 0.0f, 60.0f,
               "listening.side_look_duration");
    clampParam(p.sideLookHeadTurn, 0.0f, 1.5f, "listening.side_look_head_turn");
    clampParam(p.sideLookEyeRange, 0.0f, 1.0f, "listening.side_look_eye_range");
    clampParam(p.eyeMicroRange, 0.0f, 1.0f, "listening.eye_micro_range");
    clampParam(p.eyeMicroInterval, 0.05f, 60.0f, "listening.eye_micro_interval");
}

inline void sanitizeParams(ThinkingParams &p) {
    clampParam(p.lookDuration, 0.05f, 60.0f, "thinking.look_duration");
    clampParam(p.lookChangeChance, 0.0f, 1.0f, "thinking.look_change_chance");
    clampParam(p.headRange.x, 0.0f, 1.5f, "thinking.head_range_x");
    clampParam(p.headRange.y, 0.0f, 1.5f, "thinking.head_range_y");
    clampParam(p.headRange.z, 0.0f, 1.5f, "thinking.head_range_z");
    clampParam(p.eyeRange, 0.0f, 1.0f, "thinking.eye_range");
    clampParam(p.lookUpBias, 0.0f, 2.0f, "thinking.look_up_bias");
    clampParam(p.eyeLeadTime, 0.0f, 2.0f, "thinking.eye_lead_time");
    clampParam(p.eyeLeadAmount, 0.0f, 2.0f, "thinking.eye_lead_amount");
    clampParam(p.eyeHeadSync, 0.0f, 1.0f, "thinking.eye_head_sync");
    clampParam(p.lookAtUserChance, 0.0f, 1.0f, "thinking.look_at_user_chance");
    clampRange(p.lookAtUserDurationMin, p.lookAtUserDurationMax, 0.0f, 60.0f,
               "thinking.look_at_user_duration");
}

inline void sanitizeParams(TalkingParams &p) {
    clampParam(p.nodIntensity, 0.0f, 1.5f, "talking.nod_intensity");
    clampParam(p.nodFrequency, 0.0f, 10.0f, "talking.nod_frequency");
    clampParam(p.nodVariation, 0.0f, 2.0f, "talking.nod_variation");
    clampParam(p.nodIntensityVariation, 0.0f, 1.0f, "talking.nod_intensity_variation");
    clampParam(p.nodFrequencyVariation, 0.0f, 1.0f, "talking.nod_frequency_variation");
    clampParam(p.nodChangeInterval, 0.05f, 60.0f, "talking.nod_change_interval");
    clampParam(p.nodPauseChance, 0.0f, 1.0f, "talking.nod_pause_chance");
    clampParam(p.nodDecay, 0.0f, 1.0f, "talking.nod_decay");
    clampParam(p.tiltChance, 0.0f, 10.0f, "talking.tilt_chance");
    clampParam(p.tiltIntensity, 0.0f, 1.0f, "talking.tilt_intensity");
    clampParam(p.occasionalTurn, 0.0f, 10.0f, "talking.occasional_turn");
    clampParam(p.turnRange, 0.0f, 1.0f, "talking.turn_range");
    clampParam(p.turnDecay, 0.0f, 1.0f, "talking.turn_decay");
    clampParam(p.tiltDecay, 0.0f, 1.0f, "talking.tilt_decay");
    clampParam(p.eyeRange, 0.0f, 1.0f, "talking.eye_range");
    clampParam(p.eyeDriftInterval, 0.05f, 60.0f, "talking.eye_drift_interval");
}

inline void sanitizeParams(MotionParams &p) {
    clampParam(p.baseAcceleration, 0.0f, 0.01f, "motion.base_acceleration");
    clampParam(p.damping, 0.0f, 0.99f, "motion.damping");
    for (StateMotion &sm : p.perState) {
        clampParam(sm.accelMultiplier, 0.0f, 50.0f, "motion.accel_multiplier");
        clampParam(sm.eyeRate, 0.0f, 1.0f, "motion.eye_rate");
    }
    clampParam(p.transitionEase, 0.001f, 1.0f, "motion.transition_ease");
    clampParam(p.transitionEyeScale, 0.0f, 10.0f, "motion.transition_eye_scale");
    clampParam(p.transitionVelDecay, 0.0f, 1.0f, "motion.transition_velocity_decay");
    clampParam(p.centerEpsilon, 0.001f, 0.5f, "motion.center_epsilon");
    clampParam(p.minTransitionTime, 0.0f, 5.0f, "motion.min_transition_time");
    clampParam(p.lockDuration, 0.0f, 5.0f, "motion.lock_duration");
    clampParam(p.lockEyeRate, 0.0f, 1.0f, "motion.lock_eye_rate");
    clampParam(p.velocityCap, 0.001f, 10.0f, "motion.velocity_cap");
}

inline void sanitizeParams(BlinkParams &p) {
    clampParam(p.duration, 0.02f, 1.0f, "blink.duration");
    clampParam(p.closeFraction, 0.05f, 0.95f, "blink.close_fraction");
    clampRange(p.firstBlinkMin, p.firstBlinkMax, 0.1f, 60.0f, "blink.first_blink");
    clampRange(p.intervalMin, p.intervalMax, 0.1f, 60.0f, "blink.interval");
    clampParam(p.doubleBlinkChance, 0.0f, 1.0f, "blink.double_blink_chance");
    clampRange(p.doubleDelayMin, p.doubleDelayMax, 0.0f, 1.0f, "blink.double_delay");
}

inline void sanitizeParams(SwayParams &p) {
    clampParam(p.interval, 0.1f, 60.0f, "sway.interval");
    clampParam(p.range, 0.0f, 0.5f, "sway.range");
    clampParam(p.ease, 0.0f, 1.0f, "sway.ease");
}

inline void sanitizeParams(AvatarParams &p) {
    sanitizeParams(p.idle);
    sanitizeParams(p.listening);
    sanitizeParams(p.thinking);
    sanitizeParams(p.talking);
    sanitizeParams(p.motion);
    sanitizeParams(p.blink);
    sanitizeParams(p.sway);
}

} // namespace Marionette

#endif
