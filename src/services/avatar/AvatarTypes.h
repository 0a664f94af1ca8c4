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

#ifndef __AVATARTYPES_H
#define __AVATARTYPES_H

#include <string>

#include "MarionetteMath.h"

namespace Marionette {

/// Conversational state, set by the conversation layer, exactly one active.
enum class ConversationState {
    Idle,       // 0: nobody is talking, look around
    Listening,  // 1: user is talking, focus + nods
    Thinking,   // 2: waiting for the reply, eyes lead head upward
    Talking,    // 3: avatar is speaking, variable nodding
    NumStates
};

/// Meta-state orthogonal to ConversationState.
///
/// Sequence after every effective setState():
///   Transitioning → MovementLocked → Active
///
/// Transitioning pulls the head straight toward neutral (no spring) until it is
/// within the centering epsilon AND the minimum transition time has passed.
/// MovementLocked then pins head/eye targets at neutral for a fixed settle time
/// with the spring running, so the next behavior starts from rest.
enum class MotionPhase {
    Transitioning,
    MovementLocked,
    Active
};

/// Avatar-agnostic pose, recomputed every frame.
/// Units are whatever the render adapter maps them to (radians for a skeletal
/// rig); eyes are normalized gaze in [-1, 1]; blink is 0 = open, 1 = closed.
struct PoseVector {
    float headPitch = 0.0f;  // nod
    float headYaw   = 0.0f;  // turn
    float headRoll  = 0.0f;  // tilt
    float bodyLean  = 0.0f;  // sway
    float eyeX      = 0.0f;  // -1 left, +1 right
    float eyeY      = 0.0f;  // -1 down, +1 up
    float blink     = 0.0f;
};

/// Head spring, one SpringState per axis packed into Vector3 (pitch, yaw, roll).
/// Reset (target and velocity) on every state transition.
struct HeadSpring {
    Vector3 current{0.0f};
    Vector3 target{0.0f};
    Vector3 velocity{0.0f};
};

/// Eye gaze: plain exponential follow, no velocity.
struct EyeGaze {
    Vector2 current{0.0f};
    Vector2 target{0.0f};
};

/// Blink cycle state. Runs regardless of ConversationState.
struct BlinkState {
    float timer       = 0.0f;   // time since the last blink started
    float nextBlinkAt = 0.0f;   // timer threshold for the next spontaneous blink
    bool  isBlinking  = false;
    float progress    = 0.0f;   // seconds into the current blink
    bool  pendingDoubleBlink = false;
    float doubleBlinkDelay   = 0.0f;  // countdown until the pending double fires
    bool  inDoubleBlink      = false; // current blink is the follow-up of a double
};

inline const char *conversationStateName(ConversationState s) {
    switch (s) {
    case ConversationState::Idle:      return "idle";
    case ConversationState::Listening: return "listening";
    case ConversationState::Thinking:  return "thinking";
    case ConversationState::Talking:   return "talking";
    default:                           return "?";
    }
}

/// Parse the lowercase name produced by conversationStateName().
inline bool parseConversationState(const std::string &name, ConversationState &out) {
    for (int i = 0; i < static_cast<int>(ConversationState::NumStates); ++i) {
        ConversationState s = static_cast<ConversationState>(i);
        if (name == conversationStateName(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

inline const char *motionPhaseName(MotionPhase p) {
    switch (p) {
    case MotionPhase::Transitioning:  return "transitioning";
    case MotionPhase::MovementLocked: return "locked";
    case MotionPhase::Active:         return "active";
    }
    return "?";
}

} // namespace Marionette

#endif
