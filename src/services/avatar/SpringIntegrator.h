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
 *    SpringIntegrator — head spring and eye follow used by every state.
 *
 *    Head (per axis, coefficients at the 60 Hz reference rate):
 *      force    = (target - current) * acceleration
 *      velocity = (velocity + force) * damping
 *      current += velocity * h * REFERENCE_FPS
 *
 *    The step is sub-divided so h never exceeds one reference frame; a 100 ms
 *    frame runs six sub-steps instead of one six-times-larger step. With
 *    acceleration <= 0.5 and damping < 1 the discrete system has |eig| < 1, so
 *    it cannot diverge. Velocity is additionally capped per axis.
 *
 *    Eyes follow their target with a frame-rate converted exponential blend
 *    and carry no velocity.
 *
 *****************************************************************************/

#ifndef __SPRINGINTEGRATOR_H
#define __SPRINGINTEGRATOR_H

#include <algorithm>
#include <cmath>

#include "AvatarTypes.h"

namespace Marionette {

/// Compute the new spring velocity for one sub-step. Returns the velocity;
/// caller integrates position. Separation allows velocity adjustments between
/// the two (transition bleed in AvatarStateMachine).
static inline Vector3 computeSpringVelocity(const Vector3 &pos,
                                            const Vector3 &oldVel,
                                            const Vector3 &target,
                                            float acceleration, float damping,
                                            float velCap) {
    Vector3 force = (target - pos) * acceleration;
    Vector3 newVel = (oldVel + force) * damping;
    return glm::clamp(newVel, Vector3(-velCap), Vector3(velCap));
}

/// Advance the head spring by dt seconds (already sanitized).
static inline void integrateSpring(HeadSpring &spring, float acceleration,
                                   float damping, float velCap, float dt) {
    if (dt <= 0.0f) return;

    int steps = static_cast<int>(std::ceil(dt / REFERENCE_FRAME_DT - 1e-4f));
    steps = std::max(steps, 1);
    float h = dt / static_cast<float>(steps);

    for (int i = 0; i < steps; ++i) {
        spring.velocity = computeSpringVelocity(spring.current, spring.velocity,
                                                spring.target, acceleration,
                                                damping, velCap);
        spring.current += spring.velocity * (h * REFERENCE_FPS);
    }
}

/// Exponential eye follow. rate is the per-frame factor at REFERENCE_FPS.
static inline void lerpEyes(EyeGaze &eyes, float rate, float dt) {
    float k = frameBlend(rate, dt);
    eyes.current += (eyes.target - eyes.current) * k;
}

/// True when every head axis is within eps of neutral.
static inline bool isCentered(const Vector3 &head, float eps) {
    return std::abs(head.x) < eps && std::abs(head.y) < eps &&
           std::abs(head.z) < eps;
}

} // namespace Marionette

#endif
