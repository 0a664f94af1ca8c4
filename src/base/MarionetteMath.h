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

/// @file MarionetteMath.h
/// @brief Central math header: GLM-backed type aliases and frame helpers.
///
/// All engine code should include this header for Vector2 / Vector3.
/// The underlying implementation is GLM 1.0 (MIT license).
///
/// GLM reference: https://github.com/g-truc/glm

#pragma once

#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>

namespace Marionette {

// --- Core type aliases ---
// Head rotation is a Vector3 laid out as (pitch, yaw, roll); eye gaze is a
// Vector2 (x = horizontal, y = vertical).

using Vector2 = glm::vec2;
using Vector3 = glm::vec3;

static constexpr float PI     = 3.14159265358979323846f;
static constexpr float TWO_PI = 2.0f * PI;

// ── Frame timing ──

/// Rate at which every per-frame coefficient in the engine is specified.
/// Spring velocity integrates with dt * REFERENCE_FPS; exponential blends are
/// converted with frameBlend() below.
static constexpr float REFERENCE_FPS = 60.0f;
static constexpr float REFERENCE_FRAME_DT = 1.0f / REFERENCE_FPS;

/// Largest dt any integrator ever sees. A host stall (tab switch, debugger,
/// asset hitch) is clamped here, not replayed.
static constexpr float MAX_FRAME_DT = 0.1f;

/// Clamp a raw host dt into [0, MAX_FRAME_DT]. NaN and negative values
/// become 0, +inf becomes MAX_FRAME_DT.
inline float sanitizeDt(float dt) {
    if (!(dt > 0.0f)) return 0.0f;   // catches NaN too
    return std::min(dt, MAX_FRAME_DT);
}

/// Convert a per-frame blend factor k (specified at REFERENCE_FPS) to the
/// equivalent factor for a step of dt seconds: 1 - (1 - k)^(dt * fps).
/// frameBlend(k, 1/60) == k; frameBlend(k, 0) == 0.
inline float frameBlend(float k, float dt) {
    if (k <= 0.0f || dt <= 0.0f) return 0.0f;
    if (k >= 1.0f) return 1.0f;
    return 1.0f - std::pow(1.0f - k, dt * REFERENCE_FPS);
}

/// Same conversion for a geometric per-frame decay factor d (value *= d).
inline float frameDecay(float d, float dt) {
    if (dt <= 0.0f) return 1.0f;
    if (d <= 0.0f) return 0.0f;
    return std::pow(d, dt * REFERENCE_FPS);
}

/// Hermite smoothstep on [edge0, edge1]; returns 0 / 1 outside the range.
inline float smoothstep(float edge0, float edge1, float x) {
    if (edge1 <= edge0) return x < edge0 ? 0.0f : 1.0f;
    float t = std::clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

inline bool isFinite(const Vector3 &v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

inline bool isFinite(const Vector2 &v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace Marionette
