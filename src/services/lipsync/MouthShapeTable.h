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

// MouthShapeTable.h — backend mouth-shape letters to phoneme weights
//
// Letters follow the Preston Blair / Rhubarb convention the speech backend
// emits. Only the cue loader consults this; the engine consumes cue targets
// as delivered.

#pragma once

#include <cctype>

#include "PhonemeTypes.h"

namespace Marionette {

static constexpr int MOUTH_SHAPE_TABLE_VERSION = 1;

struct MouthShape {
    char letter;
    PhonemeVector weights;
    bool silence;
};

//                       aa     ee     ih     oh     ou
static const MouthShape MOUTH_SHAPES[] = {
    {'A', {0.00f, 0.00f, 0.00f, 0.00f, 0.15f}, false},  // M B P
    {'B', {0.40f, 0.00f, 0.25f, 0.00f, 0.00f}, false},  // K S T
    {'C', {0.25f, 0.85f, 0.20f, 0.00f, 0.00f}, false},  // EE
    {'D', {0.90f, 0.00f, 0.10f, 0.00f, 0.00f}, false},  // AA
    {'E', {0.55f, 0.00f, 0.00f, 0.75f, 0.00f}, false},  // AH OH
    {'F', {0.20f, 0.00f, 0.00f, 0.20f, 0.80f}, false},  // OO
    {'G', {0.15f, 0.00f, 0.35f, 0.00f, 0.00f}, false},  // F V
    {'H', {0.35f, 0.00f, 0.15f, 0.00f, 0.00f}, false},  // L
    {'X', {0.00f, 0.00f, 0.00f, 0.00f, 0.00f}, true},   // rest
};

/// Look up a shape letter (case-insensitive). Unknown letters resolve to 'X'.
inline const MouthShape &lookupMouthShape(char letter) {
    const int count = static_cast<int>(sizeof(MOUTH_SHAPES) / sizeof(MOUTH_SHAPES[0]));
    char up = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
    for (int i = 0; i < count; ++i) {
        if (MOUTH_SHAPES[i].letter == up)
            return MOUTH_SHAPES[i];
    }
    return MOUTH_SHAPES[count - 1];
}

} // namespace Marionette
