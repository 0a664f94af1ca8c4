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

// CueTrackLoader.h — read speech-backend cue tracks (JSON, via yaml-cpp)
//
// Two shapes are accepted:
//
//   backend list:  [ {"start": 0.0, "end": 0.12, "shape": "D",
//                     "phonemes": {"aa": 0.9, "ih": 0.1}}, ... ]
//   raw Rhubarb:   {"mouthCues": [ {"start": 0.0, "end": 0.12, "value": "D"}, ... ] }
//
// A cue without "phonemes" takes its weights from the mouth-shape table; a
// cue with "phonemes" uses them as given (missing channels are 0). Shape 'X'
// or "silence": true marks a silence cue.
//
// Only parsing happens here; ordering and overlap are checked when the track
// is handed to the engine.

#pragma once

#include <string>
#include <vector>

#include "PhonemeTypes.h"

namespace Marionette {

/// Parse a cue track from JSON/YAML text. Returns false on malformed input;
/// cues is untouched then.
bool parseCueTrack(const std::string &text, std::vector<LipSyncCue> &cues);

/// Same, from a file. A missing file returns false and logs an error.
bool loadCueTrackFromFile(const std::string &path, std::vector<LipSyncCue> &cues);

} // namespace Marionette
