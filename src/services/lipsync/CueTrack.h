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
 *    CueTrack — validated, immutable sequence of timed mouth cues with
 *    coarticulated sampling.
 *
 *    A track is accepted only when every cue has finite times with
 *    start < end, start times strictly increase, and no cue begins before its
 *    predecessor ends (beyond a small tolerance). Targets are clamped to
 *    [0, 1]. Anything else rejects the whole track; a partially valid track
 *    would interpolate against the wrong neighbours.
 *
 *    Sampling at time t:
 *      - gap or outside the track   -> silence
 *      - inside cue i, window w = min(maxWindow, windowFraction * duration):
 *          first w seconds: blend in from cue i-1 (not for silence cues),
 *                           starting where cue i-1's outbound blend ended
 *          last  w seconds: blend toward cue i+1, weight rising to
 *                           maxNextInfluence at the boundary
 *      Neighbours only participate when they abut (gap <= adjacencyTolerance).
 *
 *****************************************************************************/

#ifndef __CUETRACK_H
#define __CUETRACK_H

#include <string>
#include <vector>

#include "LipSyncParams.h"
#include "PhonemeTypes.h"

namespace Marionette {

/// Result of CueTrack::sample(). Weights are reported for diagnostics/tests.
struct CueSample {
    PhonemeVector targets;
    bool silent = true;
    int cueIndex = -1;              // -1 in a gap / outside the track
    float window = 0.0f;            // blend window of the active cue
    float inboundWeight = 0.0f;     // weight still held by the previous cue
    float outboundInfluence = 0.0f; // weight given to the next cue
};

class CueTrack {
public:
    /// Validate and take ownership of cues. On failure the track is left
    /// empty and error (if given) describes the first problem.
    bool assign(std::vector<LipSyncCue> cues, float overlapTolerance = 0.001f,
                std::string *error = nullptr);

    void clear() { mCues.clear(); }

    bool empty() const { return mCues.empty(); }
    size_t size() const { return mCues.size(); }
    const std::vector<LipSyncCue> &cues() const { return mCues; }

    /// End time of the last cue, 0 when empty.
    float duration() const { return mCues.empty() ? 0.0f : mCues.back().endTime; }

    /// Index of the cue with start <= t < end, or -1.
    int findCue(float t) const;

    CueSample sample(float t, const CoarticulationParams &p) const;

private:
    bool abuts(size_t a, size_t b, float tolerance) const;
    float windowOf(size_t i, const CoarticulationParams &p) const;

    std::vector<LipSyncCue> mCues;
};

} // namespace Marionette

#endif
