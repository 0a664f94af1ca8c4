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

#include "CueTrack.h"
#include "MarionetteMath.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace Marionette {

static bool fail(std::string *error, size_t index, const char *what) {
    if (error) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "cue %zu: %s", index, what);
        *error = buf;
    }
    return false;
}

//------------------------------------------------------
bool CueTrack::assign(std::vector<LipSyncCue> cues, float overlapTolerance,
                      std::string *error) {
    mCues.clear();

    for (size_t i = 0; i < cues.size(); ++i) {
        LipSyncCue &c = cues[i];
        if (!std::isfinite(c.startTime) || !std::isfinite(c.endTime))
            return fail(error, i, "non-finite time");
        if (c.startTime < 0.0f)
            return fail(error, i, "negative start time");
        if (!(c.startTime < c.endTime))
            return fail(error, i, "start is not before end");

        if (i > 0) {
            const LipSyncCue &prev = cues[i - 1];
            if (!(c.startTime > prev.startTime))
                return fail(error, i, "start times not strictly increasing");
            if (c.startTime < prev.endTime - overlapTolerance)
                return fail(error, i, "overlaps the previous cue");
        }

        for (int ch = 0; ch < PHONEME_COUNT; ++ch) {
            if (!std::isfinite(c.targets[ch]))
                return fail(error, i, "non-finite phoneme target");
        }
        c.targets.clamp(0.0f, 1.0f);
        if (c.silence)
            c.targets = PhonemeVector();
    }

    mCues = std::move(cues);
    return true;
}

//------------------------------------------------------
int CueTrack::findCue(float t) const {
    if (mCues.empty() || !std::isfinite(t))
        return -1;

    // First cue starting after t; the candidate is the one before it
    auto it = std::upper_bound(mCues.begin(), mCues.end(), t,
                               [](float time, const LipSyncCue &c) { return time < c.startTime; });
    if (it == mCues.begin())
        return -1;
    --it;
    if (t >= it->endTime)
        return -1;
    return static_cast<int>(it - mCues.begin());
}

//------------------------------------------------------
bool CueTrack::abuts(size_t a, size_t b, float tolerance) const {
    return mCues[b].startTime - mCues[a].endTime <= tolerance;
}

//------------------------------------------------------
float CueTrack::windowOf(size_t i, const CoarticulationParams &p) const {
    float dur = mCues[i].endTime - mCues[i].startTime;
    return std::min(p.maxWindow, p.windowFraction * dur);
}

//------------------------------------------------------
CueSample CueTrack::sample(float t, const CoarticulationParams &p) const {
    CueSample s;
    int idx = findCue(t);
    if (idx < 0)
        return s;

    const size_t i = static_cast<size_t>(idx);
    const LipSyncCue &cue = mCues[i];

    s.cueIndex = idx;
    s.silent = cue.silence;
    s.window = windowOf(i, p);
    s.targets = cue.targets;

    if (s.window <= 0.0f)
        return s;

    // Inbound: pick up where the previous cue's outbound blend left off
    float intoCue = t - cue.startTime;
    if (!cue.silence && i > 0 && intoCue < s.window &&
        abuts(i - 1, i, p.adjacencyTolerance)) {
        float startWeight = 1.0f;
        if (windowOf(i - 1, p) > 0.0f)
            startWeight = 1.0f - p.maxNextInfluence;
        float w = smoothstep(0.0f, 1.0f, intoCue / s.window);
        s.inboundWeight = startWeight * (1.0f - w);
        s.targets = lerp(cue.targets, mCues[i - 1].targets, s.inboundWeight);
    }

    // Outbound: anticipate the next shape, never fully
    float untilEnd = cue.endTime - t;
    if (i + 1 < mCues.size() && untilEnd < s.window &&
        abuts(i, i + 1, p.adjacencyTolerance)) {
        float progress = 1.0f - untilEnd / s.window;
        s.outboundInfluence = p.maxNextInfluence * smoothstep(0.0f, 1.0f, progress);
        s.targets = lerp(s.targets, mCues[i + 1].targets, s.outboundInfluence);
    }

    return s;
}

} // namespace Marionette
