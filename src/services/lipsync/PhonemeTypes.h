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

#ifndef __PHONEMETYPES_H
#define __PHONEMETYPES_H

#include <algorithm>
#include <stdexcept>

namespace Marionette {

/// Index of a mouth channel inside PhonemeVector.
enum PhonemeChannel {
    PHONEME_AA = 0,  // jaw open
    PHONEME_EE,      // wide, front-high
    PHONEME_IH,      // front-mid
    PHONEME_OH,      // round, back-mid
    PHONEME_OU,      // pursed, back-high
    PHONEME_COUNT
};

/// Five-channel mouth shape. Each channel is in [0, maxMouthOpen].
struct PhonemeVector {
    float aa = 0.0f;
    float ee = 0.0f;
    float ih = 0.0f;
    float oh = 0.0f;
    float ou = 0.0f;

    /// Channel access by PhonemeChannel. i must be in [0, PHONEME_COUNT).
    inline float &operator[](int i) {
        switch (i) {
        case PHONEME_AA: return aa;
        case PHONEME_EE: return ee;
        case PHONEME_IH: return ih;
        case PHONEME_OH: return oh;
        case PHONEME_OU: return ou;
        }
        throw std::out_of_range("PhonemeVector: bad channel index");
    }

    inline float operator[](int i) const {
        switch (i) {
        case PHONEME_AA: return aa;
        case PHONEME_EE: return ee;
        case PHONEME_IH: return ih;
        case PHONEME_OH: return oh;
        case PHONEME_OU: return ou;
        }
        throw std::out_of_range("PhonemeVector: bad channel index");
    }

    inline float maxChannel() const {
        return std::max({aa, ee, ih, oh, ou});
    }

    inline bool isZero() const {
        return aa == 0.0f && ee == 0.0f && ih == 0.0f && oh == 0.0f && ou == 0.0f;
    }

    inline void clamp(float lo, float hi) {
        for (int i = 0; i < PHONEME_COUNT; ++i)
            (*this)[i] = std::clamp((*this)[i], lo, hi);
    }
};

inline PhonemeVector lerp(const PhonemeVector &a, const PhonemeVector &b, float t) {
    PhonemeVector r;
    for (int i = 0; i < PHONEME_COUNT; ++i)
        r[i] = a[i] + (b[i] - a[i]) * t;
    return r;
}

inline const char *phonemeChannelName(int i) {
    static const char *names[PHONEME_COUNT] = {"aa", "ee", "ih", "oh", "ou"};
    return (i >= 0 && i < PHONEME_COUNT) ? names[i] : "?";
}

/// One timed mouth target from the speech backend.
struct LipSyncCue {
    float startTime = 0.0f;
    float endTime = 0.0f;
    PhonemeVector targets;
    bool silence = false;
    char shape = 'X';  // originating mouth-shape letter, informational
};

/// Per-frame band analysis of the live spectrum. Centroids are normalized
/// within their band (0 = band floor, 1 = band ceiling).
struct FormantAnalysis {
    float amplitude = 0.0f;   // RMS of the time-domain snapshot
    float f1Energy = 0.0f;    // RMS magnitude over the F1 band
    float f2Energy = 0.0f;    // RMS magnitude over the F2 band
    float f1Centroid = 0.0f;
    float f2Centroid = 0.0f;
    float hfRatio = 0.0f;     // high band share of total band energy
};

/// How the engine produces mouth targets for the current utterance. Resolved
/// when capabilities change, never per frame.
enum class LipSyncStrategy {
    FormantLayered,
    TimedCue,
    SpectralCentroid,
    SyntheticEnvelope,
    Silent
};

/// Last degradation the engine went through. Informational only.
enum class LipSyncDiagnostic {
    None,
    InvalidCueTrack,       // track rejected, treated as absent
    AnalysisUnavailable,   // analysis tap could not be connected
    AnalysisReadFailed,    // tap connected but a read failed, strategy demoted
    PlaybackBlocked        // play() refused by the platform, intent kept
};

inline const char *lipSyncStrategyName(LipSyncStrategy s) {
    switch (s) {
    case LipSyncStrategy::FormantLayered:    return "formant";
    case LipSyncStrategy::TimedCue:          return "cues";
    case LipSyncStrategy::SpectralCentroid:  return "spectral";
    case LipSyncStrategy::SyntheticEnvelope: return "synthetic";
    case LipSyncStrategy::Silent:            return "silent";
    }
    return "?";
}

inline const char *lipSyncDiagnosticName(LipSyncDiagnostic d) {
    switch (d) {
    case LipSyncDiagnostic::None:                return "none";
    case LipSyncDiagnostic::InvalidCueTrack:     return "invalid cue track";
    case LipSyncDiagnostic::AnalysisUnavailable: return "analysis unavailable";
    case LipSyncDiagnostic::AnalysisReadFailed:  return "analysis read failed";
    case LipSyncDiagnostic::PlaybackBlocked:     return "playback blocked";
    }
    return "?";
}

} // namespace Marionette

#endif
