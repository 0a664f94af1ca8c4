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
 *    LipSyncParams — tuning records for the lip-sync engine.
 *
 *    Per-frame factors are specified at REFERENCE_FPS and converted with
 *    frameBlend() at run time. Frequencies are in Hz.
 *
 *    The formant band edges and vowel cutoffs are empirically tuned for
 *    adult speech at 16-48 kHz sample rates.
 *
 *****************************************************************************/

#ifndef __LIPSYNCPARAMS_H
#define __LIPSYNCPARAMS_H

#include "ParamClamp.h"
#include "PhonemeTypes.h"

namespace Marionette {

/// Live spectral-centroid fallback.
struct SpectralParams {
    float amplitudeThreshold = 0.001f;  // RMS below this is silence
    float amplitudeScale     = 15.0f;   // (rms - threshold) * scale -> intensity
    float centroidWide       = 0.65f;   // above: ee
    float centroidIh         = 0.45f;   // above: ih
    float centroidOh         = 0.25f;   // above: oh, else ou
};

/// Layered formant analysis.
struct FormantParams {
    float f1Low  = 200.0f,  f1High = 900.0f;    // jaw correlate
    float f2Low  = 900.0f,  f2High = 2500.0f;   // lip-shape correlate
    float hfLow  = 4000.0f, hfHigh = 10000.0f;  // sibilant band

    float amplitudeThreshold = 0.001f;
    float amplitudeScale     = 15.0f;
    float f1EnergyScale      = 4.0f;    // band RMS -> jaw contribution
    float jawAmplitudeWeight = 0.5f;
    float jawF1Weight        = 0.5f;
    float vowelScale         = 0.9f;

    // Smooth 2D vowel classification, on band-normalized centroids
    float openLow   = 0.20f, openHigh  = 0.55f;   // F1 centroid: closed -> open
    float frontLow  = 0.35f, frontHigh = 0.65f;   // F2 centroid: back -> front

    float sibilantSuppression = 0.6f;   // jaw *= 1 - hfRatio * this
    float lipTension          = 0.3f;   // spread added at full sibilance

    bool  jitter          = true;
    float jitterAmplitude = 0.02f;
    float jitterFrequency = 7.0f;

    float cueBlend = 0.2f;              // weight of concurrent cue targets, <= 0.3
};

/// Timed-cue coarticulation windows.
struct CoarticulationParams {
    float maxWindow          = 0.08f;   // seconds
    float windowFraction     = 0.3f;    // of cue duration
    float maxNextInfluence   = 0.6f;
    float adjacencyTolerance = 0.001f;  // cues closer than this are treated as abutting
};

enum class SmoothingMode {
    Symmetric,
    Asymmetric
};

struct SmoothingParams {
    SmoothingMode mode = SmoothingMode::Symmetric;
    float factor        = 0.2f;    // symmetric, per frame
    float silenceFactor = 0.45f;   // closing into silence

    //                         aa     ee     ih     oh     ou
    float attack[PHONEME_COUNT]  = {0.50f, 0.40f, 0.40f, 0.35f, 0.35f};
    float release[PHONEME_COUNT] = {0.15f, 0.12f, 0.12f, 0.10f, 0.10f};
};

/// Synthetic envelope when nothing can be analysed.
struct SyntheticParams {
    float syllableRate  = 4.0f;    // Hz
    float secondaryRate = 6.7f;    // Hz, incommensurate with syllableRate
    float jawScale      = 0.6f;
    float colourRate    = 0.35f;   // Hz, vowel colour rotation
    float colourScale   = 0.35f;
};

struct LipSyncParams {
    float maxMouthOpen = 1.0f;
    bool  highFidelity = false;

    SpectralParams       spectral;
    FormantParams        formant;
    CoarticulationParams coarticulation;
    SmoothingParams      smoothing;
    SyntheticParams      synthetic;
};

// ── Clamping ──

inline void sanitizeParams(SpectralParams &p) {
    clampParam(p.amplitudeThreshold, 0.0f, 1.0f, "spectral.amplitude_threshold");
    clampParam(p.amplitudeScale, 0.0f, 1000.0f, "spectral.amplitude_scale");
    clampParam(p.centroidWide, 0.0f, 1.0f, "spectral.centroid_wide");
    clampParam(p.centroidIh, 0.0f, p.centroidWide, "spectral.centroid_ih");
    clampParam(p.centroidOh, 0.0f, p.centroidIh, "spectral.centroid_oh");
}

inline void sanitizeParams(FormantParams &p) {
    clampRange(p.f1Low, p.f1High, 20.0f, 24000.0f, "formant.f1");
    clampRange(p.f2Low, p.f2High, 20.0f, 24000.0f, "formant.f2");
    clampRange(p.hfLow, p.hfHigh, 20.0f, 24000.0f, "formant.hf");
    clampParam(p.amplitudeThreshold, 0.0f, 1.0f, "formant.amplitude_threshold");
    clampParam(p.amplitudeScale, 0.0f, 1000.0f, "formant.amplitude_scale");
    clampParam(p.f1EnergyScale, 0.0f, 100.0f, "formant.f1_energy_scale");
    clampParam(p.jawAmplitudeWeight, 0.0f, 1.0f, "formant.jaw_amplitude_weight");
    clampParam(p.jawF1Weight, 0.0f, 1.0f, "formant.jaw_f1_weight");
    clampParam(p.vowelScale, 0.0f, 1.0f, "formant.vowel_scale");
    clampRange(p.openLow, p.openHigh, 0.0f, 1.0f, "formant.open");
    clampRange(p.frontLow, p.frontHigh, 0.0f, 1.0f, "formant.front");
    clampParam(p.sibilantSuppression, 0.0f, 1.0f, "formant.sibilant_suppression");
    clampParam(p.lipTension, 0.0f, 1.0f, "formant.lip_tension");
    clampParam(p.jitterAmplitude, 0.0f, 0.1f, "formant.jitter_amplitude");
    clampParam(p.jitterFrequency, 0.0f, 30.0f, "formant.jitter_frequency");
    clampParam(p.cueBlend, 0.0f, 0.3f, "formant.cue_blend");
}

inline void sanitizeParams(CoarticulationParams &p) {
    clampParam(p.maxWindow, 0.0f, 0.08f, "coarticulation.max_window");
    clampParam(p.windowFraction, 0.0f, 0.3f, "coarticulation.window_fraction");
    clampParam(p.maxNextInfluence, 0.0f, 0.6f, "coarticulation.max_next_influence");
    clampParam(p.adjacencyTolerance, 0.0f, 0.05f, "coarticulation.adjacency_tolerance");
}

inline void sanitizeParams(SmoothingParams &p) {
    clampParam(p.factor, 0.001f, 1.0f, "smoothing.factor");
    clampParam(p.silenceFactor, 0.001f, 1.0f, "smoothing.silence_factor");
    for (int i = 0; i < PHONEME_COUNT; ++i) {
        clampParam(p.attack[i], 0.001f, 1.0f, "smoothing.attack");
        clampParam(p.release[i], 0.001f, 1.0f, "smoothing.release");
    }
}

inline void sanitizeParams(SyntheticParams &p) {
    clampParam(p.syllableRate, 0.0f, 20.0f, "synthetic.syllable_rate");
    clampParam(p.secondaryRate, 0.0f, 20.0f, "synthetic.secondary_rate");
    clampParam(p.jawScale, 0.0f, 1.0f, "synthetic.jaw_scale");
    clampParam(p.colourRate, 0.0f, 5.0f, "synthetic.colour_rate");
    clampParam(p.colourScale, 0.0f, 1.0f, "synthetic.colour_scale");
}

inline void sanitizeParams(LipSyncParams &p) {
    clampParam(p.maxMouthOpen, 0.0f, 1.0f, "lipsync.max_mouth_open");
    sanitizeParams(p.spectral);
    sanitizeParams(p.formant);
    sanitizeParams(p.coarticulation);
    sanitizeParams(p.smoothing);
    sanitizeParams(p.synthetic);
}

} // namespace Marionette

#endif
