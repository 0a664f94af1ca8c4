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

#include "SpectralAnalysis.h"
#include "MarionetteMath.h"

#include <algorithm>
#include <cmath>

namespace Marionette {

namespace {

struct BandStats {
    float energy = 0.0f;    // RMS magnitude over the band
    float centroid = 0.0f;  // 0 = band floor, 1 = band ceiling
};

BandStats measureBand(const float *mags, size_t binCount, float binHz,
                      float lo, float hi) {
    BandStats bs;
    if (binHz <= 0.0f || hi <= lo)
        return bs;

    size_t first = static_cast<size_t>(std::ceil(lo / binHz));
    size_t last = std::min(binCount, static_cast<size_t>(std::ceil(hi / binHz)));
    if (first >= last)
        return bs;

    float sumSq = 0.0f, sumMag = 0.0f, sumFreq = 0.0f;
    for (size_t i = first; i < last; ++i) {
        float m = std::max(mags[i], 0.0f);
        sumSq += m * m;
        sumMag += m;
        sumFreq += m * static_cast<float>(i) * binHz;
    }

    bs.energy = std::sqrt(sumSq / static_cast<float>(last - first));
    if (sumMag > 0.0f) {
        float hz = sumFreq / sumMag;
        bs.centroid = std::clamp((hz - lo) / (hi - lo), 0.0f, 1.0f);
    }
    return bs;
}

} // namespace

//------------------------------------------------------
float computeRms(const float *samples, size_t n) {
    if (n == 0)
        return 0.0f;
    float sumSq = 0.0f;
    for (size_t i = 0; i < n; ++i)
        sumSq += samples[i] * samples[i];
    return std::sqrt(sumSq / static_cast<float>(n));
}

//------------------------------------------------------
float computeSpectralCentroid(const float *mags, size_t n) {
    float weighted = 0.0f, total = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        float m = std::max(mags[i], 0.0f);
        weighted += static_cast<float>(i) * m;
        total += m;
    }
    return total > 0.0f ? weighted / total / static_cast<float>(n) : 0.0f;
}

//------------------------------------------------------
FormantAnalysis analyzeFormants(const float *samples, size_t sampleCount,
                                const float *mags, size_t binCount,
                                float sampleRate, const FormantParams &p) {
    FormantAnalysis fa;
    fa.amplitude = computeRms(samples, sampleCount);

    if (binCount == 0 || sampleRate <= 0.0f)
        return fa;

    const float binHz = sampleRate / static_cast<float>(binCount * 2);

    BandStats f1 = measureBand(mags, binCount, binHz, p.f1Low, p.f1High);
    BandStats f2 = measureBand(mags, binCount, binHz, p.f2Low, p.f2High);
    BandStats hf = measureBand(mags, binCount, binHz, p.hfLow, p.hfHigh);

    fa.f1Energy = f1.energy;
    fa.f2Energy = f2.energy;
    fa.f1Centroid = f1.centroid;
    fa.f2Centroid = f2.centroid;

    float total = f1.energy + f2.energy + hf.energy;
    fa.hfRatio = total > 0.0f ? hf.energy / total : 0.0f;
    return fa;
}

/*----------------------------------------------------*/
/*-------------------- Estimators --------------------*/
/*----------------------------------------------------*/
PhonemeVector estimateFromCentroid(float amplitude, float centroid,
                                   const SpectralParams &p) {
    PhonemeVector v;
    if (!(amplitude > p.amplitudeThreshold))
        return v;

    float intensity = std::min(1.0f, (amplitude - p.amplitudeThreshold) * p.amplitudeScale);

    if (centroid > p.centroidWide) {
        v.ee = intensity * 0.8f;
        v.aa = intensity * 0.3f;
    } else if (centroid > p.centroidIh) {
        v.ih = intensity * 0.7f;
        v.aa = intensity * 0.5f;
    } else if (centroid > p.centroidOh) {
        v.oh = intensity * 0.8f;
        v.aa = intensity * 0.6f;
    } else {
        v.ou = intensity * 0.9f;
        v.aa = intensity * 0.4f;
    }
    return v;
}

//------------------------------------------------------
PhonemeVector estimateFromFormants(const FormantAnalysis &fa,
                                   const FormantParams &p, float jitterClock) {
    PhonemeVector v;
    if (!(fa.amplitude > p.amplitudeThreshold))
        return v;

    float loud = std::min(1.0f, (fa.amplitude - p.amplitudeThreshold) * p.amplitudeScale);
    float f1 = std::min(1.0f, fa.f1Energy * p.f1EnergyScale);

    float jaw = std::min(1.0f, p.jawAmplitudeWeight * loud + p.jawF1Weight * f1);
    jaw *= 1.0f - fa.hfRatio * p.sibilantSuppression;

    // Blended quadrants: F2 picks front/back, F1 picks open/closed
    float open = smoothstep(p.openLow, p.openHigh, fa.f1Centroid);
    float front = smoothstep(p.frontLow, p.frontHigh, fa.f2Centroid);
    float back = 1.0f - front;
    float vowel = loud * p.vowelScale;

    v.aa = jaw;
    v.ee = front * (1.0f - open) * vowel;
    v.ih = front * open * vowel;
    v.oh = back * open * vowel;
    v.ou = back * (1.0f - open) * vowel;

    // Sibilants spread the lips
    float tension = fa.hfRatio * p.lipTension * loud;
    v.ee += tension;
    v.ih += tension * 0.5f;

    if (p.jitter && p.jitterAmplitude > 0.0f) {
        for (int i = 0; i < PHONEME_COUNT; ++i) {
            if (v[i] <= 0.0f)
                continue;
            float phase = jitterClock * TWO_PI * p.jitterFrequency + static_cast<float>(i) * 1.7f;
            v[i] = std::max(0.0f, v[i] + std::sin(phase) * p.jitterAmplitude);
        }
    }

    return v;
}

//------------------------------------------------------
PhonemeVector syntheticEnvelope(float t, const SyntheticParams &p) {
    PhonemeVector v;

    float primary = 0.5f * (std::sin(TWO_PI * p.syllableRate * t) + 1.0f);
    float secondary = 0.5f * (std::sin(TWO_PI * p.secondaryRate * t + 1.3f) + 1.0f);
    float env = 0.65f * primary + 0.35f * secondary;

    v.aa = env * p.jawScale;

    // Four vowel lobes a quarter turn apart
    float angle = TWO_PI * p.colourRate * t;
    for (int i = PHONEME_EE; i <= PHONEME_OU; ++i) {
        float lobe = std::cos(angle - static_cast<float>(i - PHONEME_EE) * 0.5f * PI);
        v[i] = std::max(0.0f, lobe) * env * p.colourScale;
    }
    return v;
}

} // namespace Marionette
