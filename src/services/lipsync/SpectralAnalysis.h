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

// SpectralAnalysis.h — pure transforms over analysis snapshots
//
// Nothing here allocates or keeps state; every function reads buffers the
// caller already filled. Frequency bin i covers i * sampleRate / fftSize Hz,
// with fftSize = 2 * binCount.

#pragma once

#include <cstddef>

#include "LipSyncParams.h"
#include "PhonemeTypes.h"

namespace Marionette {

/// Root mean square of time-domain samples in [-1, 1].
float computeRms(const float *samples, size_t n);

/// Energy-weighted mean bin index divided by the bin count, in [0, 1).
/// 0 when the spectrum is empty.
float computeSpectralCentroid(const float *magnitudes, size_t n);

/// Split the spectrum into F1 / F2 / high bands and measure each.
FormantAnalysis analyzeFormants(const float *samples, size_t sampleCount,
                                const float *magnitudes, size_t binCount,
                                float sampleRate, const FormantParams &p);

// ── Target estimators ──

/// Amplitude drives jaw opening; the centroid bucket picks one vowel channel.
PhonemeVector estimateFromCentroid(float amplitude, float centroid,
                                   const SpectralParams &p);

/// 2D vowel classification from band centroids plus sibilant suppression.
/// jitterClock feeds the optional tremor; pass 0 to get the bare estimate.
PhonemeVector estimateFromFormants(const FormantAnalysis &fa,
                                   const FormantParams &p, float jitterClock);

/// Syllable-rate envelope and rotating vowel colour at time t.
PhonemeVector syntheticEnvelope(float t, const SyntheticParams &p);

} // namespace Marionette
