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
 *    IAudioSource — the platform audio primitive the lip-sync engine reads.
 *
 *    One instance per utterance player, owned by the host and handed to the
 *    engine as a non-owning pointer. It exposes:
 *    - a playback clock and play/pause/stop lifecycle
 *    - an optional analysis tap: fixed-length time-domain samples in [-1, 1]
 *      and frequency magnitudes in [0, 1] (bin count = analysisSize() / 2)
 *
 *    The analysis tap is exclusive: only one consumer may be connected at a
 *    time. A second connectAnalysis() fails until the first disconnects.
 *
 *    Reads never block; they copy whatever snapshot the audio pipeline last
 *    produced.
 *
 *****************************************************************************/

#ifndef __IAUDIOSOURCE_H
#define __IAUDIOSOURCE_H

#include <cstddef>

namespace Marionette {

enum class PlaybackStatus {
    Stopped,
    Playing,
    Paused
};

class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    // ── Lifecycle ──

    /// Request playback. false = transient refusal (autoplay policy, device
    /// busy); the caller may retry later.
    virtual bool play() = 0;
    virtual void pause() = 0;

    /// Pause and rewind to 0.
    virtual void stop() = 0;

    virtual PlaybackStatus status() const = 0;

    /// Seconds into the current utterance.
    virtual float playbackTime() const = 0;

    /// True once the clip has played to its end (status is then Stopped).
    virtual bool ended() const = 0;

    // ── Analysis tap ──

    /// Whether this source can provide analysis buffers at all.
    virtual bool supportsAnalysis() const = 0;

    /// Claim the analysis tap. false when unsupported or already claimed.
    virtual bool connectAnalysis() = 0;
    virtual void disconnectAnalysis() = 0;

    virtual float sampleRate() const = 0;

    /// Time-domain snapshot length N. Frequency snapshots hold N / 2 bins
    /// spanning 0 .. sampleRate / 2.
    virtual size_t analysisSize() const = 0;

    /// Copy up to n of the latest samples into out. Returns false on a read
    /// failure (tap lost, device error).
    virtual bool readTimeDomain(float *out, size_t n) = 0;
    virtual bool readFrequency(float *out, size_t n) = 0;
};

} // namespace Marionette

#endif
