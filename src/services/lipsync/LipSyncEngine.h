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
 *    LipSyncEngine — per-frame five-channel mouth shape from a cue track, a
 *    live audio tap, or neither.
 *
 *    The strategy is resolved from capabilities whenever they change (attach,
 *    detach, cue track, fidelity switch, play, pause, stop), in priority:
 *
 *      1. FormantLayered     analysis tap + high fidelity
 *      2. TimedCue           cue track + playback clock
 *      3. SpectralCentroid   analysis tap
 *      4. SyntheticEnvelope  playback intended, nothing to analyse
 *      5. Silent
 *
 *    update() then only runs the chosen estimator, feeds its targets through
 *    the smoothing stage and clamps to [0, maxMouthOpen]. A failed tap read
 *    demotes the strategy once; it is never re-promoted until the next
 *    attach.
 *
 *    The audio source is host-owned. The engine holds a non-owning pointer
 *    and releases the analysis tap on detach / destruction.
 *
 *****************************************************************************/

#ifndef __LIPSYNCENGINE_H
#define __LIPSYNCENGINE_H

#include <functional>
#include <vector>

#include "CueTrack.h"
#include "IAudioSource.h"
#include "LipSyncParams.h"
#include "MarionetteMath.h"
#include "PhonemeTypes.h"

namespace Marionette {

/// Everything strategy selection depends on.
struct LipSyncCapabilities {
    bool analysis = false;       // analysis tap connected and readable
    bool highFidelity = false;
    bool cueTrack = false;       // non-empty validated track
    bool playbackClock = false;  // an audio source is attached
    bool playbackIntent = false; // play() requested and not since stopped/paused
};

/// Pure strategy resolution.
LipSyncStrategy selectStrategy(const LipSyncCapabilities &caps);

/// Fired once when an utterance plays to its end.
using PlaybackEndedCallback = std::function<void()>;

class LipSyncEngine {
public:
    explicit LipSyncEngine(const LipSyncParams &params = LipSyncParams());
    ~LipSyncEngine();

    LipSyncEngine(const LipSyncEngine &) = delete;
    LipSyncEngine &operator=(const LipSyncEngine &) = delete;

    // ── Inputs ──

    /// Install a cue track for the next utterance. An empty vector clears the
    /// track. An invalid track is rejected (treated as absent) and false is
    /// returned.
    bool setCueTrack(std::vector<LipSyncCue> cues);
    void clearCueTrack();
    const CueTrack &cueTrack() const { return mTrack; }

    /// Wire to a host-owned audio source. Any previous source is detached
    /// first. A source whose analysis tap cannot be claimed is still used for
    /// its playback clock.
    void attachAudioSource(IAudioSource *source);
    void detachAudioSource();
    IAudioSource *audioSource() const { return mSource; }

    void setHighFidelity(bool enabled);
    bool highFidelity() const { return mParams.highFidelity; }

    // ── Playback ──

    /// Forward play() to the source and record the intent. false when the
    /// platform refused; the intent is kept.
    bool play();
    void pause();

    /// Stop, rewind and close the mouth immediately.
    void stop();

    bool isPlaying() const { return mPlaybackIntent; }

    /// Snap every channel to 0.
    void resetMouth() { mCurrent = PhonemeVector(); }

    void setOnPlaybackEnded(PlaybackEndedCallback cb) { mOnPlaybackEnded = std::move(cb); }

    // ── Per frame ──

    PhonemeVector update(float dt = REFERENCE_FRAME_DT);

    const PhonemeVector &current() const { return mCurrent; }

    // ── Tuning / diagnostics ──

    void setParams(const LipSyncParams &params);
    const LipSyncParams &params() const { return mParams; }

    LipSyncStrategy strategy() const { return mStrategy; }
    LipSyncDiagnostic lastDiagnostic() const { return mDiagnostic; }
    LipSyncCapabilities capabilities() const;

private:
    void resolveStrategy();
    void demoteAnalysis();
    void releaseTap();
    void checkPlaybackEnded();

    bool readSnapshot();
    PhonemeVector targetsFromFormants(bool &silent);
    PhonemeVector targetsFromCentroid(bool &silent);
    PhonemeVector targetsFromCues(bool &silent) const;

    LipSyncParams mParams;
    CueTrack mTrack;

    IAudioSource *mSource = nullptr;
    bool mTapConnected = false;
    bool mAnalysisUsable = false;

    // Scratch, sized at attach
    std::vector<float> mTimeDomain;
    std::vector<float> mFrequency;

    LipSyncStrategy mStrategy = LipSyncStrategy::Silent;
    LipSyncDiagnostic mDiagnostic = LipSyncDiagnostic::None;

    bool mPlaybackIntent = false;
    PlaybackEndedCallback mOnPlaybackEnded;

    PhonemeVector mCurrent;
    float mClock = 0.0f;   // drives the synthetic envelope and jitter
};

} // namespace Marionette

#endif
