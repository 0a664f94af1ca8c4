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

#include "LipSyncEngine.h"
#include "PhonemeSmoother.h"
#include "SpectralAnalysis.h"
#include "logger.h"

#include <cmath>
#include <string>

namespace Marionette {

LipSyncStrategy selectStrategy(const LipSyncCapabilities &caps) {
    if (caps.analysis && caps.highFidelity)
        return LipSyncStrategy::FormantLayered;
    if (caps.cueTrack && caps.playbackClock)
        return LipSyncStrategy::TimedCue;
    if (caps.analysis)
        return LipSyncStrategy::SpectralCentroid;
    if (caps.playbackIntent)
        return LipSyncStrategy::SyntheticEnvelope;
    return LipSyncStrategy::Silent;
}

/*----------------------------------------------------*/
/*------------------- LipSyncEngine ------------------*/
/*----------------------------------------------------*/
LipSyncEngine::LipSyncEngine(const LipSyncParams &params) : mParams(params) {
    sanitizeParams(mParams);
}

//------------------------------------------------------
LipSyncEngine::~LipSyncEngine() {
    releaseTap();
}

//------------------------------------------------------
bool LipSyncEngine::setCueTrack(std::vector<LipSyncCue> cues) {
    if (cues.empty()) {
        clearCueTrack();
        return true;
    }

    std::string error;
    if (!mTrack.assign(std::move(cues), mParams.coarticulation.adjacencyTolerance, &error)) {
        LOG_ERROR("LipSyncEngine: cue track rejected (%s)", error.c_str());
        mDiagnostic = LipSyncDiagnostic::InvalidCueTrack;
        resolveStrategy();
        return false;
    }

    LOG_DEBUG("LipSyncEngine: cue track with %zu cues, %.2fs", mTrack.size(),
              static_cast<double>(mTrack.duration()));
    resolveStrategy();
    return true;
}

//------------------------------------------------------
void LipSyncEngine::clearCueTrack() {
    mTrack.clear();
    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::attachAudioSource(IAudioSource *source) {
    if (mSource)
        detachAudioSource();

    mSource = source;
    if (!mSource) {
        resolveStrategy();
        return;
    }

    if (mSource->supportsAnalysis()) {
        if (mSource->connectAnalysis()) {
            mTapConnected = true;
            mAnalysisUsable = true;
            size_t n = mSource->analysisSize();
            mTimeDomain.assign(n, 0.0f);
            mFrequency.assign(n / 2, 0.0f);
        } else {
            LOG_INFO("LipSyncEngine: analysis tap unavailable, using playback clock only");
            mDiagnostic = LipSyncDiagnostic::AnalysisUnavailable;
        }
    }

    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::detachAudioSource() {
    releaseTap();
    mSource = nullptr;
    mPlaybackIntent = false;
    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::releaseTap() {
    if (mSource && mTapConnected)
        mSource->disconnectAnalysis();
    mTapConnected = false;
    mAnalysisUsable = false;
}

//------------------------------------------------------
void LipSyncEngine::setHighFidelity(bool enabled) {
    if (mParams.highFidelity == enabled)
        return;
    mParams.highFidelity = enabled;
    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::setParams(const LipSyncParams &params) {
    mParams = params;
    sanitizeParams(mParams);
    resolveStrategy();
}

//------------------------------------------------------
bool LipSyncEngine::play() {
    mPlaybackIntent = true;
    bool started = true;

    if (mSource && !mSource->play()) {
        // Autoplay policy or a busy device; the host retries later
        LOG_INFO("LipSyncEngine: playback refused by the audio source, keeping intent");
        mDiagnostic = LipSyncDiagnostic::PlaybackBlocked;
        started = false;
    }

    resolveStrategy();
    return started;
}

//------------------------------------------------------
void LipSyncEngine::pause() {
    if (mSource)
        mSource->pause();
    mPlaybackIntent = false;
    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::stop() {
    if (mSource)
        mSource->stop();
    mPlaybackIntent = false;
    resetMouth();
    resolveStrategy();
}

//------------------------------------------------------
LipSyncCapabilities LipSyncEngine::capabilities() const {
    LipSyncCapabilities caps;
    caps.analysis = mTapConnected && mAnalysisUsable;
    caps.highFidelity = mParams.highFidelity;
    caps.cueTrack = !mTrack.empty();
    caps.playbackClock = mSource != nullptr;
    caps.playbackIntent = mPlaybackIntent;
    return caps;
}

//------------------------------------------------------
void LipSyncEngine::resolveStrategy() {
    LipSyncStrategy next = selectStrategy(capabilities());
    if (next == mStrategy)
        return;
    LOG_DEBUG("LipSyncEngine: strategy %s -> %s", lipSyncStrategyName(mStrategy),
              lipSyncStrategyName(next));
    mStrategy = next;
}

//------------------------------------------------------
void LipSyncEngine::demoteAnalysis() {
    LOG_ERROR("LipSyncEngine: analysis read failed, dropping %s mode",
              lipSyncStrategyName(mStrategy));
    mDiagnostic = LipSyncDiagnostic::AnalysisReadFailed;
    releaseTap();
    resolveStrategy();
}

//------------------------------------------------------
void LipSyncEngine::checkPlaybackEnded() {
    if (!mPlaybackIntent || !mSource || !mSource->ended())
        return;

    LOG_DEBUG("LipSyncEngine: utterance finished");
    mPlaybackIntent = false;
    resolveStrategy();
    if (mOnPlaybackEnded)
        mOnPlaybackEnded();
}

//------------------------------------------------------
bool LipSyncEngine::readSnapshot() {
    return mSource->readTimeDomain(mTimeDomain.data(), mTimeDomain.size()) &&
           mSource->readFrequency(mFrequency.data(), mFrequency.size());
}

//------------------------------------------------------
PhonemeVector LipSyncEngine::targetsFromFormants(bool &silent) {
    FormantAnalysis fa = analyzeFormants(mTimeDomain.data(), mTimeDomain.size(),
                                         mFrequency.data(), mFrequency.size(),
                                         mSource->sampleRate(), mParams.formant);
    silent = !(fa.amplitude > mParams.formant.amplitudeThreshold);
    PhonemeVector v = estimateFromFormants(fa, mParams.formant, mClock);

    // Refine toward the backend's cue when both are available
    if (!mTrack.empty() && mParams.formant.cueBlend > 0.0f) {
        CueSample cs = mTrack.sample(mSource->playbackTime(), mParams.coarticulation);
        if (cs.cueIndex >= 0)
            v = lerp(v, cs.targets, mParams.formant.cueBlend);
    }
    return v;
}

//------------------------------------------------------
PhonemeVector LipSyncEngine::targetsFromCentroid(bool &silent) {
    float amplitude = computeRms(mTimeDomain.data(), mTimeDomain.size());
    float centroid = computeSpectralCentroid(mFrequency.data(), mFrequency.size());
    silent = !(amplitude > mParams.spectral.amplitudeThreshold);
    return estimateFromCentroid(amplitude, centroid, mParams.spectral);
}

//------------------------------------------------------
PhonemeVector LipSyncEngine::targetsFromCues(bool &silent) const {
    // Cues follow the audio; nothing moves while it is not audibly playing
    if (mSource->status() != PlaybackStatus::Playing) {
        silent = true;
        return PhonemeVector();
    }
    CueSample cs = mTrack.sample(mSource->playbackTime(), mParams.coarticulation);
    silent = cs.silent;
    return cs.targets;
}

//------------------------------------------------------
PhonemeVector LipSyncEngine::update(float rawDt) {
    const float dt = sanitizeDt(rawDt);
    mClock += dt;

    checkPlaybackEnded();

    PhonemeVector target;
    bool silent = false;

    switch (mStrategy) {
    case LipSyncStrategy::FormantLayered:
        if (readSnapshot()) {
            target = targetsFromFormants(silent);
        } else {
            demoteAnalysis();
            silent = true;
        }
        break;
    case LipSyncStrategy::TimedCue:
        target = targetsFromCues(silent);
        break;
    case LipSyncStrategy::SpectralCentroid:
        if (readSnapshot()) {
            target = targetsFromCentroid(silent);
        } else {
            demoteAnalysis();
            silent = true;
        }
        break;
    case LipSyncStrategy::SyntheticEnvelope:
        target = syntheticEnvelope(mClock, mParams.synthetic);
        break;
    case LipSyncStrategy::Silent:
        silent = true;
        break;
    }

    mCurrent = smoothPhonemes(mCurrent, target, silent, mParams.smoothing, dt);

    for (int i = 0; i < PHONEME_COUNT; ++i) {
        if (!std::isfinite(mCurrent[i])) {
            LOG_ERROR("LipSyncEngine: non-finite mouth output, resetting");
            mCurrent = PhonemeVector();
            break;
        }
    }
    mCurrent.clamp(0.0f, mParams.maxMouthOpen);

    return mCurrent;
}

} // namespace Marionette
