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

// BufferedAudioSource.h — in-memory IAudioSource
//
// The host (or a test) owns the clock and the analysis snapshot: it calls
// advance()/setTime() as its own audio output progresses and setSnapshot()
// whenever new samples are available. Nothing here touches a device.

#pragma once

#include <algorithm>
#include <vector>

#include "IAudioSource.h"

namespace Marionette {

class BufferedAudioSource : public IAudioSource {
public:
    /// analysisSize == 0 makes a source with playback only (no analysis tap).
    explicit BufferedAudioSource(float sampleRate = 44100.0f,
                                 size_t analysisSize = 2048,
                                 float duration = 0.0f)
        : mSampleRate(sampleRate), mAnalysisSize(analysisSize),
          mDuration(duration), mTimeDomain(analysisSize, 0.0f),
          mFrequency(analysisSize / 2, 0.0f) {}

    // ── IAudioSource ──

    bool play() override {
        if (mPlayBlocked) return false;
        mStatus = PlaybackStatus::Playing;
        mEnded = false;
        return true;
    }

    void pause() override {
        if (mStatus == PlaybackStatus::Playing)
            mStatus = PlaybackStatus::Paused;
    }

    void stop() override {
        mStatus = PlaybackStatus::Stopped;
        mTime = 0.0f;
    }

    PlaybackStatus status() const override { return mStatus; }
    float playbackTime() const override { return mTime; }
    bool ended() const override { return mEnded; }

    bool supportsAnalysis() const override { return mAnalysisSize > 0; }

    bool connectAnalysis() override {
        if (!supportsAnalysis() || mTapConnected) return false;
        mTapConnected = true;
        return true;
    }

    void disconnectAnalysis() override { mTapConnected = false; }

    float sampleRate() const override { return mSampleRate; }
    size_t analysisSize() const override { return mAnalysisSize; }

    bool readTimeDomain(float *out, size_t n) override {
        if (!mTapConnected || mReadFails) return false;
        std::copy_n(mTimeDomain.begin(), std::min(n, mTimeDomain.size()), out);
        return true;
    }

    bool readFrequency(float *out, size_t n) override {
        if (!mTapConnected || mReadFails) return false;
        std::copy_n(mFrequency.begin(), std::min(n, mFrequency.size()), out);
        return true;
    }

    // ── Host side ──

    /// Move the clock forward while playing. Reaching a nonzero duration
    /// stops the source and marks it ended.
    void advance(float dt) {
        if (mStatus != PlaybackStatus::Playing) return;
        mTime += dt;
        if (mDuration > 0.0f && mTime >= mDuration) {
            mTime = mDuration;
            mStatus = PlaybackStatus::Stopped;
            mEnded = true;
        }
    }

    void setTime(float t) { mTime = t; }
    void setDuration(float d) { mDuration = d; }

    /// Replace the analysis snapshot. Shorter inputs are zero padded, longer
    /// inputs truncated to the fixed sizes.
    void setSnapshot(const std::vector<float> &timeDomain,
                     const std::vector<float> &frequency) {
        std::fill(mTimeDomain.begin(), mTimeDomain.end(), 0.0f);
        std::fill(mFrequency.begin(), mFrequency.end(), 0.0f);
        std::copy_n(timeDomain.begin(), std::min(timeDomain.size(), mTimeDomain.size()),
                    mTimeDomain.begin());
        std::copy_n(frequency.begin(), std::min(frequency.size(), mFrequency.size()),
                    mFrequency.begin());
    }

    /// Simulate an autoplay policy refusing play().
    void setPlayBlocked(bool blocked) { mPlayBlocked = blocked; }

    /// Simulate the tap failing after it was connected.
    void setReadFails(bool fails) { mReadFails = fails; }

    bool analysisConnected() const { return mTapConnected; }

private:
    float mSampleRate;
    size_t mAnalysisSize;
    float mDuration;

    std::vector<float> mTimeDomain;
    std::vector<float> mFrequency;

    PlaybackStatus mStatus = PlaybackStatus::Stopped;
    float mTime = 0.0f;
    bool mEnded = false;
    bool mTapConnected = false;
    bool mPlayBlocked = false;
    bool mReadFails = false;
};

} // namespace Marionette
