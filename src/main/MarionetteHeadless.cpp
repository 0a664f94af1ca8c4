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

// Headless driver for Marionette
// Runs the avatar state machine and the lip-sync engine over a simulated
// clock and prints one CSV row per frame.

#include "logger.h"
#include "stdlog.h"

#include "AvatarStateMachine.h"
#include "BufferedAudioSource.h"
#include "CueTrackLoader.h"
#include "LipSyncEngine.h"
#include "MarionetteConfig.h"
#include "MouthForm.h"
#include "SpectralAnalysis.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace Marionette;

static constexpr float SIM_SAMPLE_RATE = 44100.0f;
static constexpr size_t SIM_FFT_SIZE = 2048;

// ---------- Simulated analysis snapshots ----------

// Add a Gaussian resonance peak to a magnitude spectrum.
static void addPeak(std::vector<float> &mags, float binHz, float centerHz,
                    float widthHz, float gain) {
    for (size_t i = 0; i < mags.size(); ++i) {
        float d = (static_cast<float>(i) * binHz - centerHz) / widthHz;
        mags[i] += gain * std::exp(-0.5f * d * d);
    }
}

// Fake a voiced snapshot for the given mouth targets: F1 rises with jaw
// opening, F2 rises with lip spread and falls with rounding.
static void synthesizeSnapshot(const PhonemeVector &v, float t,
                               std::vector<float> &timeDomain,
                               std::vector<float> &mags) {
    float level = std::min(1.0f, v.maxChannel());
    float f1 = 300.0f + 500.0f * v.aa;
    float f2 = 1200.0f + 1000.0f * (v.ee + 0.6f * v.ih) - 500.0f * (v.oh + v.ou);
    f2 = std::max(f2, f1 + 200.0f);

    std::fill(mags.begin(), mags.end(), 0.0f);
    const float binHz = SIM_SAMPLE_RATE / static_cast<float>(SIM_FFT_SIZE);
    if (level > 0.0f) {
        addPeak(mags, binHz, f1, 120.0f, 0.8f * level);
        addPeak(mags, binHz, f2, 200.0f, 0.5f * level);
    }
    for (float &m : mags)
        m = std::min(m, 1.0f);

    for (size_t i = 0; i < timeDomain.size(); ++i) {
        float s = t + static_cast<float>(i) / SIM_SAMPLE_RATE;
        timeDomain[i] = 0.3f * level * (std::sin(TWO_PI * f1 * s) + 0.5f * std::sin(TWO_PI * f2 * s)) / 1.5f;
    }
}

// ---------- Usage ----------

static void printUsage(const char *prog) {
    std::cerr << "Marionette headless driver" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Usage: " << prog << " [options]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config <file>   YAML tunables (default: marionette.yaml if present)" << std::endl;
    std::cerr << "  --cues <file>     Cue track JSON (backend list or mouthCues form)" << std::endl;
    std::cerr << "  --state <name>    idle | listening | thinking | talking (default: talking)" << std::endl;
    std::cerr << "  --frames <n>      Frames to simulate (default: 300)" << std::endl;
    std::cerr << "  --fps <f>         Simulated frame rate (default: 60)" << std::endl;
    std::cerr << "  --seed <n>        Random seed, 0 = nondeterministic (default: 1)" << std::endl;
    std::cerr << "  --formant         High-fidelity formant analysis of a simulated voice" << std::endl;
    std::cerr << "  --verbose         Debug logging to stderr" << std::endl;
}

// ---------- Main ----------

int main(int argc, char *argv[]) {
    Logger logger;
    StdLog stdlog;
    logger.registerLogListener(&stdlog);
    logger.setLogLevel(Logger::LOG_LEVEL_ERROR);

    // Parse config: hardcoded defaults -> YAML file -> CLI overrides
    MarionetteConfig cfg;
    CliResult cli = applyCliOverrides(argc, argv, cfg);

    if (cli.helpRequested) {
        printUsage(argv[0]);
        logger.unregisterLogListener(&stdlog);
        return 0;
    }
    if (cli.badArgument) {
        printUsage(argv[0]);
        logger.unregisterLogListener(&stdlog);
        return 1;
    }
    if (cli.verbose)
        logger.setLogLevel(Logger::LOG_LEVEL_DEBUG);

    std::string configPath = cli.configPath.empty() ? "marionette.yaml" : cli.configPath;
    if (!loadConfigFromYAML(configPath, cfg) && !cli.configPath.empty())
        LOG_ERROR("Using defaults, could not load %s", configPath.c_str());

    // Re-apply CLI so flags always win over YAML values
    cli = applyCliOverrides(argc, argv, cfg);

    std::vector<LipSyncCue> cues;
    if (!cli.cuesPath.empty() && !loadCueTrackFromFile(cli.cuesPath, cues)) {
        logger.unregisterLogListener(&stdlog);
        return 1;
    }

    AvatarStateMachine avatar(cfg.avatar, cli.seed);
    avatar.setState(cli.state);

    LipSyncEngine lipsync(cfg.lipsync);
    if (!lipsync.setCueTrack(cues)) {
        logger.unregisterLogListener(&stdlog);
        return 1;
    }

    const float dt = 1.0f / cli.fps;
    float duration = lipsync.cueTrack().empty()
                         ? static_cast<float>(cli.frames) * dt
                         : lipsync.cueTrack().duration();

    // Analysis only when simulating a voice for the formant path
    BufferedAudioSource audio(SIM_SAMPLE_RATE, cfg.lipsync.highFidelity ? SIM_FFT_SIZE : 0,
                              duration);
    std::vector<float> timeDomain(SIM_FFT_SIZE, 0.0f);
    std::vector<float> mags(SIM_FFT_SIZE / 2, 0.0f);

    lipsync.attachAudioSource(&audio);
    lipsync.setOnPlaybackEnded([]() { LOG_INFO("Utterance finished"); });
    lipsync.play();

    LOG_INFO("Simulating %d frames at %.1f fps, state %s, lip-sync %s", cli.frames,
             static_cast<double>(cli.fps), conversationStateName(cli.state),
             lipSyncStrategyName(lipsync.strategy()));

    std::printf("time,state,phase,head_pitch,head_yaw,head_roll,body_lean,eye_x,eye_y,blink,"
                "aa,ee,ih,oh,ou,mouth_open,mouth_form,strategy\n");

    CoarticulationParams reference = cfg.lipsync.coarticulation;
    float t = 0.0f;
    for (int frame = 0; frame < cli.frames; ++frame) {
        t += dt;
        audio.advance(dt);

        if (cfg.lipsync.highFidelity) {
            PhonemeVector voice;
            if (!lipsync.cueTrack().empty())
                voice = lipsync.cueTrack().sample(audio.playbackTime(), reference).targets;
            else if (audio.status() == PlaybackStatus::Playing)
                voice = syntheticEnvelope(t, cfg.lipsync.synthetic);
            synthesizeSnapshot(voice, t, timeDomain, mags);
            audio.setSnapshot(timeDomain, mags);
        }

        PoseVector pose = avatar.update(dt);
        PhonemeVector mouth = lipsync.update(dt);
        MouthForm form = toMouthForm(mouth);

        std::printf("%.4f,%s,%s,%.5f,%.5f,%.5f,%.5f,%.5f,%.5f,%.4f,"
                    "%.4f,%.4f,%.4f,%.4f,%.4f,%.4f,%.4f,%s\n",
                    static_cast<double>(t), conversationStateName(avatar.getState()),
                    motionPhaseName(avatar.phase()),
                    static_cast<double>(pose.headPitch), static_cast<double>(pose.headYaw),
                    static_cast<double>(pose.headRoll), static_cast<double>(pose.bodyLean),
                    static_cast<double>(pose.eyeX), static_cast<double>(pose.eyeY),
                    static_cast<double>(pose.blink),
                    static_cast<double>(mouth.aa), static_cast<double>(mouth.ee),
                    static_cast<double>(mouth.ih), static_cast<double>(mouth.oh),
                    static_cast<double>(mouth.ou),
                    static_cast<double>(form.open), static_cast<double>(form.form),
                    lipSyncStrategyName(lipsync.strategy()));
    }

    lipsync.detachAudioSource();
    logger.unregisterLogListener(&stdlog);
    return 0;
}
