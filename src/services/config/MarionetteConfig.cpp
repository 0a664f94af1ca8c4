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

#include "MarionetteConfig.h"
#include "logger.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <yaml-cpp/yaml.h>

namespace Marionette {

namespace {

template <typename T>
void read(const YAML::Node &sec, const char *key, T &out) {
    if (sec[key])
        out = sec[key].as<T>();
}

void readVec3(const YAML::Node &sec, const char *key, Vector3 &out) {
    YAML::Node n = sec[key];
    if (!n)
        return;
    if (!n.IsSequence() || n.size() != 3)
        throw YAML::Exception(n.Mark(), std::string(key) + " needs three values");
    out = Vector3(n[0].as<float>(), n[1].as<float>(), n[2].as<float>());
}

// [min, max] pair
void readRange(const YAML::Node &sec, const char *key, float &lo, float &hi) {
    YAML::Node n = sec[key];
    if (!n)
        return;
    if (!n.IsSequence() || n.size() != 2)
        throw YAML::Exception(n.Mark(), std::string(key) + " needs [min, max]");
    lo = n[0].as<float>();
    hi = n[1].as<float>();
}

// { aa: .., ee: .., ... } onto a per-channel array
void readChannels(const YAML::Node &sec, const char *key, float (&out)[PHONEME_COUNT]) {
    YAML::Node n = sec[key];
    if (!n)
        return;
    for (int i = 0; i < PHONEME_COUNT; ++i)
        read(n, phonemeChannelName(i), out[i]);
}

void readIdle(const YAML::Node &s, IdleParams &p) {
    read(s, "look_duration", p.lookDuration);
    read(s, "look_change_chance", p.lookChangeChance);
    readVec3(s, "head_range", p.headRange);
    read(s, "eye_range", p.eyeRange);
    read(s, "look_at_user_chance", p.lookAtUserChance);
    readRange(s, "look_at_user_duration", p.lookAtUserDurationMin, p.lookAtUserDurationMax);
}

void readListening(const YAML::Node &s, ListeningParams &p) {
    read(s, "nod_intensity", p.nodIntensity);
    read(s, "nod_count", p.nodCount);
    read(s, "nod_cycle_duration", p.nodCycleDuration);
    read(s, "nod_active_portion", p.nodActivePortion);
    read(s, "nod_decay", p.nodDecay);
    read(s, "side_look_chance", p.sideLookChance);
    readRange(s, "side_look_duration", p.sideLookDurationMin, p.sideLookDurationMax);
    read(s, "side_look_head_turn", p.sideLookHeadTurn);
    read(s, "side_look_eye_range", p.sideLookEyeRange);
    read(s, "eye_micro_range", p.eyeMicroRange);
    read(s, "eye_micro_interval", p.eyeMicroInterval);
}

void readThinking(const YAML::Node &s, ThinkingParams &p) {
    read(s, "look_duration", p.lookDuration);
    read(s, "look_change_chance", p.lookChangeChance);
    readVec3(s, "head_range", p.headRange);
    read(s, "eye_range", p.eyeRange);
    read(s, "look_up_bias", p.lookUpBias);
    read(s, "eye_lead_time", p.eyeLeadTime);
    read(s, "eye_lead_amount", p.eyeLeadAmount);
    read(s, "eye_head_sync", p.eyeHeadSync);
    read(s, "look_at_user_chance", p.lookAtUserChance);
    readRange(s, "look_at_user_duration", p.lookAtUserDurationMin, p.lookAtUserDurationMax);
}

void readTalking(const YAML::Node &s, TalkingParams &p) {
    read(s, "nod_intensity", p.nodIntensity);
    read(s, "nod_frequency", p.nodFrequency);
    read(s, "nod_variation", p.nodVariation);
    read(s, "nod_intensity_variation", p.nodIntensityVariation);
    read(s, "nod_frequency_variation", p.nodFrequencyVariation);
    read(s, "nod_change_interval", p.nodChangeInterval);
    read(s, "nod_pause_chance", p.nodPauseChance);
    read(s, "nod_decay", p.nodDecay);
    read(s, "tilt_chance", p.tiltChance);
    read(s, "tilt_intensity", p.tiltIntensity);
    read(s, "occasional_turn", p.occasionalTurn);
    read(s, "turn_range", p.turnRange);
    read(s, "turn_decay", p.turnDecay);
    read(s, "tilt_decay", p.tiltDecay);
    read(s, "eye_range", p.eyeRange);
    read(s, "eye_drift_interval", p.eyeDriftInterval);
}

void readMotion(const YAML::Node &s, MotionParams &p) {
    read(s, "base_acceleration", p.baseAcceleration);
    read(s, "damping", p.damping);
    for (int i = 0; i < static_cast<int>(ConversationState::NumStates); ++i) {
        const char *name = conversationStateName(static_cast<ConversationState>(i));
        if (YAML::Node accel = s["accel_multiplier"])
            read(accel, name, p.perState[i].accelMultiplier);
        if (YAML::Node eye = s["eye_rate"])
            read(eye, name, p.perState[i].eyeRate);
    }
    read(s, "transition_ease", p.transitionEase);
    read(s, "transition_eye_scale", p.transitionEyeScale);
    read(s, "transition_velocity_decay", p.transitionVelDecay);
    read(s, "center_epsilon", p.centerEpsilon);
    read(s, "min_transition_time", p.minTransitionTime);
    read(s, "lock_duration", p.lockDuration);
    read(s, "lock_eye_rate", p.lockEyeRate);
    read(s, "velocity_cap", p.velocityCap);
}

void readBlink(const YAML::Node &s, BlinkParams &p) {
    read(s, "duration", p.duration);
    read(s, "close_fraction", p.closeFraction);
    readRange(s, "first_blink", p.firstBlinkMin, p.firstBlinkMax);
    readRange(s, "interval", p.intervalMin, p.intervalMax);
    read(s, "double_blink_chance", p.doubleBlinkChance);
    readRange(s, "double_delay", p.doubleDelayMin, p.doubleDelayMax);
}

void readSway(const YAML::Node &s, SwayParams &p) {
    read(s, "interval", p.interval);
    read(s, "range", p.range);
    read(s, "ease", p.ease);
}

void readSpectral(const YAML::Node &s, SpectralParams &p) {
    read(s, "amplitude_threshold", p.amplitudeThreshold);
    read(s, "amplitude_scale", p.amplitudeScale);
    read(s, "centroid_wide", p.centroidWide);
    read(s, "centroid_ih", p.centroidIh);
    read(s, "centroid_oh", p.centroidOh);
}

void readFormant(const YAML::Node &s, FormantParams &p) {
    readRange(s, "f1", p.f1Low, p.f1High);
    readRange(s, "f2", p.f2Low, p.f2High);
    readRange(s, "hf", p.hfLow, p.hfHigh);
    read(s, "amplitude_threshold", p.amplitudeThreshold);
    read(s, "amplitude_scale", p.amplitudeScale);
    read(s, "f1_energy_scale", p.f1EnergyScale);
    read(s, "jaw_amplitude_weight", p.jawAmplitudeWeight);
    read(s, "jaw_f1_weight", p.jawF1Weight);
    read(s, "vowel_scale", p.vowelScale);
    readRange(s, "open", p.openLow, p.openHigh);
    readRange(s, "front", p.frontLow, p.frontHigh);
    read(s, "sibilant_suppression", p.sibilantSuppression);
    read(s, "lip_tension", p.lipTension);
    read(s, "jitter", p.jitter);
    read(s, "jitter_amplitude", p.jitterAmplitude);
    read(s, "jitter_frequency", p.jitterFrequency);
    read(s, "cue_blend", p.cueBlend);
}

void readCoarticulation(const YAML::Node &s, CoarticulationParams &p) {
    read(s, "max_window", p.maxWindow);
    read(s, "window_fraction", p.windowFraction);
    read(s, "max_next_influence", p.maxNextInfluence);
    read(s, "adjacency_tolerance", p.adjacencyTolerance);
}

void readSmoothing(const YAML::Node &s, SmoothingParams &p) {
    if (s["mode"]) {
        std::string val = s["mode"].as<std::string>();
        if (val == "asymmetric") p.mode = SmoothingMode::Asymmetric;
        else p.mode = SmoothingMode::Symmetric;  // "symmetric" or unknown -> default
    }
    read(s, "factor", p.factor);
    read(s, "silence_factor", p.silenceFactor);
    readChannels(s, "attack", p.attack);
    readChannels(s, "release", p.release);
}

void readSynthetic(const YAML::Node &s, SyntheticParams &p) {
    read(s, "syllable_rate", p.syllableRate);
    read(s, "secondary_rate", p.secondaryRate);
    read(s, "jaw_scale", p.jawScale);
    read(s, "colour_rate", p.colourRate);
    read(s, "colour_scale", p.colourScale);
}

// Parse into a copy so a failure halfway leaves the caller's config intact.
void readRoot(const YAML::Node &root, MarionetteConfig &out) {
    MarionetteConfig cfg = out;

    if (YAML::Node s = root["idle"])      readIdle(s, cfg.avatar.idle);
    if (YAML::Node s = root["listening"]) readListening(s, cfg.avatar.listening);
    if (YAML::Node s = root["thinking"])  readThinking(s, cfg.avatar.thinking);
    if (YAML::Node s = root["talking"])   readTalking(s, cfg.avatar.talking);
    if (YAML::Node s = root["motion"])    readMotion(s, cfg.avatar.motion);
    if (YAML::Node s = root["blink"])     readBlink(s, cfg.avatar.blink);
    if (YAML::Node s = root["sway"])      readSway(s, cfg.avatar.sway);

    if (YAML::Node s = root["lipsync"]) {
        read(s, "max_mouth_open", cfg.lipsync.maxMouthOpen);
        read(s, "high_fidelity", cfg.lipsync.highFidelity);
    }
    if (YAML::Node s = root["spectral"])       readSpectral(s, cfg.lipsync.spectral);
    if (YAML::Node s = root["formant"])        readFormant(s, cfg.lipsync.formant);
    if (YAML::Node s = root["coarticulation"]) readCoarticulation(s, cfg.lipsync.coarticulation);
    if (YAML::Node s = root["smoothing"])      readSmoothing(s, cfg.lipsync.smoothing);
    if (YAML::Node s = root["synthetic"])      readSynthetic(s, cfg.lipsync.synthetic);

    sanitizeParams(cfg.avatar);
    sanitizeParams(cfg.lipsync);
    out = cfg;
}

} // namespace

//------------------------------------------------------
bool loadConfigFromYAML(const std::string &path, MarionetteConfig &cfg) {
    // Check if file exists before trying to parse
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) return false;
    std::fclose(f);

    try {
        readRoot(YAML::LoadFile(path), cfg);
        LOG_INFO("Loaded config from %s", path.c_str());
        return true;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("Failed to parse config %s: %s", path.c_str(), e.what());
        return false;
    }
}

//------------------------------------------------------
bool loadConfigFromString(const std::string &text, MarionetteConfig &cfg) {
    try {
        readRoot(YAML::Load(text), cfg);
        return true;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("Failed to parse config: %s", e.what());
        return false;
    }
}

//------------------------------------------------------
CliResult applyCliOverrides(int argc, char *argv[], MarionetteConfig &cfg) {
    CliResult cli;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            cli.helpRequested = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--cues") == 0 && i + 1 < argc) {
            cli.cuesPath = argv[++i];
        } else if (std::strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            if (!parseConversationState(argv[++i], cli.state)) {
                std::fprintf(stderr, "Unknown state '%s'\n", argv[i]);
                cli.badArgument = true;
            }
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            cli.frames = std::atoi(argv[++i]);
            if (cli.frames < 0) cli.frames = 0;
        } else if (std::strcmp(argv[i], "--fps") == 0 && i + 1 < argc) {
            cli.fps = static_cast<float>(std::atof(argv[++i]));
            if (!(cli.fps >= 1.0f)) cli.fps = 1.0f;
            if (cli.fps > 1000.0f) cli.fps = 1000.0f;
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            cli.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--formant") == 0) {
            cfg.lipsync.highFidelity = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            cli.verbose = true;
        } else {
            std::fprintf(stderr, "Unknown argument '%s'\n", argv[i]);
            cli.badArgument = true;
        }
    }

    return cli;
}

} // namespace Marionette
