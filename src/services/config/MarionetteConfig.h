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

// MarionetteConfig.h — tunables from YAML and command line
//
// Precedence: built-in defaults -> YAML file -> CLI flags.
//
// The YAML layout mirrors the parameter records, one section per record:
//
//   idle:      { look_duration: 3.0, head_range: [0.2, 0.12, 0.15], ... }
//   listening: { nod_intensity: 0.3, nod_count: 2, ... }
//   thinking:  { eye_lead_time: 0.1, ... }
//   talking:   { nod_frequency: 1.8, ... }
//   motion:    { damping: 0.85, accel_multiplier: { talking: 10 }, ... }
//   blink:     { duration: 0.12, interval: [2.5, 6.5], ... }
//   sway:      { interval: 2.8, range: 0.04, ease: 0.01 }
//   lipsync:   { max_mouth_open: 1.0, high_fidelity: false }
//   spectral:  { amplitude_threshold: 0.001, ... }
//   formant:   { f1: [200, 900], f2: [900, 2500], hf: [4000, 10000], ... }
//   coarticulation: { max_window: 0.08, ... }
//   smoothing: { mode: asymmetric, attack: { aa: 0.5 }, ... }
//   synthetic: { syllable_rate: 4.0, ... }
//
// Any field may be omitted; it keeps its default. Every value read is
// clamped into range afterwards.

#pragma once

#include <cstdint>
#include <string>

#include "AvatarParams.h"
#include "LipSyncParams.h"

namespace Marionette {

struct MarionetteConfig {
    AvatarParams avatar;
    LipSyncParams lipsync;
};

// Result of CLI parsing: values that are CLI-only (not in YAML).
struct CliResult {
    std::string configPath;           // --config <path>
    std::string cuesPath;             // --cues <path>
    ConversationState state = ConversationState::Talking;  // --state <name>
    int      frames  = 300;           // --frames <n>
    float    fps     = 60.0f;         // --fps <f>
    uint32_t seed    = 1;             // --seed <n>, 0 = random
    bool     verbose = false;         // --verbose
    bool     helpRequested = false;   // --help / -h
    bool     badArgument = false;     // unknown flag or unparsable value
};

// Load settings from a YAML config file into cfg.
// Returns true if the file was loaded successfully.
// Returns false (silently) if the file doesn't exist; this is the normal case.
// Logs and returns false on parse errors, leaving cfg untouched.
bool loadConfigFromYAML(const std::string &path, MarionetteConfig &cfg);

// Same, from YAML text already in memory.
bool loadConfigFromString(const std::string &text, MarionetteConfig &cfg);

// Parse CLI arguments into cfg and extract CLI-only values. Run once to get
// --config, then again after the YAML load so flags win.
CliResult applyCliOverrides(int argc, char *argv[], MarionetteConfig &cfg);

} // namespace Marionette
