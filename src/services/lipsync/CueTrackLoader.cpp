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

#include "CueTrackLoader.h"
#include "MouthShapeTable.h"
#include "logger.h"

#include <cstdio>

#include <yaml-cpp/yaml.h>

namespace Marionette {

static char shapeLetter(const YAML::Node &node) {
    if (!node)
        return 'X';
    std::string s = node.as<std::string>();
    return s.empty() ? 'X' : s[0];
}

// One cue in either form. Throws YAML::Exception on type errors.
static LipSyncCue parseCue(const YAML::Node &node) {
    if (!node.IsMap() || !node["start"] || !node["end"])
        throw YAML::Exception(node.Mark(), "cue needs 'start' and 'end'");

    LipSyncCue cue;
    cue.startTime = node["start"].as<float>();
    cue.endTime = node["end"].as<float>();

    // "shape" in the backend form, "value" in the Rhubarb form
    YAML::Node letterNode = node["shape"] ? node["shape"] : node["value"];
    const MouthShape &shape = lookupMouthShape(shapeLetter(letterNode));
    cue.shape = shape.letter;
    cue.silence = shape.silence;

    if (YAML::Node ph = node["phonemes"]) {
        for (int i = 0; i < PHONEME_COUNT; ++i) {
            const char *name = phonemeChannelName(i);
            if (ph[name])
                cue.targets[i] = ph[name].as<float>();
        }
    } else {
        cue.targets = shape.weights;
    }

    if (node["silence"])
        cue.silence = node["silence"].as<bool>();

    return cue;
}

//------------------------------------------------------
static bool parseCueRoot(const YAML::Node &root, std::vector<LipSyncCue> &cues) {
    YAML::Node list = root;
    if (root.IsMap()) {
        list = root["mouthCues"];
        if (!list) {
            LOG_ERROR("CueTrackLoader: object has no 'mouthCues' list");
            return false;
        }
    }
    if (!list.IsSequence()) {
        LOG_ERROR("CueTrackLoader: expected a list of cues");
        return false;
    }

    std::vector<LipSyncCue> parsed;
    parsed.reserve(list.size());
    for (const YAML::Node &node : list)
        parsed.push_back(parseCue(node));

    cues = std::move(parsed);
    return true;
}

//------------------------------------------------------
bool parseCueTrack(const std::string &text, std::vector<LipSyncCue> &cues) {
    try {
        return parseCueRoot(YAML::Load(text), cues);
    } catch (const YAML::Exception &e) {
        LOG_ERROR("CueTrackLoader: failed to parse cue track: %s", e.what());
        return false;
    }
}

//------------------------------------------------------
bool loadCueTrackFromFile(const std::string &path, std::vector<LipSyncCue> &cues) {
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) {
        LOG_ERROR("CueTrackLoader: cannot open %s", path.c_str());
        return false;
    }
    std::fclose(f);

    try {
        if (!parseCueRoot(YAML::LoadFile(path), cues))
            return false;
        LOG_INFO("CueTrackLoader: %zu cues from %s", cues.size(), path.c_str());
        return true;
    } catch (const YAML::Exception &e) {
        LOG_ERROR("CueTrackLoader: failed to parse %s: %s", path.c_str(), e.what());
        return false;
    }
}

} // namespace Marionette
