// CueTrack and cue loader tests: validation, coarticulated sampling, and the
// two accepted JSON shapes.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "CueTrack.h"
#include "CueTrackLoader.h"
#include "MouthShapeTable.h"

using namespace Marionette;
using Catch::Approx;

static LipSyncCue makeCue(float start, float end, float aa, float ee = 0.0f,
                          bool silence = false) {
    LipSyncCue c;
    c.startTime = start;
    c.endTime = end;
    c.targets.aa = aa;
    c.targets.ee = ee;
    c.silence = silence;
    return c;
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("well-formed track is accepted and targets clamped", "[cues]") {
    CueTrack track;
    std::vector<LipSyncCue> cues = {makeCue(0.0f, 0.2f, 1.5f), makeCue(0.2f, 0.4f, -0.3f, 0.5f)};

    REQUIRE(track.assign(cues));
    REQUIRE(track.size() == 2);
    CHECK(track.cues()[0].targets.aa == Approx(1.0f));
    CHECK(track.cues()[1].targets.aa == Approx(0.0f));
    CHECK(track.cues()[1].targets.ee == Approx(0.5f));
    CHECK(track.duration() == Approx(0.4f));
}

TEST_CASE("silence cues carry no targets", "[cues]") {
    CueTrack track;
    REQUIRE(track.assign({makeCue(0.0f, 0.3f, 0.8f, 0.2f, true)}));
    CHECK(track.cues()[0].targets.isZero());
}

TEST_CASE("invalid tracks are rejected whole", "[cues]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    CueTrack track;
    std::string error;

    SECTION("overlap beyond tolerance") {
        CHECK_FALSE(track.assign({makeCue(0.0f, 0.3f, 1.0f), makeCue(0.2f, 0.5f, 1.0f)}, 0.001f, &error));
    }
    SECTION("start times not increasing") {
        CHECK_FALSE(track.assign({makeCue(0.3f, 0.4f, 1.0f), makeCue(0.3f, 0.5f, 1.0f)}, 0.001f, &error));
    }
    SECTION("start not before end") {
        CHECK_FALSE(track.assign({makeCue(0.5f, 0.5f, 1.0f)}, 0.001f, &error));
    }
    SECTION("negative start") {
        CHECK_FALSE(track.assign({makeCue(-0.1f, 0.5f, 1.0f)}, 0.001f, &error));
    }
    SECTION("non-finite time") {
        CHECK_FALSE(track.assign({makeCue(0.0f, nan, 1.0f)}, 0.001f, &error));
    }
    SECTION("non-finite target") {
        CHECK_FALSE(track.assign({makeCue(0.0f, 0.2f, nan)}, 0.001f, &error));
    }

    CHECK(track.empty());
    CHECK_FALSE(error.empty());
}

TEST_CASE("overlap within tolerance is accepted", "[cues]") {
    CueTrack track;
    CHECK(track.assign({makeCue(0.0f, 0.3f, 1.0f), makeCue(0.2995f, 0.5f, 1.0f)}));
}

// ============================================================================
// Sampling
// ============================================================================

TEST_CASE("gaps and out-of-track times sample as silence", "[cues][sample]") {
    CoarticulationParams p;
    CueTrack track;
    REQUIRE(track.assign({makeCue(0.0f, 0.2f, 1.0f), makeCue(0.5f, 0.7f, 1.0f)}));

    CueSample s = track.sample(0.3f, p);
    CHECK(s.silent);
    CHECK(s.cueIndex == -1);
    CHECK(s.targets.isZero());

    CHECK(track.sample(-1.0f, p).silent);
    CHECK(track.sample(0.7f, p).silent);
    CHECK(track.sample(std::numeric_limits<float>::quiet_NaN(), p).silent);
    CHECK_FALSE(track.sample(0.1f, p).silent);
}

TEST_CASE("non-abutting neighbours do not blend", "[cues][sample]") {
    CoarticulationParams p;
    CueTrack track;
    REQUIRE(track.assign({makeCue(0.0f, 0.2f, 1.0f), makeCue(0.5f, 0.7f, 0.0f, 1.0f)}));

    CueSample s = track.sample(0.199f, p);
    CHECK(s.outboundInfluence == 0.0f);
    CHECK(s.targets.aa == Approx(1.0f));
}

TEST_CASE("blend window and next influence stay bounded", "[cues][sample]") {
    CoarticulationParams p;
    CueTrack track;
    // Long cue, short cue, long cue
    REQUIRE(track.assign({makeCue(0.0f, 1.0f, 1.0f), makeCue(1.0f, 1.1f, 0.0f, 1.0f),
                          makeCue(1.1f, 2.0f, 0.5f)}));

    for (int i = 0; i < 2000; ++i) {
        float t = static_cast<float>(i) * 0.001f;
        CueSample s = track.sample(t, p);
        REQUIRE(s.cueIndex >= 0);
        const LipSyncCue &c = track.cues()[static_cast<size_t>(s.cueIndex)];
        float dur = c.endTime - c.startTime;
        CHECK(s.window <= std::min(0.08f, 0.3f * dur) + 1e-6f);
        CHECK(s.outboundInfluence <= 0.6f + 1e-6f);
        CHECK(s.inboundWeight <= 1.0f);
    }

    // Short cue window is 30% of its duration
    CHECK(track.sample(1.05f, p).window == Approx(0.03f));
    CHECK(track.sample(0.5f, p).window == Approx(0.08f));
}

TEST_CASE("a cue picks up where the previous outbound blend ended", "[cues][sample]") {
    CoarticulationParams p;
    CueTrack track;
    REQUIRE(track.assign({makeCue(0.0f, 0.5f, 1.0f), makeCue(0.5f, 1.0f, 0.0f, 1.0f)}));

    // Just before the boundary: 60% of the way toward the next cue
    CueSample before = track.sample(0.49999f, p);
    CHECK(before.outboundInfluence == Approx(0.6f).margin(1e-3));
    CHECK(before.targets.ee == Approx(0.6f).margin(1e-3));

    // Just after it: the previous cue still holds 40%
    CueSample after = track.sample(0.5f, p);
    CHECK(after.inboundWeight == Approx(0.4f).margin(1e-3));
    CHECK(after.targets.ee == Approx(0.6f).margin(1e-3));

    // Past the window the cue is unblended
    CueSample mid = track.sample(0.75f, p);
    CHECK(mid.inboundWeight == 0.0f);
    CHECK(mid.targets.ee == Approx(1.0f));
}

TEST_CASE("maxNextInfluence of zero disables anticipation", "[cues][sample]") {
    CoarticulationParams p;
    p.maxNextInfluence = 0.0f;
    CueTrack track;
    REQUIRE(track.assign({makeCue(0.0f, 0.5f, 1.0f), makeCue(0.5f, 1.0f, 0.0f, 1.0f)}));

    CHECK(track.sample(0.499f, p).targets.aa == Approx(1.0f));
    CHECK(track.sample(0.499f, p).targets.ee == Approx(0.0f));
}

// ============================================================================
// Loader
// ============================================================================

TEST_CASE("backend list form loads shapes and explicit phonemes", "[cues][loader]") {
    std::vector<LipSyncCue> cues;
    REQUIRE(parseCueTrack(R"([
        {"start": 0.0, "end": 0.12, "shape": "D"},
        {"start": 0.12, "end": 0.3, "shape": "C", "phonemes": {"ee": 0.7}},
        {"start": 0.3, "end": 0.5, "shape": "X"}
    ])", cues));

    REQUIRE(cues.size() == 3);
    CHECK(cues[0].shape == 'D');
    CHECK(cues[0].targets.aa == Approx(lookupMouthShape('D').weights.aa));
    CHECK(cues[1].targets.ee == Approx(0.7f));
    CHECK(cues[1].targets.aa == 0.0f);
    CHECK(cues[2].silence);
}

TEST_CASE("raw mouthCues form loads", "[cues][loader]") {
    std::vector<LipSyncCue> cues;
    REQUIRE(parseCueTrack(R"({"metadata": {"duration": 0.4},
        "mouthCues": [
            {"start": 0.0, "end": 0.2, "value": "f"},
            {"start": 0.2, "end": 0.4, "value": "Q"}
        ]})", cues));

    REQUIRE(cues.size() == 2);
    CHECK(cues[0].shape == 'F');
    CHECK(cues[0].targets.ou == Approx(0.8f));
    // Unknown letters resolve to rest
    CHECK(cues[1].shape == 'X');
    CHECK(cues[1].silence);
}

TEST_CASE("malformed cue JSON is rejected", "[cues][loader]") {
    std::vector<LipSyncCue> cues = {makeCue(0.0f, 1.0f, 1.0f)};

    CHECK_FALSE(parseCueTrack(R"([{"start": 0.0}])", cues));
    CHECK_FALSE(parseCueTrack(R"({"cues": []})", cues));
    CHECK_FALSE(parseCueTrack(R"([{"start": "soon", "end": 1.0}])", cues));
    CHECK_FALSE(parseCueTrack("42", cues));

    // Untouched on failure
    REQUIRE(cues.size() == 1);
    CHECK(cues[0].targets.aa == 1.0f);
}

TEST_CASE("missing cue file is reported", "[cues][loader]") {
    std::vector<LipSyncCue> cues;
    CHECK_FALSE(loadCueTrackFromFile("/tmp/nonexistent_marionette_cues_xyz.json", cues));
    CHECK(cues.empty());
}
