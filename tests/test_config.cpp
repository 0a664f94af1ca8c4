// Unit tests for MarionetteConfig (YAML + CLI configuration)
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "MarionetteConfig.h"

namespace fs = std::filesystem;
using Catch::Approx;

// Helper: write a temporary YAML file and return its path.
// The file is deleted when the returned guard goes out of scope.
struct TmpFile {
    fs::path path;
    explicit TmpFile(const std::string& content) {
        path = fs::temp_directory_path() / ("marionette_test_" + std::to_string(reinterpret_cast<uintptr_t>(this)) + ".yaml");
        std::ofstream out(path);
        out << content;
    }
    ~TmpFile() { std::error_code ec; fs::remove(path, ec); }
    TmpFile(const TmpFile&) = delete;
    TmpFile& operator=(const TmpFile&) = delete;
};

// Helper: build argc/argv from a vector of strings.
// Returns owning vector of char* pointers valid for the lifetime of `args`.
static std::vector<char*> makeArgv(std::vector<std::string>& args) {
    std::vector<char*> ptrs;
    for (auto& s : args) ptrs.push_back(s.data());
    return ptrs;
}

// ---- Test cases ----

TEST_CASE("MarionetteConfig defaults", "[config]") {
    Marionette::MarionetteConfig cfg;

    CHECK(cfg.avatar.idle.lookDuration == Approx(3.0f));
    CHECK(cfg.avatar.listening.nodCount == 2);
    CHECK(cfg.avatar.thinking.eyeLeadTime == Approx(0.10f));
    CHECK(cfg.avatar.motion.damping == Approx(0.85f));
    CHECK(cfg.avatar.blink.duration == Approx(0.12f));
    CHECK(cfg.lipsync.maxMouthOpen == Approx(1.0f));
    CHECK(cfg.lipsync.highFidelity == false);
    CHECK(cfg.lipsync.spectral.amplitudeScale == Approx(15.0f));
    CHECK(cfg.lipsync.smoothing.mode == Marionette::SmoothingMode::Symmetric);
}

TEST_CASE("YAML full sections load", "[config][yaml]") {
    TmpFile tmp(R"(
idle:
  look_duration: 4.5
  head_range: [0.1, 0.2, 0.3]
listening:
  nod_count: 3
thinking:
  eye_lead_time: 0.25
talking:
  nod_frequency: 2.5
motion:
  damping: 0.8
  accel_multiplier:
    talking: 12
  eye_rate:
    idle: 0.05
blink:
  interval: [3.0, 5.0]
sway:
  range: 0.02
lipsync:
  max_mouth_open: 0.8
  high_fidelity: true
spectral:
  amplitude_scale: 10
formant:
  f1: [250, 850]
  jitter: false
coarticulation:
  max_window: 0.05
smoothing:
  mode: asymmetric
  attack:
    aa: 0.6
synthetic:
  syllable_rate: 5.0
)");

    Marionette::MarionetteConfig cfg;
    bool ok = Marionette::loadConfigFromYAML(tmp.path.string(), cfg);

    REQUIRE(ok);
    CHECK(cfg.avatar.idle.lookDuration == Approx(4.5f));
    CHECK(cfg.avatar.idle.headRange.z == Approx(0.3f));
    CHECK(cfg.avatar.listening.nodCount == 3);
    CHECK(cfg.avatar.thinking.eyeLeadTime == Approx(0.25f));
    CHECK(cfg.avatar.talking.nodFrequency == Approx(2.5f));
    CHECK(cfg.avatar.motion.damping == Approx(0.8f));
    CHECK(cfg.avatar.stateMotion(Marionette::ConversationState::Talking).accelMultiplier == Approx(12.0f));
    CHECK(cfg.avatar.stateMotion(Marionette::ConversationState::Idle).eyeRate == Approx(0.05f));
    CHECK(cfg.avatar.blink.intervalMin == Approx(3.0f));
    CHECK(cfg.avatar.blink.intervalMax == Approx(5.0f));
    CHECK(cfg.avatar.sway.range == Approx(0.02f));
    CHECK(cfg.lipsync.maxMouthOpen == Approx(0.8f));
    CHECK(cfg.lipsync.highFidelity == true);
    CHECK(cfg.lipsync.spectral.amplitudeScale == Approx(10.0f));
    CHECK(cfg.lipsync.formant.f1Low == Approx(250.0f));
    CHECK(cfg.lipsync.formant.f1High == Approx(850.0f));
    CHECK(cfg.lipsync.formant.jitter == false);
    CHECK(cfg.lipsync.coarticulation.maxWindow == Approx(0.05f));
    CHECK(cfg.lipsync.smoothing.mode == Marionette::SmoothingMode::Asymmetric);
    CHECK(cfg.lipsync.smoothing.attack[Marionette::PHONEME_AA] == Approx(0.6f));
    CHECK(cfg.lipsync.synthetic.syllableRate == Approx(5.0f));
}

TEST_CASE("YAML partial load, unset fields keep defaults", "[config][yaml]") {
    TmpFile tmp(R"(
talking:
  tilt_intensity: 0.1
)");

    Marionette::MarionetteConfig cfg;
    bool ok = Marionette::loadConfigFromYAML(tmp.path.string(), cfg);

    REQUIRE(ok);
    CHECK(cfg.avatar.talking.tiltIntensity == Approx(0.1f));
    // Everything else should be default
    CHECK(cfg.avatar.talking.nodFrequency == Approx(1.8f));
    CHECK(cfg.avatar.talking.nodIntensity == Approx(0.35f));
    CHECK(cfg.avatar.idle.lookDuration == Approx(3.0f));
    CHECK(cfg.lipsync.smoothing.factor == Approx(0.2f));
}

TEST_CASE("YAML out-of-range values are clamped, not rejected", "[config][yaml]") {
    TmpFile tmp(R"(
motion:
  damping: 5.0
  base_acceleration: -1
blink:
  double_blink_chance: 2.0
  interval: [6.0, 2.0]
coarticulation:
  max_window: 0.5
  max_next_influence: 0.9
formant:
  cue_blend: 0.8
lipsync:
  max_mouth_open: 3
)");

    Marionette::MarionetteConfig cfg;
    bool ok = Marionette::loadConfigFromYAML(tmp.path.string(), cfg);

    REQUIRE(ok);
    CHECK(cfg.avatar.motion.damping == Approx(0.99f));
    CHECK(cfg.avatar.motion.baseAcceleration == Approx(0.0f));
    CHECK(cfg.avatar.blink.doubleBlinkChance == Approx(1.0f));
    // Inverted range collapses onto its minimum
    CHECK(cfg.avatar.blink.intervalMin == Approx(6.0f));
    CHECK(cfg.avatar.blink.intervalMax == Approx(6.0f));
    CHECK(cfg.lipsync.coarticulation.maxWindow == Approx(0.08f));
    CHECK(cfg.lipsync.coarticulation.maxNextInfluence == Approx(0.6f));
    CHECK(cfg.lipsync.formant.cueBlend == Approx(0.3f));
    CHECK(cfg.lipsync.maxMouthOpen == Approx(1.0f));
}

TEST_CASE("YAML missing file returns false, config unchanged", "[config][yaml]") {
    Marionette::MarionetteConfig cfg;
    Marionette::MarionetteConfig orig = cfg;

    bool ok = Marionette::loadConfigFromYAML("/tmp/nonexistent_marionette_config_xyz.yaml", cfg);

    CHECK_FALSE(ok);
    CHECK(cfg.avatar.idle.lookDuration == orig.avatar.idle.lookDuration);
    CHECK(cfg.lipsync.maxMouthOpen == orig.lipsync.maxMouthOpen);
}

TEST_CASE("YAML malformed file returns false, no crash", "[config][yaml]") {
    TmpFile tmp("{{{{not valid yaml at all : : :");

    Marionette::MarionetteConfig cfg;
    Marionette::MarionetteConfig orig = cfg;

    bool ok = Marionette::loadConfigFromYAML(tmp.path.string(), cfg);

    CHECK_FALSE(ok);
    CHECK(cfg.avatar.idle.lookDuration == orig.avatar.idle.lookDuration);
    CHECK(cfg.avatar.motion.damping == orig.avatar.motion.damping);
}

TEST_CASE("YAML wrong value type leaves config untouched", "[config][yaml]") {
    // The first field parses, the second does not; nothing may be applied
    Marionette::MarionetteConfig cfg;
    bool ok = Marionette::loadConfigFromString(R"(
idle:
  look_duration: 9.0
  eye_range: "wide"
)", cfg);

    CHECK_FALSE(ok);
    CHECK(cfg.avatar.idle.lookDuration == Approx(3.0f));
    CHECK(cfg.avatar.idle.eyeRange == Approx(0.5f));
}

TEST_CASE("YAML empty file loads with defaults", "[config][yaml]") {
    TmpFile tmp("");

    Marionette::MarionetteConfig cfg;
    bool ok = Marionette::loadConfigFromYAML(tmp.path.string(), cfg);

    CHECK(ok);
    CHECK(cfg.avatar.idle.lookDuration == Approx(3.0f));
}

TEST_CASE("CLI flags parse", "[config][cli]") {
    std::vector<std::string> args = {"marionetteHeadless", "--config", "my.yaml",
                                     "--cues", "track.json", "--state", "thinking",
                                     "--frames", "120", "--fps", "30", "--seed", "42",
                                     "--formant", "--verbose"};
    auto argv = makeArgv(args);

    Marionette::MarionetteConfig cfg;
    Marionette::CliResult cli = Marionette::applyCliOverrides(static_cast<int>(argv.size()), argv.data(), cfg);

    CHECK(cli.configPath == "my.yaml");
    CHECK(cli.cuesPath == "track.json");
    CHECK(cli.state == Marionette::ConversationState::Thinking);
    CHECK(cli.frames == 120);
    CHECK(cli.fps == Approx(30.0f));
    CHECK(cli.seed == 42u);
    CHECK(cli.verbose);
    CHECK_FALSE(cli.badArgument);
    CHECK(cfg.lipsync.highFidelity == true);
}

TEST_CASE("CLI unknown state or flag is reported", "[config][cli]") {
    std::vector<std::string> args = {"marionetteHeadless", "--state", "dancing"};
    auto argv = makeArgv(args);

    Marionette::MarionetteConfig cfg;
    Marionette::CliResult cli = Marionette::applyCliOverrides(static_cast<int>(argv.size()), argv.data(), cfg);
    CHECK(cli.badArgument);
    CHECK(cli.state == Marionette::ConversationState::Talking);

    std::vector<std::string> args2 = {"marionetteHeadless", "--bogus"};
    auto argv2 = makeArgv(args2);
    cli = Marionette::applyCliOverrides(static_cast<int>(argv2.size()), argv2.data(), cfg);
    CHECK(cli.badArgument);
}

TEST_CASE("CLI overrides YAML", "[config][cli][yaml]") {
    TmpFile tmp(R"(
lipsync:
  high_fidelity: false
)");

    std::vector<std::string> args = {"marionetteHeadless", "--formant"};
    auto argv = makeArgv(args);

    Marionette::MarionetteConfig cfg;
    Marionette::applyCliOverrides(static_cast<int>(argv.size()), argv.data(), cfg);
    REQUIRE(Marionette::loadConfigFromYAML(tmp.path.string(), cfg));
    CHECK(cfg.lipsync.highFidelity == false);

    // Re-apply CLI so flags always win over YAML values
    Marionette::applyCliOverrides(static_cast<int>(argv.size()), argv.data(), cfg);
    CHECK(cfg.lipsync.highFidelity == true);
}
