// AvatarStateMachine tests: numerical stability under hostile dt, transition
// and settle sequencing, and the per-state target generators.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <vector>

#include "AvatarStateMachine.h"
#include "SpringIntegrator.h"
#include "StateBehaviors.h"

using namespace Marionette;
using Catch::Approx;

static bool poseFinite(const PoseVector &p) {
    return std::isfinite(p.headPitch) && std::isfinite(p.headYaw) &&
           std::isfinite(p.headRoll) && std::isfinite(p.bodyLean) &&
           std::isfinite(p.eyeX) && std::isfinite(p.eyeY) &&
           std::isfinite(p.blink);
}

static const ConversationState ALL_STATES[] = {
    ConversationState::Idle, ConversationState::Listening,
    ConversationState::Thinking, ConversationState::Talking};

// ============================================================================
// Stability
// ============================================================================

TEST_CASE("update never emits non-finite channels for any dt", "[avatar][stability]") {
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const std::vector<float> dts = {0.0f, 1e-5f, 1.0f / 144.0f, 1.0f / 60.0f,
                                    1.0f / 15.0f, 0.5f, 10.0f, 1e6f, inf, nan, -1.0f};

    AvatarStateMachine sm(AvatarParams(), 1234);

    for (ConversationState state : ALL_STATES) {
        sm.setState(state);
        for (int i = 0; i < 400; ++i) {
            float dt = dts[static_cast<size_t>(i) % dts.size()];
            PoseVector p = sm.update(dt);
            REQUIRE(poseFinite(p));
            CHECK(p.blink >= 0.0f);
            CHECK(p.blink <= 1.0f);
            CHECK(std::abs(p.headPitch) < 1.0f);
            CHECK(std::abs(p.headYaw) < 1.0f);
            CHECK(std::abs(p.headRoll) < 1.0f);
        }
    }
}

TEST_CASE("a host stall is clamped, not replayed", "[avatar][stability]") {
    AvatarStateMachine a(AvatarParams(), 99);
    AvatarStateMachine b(AvatarParams(), 99);

    a.update(MAX_FRAME_DT);
    b.update(60.0f);   // one minute stall

    CHECK(b.stateTime() == Approx(a.stateTime()));
    CHECK(b.stateTime() == Approx(MAX_FRAME_DT));
}

TEST_CASE("per-frame head delta stays bounded", "[avatar][stability]") {
    AvatarParams params;
    AvatarStateMachine sm(params, 5);
    sm.setState(ConversationState::Talking);

    const float bound = params.motion.velocityCap * MAX_FRAME_DT * REFERENCE_FPS;
    Vector3 prev = sm.head().current;
    for (int i = 0; i < 600; ++i) {
        sm.update(i % 7 == 0 ? 5.0f : 1.0f / 60.0f);
        Vector3 cur = sm.head().current;
        CHECK(std::abs(cur.x - prev.x) <= bound);
        CHECK(std::abs(cur.y - prev.y) <= bound);
        CHECK(std::abs(cur.z - prev.z) <= bound);
        prev = cur;
    }
}

TEST_CASE("spring integration is step-size independent", "[avatar][spring]") {
    HeadSpring coarse, fine;
    coarse.current = fine.current = Vector3(0.2f, -0.1f, 0.05f);

    // One 100 ms step sub-steps into six reference frames
    integrateSpring(coarse, 0.01f, 0.85f, 0.5f, 0.1f);
    for (int i = 0; i < 6; ++i)
        integrateSpring(fine, 0.01f, 0.85f, 0.5f, 1.0f / 60.0f);

    CHECK(coarse.current.x == Approx(fine.current.x).margin(1e-5));
    CHECK(coarse.current.y == Approx(fine.current.y).margin(1e-5));
    CHECK(coarse.velocity.z == Approx(fine.velocity.z).margin(1e-5));
}

// ============================================================================
// State changes
// ============================================================================

TEST_CASE("setState with the same state resets timers exactly once", "[avatar][state]") {
    AvatarStateMachine sm(AvatarParams(), 42);

    sm.setState(ConversationState::Listening);
    CHECK(sm.phase() == MotionPhase::Transitioning);
    CHECK(sm.stateTime() == 0.0f);

    for (int i = 0; i < 30; ++i)
        sm.update(1.0f / 60.0f);
    float elapsed = sm.stateTime();
    MotionPhase phase = sm.phase();
    REQUIRE(elapsed > 0.0f);

    sm.setState(ConversationState::Listening);
    CHECK(sm.stateTime() == elapsed);
    CHECK(sm.phase() == phase);
    CHECK(sm.getState() == ConversationState::Listening);
}

TEST_CASE("initial state is idle and active", "[avatar][state]") {
    AvatarStateMachine sm;
    CHECK(sm.getState() == ConversationState::Idle);
    CHECK(sm.phase() == MotionPhase::Active);

    // Idle -> Idle is a no-op
    sm.setState(ConversationState::Idle);
    CHECK(sm.phase() == MotionPhase::Active);
}

TEST_CASE("transition from an offset settles at neutral before going active", "[avatar][state]") {
    AvatarParams params;
    // Talking with big nods so the head is clearly off center
    params.talking.nodIntensity = 1.0f;
    params.talking.nodPauseChance = 0.0f;
    AvatarStateMachine sm(params, 7);

    sm.setState(ConversationState::Talking);
    for (int i = 0; i < 240; ++i)
        sm.update(1.0f / 60.0f);
    REQUIRE(sm.phase() == MotionPhase::Active);

    float offset = std::abs(sm.head().current.x) + std::abs(sm.head().current.y) +
                   std::abs(sm.head().current.z);
    REQUIRE(offset > 0.0f);

    sm.setState(ConversationState::Idle);
    REQUIRE(sm.phase() == MotionPhase::Transitioning);

    std::vector<MotionPhase> seen = {sm.phase()};
    int frames = 0;
    while (sm.phase() != MotionPhase::Active && frames < 600) {
        sm.update(1.0f / 60.0f);
        if (sm.phase() != seen.back())
            seen.push_back(sm.phase());
        ++frames;
    }

    REQUIRE(sm.phase() == MotionPhase::Active);
    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == MotionPhase::Transitioning);
    CHECK(seen[1] == MotionPhase::MovementLocked);
    CHECK(seen[2] == MotionPhase::Active);

    const float eps = params.motion.centerEpsilon;
    CHECK(std::abs(sm.head().current.x) < eps);
    CHECK(std::abs(sm.head().current.y) < eps);
    CHECK(std::abs(sm.head().current.z) < eps);
    CHECK(sm.stateTime() >= params.motion.minTransitionTime + params.motion.lockDuration - 1e-3f);
}

TEST_CASE("same seed replays the same motion", "[avatar][determinism]") {
    AvatarStateMachine a(AvatarParams(), 2024);
    AvatarStateMachine b(AvatarParams(), 2024);

    for (ConversationState state : ALL_STATES) {
        a.setState(state);
        b.setState(state);
        for (int i = 0; i < 200; ++i) {
            PoseVector pa = a.update(1.0f / 60.0f);
            PoseVector pb = b.update(1.0f / 60.0f);
            REQUIRE(pa.headPitch == pb.headPitch);
            REQUIRE(pa.eyeX == pb.eyeX);
            REQUIRE(pa.blink == pb.blink);
            REQUIRE(pa.bodyLean == pb.bodyLean);
        }
    }
}

TEST_CASE("setParams clamps out-of-range tunables", "[avatar][params]") {
    AvatarParams params;
    params.motion.damping = 3.0f;
    params.blink.closeFraction = std::numeric_limits<float>::quiet_NaN();
    params.sway.range = -1.0f;

    AvatarStateMachine sm;
    sm.setParams(params);

    CHECK(sm.params().motion.damping == Approx(0.99f));
    CHECK(std::isfinite(sm.params().blink.closeFraction));
    CHECK(sm.params().sway.range == Approx(0.0f));
}

// ============================================================================
// Behaviors
// ============================================================================

TEST_CASE("thinking eyes lead the head by eyeLeadTime", "[avatar][thinking]") {
    ThinkingParams p;
    p.lookDuration = 0.08f;
    p.lookChangeChance = 1.0f;
    p.lookAtUserChance = 0.0f;
    p.eyeHeadSync = 1.0f;
    p.eyeLeadTime = 0.1f;

    ThinkingScratch s;
    MotionTargets t;
    RandomSource rng(3);

    // Look change fires: eyes move now, head is queued for clock + 0.1
    stepThinking(s, p, t, 0.09f, rng);
    CHECK(t.eyes.y > 0.0f);
    CHECK(t.head.x == 0.0f);
    CHECK(t.head.y == 0.0f);
    REQUIRE(s.pendingHead.size() == 1);
    CHECK(s.pendingHead.nextAt() == Approx(0.19f));

    // Not yet due
    stepThinking(s, p, t, 0.05f, rng);
    CHECK(t.head.x == 0.0f);
    CHECK(t.head.y == 0.0f);

    // Past due: the queued head target lands
    stepThinking(s, p, t, 0.06f, rng);
    CHECK((t.head.x != 0.0f || t.head.y != 0.0f));
}

TEST_CASE("listening nod follows time in state", "[avatar][listening]") {
    ListeningParams p;
    p.sideLookChance = 0.0f;
    p.nodIntensity = 0.3f;
    p.nodCount = 2;
    p.nodCycleDuration = 2.5f;
    p.nodActivePortion = 0.4f;

    ListeningScratch s;
    MotionTargets t;
    RandomSource rng(11);

    // Active window is 1 s with two nods; a quarter nod in is the peak
    stepListening(s, p, t, 0.125f, 1.0f / 60.0f, rng);
    CHECK(t.head.x == Approx(0.3f).margin(1e-4));

    // Outside the window the pitch target decays instead
    float before = t.head.x;
    stepListening(s, p, t, 1.5f, 1.0f / 60.0f, rng);
    CHECK(t.head.x == Approx(before * p.nodDecay).margin(1e-4));
}

TEST_CASE("idle look-at-user holds neutral targets", "[avatar][idle]") {
    IdleParams p;
    p.lookDuration = 0.05f;
    p.lookAtUserChance = 1.0f;
    p.lookAtUserDurationMin = 1.0f;
    p.lookAtUserDurationMax = 1.0f;

    IdleScratch s;
    MotionTargets t;
    t.head = Vector3(0.1f, 0.1f, 0.1f);
    RandomSource rng(5);

    stepIdle(s, p, t, 0.1f, rng);
    CHECK(s.lookingAtUser);
    CHECK(t.head == Vector3(0.0f));
    CHECK(t.eyes == Vector2(0.0f));

    // Holds for the rolled duration, then releases
    stepIdle(s, p, t, 0.5f, rng);
    CHECK(s.lookingAtUser);
    stepIdle(s, p, t, 0.6f, rng);
    CHECK_FALSE(s.lookingAtUser);
}

TEST_CASE("talking tilts and turns decay toward zero", "[avatar][talking]") {
    TalkingParams p;
    p.tiltChance = 0.0f;
    p.occasionalTurn = 0.0f;

    TalkingScratch s;
    MotionTargets t;
    t.head = Vector3(0.0f, 0.03f, 0.06f);
    RandomSource rng(9);

    for (int i = 0; i < 120; ++i)
        stepTalking(s, p, t, static_cast<float>(i) / 60.0f, 1.0f / 60.0f, rng);

    CHECK(std::abs(t.head.y) < 0.03f * 0.01f);
    CHECK(std::abs(t.head.z) < 0.06f * 0.01f);
}
