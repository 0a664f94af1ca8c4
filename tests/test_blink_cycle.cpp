// BlinkCycle tests: curve shape, timing, and double-blink chaining.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <vector>

#include "BlinkCycle.h"

using namespace Marionette;
using Catch::Approx;

TEST_CASE("blink curve closes fast and opens slowly", "[blink]") {
    const float cf = 0.4f;

    CHECK(BlinkCycle::curve(0.0f, cf) == Approx(0.0f));
    CHECK(BlinkCycle::curve(cf, cf) == Approx(1.0f));
    CHECK(BlinkCycle::curve(1.0f, cf) == Approx(0.0f));

    // Out-of-range input is clamped, not extrapolated
    CHECK(BlinkCycle::curve(-1.0f, cf) == Approx(0.0f));
    CHECK(BlinkCycle::curve(2.0f, cf) == Approx(0.0f));

    // Closing half accelerates: first quarter covers less than a quarter
    CHECK(BlinkCycle::curve(cf * 0.5f, cf) == Approx(0.25f));
    // Opening is monotonic
    CHECK(BlinkCycle::curve(0.6f, cf) > BlinkCycle::curve(0.8f, cf));
}

TEST_CASE("blink amount stays within [0, 1]", "[blink]") {
    BlinkParams p;
    p.intervalMin = 0.2f;
    p.intervalMax = 0.4f;
    p.firstBlinkMin = 0.1f;
    p.firstBlinkMax = 0.2f;
    RandomSource rng(17);

    BlinkCycle blink;
    blink.reset(p, rng);
    int blinks = 0;
    bool wasBlinking = false;
    for (int i = 0; i < 3000; ++i) {
        float a = blink.update(1.0f / 60.0f, p, rng);
        REQUIRE(a >= 0.0f);
        REQUIRE(a <= 1.0f);
        if (blink.isBlinking() && !wasBlinking)
            ++blinks;
        wasBlinking = blink.isBlinking();
    }
    CHECK(blinks > 10);
}

TEST_CASE("triggered blink completes within its duration", "[blink]") {
    BlinkParams p;
    p.doubleBlinkChance = 0.0f;
    RandomSource rng(3);

    BlinkCycle blink;
    blink.reset(p, rng);
    blink.trigger();
    REQUIRE(blink.isBlinking());

    const float step = 0.001f;
    float elapsed = 0.0f;
    float peak = 0.0f;
    while (blink.isBlinking() && elapsed < 1.0f) {
        peak = std::max(peak, blink.update(step, p, rng));
        elapsed += step;
    }

    CHECK_FALSE(blink.isBlinking());
    CHECK(elapsed <= p.duration + 0.0025f);
    CHECK(peak > 0.95f);
    CHECK(blink.amount() == 0.0f);

    // Trigger mid-blink is ignored
    blink.trigger();
    blink.update(0.01f, p, rng);
    float progress = blink.state().progress;
    blink.trigger();
    CHECK(blink.state().progress == Approx(progress));
}

TEST_CASE("a double blink never schedules a third", "[blink]") {
    BlinkParams p;
    p.doubleBlinkChance = 1.0f;
    p.firstBlinkMin = 0.5f;
    p.firstBlinkMax = 0.5f;
    p.intervalMin = 2.0f;
    p.intervalMax = 2.0f;
    RandomSource rng(8);

    BlinkCycle blink;
    blink.reset(p, rng);

    std::vector<float> starts;
    bool wasBlinking = false;
    float t = 0.0f;
    for (int i = 0; i < 60 * 20; ++i) {
        t += 1.0f / 60.0f;
        blink.update(1.0f / 60.0f, p, rng);
        if (blink.isBlinking() && !wasBlinking)
            starts.push_back(t);
        wasBlinking = blink.isBlinking();
    }

    REQUIRE(starts.size() >= 4);
    // Starts alternate: short gap (double follow-up), long gap (interval)
    const float shortGap = p.duration + p.doubleDelayMax + 0.05f;
    for (size_t i = 1; i < starts.size(); ++i) {
        float gap = starts[i] - starts[i - 1];
        if (i % 2 == 1)
            CHECK(gap < shortGap);
        else
            CHECK(gap >= p.intervalMin - 0.02f);
    }
}
