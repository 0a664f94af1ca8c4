// Two-parameter mouth collapse for rigs without per-vowel shapes.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>

#include "MouthForm.h"

using namespace Marionette;
using Catch::Approx;

TEST_CASE("closed mouth is neutral", "[mouthform]") {
    MouthForm m = toMouthForm(PhonemeVector());
    CHECK(m.open == 0.0f);
    CHECK(m.form == 0.0f);
}

TEST_CASE("spread and rounded vowels pull form in opposite directions", "[mouthform]") {
    PhonemeVector ee;
    ee.ee = 1.0f;
    PhonemeVector ou;
    ou.ou = 1.0f;

    CHECK(toMouthForm(ee).form == Approx(0.6f));
    CHECK(toMouthForm(ou).form == Approx(-0.7f));
    CHECK(toMouthForm(ou).open == Approx(0.7f));
}

TEST_CASE("mouth form output is clamped", "[mouthform]") {
    PhonemeVector all;
    all.aa = all.ee = all.ih = all.oh = all.ou = 1.0f;
    MouthForm m = toMouthForm(all);
    CHECK(m.open == Approx(1.0f));
    CHECK(m.form >= -1.0f);
    CHECK(m.form <= 1.0f);
}

TEST_CASE("phoneme channel index outside the range is rejected", "[mouthform]") {
    PhonemeVector v;
    v.aa = 0.25f;
    const PhonemeVector &cv = v;

    CHECK(cv[PHONEME_OU] == 0.0f);
    CHECK_THROWS_AS(cv[PHONEME_COUNT], std::out_of_range);
    CHECK_THROWS_AS(cv[-1], std::out_of_range);
    CHECK_THROWS_AS(v[PHONEME_COUNT] = 1.0f, std::out_of_range);
    CHECK(v.aa == 0.25f);
}
