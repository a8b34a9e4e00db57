// ==============================================================================
// Tuning Indicator - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/needle/dsp/core/tuning_indicator.h
// ==============================================================================

#include <catch2/catch.hpp>

#include <needle/dsp/core/tuning_indicator.h>

using namespace Needle::DSP;
using Catch::Detail::Approx;

TEST_CASE("isInTune uses a strict band around zero",
          "[dsp][core][tuning_indicator]") {

    SECTION("Default band is +/-10 cents, exclusive") {
        CHECK(isInTune(0.0f));
        CHECK(isInTune(9.99f));
        CHECK(isInTune(-9.99f));
        CHECK_FALSE(isInTune(10.0f));
        CHECK_FALSE(isInTune(-10.0f));
        CHECK_FALSE(isInTune(50.0f));
    }

    SECTION("Custom band") {
        TuningIndicatorConfig config;
        config.inTuneCents = 3.0f;
        CHECK(isInTune(2.5f, config));
        CHECK_FALSE(isInTune(3.5f, config));
    }
}

TEST_CASE("needlePosition locks to centre when in tune",
          "[dsp][core][tuning_indicator]") {

    SECTION("In tune snaps to zero") {
        CHECK(needlePosition(0.0f) == 0.0f);
        CHECK(needlePosition(9.0f) == 0.0f);
        CHECK(needlePosition(-9.0f) == 0.0f);
    }

    SECTION("Out of tune scales by 50 cents") {
        CHECK(needlePosition(10.0f) == Approx(0.2f));
        CHECK(needlePosition(-25.0f) == Approx(-0.5f));
        CHECK(needlePosition(50.0f) == Approx(1.0f));
    }

    SECTION("Clamped to [-1, 1] with a narrower full scale") {
        TuningIndicatorConfig config;
        config.fullScaleCents = 20.0f;
        CHECK(needlePosition(40.0f, config) == 1.0f);
        CHECK(needlePosition(-40.0f, config) == -1.0f);
        CHECK(needlePosition(15.0f, config) == Approx(0.75f));
    }
}

TEST_CASE("indicatorColor fades from green to red",
          "[dsp][core][tuning_indicator]") {

    SECTION("In tune is the fixed good colour") {
        CHECK(indicatorColor(0.0f) == kInTuneColor);
        CHECK(indicatorColor(-5.0f) == IndicatorColor{0, 255, 125});
    }

    SECTION("At the edge of the band") {
        // |cents| / 50 = 0.2 -> r = 10 + 200, g = floor(0.8 * 255) = 204
        const auto c = indicatorColor(10.0f);
        CHECK(c.r == 210);
        CHECK(c.g == 204);
        CHECK(c.b == 50);
    }

    SECTION("Half scale, either direction") {
        const auto sharp = indicatorColor(25.0f);
        const auto flat = indicatorColor(-25.0f);
        CHECK(sharp == flat);
        CHECK(sharp.r == 225);
        CHECK(sharp.g == 127);
    }

    SECTION("Full scale") {
        const auto c = indicatorColor(50.0f);
        CHECK(c.r == 250);
        CHECK(c.g == 0);
        CHECK(c.b == 50);
    }
}

TEST_CASE("computeTuningIndication reads only the cents of a note",
          "[dsp][core][tuning_indicator]") {
    const PitchMapResult close = mapFrequencyToPitch(441.0f, AccidentalMode::Sharp);
    const PitchMapResult far = mapFrequencyToPitch(452.0f, AccidentalMode::Flat);
    REQUIRE(close);
    REQUIRE(far);

    const auto closeIndication = computeTuningIndication(close.note);
    CHECK(closeIndication.inTune);
    CHECK(closeIndication.needlePosition == 0.0f);
    CHECK(closeIndication.color == kInTuneColor);

    // 452 Hz is ~46.6 cents sharp of A4
    const auto farIndication = computeTuningIndication(far.note);
    CHECK_FALSE(farIndication.inTune);
    CHECK(farIndication.needlePosition == Approx(far.note.cents / 50.0f));
    CHECK(farIndication.needlePosition > 0.9f);
    CHECK(farIndication.color.r > 240);
}
