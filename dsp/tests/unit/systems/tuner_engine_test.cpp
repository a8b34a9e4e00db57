// ==============================================================================
// Unit Tests: TunerEngine
// ==============================================================================
// Layer 3: System Component Tests
//
// Tests for: dsp/include/needle/dsp/systems/tuner_engine.h
// ==============================================================================

#include <catch2/catch.hpp>

#include <needle/dsp/systems/tuner_engine.h>

#include <cmath>
#include <vector>

using namespace Needle::DSP;
using Catch::Detail::Approx;

namespace {

constexpr double kTestSampleRate = 22050.0;
constexpr std::size_t kTestBufferSize = 4096;
constexpr double kTwoPi = 6.283185307179586;

std::vector<float> makeSine(double frequency, std::size_t size = kTestBufferSize) {
    std::vector<float> buffer(size);
    for (std::size_t i = 0; i < size; ++i) {
        buffer[i] = 0.5f * static_cast<float>(
            std::sin(kTwoPi * frequency * static_cast<double>(i) / kTestSampleRate));
    }
    return buffer;
}

} // namespace

TEST_CASE("TunerEngine starts on A4", "[tuner_engine][systems]") {
    TunerEngine tuner;
    tuner.prepare(kTestSampleRate, kTestBufferSize);

    const TunerReading reading = tuner.getLastReading();
    CHECK_FALSE(reading.hasPitch);
    CHECK(reading.note.note == NoteLetter::A);
    CHECK(reading.note.accidental == Accidental::Natural);
    CHECK(reading.note.octave == 4);
    CHECK(reading.note.frequency == 440.0f);
    CHECK(reading.note.cents == 0.0f);
    CHECK(reading.indication.inTune);
    CHECK(tuner.getAccidentalMode() == AccidentalMode::Sharp);
}

TEST_CASE("TunerEngine maps a detected tone", "[tuner_engine][systems]") {
    TunerEngine tuner;
    tuner.prepare(kTestSampleRate, kTestBufferSize);

    SECTION("G3 in tune") {
        const auto tone = makeSine(196.0);
        const TunerReading reading = tuner.processBuffer(tone.data(), tone.size());

        REQUIRE(reading.hasPitch);
        CHECK(reading.note.note == NoteLetter::G);
        CHECK(reading.note.accidental == Accidental::Natural);
        CHECK(reading.note.octave == 3);
        CHECK(std::abs(reading.note.cents) < 5.0f);
        CHECK(reading.indication.inTune);
        CHECK(reading.indication.needlePosition == 0.0f);
        CHECK(reading.probability > 0.9f);
    }

    SECTION("A string 30 cents sharp") {
        const double hz = 110.0 * std::exp2(30.0 / 1200.0);
        const auto tone = makeSine(hz);
        const TunerReading reading = tuner.processBuffer(tone.data(), tone.size());

        REQUIRE(reading.hasPitch);
        CHECK(reading.note.note == NoteLetter::A);
        CHECK(reading.note.octave == 2);
        CHECK(reading.note.cents == Approx(30.0f).margin(5.0f));
        CHECK_FALSE(reading.indication.inTune);
        CHECK(reading.indication.needlePosition > 0.4f);
    }
}

TEST_CASE("TunerEngine holds the last reading when no pitch is found", "[tuner_engine][systems]") {
    TunerEngine tuner;
    tuner.prepare(kTestSampleRate, kTestBufferSize);

    const auto tone = makeSine(329.63);
    const std::vector<float> silence(kTestBufferSize, 0.0f);

    const TunerReading pitched = tuner.processBuffer(tone.data(), tone.size());
    REQUIRE(pitched.hasPitch);
    REQUIRE(pitched.note.note == NoteLetter::E);

    const TunerReading held = tuner.processBuffer(silence.data(), silence.size());
    CHECK_FALSE(held.hasPitch);
    CHECK(held.note == pitched.note);
    CHECK(tuner.getDisplayedFrequency() == pitched.note.frequency);
}

TEST_CASE("TunerEngine accidental mode re-spells the held reading", "[tuner_engine][systems]") {
    TunerEngine tuner;
    tuner.prepare(kTestSampleRate, kTestBufferSize);

    // F#4 / Gb4
    const auto tone = makeSine(369.99);
    const TunerReading sharp = tuner.processBuffer(tone.data(), tone.size());
    REQUIRE(sharp.hasPitch);
    CHECK(sharp.note.note == NoteLetter::F);
    CHECK(sharp.note.accidental == Accidental::Sharp);

    tuner.toggleAccidentalMode();
    CHECK(tuner.getAccidentalMode() == AccidentalMode::Flat);

    const TunerReading flat = tuner.getLastReading();
    CHECK(flat.note.note == NoteLetter::G);
    CHECK(flat.note.accidental == Accidental::Flat);
    CHECK(flat.note.octave == sharp.note.octave);
    CHECK(flat.note.cents == sharp.note.cents);

    tuner.toggleAccidentalMode();
    CHECK(tuner.getAccidentalMode() == AccidentalMode::Sharp);
    CHECK(tuner.getLastReading().note == sharp.note);
}

TEST_CASE("TunerEngine configuration", "[tuner_engine][systems]") {
    TunerEngine tuner;
    tuner.prepare(kTestSampleRate, kTestBufferSize);

    SECTION("Reference frequency shifts cents") {
        tuner.setReferenceFrequency(432.0f);
        CHECK(tuner.getReferenceFrequency() == 432.0f);

        const auto tone = makeSine(432.0);
        const TunerReading reading = tuner.processBuffer(tone.data(), tone.size());
        REQUIRE(reading.hasPitch);
        CHECK(reading.note.note == NoteLetter::A);
        CHECK(std::abs(reading.note.cents) < 5.0f);
    }

    SECTION("Reference change before any pitch keeps A4 in tune") {
        tuner.setReferenceFrequency(432.0f);

        const TunerReading reading = tuner.getLastReading();
        CHECK(tuner.getDisplayedFrequency() == 432.0f);
        CHECK(reading.note.note == NoteLetter::A);
        CHECK(reading.note.accidental == Accidental::Natural);
        CHECK(reading.note.octave == 4);
        CHECK(reading.note.cents == 0.0f);
        CHECK(reading.indication.inTune);
    }

    SECTION("Reference change after a pitch keeps the held frequency") {
        const auto tone = makeSine(329.63);
        const TunerReading pitched = tuner.processBuffer(tone.data(), tone.size());
        REQUIRE(pitched.hasPitch);

        tuner.setReferenceFrequency(432.0f);
        CHECK(tuner.getDisplayedFrequency() == pitched.note.frequency);
        CHECK(tuner.getLastReading().note.cents > pitched.note.cents);

        tuner.reset();
        CHECK(tuner.getDisplayedFrequency() == 432.0f);
        tuner.setReferenceFrequency(440.0f);
        CHECK(tuner.getDisplayedFrequency() == 440.0f);
    }

    SECTION("Invalid reference is ignored") {
        tuner.setReferenceFrequency(0.0f);
        tuner.setReferenceFrequency(-440.0f);
        tuner.setReferenceFrequency(std::nanf(""));
        CHECK(tuner.getReferenceFrequency() == 440.0f);
    }

    SECTION("Indicator band is configurable") {
        TuningIndicatorConfig config;
        config.inTuneCents = 40.0f;
        tuner.setIndicatorConfig(config);
        CHECK(tuner.getIndicatorConfig().inTuneCents == 40.0f);

        const auto tone = makeSine(110.0 * std::exp2(30.0 / 1200.0));
        const TunerReading reading = tuner.processBuffer(tone.data(), tone.size());
        REQUIRE(reading.hasPitch);
        CHECK(reading.indication.inTune);
    }

    SECTION("Reset returns the display to the reference") {
        const auto tone = makeSine(523.25);
        REQUIRE(tuner.processBuffer(tone.data(), tone.size()).hasPitch);

        tuner.reset();
        CHECK(tuner.getDisplayedFrequency() == 440.0f);
        CHECK_FALSE(tuner.getLastReading().hasPitch);
    }
}
