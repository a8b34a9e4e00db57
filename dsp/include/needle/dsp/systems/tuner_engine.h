// ==============================================================================
// Layer 3: System Component - TunerEngine
// ==============================================================================
// Per-buffer tuner pipeline:
//   [1] PitchDetector (YIN)  ->  [2] mapFrequencyToPitch  ->  [3] TuningIndication
//
// Holds the user's accidental spelling preference and the frequency currently
// on display. A buffer without a detectable pitch leaves the display on the
// previous frequency; readings are never averaged.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations in processBuffer)
// - Principle IX: Layer 3 (composes Layer 0 and Layer 1)
// ==============================================================================

#pragma once

#include <needle/dsp/core/pitch_mapper.h>
#include <needle/dsp/core/pitch_utils.h>
#include <needle/dsp/core/tuning_indicator.h>
#include <needle/dsp/primitives/pitch_detector.h>

#include <cmath>
#include <cstddef>

namespace Needle::DSP {

/// One display update.
struct TunerReading {
    bool hasPitch = false;       ///< True if this buffer produced a new pitch
    PitchedNote note{};          ///< Note on display (held when !hasPitch)
    TuningIndication indication{};
    float probability = 0.0f;    ///< Detector probability for this buffer
};

/// @brief Detector + mapper + indicator for a monophonic tuner (Layer 3).
///
/// @par Usage
/// @code
/// TunerEngine tuner;
/// tuner.prepare(22050.0, 4096);
///
/// // Per captured buffer
/// TunerReading reading = tuner.processBuffer(samples, numSamples);
/// draw(reading.note, reading.indication);
/// @endcode
class TunerEngine {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr double kDefaultSampleRate = 22050.0;
    static constexpr std::size_t kDefaultBufferSize = PitchDetector::kDefaultBufferSize;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    TunerEngine() noexcept = default;

    /// @brief Prepare for the given capture format
    /// @note Allocates (via PitchDetector). Call from setup, not audio thread.
    void prepare(double sampleRate = kDefaultSampleRate,
                 std::size_t bufferSize = kDefaultBufferSize) {
        detector_.prepare(sampleRate, bufferSize);
        reset();
    }

    /// @brief Return the display to A4 at the reference frequency
    void reset() noexcept {
        detector_.reset();
        displayedFrequency_ = referenceHz_;
        lastProbability_ = 0.0f;
        lastHadPitch_ = false;
        hasDetectedPitch_ = false;
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setAccidentalMode(AccidentalMode mode) noexcept { mode_ = mode; }

    void toggleAccidentalMode() noexcept {
        mode_ = (mode_ == AccidentalMode::Sharp) ? AccidentalMode::Flat
                                                 : AccidentalMode::Sharp;
    }

    [[nodiscard]] AccidentalMode getAccidentalMode() const noexcept { return mode_; }

    /// @brief Set the A4 reference. Non-finite or non-positive values are ignored.
    /// Until a pitch has been detected the display follows the reference, so it
    /// keeps showing A4 in tune.
    void setReferenceFrequency(float hz) noexcept {
        if (hz > 0.0f && std::isfinite(hz)) {
            referenceHz_ = hz;
            if (!hasDetectedPitch_) {
                displayedFrequency_ = hz;
            }
        }
    }

    [[nodiscard]] float getReferenceFrequency() const noexcept { return referenceHz_; }

    void setIndicatorConfig(const TuningIndicatorConfig& config) noexcept {
        indicatorConfig_ = config;
    }

    [[nodiscard]] const TuningIndicatorConfig& getIndicatorConfig() const noexcept {
        return indicatorConfig_;
    }

    void setDetectorThreshold(float threshold) noexcept {
        detector_.setThreshold(threshold);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Analyse one captured buffer and produce a display update
    [[nodiscard]] TunerReading processBuffer(const float* samples,
                                             std::size_t numSamples) noexcept {
        const PitchEstimate estimate = detector_.detect(samples, numSamples);

        lastHadPitch_ = false;
        lastProbability_ = estimate.probability;
        if (estimate.valid) {
            // A detector estimate the mapper rejects is treated as no pitch
            const PitchMapResult mapped =
                mapFrequencyToPitch(estimate.frequency, mode_, referenceHz_);
            if (mapped) {
                displayedFrequency_ = estimate.frequency;
                lastHadPitch_ = true;
                hasDetectedPitch_ = true;
            }
        }

        return getLastReading();
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// @brief Reading for the frequency on display, spelled with the current mode
    [[nodiscard]] TunerReading getLastReading() const noexcept {
        TunerReading reading;
        reading.hasPitch = lastHadPitch_;
        reading.probability = lastProbability_;

        const PitchMapResult mapped =
            mapFrequencyToPitch(displayedFrequency_, mode_, referenceHz_);
        if (mapped) {
            reading.note = mapped.note;
        }
        reading.indication = computeTuningIndication(reading.note, indicatorConfig_);
        return reading;
    }

    [[nodiscard]] float getDisplayedFrequency() const noexcept { return displayedFrequency_; }

    [[nodiscard]] const PitchDetector& detector() const noexcept { return detector_; }

private:
    PitchDetector detector_;
    TuningIndicatorConfig indicatorConfig_{};
    AccidentalMode mode_ = AccidentalMode::Sharp;
    float referenceHz_ = kA4FrequencyHz;
    float displayedFrequency_ = kA4FrequencyHz;
    float lastProbability_ = 0.0f;
    bool lastHadPitch_ = false;
    bool hasDetectedPitch_ = false;  // Since construction or the last reset()
};

}  // namespace Needle::DSP
