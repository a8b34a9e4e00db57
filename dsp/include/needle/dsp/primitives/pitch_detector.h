// ==============================================================================
// Layer 1: DSP Primitive - PitchDetector
// ==============================================================================
// YIN fundamental-frequency estimator for monophonic instrument tuning.
//
// Analyses one buffer at a time and reports either a detected frequency or
// "no pitch". Detection is stateless between buffers; nothing is smoothed.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations in detect)
// - Principle III: Modern C++ (C++20, RAII)
// - Principle IX: Layer 1 (depends only on Layer 0 / standard library)
//
// Reference: de Cheveigne & Kawahara, "YIN, a fundamental frequency estimator
// for speech and music", JASA 2002.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace Needle::DSP {

/// Result of analysing one buffer.
struct PitchEstimate {
    bool valid = false;        ///< False when no pitch was found
    float frequency = 0.0f;    ///< Detected fundamental in Hz (0 when !valid)
    float probability = 0.0f;  ///< 1 - normalized difference at the chosen lag
};

/// @brief YIN pitch detector
///
/// Algorithm:
/// 1. Difference function d(tau) over the first half of the buffer
/// 2. Cumulative mean normalized difference d'(tau)
/// 3. First lag where d'(tau) drops below the threshold, followed down to
///    its local minimum
/// 4. Parabolic interpolation around that minimum for sub-sample accuracy
///
/// @par Usage
/// @code
/// PitchDetector detector;
/// detector.prepare(22050.0, 4096);
///
/// // Per captured buffer
/// PitchEstimate estimate = detector.detect(samples, numSamples);
/// if (estimate.valid) {
///     auto result = mapFrequencyToPitch(estimate.frequency, AccidentalMode::Sharp);
/// }
/// @endcode
class PitchDetector {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    /// Default analysis buffer size in samples (~186ms at 22.05kHz)
    static constexpr std::size_t kDefaultBufferSize = 4096;

    /// Minimum detectable frequency (Hz) - sets max search lag
    static constexpr float kMinFrequency = 40.0f;

    /// Maximum detectable frequency (Hz) - sets min search lag
    static constexpr float kMaxFrequency = 2000.0f;

    /// Default absolute threshold on the normalized difference
    static constexpr float kDefaultThreshold = 0.10f;

    /// Buffers quieter than this (mean square) are treated as silence
    static constexpr float kSilenceEnergy = 1e-10f;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    PitchDetector() noexcept = default;

    /// @brief Prepare the detector for given sample rate and buffer size
    /// @param sampleRate Sample rate in Hz
    /// @param bufferSize Largest buffer that will be passed to detect()
    /// @note Allocates. Call from setup, not the audio thread.
    /// @note A sample rate that is not finite, not positive or beyond float
    ///       range leaves the detector unprepared; detect() then reports no pitch.
    void prepare(double sampleRate, std::size_t bufferSize = kDefaultBufferSize) {
        if (!(sampleRate > 0.0) ||
            !(sampleRate <= static_cast<double>(std::numeric_limits<float>::max()))) {
            sampleRate_ = 0.0f;
            bufferSize_ = 0;
            minLag_ = 0;
            maxLag_ = 0;
            yinBuffer_.clear();
            reset();
            return;
        }

        sampleRate_ = static_cast<float>(sampleRate);
        bufferSize_ = bufferSize;

        // Lags never exceed the half buffer, so both fit in size_t
        const double lagLimit = static_cast<double>(bufferSize_ / 2);
        minLag_ = std::max<std::size_t>(
            2, static_cast<std::size_t>(std::min(sampleRate / kMaxFrequency, lagLimit)));
        maxLag_ = static_cast<std::size_t>(
            std::min(std::ceil(sampleRate / kMinFrequency), lagLimit));

        yinBuffer_.assign(bufferSize_ / 2, 0.0f);

        reset();
    }

    /// @brief Clear the last estimate
    void reset() noexcept {
        std::fill(yinBuffer_.begin(), yinBuffer_.end(), 0.0f);
        lastEstimate_ = PitchEstimate{};
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Set the absolute threshold (0, 1). Lower = stricter.
    /// Values outside (0, 1) are ignored.
    void setThreshold(float threshold) noexcept {
        if (threshold > 0.0f && threshold < 1.0f) {
            threshold_ = threshold;
        }
    }

    [[nodiscard]] float getThreshold() const noexcept { return threshold_; }
    [[nodiscard]] float getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] std::size_t getBufferSize() const noexcept { return bufferSize_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Estimate the fundamental frequency of one buffer
    /// @param samples Input samples
    /// @param numSamples Number of samples (only the first getBufferSize() are used)
    /// @return Estimate; valid == false for silence, noise or too short input
    [[nodiscard]] PitchEstimate detect(const float* samples, std::size_t numSamples) noexcept {
        lastEstimate_ = PitchEstimate{};

        if (samples == nullptr || yinBuffer_.empty()) {
            return lastEstimate_;
        }

        const std::size_t n = std::min(numSamples, bufferSize_);
        const std::size_t halfSize = n / 2;
        const std::size_t maxLag = std::min(maxLag_, halfSize - (halfSize > 0 ? 1 : 0));
        if (halfSize < 3 || maxLag <= minLag_ + 1) {
            return lastEstimate_;
        }

        if (meanSquare(samples, n) < kSilenceEnergy) {
            return lastEstimate_;
        }

        computeDifference(samples, halfSize, maxLag);
        computeCumulativeMeanNormalized(maxLag);

        const std::size_t tau = absoluteThreshold(maxLag);
        if (tau == 0) {
            return lastEstimate_;
        }

        const float refinedTau = parabolicInterpolation(tau, maxLag);
        if (refinedTau <= 0.0f) {
            return lastEstimate_;
        }

        lastEstimate_.valid = true;
        lastEstimate_.frequency = sampleRate_ / refinedTau;
        lastEstimate_.probability = 1.0f - yinBuffer_[tau];
        return lastEstimate_;
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// @brief Result of the most recent detect() call
    [[nodiscard]] const PitchEstimate& getLastEstimate() const noexcept {
        return lastEstimate_;
    }

private:
    [[nodiscard]] static float meanSquare(const float* samples, std::size_t n) noexcept {
        float energy = 0.0f;
        for (std::size_t i = 0; i < n; ++i) {
            energy += samples[i] * samples[i];
        }
        return energy / static_cast<float>(n);
    }

    /// d(tau) = sum_j (x[j] - x[j + tau])^2 over the first half of the buffer
    void computeDifference(const float* samples, std::size_t halfSize,
                           std::size_t maxLag) noexcept {
        yinBuffer_[0] = 0.0f;
        for (std::size_t tau = 1; tau <= maxLag; ++tau) {
            float sum = 0.0f;
            for (std::size_t j = 0; j < halfSize; ++j) {
                const float delta = samples[j] - samples[j + tau];
                sum += delta * delta;
            }
            yinBuffer_[tau] = sum;
        }
    }

    /// d'(tau) = d(tau) * tau / sum_{k=1..tau} d(k), d'(0) = 1
    void computeCumulativeMeanNormalized(std::size_t maxLag) noexcept {
        yinBuffer_[0] = 1.0f;
        float runningSum = 0.0f;
        for (std::size_t tau = 1; tau <= maxLag; ++tau) {
            runningSum += yinBuffer_[tau];
            yinBuffer_[tau] = (runningSum > 0.0f)
                ? yinBuffer_[tau] * static_cast<float>(tau) / runningSum
                : 1.0f;
        }
    }

    /// First dip below the threshold, followed to its local minimum.
    /// @return Lag in samples, or 0 if none
    [[nodiscard]] std::size_t absoluteThreshold(std::size_t maxLag) const noexcept {
        for (std::size_t tau = minLag_; tau <= maxLag; ++tau) {
            if (yinBuffer_[tau] < threshold_) {
                while (tau + 1 <= maxLag && yinBuffer_[tau + 1] < yinBuffer_[tau]) {
                    ++tau;
                }
                return tau;
            }
        }
        return 0;
    }

    [[nodiscard]] float parabolicInterpolation(std::size_t tau, std::size_t maxLag) const noexcept {
        if (tau < 1 || tau + 1 > maxLag) {
            return static_cast<float>(tau);
        }

        const float s0 = yinBuffer_[tau - 1];
        const float s1 = yinBuffer_[tau];
        const float s2 = yinBuffer_[tau + 1];

        // Parabola vertex: x = (s0 - s2) / (2 * (s0 - 2*s1 + s2))
        const float denom = 2.0f * (s0 - 2.0f * s1 + s2);
        if (std::abs(denom) < 1e-12f) {
            return static_cast<float>(tau);
        }
        const float delta = std::clamp((s0 - s2) / denom, -1.0f, 1.0f);
        return static_cast<float>(tau) + delta;
    }

    // Configuration
    float sampleRate_ = 22050.0f;
    std::size_t bufferSize_ = 0;
    std::size_t minLag_ = 11;   // 2000Hz at 22.05kHz
    std::size_t maxLag_ = 552;  // 40Hz at 22.05kHz
    float threshold_ = kDefaultThreshold;

    // State
    std::vector<float> yinBuffer_;

    // Results
    PitchEstimate lastEstimate_;
};

}  // namespace Needle::DSP
