// ==============================================================================
// Layer 0: Core Utility - Pitch Conversion
// ==============================================================================
// Frequency <-> semitone conversions relative to a reference pitch, and the
// semitone quantizer shared by the pitch mapper.
//
// Constitution Principle II: Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
// ==============================================================================

#pragma once

#include <cmath>
#include <cstdint>

namespace Needle::DSP {

// =============================================================================
// Constants
// =============================================================================

/// Standard A4 reference frequency in Hz
inline constexpr float kA4FrequencyHz = 440.0f;

/// Number of semitones in an octave
inline constexpr int kSemitonesPerOctave = 12;

/// Number of cents in a semitone
inline constexpr float kCentsPerSemitone = 100.0f;

/// Largest deviation from the nearest semitone, in cents
inline constexpr float kMaxCentsDeviation = 50.0f;

// =============================================================================
// Frequency / Semitone Conversion
// =============================================================================

/// Convert a frequency to a continuous semitone offset from a reference pitch.
/// offset = 12 * log2(hz / referenceHz)
/// @param hz Frequency in Hz (must be > 0)
/// @param referenceHz Reference frequency in Hz (must be > 0)
/// @return Semitone offset (0 = reference, +12 = octave up). Returns 0.0 if
///         either argument is not a positive finite number.
[[nodiscard]] inline float frequencyToSemitoneOffset(
    float hz, float referenceHz = kA4FrequencyHz) noexcept {
    if (!(hz > 0.0f) || !(referenceHz > 0.0f)) return 0.0f;
    if (!std::isfinite(hz) || !std::isfinite(referenceHz)) return 0.0f;
    // Difference of logs in double: the ratio can underflow for subnormal hz
    return static_cast<float>(
        static_cast<double>(kSemitonesPerOctave) *
        (std::log2(static_cast<double>(hz)) - std::log2(static_cast<double>(referenceHz))));
}

/// Convert a semitone offset from a reference pitch back to a frequency.
/// @param semitones Offset in semitones (may be fractional)
/// @param referenceHz Reference frequency in Hz
/// @return Frequency in Hz
[[nodiscard]] inline float semitoneOffsetToFrequency(
    float semitones, float referenceHz = kA4FrequencyHz) noexcept {
    return referenceHz * std::exp2(semitones / static_cast<float>(kSemitonesPerOctave));
}

/// Convert cents to a frequency ratio (+1200 cents = 2.0)
[[nodiscard]] inline float centsToRatio(float cents) noexcept {
    return std::exp2(cents / 1200.0f);
}

/// Convert a frequency ratio to cents
/// @return Cents, or 0.0 for a non-positive ratio
[[nodiscard]] inline float ratioToCents(float ratio) noexcept {
    if (ratio <= 0.0f) {
        return 0.0f;
    }
    return 1200.0f * std::log2(ratio);
}

// =============================================================================
// Semitone Quantization
// =============================================================================

/// Nearest semitone and signed deviation derived from one continuous offset.
struct SemitoneQuantization {
    int semitones = 0;   ///< Nearest whole semitone offset
    float cents = 0.0f;  ///< Deviation from that semitone, in (-50, +50]
};

/// Quantize a continuous semitone offset to the nearest semitone.
///
/// Ties (an offset exactly halfway between two semitones) resolve to the
/// lower semitone, reported as +50 cents. Together with the rounding this
/// keeps cents in (-50, +50].
///
/// @param offset Continuous semitone offset (finite)
/// @return Nearest semitone and the deviation in cents
[[nodiscard]] inline SemitoneQuantization quantizeSemitoneOffset(float offset) noexcept {
    float nearest = std::ceil(offset - 0.5f);
    float cents = (offset - nearest) * kCentsPerSemitone;

    // The product can round onto -50 just above a tie; that is the +50 side
    // of the semitone below.
    if (cents <= -kMaxCentsDeviation) {
        nearest -= 1.0f;
        cents += kCentsPerSemitone;
    } else if (cents > kMaxCentsDeviation) {
        nearest += 1.0f;
        cents -= kCentsPerSemitone;
    }

    return {static_cast<int>(nearest), cents};
}

}  // namespace Needle::DSP
