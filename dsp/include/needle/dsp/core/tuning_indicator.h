// ==============================================================================
// Layer 0: Core Utility - Tuning Indicator
// ==============================================================================
// Display measures derived purely from a cents deviation: whether the note is
// close enough to count as in tune, where the needle sits, and the indicator
// colour. Kept apart from the pitch mapper, which knows nothing about display.
//
// Constitution Principle II: Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
// ==============================================================================

#pragma once

#include <needle/dsp/core/pitch_mapper.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Needle::DSP {

/// Thresholds for the tuning display.
struct TuningIndicatorConfig {
    float inTuneCents = 10.0f;     ///< |cents| strictly below this is in tune
    float fullScaleCents = 50.0f;  ///< Deviation that moves the needle fully out
};

/// 8-bit RGB colour.
struct IndicatorColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    [[nodiscard]] bool operator==(const IndicatorColor&) const noexcept = default;
};

/// Colour shown while the note is in tune
inline constexpr IndicatorColor kInTuneColor{0, 255, 125};

/// Everything the display needs for one reading.
struct TuningIndication {
    bool inTune = true;
    float needlePosition = 0.0f;  ///< [-1, +1], 0 = centred, negative = flat
    IndicatorColor color = kInTuneColor;
};

/// True when the deviation lies strictly inside (-inTuneCents, +inTuneCents).
[[nodiscard]] inline bool isInTune(float cents,
                                   const TuningIndicatorConfig& config = {}) noexcept {
    return cents > -config.inTuneCents && cents < config.inTuneCents;
}

/// Needle offset for a deviation.
/// Snaps to 0 while in tune, otherwise cents / fullScaleCents clamped to [-1, 1].
[[nodiscard]] inline float needlePosition(float cents,
                                          const TuningIndicatorConfig& config = {}) noexcept {
    if (isInTune(cents, config) || config.fullScaleCents <= 0.0f) {
        return 0.0f;
    }
    return std::clamp(cents / config.fullScaleCents, -1.0f, 1.0f);
}

/// Indicator colour for a deviation.
///
/// In tune: kInTuneColor. Otherwise red rises from 200 to 250 and green falls
/// from 255 to 0 as |cents| approaches fullScaleCents; blue stays at 50.
[[nodiscard]] inline IndicatorColor indicatorColor(float cents,
                                                   const TuningIndicatorConfig& config = {}) noexcept {
    if (isInTune(cents, config)) {
        return kInTuneColor;
    }
    if (config.fullScaleCents <= 0.0f) {
        return {250, 0, 50};
    }

    const float amount = std::min(std::abs(cents), config.fullScaleCents) / config.fullScaleCents;
    IndicatorColor color;
    color.r = static_cast<uint8_t>(std::floor(amount * 50.0f) + 200.0f);
    color.g = static_cast<uint8_t>(std::floor((1.0f - amount) * 255.0f));
    color.b = 50;
    return color;
}

/// Compute all display measures for a mapped note.
[[nodiscard]] inline TuningIndication computeTuningIndication(
    const PitchedNote& note, const TuningIndicatorConfig& config = {}) noexcept {
    TuningIndication indication;
    indication.inTune = isInTune(note.cents, config);
    indication.needlePosition = needlePosition(note.cents, config);
    indication.color = indicatorColor(note.cents, config);
    return indication;
}

}  // namespace Needle::DSP
