#pragma once

// ==============================================================================
// PitchMapper - Frequency to Pitch Name (Layer 0: Core)
// ==============================================================================
// Maps a detected fundamental frequency onto the 12-tone equal-tempered scale
// anchored at a reference A4, returning the nearest note (letter, accidental,
// octave in scientific pitch notation) and the signed deviation in cents.
//
// Stateless: every call is independent and returns a fresh value. All
// functions are noexcept and zero-allocation, suitable for real-time audio.
// Header-only implementation with constexpr lookup tables.
// ==============================================================================

#include <needle/dsp/core/pitch_utils.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace Needle::DSP {

// =============================================================================
// Enums
// =============================================================================

/// Natural note letter names.
enum class NoteLetter : uint8_t {
    A = 0,
    B = 1,
    C = 2,
    D = 3,
    E = 4,
    F = 5,
    G = 6,
};

/// Accidental attached to a note letter.
enum class Accidental : uint8_t {
    Natural = 0,
    Sharp = 1,
    Flat = 2,
};

/// Spelling preference for the five non-natural pitch classes.
/// Selects the name only, never the semitone.
enum class AccidentalMode : uint8_t {
    Sharp = 0,  ///< A#, C#, D#, F#, G#
    Flat = 1,   ///< Bb, Db, Eb, Gb, Ab
};

/// Reasons a frequency could not be mapped.
enum class PitchMapError : uint8_t {
    None = 0,
    InvalidFrequency,  ///< Frequency <= 0, infinite or NaN
    InvalidReference,  ///< Reference pitch <= 0, infinite or NaN
};

// =============================================================================
// Constants
// =============================================================================

/// Octave number of the reference pitch (A4)
inline constexpr int kReferenceOctave = 4;

/// Semitones from C up to A within one octave (C4 -> A4)
inline constexpr int kSemitonesFromCToA = 9;

// =============================================================================
// Result Types
// =============================================================================

/// Nearest equal-tempered pitch for a frequency.
struct PitchedNote {
    NoteLetter note = NoteLetter::A;
    Accidental accidental = Accidental::Natural;
    int octave = kReferenceOctave;
    float frequency = kA4FrequencyHz;  ///< Input frequency, echoed unchanged
    float cents = 0.0f;                ///< Deviation in (-50, +50]

    [[nodiscard]] bool operator==(const PitchedNote&) const noexcept = default;
};

/// Outcome of mapFrequencyToPitch().
///
/// When error != PitchMapError::None the note member is default-constructed
/// and carries no information about the input.
struct PitchMapResult {
    PitchedNote note{};
    PitchMapError error = PitchMapError::None;

    [[nodiscard]] bool isValid() const noexcept {
        return error == PitchMapError::None;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return isValid();
    }
};

// =============================================================================
// Naming Table
// =============================================================================

namespace detail {

struct NoteSpelling {
    NoteLetter note;
    Accidental accidental;
};

struct PitchClassEntry {
    NoteSpelling sharp;
    NoteSpelling flat;
};

/// Pitch classes anchored at A (index 0 = A, index 3 = C).
/// Natural entries carry the same spelling in both columns.
inline constexpr std::array<PitchClassEntry, kSemitonesPerOctave> kPitchClassTable = {{
    {{NoteLetter::A, Accidental::Natural}, {NoteLetter::A, Accidental::Natural}},
    {{NoteLetter::A, Accidental::Sharp},   {NoteLetter::B, Accidental::Flat}},
    {{NoteLetter::B, Accidental::Natural}, {NoteLetter::B, Accidental::Natural}},
    {{NoteLetter::C, Accidental::Natural}, {NoteLetter::C, Accidental::Natural}},
    {{NoteLetter::C, Accidental::Sharp},   {NoteLetter::D, Accidental::Flat}},
    {{NoteLetter::D, Accidental::Natural}, {NoteLetter::D, Accidental::Natural}},
    {{NoteLetter::D, Accidental::Sharp},   {NoteLetter::E, Accidental::Flat}},
    {{NoteLetter::E, Accidental::Natural}, {NoteLetter::E, Accidental::Natural}},
    {{NoteLetter::F, Accidental::Natural}, {NoteLetter::F, Accidental::Natural}},
    {{NoteLetter::F, Accidental::Sharp},   {NoteLetter::G, Accidental::Flat}},
    {{NoteLetter::G, Accidental::Natural}, {NoteLetter::G, Accidental::Natural}},
    {{NoteLetter::G, Accidental::Sharp},   {NoteLetter::A, Accidental::Flat}},
}};

/// Index of each natural letter in kPitchClassTable, by NoteLetter value.
inline constexpr std::array<int, 7> kNaturalPitchClass = {0, 2, 3, 5, 7, 8, 10};

/// Floor division for a positive divisor.
[[nodiscard]] constexpr int floorDiv(int value, int divisor) noexcept {
    const int q = value / divisor;
    return (value % divisor != 0 && value < 0) ? q - 1 : q;
}

[[nodiscard]] constexpr bool isUsableFrequency(float hz) noexcept {
    // NaN fails both comparisons
    return hz > 0.0f && hz <= std::numeric_limits<float>::max();
}

}  // namespace detail

// =============================================================================
// Semitone <-> Name
// =============================================================================

/// Pitch class (0-11, 0 = A) of a semitone offset from A.
[[nodiscard]] constexpr int pitchClassFromSemitones(int semitones) noexcept {
    return ((semitones % kSemitonesPerOctave) + kSemitonesPerOctave) % kSemitonesPerOctave;
}

/// Scientific-pitch octave of a semitone offset from A4.
/// The octave number changes between B and C: 0 -> 4, 3 -> 5, -9 -> 4, -10 -> 3.
[[nodiscard]] constexpr int octaveFromSemitones(int semitones) noexcept {
    return kReferenceOctave +
           detail::floorDiv(semitones + kSemitonesFromCToA, kSemitonesPerOctave);
}

/// Build the note named by a semitone offset from the reference A4.
/// frequency and cents are left for the caller to fill.
[[nodiscard]] constexpr PitchedNote noteFromSemitones(int semitones,
                                                      AccidentalMode mode) noexcept {
    const auto& entry = detail::kPitchClassTable[static_cast<std::size_t>(
        pitchClassFromSemitones(semitones))];
    const auto& spelling = (mode == AccidentalMode::Flat) ? entry.flat : entry.sharp;

    PitchedNote result;
    result.note = spelling.note;
    result.accidental = spelling.accidental;
    result.octave = octaveFromSemitones(semitones);
    return result;
}

/// Pitch class (0-11, 0 = A) of a named note.
[[nodiscard]] constexpr int pitchClassOf(const PitchedNote& note) noexcept {
    int pc = detail::kNaturalPitchClass[static_cast<std::size_t>(note.note)];
    if (note.accidental == Accidental::Sharp) {
        pc += 1;
    } else if (note.accidental == Accidental::Flat) {
        pc -= 1;
    }
    return pitchClassFromSemitones(pc);
}

/// Signed semitone distance of a named note from A4 (A4 = 0, C4 = -9, B3 = -10).
[[nodiscard]] constexpr int semitonesFromReference(const PitchedNote& note) noexcept {
    // Position of the note counted upward from C of its octave
    const int fromC = pitchClassFromSemitones(pitchClassOf(note) + kSemitonesFromCToA);
    // B# and Cb cross the octave line relative to their letter
    int octave = note.octave;
    if (note.note == NoteLetter::B && note.accidental == Accidental::Sharp) {
        ++octave;
    } else if (note.note == NoteLetter::C && note.accidental == Accidental::Flat) {
        --octave;
    }
    return (octave - kReferenceOctave) * kSemitonesPerOctave + fromC - kSemitonesFromCToA;
}

/// Equal-tempered frequency of a named note (cents ignored).
/// @param note Note to evaluate
/// @param referenceHz Frequency of A4
[[nodiscard]] inline float nearestNoteFrequency(
    const PitchedNote& note, float referenceHz = kA4FrequencyHz) noexcept {
    return semitoneOffsetToFrequency(
        static_cast<float>(semitonesFromReference(note)), referenceHz);
}

// =============================================================================
// Frequency -> PitchedNote
// =============================================================================

/// Map a frequency to the nearest equal-tempered pitch.
///
/// offset = 12 * log2(hz / referenceHz) is quantized once; the nearest
/// semitone selects name and octave and the remainder becomes cents, so the
/// two never disagree. A tie exactly halfway between semitones resolves to
/// the lower one with cents = +50.
///
/// The accidental mode only changes how the five non-natural pitch classes
/// are spelled. Octave and cents do not depend on it.
///
/// @param hz Detected fundamental frequency in Hz (finite, > 0)
/// @param mode Sharp or flat spelling
/// @param referenceHz Frequency of A4 (finite, > 0, default 440 Hz)
/// @return The mapped note, or InvalidFrequency / InvalidReference
///
/// @example mapFrequencyToPitch(440.0f, AccidentalMode::Sharp)  -> A4, 0 cents
/// @example mapFrequencyToPitch(466.16f, AccidentalMode::Flat)  -> Bb4, ~0 cents
/// @example mapFrequencyToPitch(0.0f, AccidentalMode::Sharp)    -> InvalidFrequency
[[nodiscard]] inline PitchMapResult mapFrequencyToPitch(
    float hz,
    AccidentalMode mode,
    float referenceHz = kA4FrequencyHz
) noexcept {
    PitchMapResult result;
    if (!detail::isUsableFrequency(hz)) {
        result.error = PitchMapError::InvalidFrequency;
        return result;
    }
    if (!detail::isUsableFrequency(referenceHz)) {
        result.error = PitchMapError::InvalidReference;
        return result;
    }

    const SemitoneQuantization q =
        quantizeSemitoneOffset(frequencyToSemitoneOffset(hz, referenceHz));

    result.note = noteFromSemitones(q.semitones, mode);
    result.note.frequency = hz;
    result.note.cents = q.cents;
    return result;
}

// =============================================================================
// Display Names
// =============================================================================

/// Letter name ("A".."G").
[[nodiscard]] constexpr const char* noteLetterName(NoteLetter letter) noexcept {
    switch (letter) {
        case NoteLetter::A: return "A";
        case NoteLetter::B: return "B";
        case NoteLetter::C: return "C";
        case NoteLetter::D: return "D";
        case NoteLetter::E: return "E";
        case NoteLetter::F: return "F";
        case NoteLetter::G: return "G";
    }
    return "?";
}

/// ASCII accidental symbol ("#", "b", or "" for natural).
[[nodiscard]] constexpr const char* accidentalSymbol(Accidental accidental) noexcept {
    switch (accidental) {
        case Accidental::Sharp: return "#";
        case Accidental::Flat: return "b";
        case Accidental::Natural: return "";
    }
    return "";
}

/// Short description of a mapping error.
[[nodiscard]] constexpr const char* pitchMapErrorName(PitchMapError error) noexcept {
    switch (error) {
        case PitchMapError::None: return "none";
        case PitchMapError::InvalidFrequency: return "invalid frequency";
        case PitchMapError::InvalidReference: return "invalid reference frequency";
    }
    return "unknown";
}

}  // namespace Needle::DSP
