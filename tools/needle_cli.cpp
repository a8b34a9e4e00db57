// ==============================================================================
// Needle Command-Line Tuner
// ==============================================================================
// Maps frequencies to note names, or runs a synthesized tone through the full
// tuner pipeline, and prints the readings.
//
// Usage:
//   needle_cli [--flat] [--reference HZ] FREQ...
//   needle_cli [--flat] [--reference HZ] --tone HZ [--sample-rate SR]
// ==============================================================================

#include <needle/dsp/core/pitch_mapper.h>
#include <needle/dsp/core/tuning_indicator.h>
#include <needle/dsp/systems/tuner_engine.h>

#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numbers>
#include <sstream>
#include <string>
#include <vector>

using namespace Needle::DSP;

namespace {

struct Options {
    AccidentalMode mode = AccidentalMode::Sharp;
    float referenceHz = kA4FrequencyHz;
    double sampleRate = TunerEngine::kDefaultSampleRate;
    bool toneMode = false;
    float toneHz = 0.0f;
    std::vector<std::string> frequencies;
};

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--flat] [--reference HZ] FREQ...\n"
              << "  " << program << " [--flat] [--reference HZ] --tone HZ [--sample-rate SR]\n";
}

// Parses a whole argument as a number; rejects trailing garbage
bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end != nullptr && *end == '\0';
}

// Positive, finite and representable as float
bool isPositiveFloat(double value) {
    return value > 0.0 && value <= static_cast<double>(std::numeric_limits<float>::max());
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        double value = 0.0;

        if (arg == "--flat") {
            options.mode = AccidentalMode::Flat;
        } else if (arg == "--sharp") {
            options.mode = AccidentalMode::Sharp;
        } else if (arg == "--reference" && i + 1 < argc) {
            if (!parseNumber(argv[++i], value) || !isPositiveFloat(value)) {
                std::cerr << "Invalid reference frequency: " << argv[i] << std::endl;
                return false;
            }
            options.referenceHz = static_cast<float>(value);
        } else if (arg == "--tone" && i + 1 < argc) {
            if (!parseNumber(argv[++i], value) || !isPositiveFloat(value)) {
                std::cerr << "Invalid tone frequency: " << argv[i] << std::endl;
                return false;
            }
            options.toneMode = true;
            options.toneHz = static_cast<float>(value);
        } else if (arg == "--sample-rate" && i + 1 < argc) {
            if (!parseNumber(argv[++i], value) || !(value >= 8000.0) || !isPositiveFloat(value)) {
                std::cerr << "Invalid sample rate: " << argv[i] << std::endl;
                return false;
            }
            options.sampleRate = value;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            options.frequencies.push_back(arg);
        }
    }
    return options.toneMode || !options.frequencies.empty();
}

std::string formatNote(const PitchedNote& note) {
    std::ostringstream out;
    out << noteLetterName(note.note) << accidentalSymbol(note.accidental) << note.octave;
    return out.str();
}

void printReading(const PitchedNote& note, const TuningIndication& indication) {
    // Deviations that round to 0.0 print unsigned, never as -0.0
    float cents = note.cents;
    if (std::abs(cents) < 0.05f) cents = 0.0f;

    std::cout << std::fixed << std::setprecision(2) << note.frequency << " Hz -> "
              << formatNote(note) << " ";
    if (cents != 0.0f) std::cout << std::showpos;
    std::cout << std::setprecision(1) << cents << std::noshowpos << " cents"
              << (indication.inTune ? " [in tune]" : "") << std::endl;
}

int mapFrequencies(const Options& options) {
    int failures = 0;
    for (const auto& text : options.frequencies) {
        double value = 0.0;
        if (!parseNumber(text, value)) {
            std::cerr << "Not a number: " << text << std::endl;
            ++failures;
            continue;
        }

        // Beyond float range cannot be narrowed; report it as the mapper would
        if (!(std::abs(value) <= static_cast<double>(std::numeric_limits<float>::max()))) {
            std::cerr << text << ": " << pitchMapErrorName(PitchMapError::InvalidFrequency)
                      << std::endl;
            ++failures;
            continue;
        }

        const PitchMapResult result =
            mapFrequencyToPitch(static_cast<float>(value), options.mode, options.referenceHz);
        if (!result) {
            std::cerr << text << ": " << pitchMapErrorName(result.error) << std::endl;
            ++failures;
            continue;
        }
        printReading(result.note, computeTuningIndication(result.note));
    }
    return failures == 0 ? 0 : 1;
}

int runTone(const Options& options) {
    TunerEngine tuner;
    tuner.prepare(options.sampleRate, TunerEngine::kDefaultBufferSize);
    tuner.setAccidentalMode(options.mode);
    tuner.setReferenceFrequency(options.referenceHz);

    std::vector<float> buffer(TunerEngine::kDefaultBufferSize);
    const double twoPi = 2.0 * std::numbers::pi;
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<float>(
            0.5 * std::sin(twoPi * options.toneHz * static_cast<double>(i) / options.sampleRate));
    }

    const TunerReading reading = tuner.processBuffer(buffer.data(), buffer.size());
    if (!reading.hasPitch) {
        std::cerr << "No pitch detected in " << options.toneHz << " Hz tone" << std::endl;
        return 1;
    }

    std::cout << "Tone " << options.toneHz << " Hz, probability "
              << std::setprecision(3) << reading.probability << std::endl;
    printReading(reading.note, reading.indication);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    return options.toneMode ? runTone(options) : mapFrequencies(options);
}
