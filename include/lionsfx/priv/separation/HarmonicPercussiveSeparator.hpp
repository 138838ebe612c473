#pragma once

#include <cstddef>

#include "../common.hpp"
#include "../audio/AudioBuffer.hpp"

namespace lionsfx {

// Tunables of the separation. They are heuristics, not model weights; the defaults
// were picked by ear on pop mixes and are meant to be overridden from configuration.
struct SeparationSettings {
    size_t frameSize{2048};
    size_t hopSize{512};
    // median filter widths: frames for the harmonic (time) pass, bins for the percussive (frequency) pass
    size_t harmonicFilterWidth{17};
    size_t percussiveFilterWidth{17};
    // exponent applied to both estimates before building the soft mask
    float maskPower{2.0f};
    // harmonic ratio at or above which a bin is attributed to the vocal estimate
    float dominanceThreshold{0.5f};
    // 0 disables spectral subtraction, 1 subtracts the full opposite estimate
    float subtractionStrength{0.5f};
    double vocalBandLowHz{300.0};
    double vocalBandHighHz{3000.0};
    // vocal gain outside the vocal band; the removed part goes to the instrumental estimate
    float outOfBandVocalGain{0.4f};
};

struct SeparationOutput {
    AudioBuffer vocals{};
    AudioBuffer instrumental{};
};

// Vocal / instrumental split by harmonic-percussive median filtering and spectral subtraction.
// The input is downmixed to mono; both outputs are mono, have the input's length and sample rate,
// and are peak-normalized.
class HarmonicPercussiveSeparator {
public:
    explicit HarmonicPercussiveSeparator(SeparationSettings settings = {});

    const SeparationSettings& settings() const { return settings_; }

    // Reports 10 after the transform, 40 after mask estimation, 80 after reconstruction.
    // Throws AudioJobError(InvalidParameter) for an empty buffer.
    SeparationOutput separate(const AudioBuffer& input, const ProgressCallback& progress = {}) const;

private:
    SeparationSettings settings_;
};

} // namespace lionsfx
