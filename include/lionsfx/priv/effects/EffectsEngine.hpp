#pragma once

#include <string_view>

#include "../common.hpp"
#include "../audio/AudioBuffer.hpp"
#include "EffectParameters.hpp"

namespace lionsfx {

// Applies one of the seven effects to a buffer. Every channel is processed on its own
// (chorus shares its modulation phase across channels), the result keeps the input's
// length, channel count and sample rate, and is peak-normalized.
//
// Progress: 10 after setup, 10-70 while channels are processed, 80 after normalization.
class EffectsEngine {
public:
    AudioBuffer apply(const AudioBuffer& input, EffectType type, int intensity,
                      const ProgressCallback& progress = {}) const;

    // Throws AudioJobError(InvalidParameter) for an unknown effect name.
    AudioBuffer apply(const AudioBuffer& input, std::string_view effectName, int intensity,
                      const ProgressCallback& progress = {}) const;

    AudioBuffer apply(const AudioBuffer& input, const EffectParameters& parameters,
                      const ProgressCallback& progress = {}) const;
};

}
