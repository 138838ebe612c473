#pragma once

#include <vector>

#include "../audio/AudioBuffer.hpp"

namespace lionsfx::dsp {

// Peaks at or below this are treated as silence and left untouched.
inline constexpr float kSilencePeakThreshold = 1.0e-9f;

float peakAmplitude(const std::vector<float>& samples);

// Scales `samples` by 1/peak if the peak exceeds 1.0. Returns the applied gain (1.0 when unchanged).
// Throws AudioJobError(ProcessingError) on non-finite samples.
float normalizePeakInPlace(std::vector<float>& samples);

// Same rule over all channels together, so the inter-channel balance is kept.
AudioBuffer normalizePeak(std::vector<std::vector<float>> channels, uint32_t sampleRate);

} // namespace lionsfx::dsp
