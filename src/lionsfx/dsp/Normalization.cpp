#include <algorithm>
#include <cmath>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx::dsp {

namespace {

float checkedPeak(const std::vector<float>& samples)
{
    float peak = 0.0f;
    for (float s : samples) {
        if (!std::isfinite(s))
            throw AudioJobError(ErrorKind::ProcessingError, "Processing produced a non-finite sample");
        peak = std::max(peak, std::fabs(s));
    }
    return peak;
}

} // namespace

float peakAmplitude(const std::vector<float>& samples)
{
    float peak = 0.0f;
    for (float s : samples)
        peak = std::max(peak, std::fabs(s));
    return peak;
}

float normalizePeakInPlace(std::vector<float>& samples)
{
    const float peak = checkedPeak(samples);
    if (peak <= 1.0f || peak <= kSilencePeakThreshold)
        return 1.0f;

    const float gain = 1.0f / peak;
    for (auto& s : samples)
        s = std::clamp(s * gain, -1.0f, 1.0f);
    return gain;
}

AudioBuffer normalizePeak(std::vector<std::vector<float>> channels, uint32_t sampleRate)
{
    float peak = 0.0f;
    for (const auto& ch : channels)
        peak = std::max(peak, checkedPeak(ch));

    if (peak > 1.0f) {
        const float gain = 1.0f / peak;
        for (auto& ch : channels)
            for (auto& s : ch)
                s = std::clamp(s * gain, -1.0f, 1.0f);
    }
    return AudioBuffer(std::move(channels), sampleRate);
}

} // namespace lionsfx::dsp
