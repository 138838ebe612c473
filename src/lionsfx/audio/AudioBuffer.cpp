#include <algorithm>
#include <cmath>
#include <format>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

AudioBuffer::AudioBuffer(std::vector<std::vector<float>> channels, uint32_t sampleRate)
    : channels_(std::move(channels)), sample_rate_(sampleRate)
{
    if (sample_rate_ == 0)
        throw AudioJobError(ErrorKind::InvalidParameter, "Sample rate must be positive");

    if (channels_.empty())
        return;

    const size_t frames = channels_.front().size();
    for (size_t ch = 1; ch < channels_.size(); ++ch) {
        if (channels_[ch].size() != frames) {
            throw AudioJobError(ErrorKind::InvalidParameter,
                                std::format("Channel {} has {} frames, expected {}", ch, channels_[ch].size(), frames));
        }
    }
}

AudioBuffer AudioBuffer::silence(uint32_t numChannels, uint64_t numFrames, uint32_t sampleRate)
{
    return AudioBuffer(std::vector<std::vector<float>>(numChannels, std::vector<float>(numFrames, 0.0f)), sampleRate);
}

double AudioBuffer::durationSeconds() const
{
    if (sample_rate_ == 0)
        return 0.0;
    return static_cast<double>(numFrames()) / static_cast<double>(sample_rate_);
}

float AudioBuffer::peakAmplitude() const
{
    float peak = 0.0f;
    for (const auto& ch : channels_)
        for (float s : ch)
            peak = std::max(peak, std::fabs(s));
    return peak;
}

std::vector<float> AudioBuffer::downmixToMono() const
{
    if (channels_.empty())
        return {};
    if (channels_.size() == 1)
        return channels_.front();

    const size_t frameCount = channels_.front().size();
    std::vector<float> mono(frameCount, 0.0f);
    for (const auto& ch : channels_)
        for (size_t i = 0; i < frameCount; ++i)
            mono[i] += ch[i];

    const float scale = 1.0f / static_cast<float>(channels_.size());
    for (auto& s : mono)
        s *= scale;
    return mono;
}

} // namespace lionsfx
