#pragma once

#include <cstdint>
#include <vector>

namespace lionsfx {

    // Immutable planar float audio. All channels have the same number of frames.
    class AudioBuffer {
    public:
        AudioBuffer() = default;
        // Throws AudioJobError(InvalidParameter) for unequal channel lengths or a non-positive sample rate.
        AudioBuffer(std::vector<std::vector<float>> channels, uint32_t sampleRate);

        static AudioBuffer silence(uint32_t numChannels, uint64_t numFrames, uint32_t sampleRate);

        uint32_t sampleRate() const { return sample_rate_; }
        uint32_t numChannels() const { return static_cast<uint32_t>(channels_.size()); }
        uint64_t numFrames() const { return channels_.empty() ? 0 : channels_.front().size(); }
        double durationSeconds() const;
        bool empty() const { return numFrames() == 0; }

        const std::vector<float>& channel(uint32_t index) const { return channels_.at(index); }
        const std::vector<std::vector<float>>& channels() const { return channels_; }

        float peakAmplitude() const;
        // Averages all channels into one.
        std::vector<float> downmixToMono() const;

    private:
        std::vector<std::vector<float>> channels_{};
        uint32_t sample_rate_{0};
    };

}
