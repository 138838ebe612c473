#pragma once

#include <cstdint>
#include <string>

namespace lionsfx {

    // Minimal audio file reader interface to avoid exposing third-party headers
    class AudioFileReader {
    public:
        struct Properties {
            uint64_t numFrames{};
            uint32_t numChannels{};
            uint32_t sampleRate{};
            std::string formatName{};
        };

        virtual ~AudioFileReader() = default;

        // Query file properties (number of frames/channels, sample rate and container format).
        virtual Properties getProperties() const = 0;

        // Read 'framesToRead' frames starting at 'startFrame' into planar buffers.
        // 'dest' is an array of channel pointers with at least 'numChannels' entries.
        // Returns false if the underlying decoder could not deliver the frames.
        virtual bool readFrames(uint64_t startFrame,
                                uint64_t framesToRead,
                                float* const* dest,
                                uint32_t numChannels) = 0;
    };

}
