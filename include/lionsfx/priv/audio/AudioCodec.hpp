#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "AudioBuffer.hpp"
#include "AudioFileFactory.hpp"

namespace lionsfx {

    struct AudioFileInfo {
        std::filesystem::path path{};
        std::string formatName{};
        uint32_t sampleRate{0};
        uint32_t numChannels{0};
        uint64_t numFrames{0};
        double durationSeconds{0.0};
        uint64_t fileSizeBytes{0};
    };

    // The boundary between the processing core and on-disk audio files.
    // decode() and inspect() throw AudioJobError(DecodeError), encode() throws AudioJobError(EncodeError).
    class AudioCodec {
    protected:
        AudioCodec() = default;

    public:
        virtual ~AudioCodec() = default;

        // Codec backed by choc's WAV / FLAC / Ogg formats.
        static std::unique_ptr<AudioCodec> create(SampleFormat outputSampleFormat = SampleFormat::Int24);

        virtual AudioBuffer decode(const std::filesystem::path& path) = 0;
        virtual void encode(const AudioBuffer& buffer, const std::filesystem::path& destination) = 0;
        virtual AudioFileInfo inspect(const std::filesystem::path& path) = 0;
    };

}
