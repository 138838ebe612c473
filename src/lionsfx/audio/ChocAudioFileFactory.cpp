#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include "lionsfx/lionsfx.hpp"

#include <choc/audio/choc_AudioFileFormat_WAV.h>
#include <choc/audio/choc_AudioFileFormat_FLAC.h>
#include <choc/audio/choc_AudioFileFormat_Ogg.h>
#include <choc/audio/choc_SampleBuffers.h>

namespace lionsfx {

    namespace {
        constexpr uint32_t kWriteBlockFrames = 8192;

        std::string lowerCaseExtension(const std::string& filepath) {
            std::string ext;
            auto dot = filepath.find_last_of('.');
            auto slash = filepath.find_last_of("/\\");
            if (dot != std::string::npos && (slash == std::string::npos || dot > slash))
                ext = filepath.substr(dot + 1);
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
            return ext;
        }

        class ChocAudioFileReaderAdapter : public AudioFileReader {
        public:
            ChocAudioFileReaderAdapter(std::unique_ptr<choc::audio::AudioFileReader>&& reader, std::string formatName)
                : impl_(std::move(reader)), format_name_(std::move(formatName)) {}

            Properties getProperties() const override {
                const auto& p = impl_->getProperties();
                return Properties{ p.numFrames, p.numChannels, static_cast<uint32_t>(p.sampleRate), format_name_ };
            }

            bool readFrames(uint64_t startFrame,
                            uint64_t framesToRead,
                            float* const* dest,
                            uint32_t numChannels) override {
                choc::buffer::ChannelArrayBuffer<float> temp(numChannels, static_cast<choc::buffer::FrameCount>(framesToRead));
                if (!impl_->readFrames(startFrame, temp.getView()))
                    return false;
                for (uint32_t ch = 0; ch < numChannels; ++ch) {
                    float* out = dest[ch];
                    for (uint64_t i = 0; i < framesToRead; ++i)
                        out[i] = temp.getSample(ch, static_cast<choc::buffer::FrameCount>(i));
                }
                return true;
            }

        private:
            std::unique_ptr<choc::audio::AudioFileReader> impl_;
            std::string format_name_;
        };

        choc::audio::BitDepth toChocBitDepth(SampleFormat format, bool floatSupported) {
            switch (format) {
                case SampleFormat::Int16: return choc::audio::BitDepth::int16;
                case SampleFormat::Int24: return choc::audio::BitDepth::int24;
                case SampleFormat::Float32:
                    return floatSupported ? choc::audio::BitDepth::float32 : choc::audio::BitDepth::int24;
            }
            return choc::audio::BitDepth::int16;
        }

        template <typename Format>
        bool writeWithFormat(Format format, const std::string& filepath, const AudioBuffer& buffer, choc::audio::BitDepth bitDepth) {
            choc::audio::AudioFileProperties props;
            props.sampleRate = static_cast<double>(buffer.sampleRate());
            props.numChannels = buffer.numChannels();
            props.numFrames = buffer.numFrames();
            props.bitDepth = bitDepth;

            auto writer = format.createWriter(filepath, props);
            if (!writer)
                return false;

            const uint32_t numChannels = buffer.numChannels();
            const uint64_t totalFrames = buffer.numFrames();
            std::vector<const float*> channelPtrs(numChannels, nullptr);
            uint64_t written = 0;

            while (written < totalFrames) {
                const uint32_t blockFrames = static_cast<uint32_t>(std::min<uint64_t>(totalFrames - written, kWriteBlockFrames));
                for (uint32_t ch = 0; ch < numChannels; ++ch)
                    channelPtrs[ch] = buffer.channel(ch).data() + written;
                auto view = choc::buffer::createChannelArrayView(channelPtrs.data(), numChannels, blockFrames);
                if (!writer->appendFrames(view))
                    return false;
                written += blockFrames;
            }

            return writer->flush();
        }
    }

    std::unique_ptr<AudioFileReader> createAudioFileReaderFromPath(const std::string& filepath) {
        auto createReaderForTarget = [&](auto format) -> std::unique_ptr<choc::audio::AudioFileReader> {
            return format.createReader(filepath);
        };

        const std::string ext = lowerCaseExtension(filepath);

        std::unique_ptr<choc::audio::AudioFileReader> reader;
        std::string formatName;

        if (ext == "wav") {
            reader = createReaderForTarget(choc::audio::WAVAudioFileFormat<false>());
            formatName = "wav";
        } else if (ext == "flac") {
            reader = createReaderForTarget(choc::audio::FLACAudioFileFormat<false>());
            formatName = "flac";
        } else if (ext == "ogg") {
            reader = createReaderForTarget(choc::audio::OggAudioFileFormat<false>());
            formatName = "ogg";
        } else {
            // Try all formats as fallback
            reader = createReaderForTarget(choc::audio::WAVAudioFileFormat<false>());
            formatName = "wav";
            if (!reader) {
                reader = createReaderForTarget(choc::audio::FLACAudioFileFormat<false>());
                formatName = "flac";
            }
            if (!reader) {
                reader = createReaderForTarget(choc::audio::OggAudioFileFormat<false>());
                formatName = "ogg";
            }
        }

        if (!reader)
            return nullptr;
        return std::make_unique<ChocAudioFileReaderAdapter>(std::move(reader), formatName);
    }

    bool writeAudioFileToPath(const std::string& filepath, const AudioBuffer& buffer, SampleFormat sampleFormat) {
        if (buffer.numChannels() == 0)
            return false;

        const std::string ext = lowerCaseExtension(filepath);
        if (ext == "wav")
            return writeWithFormat(choc::audio::WAVAudioFileFormat<true>(), filepath, buffer, toChocBitDepth(sampleFormat, true));
        if (ext == "flac")
            return writeWithFormat(choc::audio::FLACAudioFileFormat<true>(), filepath, buffer, toChocBitDepth(sampleFormat, false));
        return false;
    }

    std::vector<std::string> readableAudioFileExtensions() {
        return {"wav", "flac", "ogg"};
    }

    std::vector<std::string> writableAudioFileExtensions() {
        return {"flac", "wav"};
    }

}
