#include <algorithm>
#include <format>
#include <limits>
#include <system_error>
#include <vector>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

constexpr uint64_t kReadBlockFrames = 65536;

std::unique_ptr<AudioFileReader> openReader(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
        throw AudioJobError(ErrorKind::DecodeError, std::format("Audio file not found: {}", path.string()));

    auto reader = createAudioFileReaderFromPath(path.string());
    if (!reader)
        throw AudioJobError(ErrorKind::DecodeError, std::format("Unsupported audio format: {}", path.filename().string()));
    return reader;
}

class ChocAudioCodec : public AudioCodec {
    SampleFormat output_sample_format_;

public:
    explicit ChocAudioCodec(SampleFormat outputSampleFormat)
        : output_sample_format_(outputSampleFormat) {}

    AudioBuffer decode(const std::filesystem::path& path) override {
        auto reader = openReader(path);
        const auto props = reader->getProperties();
        if (props.numChannels == 0 || props.sampleRate == 0)
            throw AudioJobError(ErrorKind::DecodeError, std::format("Audio file has no usable stream: {}", path.filename().string()));
        if (props.numFrames > static_cast<uint64_t>(std::numeric_limits<int32_t>::max()))
            throw AudioJobError(ErrorKind::DecodeError, "Audio file is too long");

        std::vector<std::vector<float>> channelData(props.numChannels, std::vector<float>(props.numFrames, 0.0f));
        std::vector<float*> destPtrs(props.numChannels, nullptr);

        uint64_t position = 0;
        while (position < props.numFrames) {
            const uint64_t block = std::min(kReadBlockFrames, props.numFrames - position);
            for (uint32_t ch = 0; ch < props.numChannels; ++ch)
                destPtrs[ch] = channelData[ch].data() + position;
            if (!reader->readFrames(position, block, destPtrs.data(), props.numChannels))
                throw AudioJobError(ErrorKind::DecodeError,
                                    std::format("Failed to read frames {}-{} of {}", position, position + block, path.filename().string()));
            position += block;
        }

        Logger::global()->logDiagnostic("Decoded %s: %s, %u ch, %u Hz, %llu frames",
                                        path.filename().string().c_str(), props.formatName.c_str(),
                                        props.numChannels, props.sampleRate,
                                        static_cast<unsigned long long>(props.numFrames));
        return AudioBuffer(std::move(channelData), props.sampleRate);
    }

    void encode(const AudioBuffer& buffer, const std::filesystem::path& destination) override {
        if (buffer.numChannels() == 0)
            throw AudioJobError(ErrorKind::EncodeError, "Cannot encode a buffer without channels");

        if (!destination.parent_path().empty()) {
            std::error_code ec;
            std::filesystem::create_directories(destination.parent_path(), ec);
            if (ec)
                throw AudioJobError(ErrorKind::EncodeError, std::format("Cannot create output directory: {}", ec.message()));
        }

        if (!writeAudioFileToPath(destination.string(), buffer, output_sample_format_)) {
            std::error_code removeEc;
            std::filesystem::remove(destination, removeEc);
            throw AudioJobError(ErrorKind::EncodeError, std::format("Failed to write {}", destination.string()));
        }
    }

    AudioFileInfo inspect(const std::filesystem::path& path) override {
        auto reader = openReader(path);
        const auto props = reader->getProperties();

        AudioFileInfo info;
        info.path = path;
        info.formatName = props.formatName;
        info.sampleRate = props.sampleRate;
        info.numChannels = props.numChannels;
        info.numFrames = props.numFrames;
        info.durationSeconds = props.sampleRate == 0 ? 0.0
            : static_cast<double>(props.numFrames) / static_cast<double>(props.sampleRate);

        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        info.fileSizeBytes = ec ? 0 : static_cast<uint64_t>(size);
        return info;
    }
};

} // namespace

std::unique_ptr<AudioCodec> AudioCodec::create(SampleFormat outputSampleFormat)
{
    return std::make_unique<ChocAudioCodec>(outputSampleFormat);
}

} // namespace lionsfx
