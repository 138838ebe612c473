#include <format>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

constexpr const char* kServiceName = "Lions Flute Audio FX";

std::string describeBuffer(const AudioBuffer& buffer)
{
    return std::format("<buffer {} ch, {:.2f} s>", buffer.numChannels(), buffer.durationSeconds());
}

} // namespace

// Either an in-memory buffer or a file that is decoded once the task runs.
struct AudioJobService::InputSource {
    std::optional<AudioBuffer> buffer{};
    std::filesystem::path file{};

    AudioBuffer take(AudioCodec& codec) {
        if (buffer) {
            AudioBuffer taken = std::move(*buffer);
            buffer.reset();
            return taken;
        }
        return codec.decode(file);
    }
};

AudioJobService::AudioJobService(ServiceConfiguration configuration,
                                 std::unique_ptr<AudioCodec> codec,
                                 std::unique_ptr<TaskEngine> engine)
    : configuration_(std::move(configuration)), codec_(std::move(codec)), engine_(std::move(engine))
{
    configuration_.validate();
    if (!codec_ || !engine_)
        throw AudioJobError(ErrorKind::InvalidParameter, "AudioJobService needs a codec and a task engine");
}

AudioJobService::AudioJobService(ServiceConfiguration configuration)
    : AudioJobService(configuration,
                      AudioCodec::create(configuration.sampleFormat()),
                      TaskEngine::create(configuration.engineOptions()))
{
}

AudioJobService::~AudioJobService()
{
    // work units hold a pointer to the codec, so no worker may outlive it
    engine_->shutdown();
}

std::filesystem::path AudioJobService::outputPath(const std::string& stem) const
{
    return configuration_.outputDirectory / std::format("{}.{}", stem, configuration_.outputFormat);
}

SubmitResult AudioJobService::submitSeparation(AudioBuffer buffer, std::string baseName)
{
    auto description = std::format("split {}", describeBuffer(buffer));
    return submitSeparationTask(InputSource{std::move(buffer), {}}, std::move(baseName), std::move(description));
}

SubmitResult AudioJobService::submitEffect(AudioBuffer buffer, std::string_view effectName, int intensity, std::string baseName)
{
    auto description = std::format("{}@{} {}", effectName, intensity, describeBuffer(buffer));
    return submitEffectTask(InputSource{std::move(buffer), {}}, std::string{effectName}, intensity,
                            std::move(baseName), std::move(description));
}

SubmitResult AudioJobService::submitEffect(AudioBuffer buffer, EffectType type, int intensity, std::string baseName)
{
    return submitEffect(std::move(buffer), std::string_view{lionsfx::effectName(type)}, intensity, std::move(baseName));
}

SubmitResult AudioJobService::submitSeparationFromFile(const std::filesystem::path& input)
{
    return submitSeparationTask(InputSource{std::nullopt, input}, input.stem().string(),
                                std::format("split {}", input.filename().string()));
}

SubmitResult AudioJobService::submitEffectFromFile(const std::filesystem::path& input, std::string_view effectName, int intensity)
{
    return submitEffectTask(InputSource{std::nullopt, input}, std::string{effectName}, intensity, input.stem().string(),
                            std::format("{}@{} {}", effectName, intensity, input.filename().string()));
}

SubmitResult AudioJobService::submitSeparationTask(InputSource source, std::string baseName, std::string description)
{
    auto work = [this, source = std::move(source), baseName = std::move(baseName)](TaskContext& context) mutable -> TaskResult {
        const auto input = source.take(*codec_);
        const auto base = baseName.empty() ? context.id() : baseName;

        HarmonicPercussiveSeparator separator(configuration_.separation);
        const auto output = separator.separate(input, context.progressCallback());

        context.reportProgress(90);
        const auto vocalPath = outputPath(base + "_vocals");
        const auto instrumentalPath = outputPath(base + "_instruments");
        codec_->encode(output.vocals, vocalPath);
        codec_->encode(output.instrumental, instrumentalPath);
        return SeparationResult{vocalPath.string(), instrumentalPath.string()};
    };
    return engine_->submit(TaskKind::Separate, std::move(description), std::move(work));
}

SubmitResult AudioJobService::submitEffectTask(InputSource source, std::string effectName, int intensity,
                                               std::string baseName, std::string description)
{
    auto work = [this, source = std::move(source), effectName = std::move(effectName), intensity,
                 baseName = std::move(baseName)](TaskContext& context) mutable -> TaskResult {
        // the name is checked before decoding, so an unknown effect fails fast
        const auto config = EffectConfig::make(effectName, intensity);
        const auto input = source.take(*codec_);
        const auto base = baseName.empty() ? context.id() : baseName;

        EffectsEngine effects;
        const auto output = effects.apply(input, config.type, config.intensity, context.progressCallback());

        context.reportProgress(90);
        const auto path = outputPath(std::format("{}_{}_{}", base, lionsfx::effectName(config.type), config.intensity));
        codec_->encode(output, path);
        return EffectResult{path.string()};
    };
    return engine_->submit(TaskKind::ApplyEffect, std::move(description), std::move(work));
}

std::optional<TaskSnapshot> AudioJobService::pollStatus(const std::string& taskId)
{
    return engine_->getStatus(taskId);
}

AudioFileInfo AudioJobService::inspectAudioFile(const std::filesystem::path& path)
{
    return codec_->inspect(path);
}

ServiceStatus AudioJobService::serviceStatus()
{
    ServiceStatus status;
    status.name = kServiceName;
    status.version = LIONSFX_VERSION;
    status.supportedInputFormats = readableAudioFileExtensions();
    for (auto type : kAllEffectTypes)
        status.supportedEffects.emplace_back(lionsfx::effectName(type));
    status.outputFormat = configuration_.outputFormat;
    status.engine = engine_->statistics();
    return status;
}

} // namespace lionsfx
