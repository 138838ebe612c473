#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../audio/AudioCodec.hpp"
#include "../effects/EffectType.hpp"
#include "../tasks/TaskEngine.hpp"
#include "ServiceConfiguration.hpp"

namespace lionsfx {

    struct ServiceStatus {
        std::string name{};
        std::string version{};
        std::vector<std::string> supportedInputFormats{};
        std::vector<std::string> supportedEffects{};
        std::string outputFormat{};
        TaskEngineStatistics engine{};
    };

    // Entry point for a front end (HTTP layer, CLI): turns a buffer or a file plus a job
    // description into a task, and exposes the task state for polling.
    //
    // Separation writes <base>_vocals.<ext> and <base>_instruments.<ext>, effects write
    // <base>_<effect>_<intensity>.<ext>, all into the configured output directory.
    // The base name defaults to the task id for buffers and to the file stem for files.
    class AudioJobService {
        ServiceConfiguration configuration_;
        std::unique_ptr<AudioCodec> codec_;
        std::unique_ptr<TaskEngine> engine_;

    public:
        // Throws AudioJobError(InvalidParameter) for an invalid configuration.
        AudioJobService(ServiceConfiguration configuration,
                        std::unique_ptr<AudioCodec> codec,
                        std::unique_ptr<TaskEngine> engine);
        // Uses the choc codec and a task engine built from the configuration.
        explicit AudioJobService(ServiceConfiguration configuration);
        ~AudioJobService();

        AudioJobService(const AudioJobService&) = delete;
        AudioJobService& operator=(const AudioJobService&) = delete;

        SubmitResult submitSeparation(AudioBuffer buffer, std::string baseName = "");
        // An unknown effect name yields a task that fails with InvalidParameter.
        SubmitResult submitEffect(AudioBuffer buffer, std::string_view effectName, int intensity, std::string baseName = "");
        SubmitResult submitEffect(AudioBuffer buffer, EffectType type, int intensity, std::string baseName = "");

        // The file is decoded inside the task, so decode failures show up as a Failed task.
        SubmitResult submitSeparationFromFile(const std::filesystem::path& input);
        SubmitResult submitEffectFromFile(const std::filesystem::path& input, std::string_view effectName, int intensity);

        // std::nullopt means NotFound: the id is unknown or the task has expired.
        std::optional<TaskSnapshot> pollStatus(const std::string& taskId);

        // Throws AudioJobError(DecodeError).
        AudioFileInfo inspectAudioFile(const std::filesystem::path& path);

        ServiceStatus serviceStatus();

        const ServiceConfiguration& configuration() const { return configuration_; }
        TaskEngine& engine() { return *engine_; }

    private:
        struct InputSource;

        SubmitResult submitSeparationTask(InputSource source, std::string baseName, std::string description);
        SubmitResult submitEffectTask(InputSource source, std::string effectName, int intensity,
                                      std::string baseName, std::string description);
        std::filesystem::path outputPath(const std::string& stem) const;
    };

}
