#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "../audio/AudioFileFactory.hpp"
#include "../separation/HarmonicPercussiveSeparator.hpp"
#include "../tasks/TaskEngine.hpp"

namespace lionsfx {

    // Settings of an AudioJobService. Every field has a usable default; a JSON file only
    // needs to list what it overrides. Unknown keys are ignored.
    struct ServiceConfiguration {
        std::filesystem::path outputDirectory{"processed"};
        // "flac" or "wav"
        std::string outputFormat{"flac"};
        // 16, 24, or 32 (float, WAV only; FLAC falls back to 24)
        int outputBitDepth{24};
        size_t workerCount{0};
        // 0: no admission limit
        size_t maxPendingTasks{0};
        int64_t retentionSeconds{3600};
        int64_t sweepIntervalSeconds{60};
        SeparationSettings separation{};

        // Throws AudioJobError(InvalidParameter) describing the first offending field.
        void validate() const;

        TaskEngineOptions engineOptions() const;
        SampleFormat sampleFormat() const;

        // Throws AudioJobError(InvalidParameter) for malformed JSON or wrongly typed values.
        static ServiceConfiguration fromJson(std::string_view json);
        static ServiceConfiguration load(const std::filesystem::path& path);

        std::string toJson() const;
        void save(const std::filesystem::path& path) const;
    };

}
