#pragma once

#include <memory>
#include <string>
#include <vector>
#include "AudioBuffer.hpp"
#include "AudioFileReader.hpp"

namespace lionsfx {

    enum class SampleFormat {
        Int16,
        Int24,
        Float32
    };

    // Create an AudioFileReader for the given file path.
    // Returns nullptr if the format is unsupported or cannot be opened.
    std::unique_ptr<AudioFileReader> createAudioFileReaderFromPath(const std::string& filepath);

    // Writes the whole buffer to `filepath`. The container (wav or flac) is chosen from the extension.
    // FLAC has no float encoding, Float32 is written as 24-bit there.
    // Returns false if the file cannot be created or the extension is not writable.
    bool writeAudioFileToPath(const std::string& filepath, const AudioBuffer& buffer, SampleFormat sampleFormat);

    // Lower-case file extensions (without dot) that can be decoded / encoded.
    std::vector<std::string> readableAudioFileExtensions();
    std::vector<std::string> writableAudioFileExtensions();

}
