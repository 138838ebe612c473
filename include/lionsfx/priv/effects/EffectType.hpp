#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace lionsfx {

    enum class EffectType {
        Reverb,
        Echo,
        Chorus,
        Distortion,
        Compressor,
        Equalizer,
        Delay
    };

    inline constexpr std::array<EffectType, 7> kAllEffectTypes{
        EffectType::Reverb,
        EffectType::Echo,
        EffectType::Chorus,
        EffectType::Distortion,
        EffectType::Compressor,
        EffectType::Equalizer,
        EffectType::Delay
    };

    // Lower-case identifier, e.g. "reverb".
    const char* effectName(EffectType type);

    // Case-insensitive lookup of an identifier returned by effectName().
    std::optional<EffectType> parseEffectType(std::string_view name);

    inline constexpr int kMinIntensity = 0;
    inline constexpr int kMaxIntensity = 100;

    struct EffectConfig {
        EffectType type{EffectType::Reverb};
        int intensity{50};

        // Clamps the intensity into [0, 100].
        static EffectConfig make(EffectType type, int intensity);
        // Throws AudioJobError(InvalidParameter) for an unknown name.
        static EffectConfig make(std::string_view name, int intensity);
    };

}
