#include <algorithm>
#include <cctype>
#include <format>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

const char* effectName(EffectType type)
{
    switch (type) {
        case EffectType::Reverb: return "reverb";
        case EffectType::Echo: return "echo";
        case EffectType::Chorus: return "chorus";
        case EffectType::Distortion: return "distortion";
        case EffectType::Compressor: return "compressor";
        case EffectType::Equalizer: return "equalizer";
        case EffectType::Delay: return "delay";
    }
    return "";
}

std::optional<EffectType> parseEffectType(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto type : kAllEffectTypes)
        if (lower == effectName(type))
            return type;
    return std::nullopt;
}

EffectConfig EffectConfig::make(EffectType type, int intensity)
{
    return EffectConfig{type, std::clamp(intensity, kMinIntensity, kMaxIntensity)};
}

EffectConfig EffectConfig::make(std::string_view name, int intensity)
{
    auto type = parseEffectType(name);
    if (!type) {
        std::string supported;
        for (auto t : kAllEffectTypes)
            supported += (supported.empty() ? "" : ", ") + std::string{effectName(t)};
        throw AudioJobError(ErrorKind::InvalidParameter,
                            std::format("Unknown effect: {}. Available effects: {}", name, supported));
    }
    return make(*type, intensity);
}

} // namespace lionsfx
