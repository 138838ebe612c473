#include <cmath>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

int roundToInt(double v)
{
    return static_cast<int>(std::lround(v));
}

} // namespace

EffectParameters EffectParameters::fromIntensity(EffectType type, int intensity)
{
    const auto config = EffectConfig::make(type, intensity);
    const double t = static_cast<double>(config.intensity) / 100.0;
    const auto tf = static_cast<float>(t);

    EffectParameters p;
    p.type = config.type;
    p.intensity = config.intensity;

    switch (config.type) {
        case EffectType::Reverb:
            p.values = ReverbParameters{.decaySeconds = 0.1 + 1.9 * t, .damping = 0.5f, .wet = 0.5f * tf};
            break;
        case EffectType::Echo:
            p.values = EchoParameters{.delaySeconds = 0.2 + 0.5 * t, .feedback = 0.5f, .repeats = 1 + roundToInt(3.0 * t), .wet = 0.6f * tf};
            break;
        case EffectType::Chorus:
            p.values = ChorusParameters{.rateHz = 1.0 + 2.0 * t,
                                        .depthSeconds = 0.002 + 0.004 * t,
                                        .baseDelaySeconds = 0.015,
                                        .voices = 1 + roundToInt(2.0 * t),
                                        .wet = 0.7f * tf};
            break;
        case EffectType::Distortion:
            p.values = DistortionParameters{.drive = 1.0f + 4.0f * tf, .wet = tf};
            break;
        case EffectType::Compressor:
            p.values = CompressorParameters{.threshold = 0.8f - 0.5f * tf, .ratio = 2.0f + 6.0f * tf, .wet = tf};
            break;
        case EffectType::Equalizer:
            p.values = EqualizerParameters{.lowCrossoverHz = 300.0,
                                           .highCrossoverHz = 3000.0,
                                           .lowGain = 0.5f + tf,
                                           .midGain = 1.0f + (tf - 0.5f) * 0.5f,
                                           .highGain = 0.7f + 0.6f * tf,
                                           .wet = tf};
            break;
        case EffectType::Delay:
            p.values = DelayParameters{.delaySeconds = 0.5 + 1.0 * t, .feedback = 0.3f + 0.4f * tf, .wet = 0.5f * tf};
            break;
    }
    return p;
}

float EffectParameters::wet() const
{
    return std::visit([](const auto& v) { return v.wet; }, values);
}

} // namespace lionsfx
