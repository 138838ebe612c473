#pragma once

#include <variant>

#include "EffectType.hpp"

namespace lionsfx {

struct ReverbParameters {
    // length of the impulse response
    double decaySeconds{1.0};
    // fraction of the impulse response length over which it decays by 1/e
    float damping{0.5f};
    float wet{0.25f};
};

struct EchoParameters {
    double delaySeconds{0.45};
    float feedback{0.5f};
    int repeats{2};
    float wet{0.3f};
};

struct ChorusParameters {
    double rateHz{2.0};
    double depthSeconds{0.004};
    double baseDelaySeconds{0.015};
    int voices{2};
    float wet{0.35f};
};

struct DistortionParameters {
    float drive{3.0f};
    float wet{0.5f};
};

struct CompressorParameters {
    float threshold{0.55f};
    float ratio{5.0f};
    float wet{0.5f};
};

struct EqualizerParameters {
    double lowCrossoverHz{300.0};
    double highCrossoverHz{3000.0};
    float lowGain{1.0f};
    float midGain{1.0f};
    float highGain{1.0f};
    float wet{0.5f};
};

struct DelayParameters {
    double delaySeconds{1.0};
    float feedback{0.5f};
    float wet{0.25f};
};

// Internal parameters of one effect, derived from the 0-100 intensity knob.
struct EffectParameters {
    using Values = std::variant<ReverbParameters,
                                EchoParameters,
                                ChorusParameters,
                                DistortionParameters,
                                CompressorParameters,
                                EqualizerParameters,
                                DelayParameters>;

    EffectType type{EffectType::Reverb};
    int intensity{0};
    Values values{};

    // intensity is clamped into [0, 100] first.
    static EffectParameters fromIntensity(EffectType type, int intensity);

    float wet() const;
};

}
