#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <numbers>
#include <random>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

// Fixed so that the same request always renders the same output.
constexpr uint32_t kReverbNoiseSeed = 0x4c696f6e;

void report(const ProgressCallback& progress, int percent)
{
    if (progress)
        progress(percent);
}

size_t secondsToSamples(double seconds, uint32_t sampleRate)
{
    return static_cast<size_t>(std::lround(std::max(0.0, seconds) * static_cast<double>(sampleRate)));
}

// (1 - wet) * dry + wet * processed, in place on `processed`.
void mixInto(const std::vector<float>& dry, std::vector<float>& processed, float wet)
{
    for (size_t i = 0; i < processed.size(); ++i)
        processed[i] = (1.0f - wet) * dry[i] + wet * processed[i];
}

// Linear interpolation at a fractional position; positions before the start read silence.
float readFractional(const std::vector<float>& x, double position)
{
    if (position < 0.0)
        return 0.0f;
    const auto index = static_cast<size_t>(position);
    if (index >= x.size())
        return 0.0f;
    const auto frac = static_cast<float>(position - static_cast<double>(index));
    const float next = index + 1 < x.size() ? x[index + 1] : 0.0f;
    return x[index] + frac * (next - x[index]);
}

// Exponentially decaying gaussian noise, scaled to unit energy.
std::vector<float> makeReverbImpulse(const ReverbParameters& p, uint32_t sampleRate)
{
    const size_t length = std::max<size_t>(1, secondsToSamples(p.decaySeconds, sampleRate));
    const double tau = std::max(1.0, static_cast<double>(length) * static_cast<double>(p.damping));

    std::mt19937 rng(kReverbNoiseSeed);
    std::normal_distribution<float> noise(0.0f, 1.0f);

    std::vector<float> impulse(length);
    double energy = 0.0;
    for (size_t i = 0; i < length; ++i) {
        impulse[i] = noise(rng) * static_cast<float>(std::exp(-static_cast<double>(i) / tau));
        energy += static_cast<double>(impulse[i]) * impulse[i];
    }
    if (energy > 0.0) {
        const auto scale = static_cast<float>(1.0 / std::sqrt(energy));
        for (auto& s : impulse)
            s *= scale;
    }
    return impulse;
}

std::vector<float> reverb(const std::vector<float>& x, const std::vector<float>& impulse, const ReverbParameters& p)
{
    auto wet = dsp::convolve(x, impulse);
    mixInto(x, wet, p.wet);
    return wet;
}

std::vector<float> echo(const std::vector<float>& x, const EchoParameters& p, uint32_t sampleRate)
{
    const size_t delay = std::max<size_t>(1, secondsToSamples(p.delaySeconds, sampleRate));
    std::vector<float> out(x);
    float gain = 1.0f;
    for (int r = 1; r <= p.repeats; ++r) {
        gain *= p.feedback;
        const size_t offset = delay * static_cast<size_t>(r);
        if (offset >= x.size())
            break;
        for (size_t i = offset; i < x.size(); ++i)
            out[i] += p.wet * gain * x[i - offset];
    }
    return out;
}

std::vector<float> chorus(const std::vector<float>& x, const ChorusParameters& p, uint32_t sampleRate)
{
    const double sr = static_cast<double>(sampleRate);
    const double baseDelay = p.baseDelaySeconds * sr;
    const double depth = p.depthSeconds * sr;
    const double phaseIncrement = 2.0 * std::numbers::pi * p.rateHz / sr;
    const int voices = std::max(1, p.voices);

    // The LFO depends only on the sample index, so every channel sees the same modulation.
    std::vector<float> out(x.size(), 0.0f);
    for (int v = 0; v < voices; ++v) {
        const double voicePhase = 2.0 * std::numbers::pi * static_cast<double>(v) / static_cast<double>(voices);
        for (size_t i = 0; i < x.size(); ++i) {
            const double lfo = 0.5 * (1.0 + std::sin(phaseIncrement * static_cast<double>(i) + voicePhase));
            out[i] += readFractional(x, static_cast<double>(i) - (baseDelay + depth * lfo));
        }
    }
    const float voiceScale = 1.0f / static_cast<float>(voices);
    for (auto& s : out)
        s *= voiceScale;
    mixInto(x, out, p.wet);
    return out;
}

std::vector<float> distortion(const std::vector<float>& x, const DistortionParameters& p)
{
    std::vector<float> out(x.size());
    for (size_t i = 0; i < x.size(); ++i)
        out[i] = std::tanh(p.drive * x[i]);
    mixInto(x, out, p.wet);
    return out;
}

std::vector<float> compressor(const std::vector<float>& x, const CompressorParameters& p)
{
    std::vector<float> out(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        const float magnitude = std::fabs(x[i]);
        out[i] = magnitude > p.threshold
            ? std::copysign(p.threshold + (magnitude - p.threshold) / p.ratio, x[i])
            : x[i];
    }
    mixInto(x, out, p.wet);
    return out;
}

std::vector<float> equalizer(const std::vector<float>& x, const EqualizerParameters& p, uint32_t sampleRate)
{
    const double sr = static_cast<double>(sampleRate);
    const auto low = dsp::filterForwardBackward(x, dsp::FilterCascade::butterworthLowPass4(p.lowCrossoverHz, sr));
    auto midBand = dsp::FilterCascade::butterworthHighPass4(p.lowCrossoverHz, sr);
    midBand.append(dsp::FilterCascade::butterworthLowPass4(p.highCrossoverHz, sr));
    const auto mid = dsp::filterForwardBackward(x, midBand);
    const auto high = dsp::filterForwardBackward(x, dsp::FilterCascade::butterworthHighPass4(p.highCrossoverHz, sr));

    std::vector<float> out(x.size());
    for (size_t i = 0; i < x.size(); ++i)
        out[i] = p.lowGain * low[i] + p.midGain * mid[i] + p.highGain * high[i];
    mixInto(x, out, p.wet);
    return out;
}

std::vector<float> delay(const std::vector<float>& x, const DelayParameters& p, uint32_t sampleRate)
{
    const size_t offset = std::max<size_t>(1, secondsToSamples(p.delaySeconds, sampleRate));
    std::vector<float> out(x);
    for (size_t i = offset; i < x.size(); ++i)
        out[i] += p.wet * p.feedback * x[i - offset];
    return out;
}

} // namespace

AudioBuffer EffectsEngine::apply(const AudioBuffer& input, EffectType type, int intensity, const ProgressCallback& progress) const
{
    return apply(input, EffectParameters::fromIntensity(type, intensity), progress);
}

AudioBuffer EffectsEngine::apply(const AudioBuffer& input, std::string_view effectName, int intensity, const ProgressCallback& progress) const
{
    const auto config = EffectConfig::make(effectName, intensity);
    return apply(input, config.type, config.intensity, progress);
}

AudioBuffer EffectsEngine::apply(const AudioBuffer& input, const EffectParameters& parameters, const ProgressCallback& progress) const
{
    if (input.empty())
        throw AudioJobError(ErrorKind::InvalidParameter, "Cannot apply an effect to an empty audio buffer");

    const auto started = std::chrono::steady_clock::now();
    const uint32_t sampleRate = input.sampleRate();
    const uint32_t numChannels = input.numChannels();

    std::vector<float> reverbImpulse;
    if (parameters.type == EffectType::Reverb && parameters.wet() > 0.0f)
        reverbImpulse = makeReverbImpulse(std::get<ReverbParameters>(parameters.values), sampleRate);
    report(progress, 10);

    std::vector<std::vector<float>> channels;
    channels.reserve(numChannels);
    for (uint32_t ch = 0; ch < numChannels; ++ch) {
        const auto& x = input.channel(ch);
        if (parameters.wet() <= 0.0f) {
            channels.push_back(x);
        } else {
            switch (parameters.type) {
                case EffectType::Reverb:
                    channels.push_back(reverb(x, reverbImpulse, std::get<ReverbParameters>(parameters.values)));
                    break;
                case EffectType::Echo:
                    channels.push_back(echo(x, std::get<EchoParameters>(parameters.values), sampleRate));
                    break;
                case EffectType::Chorus:
                    channels.push_back(chorus(x, std::get<ChorusParameters>(parameters.values), sampleRate));
                    break;
                case EffectType::Distortion:
                    channels.push_back(distortion(x, std::get<DistortionParameters>(parameters.values)));
                    break;
                case EffectType::Compressor:
                    channels.push_back(compressor(x, std::get<CompressorParameters>(parameters.values)));
                    break;
                case EffectType::Equalizer:
                    channels.push_back(equalizer(x, std::get<EqualizerParameters>(parameters.values), sampleRate));
                    break;
                case EffectType::Delay:
                    channels.push_back(delay(x, std::get<DelayParameters>(parameters.values), sampleRate));
                    break;
            }
        }
        report(progress, 10 + static_cast<int>(60 * (ch + 1) / numChannels));
    }

    auto output = dsp::normalizePeak(std::move(channels), sampleRate);
    report(progress, 80);

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    Logger::global()->logDiagnostic("Effect %s@%d on %u ch x %llu frames finished in %lld ms",
                                    effectName(parameters.type), parameters.intensity, numChannels,
                                    static_cast<unsigned long long>(input.numFrames()), static_cast<long long>(elapsedMs));
    return output;
}

} // namespace lionsfx
