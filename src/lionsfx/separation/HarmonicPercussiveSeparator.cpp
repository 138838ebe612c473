#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx {

namespace {

constexpr float kMaskEpsilon = 1.0e-10f;

void validate(const SeparationSettings& s)
{
    if (s.harmonicFilterWidth == 0 || s.percussiveFilterWidth == 0)
        throw AudioJobError(ErrorKind::InvalidParameter, "Median filter widths must be positive");
    if (!(s.maskPower > 0.0f))
        throw AudioJobError(ErrorKind::InvalidParameter, "Mask power must be positive");
    if (s.dominanceThreshold < 0.0f || s.dominanceThreshold > 1.0f)
        throw AudioJobError(ErrorKind::InvalidParameter, std::format("Dominance threshold {} is outside [0, 1]", s.dominanceThreshold));
    if (s.subtractionStrength < 0.0f || s.subtractionStrength > 1.0f)
        throw AudioJobError(ErrorKind::InvalidParameter, std::format("Subtraction strength {} is outside [0, 1]", s.subtractionStrength));
    if (s.outOfBandVocalGain < 0.0f || s.outOfBandVocalGain > 1.0f)
        throw AudioJobError(ErrorKind::InvalidParameter, std::format("Out-of-band vocal gain {} is outside [0, 1]", s.outOfBandVocalGain));
    if (s.vocalBandLowHz < 0.0 || s.vocalBandHighHz <= s.vocalBandLowHz)
        throw AudioJobError(ErrorKind::InvalidParameter,
                            std::format("Invalid vocal band {}-{} Hz", s.vocalBandLowHz, s.vocalBandHighHz));
    // frame and hop sizes are validated by the transform itself
    const dsp::ShortTimeFourierTransform probe(s.frameSize, s.hopSize);
    (void) probe;
}

AudioBuffer monoBuffer(std::vector<float>&& samples, uint32_t sampleRate)
{
    std::vector<std::vector<float>> channels;
    channels.push_back(std::move(samples));
    return AudioBuffer(std::move(channels), sampleRate);
}

void report(const ProgressCallback& progress, int percent)
{
    if (progress)
        progress(percent);
}

struct MaskedMagnitudes {
    Eigen::MatrixXf vocals;
    Eigen::MatrixXf instrumental;
};

MaskedMagnitudes applyMasks(const SeparationSettings& s,
                            const Eigen::MatrixXf& magnitude,
                            const Eigen::MatrixXf& harmonic,
                            const Eigen::MatrixXf& percussive,
                            uint32_t sampleRate)
{
    const Eigen::ArrayXXf h = harmonic.array().pow(s.maskPower);
    const Eigen::ArrayXXf p = percussive.array().pow(s.maskPower);
    const Eigen::ArrayXXf ratio = h / (h + p + kMaskEpsilon);

    MaskedMagnitudes out{Eigen::MatrixXf(magnitude.rows(), magnitude.cols()),
                         Eigen::MatrixXf(magnitude.rows(), magnitude.cols())};

    const float a = s.subtractionStrength;
    const double binWidthHz = static_cast<double>(sampleRate) / static_cast<double>(s.frameSize);

    for (Eigen::Index k = 0; k < magnitude.rows(); ++k) {
        const double binHz = static_cast<double>(k) * binWidthHz;
        const bool inVocalBand = binHz >= s.vocalBandLowHz && binHz <= s.vocalBandHighHz;

        for (Eigen::Index t = 0; t < magnitude.cols(); ++t) {
            const float x = magnitude(k, t);
            const float r = ratio(k, t);
            float vocal = x * r;
            float instrumental = x * (1.0f - r);

            // spectral subtraction: the winning side loses the opposite estimate,
            // the losing side is attenuated by the winner's share
            if (r >= s.dominanceThreshold) {
                const float sharpened = std::max(vocal - a * instrumental, 0.0f);
                instrumental *= (1.0f - a * r);
                vocal = sharpened;
            } else {
                const float sharpened = std::max(instrumental - a * vocal, 0.0f);
                vocal *= (1.0f - a * (1.0f - r));
                instrumental = sharpened;
            }

            if (!inVocalBand) {
                const float moved = vocal * (1.0f - s.outOfBandVocalGain);
                vocal -= moved;
                instrumental += moved;
            }

            out.vocals(k, t) = vocal;
            out.instrumental(k, t) = instrumental;
        }
    }
    return out;
}

} // namespace

HarmonicPercussiveSeparator::HarmonicPercussiveSeparator(SeparationSettings settings)
    : settings_(settings)
{
    validate(settings_);
}

SeparationOutput HarmonicPercussiveSeparator::separate(const AudioBuffer& input, const ProgressCallback& progress) const
{
    if (input.empty())
        throw AudioJobError(ErrorKind::InvalidParameter, "Cannot separate an empty audio buffer");

    const auto started = std::chrono::steady_clock::now();
    auto logger = Logger::global();

    const std::vector<float> mono = input.downmixToMono();
    const dsp::ShortTimeFourierTransform stft(settings_.frameSize, settings_.hopSize);

    const auto spec = stft.analyze(mono);
    logger->logDiagnostic("Separation: %lld bins x %lld frames",
                          static_cast<long long>(spec.numBins()), static_cast<long long>(spec.numFrames()));
    report(progress, 10);

    const Eigen::MatrixXf harmonic = dsp::medianFilterAlongTime(spec.magnitude, settings_.harmonicFilterWidth);
    const Eigen::MatrixXf percussive = dsp::medianFilterAlongFrequency(spec.magnitude, settings_.percussiveFilterWidth);
    const auto masked = applyMasks(settings_, spec.magnitude, harmonic, percussive, input.sampleRate());
    report(progress, 40);

    std::vector<float> vocals = stft.synthesize(masked.vocals, spec.phase, mono.size());
    std::vector<float> instrumental = stft.synthesize(masked.instrumental, spec.phase, mono.size());
    report(progress, 80);

    const float vocalGain = dsp::normalizePeakInPlace(vocals);
    const float instrumentalGain = dsp::normalizePeakInPlace(instrumental);

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    logger->logDiagnostic("Separation of %.2f s finished in %lld ms (normalization gains %.3f / %.3f)",
                          input.durationSeconds(), static_cast<long long>(elapsedMs), vocalGain, instrumentalGain);

    SeparationOutput output;
    output.vocals = monoBuffer(std::move(vocals), input.sampleRate());
    output.instrumental = monoBuffer(std::move(instrumental), input.sampleRate());
    return output;
}

} // namespace lionsfx
