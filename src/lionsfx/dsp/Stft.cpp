#include <algorithm>
#include <cmath>
#include <complex>
#include <format>

#include <unsupported/Eigen/FFT>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx::dsp {

ShortTimeFourierTransform::ShortTimeFourierTransform(size_t frameSize, size_t hopSize)
    : frame_size_(frameSize), hop_size_(hopSize)
{
    if (frame_size_ < 2 || frame_size_ % 2 != 0)
        throw AudioJobError(ErrorKind::InvalidParameter, std::format("STFT frame size must be even and >= 2, got {}", frame_size_));
    if (hop_size_ == 0 || hop_size_ > frame_size_)
        throw AudioJobError(ErrorKind::InvalidParameter, std::format("STFT hop size must be in [1, {}], got {}", frame_size_, hop_size_));
    window_ = makeHannWindow(frame_size_);
}

size_t ShortTimeFourierTransform::numFramesFor(size_t signalLength) const
{
    return 1 + (signalLength + hop_size_ - 1) / hop_size_;
}

Spectrogram ShortTimeFourierTransform::analyze(const std::vector<float>& signal) const
{
    const size_t pad = frame_size_ / 2;
    const size_t frames = numFramesFor(signal.size());
    const size_t bins = numBins();

    std::vector<float> padded((frames - 1) * hop_size_ + frame_size_, 0.0f);
    std::copy(signal.begin(), signal.end(), padded.begin() + static_cast<std::ptrdiff_t>(pad));

    Spectrogram spec;
    spec.signalLength = signal.size();
    spec.magnitude.resize(static_cast<Eigen::Index>(bins), static_cast<Eigen::Index>(frames));
    spec.phase.resize(static_cast<Eigen::Index>(bins), static_cast<Eigen::Index>(frames));

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);
    std::vector<float> frame(frame_size_);
    std::vector<std::complex<float>> spectrum;

    for (size_t t = 0; t < frames; ++t) {
        const size_t offset = t * hop_size_;
        for (size_t i = 0; i < frame_size_; ++i)
            frame[i] = padded[offset + i] * window_[i];

        fft.fwd(spectrum, frame);

        for (size_t k = 0; k < bins; ++k) {
            spec.magnitude(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(t)) = std::abs(spectrum[k]);
            spec.phase(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(t)) = std::arg(spectrum[k]);
        }
    }
    return spec;
}

std::vector<float> ShortTimeFourierTransform::synthesize(const Eigen::MatrixXf& magnitude,
                                                         const Eigen::MatrixXf& phase,
                                                         size_t signalLength) const
{
    const auto bins = static_cast<Eigen::Index>(numBins());
    if (magnitude.rows() != bins || phase.rows() != bins || magnitude.cols() != phase.cols())
        throw AudioJobError(ErrorKind::ProcessingError,
                            std::format("Spectrogram shape mismatch: {}x{} magnitude, {}x{} phase, {} bins expected",
                                        magnitude.rows(), magnitude.cols(), phase.rows(), phase.cols(), bins));

    const auto frames = static_cast<size_t>(magnitude.cols());
    const size_t pad = frame_size_ / 2;
    const size_t outputLength = frames == 0 ? 0 : (frames - 1) * hop_size_ + frame_size_;

    std::vector<float> accumulated(outputLength, 0.0f);
    std::vector<float> windowSum(outputLength, 0.0f);

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);
    std::vector<std::complex<float>> spectrum(static_cast<size_t>(bins));
    std::vector<float> frame;

    for (size_t t = 0; t < frames; ++t) {
        for (Eigen::Index k = 0; k < bins; ++k)
            spectrum[static_cast<size_t>(k)] = std::polar(magnitude(k, static_cast<Eigen::Index>(t)),
                                                          phase(k, static_cast<Eigen::Index>(t)));

        fft.inv(frame, spectrum, static_cast<Eigen::Index>(frame_size_));

        const size_t offset = t * hop_size_;
        for (size_t i = 0; i < frame_size_; ++i) {
            accumulated[offset + i] += frame[i] * window_[i];
            windowSum[offset + i] += window_[i] * window_[i];
        }
    }

    std::vector<float> output(signalLength, 0.0f);
    for (size_t n = 0; n < signalLength; ++n) {
        const size_t index = n + pad;
        if (index >= outputLength)
            break;
        if (windowSum[index] > 1.0e-8f)
            output[n] = accumulated[index] / windowSum[index];
    }
    return output;
}

} // namespace lionsfx::dsp
