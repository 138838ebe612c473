#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

namespace lionsfx::dsp {

// Magnitude and phase of a real signal, [bins x frames].
struct Spectrogram {
    Eigen::MatrixXf magnitude{};
    Eigen::MatrixXf phase{};
    // Length of the analysed signal, needed to trim the centering padding on resynthesis.
    size_t signalLength{0};

    Eigen::Index numBins() const { return magnitude.rows(); }
    Eigen::Index numFrames() const { return magnitude.cols(); }
};

// Short-time Fourier transform with a Hann window.
// The signal is centered: frameSize/2 zeros are padded on both sides, so that
// synthesize(analyze(x)) returns exactly x.size() samples for any non-empty x.
class ShortTimeFourierTransform {
public:
    ShortTimeFourierTransform(size_t frameSize, size_t hopSize);

    size_t frameSize() const { return frame_size_; }
    size_t hopSize() const { return hop_size_; }
    size_t numBins() const { return frame_size_ / 2 + 1; }
    size_t numFramesFor(size_t signalLength) const;

    Spectrogram analyze(const std::vector<float>& signal) const;

    // Weighted overlap-add. `magnitude` and `phase` must have the same shape.
    std::vector<float> synthesize(const Eigen::MatrixXf& magnitude,
                                  const Eigen::MatrixXf& phase,
                                  size_t signalLength) const;

private:
    size_t frame_size_;
    size_t hop_size_;
    std::vector<float> window_;
};

} // namespace lionsfx::dsp
