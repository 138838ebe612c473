#include <algorithm>
#include <complex>

#include <unsupported/Eigen/FFT>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx::dsp {

namespace {

size_t nextPowerOfTwo(size_t n)
{
    size_t p = 1;
    while (p < n)
        p <<= 1;
    return p;
}

} // namespace

std::vector<float> convolve(const std::vector<float>& signal, const std::vector<float>& kernel)
{
    std::vector<float> output(signal.size(), 0.0f);
    if (signal.empty() || kernel.empty())
        return output;

    const size_t fftSize = nextPowerOfTwo(2 * kernel.size());
    const size_t blockSize = fftSize - kernel.size() + 1;

    Eigen::FFT<float> fft;
    fft.SetFlag(Eigen::FFT<float>::HalfSpectrum);

    std::vector<float> padded(fftSize, 0.0f);
    std::copy(kernel.begin(), kernel.end(), padded.begin());
    std::vector<std::complex<float>> kernelSpectrum;
    fft.fwd(kernelSpectrum, padded);

    std::vector<std::complex<float>> blockSpectrum;
    std::vector<float> blockResult;

    for (size_t start = 0; start < signal.size(); start += blockSize) {
        const size_t count = std::min(blockSize, signal.size() - start);
        std::fill(padded.begin(), padded.end(), 0.0f);
        std::copy_n(signal.begin() + static_cast<std::ptrdiff_t>(start), count, padded.begin());

        fft.fwd(blockSpectrum, padded);
        for (size_t k = 0; k < blockSpectrum.size(); ++k)
            blockSpectrum[k] *= kernelSpectrum[k];
        fft.inv(blockResult, blockSpectrum, static_cast<Eigen::Index>(fftSize));

        const size_t usable = std::min(fftSize, signal.size() - start);
        for (size_t i = 0; i < usable; ++i)
            output[start + i] += blockResult[i];
    }
    return output;
}

} // namespace lionsfx::dsp
