#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

#include <lionsfx/lionsfx.hpp>

namespace {

using namespace lionsfx;

std::vector<float> sine(double frequency, double sampleRate, size_t length, float amplitude = 1.0f) {
    std::vector<float> x(length);
    for (size_t i = 0; i < length; ++i)
        x[i] = amplitude * static_cast<float>(std::sin(2.0 * std::numbers::pi * frequency * static_cast<double>(i) / sampleRate));
    return x;
}

double rms(const std::vector<float>& x, size_t begin, size_t end) {
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i)
        sum += static_cast<double>(x[i]) * x[i];
    return std::sqrt(sum / static_cast<double>(end - begin));
}

TEST(StftTest, ResynthesisReproducesSignal) {
    const size_t length = 5000;
    auto a = sine(440.0, 44100.0, length, 0.5f);
    auto b = sine(3100.0, 44100.0, length, 0.25f);
    std::vector<float> x(length);
    for (size_t i = 0; i < length; ++i)
        x[i] = a[i] + b[i] + (i % 97 == 0 ? 0.2f : 0.0f);

    dsp::ShortTimeFourierTransform stft(2048, 512);
    auto spec = stft.analyze(x);
    EXPECT_EQ(spec.numBins(), 1025);
    EXPECT_EQ(static_cast<size_t>(spec.numFrames()), stft.numFramesFor(length));

    auto y = stft.synthesize(spec.magnitude, spec.phase, length);
    ASSERT_EQ(y.size(), length);
    for (size_t i = 0; i < length; ++i)
        ASSERT_NEAR(y[i], x[i], 1.0e-4f) << "sample " << i;
}

TEST(StftTest, ShortSignalKeepsLength) {
    std::vector<float> x(100, 0.25f);
    dsp::ShortTimeFourierTransform stft(2048, 512);
    auto spec = stft.analyze(x);
    auto y = stft.synthesize(spec.magnitude, spec.phase, x.size());
    ASSERT_EQ(y.size(), x.size());
    EXPECT_NEAR(y[50], 0.25f, 1.0e-4f);
}

TEST(StftTest, RejectsInvalidGeometry) {
    EXPECT_THROW(dsp::ShortTimeFourierTransform(1023, 256), AudioJobError);
    EXPECT_THROW(dsp::ShortTimeFourierTransform(1024, 0), AudioJobError);
    EXPECT_THROW(dsp::ShortTimeFourierTransform(1024, 2048), AudioJobError);
}

TEST(StftTest, RejectsMismatchedSpectrogram) {
    dsp::ShortTimeFourierTransform stft(256, 64);
    Eigen::MatrixXf magnitude = Eigen::MatrixXf::Zero(129, 4);
    Eigen::MatrixXf phase = Eigen::MatrixXf::Zero(129, 5);
    EXPECT_THROW(stft.synthesize(magnitude, phase, 100), AudioJobError);
}

TEST(MedianFilterTest, MedianOfOddAndEvenSets) {
    std::vector<float> odd{3.0f, 1.0f, 2.0f};
    EXPECT_FLOAT_EQ(dsp::median(odd), 2.0f);
    std::vector<float> even{4.0f, 1.0f, 3.0f, 2.0f};
    EXPECT_FLOAT_EQ(dsp::median(even), 3.0f);
}

TEST(MedianFilterTest, TimeFilterRemovesTransient) {
    Eigen::MatrixXf m = Eigen::MatrixXf::Constant(2, 7, 1.0f);
    m(0, 3) = 10.0f;
    auto filtered = dsp::medianFilterAlongTime(m, 3);
    for (Eigen::Index t = 0; t < m.cols(); ++t) {
        EXPECT_FLOAT_EQ(filtered(0, t), 1.0f);
        EXPECT_FLOAT_EQ(filtered(1, t), 1.0f);
    }
}

TEST(MedianFilterTest, FrequencyFilterRemovesTonalPeak) {
    Eigen::MatrixXf m = Eigen::MatrixXf::Zero(9, 3);
    m.row(4).setConstant(5.0f);
    auto filtered = dsp::medianFilterAlongFrequency(m, 5);
    EXPECT_FLOAT_EQ(filtered.maxCoeff(), 0.0f);
    // the same line survives filtering along time
    auto sustained = dsp::medianFilterAlongTime(m, 5);
    EXPECT_FLOAT_EQ(sustained(4, 1), 5.0f);
}

TEST(BiquadFilterTest, ButterworthLowPassSplitsBands) {
    const double sr = 44100.0;
    auto low = sine(100.0, sr, 44100);
    auto high = sine(5000.0, sr, 44100);

    auto lowOut = dsp::filterForwardBackward(low, dsp::FilterCascade::butterworthLowPass4(300.0, sr));
    auto highOut = dsp::filterForwardBackward(high, dsp::FilterCascade::butterworthLowPass4(300.0, sr));
    ASSERT_EQ(lowOut.size(), low.size());

    EXPECT_NEAR(rms(lowOut, 4000, 40000) / rms(low, 4000, 40000), 1.0, 0.02);
    EXPECT_LT(rms(highOut, 4000, 40000), 0.001);
}

TEST(BiquadFilterTest, ButterworthHighPassSplitsBands) {
    const double sr = 44100.0;
    auto low = sine(100.0, sr, 44100);
    auto high = sine(10000.0, sr, 44100);
    auto cascade = dsp::FilterCascade::butterworthHighPass4(3000.0, sr);
    EXPECT_EQ(cascade.numSections(), 2u);

    auto lowOut = dsp::filterForwardBackward(low, cascade);
    auto highOut = dsp::filterForwardBackward(high, cascade);
    EXPECT_LT(rms(lowOut, 4000, 40000), 0.001);
    EXPECT_NEAR(rms(highOut, 4000, 40000) / rms(high, 4000, 40000), 1.0, 0.02);
}

TEST(BiquadFilterTest, RejectsNonPositiveSampleRate) {
    EXPECT_THROW(dsp::BiquadFilter::lowPass(300.0, 0.0, 0.707), AudioJobError);
}

TEST(BiquadFilterTest, CutoffAboveNyquistAtTinySampleRateStaysStable) {
    for (double sr : {1.0, 2.0}) {
        auto lowPass = dsp::FilterCascade::butterworthLowPass4(300.0, sr);
        auto highPass = dsp::FilterCascade::butterworthHighPass4(3000.0, sr);
        auto input = sine(0.1 * sr, sr, 512, 0.5f);
        for (const auto& out : {dsp::filterForwardBackward(input, lowPass), dsp::filterForwardBackward(input, highPass)}) {
            ASSERT_EQ(out.size(), input.size());
            for (float v : out)
                ASSERT_TRUE(std::isfinite(v)) << "sample rate " << sr;
        }
    }
}

TEST(ConvolutionTest, MatchesDirectConvolution) {
    std::vector<float> signal(300);
    for (size_t i = 0; i < signal.size(); ++i)
        signal[i] = static_cast<float>(std::sin(0.37 * static_cast<double>(i)) * std::cos(0.011 * static_cast<double>(i)));
    std::vector<float> kernel(50);
    for (size_t i = 0; i < kernel.size(); ++i)
        kernel[i] = static_cast<float>(std::exp(-0.1 * static_cast<double>(i)) * (i % 2 == 0 ? 1.0 : -0.5));

    auto fast = dsp::convolve(signal, kernel);
    ASSERT_EQ(fast.size(), signal.size());
    for (size_t n = 0; n < signal.size(); ++n) {
        double expected = 0.0;
        for (size_t k = 0; k < kernel.size() && k <= n; ++k)
            expected += static_cast<double>(kernel[k]) * signal[n - k];
        ASSERT_NEAR(fast[n], expected, 1.0e-4) << "sample " << n;
    }
}

TEST(ConvolutionTest, DeltaKernelDelays) {
    std::vector<float> signal{1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
    auto out = dsp::convolve(signal, {0.0f, 0.0f, 1.0f});
    ASSERT_EQ(out.size(), 5u);
    EXPECT_NEAR(out[0], 0.0f, 1.0e-5f);
    EXPECT_NEAR(out[2], 1.0f, 1.0e-5f);
    EXPECT_NEAR(out[4], 3.0f, 1.0e-5f);
}

TEST(NormalizationTest, ScalesDownLoudSignal) {
    std::vector<float> x{0.5f, -2.0f, 1.0f};
    const float gain = dsp::normalizePeakInPlace(x);
    EXPECT_FLOAT_EQ(gain, 0.5f);
    EXPECT_FLOAT_EQ(x[1], -1.0f);
    EXPECT_FLOAT_EQ(dsp::peakAmplitude(x), 1.0f);
}

TEST(NormalizationTest, IsIdempotent) {
    std::vector<float> x{0.3f, -3.0f, 2.5f};
    dsp::normalizePeakInPlace(x);
    const auto once = x;
    EXPECT_FLOAT_EQ(dsp::normalizePeakInPlace(x), 1.0f);
    EXPECT_EQ(x, once);
}

TEST(NormalizationTest, LeavesQuietAndSilentSignalsAlone) {
    std::vector<float> quiet{0.1f, -0.4f};
    EXPECT_FLOAT_EQ(dsp::normalizePeakInPlace(quiet), 1.0f);
    EXPECT_FLOAT_EQ(quiet[1], -0.4f);

    std::vector<float> silent(16, 0.0f);
    EXPECT_FLOAT_EQ(dsp::normalizePeakInPlace(silent), 1.0f);
    EXPECT_FLOAT_EQ(dsp::peakAmplitude(silent), 0.0f);
}

TEST(NormalizationTest, RejectsNonFiniteSamples) {
    std::vector<float> x{0.1f, std::numeric_limits<float>::quiet_NaN()};
    try {
        dsp::normalizePeakInPlace(x);
        FAIL() << "expected AudioJobError";
    } catch (const AudioJobError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessingError);
    }
}

TEST(NormalizationTest, BufferNormalizationKeepsChannelBalance) {
    auto buffer = dsp::normalizePeak({{2.0f, 0.0f}, {1.0f, -0.5f}}, 44100);
    EXPECT_FLOAT_EQ(buffer.channel(0)[0], 1.0f);
    EXPECT_FLOAT_EQ(buffer.channel(1)[0], 0.5f);
    EXPECT_FLOAT_EQ(buffer.channel(1)[1], -0.25f);
}

} // namespace
