#include <algorithm>
#include <cmath>
#include <numbers>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx::dsp {

namespace {

// Pole-pair Q values of a 4th order Butterworth prototype.
constexpr double kButterworth4Q1 = 0.54119610014619698;
constexpr double kButterworth4Q2 = 1.30656296487637652;

constexpr size_t kReflectionPadding = 64;

double checkedOmega(double cutoffHz, double sampleRate)
{
    if (sampleRate <= 0.0)
        throw AudioJobError(ErrorKind::InvalidParameter, "Filter sample rate must be positive");
    const double nyquist = sampleRate / 2.0;
    // keep the cutoff strictly inside (0, nyquist) so that the bilinear transform stays stable;
    // below ~2 Hz sample rate the nyquist bound wins over the 1 Hz floor
    const double clamped = std::min(std::max(cutoffHz, 1.0), nyquist * 0.99);
    return 2.0 * std::numbers::pi * clamped / sampleRate;
}

BiquadFilter::Coefficients normalize(double b0, double b1, double b2, double a0, double a1, double a2)
{
    return BiquadFilter::Coefficients{
        static_cast<float>(b0 / a0),
        static_cast<float>(b1 / a0),
        static_cast<float>(b2 / a0),
        static_cast<float>(a1 / a0),
        static_cast<float>(a2 / a0)
    };
}

} // namespace

BiquadFilter::Coefficients BiquadFilter::lowPass(double cutoffHz, double sampleRate, double q)
{
    const double w0 = checkedOmega(cutoffHz, sampleRate);
    const double cosW = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    return normalize((1.0 - cosW) / 2.0, 1.0 - cosW, (1.0 - cosW) / 2.0,
                     1.0 + alpha, -2.0 * cosW, 1.0 - alpha);
}

BiquadFilter::Coefficients BiquadFilter::highPass(double cutoffHz, double sampleRate, double q)
{
    const double w0 = checkedOmega(cutoffHz, sampleRate);
    const double cosW = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    return normalize((1.0 + cosW) / 2.0, -(1.0 + cosW), (1.0 + cosW) / 2.0,
                     1.0 + alpha, -2.0 * cosW, 1.0 - alpha);
}

FilterCascade FilterCascade::butterworthLowPass4(double cutoffHz, double sampleRate)
{
    FilterCascade cascade;
    cascade.sections_.emplace_back(BiquadFilter::lowPass(cutoffHz, sampleRate, kButterworth4Q1));
    cascade.sections_.emplace_back(BiquadFilter::lowPass(cutoffHz, sampleRate, kButterworth4Q2));
    return cascade;
}

FilterCascade FilterCascade::butterworthHighPass4(double cutoffHz, double sampleRate)
{
    FilterCascade cascade;
    cascade.sections_.emplace_back(BiquadFilter::highPass(cutoffHz, sampleRate, kButterworth4Q1));
    cascade.sections_.emplace_back(BiquadFilter::highPass(cutoffHz, sampleRate, kButterworth4Q2));
    return cascade;
}

FilterCascade& FilterCascade::append(const FilterCascade& other)
{
    sections_.insert(sections_.end(), other.sections_.begin(), other.sections_.end());
    return *this;
}

void FilterCascade::reset()
{
    for (auto& section : sections_)
        section.reset();
}

float FilterCascade::process(float x)
{
    for (auto& section : sections_)
        x = section.process(x);
    return x;
}

void FilterCascade::processInPlace(std::vector<float>& samples)
{
    for (auto& s : samples)
        s = process(s);
}

std::vector<float> filterForwardBackward(const std::vector<float>& input, FilterCascade cascade)
{
    if (input.empty())
        return {};

    const size_t n = input.size();
    const size_t pad = std::min(kReflectionPadding, n - 1);

    // odd extension: 2*x[0] - x[pad..1], x, 2*x[n-1] - x[n-2..n-1-pad]
    std::vector<float> extended;
    extended.reserve(n + 2 * pad);
    for (size_t i = pad; i >= 1; --i)
        extended.push_back(2.0f * input.front() - input[i]);
    extended.insert(extended.end(), input.begin(), input.end());
    for (size_t i = 1; i <= pad; ++i)
        extended.push_back(2.0f * input.back() - input[n - 1 - i]);

    cascade.reset();
    cascade.processInPlace(extended);
    std::reverse(extended.begin(), extended.end());
    cascade.reset();
    cascade.processInPlace(extended);
    std::reverse(extended.begin(), extended.end());

    return std::vector<float>(extended.begin() + static_cast<std::ptrdiff_t>(pad),
                              extended.begin() + static_cast<std::ptrdiff_t>(pad + n));
}

} // namespace lionsfx::dsp
