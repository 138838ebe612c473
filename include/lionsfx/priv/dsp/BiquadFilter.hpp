#pragma once

#include <cstddef>
#include <vector>

namespace lionsfx::dsp {

// Direct form I biquad section, coefficients normalized by a0 (RBJ audio EQ cookbook).
class BiquadFilter {
public:
    struct Coefficients {
        float b0{1.0f};
        float b1{0.0f};
        float b2{0.0f};
        float a1{0.0f};
        float a2{0.0f};
    };

    static Coefficients lowPass(double cutoffHz, double sampleRate, double q);
    static Coefficients highPass(double cutoffHz, double sampleRate, double q);

    BiquadFilter() = default;
    explicit BiquadFilter(Coefficients coefficients) : c_(coefficients) {}

    void reset() { x1_ = x2_ = y1_ = y2_ = 0.0f; }

    float process(float x) {
        const float y = c_.b0 * x + c_.b1 * x1_ + c_.b2 * x2_ - c_.a1 * y1_ - c_.a2 * y2_;
        x2_ = x1_;
        x1_ = x;
        y2_ = y1_;
        y1_ = y;
        return y;
    }

    const Coefficients& coefficients() const { return c_; }

private:
    Coefficients c_{};
    float x1_{0.0f};
    float x2_{0.0f};
    float y1_{0.0f};
    float y2_{0.0f};
};

// Series of biquad sections, e.g. a 4th order Butterworth filter.
class FilterCascade {
public:
    static FilterCascade butterworthLowPass4(double cutoffHz, double sampleRate);
    static FilterCascade butterworthHighPass4(double cutoffHz, double sampleRate);

    FilterCascade& append(const FilterCascade& other);

    void reset();
    float process(float x);
    void processInPlace(std::vector<float>& samples);

    size_t numSections() const { return sections_.size(); }

private:
    std::vector<BiquadFilter> sections_{};
};

// Zero-phase filtering: runs the cascade forward, then backward over the result.
// The signal is extended by odd reflection at both ends to reduce edge transients.
std::vector<float> filterForwardBackward(const std::vector<float>& input, FilterCascade cascade);

} // namespace lionsfx::dsp
