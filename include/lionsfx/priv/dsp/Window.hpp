#pragma once

#include <cmath>
#include <numbers>
#include <vector>

namespace lionsfx::dsp {

// Periodic Hann window (L+1 points, drop last), which satisfies COLA at hop = size/4.
inline std::vector<float> makeHannWindow(size_t size) {
    std::vector<float> w(size);
    for (size_t i = 0; i < size; i++)
        w[i] = 0.5f * (1.0f - static_cast<float>(std::cos(2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(size))));
    return w;
}

} // namespace lionsfx::dsp
