#pragma once

#include <vector>

namespace lionsfx::dsp {

// Causal linear convolution of `signal` with `kernel`, truncated to signal.size() samples.
// Uses FFT overlap-add, so long impulse responses stay affordable.
std::vector<float> convolve(const std::vector<float>& signal, const std::vector<float>& kernel);

} // namespace lionsfx::dsp
