#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

namespace lionsfx::dsp {

// Median of `values` (the vector is reordered). Even-sized input yields the upper median.
float median(std::vector<float>& values);

// Sliding median along each row of a [bins x frames] matrix, i.e. over time per frequency bin.
// The window is centered and shrinks at the edges. `width` is forced to be odd.
Eigen::MatrixXf medianFilterAlongTime(const Eigen::MatrixXf& input, size_t width);

// Sliding median along each column, i.e. over frequency per time frame.
Eigen::MatrixXf medianFilterAlongFrequency(const Eigen::MatrixXf& input, size_t width);

} // namespace lionsfx::dsp
