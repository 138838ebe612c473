#include <algorithm>

#include "lionsfx/lionsfx.hpp"

namespace lionsfx::dsp {

namespace {

size_t oddWidth(size_t width)
{
    if (width == 0)
        return 1;
    return width % 2 == 0 ? width + 1 : width;
}

// Filters one strided line of `count` elements.
template <typename Read, typename Write>
void filterLine(Eigen::Index count, size_t width, std::vector<float>& scratch, Read read, Write write)
{
    const auto half = static_cast<Eigen::Index>(width / 2);
    for (Eigen::Index i = 0; i < count; ++i) {
        const Eigen::Index begin = std::max<Eigen::Index>(0, i - half);
        const Eigen::Index end = std::min<Eigen::Index>(count, i + half + 1);
        scratch.clear();
        for (Eigen::Index j = begin; j < end; ++j)
            scratch.push_back(read(j));
        write(i, median(scratch));
    }
}

} // namespace

float median(std::vector<float>& values)
{
    if (values.empty())
        return 0.0f;
    auto mid = values.begin() + static_cast<std::ptrdiff_t>(values.size() / 2);
    std::nth_element(values.begin(), mid, values.end());
    return *mid;
}

Eigen::MatrixXf medianFilterAlongTime(const Eigen::MatrixXf& input, size_t width)
{
    width = oddWidth(width);
    Eigen::MatrixXf output(input.rows(), input.cols());
    std::vector<float> scratch;
    scratch.reserve(width);

    for (Eigen::Index bin = 0; bin < input.rows(); ++bin) {
        filterLine(input.cols(), width, scratch,
                   [&](Eigen::Index t) { return input(bin, t); },
                   [&](Eigen::Index t, float v) { output(bin, t) = v; });
    }
    return output;
}

Eigen::MatrixXf medianFilterAlongFrequency(const Eigen::MatrixXf& input, size_t width)
{
    width = oddWidth(width);
    Eigen::MatrixXf output(input.rows(), input.cols());
    std::vector<float> scratch;
    scratch.reserve(width);

    for (Eigen::Index frame = 0; frame < input.cols(); ++frame) {
        filterLine(input.rows(), width, scratch,
                   [&](Eigen::Index k) { return input(k, frame); },
                   [&](Eigen::Index k, float v) { output(k, frame) = v; });
    }
    return output;
}

} // namespace lionsfx::dsp
