#pragma once

#include <string_view>
#include <opencv2/core.hpp>


namespace Dehaze
{
    using Image = cv::Mat_<cv::Vec3d>;
    using Map = cv::Mat_<double>;
    using Color = cv::Vec3d;

    // guards divisions by atmospheric light components close to zero
    constexpr double epsilon = 1e-6;

    Image toUnitRange(const cv::Mat& image);
    cv::Mat toDisplay(const Map& map);

    void requireNonEmpty(const cv::Mat& image, std::string_view what);
    void requireSameSize(const cv::Mat& lhs, const cv::Mat& rhs, std::string_view what);
}
