#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "atmospheric_light.hpp"


namespace
{
    std::size_t brightestCount(std::size_t pixels, double topFraction)
    {
        const auto count = static_cast<std::size_t>(std::floor(static_cast<double>(pixels) * topFraction));
        return std::clamp<std::size_t>(count, 1, pixels);
    }
}


namespace Dehaze
{
    Color atmosphericLight(const Image& image, const Map& darkChannel, double topFraction)
    {
        requireNonEmpty(image, "atmospheric light");
        requireSameSize(image, darkChannel, "atmospheric light");

        if (!(topFraction > 0.0 && topFraction <= 1.0))
            throw std::invalid_argument("atmospheric light: top fraction must be in range (0, 1], got " + std::to_string(topFraction));

        // ordering below requires comparable values
        if (cv::checkRange(darkChannel) == false)
            throw std::invalid_argument("atmospheric light: dark channel contains non-finite values");

        const int cols = image.cols;
        const std::size_t pixels = image.total();
        const std::size_t count = brightestCount(pixels, topFraction);

        std::vector<std::size_t> indices(pixels);
        std::iota(indices.begin(), indices.end(), 0);

        auto darkValue = [&](std::size_t idx)
        {
            return darkChannel(static_cast<int>(idx / cols), static_cast<int>(idx % cols));
        };

        // brightest first, lower index first among equal values
        auto brighter = [&](std::size_t lhs, std::size_t rhs)
        {
            const double l = darkValue(lhs);
            const double r = darkValue(rhs);
            return l > r || (l == r && lhs < rhs);
        };

        if (count < pixels)
            std::nth_element(indices.begin(), indices.begin() + count, indices.end(), brighter);

        Color sum(0.0, 0.0, 0.0);
        for (std::size_t i = 0; i < count; i++)
        {
            const std::size_t idx = indices[i];
            sum += image(static_cast<int>(idx / cols), static_cast<int>(idx % cols));
        }

        const Color light = sum / static_cast<double>(count);

        spdlog::debug("Atmospheric light estimated from {} pixels: ({:.4f}, {:.4f}, {:.4f})", count, light[0], light[1], light[2]);

        return light;
    }
}
