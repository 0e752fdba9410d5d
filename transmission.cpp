#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "dark_channel.hpp"
#include "transmission.hpp"


namespace Dehaze
{
    Map transmission(const Image& image, const Color& atmosphericLight, int windowRadius, double omega, double floor)
    {
        requireNonEmpty(image, "transmission");

        if (!(omega >= 0.0 && omega <= 1.0))
            throw std::invalid_argument("transmission: omega must be in range [0, 1], got " + std::to_string(omega));

        if (!(floor > 0.0 && floor <= 1.0))
            throw std::invalid_argument("transmission: floor must be in range (0, 1], got " + std::to_string(floor));

        for (int c = 0; c < 3; c++)
            if (!(atmosphericLight[c] >= 0.0 && std::isfinite(atmosphericLight[c])))
                throw std::invalid_argument("transmission: atmospheric light components must be non-negative");

        const Color divisor = atmosphericLight + Color::all(epsilon);
        Image normalized(image.size());

        #pragma omp parallel for
        for (int y = 0; y < image.rows; ++y)
            for (int x = 0; x < image.cols; ++x)
            {
                const cv::Vec3d& pixel = image(y, x);
                normalized(y, x) = cv::Vec3d(pixel[0] / divisor[0], pixel[1] / divisor[1], pixel[2] / divisor[2]);
            }

        const Map dark = darkChannel(normalized, windowRadius);
        Map result(image.size());

        #pragma omp parallel for
        for (int y = 0; y < image.rows; ++y)
            for (int x = 0; x < image.cols; ++x)
                result(y, x) = std::clamp(1.0 - omega * dark(y, x), floor, 1.0);

        return result;
    }
}
