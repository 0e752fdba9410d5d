#include <stdexcept>
#include <string>

#include "radiance_recovery.hpp"


namespace
{
    uchar toByte(double value)
    {
        // NaN fails both comparisons and lands on 0
        const double scaled = value * 255.0;
        if (scaled >= 255.0)
            return 255;
        else if (scaled > 0.0)
            return cv::saturate_cast<uchar>(scaled);
        else
            return 0;
    }
}


cv::Mat Dehaze::recover(const Image& image, const Map& transmission, const Color& atmosphericLight, double minTransmission)
{
    requireNonEmpty(image, "recovery");
    requireSameSize(image, transmission, "recovery");

    if (!(minTransmission > 0.0 && minTransmission <= 1.0))
        throw std::invalid_argument("recovery: minimal transmission must be in range (0, 1], got " + std::to_string(minTransmission));

    cv::Mat_<cv::Vec3b> result(image.size());

    #pragma omp parallel for
    for (int y = 0; y < image.rows; ++y)
        for (int x = 0; x < image.cols; ++x)
        {
            const double t = transmission(y, x);
            const double bounded = t > minTransmission? t : minTransmission;     // also replaces NaN

            const cv::Vec3d& pixel = image(y, x);
            cv::Vec3b& output = result(y, x);

            for (int c = 0; c < 3; c++)
                output[c] = toByte((pixel[c] - atmosphericLight[c]) / bounded + atmosphericLight[c]);
        }

    return result;
}
