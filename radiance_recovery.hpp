#pragma once

#include "image.hpp"


namespace Dehaze
{
    /**
     * Inverts haze model I = J * t + A * (1 - t).
     * Transmission is raised to at least minTransmission before division.
     * Returns CV_8UC3 image with every channel saturated to [0, 255].
     */
    cv::Mat recover(const Image& image, const Map& transmission, const Color& atmosphericLight, double minTransmission);
}
