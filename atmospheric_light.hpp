#pragma once

#include "image.hpp"


namespace Dehaze
{
    /**
     * Mean color of the max(floor(pixels * topFraction), 1) pixels with the
     * highest dark channel value. Ties are resolved by raster order.
     */
    Color atmosphericLight(const Image& image, const Map& darkChannel, double topFraction);
}
