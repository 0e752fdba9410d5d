#pragma once

#include "image.hpp"


namespace Dehaze
{
    /**
     * Per pixel minimum over color channels followed by a square minimum filter
     * of side 2 * windowRadius + 1. Pixels outside of the image replicate the
     * nearest border pixel.
     *
     * Throws std::invalid_argument for empty image or windowRadius < 1.
     */
    Map darkChannel(const Image& image, int windowRadius);

    Map channelMinimum(const Image& image);
    Map minFilter(const Map& map, int windowRadius);
}
