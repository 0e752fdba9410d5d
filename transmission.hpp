#pragma once

#include "image.hpp"


namespace Dehaze
{
    /**
     * Transmission estimate t = 1 - omega * dark(I / A), clamped to [floor, 1].
     *
     * omega is the fraction of haze removed (0 keeps all of it).
     * Lower floor gives stronger haze removal but amplifies noise in thick haze.
     */
    Map transmission(const Image& image, const Color& atmosphericLight, int windowRadius, double omega, double floor);
}
