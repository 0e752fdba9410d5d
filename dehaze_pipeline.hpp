#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "image.hpp"


namespace Dehaze
{
    struct Parameters
    {
        int windowRadius = 7;               // window of 15x15 pixels
        double omega = 0.95;
        double transmissionFloor = 0.1;
        double topFraction = 0.001;
        double minTransmission = 0.1;

        bool operator==(const Parameters &) const = default;
    };

    struct Result
    {
        cv::Mat recovered;
        Map darkChannel;
        Map transmission;
        Color atmosphericLight;
    };

    std::optional<Parameters> presetByName(std::string_view name);
    std::vector<std::string_view> presetNames();

    void validate(const Parameters& parameters);

    Result dehaze(const cv::Mat& image, const Parameters& parameters);
}
