#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

#include "atmospheric_light.hpp"
#include "dark_channel.hpp"
#include "dehaze_pipeline.hpp"
#include "radiance_recovery.hpp"
#include "transmission.hpp"


namespace
{
    const std::array<std::pair<std::string_view, Dehaze::Parameters>, 3> presets =
    {{
        {"default",      Dehaze::Parameters{}},
        {"small-window", Dehaze::Parameters{.windowRadius = 2, .omega = 0.95, .transmissionFloor = 0.01, .topFraction = 0.2, .minTransmission = 0.1}},
        {"large-window", Dehaze::Parameters{.windowRadius = 7, .omega = 0.95, .transmissionFloor = 0.01, .topFraction = 0.2, .minTransmission = 0.1}},
    }};
}


namespace Dehaze
{
    std::optional<Parameters> presetByName(std::string_view name)
    {
        for (const auto& [presetName, parameters]: presets)
            if (presetName == name)
                return parameters;

        return {};
    }

    std::vector<std::string_view> presetNames()
    {
        std::vector<std::string_view> names;
        for (const auto& preset: presets)
            names.push_back(preset.first);

        return names;
    }

    void validate(const Parameters& parameters)
    {
        if (parameters.windowRadius < 1)
            throw std::invalid_argument("Invalid value for window radius: " + std::to_string(parameters.windowRadius) + ". Expected positive value");

        if (!(parameters.omega >= 0.0 && parameters.omega <= 1.0))
            throw std::invalid_argument("Invalid value for omega: " + std::to_string(parameters.omega) + ". Expected value in range [0, 1]");

        if (!(parameters.transmissionFloor > 0.0 && parameters.transmissionFloor <= 1.0))
            throw std::invalid_argument("Invalid value for transmission floor: " + std::to_string(parameters.transmissionFloor) + ". Expected value in range (0, 1]");

        if (!(parameters.topFraction > 0.0 && parameters.topFraction <= 1.0))
            throw std::invalid_argument("Invalid value for top fraction: " + std::to_string(parameters.topFraction) + ". Expected value in range (0, 1]");

        if (!(parameters.minTransmission > 0.0 && parameters.minTransmission <= 1.0))
            throw std::invalid_argument("Invalid value for minimal transmission: " + std::to_string(parameters.minTransmission) + ". Expected value in range (0, 1]");
    }

    Result dehaze(const cv::Mat& input, const Parameters& parameters)
    {
        validate(parameters);

        const Image image = toUnitRange(input);

        spdlog::debug("Dehazing {}x{} image: window radius {}, omega {}, transmission floor {}, top fraction {}, minimal transmission {}",
                      image.cols, image.rows,
                      parameters.windowRadius, parameters.omega, parameters.transmissionFloor,
                      parameters.topFraction, parameters.minTransmission);

        Result result;
        result.darkChannel = darkChannel(image, parameters.windowRadius);
        result.atmosphericLight = atmosphericLight(image, result.darkChannel, parameters.topFraction);
        result.transmission = transmission(image, result.atmosphericLight, parameters.windowRadius, parameters.omega, parameters.transmissionFloor);
        result.recovered = recover(image, result.transmission, result.atmosphericLight, parameters.minTransmission);

        return result;
    }
}
