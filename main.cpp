#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <omp.h>
#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#include "config.hpp"
#include "images_dehazer.hpp"
#include "utils.hpp"


namespace
{
    class HideCursor final
    {
    public:
        HideCursor()
        {
            indicators::show_console_cursor(false);
        }

        ~HideCursor()
        {
            indicators::show_console_cursor(true);
        }
    };
}


int main(int argc, char** argv)
{
    spdlog::cfg::load_env_levels();

    try
    {
        const auto config = Config::readParams(argc, argv);
        const auto& parameters = config.parameters;

        const auto useThreads = Utils::threadsToUse(config.threads, omp_get_max_threads());
        spdlog::info("Using {} threads", useThreads);
        omp_set_num_threads(useThreads);

        const auto images = Utils::collectImages(config.inputFiles);
        if (images.empty())
            throw std::runtime_error("No images found in input files.");

        spdlog::info("Preset '{}': window radius {}, omega {}, transmission floor {}, top fraction {}, minimal transmission {}",
                     config.preset, parameters.windowRadius, parameters.omega, parameters.transmissionFloor,
                     parameters.topFraction, parameters.minTransmission);

        std::vector<std::filesystem::path> dehazed;

        {
            HideCursor _;
            indicators::ProgressBar progressBar{
                indicators::option::BarWidth{40},
                indicators::option::MaxProgress{images.size()},
                indicators::option::ShowPercentage{true},
                indicators::option::PrefixText{"Dehazing "},
            };

            dehazed = Utils::measureTimeWithMessage("Dehazing images.", dehazeImages, config.outputDir, images, parameters, config.debugSteps, [&progressBar]()
            {
                progressBar.tick();
            });
        }

        spdlog::info("{} images written to {}", dehazed.size(), config.outputDir.string());

        if (config.show)
            showImages(dehazed);
    }
    catch (const std::runtime_error& error)
    {
        std::cout << error.what() << "\n";
        return 1;
    }
    catch (const std::invalid_argument& error)
    {
        spdlog::error(error.what());
        return 1;
    }
    catch (const std::logic_error& error)
    {
        std::cerr << "Error: " << error.what() << "\n";
        return 1;
    }
    catch (const cv::Exception& error)
    {
        spdlog::error(error.what());
        return 1;
    }
    catch(...)
    {
        spdlog::error("Fail: Unhandled exception");
        return 1;
    }

    return 0;
}
