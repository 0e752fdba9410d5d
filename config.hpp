#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dehaze_pipeline.hpp"


namespace Config
{
    struct Config
    {
        const std::vector<std::filesystem::path> inputFiles;
        const std::filesystem::path outputDir;
        const std::string preset;
        const Dehaze::Parameters parameters;
        const int threads;
        const bool debugSteps;
        const bool show;
    };

    Config readParams(int argc, char** argv);
}
