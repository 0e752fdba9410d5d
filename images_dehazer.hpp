#pragma once

#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "dehaze_pipeline.hpp"


// Dehazes every image and writes result into 'dir' under input's file name.
// With 'debugSteps' dark channel and transmission maps are stored in subdirectories.
std::vector<std::filesystem::path> dehazeImages(const std::filesystem::path& dir,
                                                std::span<const std::filesystem::path> images,
                                                const Dehaze::Parameters& parameters,
                                                bool debugSteps,
                                                const std::function<void()>& imageDone = {});

void showImages(std::span<const std::filesystem::path> images);
