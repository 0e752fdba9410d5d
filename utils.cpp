#include <algorithm>
#include <array>
#include <ranges>
#include <set>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string.hpp>

#include "utils.hpp"


namespace
{
    const std::array<std::string_view, 9> imageExtensions = { ".bmp", ".jpeg", ".jpg", ".png", ".ppm", ".tif", ".tiff", ".webp", ".pgm" };

    std::vector<std::filesystem::path> imagesInDirectory(const std::filesystem::path& inputDir)
    {
        auto files =
            std::filesystem::recursive_directory_iterator(inputDir) |
            std::views::filter([](const std::filesystem::directory_entry &entry)
            {
                return entry.is_regular_file() && Utils::isImageFile(entry.path());
            }) |
            std::views::transform([](const std::filesystem::directory_entry &entry)
            {
                return entry.path();
            });

        std::vector<std::filesystem::path> result;
        std::ranges::copy(files, std::back_inserter(result));
        std::ranges::sort(result);

        return result;
    }
}


namespace Utils
{
    bool isImageFile(const std::filesystem::path& path)
    {
        const auto extension = boost::algorithm::to_lower_copy(path.extension().string());
        return std::ranges::find(imageExtensions, extension) != imageExtensions.end();
    }

    std::vector<std::filesystem::path> collectImages(std::span<const std::filesystem::path> inputs)
    {
        std::vector<std::filesystem::path> images;
        std::set<std::filesystem::path> seen;

        // overlapping inputs (a directory and its subdirectory) name some files twice
        auto add = [&images, &seen](const std::filesystem::path& path)
        {
            if (seen.insert(std::filesystem::weakly_canonical(path)).second)
                images.push_back(path);
        };

        for (const auto& input: inputs)
        {
            if (std::filesystem::is_directory(input))
                std::ranges::for_each(imagesInDirectory(input), add);
            else if (std::filesystem::is_regular_file(input))
                add(input);
            else
                throw std::runtime_error("Input file does not exist: " + input.string());
        }

        return images;
    }

    int threadsToUse(int requested, int available)
    {
        const int threads = requested > 0? requested: available + requested;
        return std::clamp(threads, 1, std::max(available, 1));
    }
}
