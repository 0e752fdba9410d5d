#include <set>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/highgui.hpp>
#include <spdlog/spdlog.h>

#include "images_dehazer.hpp"
#include "image.hpp"
#include "utils.hpp"


namespace
{
    const std::filesystem::path darkChannelDir = "dark_channel";
    const std::filesystem::path transmissionDir = "transmission";

    cv::Mat readImage(const std::filesystem::path& path)
    {
        const cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);

        if (image.empty())
            throw std::runtime_error("Could not read image: " + path.string());

        return image;
    }

    void writeImage(const std::filesystem::path& path, const cv::Mat& image)
    {
        if (cv::imwrite(path.string(), image) == false)
            throw std::runtime_error("Could not write image: " + path.string());
    }

    // results land in one flat directory, so input file names must not repeat
    void requireUniqueNames(std::span<const std::filesystem::path> images)
    {
        std::set<std::filesystem::path> names;

        for (const auto& path: images)
            if (names.insert(path.filename()).second == false)
                throw std::invalid_argument("Two inputs share file name " + path.filename().string() + ", results would overwrite each other");
    }
}


std::vector<std::filesystem::path> dehazeImages(const std::filesystem::path& dir,
                                                std::span<const std::filesystem::path> images,
                                                const Dehaze::Parameters& parameters,
                                                bool debugSteps,
                                                const std::function<void()>& imageDone)
{
    Dehaze::validate(parameters);
    requireUniqueNames(images);

    std::filesystem::create_directories(dir);

    if (debugSteps)
    {
        std::filesystem::create_directories(dir / darkChannelDir);
        std::filesystem::create_directories(dir / transmissionDir);
    }

    const auto imagesCount = images.size();
    std::vector<std::filesystem::path> resultPaths(imagesCount);

    Utils::forEach(images, [&](const size_t i)
    {
        const auto& imagePath = images[i];
        const cv::Mat image = readImage(imagePath);

        const Dehaze::Result result = Dehaze::dehaze(image, parameters);
        const auto& light = result.atmosphericLight;
        spdlog::debug("{}: atmospheric light (B, G, R) = ({:.4f}, {:.4f}, {:.4f})", imagePath.string(), light[0], light[1], light[2]);

        const auto outputPath = dir / imagePath.filename();
        writeImage(outputPath, result.recovered);

        if (debugSteps)
        {
            const auto debugName = imagePath.stem().string() + ".png";
            writeImage(dir / darkChannelDir / debugName, Dehaze::toDisplay(result.darkChannel));
            writeImage(dir / transmissionDir / debugName, Dehaze::toDisplay(result.transmission));
        }

        spdlog::debug("Dehazed image written to {}", outputPath.string());
        resultPaths[i] = outputPath;

        if (imageDone)
            imageDone();
    });

    return resultPaths;
}


void showImages(std::span<const std::filesystem::path> images)
{
    for (const auto& path: images)
    {
        const auto title = path.filename().string();
        cv::imshow(title, readImage(path));
        cv::waitKey(0);
        cv::destroyAllWindows();
    }
}
