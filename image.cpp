#include <stdexcept>
#include <string>

#include "image.hpp"


namespace Dehaze
{
    Image toUnitRange(const cv::Mat& image)
    {
        requireNonEmpty(image, "input image");

        if (image.type() != CV_8UC3)
            throw std::invalid_argument("input image: expected 8-bit 3 channel image");

        Image result;
        image.convertTo(result, CV_64FC3, 1.0 / 255.0);

        return result;
    }

    cv::Mat toDisplay(const Map& map)
    {
        cv::Mat result;
        map.convertTo(result, CV_8UC1, 255.0);      // convertTo saturates

        return result;
    }

    void requireNonEmpty(const cv::Mat& image, std::string_view what)
    {
        if (image.empty() || image.rows < 1 || image.cols < 1)
            throw std::invalid_argument(std::string(what) + ": image is empty");
    }

    void requireSameSize(const cv::Mat& lhs, const cv::Mat& rhs, std::string_view what)
    {
        if (lhs.size() != rhs.size())
            throw std::invalid_argument(std::string(what) + ": size mismatch (" +
                                        std::to_string(lhs.cols) + "x" + std::to_string(lhs.rows) + " vs " +
                                        std::to_string(rhs.cols) + "x" + std::to_string(rhs.rows) + ")");
    }
}
