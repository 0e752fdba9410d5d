#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/imgproc.hpp>

#include "dark_channel.hpp"


namespace Dehaze
{
    Map channelMinimum(const Image& image)
    {
        requireNonEmpty(image, "dark channel");

        std::vector<cv::Mat> channels;
        cv::split(image, channels);

        Map result;
        cv::min(channels[0], channels[1], result);
        cv::min(result, channels[2], result);

        return result;
    }

    Map minFilter(const Map& map, int windowRadius)
    {
        requireNonEmpty(map, "dark channel");

        if (windowRadius < 1)
            throw std::invalid_argument("dark channel: window radius must be positive, got " + std::to_string(windowRadius));

        // window covering whole image gives the same result as any bigger one
        const int radius = std::min(windowRadius, std::max(map.rows, map.cols));
        const int side = 2 * radius + 1;

        const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(side, side));

        Map result;
        cv::erode(map, result, kernel, cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);

        return result;
    }

    Map darkChannel(const Image& image, int windowRadius)
    {
        if (windowRadius < 1)
            throw std::invalid_argument("dark channel: window radius must be positive, got " + std::to_string(windowRadius));

        const Map minimum = channelMinimum(image);
        return minFilter(minimum, windowRadius);
    }
}
