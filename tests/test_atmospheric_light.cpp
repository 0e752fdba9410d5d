
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <limits>
#include <vector>

#include "atmospheric_light.hpp"
#include "dark_channel.hpp"


namespace
{
    Dehaze::Image randomImage(int rows, int cols, std::uint64_t seed)
    {
        cv::RNG rng(seed);
        Dehaze::Image image(rows, cols);
        rng.fill(image, cv::RNG::UNIFORM, 0.0, 1.0);

        return image;
    }

    Dehaze::Map rowMap(const std::vector<double>& values)
    {
        Dehaze::Map map(1, static_cast<int>(values.size()));
        for (std::size_t i = 0; i < values.size(); i++)
            map(0, static_cast<int>(i)) = values[i];

        return map;
    }
}


TEST(AtmosphericLightTest, singleWhitePixel)
{
    Dehaze::Image image(2, 2, cv::Vec3d::all(0.0));
    image(1, 0) = cv::Vec3d::all(1.0);

    const auto dark = Dehaze::channelMinimum(image);
    const auto light = Dehaze::atmosphericLight(image, dark, 0.25);

    EXPECT_DOUBLE_EQ(light[0] * 255.0, 255.0);
    EXPECT_DOUBLE_EQ(light[1] * 255.0, 255.0);
    EXPECT_DOUBLE_EQ(light[2] * 255.0, 255.0);
}


TEST(AtmosphericLightTest, uniformImage)
{
    const Dehaze::Image image(4, 4, cv::Vec3d::all(50.0 / 255.0));
    const auto dark = Dehaze::darkChannel(image, 1);

    const auto light = Dehaze::atmosphericLight(image, dark, 1.0);

    for (int c = 0; c < 3; c++)
        EXPECT_NEAR(light[c], 50.0 / 255.0, 1e-12);
}


TEST(AtmosphericLightTest, brightestDarkChannelPixelsAreUsed)
{
    Dehaze::Image image(1, 4);
    image(0, 0) = cv::Vec3d(0.1, 0.1, 0.1);
    image(0, 1) = cv::Vec3d(0.2, 0.4, 0.6);
    image(0, 2) = cv::Vec3d(0.4, 0.6, 0.8);
    image(0, 3) = cv::Vec3d(0.9, 0.9, 0.9);

    const auto dark = rowMap({0.1, 0.9, 0.5, 0.2});

    // 4 * 0.5 = 2 pixels: second and third
    const auto light = Dehaze::atmosphericLight(image, dark, 0.5);

    EXPECT_NEAR(light[0], 0.3, 1e-12);
    EXPECT_NEAR(light[1], 0.5, 1e-12);
    EXPECT_NEAR(light[2], 0.7, 1e-12);
}


TEST(AtmosphericLightTest, pixelCountIsRoundedDown)
{
    Dehaze::Image image(1, 10, cv::Vec3d::all(0.0));
    image(0, 0) = cv::Vec3d::all(1.0);
    image(0, 1) = cv::Vec3d::all(0.5);
    image(0, 2) = cv::Vec3d::all(0.25);

    const auto dark = rowMap({0.9, 0.8, 0.7, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0});

    // floor(10 * 0.29) = 2
    const auto light = Dehaze::atmosphericLight(image, dark, 0.29);
    EXPECT_NEAR(light[0], 0.75, 1e-12);

    // at least one pixel is always taken
    const auto tight = Dehaze::atmosphericLight(image, dark, 0.001);
    EXPECT_NEAR(tight[0], 1.0, 1e-12);
}


TEST(AtmosphericLightTest, allPixelsGiveMeanColor)
{
    const auto image = randomImage(13, 17, 5);
    const auto dark = Dehaze::darkChannel(image, 2);

    const auto light = Dehaze::atmosphericLight(image, dark, 1.0);
    const cv::Scalar mean = cv::mean(image);

    for (int c = 0; c < 3; c++)
        EXPECT_NEAR(light[c], mean[c], 1e-9);
}


TEST(AtmosphericLightTest, invalidArguments)
{
    const auto image = randomImage(4, 4, 3);
    const auto dark = Dehaze::darkChannel(image, 1);

    EXPECT_THROW(Dehaze::atmosphericLight(image, dark, 0.0), std::invalid_argument);
    EXPECT_THROW(Dehaze::atmosphericLight(image, dark, -0.2), std::invalid_argument);
    EXPECT_THROW(Dehaze::atmosphericLight(image, dark, 1.5), std::invalid_argument);
    EXPECT_THROW(Dehaze::atmosphericLight(image, Dehaze::Map(3, 4, 0.0), 0.5), std::invalid_argument);
    EXPECT_THROW(Dehaze::atmosphericLight(Dehaze::Image(), Dehaze::Map(), 0.5), std::invalid_argument);
}


class AtmosphericLightFractionTest: public testing::TestWithParam<double> { };

INSTANTIATE_TEST_SUITE_P(
    Fractions, AtmosphericLightFractionTest,
    testing::Values(0.001, 0.01, 0.2, 0.5, 1.0)
);


TEST_P(AtmosphericLightFractionTest, lightIsWithinChannelRange)
{
    const auto image = randomImage(40, 30, 11);
    const auto dark = Dehaze::darkChannel(image, 3);

    const auto light = Dehaze::atmosphericLight(image, dark, GetParam());

    std::vector<cv::Mat> channels;
    cv::split(image, channels);

    for (int c = 0; c < 3; c++)
    {
        double minValue = 0.0, maxValue = 0.0;
        cv::minMaxLoc(channels[c], &minValue, &maxValue);

        EXPECT_GE(light[c], minValue);
        EXPECT_LE(light[c], maxValue);
    }
}


TEST(AtmosphericLightTest, nonFiniteDarkChannelIsRejected)
{
    const auto image = randomImage(3, 3, 4);

    for (const double value: {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()})
    {
        Dehaze::Map dark = Dehaze::channelMinimum(image);
        dark(1, 2) = value;

        EXPECT_THROW(Dehaze::atmosphericLight(image, dark, 0.5), std::invalid_argument);
    }
}
