#include <gtest/gtest.h>

#include "appicon/source_loader.hpp"
#include "test_util.hpp"

using namespace appicon;

TEST(SourceLoaderTest, MissingFileIsInputNotFound)
{
    appicon_test::TempDir dir;
    auto result = loadMaster(dir.path() / "nope.png");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorKind::InputNotFound);
    EXPECT_TRUE(result.image.empty());
}

TEST(SourceLoaderTest, DirectoryIsInputNotFound)
{
    appicon_test::TempDir dir;
    auto result = loadMaster(dir.path());
    EXPECT_EQ(result.error, ErrorKind::InputNotFound);
}

TEST(SourceLoaderTest, CorruptFileIsDecodeError)
{
    appicon_test::TempDir dir;
    auto path = dir.path() / "broken.png";
    {
        std::ofstream out(path, std::ios::binary);
        out << "\x89PNG\r\n\x1a\n this is not really a png";
    }

    auto result = loadMaster(path);
    EXPECT_EQ(result.error, ErrorKind::DecodeError);
    EXPECT_NE(result.message.find("broken.png"), std::string::npos) << result.message;
}

TEST(SourceLoaderTest, OpaqueImageGetsAlphaChannel)
{
    appicon_test::TempDir dir;
    auto path = dir.path() / "rgb.png";
    cv::Mat rgb(20, 30, CV_8UC3, cv::Scalar(10, 20, 30));
    ASSERT_TRUE(cv::imwrite(path.string(), rgb));

    auto result = loadMaster(path);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.sourceChannels, 3);
    EXPECT_EQ(result.image.type(), CV_8UC4);
    EXPECT_EQ(result.image.size(), cv::Size(30, 20));
    EXPECT_EQ(result.image.at<cv::Vec4b>(5, 5), cv::Vec4b(10, 20, 30, 255));
}

TEST(SourceLoaderTest, KeepsExistingAlpha)
{
    appicon_test::TempDir dir;
    auto path = dir.path() / "bgra.png";
    cv::Mat bgra(16, 16, CV_8UC4, cv::Scalar(1, 2, 3, 77));
    ASSERT_TRUE(cv::imwrite(path.string(), bgra));

    auto result = loadMaster(path);
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.image.at<cv::Vec4b>(0, 0), cv::Vec4b(1, 2, 3, 77));
}

TEST(SourceLoaderTest, NormalizesGreyAndDeepImages)
{
    cv::Mat out;
    std::string err;

    cv::Mat grey(4, 4, CV_8UC1, cv::Scalar(90));
    ASSERT_TRUE(normalizeToBgra(grey, out, err)) << err;
    EXPECT_EQ(out.at<cv::Vec4b>(1, 1), cv::Vec4b(90, 90, 90, 255));

    cv::Mat greyAlpha(4, 4, CV_8UC2, cv::Scalar(90, 40));
    ASSERT_TRUE(normalizeToBgra(greyAlpha, out, err)) << err;
    EXPECT_EQ(out.at<cv::Vec4b>(1, 1), cv::Vec4b(90, 90, 90, 40));

    cv::Mat deep(4, 4, CV_16UC4, cv::Scalar(65535, 0, 257 * 100, 65535));
    ASSERT_TRUE(normalizeToBgra(deep, out, err)) << err;
    EXPECT_EQ(out.type(), CV_8UC4);
    EXPECT_EQ(out.at<cv::Vec4b>(1, 1), cv::Vec4b(255, 0, 100, 255));

    cv::Mat floating(4, 4, CV_32FC3);
    EXPECT_FALSE(normalizeToBgra(floating, out, err));
}
