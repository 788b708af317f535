#include <gtest/gtest.h>
#include "sliceerrors.h"
#include "sourceimage.h"
#include "testutils.h"

TEST(SourceImageTest, DecodedSourceDoesNotFollowCallerBuffer)
{
    cv::Mat pixels = testutils::gradientImage(40, 80);
    cv::Mat original = pixels.clone();
    SourceImage image = SourceImage::fromMat(pixels, "shot.png");

    // The caller reuses its buffer after handing the image over
    pixels.setTo(cv::Scalar(0, 0, 0));

    cv::Mat decoded = image.decode();
    ASSERT_EQ(decoded.size(), original.size());
    EXPECT_EQ(cv::norm(decoded, original, cv::NORM_INF), 0.0);
    EXPECT_NE(decoded.data, pixels.data);
}

TEST(SourceImageTest, DecodesEncodedBytes)
{
    SourceImage image = SourceImage::fromEncoded(testutils::encodePng(testutils::gradientImage(30, 50)),
                                                 "capture.final.png");

    EXPECT_FALSE(image.isNull());
    EXPECT_GT(image.encodedSize(), 0);
    cv::Mat decoded = image.decode();
    EXPECT_EQ(decoded.cols, 30);
    EXPECT_EQ(decoded.rows, 50);
    EXPECT_EQ(image.baseName(), "capture.final");
}

TEST(SourceImageTest, UnreadableBytesThrow)
{
    EXPECT_TRUE(SourceImage().isNull());
    EXPECT_THROW(SourceImage().decode(), DecodeError);
    EXPECT_THROW(SourceImage::fromEncoded("not an image", "x.png").decode(), DecodeError);
}
