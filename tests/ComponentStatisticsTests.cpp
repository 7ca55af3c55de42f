/******************************************************************************
 * @brief Unit tests for image preparation and component statistics.
 *
 * @file ComponentStatisticsTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/util/vision/ImageOperations.hpp"
#include "../src/vision/algorithms/ComponentStatistics.hpp"
#include "./SyntheticImages.hpp"

/// \cond
#include <algorithm>
#include <gtest/gtest.h>
#include <vector>

/// \endcond

TEST(ImageOperationsTests, ResizeToCanonical)
{
    cv::Mat cvImage(123, 457, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat cvResized;
    imgops::ResizeToCanonical(cvImage, cvResized);

    EXPECT_EQ(cvResized.cols, 800);
    EXPECT_EQ(cvResized.rows, 600);
    EXPECT_EQ(cvResized.type(), CV_8UC3);
}

TEST(ImageOperationsTests, CutBorderRemovesMargin)
{
    cv::Mat cvImage(600, 800, CV_8UC1, cv::Scalar(0));
    cvImage(cv::Rect(30, 30, 740, 540)).setTo(cv::Scalar(200));

    cv::Mat cvCut = imgops::CutBorder(cvImage);
    EXPECT_EQ(cvCut.cols, 740);
    EXPECT_EQ(cvCut.rows, 540);
    EXPECT_EQ(cv::countNonZero(cvCut == 200), 740 * 540);
}

TEST(ImageOperationsTests, CutBorderKeepsTooSmallImage)
{
    cv::Mat cvImage(50, 50, CV_8UC1, cv::Scalar(7));
    cv::Mat cvCut = imgops::CutBorder(cvImage, 30);

    EXPECT_EQ(cvCut.size(), cvImage.size());
}

TEST(ImageOperationsTests, BinarizeMakesDarkObjectsForeground)
{
    cv::Mat cvImage(100, 100, CV_8UC3, cv::Scalar(220, 220, 220));
    cv::rectangle(cvImage, cv::Rect(10, 10, 20, 20), cv::Scalar(15, 15, 15), cv::FILLED);

    cv::Mat cvMask;
    imgops::BinarizeInverseOtsu(cvImage, cvMask);

    ASSERT_EQ(cvMask.type(), CV_8UC1);
    EXPECT_EQ(cv::countNonZero(cvMask), 400);
    EXPECT_EQ(cvMask.at<uchar>(15, 15), 255);
    EXPECT_EQ(cvMask.at<uchar>(50, 50), 0);
}

TEST(ComponentStatisticsTests, AreasOfSeparateRectangles)
{
    cv::Mat cvImage = synthetic::DrawRectangles({cv::Rect(100, 100, 10, 10), cv::Rect(300, 200, 20, 5), cv::Rect(500, 400, 7, 9)});

    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);

    ASSERT_EQ(stComponents.vStats.size(), 4u);
    ASSERT_EQ(stComponents.vAreas.size(), 3u);
    std::vector<int> vAreas = stComponents.vAreas;
    std::sort(vAreas.begin(), vAreas.end());
    EXPECT_EQ(vAreas, (std::vector<int>{63, 100, 100}));

    // Background is the rest of the cut image.
    EXPECT_EQ(stComponents.vStats[0].nArea, 740 * 540 - 263);
}

TEST(ComponentStatisticsTests, BoundingBoxesAreInCutCoordinates)
{
    cv::Mat cvImage = synthetic::DrawRectangles({cv::Rect(100, 80, 12, 6)});

    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);

    ASSERT_EQ(stComponents.vStats.size(), 2u);
    EXPECT_EQ(stComponents.vStats[1].nLeft, 70);
    EXPECT_EQ(stComponents.vStats[1].nTop, 50);
    EXPECT_EQ(stComponents.vStats[1].nWidth, 12);
    EXPECT_EQ(stComponents.vStats[1].nHeight, 6);
    EXPECT_EQ(stComponents.vStats[1].nArea, 72);
}

TEST(ComponentStatisticsTests, DiagonalNeighboursAreSeparate)
{
    // The squares only share a corner, which 4 connectivity does not join.
    cv::Mat cvImage = synthetic::DrawRectangles({cv::Rect(200, 200, 10, 10), cv::Rect(210, 210, 10, 10)});

    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);

    ASSERT_EQ(stComponents.vAreas.size(), 2u);
    EXPECT_EQ(stComponents.vAreas[0], 100);
    EXPECT_EQ(stComponents.vAreas[1], 100);
}

TEST(ComponentStatisticsTests, ObjectsInMarginAreCut)
{
    cv::Mat cvImage = synthetic::DrawRectangles({cv::Rect(5, 5, 20, 20), cv::Rect(400, 300, 10, 10)});

    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);

    ASSERT_EQ(stComponents.vAreas.size(), 1u);
    EXPECT_EQ(stComponents.vAreas[0], 100);
}

TEST(ComponentStatisticsTests, BlankImageHasOnlyBackground)
{
    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(synthetic::DrawRectangles({}));

    EXPECT_TRUE(stComponents.vAreas.empty());
}

TEST(ComponentStatisticsTests, EmptyImageYieldsNothing)
{
    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cv::Mat());

    EXPECT_TRUE(stComponents.vStats.empty());
    EXPECT_TRUE(stComponents.vAreas.empty());
}
