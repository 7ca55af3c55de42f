/******************************************************************************
 * @brief Unit tests for the directory backed image source.
 *
 * @file DirectoryImageSourceTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/vision/sources/DirectoryImageSource.h"
#include "./SyntheticImages.hpp"

/// \cond
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

/// \endcond

/******************************************************************************
 * @brief Fresh image directory per test.
 ******************************************************************************/
class DirectoryImageSourceTests : public ::testing::Test
{
    protected:
        std::filesystem::path m_pathDirectory;

        void SetUp() override
        {
            const ::testing::TestInfo* pInfo = ::testing::UnitTest::GetInstance()->current_test_info();
            m_pathDirectory                  = std::filesystem::temp_directory_path() / "granule_counter_image_tests" / pInfo->name();
            std::filesystem::remove_all(m_pathDirectory);
            std::filesystem::create_directories(m_pathDirectory);
        }

        void TearDown() override { std::filesystem::remove_all(m_pathDirectory); }
};

TEST_F(DirectoryImageSourceTests, MapsIdentifierToPath)
{
    DirectoryImageSource stSource(m_pathDirectory.string(), ".jpg");

    EXPECT_EQ(stSource.GetImagePath("42"), m_pathDirectory / "42.jpg");
    EXPECT_EQ(stSource.GetSourceLocation(), m_pathDirectory.string());
}

TEST_F(DirectoryImageSourceTests, ReadsLosslessImage)
{
    cv::Mat cvImage = synthetic::DrawRectangles({cv::Rect(100, 100, 10, 10)});
    ASSERT_TRUE(cv::imwrite((m_pathDirectory / "7.png").string(), cvImage));

    DirectoryImageSource stSource(m_pathDirectory.string(), ".png");
    std::optional<cv::Mat> cvRead = stSource.ReadImage("7");

    ASSERT_TRUE(cvRead.has_value());
    EXPECT_EQ(cvRead->size(), cvImage.size());
    EXPECT_EQ(cvRead->channels(), 3);
    EXPECT_EQ(cv::norm(cvRead.value(), cvImage, cv::NORM_INF), 0.0);
}

TEST_F(DirectoryImageSourceTests, MissingImageIsEmpty)
{
    DirectoryImageSource stSource(m_pathDirectory.string(), ".jpg");

    EXPECT_FALSE(stSource.ReadImage("1").has_value());
}

TEST_F(DirectoryImageSourceTests, UndecodableImageIsEmpty)
{
    std::ofstream fsOut(m_pathDirectory / "3.jpg");
    fsOut << "not an image";
    fsOut.close();

    DirectoryImageSource stSource(m_pathDirectory.string(), ".jpg");

    EXPECT_FALSE(stSource.ReadImage("3").has_value());
}

TEST_F(DirectoryImageSourceTests, MissingDirectoryStillConstructs)
{
    DirectoryImageSource stSource((m_pathDirectory / "absent").string(), ".jpg");

    EXPECT_FALSE(stSource.ReadImage("1").has_value());
}
