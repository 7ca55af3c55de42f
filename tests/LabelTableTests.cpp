/******************************************************************************
 * @brief Unit tests for the label table loader and filter.
 *
 * @file LabelTableTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/Constants.h"
#include "../src/training/LabelTable.h"

/// \cond
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Writes CSV fixtures into a fresh temporary directory per test.
 ******************************************************************************/
class LabelTableTests : public ::testing::Test
{
    protected:
        std::filesystem::path m_pathDirectory;

        void SetUp() override
        {
            const ::testing::TestInfo* pInfo = ::testing::UnitTest::GetInstance()->current_test_info();
            m_pathDirectory                  = std::filesystem::temp_directory_path() / "granule_counter_label_tests" / pInfo->name();
            std::filesystem::remove_all(m_pathDirectory);
            std::filesystem::create_directories(m_pathDirectory);
        }

        void TearDown() override { std::filesystem::remove_all(m_pathDirectory); }

        std::string WriteCsv(const std::string& szContents)
        {
            std::filesystem::path pathCsv = m_pathDirectory / "labels.csv";
            std::ofstream fsOut(pathCsv);
            fsOut << szContents;
            return pathCsv.string();
        }

        LabelTable Load(const std::string& szPath)
        {
            return labeltable::LoadLabelTable(szPath, constants::DATASET_DROP_COLUMNS, constants::DATASET_IMAGE_ID_COLUMN, constants::DATASET_LABEL_COLUMN);
        }
};

TEST(LabelTableParsingTests, SplitHandlesQuotes)
{
    std::vector<std::string> vCells = labeltable::SplitCsvLine("1,\"a,b\",\"say \"\"hi\"\"\",");

    ASSERT_EQ(vCells.size(), 4u);
    EXPECT_EQ(vCells[0], "1");
    EXPECT_EQ(vCells[1], "a,b");
    EXPECT_EQ(vCells[2], "say \"hi\"");
    EXPECT_EQ(vCells[3], "");
}

TEST(LabelTableParsingTests, ParseLabel)
{
    EXPECT_DOUBLE_EQ(labeltable::ParseLabel("12").value(), 12.0);
    EXPECT_DOUBLE_EQ(labeltable::ParseLabel(" 7.5 ").value(), 7.5);
    EXPECT_FALSE(labeltable::ParseLabel("").has_value());
    EXPECT_FALSE(labeltable::ParseLabel("   ").has_value());
    EXPECT_FALSE(labeltable::ParseLabel("nan").has_value());
    EXPECT_FALSE(labeltable::ParseLabel("NaN").has_value());
    EXPECT_FALSE(labeltable::ParseLabel("twelve").has_value());
    EXPECT_FALSE(labeltable::ParseLabel("12abc").has_value());
}

TEST(LabelTableParsingTests, NormalizeImageId)
{
    EXPECT_EQ(labeltable::NormalizeImageId("42"), "42");
    EXPECT_EQ(labeltable::NormalizeImageId("42.0"), "42");
    EXPECT_EQ(labeltable::NormalizeImageId(" 7 "), "7");
    EXPECT_EQ(labeltable::NormalizeImageId("img_3"), "img_3");
}

TEST_F(LabelTableTests, LoadDropsIndexColumns)
{
    std::string szPath = this->WriteCsv("Unnamed: 0,ImageId,prop_count,Unnamed: 0.1\n"
                                        "0,1,12,0\n"
                                        "1,2,,1\n"
                                        "2,3.0,nan,2\n");

    LabelTable stTable = this->Load(szPath);

    EXPECT_EQ(stTable.vColumns, (std::vector<std::string>{"ImageId", "prop_count"}));
    ASSERT_EQ(stTable.vRows.size(), 3u);
    EXPECT_EQ(stTable.vRows[0].szImageId, "1");
    EXPECT_DOUBLE_EQ(stTable.vRows[0].dLabel.value(), 12.0);
    EXPECT_EQ(stTable.vRows[1].szImageId, "2");
    EXPECT_FALSE(stTable.vRows[1].dLabel.has_value());
    EXPECT_EQ(stTable.vRows[2].szImageId, "3");
    EXPECT_FALSE(stTable.vRows[2].dLabel.has_value());
}

TEST_F(LabelTableTests, LoadToleratesWindowsLineEndingsAndShortRows)
{
    std::string szPath = this->WriteCsv("ImageId,prop_count\r\n5,9\r\n6\r\n\r\n");

    LabelTable stTable = this->Load(szPath);

    ASSERT_EQ(stTable.vRows.size(), 2u);
    EXPECT_DOUBLE_EQ(stTable.vRows[0].dLabel.value(), 9.0);
    EXPECT_EQ(stTable.vRows[1].szImageId, "6");
    EXPECT_FALSE(stTable.vRows[1].dLabel.has_value());
}

TEST_F(LabelTableTests, MissingColumnThrows)
{
    std::string szPath = this->WriteCsv("ImageId,count\n1,2\n");

    EXPECT_THROW(this->Load(szPath), std::runtime_error);
}

TEST_F(LabelTableTests, MissingFileThrows)
{
    EXPECT_THROW(this->Load((m_pathDirectory / "absent.csv").string()), std::runtime_error);
}

TEST_F(LabelTableTests, EmptyFileThrows)
{
    std::string szPath = this->WriteCsv("");

    EXPECT_THROW(this->Load(szPath), std::runtime_error);
}

TEST_F(LabelTableTests, FilterDropsUnusableRows)
{
    std::string szPath = this->WriteCsv("ImageId,prop_count\n"
                                        "1,10\n"
                                        "2,\n"
                                        "3,0\n"
                                        "4,-2\n"
                                        "104,8\n"
                                        "5,6\n");

    LabelTable stTable                 = this->Load(szPath);
    std::vector<LabeledImage> vLabeled = labeltable::FilterLabelTable(stTable, {"104"});

    ASSERT_EQ(vLabeled.size(), 2u);
    EXPECT_EQ(vLabeled[0].szImageId, "1");
    EXPECT_DOUBLE_EQ(vLabeled[0].dLabel, 10.0);
    EXPECT_EQ(vLabeled[1].szImageId, "5");
    EXPECT_DOUBLE_EQ(vLabeled[1].dLabel, 6.0);
}

TEST(LabelTableConstantsTests, DropListCoversKnownBadImages)
{
    const std::vector<std::string>& vDrop = constants::DATASET_DROP_IMAGE_IDS;

    EXPECT_NE(std::find(vDrop.begin(), vDrop.end(), "104"), vDrop.end());
    EXPECT_NE(std::find(vDrop.begin(), vDrop.end(), "904"), vDrop.end());
    EXPECT_NE(std::find(vDrop.begin(), vDrop.end(), "999"), vDrop.end());
    EXPECT_EQ(std::find(vDrop.begin(), vDrop.end(), "903"), vDrop.end());
    EXPECT_EQ(vDrop.size(), 97u);
}
