/******************************************************************************
 * @brief Unit tests for the feature builder.
 *
 * @file FeatureBuilderTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/counting/FeatureBuilder.hpp"

/// \cond
#include <gtest/gtest.h>
#include <numeric>
#include <vector>

/// \endcond

TEST(FeatureBuilderTests, BinEdges)
{
    EXPECT_EQ(FeatureBuilder::AreaBin(0), 0);
    EXPECT_EQ(FeatureBuilder::AreaBin(10), 0);
    EXPECT_EQ(FeatureBuilder::AreaBin(11), 1);
    EXPECT_EQ(FeatureBuilder::AreaBin(20), 1);
    EXPECT_EQ(FeatureBuilder::AreaBin(21), 2);
    EXPECT_EQ(FeatureBuilder::AreaBin(980), 97);
    EXPECT_EQ(FeatureBuilder::AreaBin(990), 98);
    EXPECT_EQ(FeatureBuilder::AreaBin(995), 98);
    EXPECT_EQ(FeatureBuilder::AreaBin(999), 98);
}

TEST(FeatureBuilderTests, HistogramIsNormalized)
{
    std::vector<float> vFeatures = FeatureBuilder::BuildAreaHistogram({5, 10, 11, 995, 1000, 5000});

    ASSERT_EQ(vFeatures.size(), 99u);
    EXPECT_FLOAT_EQ(vFeatures[0], 0.5f);
    EXPECT_FLOAT_EQ(vFeatures[1], 0.25f);
    EXPECT_FLOAT_EQ(vFeatures[98], 0.25f);
    EXPECT_NEAR(std::accumulate(vFeatures.begin(), vFeatures.end(), 0.0), 1.0, 1e-6);
    for (const float fShare : vFeatures)
    {
        EXPECT_GE(fShare, 0.0f);
        EXPECT_LE(fShare, 1.0f);
    }
}

TEST(FeatureBuilderTests, OnlyLargeAreasGiveZeroVector)
{
    std::vector<float> vFeatures = FeatureBuilder::BuildAreaHistogram({1000, 2500});
    ASSERT_EQ(vFeatures.size(), 99u);
    EXPECT_EQ(std::accumulate(vFeatures.begin(), vFeatures.end(), 0.0), 0.0);

    vFeatures = FeatureBuilder::BuildAreaHistogram({});
    ASSERT_EQ(vFeatures.size(), 99u);
    EXPECT_EQ(std::accumulate(vFeatures.begin(), vFeatures.end(), 0.0), 0.0);
}

TEST(FeatureBuilderTests, BackgroundRowIsExcluded)
{
    std::vector<ComponentStatsRow> vStats(3);
    vStats[0].nArea = 500;    // background
    vStats[1].nArea = 100;
    vStats[2].nArea = 100;

    std::vector<float> vFeatures = FeatureBuilder::BuildFeatures(vStats);
    EXPECT_FLOAT_EQ(vFeatures[FeatureBuilder::AreaBin(100)], 1.0f);
    EXPECT_FLOAT_EQ(vFeatures[FeatureBuilder::AreaBin(500)], 0.0f);

    // Only a background row.
    vFeatures = FeatureBuilder::BuildFeatures({vStats[0]});
    EXPECT_EQ(std::accumulate(vFeatures.begin(), vFeatures.end(), 0.0), 0.0);
}
