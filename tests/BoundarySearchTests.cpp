/******************************************************************************
 * @brief Unit tests for the boundary search.
 *
 * @file BoundarySearchTests.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/counting/BoundarySearch.hpp"

/// \cond
#include <cmath>
#include <gtest/gtest.h>
#include <vector>

/// \endcond

TEST(BoundarySearchTests, GridRunsFromFortyToNineHundredNinety)
{
    std::vector<int> vGrid = BoundarySearch::UpperBoundGrid();

    ASSERT_EQ(vGrid.size(), 96u);
    EXPECT_EQ(vGrid.front(), 40);
    EXPECT_EQ(vGrid.back(), 990);
    for (size_t siIter = 1; siIter < vGrid.size(); ++siIter)
    {
        EXPECT_EQ(vGrid[siIter] - vGrid[siIter - 1], 10);
    }
}

TEST(BoundarySearchTests, RelativeError)
{
    EXPECT_DOUBLE_EQ(BoundarySearch::RelativeError(9, 5.0), 0.8);
    EXPECT_DOUBLE_EQ(BoundarySearch::RelativeError(3, 5.0), 0.4);
    EXPECT_DOUBLE_EQ(BoundarySearch::RelativeError(5, 5.0), 0.0);
}

TEST(BoundarySearchTests, MixedAreasPickFirstBestWindow)
{
    // (30, 40] is empty, (30, 50..290] counts 9, (30, 300..990] counts 3.
    BoundarySearchResult stResult = BoundarySearch::SearchBounds({50, 55, 52, 300}, 5.0);

    EXPECT_EQ(stResult.nLower, 30);
    EXPECT_EQ(stResult.nUpper, 300);
    EXPECT_NEAR(stResult.dMinRelativeError, 0.4, 1e-12);
}

TEST(BoundarySearchTests, EmptyAreasScoreAsZeroObjects)
{
    BoundarySearchResult stResult = BoundarySearch::SearchBounds({}, 7.0);

    EXPECT_EQ(stResult.nLower, 30);
    EXPECT_EQ(stResult.nUpper, 40);
    EXPECT_DOUBLE_EQ(stResult.dMinRelativeError, 1.0);
}

TEST(BoundarySearchTests, ExactFitIsFound)
{
    // Ten objects of about 100 pixels and one clump of three.
    std::vector<int> vAreas = {98, 101, 100, 99, 102, 97, 100, 103, 100, 100, 300};
    BoundarySearchResult stResult = BoundarySearch::SearchBounds(vAreas, 13.0);

    EXPECT_EQ(stResult.nLower, 30);
    EXPECT_DOUBLE_EQ(stResult.dMinRelativeError, 0.0);
    EXPECT_GE(stResult.nUpper, 40);
    EXPECT_LE(stResult.nUpper, 990);
    EXPECT_EQ(stResult.nUpper % 10, 0);
}

TEST(BoundarySearchTests, NonPositiveTruthHasInfiniteError)
{
    BoundarySearchResult stResult = BoundarySearch::SearchBounds({50, 60}, 0.0);

    EXPECT_EQ(stResult.nLower, 30);
    EXPECT_TRUE(std::isinf(stResult.dMinRelativeError));
}
