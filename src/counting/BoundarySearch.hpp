/******************************************************************************
 * @brief Atomic functional library that brute forces the unit area window of
 * one labeled image against its ground truth count.
 *
 * @file BoundarySearch.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef BOUNDARY_SEARCH_HPP
#define BOUNDARY_SEARCH_HPP

#include "../Constants.h"
#include "../Logging.h"
#include "../util/counting/CountingModels.hpp"
#include "./CountEstimator.hpp"

/// \cond
#include <cmath>
#include <limits>
#include <vector>

/// \endcond

namespace BoundarySearch
{
    /******************************************************************************
     * @brief Relative count error |nFound - dTrueCount| / dTrueCount.
     *
     * @param nFound - Estimated count.
     * @param dTrueCount - Ground truth count, must be positive.
     * @return double - The relative error.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline double RelativeError(const int nFound, const double dTrueCount)
    {
        return std::abs(nFound - dTrueCount) / dTrueCount;
    }

    /******************************************************************************
     * @brief Candidate upper bounds scanned by the search, in increasing order:
     * nLower + nStep up to (but excluding) nLimit.
     *
     * @param nLower - The fixed lower bound.
     * @param nStep - Grid spacing.
     * @param nLimit - Exclusive end of the grid.
     * @return std::vector<int> - The grid.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline std::vector<int> UpperBoundGrid(const int nLower = constants::SEARCH_LOWER_BOUND,
                                           const int nStep  = constants::SEARCH_STEP,
                                           const int nLimit = constants::SEARCH_UPPER_LIMIT)
    {
        std::vector<int> vGrid;
        for (int nUpper = nLower + nStep; nUpper < nLimit; nUpper += nStep)
        {
            vGrid.push_back(nUpper);
        }

        return vGrid;
    }

    /******************************************************************************
     * @brief Find the upper bound whose window gives the count closest to the truth.
     *
     * The lower bound is pinned at SEARCH_LOWER_BOUND and only the upper bound is
     * scanned. The objective snaps between rounded multiples as the unit mean
     * shifts, so it is neither smooth nor convex and the whole grid is evaluated.
     * A window holding no component counts as an estimate of 0. The first (lowest)
     * upper bound reaching the minimum wins ties.
     *
     * @param vAreas - Component areas of one image.
     * @param dTrueCount - Ground truth count of the image, must be positive.
     * @return BoundarySearchResult - (lower, best upper, minimum relative error).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline BoundarySearchResult SearchBounds(const std::vector<int>& vAreas, const double dTrueCount)
    {
        BoundarySearchResult stResult;
        stResult.nLower            = constants::SEARCH_LOWER_BOUND;
        stResult.nUpper            = constants::SEARCH_LOWER_BOUND + constants::SEARCH_STEP;
        stResult.dMinRelativeError = constants::SEARCH_INITIAL_ERROR;

        // The error is undefined without a positive truth.
        if (!(dTrueCount > 0.0))
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "SearchBounds: Ground truth count must be positive, got {}.", dTrueCount);
            stResult.dMinRelativeError = std::numeric_limits<double>::infinity();
            return stResult;
        }

        for (const int nUpper : UpperBoundGrid())
        {
            // An empty window means no estimate, which scores as zero objects.
            std::optional<int> nEstimate = CountEstimator::EstimateCount(vAreas, stResult.nLower, nUpper);
            int nFound                   = nEstimate.value_or(0);

            double dError = RelativeError(nFound, dTrueCount);
            LOG_TRACE_L1(logging::g_qSharedLogger, "SearchBounds: ({}, {}] -> {} found, error {:.4f}.", stResult.nLower, nUpper, nFound, dError);

            if (dError < stResult.dMinRelativeError)
            {
                stResult.dMinRelativeError = dError;
                stResult.nUpper            = nUpper;
            }
        }

        return stResult;
    }
}    // namespace BoundarySearch

#endif    // BOUNDARY_SEARCH_HPP
