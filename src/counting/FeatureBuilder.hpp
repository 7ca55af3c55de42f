/******************************************************************************
 * @brief Atomic functional library that turns an image's component area
 * distribution into the fixed length histogram the regressor learns from.
 *
 * @file FeatureBuilder.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-28
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef FEATURE_BUILDER_HPP
#define FEATURE_BUILDER_HPP

#include "../Constants.h"
#include "../util/counting/CountingModels.hpp"
#include "../vision/algorithms/ComponentStatistics.hpp"

/// \cond
#include <algorithm>
#include <vector>

/// \endcond

namespace FeatureBuilder
{
    /******************************************************************************
     * @brief Histogram bin of one component area. Bin 0 is [0, w], bin i > 0 is
     * (i*w, (i+1)*w]. Areas past the last edge but under the cutoff land in the
     * last bin.
     *
     * @param nArea - Component area, must be under the cutoff.
     * @return int - The bin index.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline int AreaBin(const int nArea)
    {
        int nBin = nArea <= constants::FEATURE_BIN_WIDTH ? 0 : (nArea - 1) / constants::FEATURE_BIN_WIDTH;
        return std::min(nBin, constants::FEATURE_BIN_COUNT - 1);
    }

    /******************************************************************************
     * @brief Normalized histogram of the component areas under the cutoff.
     *
     * @param vAreas - Foreground component areas.
     * @return std::vector<float> - FEATURE_BIN_COUNT shares in increasing bin order.
     *      They sum to 1, or are all 0 when no area is under the cutoff.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline std::vector<float> BuildAreaHistogram(const std::vector<int>& vAreas)
    {
        std::vector<int> vCounts(constants::FEATURE_BIN_COUNT, 0);
        int nPopulation = 0;

        for (const int nArea : vAreas)
        {
            if (nArea < constants::FEATURE_AREA_CUTOFF)
            {
                ++vCounts[AreaBin(nArea)];
                ++nPopulation;
            }
        }

        std::vector<float> vFeatures(constants::FEATURE_BIN_COUNT, 0.0f);
        if (nPopulation == 0)
        {
            return vFeatures;
        }

        for (int nBin = 0; nBin < constants::FEATURE_BIN_COUNT; ++nBin)
        {
            vFeatures[nBin] = static_cast<float>(static_cast<double>(vCounts[nBin]) / nPopulation);
        }

        return vFeatures;
    }

    /******************************************************************************
     * @brief Feature vector of one image from its component statistics. The
     * background row never contributes.
     *
     * @param vStats - Statistics rows with the background at index 0.
     * @return std::vector<float> - The normalized area histogram.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-28
     ******************************************************************************/
    inline std::vector<float> BuildFeatures(const std::vector<ComponentStatsRow>& vStats)
    {
        return BuildAreaHistogram(ComponentStatistics::ToAreaVector(vStats));
    }
}    // namespace FeatureBuilder

#endif    // FEATURE_BUILDER_HPP
