/******************************************************************************
 * @brief Atomic functional library for estimating how many unit sized objects a
 * set of component areas represents, given the area window of one object.
 *
 * @file CountEstimator.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-27
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef COUNT_ESTIMATOR_HPP
#define COUNT_ESTIMATOR_HPP

#include "../Constants.h"
#include "../Logging.h"
#include "../vision/algorithms/ComponentStatistics.hpp"

/// \cond
#include <cmath>
#include <opencv2/opencv.hpp>
#include <optional>
#include <utility>
#include <vector>

/// \endcond

namespace CountEstimator
{
    /******************************************************************************
     * @brief Round to the nearest integer with exact halves going to the even
     * neighbour (1.5 -> 2, 2.5 -> 2). Independent of the FPU rounding mode, so the
     * search and inference paths always agree.
     *
     * @param dValue - Value to round.
     * @return double - The rounded value.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline double RoundHalfToEven(const double dValue)
    {
        double dFloor    = std::floor(dValue);
        double dFraction = dValue - dFloor;

        if (dFraction < 0.5)
        {
            return dFloor;
        }
        if (dFraction > 0.5)
        {
            return dFloor + 1.0;
        }

        return std::fmod(dFloor, 2.0) == 0.0 ? dFloor : dFloor + 1.0;
    }

    /******************************************************************************
     * @brief Mean area of the components inside the unit window (dLower, dUpper].
     *
     * @param vAreas - Component areas of one image.
     * @param dLower - Exclusive lower bound of the window.
     * @param dUpper - Inclusive upper bound of the window.
     * @return std::optional<double> - The mean, or nullopt if no area falls in the window.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline std::optional<double> UnitArea(const std::vector<int>& vAreas, const double dLower, const double dUpper)
    {
        double dSum   = 0.0;
        size_t siHits = 0;
        for (const int nArea : vAreas)
        {
            if (dLower < nArea && nArea <= dUpper)
            {
                dSum += nArea;
                ++siHits;
            }
        }

        if (siHits == 0)
        {
            return std::nullopt;
        }

        return dSum / static_cast<double>(siHits);
    }

    /******************************************************************************
     * @brief Estimate the object count of an image from its component areas.
     *
     * The mean area of the components in (dLower, dUpper] is taken as the size of
     * one object. Every component, inside the window or not, then contributes its
     * area divided by that mean, rounded. Merged clumps count as several objects
     * and specks of noise round to zero.
     *
     * @param vAreas - Component areas of one image (background excluded).
     * @param dLower - Exclusive lower bound of the unit window.
     * @param dUpper - Inclusive upper bound of the unit window.
     * @return std::optional<int> - The estimated count, or nullopt when the window holds
     *      no component (invalid range, there is no unit area to divide by).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline std::optional<int> EstimateCount(const std::vector<int>& vAreas, const double dLower, const double dUpper)
    {
        std::optional<double> dUnitArea = UnitArea(vAreas, dLower, dUpper);
        if (!dUnitArea.has_value())
        {
            return std::nullopt;
        }

        long long llFound = 0;
        for (const int nArea : vAreas)
        {
            llFound += static_cast<long long>(RoundHalfToEven(nArea / dUnitArea.value()));
        }

        return static_cast<int>(llFound);
    }

    /******************************************************************************
     * @brief Extract component statistics from a raw image and estimate its count.
     *
     * @param cvImage - Raw image of any size.
     * @param dLower - Exclusive lower bound of the unit window.
     * @param dUpper - Inclusive upper bound of the unit window.
     * @param pComponents - (Optional) Receives the extracted statistics.
     * @return std::optional<int> - The estimated count, or nullopt when the window holds no component.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline std::optional<int> CountObjects(const cv::Mat& cvImage, const double dLower, const double dUpper, ImageComponents* pComponents = nullptr)
    {
        ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);
        std::optional<int> nFound    = EstimateCount(stComponents.vAreas, dLower, dUpper);

        if (!nFound.has_value())
        {
            // Submit logger message.
            LOG_DEBUG(logging::g_qSharedLogger,
                      "CountObjects: None of the {} components fall in ({}, {}].",
                      stComponents.vAreas.size(),
                      dLower,
                      dUpper);
        }

        // Optional statistics output
        if (pComponents)
        {
            *pComponents = std::move(stComponents);
        }

        return nFound;
    }

    /******************************************************************************
     * @brief Count with a predicted window. A window that is inverted or holds no
     *      component is replaced by (COUNT_DEFAULT_LOWER_BOUND, COUNT_DEFAULT_UPPER_BOUND],
     *      and a count that still has no unit area is 0.
     *
     * @param vAreas - Component areas of one image (background excluded).
     * @param stWindow - The predicted window.
     * @return WindowedCount - The count, the window it used and whether the fallback was taken.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-09
     ******************************************************************************/
    inline WindowedCount CountWithWindow(const std::vector<int>& vAreas, const BoundaryPair& stWindow)
    {
        WindowedCount stResult;
        stResult.stWindow = stWindow;

        std::optional<int> nFound;
        if (stWindow.dLower < stWindow.dUpper)
        {
            nFound = EstimateCount(vAreas, stWindow.dLower, stWindow.dUpper);
        }

        if (!nFound.has_value())
        {
            // Submit logger message.
            LOG_WARNING(logging::g_qSharedLogger,
                        "CountWithWindow: Window ({:.1f}, {:.1f}] holds none of {} components, using ({}, {}].",
                        stWindow.dLower,
                        stWindow.dUpper,
                        vAreas.size(),
                        constants::COUNT_DEFAULT_LOWER_BOUND,
                        constants::COUNT_DEFAULT_UPPER_BOUND);

            stResult.bFellBack       = true;
            stResult.stWindow.dLower = constants::COUNT_DEFAULT_LOWER_BOUND;
            stResult.stWindow.dUpper = constants::COUNT_DEFAULT_UPPER_BOUND;
            nFound                   = EstimateCount(vAreas, stResult.stWindow.dLower, stResult.stWindow.dUpper);
        }

        stResult.nCount = nFound.value_or(0);
        return stResult;
    }
}    // namespace CountEstimator

#endif    // COUNT_ESTIMATOR_HPP
