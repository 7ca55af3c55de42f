/******************************************************************************
 * @brief Atomic functional library that turns a raw photograph of granular
 * objects into per connected component bounding box and area statistics.
 *
 * @file ComponentStatistics.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-27
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef COMPONENT_STATISTICS_HPP
#define COMPONENT_STATISTICS_HPP

#include "../../Constants.h"
#include "../../Logging.h"
#include "../../util/counting/CountingModels.hpp"
#include "../../util/vision/ImageOperations.hpp"

/// \cond
#include <opencv2/opencv.hpp>
#include <vector>

/// \endcond

namespace ComponentStatistics
{
    /******************************************************************************
     * @brief Convert the stats matrix of cv::connectedComponentsWithStats into typed
     * rows. Row order (and therefore the background at index 0) is preserved.
     *
     * @param cvStats - CV_32S matrix with one row per label and CC_STAT_* columns.
     * @return std::vector<ComponentStatsRow> - One row per label.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline std::vector<ComponentStatsRow> ToStatsRows(const cv::Mat& cvStats)
    {
        std::vector<ComponentStatsRow> vRows;
        vRows.reserve(cvStats.rows);

        for (int nLabel = 0; nLabel < cvStats.rows; ++nLabel)
        {
            ComponentStatsRow stRow;
            stRow.nLeft   = cvStats.at<int>(nLabel, cv::CC_STAT_LEFT);
            stRow.nTop    = cvStats.at<int>(nLabel, cv::CC_STAT_TOP);
            stRow.nWidth  = cvStats.at<int>(nLabel, cv::CC_STAT_WIDTH);
            stRow.nHeight = cvStats.at<int>(nLabel, cv::CC_STAT_HEIGHT);
            stRow.nArea   = cvStats.at<int>(nLabel, cv::CC_STAT_AREA);
            vRows.push_back(stRow);
        }

        return vRows;
    }

    /******************************************************************************
     * @brief Drop the background row and keep only the component areas.
     *
     * @param vStats - Statistics rows with the background at index 0.
     * @return std::vector<int> - Area of every foreground component, in label order.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline std::vector<int> ToAreaVector(const std::vector<ComponentStatsRow>& vStats)
    {
        std::vector<int> vAreas;
        if (vStats.size() > 1)
        {
            vAreas.reserve(vStats.size() - 1);
            for (size_t siIter = 1; siIter < vStats.size(); ++siIter)
            {
                vAreas.push_back(vStats[siIter].nArea);
            }
        }

        return vAreas;
    }

    /******************************************************************************
     * @brief Label an already binarized mask and collect its component statistics.
     *
     * @param cvMask - CV_8UC1 mask where non zero pixels are foreground.
     * @param nConnectivity - 4 or 8 pixel connectivity.
     * @return ImageComponents - All statistics rows and the foreground area vector.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline ImageComponents LabelMask(const cv::Mat& cvMask, const int nConnectivity = constants::PREPARE_COMPONENT_CONNECTIVITY)
    {
        ImageComponents stResult;

        cv::Mat cvLabels, cvStats, cvCentroids;
        cv::connectedComponentsWithStats(cvMask, cvLabels, cvStats, cvCentroids, nConnectivity, CV_32S);

        stResult.vStats = ToStatsRows(cvStats);
        stResult.vAreas = ToAreaVector(stResult.vStats);

        return stResult;
    }

    /******************************************************************************
     * @brief Run the full normalization and labeling chain on one raw image:
     * 1. Resize to the canonical resolution.
     * 2. Cut the fixed border margin.
     * 3. Inverse Otsu binarization of the first channel.
     * 4. 4-connected component labeling.
     *
     * An image with no foreground is not an error. It yields only the background
     * row and an empty area vector, and downstream stages handle that.
     *
     * @param cvImage - Raw image of any size, usually 3 channel BGR.
     * @return ImageComponents - All statistics rows and the foreground area vector.
     *      Both are empty if the input image is empty.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-11-27
     ******************************************************************************/
    inline ImageComponents ExtractComponentStatistics(const cv::Mat& cvImage)
    {
        // 1. Validation
        if (cvImage.empty())
        {
            // Submit logger message.
            LOG_ERROR(logging::g_qSharedLogger, "ExtractComponentStatistics: Given image is empty.");
            return ImageComponents();
        }

        // 2. Normalize geometry
        cv::Mat cvResized;
        imgops::ResizeToCanonical(cvImage, cvResized);
        cv::Mat cvCut = imgops::CutBorder(cvResized);

        // 3. Binarize
        cv::Mat cvMask;
        double dThreshold = imgops::BinarizeInverseOtsu(cvCut, cvMask);

        // 4. Label
        ImageComponents stResult = LabelMask(cvMask);

        // Submit logger message.
        LOG_TRACE_L1(logging::g_qSharedLogger,
                     "ExtractComponentStatistics: Otsu threshold {} produced {} foreground components.",
                     dThreshold,
                     stResult.vAreas.size());

        return stResult;
    }
}    // namespace ComponentStatistics

#endif    // COMPONENT_STATISTICS_HPP
