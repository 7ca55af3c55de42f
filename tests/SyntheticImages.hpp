/******************************************************************************
 * @brief Synthetic images and an in memory image source for the tests.
 *
 * @file SyntheticImages.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef SYNTHETIC_IMAGES_HPP
#define SYNTHETIC_IMAGES_HPP

#include "../src/Constants.h"
#include "../src/interfaces/ImageSource.hpp"

/// \cond
#include <map>
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

/// \endcond

namespace synthetic
{
    /******************************************************************************
     * @brief White canonical sized BGR image with a filled black rectangle per
     *      entry. Rectangles are in full image coordinates and must stay clear of
     *      the cut margin to survive extraction.
     *
     * @param vRects - Rectangles to draw.
     * @return cv::Mat - The 8UC3 image.
     ******************************************************************************/
    inline cv::Mat DrawRectangles(const std::vector<cv::Rect>& vRects)
    {
        cv::Mat cvImage(constants::PREPARE_RESIZE_HEIGHT, constants::PREPARE_RESIZE_WIDTH, CV_8UC3, cv::Scalar(255, 255, 255));
        for (const cv::Rect& cvRect : vRects)
        {
            cv::rectangle(cvImage, cvRect, cv::Scalar(0, 0, 0), cv::FILLED);
        }

        return cvImage;
    }

    /******************************************************************************
     * @brief A row of nCount squares of side nSide, spaced well apart.
     *
     * @param nCount - Number of squares.
     * @param nSide - Side length in pixels.
     * @param nTop - Row of the squares' top edge.
     * @return std::vector<cv::Rect> - The squares.
     ******************************************************************************/
    inline std::vector<cv::Rect> SquareRow(const int nCount, const int nSide, const int nTop)
    {
        std::vector<cv::Rect> vRects;
        for (int nIter = 0; nIter < nCount; ++nIter)
        {
            vRects.emplace_back(60 + nIter * (nSide + 20), nTop, nSide, nSide);
        }

        return vRects;
    }

    /******************************************************************************
     * @brief Image source backed by a map. Identifiers without an image read as
     *      missing. Counts how often each identifier was read.
     ******************************************************************************/
    class MemoryImageSource : public ImageSource
    {
        public:
            void AddImage(const std::string& szImageId, const cv::Mat& cvImage) { m_mImages[szImageId] = cvImage.clone(); }

            std::optional<cv::Mat> ReadImage(const std::string& szImageId) override
            {
                ++m_mReads[szImageId];
                auto itImage = m_mImages.find(szImageId);
                if (itImage == m_mImages.end())
                {
                    return std::nullopt;
                }

                return itImage->second.clone();
            }

            std::string GetSourceLocation() const override { return "memory"; }

            int GetReadCount(const std::string& szImageId) const
            {
                auto itReads = m_mReads.find(szImageId);
                return itReads == m_mReads.end() ? 0 : itReads->second;
            }

        private:
            std::map<std::string, cv::Mat> m_mImages;
            std::map<std::string, int> m_mReads;
    };
}    // namespace synthetic

#endif    // SYNTHETIC_IMAGES_HPP
