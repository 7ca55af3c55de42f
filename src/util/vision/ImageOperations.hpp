/******************************************************************************
 * @brief Defines and implements the image preparation steps that run before
 *      component labeling. All functions are defined within the imgops namespace.
 *
 * @file ImageOperations.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-31
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef IMAGE_OPERATIONS_HPP
#define IMAGE_OPERATIONS_HPP

#include "../../Constants.h"
#include "../../Logging.h"

/// \cond
#include <opencv2/opencv.hpp>

/// \endcond

/******************************************************************************
 * @brief Namespace containing functions that normalize raw images into the
 *      canonical geometry and binary mask the component labeler expects.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-31
 ******************************************************************************/
namespace imgops
{
    /******************************************************************************
     * @brief Resize an image of any size to the canonical pipeline resolution.
     *
     * @param cvInputFrame - The raw image.
     * @param cvOutputFrame - The resized image.
     * @param nWidth - Target width in pixels.
     * @param nHeight - Target height in pixels.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-10-05
     ******************************************************************************/
    inline void ResizeToCanonical(const cv::Mat& cvInputFrame,
                                  cv::Mat& cvOutputFrame,
                                  const int nWidth  = constants::PREPARE_RESIZE_WIDTH,
                                  const int nHeight = constants::PREPARE_RESIZE_HEIGHT)
    {
        cv::resize(cvInputFrame, cvOutputFrame, cv::Size(nWidth, nHeight), 0, 0, constants::PREPARE_RESIZE_INTERPOLATION_METHOD);
    }

    /******************************************************************************
     * @brief Cut a fixed margin off every border of an image. Removes the frame,
     *      vignetting and tray edges that otherwise label as huge components.
     *
     * @param cvInputFrame - The image to cut.
     * @param nMargin - Number of pixels removed from each side.
     * @return cv::Mat - A deep copy of the inner region. If the image is too small to
     *      keep anything, a copy of the whole image is returned instead.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-10-18
     ******************************************************************************/
    inline cv::Mat CutBorder(const cv::Mat& cvInputFrame, const int nMargin = constants::PREPARE_CROP_MARGIN)
    {
        // Check that something survives the cut.
        if (nMargin <= 0 || cvInputFrame.cols <= 2 * nMargin || cvInputFrame.rows <= 2 * nMargin)
        {
            // Submit logger message.
            LOG_WARNING(logging::g_qSharedLogger,
                        "CutBorder: A margin of {} does not fit a {}x{} image. Keeping the whole image.",
                        nMargin,
                        cvInputFrame.cols,
                        cvInputFrame.rows);

            return cvInputFrame.clone();
        }

        cv::Rect cvInner(nMargin, nMargin, cvInputFrame.cols - 2 * nMargin, cvInputFrame.rows - 2 * nMargin);
        return cvInputFrame(cvInner).clone();
    }

    /******************************************************************************
     * @brief Binarize one channel of an image with Otsu's automatic threshold and
     *      inverted polarity, so objects darker than the background become 255.
     *
     * @param cvInputFrame - 8-bit image with one or more channels.
     * @param cvOutputMask - The CV_8UC1 mask, 255 for foreground and 0 for background.
     * @param nChannel - Which channel to threshold. Ignored for single channel images.
     * @return double - The threshold Otsu picked.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-10-18
     ******************************************************************************/
    inline double BinarizeInverseOtsu(const cv::Mat& cvInputFrame, cv::Mat& cvOutputMask, const int nChannel = constants::PREPARE_BINARIZE_CHANNEL)
    {
        cv::Mat cvSingleChannel;
        if (cvInputFrame.channels() == 1)
        {
            cvSingleChannel = cvInputFrame;
        }
        else
        {
            cv::extractChannel(cvInputFrame, cvSingleChannel, nChannel);
        }

        // Otsu only works on 8-bit input.
        if (cvSingleChannel.depth() != CV_8U)
        {
            cvSingleChannel.convertTo(cvSingleChannel, CV_8U);
        }

        return cv::threshold(cvSingleChannel, cvOutputMask, 255, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    }
}    // namespace imgops
#endif
