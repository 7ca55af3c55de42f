/******************************************************************************
 * @brief Defines the ImageSource interface class.
 *
 * @file ImageSource.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-22
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef IMAGESOURCE_HPP
#define IMAGESOURCE_HPP

/// \cond
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Lookup from an image identifier to its decoded pixels. The dataset
 *      assembler only talks to this interface, so images can come from disk or
 *      be generated in memory.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-22
 ******************************************************************************/
class ImageSource
{
    public:
        virtual ~ImageSource() = default;

        /******************************************************************************
         * @brief Decode the image stored under an identifier.
         *
         * @param szImageId - Identifier of the image.
         * @return std::optional<cv::Mat> - 3 channel BGR pixels of any size, or nullopt if
         *      the image is missing or cannot be decoded.
         ******************************************************************************/
        virtual std::optional<cv::Mat> ReadImage(const std::string& szImageId) = 0;

        /******************************************************************************
         * @brief Human readable location of this source, used in log messages.
         *
         * @return std::string - The location.
         ******************************************************************************/
        virtual std::string GetSourceLocation() const = 0;
};

#endif
