/******************************************************************************
 * @brief Defines the DirectoryImageSource class.
 *
 * @file DirectoryImageSource.h
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-08-17
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef DIRECTORYIMAGESOURCE_H
#define DIRECTORYIMAGESOURCE_H

#include "../../interfaces/ImageSource.hpp"

/// \cond
#include <filesystem>
#include <opencv2/opencv.hpp>

/// \endcond

/******************************************************************************
 * @brief Reads dataset images from a flat directory where every image is stored
 *  as <directory>/<image id><extension>.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-09-21
 ******************************************************************************/
class DirectoryImageSource : public ImageSource
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        DirectoryImageSource(const std::string& szDirectory, const std::string& szExtension);
        std::optional<cv::Mat> ReadImage(const std::string& szImageId) override;

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        std::filesystem::path GetImagePath(const std::string& szImageId) const;
        std::string GetSourceLocation() const override;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////
        std::filesystem::path m_pathDirectory;
        std::string m_szExtension;
};
#endif
