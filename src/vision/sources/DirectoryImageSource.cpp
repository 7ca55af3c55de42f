/******************************************************************************
 * @brief Implements the DirectoryImageSource class.
 *
 * @file DirectoryImageSource.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-19
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "DirectoryImageSource.h"
#include "../../Logging.h"

/******************************************************************************
 * @brief Construct a new Directory Image Source object.
 *
 * @param szDirectory - Directory that holds the images.
 * @param szExtension - Extension appended to each identifier, including the dot.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-20
 ******************************************************************************/
DirectoryImageSource::DirectoryImageSource(const std::string& szDirectory, const std::string& szExtension)
{
    // Initialize member variables.
    m_pathDirectory = szDirectory;
    m_szExtension   = szExtension;

    // Check the directory up front, a bad path would otherwise show up once per image.
    std::error_code errCode;
    if (!std::filesystem::is_directory(m_pathDirectory, errCode))
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "Image directory {} does not exist or is not a directory.", m_pathDirectory.string());
    }
    else
    {
        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "Reading dataset images from {} with extension {}.", m_pathDirectory.string(), m_szExtension);
    }
}

/******************************************************************************
 * @brief Decode the image of one identifier with cv::imread.
 *
 * @param szImageId - Identifier of the image.
 * @return std::optional<cv::Mat> - BGR pixels, or nullopt if missing or unreadable.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-20
 ******************************************************************************/
std::optional<cv::Mat> DirectoryImageSource::ReadImage(const std::string& szImageId)
{
    std::filesystem::path pathImage = this->GetImagePath(szImageId);

    // Check if file exists.
    std::error_code errCode;
    if (!std::filesystem::is_regular_file(pathImage, errCode))
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Image {} not found at {}.", szImageId, pathImage.string());
        return std::nullopt;
    }

    cv::Mat cvImage = cv::imread(pathImage.string(), cv::IMREAD_COLOR);
    if (cvImage.empty())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Image {} at {} could not be decoded.", szImageId, pathImage.string());
        return std::nullopt;
    }

    return cvImage;
}

/******************************************************************************
 * @brief Accessor for the on disk path of an identifier.
 *
 * @param szImageId - Identifier of the image.
 * @return std::filesystem::path - <directory>/<image id><extension>.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-20
 ******************************************************************************/
std::filesystem::path DirectoryImageSource::GetImagePath(const std::string& szImageId) const
{
    return m_pathDirectory / (szImageId + m_szExtension);
}

/******************************************************************************
 * @brief Accessor for the directory this source reads from.
 *
 * @return std::string - The directory.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-08-20
 ******************************************************************************/
std::string DirectoryImageSource::GetSourceLocation() const
{
    return m_pathDirectory.string();
}
