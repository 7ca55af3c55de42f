/******************************************************************************
 * @brief Implements the DatasetAssembler class.
 *
 * @file DatasetAssembler.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "DatasetAssembler.h"
#include "../Constants.h"
#include "../Logging.h"
#include "../counting/BoundarySearch.hpp"
#include "../counting/CountEstimator.hpp"
#include "../counting/FeatureBuilder.hpp"
#include "../util/TimeOperations.hpp"
#include "../vision/algorithms/ComponentStatistics.hpp"

/// \cond
#include <chrono>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Construct a new Dataset Assembler object.
 *
 * @param pImageSource - Where images are read from. Must outlive the assembler.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
DatasetAssembler::DatasetAssembler(ImageSource& pImageSource) : m_pImageSource(pImageSource) {}

/******************************************************************************
 * @brief Build the training example of one labeled image.
 *
 * The image is read once for the area vector the boundary search runs on, then
 * read again for the wide window (0, 1000] pass whose statistics feed the
 * feature histogram. The two passes never share state.
 *
 * @param stImage - Identifier and ground truth count.
 * @return std::optional<TrainingExample> - The example, or nullopt if the image
 *      could not be read. An image without components still yields an example
 *      with an all zero feature vector.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
std::optional<TrainingExample> DatasetAssembler::BuildExample(const LabeledImage& stImage)
{
    // 1. Boundary search pass
    std::optional<cv::Mat> cvSearchImage = m_pImageSource.ReadImage(stImage.szImageId);
    if (!cvSearchImage.has_value())
    {
        return std::nullopt;
    }

    ImageComponents stSearchComponents = ComponentStatistics::ExtractComponentStatistics(cvSearchImage.value());
    if (stSearchComponents.vAreas.empty())
    {
        // Submit logger message.
        LOG_WARNING(logging::g_qSharedLogger, "BuildExample: Image {} has no components, every window will estimate 0.", stImage.szImageId);
    }
    BoundarySearchResult stBest = BoundarySearch::SearchBounds(stSearchComponents.vAreas, stImage.dLabel);

    // 2. Wide window pass
    std::optional<cv::Mat> cvWideImage = m_pImageSource.ReadImage(stImage.szImageId);
    if (!cvWideImage.has_value())
    {
        return std::nullopt;
    }

    ImageComponents stWideComponents;
    std::optional<int> nWideEstimate =
        CountEstimator::CountObjects(cvWideImage.value(), constants::COUNT_WIDE_LOWER_BOUND, constants::COUNT_WIDE_UPPER_BOUND, &stWideComponents);

    // 3. Assemble
    TrainingExample stExample;
    stExample.szImageId       = stImage.szImageId;
    stExample.dTrueCount      = stImage.dLabel;
    stExample.vFeatures       = FeatureBuilder::BuildFeatures(stWideComponents.vStats);
    stExample.stBounds.dLower = stBest.nLower;
    stExample.stBounds.dUpper = stBest.nUpper;
    stExample.dSearchError    = stBest.dMinRelativeError;
    stExample.nWideEstimate   = nWideEstimate;

    // Submit logger message.
    LOG_DEBUG(logging::g_qSharedLogger,
              "BuildExample: Image {} ({} components, truth {}) best window ({}, {}] error {:.4f}, wide estimate {}.",
              stImage.szImageId,
              stSearchComponents.vAreas.size(),
              stImage.dLabel,
              stBest.nLower,
              stBest.nUpper,
              stBest.dMinRelativeError,
              nWideEstimate.value_or(0));

    return stExample;
}

/******************************************************************************
 * @brief Build one example per usable row of the table and split them into
 *      training and held out sets by identifier.
 *
 * @param stTable - The loaded label table.
 * @param setDropImageIds - Identifiers of known bad images, never built.
 * @param setTestImageIds - Identifiers held out of training.
 * @return AssembledDataset - Training and held out examples in table order.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
AssembledDataset DatasetAssembler::Assemble(const LabelTable& stTable, const std::set<std::string>& setDropImageIds, const std::set<std::string>& setTestImageIds)
{
    auto tmStart = std::chrono::steady_clock::now();

    AssembledDataset stDataset;
    std::vector<LabeledImage> vLabeled = labeltable::FilterLabelTable(stTable, setDropImageIds);

    for (const LabeledImage& stImage : vLabeled)
    {
        std::optional<TrainingExample> stExample = this->BuildExample(stImage);
        if (!stExample.has_value())
        {
            ++stDataset.siFailedImages;
            LOG_WARNING(logging::g_qSharedLogger, "Assemble: Skipping image {}, it could not be read from {}.", stImage.szImageId, m_pImageSource.GetSourceLocation());
            continue;
        }

        if (setTestImageIds.count(stExample->szImageId) > 0)
        {
            stDataset.vTestExamples.push_back(std::move(stExample.value()));
        }
        else
        {
            stDataset.vTrainExamples.push_back(std::move(stExample.value()));
        }
    }

    // Summarize search quality on the training rows.
    double dMeanError = 0.0;
    for (const TrainingExample& stExample : stDataset.vTrainExamples)
    {
        dMeanError += stExample.dSearchError;
    }
    if (!stDataset.vTrainExamples.empty())
    {
        dMeanError /= static_cast<double>(stDataset.vTrainExamples.size());
    }

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger,
             "Assemble: {} training and {} held out examples ({} unreadable) in {:.2f}s. Mean best relative error {:.4f}.",
             stDataset.vTrainExamples.size(),
             stDataset.vTestExamples.size(),
             stDataset.siFailedImages,
             timeops::GetElapsedSeconds(tmStart),
             dMeanError);

    return stDataset;
}

/******************************************************************************
 * @brief Load the labels file and assemble it.
 *
 * @param szCsvPath - Path to the labels file.
 * @param vDropColumns - Index artifact columns to remove.
 * @param setDropImageIds - Identifiers of known bad images.
 * @param setTestImageIds - Identifiers held out of training.
 * @return AssembledDataset - Training and held out examples.
 *
 * @throws std::runtime_error - The labels file is unusable.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
AssembledDataset DatasetAssembler::LoadAndAssemble(const std::string& szCsvPath,
                                                   const std::vector<std::string>& vDropColumns,
                                                   const std::set<std::string>& setDropImageIds,
                                                   const std::set<std::string>& setTestImageIds)
{
    LabelTable stTable = labeltable::LoadLabelTable(szCsvPath, vDropColumns, constants::DATASET_IMAGE_ID_COLUMN, constants::DATASET_LABEL_COLUMN);
    return this->Assemble(stTable, setDropImageIds, setTestImageIds);
}

namespace dataset
{
    /******************************************************************************
     * @brief Stack the feature vectors into one CV_32F row per example.
     *
     * @param vExamples - Assembled examples, all with the same feature length.
     * @return cv::Mat - N x FEATURE_BIN_COUNT sample matrix.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-02
     ******************************************************************************/
    cv::Mat ToFeatureMatrix(const std::vector<TrainingExample>& vExamples)
    {
        cv::Mat cvFeatures(static_cast<int>(vExamples.size()), constants::FEATURE_BIN_COUNT, CV_32F, cv::Scalar(0));
        for (int nRow = 0; nRow < cvFeatures.rows; ++nRow)
        {
            const std::vector<float>& vFeatures = vExamples[nRow].vFeatures;
            for (int nCol = 0; nCol < cvFeatures.cols && nCol < static_cast<int>(vFeatures.size()); ++nCol)
            {
                cvFeatures.at<float>(nRow, nCol) = vFeatures[nCol];
            }
        }

        return cvFeatures;
    }

    /******************************************************************************
     * @brief Stack the best windows into one CV_32F (lower, upper) row per example.
     *
     * @param vExamples - Assembled examples.
     * @return cv::Mat - N x 2 response matrix.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-02
     ******************************************************************************/
    cv::Mat ToBoundaryMatrix(const std::vector<TrainingExample>& vExamples)
    {
        cv::Mat cvBounds(static_cast<int>(vExamples.size()), 2, CV_32F);
        for (int nRow = 0; nRow < cvBounds.rows; ++nRow)
        {
            cvBounds.at<float>(nRow, 0) = static_cast<float>(vExamples[nRow].stBounds.dLower);
            cvBounds.at<float>(nRow, 1) = static_cast<float>(vExamples[nRow].stBounds.dUpper);
        }

        return cvBounds;
    }
}    // namespace dataset
