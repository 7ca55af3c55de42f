/******************************************************************************
 * @brief Defines the DatasetAssembler class.
 *
 * @file DatasetAssembler.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef DATASETASSEMBLER_H
#define DATASETASSEMBLER_H

#include "../interfaces/ImageSource.hpp"
#include "../util/counting/CountingModels.hpp"
#include "./LabelTable.h"

/// \cond
#include <opencv2/opencv.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Result of one assembly run. Training and held out examples are kept
 *      apart by identifier.
 ******************************************************************************/
struct AssembledDataset
{
    public:
        std::vector<TrainingExample> vTrainExamples;    // Rows the regressor may be fitted on.
        std::vector<TrainingExample> vTestExamples;     // Rows whose identifier is in the test set.
        size_t siFailedImages = 0;                      // Labeled rows dropped because their image could not be read.
};

/******************************************************************************
 * @brief Turns a ground truth table and an image source into the training
 *  matrix. Every labeled image goes through statistics extraction, the boundary
 *  search and the feature builder independently of every other image.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
class DatasetAssembler
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        explicit DatasetAssembler(ImageSource& pImageSource);

        std::optional<TrainingExample> BuildExample(const LabeledImage& stImage);
        AssembledDataset Assemble(const LabelTable& stTable, const std::set<std::string>& setDropImageIds, const std::set<std::string>& setTestImageIds);
        AssembledDataset LoadAndAssemble(const std::string& szCsvPath,
                                         const std::vector<std::string>& vDropColumns,
                                         const std::set<std::string>& setDropImageIds,
                                         const std::set<std::string>& setTestImageIds);

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////
        ImageSource& m_pImageSource;
};

/******************************************************************************
 * @brief Helpers that pack assembled examples into the matrices cv::ml expects.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-02
 ******************************************************************************/
namespace dataset
{
    cv::Mat ToFeatureMatrix(const std::vector<TrainingExample>& vExamples);
    cv::Mat ToBoundaryMatrix(const std::vector<TrainingExample>& vExamples);
}    // namespace dataset

#endif
