/******************************************************************************
 * @brief Main program file. Trains the boundary predictor or counts one image.
 *
 *        Usage:
 *            GranuleCounter [labels.csv] [image_dir] [model_out]
 *            GranuleCounter count <image> [model]
 *
 * @file main.cpp
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-06-20
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Constants.h"
#include "./Logging.h"
#include "counting/BoundarySearch.hpp"
#include "training/BoundaryPredictor.h"
#include "training/DatasetAssembler.h"
#include "util/TimeOperations.hpp"
#include "vision/sources/DirectoryImageSource.h"

/// \cond
#include <chrono>
#include <exception>
#include <optional>
#include <set>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Count the objects of held out images exactly the way count mode does
 *      and log how far each count is from the label.
 *
 * @param stPredictor - The freshly trained predictor.
 * @param stImageSource - Source the held out images are read from.
 * @param vTestExamples - Held out examples from the assembler.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-05
 ******************************************************************************/
void EvaluateHeldOut(const BoundaryPredictor& stPredictor, ImageSource& stImageSource, const std::vector<TrainingExample>& vTestExamples)
{
    if (vTestExamples.empty())
    {
        // Submit logger message.
        LOG_NOTICE(logging::g_qSharedLogger, "Evaluate: No held out images, skipping evaluation.");
        return;
    }

    double dErrorSum   = 0.0;
    size_t siEvaluated = 0;
    for (const TrainingExample& stExample : vTestExamples)
    {
        std::optional<cv::Mat> cvImage = stImageSource.ReadImage(stExample.szImageId);
        if (!cvImage.has_value())
        {
            continue;
        }

        WindowedCount stCount = stPredictor.CountImage(cvImage.value());
        double dError         = BoundarySearch::RelativeError(stCount.nCount, stExample.dTrueCount);
        dErrorSum += dError;
        ++siEvaluated;

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger,
                 "Evaluate: Image {} window ({:.1f}, {:.1f}]{} counted {} of {} (relative error {:.4f}).",
                 stExample.szImageId,
                 stCount.stWindow.dLower,
                 stCount.stWindow.dUpper,
                 stCount.bFellBack ? " (fallback)" : "",
                 stCount.nCount,
                 stExample.dTrueCount,
                 dError);
    }

    if (siEvaluated > 0)
    {
        // Submit logger message.
        LOG_NOTICE(logging::g_qSharedLogger,
                   "Evaluate: Mean relative error over {} held out images is {:.4f}.",
                   siEvaluated,
                   dErrorSum / static_cast<double>(siEvaluated));
    }
}

/******************************************************************************
 * @brief Assemble the dataset, fit the predictor and write it to disk.
 *
 * @param szCsvPath - Labels file.
 * @param szImageDirectory - Directory holding <ImageId>.jpg files.
 * @param szModelPath - Where the predictor is written.
 *
 * @throws std::runtime_error - The labels file is unusable, nothing could be
 *      assembled or the model could not be written.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-05
 ******************************************************************************/
void RunTraining(const std::string& szCsvPath, const std::string& szImageDirectory, const std::string& szModelPath)
{
    auto tmStart = std::chrono::steady_clock::now();

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "Training: Labels {}, images {}, model {}.", szCsvPath, szImageDirectory, szModelPath);

    std::set<std::string> setDropImageIds(constants::DATASET_DROP_IMAGE_IDS.begin(), constants::DATASET_DROP_IMAGE_IDS.end());
    std::set<std::string> setTestImageIds(constants::DATASET_TEST_IMAGE_IDS.begin(), constants::DATASET_TEST_IMAGE_IDS.end());

    DirectoryImageSource stImageSource(szImageDirectory, constants::DATASET_IMAGE_EXTENSION);
    DatasetAssembler stAssembler(stImageSource);
    AssembledDataset stDataset = stAssembler.LoadAndAssemble(szCsvPath, constants::DATASET_DROP_COLUMNS, setDropImageIds, setTestImageIds);

    BoundaryPredictor stPredictor =
        BoundaryPredictor::Train(dataset::ToFeatureMatrix(stDataset.vTrainExamples), dataset::ToBoundaryMatrix(stDataset.vTrainExamples));

    EvaluateHeldOut(stPredictor, stImageSource, stDataset.vTestExamples);

    stPredictor.Save(szModelPath);

    // Submit logger message.
    LOG_NOTICE(logging::g_qSharedLogger, "Training: Finished in {:.2f}s, predictor written to {}.", timeops::GetElapsedSeconds(tmStart), szModelPath);
}

/******************************************************************************
 * @brief Count the objects of one image with a saved predictor.
 *
 * @param szImagePath - Image file to count.
 * @param szModelPath - Predictor written by a training run.
 * @return int - Exit status number.
 *
 * @throws std::runtime_error - The model could not be read.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-05
 ******************************************************************************/
int RunCount(const std::string& szImagePath, const std::string& szModelPath)
{
    BoundaryPredictor stPredictor = BoundaryPredictor::Load(szModelPath);

    cv::Mat cvImage = cv::imread(szImagePath, cv::IMREAD_COLOR);
    if (cvImage.empty())
    {
        // Submit logger message.
        LOG_ERROR(logging::g_qSharedLogger, "Count: Unable to read image {}.", szImagePath);
        return 1;
    }

    ImageComponents stComponents;
    WindowedCount stCount = stPredictor.CountImage(cvImage, &stComponents);

    // Submit logger message.
    LOG_NOTICE(logging::g_qSharedLogger,
               "Count: {} holds {} objects (window ({:.1f}, {:.1f}], {} components).",
               szImagePath,
               stCount.nCount,
               stCount.stWindow.dLower,
               stCount.stWindow.dUpper,
               stComponents.vAreas.size());

    return 0;
}

/******************************************************************************
 * @brief  main function.
 *
 * @param argc - Number of command line arguments.
 * @param argv - Command line arguments.
 * @return int - Exit status number.
 *
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-06-20
 ******************************************************************************/
int main(int argc, char* argv[])
{
    // Initialize Loggers
    logging::InitializeLoggers(constants::LOGGING_OUTPUT_PATH_ABSOLUTE);

    std::vector<std::string> vArguments(argv + 1, argv + argc);
    int nExitStatus = 0;

    try
    {
        if (!vArguments.empty() && vArguments[0] == "count")
        {
            if (vArguments.size() < 2)
            {
                // Submit logger message.
                LOG_ERROR(logging::g_qSharedLogger, "Usage: GranuleCounter count <image> [model]");
                nExitStatus = 2;
            }
            else
            {
                nExitStatus = RunCount(vArguments[1], vArguments.size() > 2 ? vArguments[2] : constants::REGRESSOR_MODEL_OUTPUT_PATH);
            }
        }
        else
        {
            RunTraining(vArguments.size() > 0 ? vArguments[0] : constants::DATASET_LABELS_CSV_PATH,
                        vArguments.size() > 1 ? vArguments[1] : constants::DATASET_IMAGE_DIRECTORY,
                        vArguments.size() > 2 ? vArguments[2] : constants::REGRESSOR_MODEL_OUTPUT_PATH);
        }
    }
    catch (const std::exception& stException)
    {
        // Submit logger message.
        LOG_CRITICAL(logging::g_qSharedLogger, "GranuleCounter cannot continue: {}", stException.what());
        nExitStatus = 1;
    }

    /////////////////////////////////////////
    // Cleanup.
    /////////////////////////////////////////

    // Submit logger message that program is done cleaning up and is now exiting.
    LOG_INFO(logging::g_qSharedLogger, "Clean up finished. Exiting...");
    logging::ShutdownLoggers();

    return nExitStatus;
}
