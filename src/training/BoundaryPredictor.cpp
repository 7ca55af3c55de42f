/******************************************************************************
 * @brief Implements the BoundaryPredictor class.
 *
 * @file BoundaryPredictor.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "BoundaryPredictor.h"
#include "../Logging.h"
#include "../counting/CountEstimator.hpp"
#include "../counting/FeatureBuilder.hpp"
#include "../vision/algorithms/ComponentStatistics.hpp"

/// \cond
#include <stdexcept>
#include <utility>

/// \endcond

/******************************************************************************
 * @brief Fit one regressor per bound.
 *
 * @param cvFeatures - N x F feature matrix, one image per row.
 * @param cvBounds - N x 2 matrix of (lower, upper) targets.
 * @return BoundaryPredictor - The trained predictor.
 *
 * @throws std::runtime_error - No training examples.
 * @throws std::invalid_argument - Mismatched matrices.
 * @throws std::runtime_error - A tree could not be fitted.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
BoundaryPredictor BoundaryPredictor::Train(const cv::Mat& cvFeatures, const cv::Mat& cvBounds)
{
    if (cvFeatures.empty())
    {
        throw std::runtime_error("BoundaryPredictor::Train: The training set is empty.");
    }
    if (cvBounds.rows != cvFeatures.rows || cvBounds.cols != 2)
    {
        throw std::invalid_argument("BoundaryPredictor::Train needs an N x F feature matrix and an N x 2 bound matrix.");
    }

    BoundaryPredictor stPredictor;
    stPredictor.m_LowerRegressor.Train(cvFeatures, cvBounds.col(0));
    stPredictor.m_UpperRegressor.Train(cvFeatures, cvBounds.col(1));

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger,
             "BoundaryPredictor: Fitted on {} examples with {} features ({} lower trees, {} upper trees).",
             cvFeatures.rows,
             cvFeatures.cols,
             stPredictor.m_LowerRegressor.GetEstimatorCount(),
             stPredictor.m_UpperRegressor.GetEstimatorCount());

    return stPredictor;
}

/******************************************************************************
 * @brief Read a predictor written by Save.
 *
 * @param szModelPath - Path of the artifact.
 * @return BoundaryPredictor - The restored predictor.
 *
 * @throws std::runtime_error - The file can't be opened or isn't a predictor.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
BoundaryPredictor BoundaryPredictor::Load(const std::string& szModelPath)
{
    cv::FileStorage fsModel;
    if (!fsModel.open(szModelPath, cv::FileStorage::READ))
    {
        throw std::runtime_error("Unable to open predictor file " + szModelPath);
    }

    cv::FileNode fnRoot = fsModel["granule_counter_predictor"];
    if (fnRoot.empty())
    {
        throw std::runtime_error("File " + szModelPath + " does not hold a granule counter predictor.");
    }

    BoundaryPredictor stPredictor;
    stPredictor.m_LowerRegressor.Read(fnRoot["lower_bound"]);
    stPredictor.m_UpperRegressor.Read(fnRoot["upper_bound"]);
    fsModel.release();

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "BoundaryPredictor: Loaded from {}.", szModelPath);

    return stPredictor;
}

/******************************************************************************
 * @brief Predict the unit window of one image.
 *
 * @param vFeatures - The image's area histogram.
 * @return BoundaryPair - Predicted (lower, upper]. Not guaranteed ordered; callers
 *      that count with it must check.
 *
 * @throws std::runtime_error - Untrained predictor or wrong feature length.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
BoundaryPair BoundaryPredictor::Predict(const std::vector<float>& vFeatures) const
{
    cv::Mat cvSample(vFeatures);

    BoundaryPair stBounds;
    stBounds.dLower = m_LowerRegressor.Predict(cvSample);
    stBounds.dUpper = m_UpperRegressor.Predict(cvSample);

    return stBounds;
}

/******************************************************************************
 * @brief Count the objects of one raw image. The window is predicted from the
 *      image's own histogram, then counted with CountEstimator::CountWithWindow,
 *      which falls back to the default window when the prediction is unusable.
 *
 * @param cvImage - Raw image of any size.
 * @param pComponents - (Optional) Receives the extracted statistics.
 * @return WindowedCount - The count and the window it was made with.
 *
 * @throws std::runtime_error - Untrained predictor.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-09
 ******************************************************************************/
WindowedCount BoundaryPredictor::CountImage(const cv::Mat& cvImage, ImageComponents* pComponents) const
{
    ImageComponents stComponents = ComponentStatistics::ExtractComponentStatistics(cvImage);
    BoundaryPair stPredicted     = this->Predict(FeatureBuilder::BuildFeatures(stComponents.vStats));
    WindowedCount stCount        = CountEstimator::CountWithWindow(stComponents.vAreas, stPredicted);

    // Submit logger message.
    LOG_DEBUG(logging::g_qSharedLogger,
              "BoundaryPredictor: Predicted ({:.1f}, {:.1f}], counted {} in ({:.1f}, {:.1f}].",
              stPredicted.dLower,
              stPredicted.dUpper,
              stCount.nCount,
              stCount.stWindow.dLower,
              stCount.stWindow.dUpper);

    if (pComponents)
    {
        *pComponents = std::move(stComponents);
    }

    return stCount;
}

/******************************************************************************
 * @brief Write the predictor to disk. The format follows the extension (.yml,
 *      .xml or .json).
 *
 * @param szModelPath - Destination path.
 *
 * @throws std::runtime_error - Untrained predictor or the file can't be written.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
void BoundaryPredictor::Save(const std::string& szModelPath) const
{
    if (!this->IsTrained())
    {
        throw std::runtime_error("BoundaryPredictor::Save called on an untrained predictor.");
    }

    cv::FileStorage fsModel;
    if (!fsModel.open(szModelPath, cv::FileStorage::WRITE))
    {
        throw std::runtime_error("Unable to open predictor file " + szModelPath + " for writing.");
    }

    fsModel << "granule_counter_predictor" << "{";
    fsModel << "lower_bound" << "{";
    m_LowerRegressor.Write(fsModel);
    fsModel << "}";
    fsModel << "upper_bound" << "{";
    m_UpperRegressor.Write(fsModel);
    fsModel << "}";
    fsModel << "}";
    fsModel.release();

    // Submit logger message.
    LOG_INFO(logging::g_qSharedLogger, "BoundaryPredictor: Saved to {}.", szModelPath);
}

/******************************************************************************
 * @brief Accessor for whether both bounds can be predicted.
 *
 * @return true - Both regressors are trained.
 * @return false - Otherwise.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
bool BoundaryPredictor::IsTrained() const
{
    return m_LowerRegressor.IsTrained() && m_UpperRegressor.IsTrained();
}
