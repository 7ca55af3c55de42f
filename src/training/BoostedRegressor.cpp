/******************************************************************************
 * @brief Implements the BoostedRegressor class.
 *
 * @file BoostedRegressor.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "BoostedRegressor.h"
#include "../Logging.h"

/// \cond
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Construct a new, untrained Boosted Regressor object.
 *
 * @param nNumEstimators - Maximum number of boosting rounds.
 * @param dLearningRate - Shrinks each tree's weight and the sample reweighting.
 * @param nMaxDepth - Depth limit of every tree.
 * @param nRandomSeed - Recorded with the model. Fitting draws no random numbers.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
BoostedRegressor::BoostedRegressor(const int nNumEstimators, const double dLearningRate, const int nMaxDepth, const int nRandomSeed)
{
    // Initialize member variables.
    m_nNumEstimators = nNumEstimators;
    m_dLearningRate  = dLearningRate;
    m_nMaxDepth      = nMaxDepth;
    m_nRandomSeed    = nRandomSeed;
    m_nFeatureCount  = 0;
}

/******************************************************************************
 * @brief Fit the ensemble. Any previous fit is discarded.
 *
 * @param cvSamples - N x F matrix, one sample per row.
 * @param cvResponses - N x 1 matrix of targets.
 *
 * @throws std::invalid_argument - Shapes don't match or there are no samples.
 * @throws std::runtime_error - OpenCV failed to fit a tree.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
void BoostedRegressor::Train(const cv::Mat& cvSamples, const cv::Mat& cvResponses)
{
    // 1. Validation
    if (cvSamples.empty() || cvResponses.rows != cvSamples.rows || cvResponses.cols != 1)
    {
        throw std::invalid_argument("BoostedRegressor::Train needs a non empty N x F sample matrix and an N x 1 response matrix, got " +
                                    std::to_string(cvSamples.rows) + "x" + std::to_string(cvSamples.cols) + " and " + std::to_string(cvResponses.rows) + "x" +
                                    std::to_string(cvResponses.cols) + ".");
    }
    if (m_nNumEstimators < 1)
    {
        throw std::invalid_argument("BoostedRegressor::Train needs at least one estimator.");
    }

    cv::Mat cvSamples32, cvResponses32;
    cvSamples.convertTo(cvSamples32, CV_32F);
    cvResponses.convertTo(cvResponses32, CV_32F);

    // 2. Reset state
    m_vEstimators.clear();
    m_vEstimatorWeights.clear();
    m_nFeatureCount = cvSamples32.cols;

    const int nSamples = cvSamples32.rows;
    std::vector<double> vSampleWeights(nSamples, 1.0 / nSamples);
    std::vector<double> vErrors(nSamples, 0.0);
    // Every feature and the response are continuous.
    cv::Mat cvVarType(1, m_nFeatureCount + 1, CV_8U, cv::Scalar(cv::ml::VAR_ORDERED));

    // 3. Boost
    for (int nBoost = 0; nBoost < m_nNumEstimators; ++nBoost)
    {
        cv::Mat cvWeights32(nSamples, 1, CV_32F);
        for (int nSample = 0; nSample < nSamples; ++nSample)
        {
            cvWeights32.at<float>(nSample, 0) = static_cast<float>(vSampleWeights[nSample]);
        }

        cv::Ptr<cv::ml::TrainData> pTrainData =
            cv::ml::TrainData::create(cvSamples32, cv::ml::ROW_SAMPLE, cvResponses32, cv::noArray(), cv::noArray(), cvWeights32, cvVarType);
        cv::Ptr<cv::ml::DTrees> pTree = this->CreateTree();
        if (!pTree->train(pTrainData))
        {
            throw std::runtime_error("BoostedRegressor::Train: OpenCV failed to fit tree " + std::to_string(nBoost) + ".");
        }
        m_vEstimators.push_back(pTree);

        // Linear loss, scaled by the worst error of this round.
        double dMaxError = 0.0;
        for (int nSample = 0; nSample < nSamples; ++nSample)
        {
            float fPrediction = pTree->predict(cvSamples32.row(nSample));
            vErrors[nSample]  = std::abs(static_cast<double>(fPrediction) - cvResponses32.at<float>(nSample, 0));
            dMaxError         = std::max(dMaxError, vErrors[nSample]);
        }
        if (dMaxError > 0.0)
        {
            for (double& dError : vErrors)
            {
                dError /= dMaxError;
            }
        }

        double dEstimatorError = 0.0;
        for (int nSample = 0; nSample < nSamples; ++nSample)
        {
            dEstimatorError += vSampleWeights[nSample] * vErrors[nSample];
        }

        // Perfect fit, nothing left to boost.
        if (dEstimatorError <= 0.0)
        {
            m_vEstimatorWeights.push_back(1.0);
            LOG_DEBUG(logging::g_qSharedLogger, "BoostedRegressor: Round {} fits every sample, stopping.", nBoost);
            break;
        }
        // No better than chance. Keep the tree only if it is the sole one.
        if (dEstimatorError >= 0.5)
        {
            if (m_vEstimators.size() > 1)
            {
                m_vEstimators.pop_back();
            }
            else
            {
                m_vEstimatorWeights.push_back(0.0);
            }
            LOG_DEBUG(logging::g_qSharedLogger, "BoostedRegressor: Round {} weighted error {:.4f} >= 0.5, stopping.", nBoost, dEstimatorError);
            break;
        }

        double dBeta = dEstimatorError / (1.0 - dEstimatorError);
        m_vEstimatorWeights.push_back(m_dLearningRate * std::log(1.0 / dBeta));
        LOG_TRACE_L1(logging::g_qSharedLogger, "BoostedRegressor: Round {} weighted error {:.4f}, tree weight {:.4f}.", nBoost, dEstimatorError, m_vEstimatorWeights.back());

        // Reweight for the next round.
        if (nBoost < m_nNumEstimators - 1)
        {
            for (int nSample = 0; nSample < nSamples; ++nSample)
            {
                vSampleWeights[nSample] *= std::pow(dBeta, (1.0 - vErrors[nSample]) * m_dLearningRate);
            }

            double dWeightSum = std::accumulate(vSampleWeights.begin(), vSampleWeights.end(), 0.0);
            if (!(dWeightSum > 0.0))
            {
                break;
            }
            for (double& dWeight : vSampleWeights)
            {
                dWeight /= dWeightSum;
            }
        }
    }
}

/******************************************************************************
 * @brief Predict one target value.
 *
 * @param cvSample - 1 x F sample.
 * @return float - Weighted median of the tree predictions.
 *
 * @throws std::runtime_error - The regressor is not trained or the sample width is wrong.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
float BoostedRegressor::Predict(const cv::Mat& cvSample) const
{
    if (!this->IsTrained())
    {
        throw std::runtime_error("BoostedRegressor::Predict called before Train or Read.");
    }
    if (static_cast<int>(cvSample.total()) != m_nFeatureCount)
    {
        throw std::runtime_error("BoostedRegressor::Predict expects " + std::to_string(m_nFeatureCount) + " features, got " + std::to_string(cvSample.total()) + ".");
    }

    cv::Mat cvSample32;
    cvSample.reshape(1, 1).convertTo(cvSample32, CV_32F);

    // Predictions in ascending order.
    std::vector<float> vPredictions(m_vEstimators.size());
    for (size_t siEstimator = 0; siEstimator < m_vEstimators.size(); ++siEstimator)
    {
        vPredictions[siEstimator] = m_vEstimators[siEstimator]->predict(cvSample32);
    }
    std::vector<size_t> vOrder(vPredictions.size());
    std::iota(vOrder.begin(), vOrder.end(), 0);
    std::stable_sort(vOrder.begin(), vOrder.end(), [&vPredictions](size_t siA, size_t siB) { return vPredictions[siA] < vPredictions[siB]; });

    // First prediction whose cumulative weight reaches half the total.
    double dTotalWeight = std::accumulate(m_vEstimatorWeights.begin(), m_vEstimatorWeights.end(), 0.0);
    double dCumulative  = 0.0;
    for (const size_t siEstimator : vOrder)
    {
        dCumulative += m_vEstimatorWeights[siEstimator];
        if (dCumulative >= 0.5 * dTotalWeight)
        {
            return vPredictions[siEstimator];
        }
    }

    return vPredictions[vOrder.back()];
}

/******************************************************************************
 * @brief Write hyperparameters, tree weights and trees into the currently open
 *      map of a cv::FileStorage.
 *
 * @param fsModel - Storage opened for writing, positioned inside a map.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
void BoostedRegressor::Write(cv::FileStorage& fsModel) const
{
    fsModel << "num_estimators" << m_nNumEstimators;
    fsModel << "learning_rate" << m_dLearningRate;
    fsModel << "max_depth" << m_nMaxDepth;
    fsModel << "random_seed" << m_nRandomSeed;
    fsModel << "feature_count" << m_nFeatureCount;
    fsModel << "estimator_weights" << m_vEstimatorWeights;

    fsModel << "estimators" << "[";
    for (const cv::Ptr<cv::ml::DTrees>& pTree : m_vEstimators)
    {
        fsModel << "{";
        pTree->write(fsModel);
        fsModel << "}";
    }
    fsModel << "]";
}

/******************************************************************************
 * @brief Restore a regressor written by Write.
 *
 * @param fnModel - The map node Write filled.
 *
 * @throws std::runtime_error - The node is missing fields or holds no trees.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
void BoostedRegressor::Read(const cv::FileNode& fnModel)
{
    if (fnModel.empty() || !fnModel.isMap())
    {
        throw std::runtime_error("BoostedRegressor::Read: Model node is missing.");
    }

    fnModel["num_estimators"] >> m_nNumEstimators;
    fnModel["learning_rate"] >> m_dLearningRate;
    fnModel["max_depth"] >> m_nMaxDepth;
    fnModel["random_seed"] >> m_nRandomSeed;
    fnModel["feature_count"] >> m_nFeatureCount;
    m_vEstimatorWeights.clear();
    fnModel["estimator_weights"] >> m_vEstimatorWeights;

    m_vEstimators.clear();
    cv::FileNode fnEstimators = fnModel["estimators"];
    for (cv::FileNodeIterator itTree = fnEstimators.begin(); itTree != fnEstimators.end(); ++itTree)
    {
        cv::Ptr<cv::ml::DTrees> pTree = cv::ml::DTrees::create();
        pTree->read(*itTree);
        m_vEstimators.push_back(pTree);
    }

    if (m_vEstimators.empty() || m_vEstimators.size() != m_vEstimatorWeights.size() || m_nFeatureCount <= 0)
    {
        throw std::runtime_error("BoostedRegressor::Read: Stored model has " + std::to_string(m_vEstimators.size()) + " trees and " +
                                 std::to_string(m_vEstimatorWeights.size()) + " weights.");
    }
}

/******************************************************************************
 * @brief Accessor for whether the regressor can predict.
 *
 * @return true - At least one tree has been fitted or read.
 * @return false - Untrained.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
bool BoostedRegressor::IsTrained() const
{
    return !m_vEstimators.empty();
}

/******************************************************************************
 * @brief Accessor for the sample width the regressor was fitted on.
 *
 * @return int - Number of features.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
int BoostedRegressor::GetFeatureCount() const
{
    return m_nFeatureCount;
}

/******************************************************************************
 * @brief Accessor for the number of trees kept after early stopping.
 *
 * @return size_t - Number of trees.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
size_t BoostedRegressor::GetEstimatorCount() const
{
    return m_vEstimators.size();
}

/******************************************************************************
 * @brief Accessor for the tree weights used by the weighted median.
 *
 * @return const std::vector<double>& - One weight per tree.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
const std::vector<double>& BoostedRegressor::GetEstimatorWeights() const
{
    return m_vEstimatorWeights;
}

/******************************************************************************
 * @brief Build one untrained weak learner. Pruning and surrogate splits are off
 *      so a tree is a plain depth limited CART regressor.
 *
 * @return cv::Ptr<cv::ml::DTrees> - The configured tree.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
cv::Ptr<cv::ml::DTrees> BoostedRegressor::CreateTree() const
{
    cv::Ptr<cv::ml::DTrees> pTree = cv::ml::DTrees::create();
    pTree->setMaxDepth(m_nMaxDepth);
    pTree->setMinSampleCount(2);
    pTree->setCVFolds(0);
    pTree->setUseSurrogates(false);
    pTree->setUse1SERule(false);
    pTree->setTruncatePrunedTree(false);
    pTree->setRegressionAccuracy(0.0f);

    return pTree;
}
