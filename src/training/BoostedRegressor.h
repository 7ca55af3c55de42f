/******************************************************************************
 * @brief Defines the BoostedRegressor class.
 *
 * @file BoostedRegressor.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef BOOSTEDREGRESSOR_H
#define BOOSTEDREGRESSOR_H

#include "../Constants.h"

/// \cond
#include <opencv2/ml.hpp>
#include <opencv2/opencv.hpp>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Single output AdaBoost.R2 regressor (linear loss) built from shallow
 *  cv::ml::DTrees regression trees.
 *
 *  Each round fits a tree on the current sample weights, scores every sample by
 *  its absolute error relative to the largest error of that round, and shifts
 *  weight toward the badly predicted samples. Boosting stops early once a tree
 *  fits perfectly or its weighted error reaches 0.5. Predictions are the
 *  weighted median of the tree outputs.
 *
 *  Samples are reweighted, never resampled, and the trees use no cross
 *  validation, so a fit is fully determined by its inputs. The seed is only
 *  written to the model file alongside the other settings.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-03
 ******************************************************************************/
class BoostedRegressor
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        BoostedRegressor(const int nNumEstimators   = constants::REGRESSOR_NUM_ESTIMATORS,
                         const double dLearningRate = constants::REGRESSOR_LEARNING_RATE,
                         const int nMaxDepth        = constants::REGRESSOR_TREE_MAX_DEPTH,
                         const int nRandomSeed      = constants::REGRESSOR_RANDOM_SEED);

        void Train(const cv::Mat& cvSamples, const cv::Mat& cvResponses);
        float Predict(const cv::Mat& cvSample) const;

        void Write(cv::FileStorage& fsModel) const;
        void Read(const cv::FileNode& fnModel);

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        bool IsTrained() const;
        int GetFeatureCount() const;
        size_t GetEstimatorCount() const;
        const std::vector<double>& GetEstimatorWeights() const;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////
        int m_nNumEstimators;
        double m_dLearningRate;
        int m_nMaxDepth;
        int m_nRandomSeed;
        int m_nFeatureCount;

        std::vector<cv::Ptr<cv::ml::DTrees>> m_vEstimators;
        std::vector<double> m_vEstimatorWeights;

        /////////////////////////////////////////
        // Declare private methods.
        /////////////////////////////////////////
        cv::Ptr<cv::ml::DTrees> CreateTree() const;
};
#endif
