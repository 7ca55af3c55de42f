/******************************************************************************
 * @brief Defines the BoundaryPredictor class.
 *
 * @file BoundaryPredictor.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef BOUNDARYPREDICTOR_H
#define BOUNDARYPREDICTOR_H

#include "../util/counting/CountingModels.hpp"
#include "./BoostedRegressor.h"

/// \cond
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Maps an area histogram to the unit window (lower, upper] of an image.
 *  Each bound has its own BoostedRegressor fitted independently on the same
 *  features. Once trained (or loaded) the predictor is only read from.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-04
 ******************************************************************************/
class BoundaryPredictor
{
    public:
        /////////////////////////////////////////
        // Declare public methods and member variables.
        /////////////////////////////////////////

        BoundaryPredictor() = default;

        static BoundaryPredictor Train(const cv::Mat& cvFeatures, const cv::Mat& cvBounds);
        static BoundaryPredictor Load(const std::string& szModelPath);

        BoundaryPair Predict(const std::vector<float>& vFeatures) const;
        WindowedCount CountImage(const cv::Mat& cvImage, ImageComponents* pComponents = nullptr) const;
        void Save(const std::string& szModelPath) const;

        /////////////////////////////////////////
        // Getters.
        /////////////////////////////////////////

        bool IsTrained() const;

    private:
        /////////////////////////////////////////
        // Declare private member variables.
        /////////////////////////////////////////
        BoostedRegressor m_LowerRegressor;
        BoostedRegressor m_UpperRegressor;
};
#endif
