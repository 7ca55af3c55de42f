/******************************************************************************
 * @brief Declares constants for the GranuleCounter.
 *
 * @file Constants.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-04-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef GRANCOUNT_CONSTANTS_H
#define GRANCOUNT_CONSTANTS_H

/// \cond
#include <cstddef>
#include <cstdint>
#include <opencv2/opencv.hpp>
#include <quill/core/LogLevel.h>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Namespace containing all constants for GranuleCounter. Every stage of
 *      the counting and training pipeline reads its fixed parameters from here.
 *
 *
 * @author ClayJay3 (claytonraycowen@gmail.com)
 * @date 2025-08-05
 ******************************************************************************/
namespace constants
{
    ///////////////////////////////////////////////////////////////////////////
    //// General Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Logging constants.
    extern const std::string LOGGING_OUTPUT_PATH_ABSOLUTE;
    extern const quill::LogLevel CONSOLE_MIN_LEVEL;
    extern const quill::LogLevel FILE_MIN_LEVEL;
    extern const quill::LogLevel CONSOLE_DEFAULT_LEVEL;
    extern const quill::LogLevel FILE_DEFAULT_LEVEL;
    extern const std::string LOGGING_LEVEL_ENVIRONMENT_VARIABLE;
    extern const size_t LOGGING_FILE_ROTATION_BYTES;
    extern const uint32_t LOGGING_FILE_MAX_BACKUPS;
    extern const uint32_t LOGGING_BACKTRACE_DEPTH;

    // Logging color constants.
    extern const std::string szTraceL3Color;
    extern const std::string szTraceL2Color;
    extern const std::string szTraceL1Color;
    extern const std::string szDebugColor;
    extern const std::string szInfoColor;
    extern const std::string szNoticeColor;
    extern const std::string szWarningColor;
    extern const std::string szErrorColor;
    extern const std::string szCriticalColor;
    extern const std::string szBacktraceColor;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Image Preparation Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Normalization.
    extern const int PREPARE_RESIZE_WIDTH;
    extern const int PREPARE_RESIZE_HEIGHT;
    extern const cv::InterpolationFlags PREPARE_RESIZE_INTERPOLATION_METHOD;
    extern const int PREPARE_CROP_MARGIN;
    // Labeling.
    extern const int PREPARE_BINARIZE_CHANNEL;
    extern const int PREPARE_COMPONENT_CONNECTIVITY;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Counting Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Count estimator windows.
    extern const int COUNT_DEFAULT_LOWER_BOUND;
    extern const int COUNT_DEFAULT_UPPER_BOUND;
    extern const int COUNT_WIDE_LOWER_BOUND;
    extern const int COUNT_WIDE_UPPER_BOUND;

    // Boundary search grid.
    extern const int SEARCH_LOWER_BOUND;
    extern const int SEARCH_STEP;
    extern const int SEARCH_UPPER_LIMIT;
    extern const double SEARCH_INITIAL_ERROR;

    // Feature histogram.
    extern const int FEATURE_BIN_WIDTH;
    extern const int FEATURE_AREA_CUTOFF;
    extern const int FEATURE_BIN_COUNT;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Dataset Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Input locations.
    extern const std::string DATASET_LABELS_CSV_PATH;
    extern const std::string DATASET_IMAGE_DIRECTORY;
    extern const std::string DATASET_IMAGE_EXTENSION;

    // Table layout.
    extern const std::string DATASET_IMAGE_ID_COLUMN;
    extern const std::string DATASET_LABEL_COLUMN;
    extern const std::vector<std::string> DATASET_DROP_COLUMNS;

    // Identifier sets.
    extern const std::vector<std::string> DATASET_DROP_IMAGE_IDS;
    extern const std::vector<std::string> DATASET_TEST_IMAGE_IDS;
    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Regression Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Boosted ensemble.
    extern const int REGRESSOR_NUM_ESTIMATORS;
    extern const int REGRESSOR_RANDOM_SEED;
    extern const double REGRESSOR_LEARNING_RATE;
    extern const int REGRESSOR_TREE_MAX_DEPTH;

    // Output artifact.
    extern const std::string REGRESSOR_MODEL_OUTPUT_PATH;
    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants

#endif    // GRANCOUNT_CONSTANTS_H
