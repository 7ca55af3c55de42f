/******************************************************************************
 * @brief Defines constants for the GranuleCounter.
 *
 * @file Constants.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-04-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "./Constants.h"

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
    const std::string LOGGING_OUTPUT_PATH_ABSOLUTE       = "../counter_logs/";          // Directory that receives one sub directory of log files per run.
    const quill::LogLevel CONSOLE_MIN_LEVEL              = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the console log stream.
    const quill::LogLevel FILE_MIN_LEVEL                 = quill::LogLevel::TraceL3;    // The minimum logging level that is allowed to send to the file log streams.
    const quill::LogLevel CONSOLE_DEFAULT_LEVEL          = quill::LogLevel::Info;       // The default logging level for console stream.
    const quill::LogLevel FILE_DEFAULT_LEVEL             = quill::LogLevel::TraceL3;    // The default logging level for file streams.
    const std::string LOGGING_LEVEL_ENVIRONMENT_VARIABLE = "GRANCOUNT_LOG_LEVEL";       // Overrides the console level when set (e.g. "debug").
    const size_t LOGGING_FILE_ROTATION_BYTES             = 64 * 1024 * 1024;            // A log file is rotated once it grows past this size.
    const uint32_t LOGGING_FILE_MAX_BACKUPS              = 4;                           // Rotated files kept per run.
    const uint32_t LOGGING_BACKTRACE_DEPTH               = 10;                          // Messages replayed when a CRITICAL is logged.

    // Logging color constants.
    const std::string szTraceL3Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL2Color   = "\033[30m";           // Standard Grey
    const std::string szTraceL1Color   = "\033[30m";           // Standard Grey
    const std::string szDebugColor     = "\033[36m";           // Standard Cyan
    const std::string szInfoColor      = "\033[32m";           // Standard Green
    const std::string szNoticeColor    = "\033[97m\033[1m";    // Bright Bold White
    const std::string szWarningColor   = "\033[93m\033[1m";    // Bright Bold Yellow
    const std::string szErrorColor     = "\033[91m\033[1m";    // Bright Bold Red
    const std::string szCriticalColor  = "\033[95m\033[1m";    // Bright Bold Magenta
    const std::string szBacktraceColor = "\033[30m";           // Standard Grey

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Image Preparation Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Normalization.
    const int PREPARE_RESIZE_WIDTH                                   = 800;                                      // The canonical width every image is resized to before labeling.
    const int PREPARE_RESIZE_HEIGHT                                  = 600;                                      // The canonical height every image is resized to before labeling.
    const cv::InterpolationFlags PREPARE_RESIZE_INTERPOLATION_METHOD = cv::InterpolationFlags::INTER_LINEAR;    // The algorithm used to fill in pixels when resizing.
    const int PREPARE_CROP_MARGIN                                    = 30;                                       // Pixels cut from every border of the resized image.
    // Labeling.
    const int PREPARE_BINARIZE_CHANNEL       = 0;    // The image channel that is thresholded (blue for BGR).
    const int PREPARE_COMPONENT_CONNECTIVITY = 4;    // Pixel connectivity used when labeling components.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Counting Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Count estimator windows.
    const int COUNT_DEFAULT_LOWER_BOUND = 70;      // Lower bound used for counting when no predicted window is usable.
    const int COUNT_DEFAULT_UPPER_BOUND = 600;     // Upper bound used for counting when no predicted window is usable.
    const int COUNT_WIDE_LOWER_BOUND    = 0;       // Lower bound of the wide feature pass.
    const int COUNT_WIDE_UPPER_BOUND    = 1000;    // Upper bound of the wide feature pass.

    // Boundary search grid.
    const int SEARCH_LOWER_BOUND      = 30;          // Fixed lower bound. Components at or under this area are noise.
    const int SEARCH_STEP             = 10;          // Spacing of the upper bound grid.
    const int SEARCH_UPPER_LIMIT      = 1000;        // Exclusive limit of the upper bound grid.
    const double SEARCH_INITIAL_ERROR = 100000.0;    // Starting value for the minimum relative error.

    // Feature histogram.
    const int FEATURE_BIN_WIDTH   = 10;      // Width of one area bin.
    const int FEATURE_AREA_CUTOFF = 1000;    // Components with this area or more are left out of the histogram.
    const int FEATURE_BIN_COUNT   = 99;      // Length of every feature vector.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Dataset Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Input locations.
    const std::string DATASET_LABELS_CSV_PATH = "./data/labels/labels_hand_marked.csv";    // Hand marked ground truth table.
    const std::string DATASET_IMAGE_DIRECTORY = "./data/images/";                          // Directory holding one image per identifier.
    const std::string DATASET_IMAGE_EXTENSION = ".jpg";                                    // Extension appended to an identifier to form its filename.

    // Table layout.
    const std::string DATASET_IMAGE_ID_COLUMN           = "ImageId";                                            // Identifier column.
    const std::string DATASET_LABEL_COLUMN              = "prop_count";                                         // Ground truth count column.
    const std::vector<std::string> DATASET_DROP_COLUMNS = {"Unnamed: 0", "Unnamed: 0.1", "Unnamed: 0.1.1"};    // Index artifact columns.

    // Identifier sets.
    const std::vector<std::string> DATASET_DROP_IMAGE_IDS = []()
    {
        // Known bad images plus the whole 904-999 block.
        std::vector<std::string> vIds = {"104"};
        for (int nId = 904; nId < 1000; ++nId)
        {
            vIds.push_back(std::to_string(nId));
        }
        return vIds;
    }();
    const std::vector<std::string> DATASET_TEST_IMAGE_IDS = {"776", "675", "42", "3", "714", "312", "127", "653", "592", "205", "179", "191"};    // Held out.

    ///////////////////////////////////////////////////////////////////////////

    ///////////////////////////////////////////////////////////////////////////
    //// Regression Constants.
    ///////////////////////////////////////////////////////////////////////////

    // Boosted ensemble.
    const int REGRESSOR_NUM_ESTIMATORS   = 5;      // Maximum number of boosted trees per output.
    const int REGRESSOR_RANDOM_SEED      = 10;     // Stored with the model. Reweighted boosting draws no random numbers.
    const double REGRESSOR_LEARNING_RATE = 1.0;    // Shrinks the contribution of each tree.
    const int REGRESSOR_TREE_MAX_DEPTH   = 3;      // Depth limit of each weak learner.

    // Output artifact.
    const std::string REGRESSOR_MODEL_OUTPUT_PATH = "./counter_model.yml";    // Where the trained predictor is written.

    ///////////////////////////////////////////////////////////////////////////
}    // namespace constants
