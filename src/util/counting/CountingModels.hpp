/******************************************************************************
 * @brief Defines the plain data types passed between the counting and training
 *      stages.
 *
 * @file CountingModels.hpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-11-24
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef COUNTING_MODELS_HPP
#define COUNTING_MODELS_HPP

/// \cond
#include <optional>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief Bounding box and pixel area of one labeled connected component. Row 0
 *      of an image's statistics is always the background.
 ******************************************************************************/
struct ComponentStatsRow
{
    public:
        int nLeft   = 0;
        int nTop    = 0;
        int nWidth  = 0;
        int nHeight = 0;
        int nArea   = 0;
};

/******************************************************************************
 * @brief Everything the statistics extractor produces for one image.
 ******************************************************************************/
struct ImageComponents
{
    public:
        std::vector<ComponentStatsRow> vStats;    // Every labeled component, background included at index 0.
        std::vector<int> vAreas;                  // Areas of every component except the background.
};

/******************************************************************************
 * @brief The area window (dLower, dUpper] that counts as one unit object.
 ******************************************************************************/
struct BoundaryPair
{
    public:
        double dLower = 0.0;
        double dUpper = 0.0;
};

/******************************************************************************
 * @brief Outcome of the brute force search over the upper bound grid.
 ******************************************************************************/
struct BoundarySearchResult
{
    public:
        int nLower               = 0;
        int nUpper               = 0;
        double dMinRelativeError = 0.0;
};

/******************************************************************************
 * @brief One assembled row of the training matrix.
 ******************************************************************************/
struct TrainingExample
{
    public:
        std::string szImageId;
        double dTrueCount = 0.0;              // Ground truth count from the label table.
        std::vector<float> vFeatures;         // Normalized area histogram.
        BoundaryPair stBounds;                // Best window found by the boundary search.
        double dSearchError = 0.0;            // Relative count error at stBounds.
        std::optional<int> nWideEstimate;     // Count over the wide feature window, empty if the window held nothing.
};

/******************************************************************************
 * @brief Count of one image and the window that produced it.
 ******************************************************************************/
struct WindowedCount
{
    public:
        int nCount = 0;
        BoundaryPair stWindow;           // Window actually used, the fallback window when bFellBack is set.
        bool bFellBack = false;          // The requested window was inverted or held no component.
};

#endif    // COUNTING_MODELS_HPP
