/******************************************************************************
 * @brief Defines the ground truth label table loader.
 *
 * @file LabelTable.h
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-01
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef LABELTABLE_H
#define LABELTABLE_H

/// \cond
#include <optional>
#include <set>
#include <string>
#include <vector>

/// \endcond

/******************************************************************************
 * @brief One data line of the labels file. dLabel is empty when the count cell
 *      is blank, NaN or not a number.
 ******************************************************************************/
struct LabelTableRow
{
    public:
        std::string szImageId;
        std::optional<double> dLabel;
};

/******************************************************************************
 * @brief The labels file after the index artifact columns were dropped.
 ******************************************************************************/
struct LabelTable
{
    public:
        std::vector<std::string> vColumns;    // Header names that survived the drop, in file order.
        std::vector<LabelTableRow> vRows;     // One entry per data line, in file order.
};

/******************************************************************************
 * @brief An image with a usable ground truth count.
 ******************************************************************************/
struct LabeledImage
{
    public:
        std::string szImageId;
        double dLabel = 0.0;
};

/******************************************************************************
 * @brief Namespace containing the functions that read and clean the ground
 *      truth table.
 *
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-01
 ******************************************************************************/
namespace labeltable
{
    std::vector<std::string> SplitCsvLine(const std::string& szLine);
    std::optional<double> ParseLabel(const std::string& szCell);
    std::string NormalizeImageId(const std::string& szCell);

    LabelTable LoadLabelTable(const std::string& szCsvPath,
                              const std::vector<std::string>& vDropColumns,
                              const std::string& szImageIdColumn,
                              const std::string& szLabelColumn);

    std::vector<LabeledImage> FilterLabelTable(const LabelTable& stTable, const std::set<std::string>& setDropImageIds);
}    // namespace labeltable

#endif
