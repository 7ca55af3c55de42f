/******************************************************************************
 * @brief Implements the ground truth label table loader.
 *
 * @file LabelTable.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-01
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "LabelTable.h"
#include "../Logging.h"

/// \cond
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <stdexcept>

/// \endcond

namespace labeltable
{
    /******************************************************************************
     * @brief Strip leading and trailing whitespace, including a stray '\r' left by
     *      files written on Windows.
     *
     * @param szText - Text to trim.
     * @return std::string - The trimmed text.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    static std::string Trim(const std::string& szText)
    {
        size_t siBegin = 0;
        size_t siEnd   = szText.size();
        while (siBegin < siEnd && std::isspace(static_cast<unsigned char>(szText[siBegin])))
        {
            ++siBegin;
        }
        while (siEnd > siBegin && std::isspace(static_cast<unsigned char>(szText[siEnd - 1])))
        {
            --siEnd;
        }

        return szText.substr(siBegin, siEnd - siBegin);
    }

    /******************************************************************************
     * @brief Split one CSV line into cells. Double quoted cells may contain commas
     *      and doubled quotes ("") for a literal quote.
     *
     * @param szLine - One line of the file without its newline.
     * @return std::vector<std::string> - The cells, quotes removed, not trimmed.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    std::vector<std::string> SplitCsvLine(const std::string& szLine)
    {
        std::vector<std::string> vCells;
        std::string szCell;
        bool bInQuotes = false;

        for (size_t siIter = 0; siIter < szLine.size(); ++siIter)
        {
            char chCurrent = szLine[siIter];
            if (bInQuotes)
            {
                if (chCurrent == '"')
                {
                    // A doubled quote inside a quoted cell is a literal quote.
                    if (siIter + 1 < szLine.size() && szLine[siIter + 1] == '"')
                    {
                        szCell += '"';
                        ++siIter;
                    }
                    else
                    {
                        bInQuotes = false;
                    }
                }
                else
                {
                    szCell += chCurrent;
                }
            }
            else if (chCurrent == '"')
            {
                bInQuotes = true;
            }
            else if (chCurrent == ',')
            {
                vCells.push_back(szCell);
                szCell.clear();
            }
            else
            {
                szCell += chCurrent;
            }
        }
        vCells.push_back(szCell);

        return vCells;
    }

    /******************************************************************************
     * @brief Parse a ground truth count cell.
     *
     * @param szCell - Raw cell text.
     * @return std::optional<double> - The count, or nullopt for a blank, NaN or
     *      non numeric cell (missing label).
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    std::optional<double> ParseLabel(const std::string& szCell)
    {
        std::string szValue = Trim(szCell);
        if (szValue.empty())
        {
            return std::nullopt;
        }

        size_t siParsed = 0;
        double dValue   = 0.0;
        try
        {
            dValue = std::stod(szValue, &siParsed);
        }
        catch (const std::invalid_argument&)
        {
            return std::nullopt;
        }
        catch (const std::out_of_range&)
        {
            return std::nullopt;
        }

        // Trailing garbage or a NaN/inf literal is not a count.
        if (siParsed != szValue.size() || !std::isfinite(dValue))
        {
            return std::nullopt;
        }

        return dValue;
    }

    /******************************************************************************
     * @brief Canonical text of an identifier cell. Integral numbers written as
     *      floats ("42.0") become "42" so they match the identifier sets.
     *
     * @param szCell - Raw cell text.
     * @return std::string - The identifier.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    std::string NormalizeImageId(const std::string& szCell)
    {
        std::string szValue                 = Trim(szCell);
        std::optional<double> dNumericValue = ParseLabel(szValue);
        if (dNumericValue.has_value() && std::floor(dNumericValue.value()) == dNumericValue.value() && std::abs(dNumericValue.value()) < 1e15)
        {
            return std::to_string(static_cast<long long>(dNumericValue.value()));
        }

        return szValue;
    }

    /******************************************************************************
     * @brief Read the labels file, drop the named columns and keep the identifier
     *      and count of every data line.
     *
     * @param szCsvPath - Path to the comma separated labels file with a header row.
     * @param vDropColumns - Columns to remove. Names absent from the header are ignored.
     * @param szImageIdColumn - Name of the identifier column.
     * @param szLabelColumn - Name of the ground truth count column.
     * @return LabelTable - The surviving header and one row per data line.
     *
     * @throws std::runtime_error - The file can't be opened, is empty, or lacks the
     *      identifier or count column.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    LabelTable LoadLabelTable(const std::string& szCsvPath,
                              const std::vector<std::string>& vDropColumns,
                              const std::string& szImageIdColumn,
                              const std::string& szLabelColumn)
    {
        std::ifstream fsLabels(szCsvPath);
        if (!fsLabels.is_open())
        {
            throw std::runtime_error("Unable to open labels file " + szCsvPath);
        }

        std::string szLine;
        if (!std::getline(fsLabels, szLine))
        {
            throw std::runtime_error("Labels file " + szCsvPath + " is empty.");
        }

        // Read header and work out which columns survive.
        std::vector<std::string> vHeader = SplitCsvLine(szLine);
        std::vector<bool> vKeepColumn(vHeader.size(), true);
        LabelTable stTable;
        for (size_t siColumn = 0; siColumn < vHeader.size(); ++siColumn)
        {
            vHeader[siColumn] = Trim(vHeader[siColumn]);
            if (std::find(vDropColumns.begin(), vDropColumns.end(), vHeader[siColumn]) != vDropColumns.end())
            {
                vKeepColumn[siColumn] = false;
                LOG_DEBUG(logging::g_qSharedLogger, "LoadLabelTable: Dropping column '{}'.", vHeader[siColumn]);
            }
            else
            {
                stTable.vColumns.push_back(vHeader[siColumn]);
            }
        }

        // Locate the two columns we need among the survivors.
        int nIdIndex    = -1;
        int nLabelIndex = -1;
        for (size_t siColumn = 0; siColumn < vHeader.size(); ++siColumn)
        {
            if (!vKeepColumn[siColumn])
            {
                continue;
            }
            if (vHeader[siColumn] == szImageIdColumn)
            {
                nIdIndex = static_cast<int>(siColumn);
            }
            else if (vHeader[siColumn] == szLabelColumn)
            {
                nLabelIndex = static_cast<int>(siColumn);
            }
        }
        if (nIdIndex < 0 || nLabelIndex < 0)
        {
            throw std::runtime_error("Labels file " + szCsvPath + " needs both '" + szImageIdColumn + "' and '" + szLabelColumn + "' columns.");
        }

        // Read data lines.
        while (std::getline(fsLabels, szLine))
        {
            if (Trim(szLine).empty())
            {
                continue;
            }

            std::vector<std::string> vCells = SplitCsvLine(szLine);
            // Short rows are padded with blanks.
            vCells.resize(std::max(vCells.size(), vHeader.size()));

            LabelTableRow stRow;
            stRow.szImageId = NormalizeImageId(vCells[nIdIndex]);
            stRow.dLabel    = ParseLabel(vCells[nLabelIndex]);
            stTable.vRows.push_back(stRow);
        }

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger, "LoadLabelTable: Read {} rows and {} columns from {}.", stTable.vRows.size(), stTable.vColumns.size(), szCsvPath);

        return stTable;
    }

    /******************************************************************************
     * @brief Keep the rows that can be trained on. Rows with a missing or non
     *      positive count, or whose identifier is in the drop set, are removed.
     *      Filtering is by identifier, never by position.
     *
     * @param stTable - The loaded table.
     * @param setDropImageIds - Identifiers of known bad images.
     * @return std::vector<LabeledImage> - Surviving rows in file order.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-12-01
     ******************************************************************************/
    std::vector<LabeledImage> FilterLabelTable(const LabelTable& stTable, const std::set<std::string>& setDropImageIds)
    {
        std::vector<LabeledImage> vLabeled;
        size_t siMissing = 0;
        size_t siDropped = 0;

        for (const LabelTableRow& stRow : stTable.vRows)
        {
            if (!stRow.dLabel.has_value())
            {
                ++siMissing;
                LOG_DEBUG(logging::g_qSharedLogger, "FilterLabelTable: Image {} has no ground truth count, skipping.", stRow.szImageId);
                continue;
            }
            if (stRow.dLabel.value() <= 0.0)
            {
                ++siMissing;
                LOG_WARNING(logging::g_qSharedLogger, "FilterLabelTable: Image {} has non positive count {}, skipping.", stRow.szImageId, stRow.dLabel.value());
                continue;
            }
            if (setDropImageIds.count(stRow.szImageId) > 0)
            {
                ++siDropped;
                continue;
            }

            vLabeled.push_back({stRow.szImageId, stRow.dLabel.value()});
        }

        // Submit logger message.
        LOG_INFO(logging::g_qSharedLogger,
                 "FilterLabelTable: Kept {} of {} rows ({} without a usable count, {} on the drop list).",
                 vLabeled.size(),
                 stTable.vRows.size(),
                 siMissing,
                 siDropped);

        return vLabeled;
    }
}    // namespace labeltable
