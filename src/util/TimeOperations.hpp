/******************************************************************************
 * @brief Wall clock helpers for naming log runs and timing pipeline stages.
 *
 * @file TimeOperations.hpp
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-01-07
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#ifndef TIME_OPERATIONS_HPP
#define TIME_OPERATIONS_HPP

/// \cond
#include <array>
#include <chrono>
#include <ctime>
#include <string>

/// \endcond

/******************************************************************************
 * @brief Namespace containing time and date helpers.
 *
 *
 * @author Eli Byrd (edbgkk@mst.edu)
 * @date 2025-01-07
 ******************************************************************************/
namespace timeops
{
    /******************************************************************************
     * @brief Local time of a system clock instant, formatted with strftime codes.
     *
     * @param szFormat - strftime format. The default sorts by run start and is
     *      safe to use as a directory name.
     * @param tmInstant - The instant to format. Defaults to now.
     * @return std::string - The formatted time, empty if it did not fit.
     *
     * @author Eli Byrd (edbgkk@mst.edu)
     * @date 2025-01-07
     ******************************************************************************/
    inline std::string GetTimestamp(const std::string& szFormat                           = "%Y%m%d-%H%M%S",
                                    const std::chrono::system_clock::time_point& tmInstant = std::chrono::system_clock::now())
    {
        std::time_t tmSeconds = std::chrono::system_clock::to_time_t(tmInstant);
        std::tm stLocalTime{};
        localtime_r(&tmSeconds, &stLocalTime);

        std::array<char, 64> aBuffer{};
        size_t siWritten = std::strftime(aBuffer.data(), aBuffer.size(), szFormat.c_str(), &stLocalTime);
        return std::string(aBuffer.data(), siWritten);
    }

    /******************************************************************************
     * @brief Seconds elapsed since a steady clock time point.
     *
     * @param tmStart - When the timed section started.
     * @return double - Elapsed wall time in seconds.
     *
     * @author clayjay3 (claytonraycowen@gmail.com)
     * @date 2025-10-20
     ******************************************************************************/
    inline double GetElapsedSeconds(const std::chrono::steady_clock::time_point& tmStart)
    {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - tmStart).count();
    }
}    // namespace timeops

#endif    // TIME_OPERATIONS_HPP
