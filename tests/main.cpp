/******************************************************************************
 * @brief Test runner. Sends all log output of the library under test into a
 *        temporary directory before running every registered test.
 *
 * @file main.cpp
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 *
 * @copyright Copyright RoveSoSeniorDesign 2025 - All Rights Reserved
 ******************************************************************************/

#include "../src/Logging.h"

/// \cond
#include <filesystem>
#include <gtest/gtest.h>

/// \endcond

/******************************************************************************
 * @brief  main function.
 *
 * @param argc - Number of command line arguments.
 * @param argv - Command line arguments.
 * @return int - Exit status number.
 *
 * @author clayjay3 (claytonraycowen@gmail.com)
 * @date 2025-12-06
 ******************************************************************************/
int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    std::filesystem::path pathLogs = std::filesystem::temp_directory_path() / "granule_counter_test_logs";
    logging::InitializeLoggers(pathLogs.string() + "/");

    int nResult = RUN_ALL_TESTS();

    logging::ShutdownLoggers();
    return nResult;
}
