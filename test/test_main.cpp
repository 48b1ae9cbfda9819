#include <gtest/gtest.h>

#include <cstdlib>

#include "util/Logger.hpp"

/**
 * @brief Main entry point for clicore unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./clicore_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep test output readable unless CLICORE_LOG asks for more.
    if (!std::getenv("CLICORE_LOG")) {
        clicore::Logger::instance().setLevel(clicore::LogLevel::Error);
    }
    return RUN_ALL_TESTS();
}
