#pragma once

#include <cstddef>

/**
 * @brief Constants shared by the router, help output and application
 *
 * Centralizes column widths and reserved option names so help rendering
 * and help detection agree.
 */
namespace clicore {

namespace Constants {
    // Exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILURE_CODE = 1;

    // Reserved help option spellings
    constexpr const char* HELP_LONG = "help";
    constexpr const char* HELP_SHORT = "h";
    constexpr const char* HELP_OPTION_DISPLAY = "-h, --help";
    constexpr const char* HELP_OPTION_DESCRIPTION = "Show this help message";

    // Separator between parent names in a nested command's parent path ("git.remote")
    constexpr char PARENT_PATH_SEPARATOR = '.';

    // Help column widths
    constexpr size_t COMMAND_COLUMN_WIDTH = 20;
    constexpr size_t ARGUMENT_COLUMN_WIDTH = 25;
    constexpr size_t OPTION_COLUMN_WIDTH = 30;
    constexpr size_t INDENT_WIDTH = 2;

    constexpr const char* NO_DESCRIPTION = "No description";

    // Environment variable selecting the initial log level
    constexpr const char* LOG_LEVEL_ENV = "CLICORE_LOG";
}
}
