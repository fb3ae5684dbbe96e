/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace loupe::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

/**
 * Check if the first argument selects a CLI subcommand (render / thumbs)
 */
[[nodiscard]] bool is_cli_invocation(int argc, char** argv);

/**
 * Configure the default "loupe" console logger
 */
void setup_logging(bool verbose, bool quiet);

}  // namespace loupe::cli
