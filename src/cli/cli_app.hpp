/**
 * @file    cli_app.hpp
 * @brief   CLI Application Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace wms::cli {

/**
 * Run the CLI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success, 1 = any error)
 */
int run(int argc, char** argv);

}  // namespace wms::cli
