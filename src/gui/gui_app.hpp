/**
 * @file    gui_app.hpp
 * @brief   GUI Application Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#pragma once

namespace loupe::gui {

/**
 * Run the GUI application
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = success)
 */
int run(int argc, char** argv);

}  // namespace loupe::gui
