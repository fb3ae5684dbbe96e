/**
 * @file    main.cpp
 * @brief   Loupe - Entry Point
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Zoomable image viewer with selectable resampling.
 *
 * Rendering Model:
 *   The view is always rendered at the source resolution: zoom and pan pick
 *   a crop of the source, which is resampled back up to full size.
 *   While a slider or pointer drag is in progress a throttled nearest
 *   neighbor Preview is shown; once input settles, a Final render with the
 *   selected algorithm replaces it.
 *
 * Usage:
 *   loupe [image-or-folder]                                   (GUI)
 *   loupe render -i in.jpg -o out.png --zoom 2 --algorithm mitchell
 *   loupe thumbs -i photos/ -o thumbs/
 */

#include "cli/cli_app.hpp"

#if defined(LOUPE_HAS_GUI)
#include "gui/gui_app.hpp"
#endif

int main(int argc, char** argv) {
#if defined(LOUPE_HAS_GUI)
    if (!loupe::cli::is_cli_invocation(argc, argv)) {
        return loupe::gui::run(argc, argv);
    }
#endif
    return loupe::cli::run(argc, argv);
}
