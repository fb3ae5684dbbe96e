/**
 * @file    render_backend.cpp
 * @brief   Backend selection
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "gui/backend/render_backend.hpp"
#include "gui/backend/opengl_backend.hpp"

namespace loupe::gui {

std::unique_ptr<IRenderBackend> create_backend() {
    return std::make_unique<OpenGLBackend>();
}

}  // namespace loupe::gui
