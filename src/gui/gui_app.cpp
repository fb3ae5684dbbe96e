/**
 * @file    gui_app.cpp
 * @brief   GUI Application Entry Point Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "gui/gui_app.hpp"
#include "gui/backend/render_backend.hpp"
#include "gui/app/app_controller.hpp"
#include "gui/widgets/main_window.hpp"
#include "gui/resources/style.hpp"
#include "app/task_pool.hpp"
#include "app/viewer_session.hpp"
#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace loupe::gui {

namespace {

// Window settings
constexpr int kDefaultWidth = 1400;
constexpr int kDefaultHeight = 1000;
constexpr int kMinWidth = 900;
constexpr int kMinHeight = 640;
constexpr const char* kWindowTitle = "Loupe";

struct GuiOptions {
    std::string input;
    int preview_interval_ms = 300;
    int quiescence_ms = 300;
    std::size_t thumbnail_capacity = kDefaultThumbnailCapacity;
    std::size_t workers = TaskPool::default_worker_count();
    bool verbose = false;
    bool quiet = false;
};

void load_fonts(ImGuiIO& io, float dpi_scale) {
    const float font_size = 16.0f * dpi_scale;

    ImFontConfig font_config;
    font_config.SizePixels = font_size;
    font_config.OversampleH = 2;
    font_config.OversampleV = 1;
    font_config.PixelSnapH = true;

#ifdef _WIN32
    const std::vector<std::string> font_paths = {
        "C:\\Windows\\Fonts\\segoeui.ttf",
    };
#elif __APPLE__
    const std::vector<std::string> font_paths = {
        "/System/Library/Fonts/SFNS.ttf",
    };
#else
    const std::vector<std::string> font_paths = {
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
#endif

    io.Fonts->Clear();

    for (const auto& font_path : font_paths) {
        if (!std::filesystem::exists(font_path)) {
            continue;
        }
        if (io.Fonts->AddFontFromFileTTF(font_path.c_str(), font_size + 2 * dpi_scale, &font_config)) {
            spdlog::info("Loaded font: {}", font_path);
            io.Fonts->Build();
            return;
        }
        spdlog::warn("Failed to load font: {}", font_path);
    }

    spdlog::info("Using default font");
    io.Fonts->AddFontDefault(&font_config);
    io.Fonts->Build();
}

}  // anonymous namespace

int run(int argc, char** argv) {
    // Parse arguments
    GuiOptions options;

    CLI::App app{"Loupe - zoomable image viewer"};
    app.set_version_flag("-V,--version", APP_VERSION);

    app.add_option("input", options.input, "Image file or folder to open")
        ->check(CLI::ExistingPath);
    app.add_option("--preview-interval", options.preview_interval_ms,
        "Minimum milliseconds between preview renders while dragging")
        ->check(CLI::Range(0, 5000))
        ->capture_default_str();
    app.add_option("--quiescence", options.quiescence_ms,
        "Milliseconds without input before the final render")
        ->check(CLI::Range(0, 5000))
        ->capture_default_str();
    app.add_option("--thumb-cache", options.thumbnail_capacity, "Thumbnail cache capacity")
        ->check(CLI::Range(std::size_t{1}, std::size_t{100000}))
        ->capture_default_str();
    app.add_option("--workers", options.workers, "Background worker threads")
        ->check(CLI::Range(std::size_t{1}, std::size_t{64}))
        ->capture_default_str();
    app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", options.quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    // Setup logging
    auto logger = spdlog::stdout_color_mt("loupe-gui");
    spdlog::set_default_logger(logger);

    if (options.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
#if defined(DEBUG) || defined(_DEBUG)
        spdlog::set_level(spdlog::level::debug);
#else
        spdlog::set_level(spdlog::level::info);
#endif
    }

    spdlog::info("Starting Loupe v{}", APP_VERSION);

    // Initialize SDL
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        spdlog::error("Failed to initialize SDL: {}", SDL_GetError());
        return 1;
    }

    auto backend = create_backend();
    if (!backend) {
        spdlog::error("Failed to create render backend");
        SDL_Quit();
        return 1;
    }

    SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    window_flags |= backend->window_flags();

    SDL_Window* window = SDL_CreateWindow(kWindowTitle, kDefaultWidth, kDefaultHeight, window_flags);
    if (!window) {
        spdlog::error("Failed to create window: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_SetWindowMinimumSize(window, kMinWidth, kMinHeight);

    // Clamp window size to usable screen area
    {
        SDL_DisplayID display = SDL_GetDisplayForWindow(window);
        SDL_Rect display_bounds;

        if (display != 0 && SDL_GetDisplayUsableBounds(display, &display_bounds)) {
            int current_w, current_h;
            SDL_GetWindowSize(window, &current_w, &current_h);

            int max_w = std::max(kMinWidth, static_cast<int>(display_bounds.w * 0.95f));
            int max_h = std::max(kMinHeight, static_cast<int>(display_bounds.h * 0.95f));

            int actual_w = std::clamp(current_w, kMinWidth, max_w);
            int actual_h = std::clamp(current_h, kMinHeight, max_h);

            if (actual_w != current_w || actual_h != current_h) {
                SDL_SetWindowSize(window, actual_w, actual_h);
                spdlog::info("Window clamped to {}x{} (screen usable: {}x{})",
                             actual_w, actual_h, display_bounds.w, display_bounds.h);
            }
            SDL_SetWindowPosition(window, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED);
        }
    }

    if (!backend->init(window)) {
        spdlog::error("Failed to initialize backend: {}", to_string(backend->last_error()));
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    spdlog::info("Using render backend: {}", backend->name());

    // Setup ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    float dpi_scale = 1.0f;
    if (SDL_DisplayID display = SDL_GetDisplayForWindow(window); display != 0) {
        const float content_scale = SDL_GetDisplayContentScale(display);
        if (content_scale > 0.0f) {
            dpi_scale = content_scale;
        }
        spdlog::info("Display DPI scale: {:.2f}", dpi_scale);
    }

    load_fonts(io, dpi_scale);
    ImGui::GetStyle().ScaleAllSizes(dpi_scale);
    apply_style();

    backend->imgui_init();

    // Session, workers and UI
    SessionConfig config;
    config.throttle.preview_interval = std::chrono::milliseconds(options.preview_interval_ms);
    config.throttle.quiescence_delay = std::chrono::milliseconds(options.quiescence_ms);
    config.thumbnail_capacity = options.thumbnail_capacity;

    {
        TaskPool pool(options.workers);
        ViewerSession session(std::make_shared<OpenCvImageSource>(), pool, config);

        AppController controller(*backend, session);
        controller.state().dpi_scale = dpi_scale;
        MainWindow main_window(controller, window);

        struct RenderContext {
            IRenderBackend* backend;
            MainWindow* main_window;
        };

        RenderContext render_ctx{backend.get(), &main_window};

        // Event watch callback - called during Windows modal resize loop
        auto event_watch = [](void* userdata, SDL_Event* event) -> bool {
            auto* ctx = static_cast<RenderContext*>(userdata);

            if (event->type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED ||
                event->type == SDL_EVENT_WINDOW_EXPOSED) {

                if (event->type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED) {
                    ctx->backend->on_resize(event->window.data1, event->window.data2);
                }

                ctx->backend->begin_frame();
                ctx->backend->imgui_new_frame();
                ImGui::NewFrame();
                ctx->main_window->render();
                ImGui::Render();
                ctx->backend->imgui_render();
                ctx->backend->end_frame();
                ctx->backend->present();
            }

            return true;
        };

        SDL_AddEventWatch(event_watch, &render_ctx);

        // Open file or folder from command line
        if (!options.input.empty()) {
            const auto path = path_from_utf8(options.input);
            if (std::filesystem::is_directory(path)) {
                controller.open_folder(path);
            } else {
                const auto folder = path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path();
                controller.open_folder(folder);
                controller.load_image(path);   // Failure stays visible in the status bar
            }
        }

        // Main loop
        bool running = true;

        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL3_ProcessEvent(&event);

                switch (event.type) {
                    case SDL_EVENT_QUIT:
                        running = false;
                        break;

                    case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                        if (event.window.windowID == SDL_GetWindowID(window)) {
                            running = false;
                        }
                        break;

                    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                        backend->on_resize(event.window.data1, event.window.data2);
                        break;

                    default:
                        main_window.handle_event(event);
                        break;
                }
            }

            backend->begin_frame();
            backend->imgui_new_frame();
            ImGui::NewFrame();
            main_window.render();
            ImGui::Render();
            backend->imgui_render();
            backend->end_frame();
            backend->present();
        }

        SDL_RemoveEventWatch(event_watch, &render_ctx);
        spdlog::info("Shutting down...");
    }

    backend->imgui_shutdown();
    ImGui::DestroyContext();

    backend->shutdown();
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}

}  // namespace loupe::gui
