/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Headless front end of the render pipeline:
 *
 *   loupe render -i in.jpg -o out.png --zoom 2 --pan 40,-10 --algorithm mitchell
 *   loupe thumbs -i photos/ -o thumbs/ --size 80
 */

#include "cli/cli_app.hpp"
#include "core/render_pipeline.hpp"
#include "core/thumbnail_cache.hpp"
#include "core/types.hpp"
#include "io/directory_tree.hpp"
#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace loupe::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "  Loupe");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n\n", APP_VERSION);
}

// =============================================================================
// Options
// =============================================================================

struct RenderOptions {
    std::string input;
    std::string output;
    float zoom = kNeutralZoom;
    std::vector<float> pan;
    std::string algorithm = "lanczos3";
    std::string tier = "final";
    bool print_crop = false;
};

struct ThumbsOptions {
    std::string input;
    std::string output;
    int size = kThumbnailSize;
};

struct ProcessResult {
    int success = 0;
    int fail = 0;

    void print() const {
        fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} succeeded", success);
        if (fail > 0) {
            fmt::print(fmt::fg(fmt::color::red), ", {} failed", fail);
        }
        fmt::print("\n");
    }
};

const CLI::Validator kAlgorithmName(
    [](std::string& value) -> std::string {
        return parse_algorithm(value) ? std::string{} : "unknown resampling algorithm: " + value;
    },
    "ALGORITHM", "Algorithm");

const CLI::Validator kTierName(
    [](std::string& value) -> std::string {
        return parse_tier(value) ? std::string{} : "unknown tier: " + value;
    },
    "TIER", "Tier");

// =============================================================================
// Processing helpers
// =============================================================================

bool write_file(const fs::path& path, std::span<const uint8_t> bytes) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Cannot open output file: {}", path);
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        spdlog::error("Failed to write: {}", path);
        return false;
    }
    return true;
}

int run_render(const RenderOptions& options) {
    const OpenCvImageSource images;
    const fs::path input = path_from_utf8(options.input);
    const fs::path output = path_from_utf8(options.output);

    DecodeResult decoded = images.decode(input);
    if (!decoded.ok()) {
        spdlog::error("Failed to load {}: {}", input, decoded.message);
        return 1;
    }

    RenderRequest request;
    request.zoom = options.zoom;
    if (options.pan.size() == 2) {
        request.pan = PanOffset{options.pan[0], options.pan[1]};
    }
    request.algorithm = parse_algorithm(options.algorithm).value_or(ResamplingAlgorithm::Lanczos3);
    request.tier = parse_tier(options.tier).value_or(RenderTier::Final);

    spdlog::info("Rendering {} ({}x{}) zoom {:.2f} pan {:.1f},{:.1f} {} / {}",
                 filename_utf8(input), decoded.raster.width(), decoded.raster.height(),
                 request.zoom, request.pan.x, request.pan.y,
                 to_string(request.algorithm), to_string(request.tier));

    const RenderedBuffer buffer = render(decoded.raster, request);

    if (options.print_crop) {
        fmt::print("crop {} {} {} {}\n", buffer.crop.x, buffer.crop.y, buffer.crop.width, buffer.crop.height);
    }

    if (!write_file(output, buffer.bytes)) {
        return 1;
    }

    spdlog::info("Wrote {} ({} bytes, {})", output, buffer.bytes.size(), to_string(buffer.algorithm));
    return 0;
}

int run_thumbs(const ThumbsOptions& options) {
    const OpenCvImageSource images;
    const fs::path input = path_from_utf8(options.input);
    const fs::path output = path_from_utf8(options.output);

    if (!fs::is_directory(input)) {
        spdlog::error("Not a directory: {}", input);
        return 1;
    }

    const auto files = list_images(input);
    spdlog::info("Building {} thumbnails from {}", files.size(), input);

    ProcessResult result;
    for (const auto& file : files) {
        const Thumbnail thumbnail = make_thumbnail(file, images, options.size);

        if (thumbnail.is_placeholder()) {
            spdlog::warn("{}: {}", filename_utf8(file), to_string(thumbnail.kind));
        }

        fs::path target = output / file.filename();
        target.replace_extension(".png");

        if (write_file(target, thumbnail.encoded) && !thumbnail.is_placeholder()) {
            result.success++;
        } else {
            result.fail++;
        }
    }

    result.print();
    return (result.fail > 0) ? 1 : 0;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("loupe");
    if (!logger) {
        logger = spdlog::stdout_color_mt("loupe");
    }
    spdlog::set_default_logger(logger);

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

bool is_cli_invocation(int argc, char** argv) {
    // Subcommands come first; later arguments may be file names
    if (argc < 2 || !argv[1]) {
        return false;
    }
    const std::string_view command = argv[1];
    return command == "render" || command == "thumbs";
}

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"Loupe - zoomable image viewer and resampler"};
    app.set_version_flag("-V,--version", APP_VERSION);
    app.require_subcommand(1);

    // Verbosity
    bool verbose = false;
    bool quiet = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    // render
    RenderOptions render_options;
    auto* render_cmd = app.add_subcommand("render", "Render one view of an image to PNG");
    render_cmd->fallthrough();

    render_cmd->add_option("-i,--input", render_options.input, "Input image file")
        ->required()
        ->check(CLI::ExistingFile);
    render_cmd->add_option("-o,--output", render_options.output, "Output PNG file")
        ->required();
    render_cmd->add_option("--zoom", render_options.zoom, "Zoom factor")
        ->check(CLI::Range(kMinZoom, kMaxZoom))
        ->capture_default_str();
    render_cmd->add_option("--pan", render_options.pan, "Pan offset X,Y in pixels")
        ->delimiter(',')
        ->expected(2);
    render_cmd->add_option("--algorithm", render_options.algorithm,
        "nearest | triangle | catrom | mitchell | lanczos3")
        ->check(kAlgorithmName)
        ->capture_default_str();
    render_cmd->add_option("--tier", render_options.tier, "preview | final")
        ->check(kTierName)
        ->capture_default_str();
    render_cmd->add_flag("--print-crop", render_options.print_crop, "Print the source crop rectangle");

    // thumbs
    ThumbsOptions thumbs_options;
    auto* thumbs_cmd = app.add_subcommand("thumbs", "Build gallery thumbnails for a directory");
    thumbs_cmd->fallthrough();

    thumbs_cmd->add_option("-i,--input", thumbs_options.input, "Input directory")
        ->required()
        ->check(CLI::ExistingDirectory);
    thumbs_cmd->add_option("-o,--output", thumbs_options.output, "Output directory")
        ->required();
    thumbs_cmd->add_option("--size", thumbs_options.size, "Thumbnail edge length")
        ->check(CLI::Range(8, 1024))
        ->capture_default_str();

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    setup_logging(verbose, quiet);
    if (!quiet) {
        print_banner();
    }

    try {
        if (render_cmd->parsed()) {
            return run_render(render_options);
        }
        return run_thumbs(thumbs_options);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace loupe::cli
