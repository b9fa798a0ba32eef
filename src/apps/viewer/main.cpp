// Diagram preview: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <preview/diagram_preview.hpp>
#include <diagram_loaders/json_loader.hpp>
#include <diagram_loaders/demo_request.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

void init_logging() {
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "sheet_diagram_viewer.log";
        auto logger = spdlog::basic_logger_mt("sheet_diagram_viewer", log_file.string(), true);
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Viewer logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("file logging unavailable, using console: {}", e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::warn("file logging unavailable, using console: {}", e.what());
    }
}

// Glyphs the diagrams use beyond ASCII: Latin-1, arrows, box drawing, block
// elements, geometric shapes (arrow heads, dots) and braille.
const ImWchar diagram_glyph_ranges[] = {
    0x0020, 0x00FF,
    0x2190, 0x21FF,
    0x2500, 0x257F,
    0x2580, 0x259F,
    0x25A0, 0x25FF,
    0x2800, 0x28FF,
    0,
};

struct LoadedRequest {
    std::optional<diagram_model::DiagramRequest> request;
    std::string status;
};

LoadedRequest load_request(const std::vector<std::string>& paths, bool strict) {
    LoadedRequest out;
    for (const auto& path : paths) {
        if (!std::filesystem::exists(path)) continue;
        std::string error;
        out.request = diagram_loaders::load_request_from_json_file(path, &error, strict);
        if (out.request) {
            out.status = "loaded " + path;
            spdlog::info("loaded diagram request from {}", path);
        } else {
            out.status = path + ": " + error;
        }
        return out;
    }
    out.request = diagram_loaders::generate_demo_request();
    out.request->strict = strict;
    out.status = "built-in demo";
    return out;
}

} // namespace

int main(int argc, char* argv[])
{
    std::vector<std::string> request_paths;
    for (int i = 1; i < argc; ++i)
        request_paths.emplace_back(argv[i]);
    if (request_paths.empty())
        request_paths = { "data/example_diagram.json", "example_diagram.json" };

    init_logging();

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        spdlog::error("SDL_Init failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;  // HiDPI: request native pixel density back buffer
    SDL_Window* window = SDL_CreateWindow("Sheet diagram preview", window_width, window_height, window_flags);
    if (!window) {
        spdlog::error("SDL_CreateWindow failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::error("SDL_GL_CreateContext failed: {}", SDL_GetError());
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    // A monospace face with box-drawing coverage; the default ImGui font has neither.
    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
#ifdef _WIN32
    const char* font_paths[] = {
        "C:\\Windows\\Fonts\\consola.ttf",
        "C:\\Windows\\Fonts\\cour.ttf",
    };
#else
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
    };
#endif
    bool font_loaded = false;
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg, diagram_glyph_ranges) != nullptr) {
            spdlog::info("using font {}", path);
            font_loaded = true;
            break;
        }
    }
    if (!font_loaded)
        spdlog::warn("no monospace font with box-drawing glyphs found; preview falls back to the ImGui default font");

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    LoadedRequest loaded = load_request(request_paths, false);
    // Keep showing the last good request when a reload fails.
    diagram_model::DiagramRequest current = loaded.request ? *loaded.request : diagram_loaders::generate_demo_request();

    preview::DiagramPreview diagram_preview;
    diagram_preview.set_request(&current);
    diagram_preview.set_status(loaded.status);

    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        if (diagram_preview.take_reload_request()) {
            loaded = load_request(request_paths, diagram_preview.strict());
            if (loaded.request) {
                current = std::move(*loaded.request);
                current.width = diagram_preview.width();
                current.frame = diagram_preview.frame();
                diagram_preview.set_request(&current);
            }
            diagram_preview.set_status(loaded.status);
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Diagram", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0)
            diagram_preview.update_and_draw(canvas_size.x, canvas_size.y);
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    spdlog::shutdown();
    return 0;
}
