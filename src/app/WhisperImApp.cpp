/**
 * @file WhisperImApp.cpp
 * @brief Implementation of the WhisperImApp class.
 */
#include "app/WhisperImApp.hpp"

#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include "infrastructure/CommandRecorder.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WhisperCliAdapter.hpp"
#include "infrastructure/WlCopyClipboard.hpp"
#include "application/AppServices.hpp"

namespace whisperim::app {

namespace {

std::string FindFontPath(const std::vector<const char*>& candidates) {
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

void LoadFonts(ImGuiIO& io) {
    const float baseFontSize = 18.0f;

    const std::vector<const char*> baseCandidates = {
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/TTF/NotoSans-Regular.ttf",
        "/usr/share/fonts/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    const std::vector<const char*> cjkCandidates = {
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/google-noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
        "/usr/share/fonts/wenquanyi/wqy-microhei/wqy-microhei.ttc",
        "/usr/share/fonts/truetype/droid/DroidSansFallbackFull.ttf",
    };

    std::string basePath = FindFontPath(baseCandidates);
    ImFont* baseFont = nullptr;
    if (!basePath.empty()) {
        baseFont = io.Fonts->AddFontFromFileTTF(basePath.c_str(), baseFontSize);
    }
    if (!baseFont) {
        baseFont = io.Fonts->AddFontDefault();
    }
    io.FontDefault = baseFont;

    std::string cjkPath = FindFontPath(cjkCandidates);
    if (cjkPath.empty()) {
        std::cerr << "[WhisperImApp] WARNING: No CJK font found in system paths. Chinese text will not render." << std::endl;
        return;
    }

    std::cout << "[WhisperImApp] Found CJK Font: " << cjkPath << std::endl;
    ImFontConfig config;
    config.MergeMode = true;
    config.PixelSnapH = true;

    ImFontGlyphRangesBuilder builder;
    builder.AddRanges(io.Fonts->GetGlyphRangesDefault());
    builder.AddRanges(io.Fonts->GetGlyphRangesChineseSimplifiedCommon());
    builder.AddRanges(io.Fonts->GetGlyphRangesJapanese());
    builder.AddRanges(io.Fonts->GetGlyphRangesKorean());
    static ImVector<ImWchar> ranges; // Static to persist until atlas build
    ranges.clear();
    builder.BuildRanges(&ranges);

    io.Fonts->AddFontFromFileTTF(cjkPath.c_str(), baseFontSize, &config, ranges.Data);
}

// Desktop launchers start us with a minimal PATH.
void ExtendSearchPath() {
    std::vector<std::filesystem::path> dirs;
    if (const char* home = std::getenv("HOME")) {
        dirs.push_back(std::filesystem::path(home) / ".local" / "bin");
    }
    dirs.emplace_back("/usr/local/bin");
    dirs.emplace_back("/usr/bin");
    infrastructure::PathUtils::PrependToSearchPath(dirs);
}

} // namespace

bool WhisperImApp::Init() {
    ExtendSearchPath();

    m_state.config.path = infrastructure::PathUtils::GetConfigFile();
    m_state.LoadConfig();

    // Dependency Injection / Composition Root
    application::AppServices services;
    services.dictationService = std::make_unique<application::DictationService>(
        std::make_unique<infrastructure::CommandRecorder>(),
        std::make_unique<infrastructure::WhisperCliAdapter>(),
        std::make_unique<infrastructure::WlCopyClipboard>(),
        [this](const std::string& line) { m_state.AppendLog(line + "\n"); });
    m_state.InjectServices(std::move(services));

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    const std::string title = std::string("Voice Input ") + WHISPERIM_VERSION;
    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 560, 520, window_flags);
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    LoadFonts(io);
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForOpenGL failed.\n");
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::fprintf(stderr, "ImGui_ImplOpenGL3_Init failed.\n");
        return false;
    }
    m_imguiInitialized = true;

    m_state.AppendLog("[System] Press SPACE or the button to record.\n");
    return true;
}

void WhisperImApp::Shutdown() {
    // Discards an active recording; waits for a running transcription.
    m_state.Shutdown();

    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int WhisperImApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) done = true;
            if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(m_window)) {
                done = true;
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ImGuiIO& io = ImGui::GetIO();
        const bool popupOpen = ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId);
        if (!io.WantTextInput && !popupOpen && ImGui::IsKeyPressed(ImGuiKey_Space, false)) {
            m_state.ToggleRecording();
        }

        ui::DrawUI(m_state);
        if (m_state.ui.requestExit) {
            done = true;
        }

        ImGui::Render();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    Shutdown();
    return 0;
}

} // namespace whisperim::app
