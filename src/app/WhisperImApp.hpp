/**
 * @file WhisperImApp.hpp
 * @brief Main application class for whisper-im.
 */

#pragma once

#include "ui/AppState.hpp"

struct SDL_Window;

namespace whisperim::app {

/**
 * @class WhisperImApp
 * @brief Orchestrates the application lifecycle, including initialization, the main loop, and shutdown.
 */
class WhisperImApp {
public:
    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Initializes SDL, OpenGL, ImGui and the application state.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Cleans up all resources before exiting.
     */
    void Shutdown();

    ui::AppState m_state; ///< Settings, session and UI state.
    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false; ///< Flag indicating SDL initialization status.
    bool m_imguiInitialized = false; ///< Flag indicating ImGui initialization status.
};

} // namespace whisperim::app
