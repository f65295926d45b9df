/**
 * @file AppState.hpp
 * @brief Core application state and UI logic coordination.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "domain/Settings.hpp"
#include "application/AppServices.hpp"

namespace whisperim::ui {

    /**
     * @enum StatusTone
     * @brief Color of the status line.
     */
    enum class StatusTone {
        Ready,
        Recording,
        Busy,
        Success,
        Warning,
        Error
    };

    /**
     * @struct ConfigState
     * @brief Persisted settings plus the working copy edited by the settings dialog.
     */
    struct ConfigState {
        domain::Settings settings;          ///< Currently active configuration.
        std::filesystem::path path;         ///< Location of config.json.
        domain::Settings draft;             ///< Edited by the dialog, applied on "Save & Close".
    };

    /**
     * @struct UiState
     * @brief State for UI flags, buffers and the status line.
     */
    struct UiState {
        std::string outputLog;
        std::string statusText = "Ready";
        StatusTone statusTone = StatusTone::Ready;
        std::string resultText;             ///< Last transcript, kept for manual copy.
        bool showSettings = false;
        bool showLog = false;
        bool requestExit = false;
        std::optional<std::chrono::steady_clock::time_point> exitAt; ///< Set after a successful copy.

        std::mutex logMutex;
    };

/**
 * @struct AppState
 * @brief Everything the UI renders from, plus the injected services.
 */
struct AppState {
    ConfigState config;
    UiState ui;

    application::AppServices services; ///< Injected services.

    AppState();

    /** @brief Injects the required services into the state. */
    void InjectServices(application::AppServices&& newServices);

    /** @brief Loads config.json, writing the defaults on first run. Problems are logged and replaced by defaults. */
    void LoadConfig();
    /** @brief Applies and persists new settings. Does not touch an active session. */
    bool SaveConfig(const domain::Settings& settings);
    /** @brief Copies the active settings into the dialog's working copy. */
    void BeginEditSettings();

    /** @brief Start/stop action of the button and the SPACE key. */
    void ToggleRecording();
    /** @brief Per-frame housekeeping: session results, recording timer, delayed exit. */
    void Update();
    /** @brief Stops an active recording and waits for a running transcription. */
    void Shutdown();

    bool IsTranscribing() const;
    bool IsRecording() const;

    void SetStatus(const std::string& text, StatusTone tone);
    /** @brief Thread-safe log append. */
    void AppendLog(const std::string& line);
    /** @brief Thread-safe log retrieval. */
    std::string GetLogSnapshot();

private:
    void HandleOutcome(const application::SessionOutcome& outcome);
};

} // namespace whisperim::ui
