/**
 * @file AppState.cpp
 * @brief Implementation of the AppState class and session/UI coordination.
 */
#include "ui/AppState.hpp"

#include <cstdio>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"

namespace whisperim::ui {

namespace {

constexpr auto kExitDelay = std::chrono::milliseconds(500);

} // namespace

AppState::AppState() {
    ui.outputLog = std::string("whisper-im ") + WHISPERIM_VERSION + "\n";
}

void AppState::InjectServices(application::AppServices&& newServices) {
    services = std::move(newServices);
    AppendLog("[System] Services ready.\n");
}

void AppState::LoadConfig() {
    domain::Failure failure;
    bool created = false;
    config.settings = infrastructure::ConfigLoader::LoadOrCreate(config.path, &failure, &created);
    if (failure.isSet()) {
        AppendLog("[Config] " + failure.message + "\n");
    }
    if (created) {
        AppendLog("[Config] Created " + config.path.string() + "\n");
    }
    AppendLog("[Config] " + config.path.string() + ": backend=" + domain::ToString(config.settings.backend) +
              " model=" + config.settings.model + " language=" + config.settings.language +
              " threads=" + std::to_string(config.settings.threads) + "\n");
}

bool AppState::SaveConfig(const domain::Settings& settings) {
    config.settings = settings;

    std::string error;
    if (!infrastructure::ConfigLoader::Save(config.path, settings, error)) {
        std::cerr << "[Config] Save failed: " << error << std::endl;
        AppendLog("[Config] Save failed: " + error + "\n");
        SetStatus("Settings not saved: " + error, StatusTone::Error);
        return false;
    }
    AppendLog("[Config] Saved " + config.path.string() + "\n");
    return true;
}

void AppState::BeginEditSettings() {
    config.draft = config.settings;
}

bool AppState::IsTranscribing() const {
    return services.dictationService &&
           services.dictationService->GetState() == application::SessionState::Transcribing;
}

bool AppState::IsRecording() const {
    return services.dictationService &&
           services.dictationService->GetState() == application::SessionState::Recording;
}

void AppState::ToggleRecording() {
    auto* dictation = services.dictationService.get();
    if (!dictation) return;

    const auto before = dictation->GetState();
    if (before == application::SessionState::Transcribing || before == application::SessionState::Closed) {
        return;
    }

    domain::Failure failure;
    if (!dictation->Toggle(config.settings, failure)) {
        SetStatus(failure.message, StatusTone::Error);
        return;
    }

    if (before == application::SessionState::Idle) {
        ui.resultText.clear();
        SetStatus("Recording...", StatusTone::Recording);
    } else if (dictation->GetState() == application::SessionState::Transcribing) {
        SetStatus("Transcribing...", StatusTone::Busy);
    }
}

void AppState::Update() {
    auto* dictation = services.dictationService.get();
    if (dictation) {
        if (auto outcome = dictation->Poll()) {
            HandleOutcome(*outcome);
        } else if (dictation->GetState() == application::SessionState::Recording) {
            char buffer[64];
            const double seconds = dictation->GetRecordingElapsed().count() / 1000.0;
            std::snprintf(buffer, sizeof(buffer), "Recording... %.1fs", seconds);
            ui.statusText = buffer;
        } else if (dictation->GetState() == application::SessionState::Transcribing &&
                   ui.statusTone != StatusTone::Busy) {
            SetStatus("Transcribing...", StatusTone::Busy);
        }
    }

    if (ui.exitAt && std::chrono::steady_clock::now() >= *ui.exitAt) {
        ui.requestExit = true;
    }
}

void AppState::Shutdown() {
    if (services.dictationService) {
        services.dictationService->Shutdown();
    }
}

void AppState::HandleOutcome(const application::SessionOutcome& outcome) {
    switch (outcome.kind) {
        case application::OutcomeKind::Completed:
            ui.resultText = outcome.text;
            SetStatus("Done", StatusTone::Success);
            ui.exitAt = std::chrono::steady_clock::now() + kExitDelay;
            break;
        case application::OutcomeKind::EmptyRecording:
            SetStatus("Ready", StatusTone::Ready);
            break;
        case application::OutcomeKind::NoText:
            SetStatus("No text detected", StatusTone::Warning);
            break;
        case application::OutcomeKind::Failed:
            ui.resultText = outcome.text;
            SetStatus(outcome.failure.message, StatusTone::Error);
            if (!outcome.retainedAudio.empty()) {
                AppendLog("[System] Audio kept for inspection: " + outcome.retainedAudio + "\n");
            }
            break;
    }
}

void AppState::SetStatus(const std::string& text, StatusTone tone) {
    ui.statusText = text;
    ui.statusTone = tone;
}

void AppState::AppendLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(ui.logMutex);
    ui.outputLog += line;
}

std::string AppState::GetLogSnapshot() {
    std::lock_guard<std::mutex> lock(ui.logMutex);
    return ui.outputLog;
}

} // namespace whisperim::ui
