#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace whisperim::ui {

void DrawMenuBar(AppState& app) {
    const bool busy = app.IsTranscribing();

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Quit", nullptr, false, !busy)) {
                app.ui.requestExit = true;
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Settings")) {
            if (ImGui::MenuItem("Preferences...", nullptr, false, true)) {
                app.BeginEditSettings();
                app.ui.showSettings = true;
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            if (ImGui::MenuItem("Log", nullptr, app.ui.showLog)) {
                app.ui.showLog = !app.ui.showLog;
            }
            ImGui::Separator();
            ImGui::TextDisabled("Version: %s", WHISPERIM_VERSION);
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

} // namespace whisperim::ui
