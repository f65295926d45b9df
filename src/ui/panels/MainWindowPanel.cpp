#include "ui/panels/MainPanels.hpp"
#include "imgui.h"

namespace whisperim::ui {

void DrawMainWindow(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    // Begin Main Window
    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_MenuBar);

    DrawMenuBar(app);

    ImGui::Spacing();
    DrawRecordControls(app);
    ImGui::Separator();
    DrawResultPanel(app);
    ImGui::Separator();
    DrawLogPanel(app);

    ImGui::End();
}

} // namespace whisperim::ui
