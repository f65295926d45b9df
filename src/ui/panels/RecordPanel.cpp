#include "ui/panels/MainPanels.hpp"
#include "ui/UiUtils.hpp"
#include "imgui.h"

namespace whisperim::ui {

void DrawRecordControls(AppState& app) {
    const bool recording = app.IsRecording();
    const bool transcribing = app.IsTranscribing();
    const bool closing = app.ui.exitAt.has_value();

    const ImVec2 buttonSize(220.0f, 56.0f);
    const float offset = (ImGui::GetContentRegionAvail().x - buttonSize.x) * 0.5f;
    if (offset > 0.0f) ImGui::SetCursorPosX(ImGui::GetCursorPosX() + offset);

    if (transcribing || closing) ImGui::BeginDisabled();
    const char* label = transcribing ? "Transcribing..." : (recording ? "[ STOP ]" : "[ START ]");
    const ImVec4 color = recording ? ImVec4(0.96f, 0.26f, 0.21f, 1.0f) : ImVec4(0.30f, 0.69f, 0.31f, 1.0f);
    if (ColoredButton(label, color, buttonSize)) {
        app.ToggleRecording();
    }
    if (transcribing || closing) ImGui::EndDisabled();

    ImGui::Spacing();
    ImGui::PushStyleColor(ImGuiCol_Text, StatusColor(app.ui.statusTone));
    ImGui::TextWrapped("%s", app.ui.statusText.c_str());
    ImGui::PopStyleColor();
}

void DrawResultPanel(AppState& app) {
    ImGui::Text("Result:");
    const float logReserve = app.ui.showLog ? 190.0f : 70.0f;
    InputTextMultilineString("##result", &app.ui.resultText, ImVec2(-1, -logReserve), ImGuiInputTextFlags_ReadOnly);

    const bool hasResult = !app.ui.resultText.empty();
    if (!hasResult) ImGui::BeginDisabled();
    if (ImGui::Button("Copy to clipboard", ImVec2(180, 0))) {
        ImGui::SetClipboardText(app.ui.resultText.c_str());
        app.SetStatus("Copied!", StatusTone::Success);
        app.AppendLog("[Clipboard] Copied through the window clipboard.\n");
    }
    if (!hasResult) ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::TextDisabled("Press SPACE to start/stop recording");
}

void DrawLogPanel(AppState& app) {
    ImGui::SetNextItemOpen(app.ui.showLog);
    app.ui.showLog = ImGui::CollapsingHeader("Log");
    if (!app.ui.showLog) return;

    ImGui::BeginChild("Log", ImVec2(0, 0), true);
    std::string logSnapshot = app.GetLogSnapshot();
    ImGui::TextUnformatted(logSnapshot.c_str());
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
        ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();
}

} // namespace whisperim::ui
