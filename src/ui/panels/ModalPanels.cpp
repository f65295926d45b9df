#include "ui/panels/MainPanels.hpp"
#include "ui/UiUtils.hpp"
#include "imgui.h"
#include <string>
#include <vector>

namespace whisperim::ui {

namespace {

bool StringCombo(const char* label, std::string& value, const std::vector<std::string>& options) {
    bool changed = false;
    if (ImGui::BeginCombo(label, value.c_str())) {
        for (const auto& option : options) {
            const bool isSelected = (option == value);
            if (ImGui::Selectable(option.c_str(), isSelected)) {
                value = option;
                changed = true;
            }
            if (isSelected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    return changed;
}

const char* BackendLabel(domain::Backend backend) {
    return backend == domain::Backend::OpenVINO ? "OpenVINO" : "Default (whisper.cpp)";
}

} // namespace

void DrawSettingsModal(AppState& app) {
    if (app.ui.showSettings) {
        ImGui::OpenPopup("Settings");
    }
    if (ImGui::BeginPopupModal("Settings", &app.ui.showSettings, ImGuiWindowFlags_AlwaysAutoResize)) {
        auto& draft = app.config.draft;
        ImGui::PushItemWidth(320.0f);

        if (ImGui::BeginCombo("Backend", BackendLabel(draft.backend))) {
            for (auto backend : {domain::Backend::Default, domain::Backend::OpenVINO}) {
                if (ImGui::Selectable(BackendLabel(backend), backend == draft.backend)) {
                    draft.backend = backend;
                    // No OpenVINO encoder for "large".
                    if (!domain::IsValidModel(draft.backend, draft.model)) {
                        draft.model = "base";
                    }
                }
            }
            ImGui::EndCombo();
        }

        InputTextString("Models Dir", &draft.modelsDir);
        if (draft.backend == domain::Backend::OpenVINO) {
            ImGui::TextDisabled("Needs ggml-<model>-encoder-openvino.xml/.bin next to the model.");
        }

        StringCombo("Model", draft.model, domain::ModelsFor(draft.backend));
        StringCombo("Language", draft.language, domain::SupportedLanguages());

        const std::string threadsLabel = std::to_string(draft.threads);
        if (ImGui::BeginCombo("Threads", threadsLabel.c_str())) {
            for (int count : domain::SupportedThreadCounts()) {
                if (ImGui::Selectable(std::to_string(count).c_str(), count == draft.threads)) {
                    draft.threads = count;
                }
            }
            ImGui::EndCombo();
        }

        ImGui::PopItemWidth();
        if (app.IsRecording() || app.IsTranscribing()) {
            ImGui::TextDisabled("Changes apply to the next recording.");
        }

        ImGui::Separator();
        ImGui::Dummy(ImVec2(0, 10));

        if (ImGui::Button("Save & Close", ImVec2(120, 0))) {
            if (draft.modelsDir.empty()) {
                draft.modelsDir = domain::Settings{}.modelsDir;
            }
            app.SaveConfig(draft);
            app.ui.showSettings = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120, 0))) {
            app.ui.showSettings = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void DrawAllModals(AppState& app) {
    DrawSettingsModal(app);
}

} // namespace whisperim::ui
