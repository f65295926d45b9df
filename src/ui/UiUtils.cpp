#include "ui/UiUtils.hpp"

namespace whisperim::ui {

ImVec4 StatusColor(StatusTone tone) {
    switch (tone) {
        case StatusTone::Recording: return ImVec4(0.96f, 0.26f, 0.21f, 1.0f);
        case StatusTone::Busy:      return ImVec4(0.30f, 0.60f, 1.00f, 1.0f);
        case StatusTone::Success:   return ImVec4(0.30f, 0.69f, 0.31f, 1.0f);
        case StatusTone::Warning:   return ImVec4(1.00f, 0.60f, 0.00f, 1.0f);
        case StatusTone::Error:     return ImVec4(0.96f, 0.26f, 0.21f, 1.0f);
        case StatusTone::Ready:     break;
    }
    return ImVec4(0.60f, 0.60f, 0.60f, 1.0f);
}

static int TextEditCallback(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* str = static_cast<std::string*>(data->UserData);
        str->resize(data->BufTextLen);
        data->Buf = str->data();
    }
    return 0;
}

bool InputTextString(const char* label, std::string* str, ImGuiInputTextFlags flags) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    return ImGui::InputText(label, str->data(), str->capacity() + 1, flags, TextEditCallback, str);
}

bool InputTextMultilineString(const char* label, std::string* str, const ImVec2& size, ImGuiInputTextFlags flags) {
    flags |= ImGuiInputTextFlags_CallbackResize;
    flags |= ImGuiInputTextFlags_NoHorizontalScroll; // Enable Word Wrap
    if (str->capacity() == 0) {
        str->reserve(1024);
    }
    return ImGui::InputTextMultiline(label, str->data(), str->capacity() + 1, size, flags, TextEditCallback, str);
}

bool ColoredButton(const char* label, const ImVec4& color, const ImVec2& size) {
    ImGui::PushStyleColor(ImGuiCol_Button, color);
    ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(color.x * 1.15f, color.y * 1.15f, color.z * 1.15f, color.w));
    ImGui::PushStyleColor(ImGuiCol_ButtonActive, ImVec4(color.x * 0.85f, color.y * 0.85f, color.z * 0.85f, color.w));
    ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 1.0f, 1.0f, 1.0f));
    const bool clicked = ImGui::Button(label, size);
    ImGui::PopStyleColor(4);
    return clicked;
}

} // namespace whisperim::ui
