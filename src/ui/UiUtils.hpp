#pragma once

#include "ui/AppState.hpp"
#include "imgui.h"
#include <string>

namespace whisperim::ui {

/**
 * @brief Text color for a status tone.
 */
ImVec4 StatusColor(StatusTone tone);

/**
 * @brief Single-line InputText backed by a std::string.
 */
bool InputTextString(const char* label, std::string* str, ImGuiInputTextFlags flags = 0);

/**
 * @brief Helper for InputTextMultiline with std::string and auto-resize.
 */
bool InputTextMultilineString(const char* label, std::string* str, const ImVec2& size, ImGuiInputTextFlags flags = 0);

/**
 * @brief Button with a custom base color. Hover/active shades are derived from it.
 */
bool ColoredButton(const char* label, const ImVec4& color, const ImVec2& size);

} // namespace whisperim::ui
