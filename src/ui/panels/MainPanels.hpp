#pragma once

#include "ui/AppState.hpp"

namespace whisperim::ui {

// Components
void DrawRecordControls(AppState& app);
void DrawResultPanel(AppState& app);
void DrawLogPanel(AppState& app);

// Modals
void DrawSettingsModal(AppState& app);
void DrawAllModals(AppState& app);

// Main Blocks
void DrawMenuBar(AppState& app);
void DrawMainWindow(AppState& app);

} // namespace whisperim::ui
