/**
 * @file UiRenderer.cpp
 * @brief Frame composition: main window first, then modals.
 */
#include "ui/UiRenderer.hpp"
#include "ui/panels/MainPanels.hpp"

namespace whisperim::ui {

void DrawUI(AppState& app) {
    app.Update();
    DrawMainWindow(app);
    DrawAllModals(app);
}

} // namespace whisperim::ui
