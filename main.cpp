#include "app/WhisperImApp.hpp"

int main(int, char**) {
    whisperim::app::WhisperImApp app;
    return app.Run();
}
