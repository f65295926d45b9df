#pragma once

#include "domain/ClipboardWriter.hpp"

#include <chrono>
#include <string>

namespace whisperim::infrastructure {

/**
 * @class WlCopyClipboard
 * @brief Wayland clipboard through wl-copy, text on stdin.
 */
class WlCopyClipboard : public domain::ClipboardWriter {
public:
    explicit WlCopyClipboard(std::string program = "wl-copy",
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    bool write(const std::string& text, domain::Failure& failure) override;

private:
    std::string m_program;
    std::chrono::milliseconds m_timeout;
};

} // namespace whisperim::infrastructure
