#pragma once

#include "domain/Failure.hpp"

#include <string>

namespace whisperim::domain {

/**
 * @class ClipboardWriter
 * @brief Places text on the desktop clipboard.
 */
class ClipboardWriter {
public:
    virtual ~ClipboardWriter() = default;

    /** @return False with a ClipboardError failure if the text could not be set. */
    virtual bool write(const std::string& text, Failure& failure) = 0;
};

} // namespace whisperim::domain
