/**
 * @file TextNormalizer.hpp
 * @brief Traditional to Simplified Chinese conversion of transcripts.
 */

#pragma once

#include <string>

namespace whisperim::domain {

/**
 * @class TextNormalizer
 * @brief Maps Traditional Chinese characters to Simplified ones, character by character.
 *
 * Input is UTF-8. Characters outside the table, ASCII and malformed byte
 * sequences are copied unchanged. normalize(normalize(x)) == normalize(x).
 */
class TextNormalizer {
public:
    std::string normalize(const std::string& text) const;

    /** @brief Number of characters the table knows about. */
    static std::size_t TableSize();
};

} // namespace whisperim::domain
