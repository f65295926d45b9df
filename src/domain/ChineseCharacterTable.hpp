#pragma once

#include <vector>

namespace whisperim::domain {

/**
 * @struct CharacterPair
 * @brief A single Traditional character and its Simplified form, both UTF-8.
 */
struct CharacterPair {
    const char* traditional;
    const char* simplified;
};

/** @brief The static conversion table used by TextNormalizer. */
const std::vector<CharacterPair>& TraditionalToSimplifiedPairs();

} // namespace whisperim::domain
