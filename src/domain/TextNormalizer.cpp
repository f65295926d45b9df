/**
 * @file TextNormalizer.cpp
 * @brief Implementation of TextNormalizer.
 */
#include "domain/TextNormalizer.hpp"
#include "domain/ChineseCharacterTable.hpp"

#include <unordered_map>

namespace whisperim::domain {

namespace {

// Length of the UTF-8 sequence starting at pos, or 0 if it is malformed.
std::size_t DecodeUtf8(const std::string& text, std::size_t pos, char32_t& codePoint) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        codePoint = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        codePoint = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        codePoint = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        codePoint = lead & 0x07;
        length = 4;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;
    for (std::size_t i = 1; i < length; ++i) {
        const unsigned char cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) return 0;
        codePoint = (codePoint << 6) | (cont & 0x3F);
    }
    return length;
}

const std::unordered_map<char32_t, const char*>& ConversionMap() {
    static const std::unordered_map<char32_t, const char*> map = [] {
        std::unordered_map<char32_t, const char*> built;
        const auto& pairs = TraditionalToSimplifiedPairs();
        built.reserve(pairs.size());
        for (const auto& pair : pairs) {
            const std::string traditional = pair.traditional;
            char32_t codePoint = 0;
            if (DecodeUtf8(traditional, 0, codePoint) == traditional.size()) {
                built.emplace(codePoint, pair.simplified);
            }
        }
        return built;
    }();
    return map;
}

} // namespace

std::string TextNormalizer::normalize(const std::string& text) const {
    const auto& map = ConversionMap();

    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t codePoint = 0;
        const std::size_t length = DecodeUtf8(text, pos, codePoint);
        if (length == 0) {
            result.push_back(text[pos]);
            ++pos;
            continue;
        }
        if (length > 1) {
            auto it = map.find(codePoint);
            if (it != map.end()) {
                result.append(it->second);
                pos += length;
                continue;
            }
        }
        result.append(text, pos, length);
        pos += length;
    }
    return result;
}

std::size_t TextNormalizer::TableSize() {
    return ConversionMap().size();
}

} // namespace whisperim::domain
