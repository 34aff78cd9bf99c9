#include <kgrag/common/utf8_utils.h>

#include <cctype>

namespace kgrag::common {

namespace {

// Length of the well-formed sequence at `i`, or 0 when the bytes there do not
// form one. Second-byte ranges follow RFC 3629 (no overlongs, no surrogates).
size_t validSequence(std::string_view s, size_t i) {
    const auto* data = reinterpret_cast<const unsigned char*>(s.data());
    const unsigned char c = data[i];
    if (c < 0x80)
        return 1;

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0)
            lo = 0xA0;
        else if (c == 0xED)
            hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0)
            lo = 0x90;
        else if (c == 0xF4)
            hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size())
        return 0;
    if (data[i + 1] < lo || data[i + 1] > hi)
        return 0;
    for (size_t k = 2; k < len; ++k) {
        if ((data[i + k] & 0xC0) != 0x80)
            return 0;
    }
    return len;
}

// Decodes one code point at `i`. Returns the consumed length, 0 on malformed input.
size_t decode(std::string_view s, size_t i, char32_t& cp) {
    const auto* data = reinterpret_cast<const unsigned char*>(s.data());
    const size_t len = validSequence(s, i);
    switch (len) {
        case 0:
            return 0;
        case 1:
            cp = data[i];
            break;
        case 2:
            cp = (char32_t(data[i] & 0x1F) << 6) | (data[i + 1] & 0x3F);
            break;
        case 3:
            cp = (char32_t(data[i] & 0x0F) << 12) | (char32_t(data[i + 1] & 0x3F) << 6) |
                 (data[i + 2] & 0x3F);
            break;
        default:
            cp = (char32_t(data[i] & 0x07) << 18) | (char32_t(data[i + 1] & 0x3F) << 12) |
                 (char32_t(data[i + 2] & 0x3F) << 6) | (data[i + 3] & 0x3F);
            break;
    }
    return len;
}

void encode(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

char32_t simpleLower(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z')
        return cp + 0x20;
    if (cp < 0xC0)
        return cp;
    // Latin-1 Supplement
    if (cp <= 0xDE)
        return cp == 0xD7 ? cp : cp + 0x20;
    // Latin Extended-A: alternating upper/lower pairs
    if (cp >= 0x100 && cp <= 0x137)
        return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148)
        return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177)
        return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178)
        return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E)
        return (cp % 2 == 1) ? cp + 1 : cp;
    // Horned O and U (Vietnamese)
    if (cp == 0x1A0 || cp == 0x1AF)
        return cp + 1;
    // Greek
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2)
        return cp + 0x20;
    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F)
        return cp + 0x50;
    if (cp >= 0x410 && cp <= 0x42F)
        return cp + 0x20;
    // Latin Extended Additional, including the Vietnamese tone-marked vowels
    if (cp >= 0x1E00 && cp <= 0x1E95)
        return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x1E9E)
        return 0xDF;
    if (cp >= 0x1EA0 && cp <= 0x1EFF)
        return (cp % 2 == 0) ? cp + 1 : cp;
    return cp;
}

} // namespace

std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        const size_t len = validSequence(input, i);
        if (len == 0) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.append(input.substr(i, len));
        i += len;
    }
    return out;
}

std::string toLowerUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        char32_t cp = 0;
        const size_t len = decode(input, i, cp);
        if (len == 0) {
            out.push_back(input[i]);
            ++i;
            continue;
        }
        encode(simpleLower(cp), out);
        i += len;
    }
    return out;
}

std::vector<std::string> splitWhitespace(std::string_view input) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < input.size()) {
        while (i < input.size() && std::isspace(static_cast<unsigned char>(input[i])))
            ++i;
        size_t start = i;
        while (i < input.size() && !std::isspace(static_cast<unsigned char>(input[i])))
            ++i;
        if (i > start)
            words.emplace_back(input.substr(start, i - start));
    }
    return words;
}

std::size_t utf8Length(std::string_view input) {
    std::size_t count = 0;
    size_t i = 0;
    while (i < input.size()) {
        char32_t cp = 0;
        const size_t len = decode(input, i, cp);
        i += (len == 0) ? 1 : len;
        ++count;
    }
    return count;
}

std::string utf8Prefix(std::string_view input, std::size_t maxChars) {
    size_t i = 0;
    std::size_t count = 0;
    while (i < input.size() && count < maxChars) {
        char32_t cp = 0;
        const size_t len = decode(input, i, cp);
        i += (len == 0) ? 1 : len;
        ++count;
    }
    return std::string(input.substr(0, i));
}

} // namespace kgrag::common
