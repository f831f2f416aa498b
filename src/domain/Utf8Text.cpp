#include "domain/Utf8Text.hpp"
#include <cctype>

namespace lexingest::domain::utf8 {

const char* const kDigitPattern = "(?:[0-9]|٠|١|٢|٣|٤|٥|٦|٧|٨|٩|۰|۱|۲|۳|۴|۵|۶|۷|۸|۹)";

namespace {
    bool IsContinuationByte(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    bool IsAsciiSpace(unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }
}

std::size_t CodePointCount(const std::string& text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        if (!IsContinuationByte(c)) ++count;
    }
    return count;
}

std::string PrefixCodePoints(const std::string& text, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!IsContinuationByte(static_cast<unsigned char>(text[i]))) {
            if (seen == count) return text.substr(0, i);
            ++seen;
        }
    }
    return text;
}

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() && IsAsciiSpace(static_cast<unsigned char>(text[begin]))) ++begin;
    std::size_t end = text.size();
    while (end > begin && IsAsciiSpace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string AsciiLower(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x80) c = static_cast<char>(std::tolower(u));
    }
    return out;
}

std::string ToAsciiDigits(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        if (i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            // U+0660..U+0669 and U+06F0..U+06F9
            if (lead == 0xD9 && next >= 0xA0 && next <= 0xA9) {
                out.push_back(static_cast<char>('0' + (next - 0xA0)));
                ++i;
                continue;
            }
            if (lead == 0xDB && next >= 0xB0 && next <= 0xB9) {
                out.push_back(static_cast<char>('0' + (next - 0xB0)));
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(lead));
    }
    return out;
}

std::string CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool lastWasSpace = false;
    for (unsigned char c : text) {
        if (IsAsciiSpace(c)) {
            if (!lastWasSpace) {
                out.push_back(' ');
                lastWasSpace = true;
            }
            continue;
        }
        out.push_back(static_cast<char>(c));
        lastWasSpace = false;
    }
    return out;
}

} // namespace lexingest::domain::utf8
