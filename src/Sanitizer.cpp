#include "Sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {
constexpr std::array<const char*, 22> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};

constexpr char kFallbackName[] = "Unknown";

bool isDeletedCharacter(unsigned char ch) {
    switch (ch) {
    case ':':
    case '*':
    case '?':
    case '"':
    case '<':
    case '>':
    case '|':
        return true;
    default:
        return ch < 0x20 || ch == 0x7F;
    }
}

bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
        return std::toupper(a) == std::toupper(b);
    });
}
// C1 control characters (U+0080..U+009F) arrive as C2 80..C2 9F in UTF-8.
bool endsWithC1Control(const std::string& text) {
    if (text.size() < 2) {
        return false;
    }
    const auto lead = static_cast<unsigned char>(text[text.size() - 2]);
    const auto tail = static_cast<unsigned char>(text.back());
    return lead == 0xC2 && tail >= 0x80 && tail <= 0x9F;
}

// Byte length of the Unicode White_Space code point starting at pos, or 0.
// ASCII controls and U+0085 never get here; they are deleted first.
std::size_t whitespaceWidth(const std::string& text, std::size_t pos) {
    auto at = [&text](std::size_t i) -> unsigned int {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0u;
    };

    const unsigned int b0 = at(pos);
    if (b0 == ' ') {
        return 1;
    }
    if (b0 == 0xC2) {
        return at(pos + 1) == 0xA0 ? 2 : 0; // U+00A0
    }

    const unsigned int b1 = at(pos + 1);
    const unsigned int b2 = at(pos + 2);
    if (b0 == 0xE1) {
        return (b1 == 0x9A && b2 == 0x80) ? 3 : 0; // U+1680
    }
    if (b0 == 0xE2 && b1 == 0x80) {
        // U+2000..U+200A, U+2028, U+2029, U+202F
        const bool spaces = b2 >= 0x80 && b2 <= 0x8A;
        return (spaces || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) ? 3 : 0;
    }
    if (b0 == 0xE2 && b1 == 0x81) {
        return b2 == 0x9F ? 3 : 0; // U+205F
    }
    if (b0 == 0xE3) {
        return (b1 == 0x80 && b2 == 0x80) ? 3 : 0; // U+3000
    }
    return 0;
}
} // namespace

bool isReservedDeviceName(const std::string& name) {
    return std::any_of(kReservedNames.begin(), kReservedNames.end(), [&name](const char* reserved) {
        return equalsIgnoreCase(name, reserved);
    });
}

std::string sanitize(const std::string& text) {
    std::string filtered;
    filtered.reserve(text.size());
    for (char byte : text) {
        const auto ch = static_cast<unsigned char>(byte);
        if (ch == '/' || ch == '\\') {
            filtered.push_back('-');
            continue;
        }
        if (isDeletedCharacter(ch)) {
            continue;
        }
        filtered.push_back(byte);
        // Checked against the output so a deletion cannot leave a C1 pair behind.
        if (endsWithC1Control(filtered)) {
            filtered.resize(filtered.size() - 2);
        }
    }

    // Collapse runs of whitespace to one space; leading and trailing runs are dropped entirely.
    std::string collapsed;
    collapsed.reserve(filtered.size());
    bool pendingSpace = false;
    for (std::size_t i = 0; i < filtered.size();) {
        if (const std::size_t width = whitespaceWidth(filtered, i)) {
            pendingSpace = !collapsed.empty();
            i += width;
            continue;
        }
        if (pendingSpace) {
            collapsed.push_back(' ');
            pendingSpace = false;
        }
        collapsed.push_back(filtered[i]);
        ++i;
    }

    const auto first = collapsed.find_first_not_of(". ");
    if (first == std::string::npos) {
        return kFallbackName;
    }
    const auto last = collapsed.find_last_not_of(". ");
    std::string trimmed = collapsed.substr(first, last - first + 1);

    if (isReservedDeviceName(trimmed)) {
        trimmed.insert(trimmed.begin(), '_');
    }
    return trimmed;
}
