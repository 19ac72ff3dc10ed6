/*
 * UTF8Util.cpp - UTF-8 validation and repair utilities implementation
 * This file is part of OggFrame.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * OggFrame is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "oggframe.h"

namespace OggFrame {
namespace Core {
namespace Utility {

// Static replacement character string
static const std::string REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD

const std::string& UTF8Util::replacementCharacter() {
    return REPLACEMENT_CHAR;
}

bool UTF8Util::isValidCodepoint(uint32_t codepoint) {
    // Valid range: U+0000 to U+10FFFF, excluding surrogates (U+D800-U+DFFF)
    return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (!isValidCodepoint(codepoint)) {
        output += REPLACEMENT_CHAR;
    } else if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

std::string UTF8Util::encodeCodepoint(uint32_t codepoint) {
    std::string result;
    appendCodepoint(result, codepoint);
    return result;
}

uint32_t UTF8Util::decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed) {
    if (!data || size == 0) {
        bytesConsumed = 0;
        return 0xFFFD;
    }

    uint8_t c = data[0];

    if (c < 0x80) {
        // ASCII
        bytesConsumed = 1;
        return c;
    } else if ((c & 0xE0) == 0xC0) {
        // 2-byte sequence
        if (size < 2 || (data[1] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        // Check for overlong encoding
        if ((c & 0x1E) == 0) {
            bytesConsumed = 2;
            return 0xFFFD;
        }
        bytesConsumed = 2;
        return ((c & 0x1F) << 6) | (data[1] & 0x3F);
    } else if ((c & 0xF0) == 0xE0) {
        // 3-byte sequence
        if (size < 3 || (data[1] & 0xC0) != 0x80 || (data[2] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        // Check for overlong encoding
        if (c == 0xE0 && (data[1] & 0x20) == 0) {
            bytesConsumed = 3;
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x0F) << 12) | ((data[1] & 0x3F) << 6) | (data[2] & 0x3F);
        // Check for surrogate range
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            bytesConsumed = 3;
            return 0xFFFD;
        }
        bytesConsumed = 3;
        return cp;
    } else if ((c & 0xF8) == 0xF0) {
        // 4-byte sequence
        if (size < 4 || (data[1] & 0xC0) != 0x80 ||
            (data[2] & 0xC0) != 0x80 || (data[3] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        // Check for overlong encoding
        if (c == 0xF0 && (data[1] & 0x30) == 0) {
            bytesConsumed = 4;
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x07) << 18) | ((data[1] & 0x3F) << 12) |
                      ((data[2] & 0x3F) << 6) | (data[3] & 0x3F);
        // Check for codepoints > U+10FFFF
        if (cp > 0x10FFFF) {
            bytesConsumed = 4;
            return 0xFFFD;
        }
        bytesConsumed = 4;
        return cp;
    }

    // Invalid start byte
    bytesConsumed = 1;
    return 0xFFFD;
}

uint32_t UTF8Util::decodeCodepoint(const std::string& text, size_t& bytesConsumed) {
    return decodeCodepoint(reinterpret_cast<const uint8_t*>(text.data()),
                           text.size(), bytesConsumed);
}

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        if (cp == 0xFFFD && !(data[i] == 0xEF && i + 2 < size &&
            data[i+1] == 0xBF && data[i+2] == 0xBD)) {
            // Got replacement char but input wasn't actually U+FFFD
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::repair(const std::string& text) {
    return decode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::decode(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }

    if (isValid(data, size)) {
        return std::string(reinterpret_cast<const char*>(data), size);
    }

    std::string result;
    result.reserve(size);

    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        appendCodepoint(result, cp);
        i += consumed;
    }

    return result;
}

size_t UTF8Util::length(const std::string& text) {
    size_t count = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        decodeCodepoint(reinterpret_cast<const uint8_t*>(text.data()) + i,
                        text.size() - i, consumed);
        i += consumed;
        count++;
    }
    return count;
}

std::string UTF8Util::trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();

    while (start < end && static_cast<uint8_t>(text[start]) <= 0x20) {
        ++start;
    }
    while (end > start && static_cast<uint8_t>(text[end - 1]) <= 0x20) {
        --end;
    }

    return text.substr(start, end - start);
}

} // namespace Utility
} // namespace Core
} // namespace OggFrame
