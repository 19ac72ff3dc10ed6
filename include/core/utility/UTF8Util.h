/*
 * UTF8Util.h - UTF-8 validation and repair utilities
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

#ifndef OGGFRAME_CORE_UTILITY_UTF8UTIL_H
#define OGGFRAME_CORE_UTILITY_UTF8UTIL_H

#include <cstdint>
#include <string>
#include <vector>

namespace OggFrame {
namespace Core {
namespace Utility {

/**
 * @brief UTF-8 handling for comment metadata
 *
 * Text stored in comment packets (vendor string, KEY=value entries) is
 * UTF-8. Decoding replaces malformed sequences with U+FFFD rather than
 * failing, so a comment block with one bad byte still yields its other
 * fields.
 *
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    // ========================================================================
    // UTF-8 Validation
    // ========================================================================

    /**
     * @brief Check if a string is valid UTF-8
     * @param text String to validate
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Check if a byte sequence is valid UTF-8
     * @param data Pointer to data
     * @param size Size of data
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const uint8_t* data, size_t size);

    /**
     * @brief Repair invalid UTF-8 sequences
     *
     * Replaces invalid sequences with U+FFFD (replacement character)
     *
     * @param text String to repair
     * @return Repaired UTF-8 string
     */
    static std::string repair(const std::string& text);

    /**
     * @brief Decode a length-delimited UTF-8 field
     *
     * Embedded NUL bytes are kept; only malformed sequences are replaced.
     *
     * @param data Pointer to UTF-8 data
     * @param size Size of data
     * @return UTF-8 string with invalid sequences replaced
     */
    static std::string decode(const uint8_t* data, size_t size);

    // ========================================================================
    // Codepoint Operations
    // ========================================================================

    static std::string encodeCodepoint(uint32_t codepoint);

    /**
     * @brief Decode the codepoint at the start of a byte sequence
     * @param data Pointer to UTF-8 data
     * @param size Bytes available
     * @param bytesConsumed Receives the length of the sequence
     * @return Codepoint, or 0xFFFD for a malformed sequence
     */
    static uint32_t decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed);

    static uint32_t decodeCodepoint(const std::string& text, size_t& bytesConsumed);

    // ========================================================================
    // String Utilities
    // ========================================================================

    /**
     * @brief Count the number of Unicode characters in UTF-8 string
     *
     * @param text UTF-8 string
     * @return Number of Unicode characters (not bytes)
     */
    static size_t length(const std::string& text);

    /**
     * @brief Strip leading and trailing control characters and spaces
     *
     * Bytes up to and including 0x20 are stripped. Multi-byte sequences
     * never start with such a byte, so the result stays valid UTF-8.
     */
    static std::string trim(const std::string& text);

    static bool isValidCodepoint(uint32_t codepoint);

    /**
     * @brief Get the replacement character (U+FFFD) as UTF-8
     *
     * @return UTF-8 encoded replacement character
     */
    static const std::string& replacementCharacter();

private:
    // Internal helper to encode codepoint to output
    static void appendCodepoint(std::string& output, uint32_t codepoint);
};

} // namespace Utility
} // namespace Core
} // namespace OggFrame

#endif // OGGFRAME_CORE_UTILITY_UTF8UTIL_H
