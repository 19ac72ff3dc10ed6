/*
 * TagKeys.h - Common comment field names
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

#ifndef OGGFRAME_TAG_TAGKEYS_H
#define OGGFRAME_TAG_TAGKEYS_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Tag {

/**
 * @brief Common comment field names, as listed by the Vorbis comment
 *        field recommendations.
 */
namespace TagKeys {

constexpr const char* TITLE = "TITLE";
constexpr const char* VERSION = "VERSION";         // Distinguishes multiple versions of one title
constexpr const char* ALBUM = "ALBUM";
constexpr const char* TRACKNUMBER = "TRACKNUMBER";
constexpr const char* ARTIST = "ARTIST";
constexpr const char* PERFORMER = "PERFORMER";
constexpr const char* COPYRIGHT = "COPYRIGHT";
constexpr const char* LICENSE = "LICENSE";
constexpr const char* ORGANIZATION = "ORGANIZATION"; // Producing organization or label
constexpr const char* DESCRIPTION = "DESCRIPTION";
constexpr const char* GENRE = "GENRE";
constexpr const char* DATE = "DATE";
constexpr const char* LOCATION = "LOCATION";       // Where the recording was made
constexpr const char* CONTACT = "CONTACT";
constexpr const char* ISRC = "ISRC";

} // namespace TagKeys
} // namespace Tag
} // namespace OggFrame

#endif // OGGFRAME_TAG_TAGKEYS_H
