/*
 * StreamEncoder.h - PCM to Ogg stream encoding driver
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

#ifndef OGGFRAME_PROVIDER_STREAMENCODER_H
#define OGGFRAME_PROVIDER_STREAMENCODER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Provider {

/**
 * @brief Drives a provider's encoder over a PCM source into an Ogg stream.
 */
class StreamEncoder {
public:
    /**
     * @brief Encode all PCM data from a source as one logical stream.
     *
     * Writes the identification header page, the comment header pages,
     * one data packet per filled PCM buffer and a final end-of-stream page.
     * When the provider names its encoder, the vendor string becomes
     * "<encoder name> (using OggFrame)".
     *
     * @return Total number of bytes written to out
     * @throws UnsupportedOperationException if the provider cannot encode
     */
    static uint64_t encode(const FormatProvider& provider, const AudioFormat& format,
                           IO::IOHandler* pcm, std::ostream& out, uint32_t serial);

    /**
     * @brief Same as above with caller-supplied comments.
     */
    static uint64_t encode(const FormatProvider& provider, const AudioFormat& format,
                           IO::IOHandler* pcm, std::ostream& out, uint32_t serial, Tag::Tags tags);
};

} // namespace Provider
} // namespace OggFrame

#endif // OGGFRAME_PROVIDER_STREAMENCODER_H
