/*
 * StreamEncoder.cpp - PCM to Ogg stream encoding driver
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
namespace Provider {

uint64_t StreamEncoder::encode(const FormatProvider& provider, const AudioFormat& format,
                               IO::IOHandler* pcm, std::ostream& out, uint32_t serial) {
    return encode(provider, format, pcm, out, serial, provider.createTags());
}

uint64_t StreamEncoder::encode(const FormatProvider& provider, const AudioFormat& format,
                               IO::IOHandler* pcm, std::ostream& out, uint32_t serial, Tag::Tags tags) {
    if (!pcm) {
        throw std::invalid_argument("StreamEncoder: PCM source cannot be null");
    }
    if (!provider.hasEncoder()) {
        throw UnsupportedOperationException("Format provider '" + provider.getType() + "' has no encoder");
    }

    std::unique_ptr<Encoder> encoder = provider.newEncoder();
    Container::StreamWriter writer(out, serial);

    writer.writeHeader(encoder->getHeader(format));

    std::string encoder_name = provider.getEncoderName();
    if (!encoder_name.empty()) {
        tags.setVendor(encoder_name + " (using OggFrame)");
    }
    writer.writeTags(tags);

    encoder->initEncoder();
    std::vector<uint8_t>& buffer = encoder->getPCMBuffer();
    if (buffer.empty()) {
        throw InvalidContainerStateException("Encoder for '" + provider.getType() + "' did not allocate a PCM buffer");
    }

    uint64_t packets = 0;
    while (true) {
        size_t got = IO::ByteReader::readUpTo(pcm, buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        encoder->encode(got);
        writer.writePacket(*encoder, encoder->getGranulePosition());
        packets++;
    }

    writer.finish();
    out.flush();

    Debug::log("provider", "StreamEncoder::encode() ", provider.getType(), ": ", packets, " packets, ",
               writer.getPageCount(), " pages, ", writer.getBytesWritten(), " bytes");
    return writer.getBytesWritten();
}

} // namespace Provider
} // namespace OggFrame
