/*
 * Packable.h - Interface for objects that serialize to one packet
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

#ifndef OGGFRAME_CONTAINER_PACKABLE_H
#define OGGFRAME_CONTAINER_PACKABLE_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Container {

class Packet;

/**
 * @brief Anything that can be turned into a single Ogg packet.
 *
 * Page::addPacket() refuses a Packable whose isValid() returns false.
 */
class Packable {
public:
    virtual ~Packable() = default;

    virtual bool isValid() const { return true; }

    virtual Packet toPacket() const = 0;
};

} // namespace Container
} // namespace OggFrame

#endif // OGGFRAME_CONTAINER_PACKABLE_H
