/*
 * FormatProvider.cpp - Payload format provider interface
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

// ============================================================================
// Encoder
// ============================================================================

void Encoder::initPCMBuffer(size_t sizePerChannel, size_t channels) {
    m_pcm_buffer.assign(sizePerChannel * channels, 0);
}

size_t Encoder::getSegmentNumber() const {
    return m_processed_data.size() / Container::Packet::MAX_SEGMENT_SIZE + 1;
}

Container::Packet Encoder::toPacket() const {
    return Container::Packet(m_processed_data);
}

void Encoder::setProcessedData(std::vector<uint8_t> data) {
    m_processed_data = std::move(data);
}

void Encoder::incrementGranulePosition(uint64_t increment) {
    m_granule_position += increment;
}

// ============================================================================
// FormatProvider
// ============================================================================

FormatProvider::FormatProvider(bool hasDecoder, bool hasEncoder)
    : m_has_decoder(hasDecoder), m_has_encoder(hasEncoder) {
}

std::string FormatProvider::getEncoderName() const {
    return std::string();
}

Tag::Tags FormatProvider::createTags() const {
    return Tag::Tags();
}

std::unique_ptr<Container::Packable> FormatProvider::getHeader(const Container::Packet& packet) const {
    (void)packet;
    throw UnsupportedOperationException("Format provider '" + getType() + "' cannot parse headers");
}

std::unique_ptr<Encoder> FormatProvider::newEncoder() const {
    throw UnsupportedOperationException("Format provider '" + getType() + "' has no encoder");
}

// ============================================================================
// ProviderRegistry
// ============================================================================

void ProviderRegistry::registerProvider(std::unique_ptr<FormatProvider> provider) {
    if (!provider) {
        throw std::invalid_argument("ProviderRegistry: provider cannot be null");
    }

    std::string type = provider->getType();
    for (auto& existing : m_providers) {
        if (existing->getType() == type) {
            Debug::log("provider", "ProviderRegistry::registerProvider() replacing provider for ", type);
            existing = std::move(provider);
            return;
        }
    }

    Debug::log("provider", "ProviderRegistry::registerProvider() registered ", type,
               " (decoder: ", provider->hasDecoder() ? "yes" : "no",
               ", encoder: ", provider->hasEncoder() ? "yes" : "no", ")");
    m_providers.push_back(std::move(provider));
}

bool ProviderRegistry::unregisterProvider(const std::string& type) {
    auto it = std::find_if(m_providers.begin(), m_providers.end(),
                           [&type](const std::unique_ptr<FormatProvider>& p) { return p->getType() == type; });
    if (it == m_providers.end()) {
        return false;
    }
    m_providers.erase(it);
    return true;
}

bool ProviderRegistry::isFormatSupported(const std::string& type) const {
    for (const auto& provider : m_providers) {
        if (provider->getType() == type) {
            return true;
        }
    }
    return false;
}

const FormatProvider& ProviderRegistry::getProvider(const std::string& type) const {
    for (const auto& provider : m_providers) {
        if (provider->getType() == type) {
            return *provider;
        }
    }
    throw std::invalid_argument("No format provider registered for type '" + type + "'");
}

std::vector<std::string> ProviderRegistry::getFormatsForDecoding() const {
    std::vector<std::string> types;
    for (const auto& provider : m_providers) {
        if (provider->hasDecoder()) {
            types.push_back(provider->getType());
        }
    }
    return types;
}

std::vector<std::string> ProviderRegistry::getFormatsForEncoding() const {
    std::vector<std::string> types;
    for (const auto& provider : m_providers) {
        if (provider->hasEncoder()) {
            types.push_back(provider->getType());
        }
    }
    return types;
}

const FormatProvider* ProviderRegistry::findProvider(const Container::Packet& packet) const {
    for (const auto& provider : m_providers) {
        if (!provider->hasDecoder()) {
            continue;
        }
        try {
            auto header = provider->getHeader(packet);
            if (header && header->isValid()) {
                Debug::log("provider", "ProviderRegistry::findProvider() matched ", provider->getType());
                return provider.get();
            }
        } catch (const UnsupportedOperationException& e) {
            Debug::log("provider", "ProviderRegistry::findProvider() skipping ", provider->getType(), ": ", e.what());
        }
    }
    return nullptr;
}

StreamInfo ProviderRegistry::probe(IO::IOHandler* handler) const {
    Container::PageReader reader(handler);

    std::vector<Container::Packet> packets = reader.readPackets();
    if (packets.empty()) {
        throw UnsupportedOperationException("Ogg stream is not valid: first page group holds no packet");
    }

    const FormatProvider* provider = findProvider(packets.front());
    if (!provider) {
        throw UnsupportedOperationException("Ogg stream is not valid: no provider recognises its header");
    }

    StreamInfo info;
    info.provider = provider;
    info.header = provider->getHeader(packets.front());
    info.tags = provider->createTags();

    if (packets.size() < 2) {
        packets = reader.readPackets();
        if (packets.empty()) {
            throw UnsupportedOperationException("Ogg stream is not valid: comment packet missing");
        }
    } else {
        packets.erase(packets.begin());
    }
    info.tags.fromPacket(packets.front());
    if (info.tags.isValid()) {
        info.tags.writeIntoMap(info.properties);
    } else {
        Debug::log("provider", "ProviderRegistry::probe() comment packet of ", provider->getType(),
                   " stream is malformed");
    }
    info.properties["vendor"] = info.tags.getVendor();

    return info;
}

} // namespace Provider
} // namespace OggFrame
