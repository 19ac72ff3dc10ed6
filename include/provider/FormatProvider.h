/*
 * FormatProvider.h - Payload format provider interface
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

#ifndef OGGFRAME_PROVIDER_FORMATPROVIDER_H
#define OGGFRAME_PROVIDER_FORMATPROVIDER_H

// No direct includes - all includes should be in oggframe.h

namespace OggFrame {
namespace Provider {

/**
 * @brief PCM layout handed to an encoder.
 */
struct AudioFormat {
    uint32_t sampleRate = 0;
    uint16_t channels = 0;
    uint16_t bitsPerSample = 16;
};

/**
 * @brief Payload encoder supplied by a format provider.
 *
 * The caller fills the PCM buffer, calls encode() with the number of valid
 * bytes and then pulls the result through toPacket(). Implementations
 * report their output with setProcessedData() and advance the granule
 * position with incrementGranulePosition().
 */
class Encoder : public Container::Packable {
public:
    ~Encoder() override = default;

    /**
     * @brief Identification header for a stream in the given format.
     */
    virtual Container::Packet getHeader(const AudioFormat& format) = 0;

    /**
     * @brief Prepare for encoding; expected to call initPCMBuffer().
     */
    virtual void initEncoder() = 0;

    /**
     * @brief Encode the first pcmBytes bytes of the PCM buffer.
     */
    virtual void encode(size_t pcmBytes) = 0;

    void initPCMBuffer(size_t sizePerChannel, size_t channels);
    std::vector<uint8_t>& getPCMBuffer() { return m_pcm_buffer; }

    uint64_t getGranulePosition() const { return m_granule_position; }

    /**
     * @brief Size in bytes of the last encoded packet.
     */
    size_t getSize() const { return m_processed_data.size(); }

    /**
     * @brief Segments the last encoded packet occupies on a page.
     */
    size_t getSegmentNumber() const;

    Container::Packet toPacket() const override;

protected:
    void setProcessedData(std::vector<uint8_t> data);
    void incrementGranulePosition(uint64_t increment);

private:
    uint64_t m_granule_position = 0;
    std::vector<uint8_t> m_pcm_buffer;
    std::vector<uint8_t> m_processed_data;
};

/**
 * @brief Plug-in point for one payload format (Vorbis, Opus, FLAC, ...).
 *
 * Providers recognise identification headers, describe the layout of their
 * comment packet and optionally supply an encoder. The base implementations
 * of getHeader() and newEncoder() throw UnsupportedOperationException.
 */
class FormatProvider {
public:
    FormatProvider(bool hasDecoder, bool hasEncoder);
    virtual ~FormatProvider() = default;

    bool hasDecoder() const { return m_has_decoder; }
    bool hasEncoder() const { return m_has_encoder; }

    /**
     * @brief Short format name, e.g. "vorbis"
     */
    virtual std::string getType() const = 0;

    virtual std::string getEncoding() const = 0;

    /**
     * @brief Name of the encoder implementation, empty if there is none.
     */
    virtual std::string getEncoderName() const;

    /**
     * @brief Empty comment block laid out the way this format expects.
     */
    virtual Tag::Tags createTags() const;

    /**
     * @brief Parse an identification header.
     *
     * Returns a Packable whose isValid() tells whether the packet belongs
     * to this format.
     */
    virtual std::unique_ptr<Container::Packable> getHeader(const Container::Packet& packet) const;

    virtual std::unique_ptr<Encoder> newEncoder() const;

private:
    bool m_has_decoder;
    bool m_has_encoder;
};

/**
 * @brief Everything known about a stream after reading its headers.
 */
struct StreamInfo {
    const FormatProvider* provider = nullptr;
    std::unique_ptr<Container::Packable> header;
    Tag::Tags tags;
    std::map<std::string, std::string> properties;
};

/**
 * @brief Set of available format providers.
 *
 * Lookups by type are exact; probing tries the decoding providers in
 * registration order.
 */
class ProviderRegistry {
public:
    ProviderRegistry() = default;

    // Prevent copying
    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * @brief Register a provider, replacing one of the same type.
     * @throws std::invalid_argument if provider is null
     */
    void registerProvider(std::unique_ptr<FormatProvider> provider);

    bool unregisterProvider(const std::string& type);

    bool isFormatSupported(const std::string& type) const;

    /**
     * @throws std::invalid_argument if no provider has that type
     */
    const FormatProvider& getProvider(const std::string& type) const;

    std::vector<std::string> getFormatsForDecoding() const;
    std::vector<std::string> getFormatsForEncoding() const;

    size_t getRegisteredProviderCount() const { return m_providers.size(); }

    /**
     * @brief First decoding provider that accepts a packet as its header.
     * @return nullptr if no provider does
     */
    const FormatProvider* findProvider(const Container::Packet& packet) const;

    /**
     * @brief Identify a stream from its first two packets.
     *
     * Reads the identification header and the comment packet that follows
     * it, decoding the latter with the matching provider's comment layout.
     * @throws UnsupportedOperationException if no provider recognises the stream
     */
    StreamInfo probe(IO::IOHandler* handler) const;

private:
    std::vector<std::unique_ptr<FormatProvider>> m_providers;
};

} // namespace Provider
} // namespace OggFrame

#endif // OGGFRAME_PROVIDER_FORMATPROVIDER_H
