// SPDX-License-Identifier: MIT
#include "export/TiffWriter.h"

#include "export/IccProfile.h"
#include "export/ImageEncoder.h"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_map>

namespace {

constexpr int kClearCode = 256;
constexpr int kEndOfInformation = 257;
constexpr int kFirstCode = 258;
constexpr int kMinBits = 9;
constexpr int kMaxBits = 12;
constexpr int kMaxCode = (1 << kMaxBits) - 1;

enum TiffType : std::uint16_t {
    Type_Short = 3,
    Type_Long = 4,
    Type_Rational = 5,
    Type_Undefined = 7
};

class BitWriter {
public:
    explicit BitWriter(std::vector<std::uint8_t>& out)
        : m_out(out)
    {
    }

    void write(int code, int bits)
    {
        m_buffer = (m_buffer << bits) | static_cast<std::uint32_t>(code);
        m_count += bits;
        while (m_count >= 8) {
            m_count -= 8;
            m_out.push_back(static_cast<std::uint8_t>(m_buffer >> m_count));
        }
        m_buffer &= (1u << m_count) - 1u;
    }

    void flush()
    {
        if (m_count > 0)
            m_out.push_back(static_cast<std::uint8_t>(m_buffer << (8 - m_count)));
        m_buffer = 0;
        m_count = 0;
    }

private:
    std::vector<std::uint8_t>& m_out;
    std::uint32_t m_buffer { 0 };
    int m_count { 0 };
};

struct IfdEntry {
    std::uint16_t tag;
    std::uint16_t type;
    std::uint32_t count;
    std::uint32_t value; // inline value or offset
};

void putU16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
    out.push_back(static_cast<std::uint8_t>(v));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

void putU32(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    putU16(out, static_cast<std::uint16_t>(v));
    putU16(out, static_cast<std::uint16_t>(v >> 16));
}

void alignWord(std::vector<std::uint8_t>& out)
{
    if (out.size() % 2 != 0)
        out.push_back(0);
}

}

std::vector<std::uint8_t> lzwCompress(const std::uint8_t* data, std::size_t length)
{
    std::vector<std::uint8_t> out;
    BitWriter writer(out);

    // (prefix code << 8 | next byte) -> code
    std::unordered_map<std::uint32_t, int> table;
    int nextCode = kFirstCode;
    int bits = kMinBits;

    const auto reset = [&] {
        table.clear();
        nextCode = kFirstCode;
        bits = kMinBits;
    };
    // Advances the table after a code was emitted; the reader widens its codes
    // one entry early, which this mirrors by comparing against the full range.
    const auto advance = [&] {
        ++nextCode;
        if (nextCode == kMaxCode - 1) {
            writer.write(kClearCode, bits);
            reset();
        } else if (nextCode > (1 << bits) - 1) {
            bits = std::min(bits + 1, kMaxBits);
        }
    };

    writer.write(kClearCode, bits);
    if (length == 0) {
        writer.write(kEndOfInformation, bits);
        writer.flush();
        return out;
    }

    int current = data[0];
    for (std::size_t i = 1; i < length; ++i) {
        const std::uint8_t byte = data[i];
        const std::uint32_t key = (static_cast<std::uint32_t>(current) << 8) | byte;
        const auto it = table.find(key);
        if (it != table.end()) {
            current = it->second;
            continue;
        }
        writer.write(current, bits);
        table.emplace(key, nextCode);
        current = byte;
        advance();
    }

    writer.write(current, bits);
    advance();
    writer.write(kEndOfInformation, bits);
    writer.flush();
    return out;
}

std::vector<std::uint8_t> encodeTiff(const std::uint8_t* rgba, int width, int height, int dpi)
{
    if (!rgba || width <= 0 || height <= 0)
        throw ExportError(fmt::format("Cannot encode an empty {}x{} image", width, height));

    const std::size_t pixelCount = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<std::uint8_t> rgb(pixelCount * 3);
    for (std::size_t i = 0; i < pixelCount; ++i) {
        rgb[i * 3 + 0] = rgba[i * 4 + 0];
        rgb[i * 3 + 1] = rgba[i * 4 + 1];
        rgb[i * 3 + 2] = rgba[i * 4 + 2];
    }
    const std::vector<std::uint8_t> strip = lzwCompress(rgb.data(), rgb.size());
    const std::vector<std::uint8_t>& icc = srgbIccProfile();

    std::vector<std::uint8_t> out;
    out.reserve(strip.size() + icc.size() + 256);
    out.push_back('I');
    out.push_back('I');
    putU16(out, 42);
    putU32(out, 0); // IFD offset, patched below

    const auto stripOffset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), strip.begin(), strip.end());
    alignWord(out);

    const auto bitsOffset = static_cast<std::uint32_t>(out.size());
    for (int i = 0; i < 3; ++i)
        putU16(out, 8);

    const auto resolutionOffset = static_cast<std::uint32_t>(out.size());
    const auto resolution = static_cast<std::uint32_t>(std::max(dpi, 1));
    putU32(out, resolution);
    putU32(out, 1);

    const auto iccOffset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), icc.begin(), icc.end());
    alignWord(out);

    // Tags must be in ascending order.
    const std::vector<IfdEntry> entries {
        { 256, Type_Long, 1, static_cast<std::uint32_t>(width) }, // ImageWidth
        { 257, Type_Long, 1, static_cast<std::uint32_t>(height) }, // ImageLength
        { 258, Type_Short, 3, bitsOffset }, // BitsPerSample
        { 259, Type_Short, 1, 5 }, // Compression: LZW
        { 262, Type_Short, 1, 2 }, // PhotometricInterpretation: RGB
        { 273, Type_Long, 1, stripOffset }, // StripOffsets
        { 277, Type_Short, 1, 3 }, // SamplesPerPixel
        { 278, Type_Long, 1, static_cast<std::uint32_t>(height) }, // RowsPerStrip
        { 279, Type_Long, 1, static_cast<std::uint32_t>(strip.size()) }, // StripByteCounts
        { 282, Type_Rational, 1, resolutionOffset }, // XResolution
        { 283, Type_Rational, 1, resolutionOffset }, // YResolution
        { 284, Type_Short, 1, 1 }, // PlanarConfiguration: chunky
        { 296, Type_Short, 1, 2 }, // ResolutionUnit: inch
        { 34675, Type_Undefined, static_cast<std::uint32_t>(icc.size()), iccOffset }, // ICC profile
    };

    const auto ifdOffset = static_cast<std::uint32_t>(out.size());
    out[4] = static_cast<std::uint8_t>(ifdOffset);
    out[5] = static_cast<std::uint8_t>(ifdOffset >> 8);
    out[6] = static_cast<std::uint8_t>(ifdOffset >> 16);
    out[7] = static_cast<std::uint8_t>(ifdOffset >> 24);

    putU16(out, static_cast<std::uint16_t>(entries.size()));
    for (const IfdEntry& entry : entries) {
        putU16(out, entry.tag);
        putU16(out, entry.type);
        putU32(out, entry.count);
        // SHORT values that fit inline are left-justified in the 4-byte field.
        if (entry.type == Type_Short && entry.count == 1) {
            putU16(out, static_cast<std::uint16_t>(entry.value));
            putU16(out, 0);
        } else {
            putU32(out, entry.value);
        }
    }
    putU32(out, 0); // no next IFD
    return out;
}
