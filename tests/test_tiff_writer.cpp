// SPDX-License-Identifier: MIT
#include "export/IccProfile.h"
#include "export/ImageEncoder.h"
#include "export/TiffWriter.h"

#include <gtest/gtest.h>

#include <cstring>
#include <map>
#include <stdexcept>
#include <string>

namespace {

class BitReader {
public:
    explicit BitReader(const std::vector<std::uint8_t>& bytes)
        : m_bytes(bytes)
    {
    }

    bool read(int bits, int& code)
    {
        if (m_position + static_cast<std::size_t>(bits) > m_bytes.size() * 8)
            return false;
        code = 0;
        for (int i = 0; i < bits; ++i, ++m_position) {
            const int bit = (m_bytes[m_position / 8] >> (7 - m_position % 8)) & 1;
            code = (code << 1) | bit;
        }
        return true;
    }

private:
    const std::vector<std::uint8_t>& m_bytes;
    std::size_t m_position { 0 };
};

// Reads TIFF LZW the way libtiff does: the first code after a Clear adds no
// entry, and the code width grows one entry before the table fills.
std::vector<std::uint8_t> lzwDecode(const std::vector<std::uint8_t>& compressed, int* clearCount = nullptr)
{
    std::vector<std::vector<std::uint8_t>> table;
    const auto reset = [&table] {
        table.assign(258, {});
        for (int i = 0; i < 256; ++i)
            table[i] = { static_cast<std::uint8_t>(i) };
    };
    reset();

    BitReader reader(compressed);
    std::vector<std::uint8_t> out;
    int bits = 9;
    int previous = -1;
    int code = 0;
    bool sawEnd = false;
    while (reader.read(bits, code)) {
        if (code == 257) {
            sawEnd = true;
            break;
        }
        if (code == 256) {
            if (clearCount)
                ++*clearCount;
            reset();
            bits = 9;
            previous = -1;
            continue;
        }
        if (previous < 0) {
            if (code > 255)
                throw std::runtime_error("first code after clear is not a literal");
            out.push_back(static_cast<std::uint8_t>(code));
            previous = code;
            continue;
        }

        std::vector<std::uint8_t> entry;
        if (code < static_cast<int>(table.size())) {
            entry = table[code];
        } else if (code == static_cast<int>(table.size())) {
            entry = table[previous];
            entry.push_back(table[previous][0]);
        } else {
            throw std::runtime_error("code " + std::to_string(code) + " out of range");
        }

        std::vector<std::uint8_t> added = table[previous];
        added.push_back(entry[0]);
        table.push_back(std::move(added));
        out.insert(out.end(), entry.begin(), entry.end());
        previous = code;
        if (static_cast<int>(table.size()) >= (1 << bits) - 1 && bits < 12)
            ++bits;
    }
    if (!sawEnd)
        throw std::runtime_error("missing EndOfInformation");
    return out;
}

std::vector<std::uint8_t> pseudoRandomBytes(std::size_t count, std::uint32_t seed, int alphabet)
{
    std::vector<std::uint8_t> bytes(count);
    std::uint32_t state = seed;
    for (auto& b : bytes) {
        state = state * 1664525u + 1013904223u;
        b = static_cast<std::uint8_t>((state >> 16) % static_cast<std::uint32_t>(alphabet));
    }
    return bytes;
}

std::uint16_t u16le(const std::vector<std::uint8_t>& b, std::size_t at)
{
    return static_cast<std::uint16_t>(b[at] | (b[at + 1] << 8));
}

std::uint32_t u32le(const std::vector<std::uint8_t>& b, std::size_t at)
{
    return static_cast<std::uint32_t>(u16le(b, at)) | (static_cast<std::uint32_t>(u16le(b, at + 2)) << 16);
}

struct Tag {
    std::uint16_t type;
    std::uint32_t count;
    std::size_t fieldOffset;
};

std::map<std::uint16_t, Tag> readIfd(const std::vector<std::uint8_t>& tiff, std::vector<std::uint16_t>& order)
{
    const std::uint32_t ifd = u32le(tiff, 4);
    const std::uint16_t count = u16le(tiff, ifd);
    std::map<std::uint16_t, Tag> tags;
    for (std::uint16_t i = 0; i < count; ++i) {
        const std::size_t at = ifd + 2 + i * 12u;
        const std::uint16_t id = u16le(tiff, at);
        order.push_back(id);
        tags[id] = { u16le(tiff, at + 2), u32le(tiff, at + 4), at + 8 };
    }
    EXPECT_EQ(u32le(tiff, ifd + 2 + count * 12u), 0u);
    return tags;
}

}

TEST(TiffLzw, EmptyInputIsClearThenEnd)
{
    const auto compressed = lzwCompress(nullptr, 0);
    EXPECT_TRUE(lzwDecode(compressed).empty());
}

TEST(TiffLzw, RepeatedRunsDecode)
{
    const std::vector<std::uint8_t> data(5000, 'a');
    const auto compressed = lzwCompress(data.data(), data.size());
    EXPECT_LT(compressed.size(), data.size() / 10);
    EXPECT_EQ(lzwDecode(compressed), data);
}

TEST(TiffLzw, TextLikeDataDecodes)
{
    const std::string text = "TOBEORNOTTOBEORTOBEORNOT#TOBEORNOTTOBEORTOBEORNOT";
    const std::vector<std::uint8_t> data(text.begin(), text.end());
    EXPECT_EQ(lzwDecode(lzwCompress(data.data(), data.size())), data);
}

TEST(TiffLzw, FullTableEmitsClearAndStillDecodes)
{
    const auto data = pseudoRandomBytes(60000, 7, 256);
    const auto compressed = lzwCompress(data.data(), data.size());
    int clears = 0;
    EXPECT_EQ(lzwDecode(compressed, &clears), data);
    EXPECT_GT(clears, 1); // leading Clear plus at least one table reset
}

TEST(TiffLzw, CodeWidthTransitionsDecode)
{
    // A small alphabet crosses the 9/10/11/12-bit boundaries slowly.
    for (std::size_t size : { 300u, 700u, 2000u, 9000u, 30000u }) {
        const auto data = pseudoRandomBytes(size, static_cast<std::uint32_t>(size), 4);
        EXPECT_EQ(lzwDecode(lzwCompress(data.data(), data.size())), data) << size;
    }
}

TEST(TiffWriter, HeaderAndTags)
{
    const int width = 5;
    const int height = 3;
    std::vector<std::uint8_t> rgba(width * height * 4);
    for (std::size_t i = 0; i < rgba.size(); ++i)
        rgba[i] = static_cast<std::uint8_t>(i * 7);

    const auto tiff = encodeTiff(rgba.data(), width, height, 72);
    ASSERT_GT(tiff.size(), 8u);
    EXPECT_EQ(tiff[0], 'I');
    EXPECT_EQ(tiff[1], 'I');
    EXPECT_EQ(u16le(tiff, 2), 42);
    EXPECT_EQ(u32le(tiff, 4) % 2, 0u);

    std::vector<std::uint16_t> order;
    const auto tags = readIfd(tiff, order);
    const std::vector<std::uint16_t> expected { 256, 257, 258, 259, 262, 273, 277, 278, 279, 282, 283, 284, 296, 34675 };
    EXPECT_EQ(order, expected);

    EXPECT_EQ(u32le(tiff, tags.at(256).fieldOffset), 5u);
    EXPECT_EQ(u32le(tiff, tags.at(257).fieldOffset), 3u);
    EXPECT_EQ(u16le(tiff, tags.at(259).fieldOffset), 5); // LZW
    EXPECT_EQ(u16le(tiff, tags.at(262).fieldOffset), 2); // RGB
    EXPECT_EQ(u16le(tiff, tags.at(277).fieldOffset), 3);
    EXPECT_EQ(u16le(tiff, tags.at(284).fieldOffset), 1);
    EXPECT_EQ(u16le(tiff, tags.at(296).fieldOffset), 2); // inch

    const std::uint32_t bitsAt = u32le(tiff, tags.at(258).fieldOffset);
    EXPECT_EQ(tags.at(258).count, 3u);
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(u16le(tiff, bitsAt + i * 2u), 8);

    for (std::uint16_t id : { 282, 283 }) {
        const std::uint32_t at = u32le(tiff, tags.at(id).fieldOffset);
        EXPECT_EQ(tags.at(id).type, 5);
        EXPECT_EQ(u32le(tiff, at), 72u);
        EXPECT_EQ(u32le(tiff, at + 4), 1u);
    }

    const auto& icc = srgbIccProfile();
    const Tag& iccTag = tags.at(34675);
    EXPECT_EQ(iccTag.type, 7);
    ASSERT_EQ(iccTag.count, icc.size());
    EXPECT_EQ(std::memcmp(&tiff[u32le(tiff, iccTag.fieldOffset)], icc.data(), icc.size()), 0);

    // The strip decodes to the RGB samples with alpha dropped.
    const std::uint32_t stripAt = u32le(tiff, tags.at(273).fieldOffset);
    const std::uint32_t stripSize = u32le(tiff, tags.at(279).fieldOffset);
    EXPECT_EQ(u32le(tiff, tags.at(278).fieldOffset), 3u);
    const std::vector<std::uint8_t> strip(tiff.begin() + stripAt, tiff.begin() + stripAt + stripSize);
    std::vector<std::uint8_t> rgb;
    for (std::size_t i = 0; i < rgba.size(); i += 4)
        rgb.insert(rgb.end(), { rgba[i], rgba[i + 1], rgba[i + 2] });
    EXPECT_EQ(lzwDecode(strip), rgb);
}

TEST(TiffWriter, RejectsEmptyImages)
{
    const std::vector<std::uint8_t> rgba(4);
    EXPECT_THROW((void)encodeTiff(rgba.data(), 0, 1, 300), ExportError);
    EXPECT_THROW((void)encodeTiff(nullptr, 1, 1, 300), ExportError);
}
