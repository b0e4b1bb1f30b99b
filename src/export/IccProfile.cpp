// SPDX-License-Identifier: MIT
#include "export/IccProfile.h"

#include <array>
#include <cmath>
#include <string_view>
#include <utility>

namespace {

constexpr std::size_t kHeaderSize = 128;
constexpr int kCurveEntries = 1024;

class ByteWriter {
public:
    void u8(std::uint8_t v) { m_bytes.push_back(v); }
    void u16(std::uint16_t v)
    {
        u8(static_cast<std::uint8_t>(v >> 8));
        u8(static_cast<std::uint8_t>(v));
    }
    void u32(std::uint32_t v)
    {
        u16(static_cast<std::uint16_t>(v >> 16));
        u16(static_cast<std::uint16_t>(v));
    }
    void s15Fixed16(double v) { u32(static_cast<std::uint32_t>(static_cast<std::int32_t>(std::lround(v * 65536.0)))); }
    void signature(std::string_view sig)
    {
        for (char c : sig)
            u8(static_cast<std::uint8_t>(c));
    }
    void zeros(std::size_t count) { m_bytes.insert(m_bytes.end(), count, 0); }
    void align4()
    {
        while (m_bytes.size() % 4 != 0)
            u8(0);
    }

    void patchU32(std::size_t offset, std::uint32_t v)
    {
        m_bytes[offset + 0] = static_cast<std::uint8_t>(v >> 24);
        m_bytes[offset + 1] = static_cast<std::uint8_t>(v >> 16);
        m_bytes[offset + 2] = static_cast<std::uint8_t>(v >> 8);
        m_bytes[offset + 3] = static_cast<std::uint8_t>(v);
    }

    [[nodiscard]] std::size_t size() const { return m_bytes.size(); }
    [[nodiscard]] std::vector<std::uint8_t>& bytes() { return m_bytes; }

private:
    std::vector<std::uint8_t> m_bytes;
};

struct TagEntry {
    std::string_view signature;
    std::size_t offset;
    std::size_t size;
};

void writeXyz(ByteWriter& out, double x, double y, double z)
{
    out.signature("XYZ ");
    out.zeros(4);
    out.s15Fixed16(x);
    out.s15Fixed16(y);
    out.s15Fixed16(z);
}

void writeDescription(ByteWriter& out, std::string_view text)
{
    out.signature("desc");
    out.zeros(4);
    out.u32(static_cast<std::uint32_t>(text.size() + 1));
    out.signature(text);
    out.u8(0);
    out.u32(0); // unicode language
    out.u32(0); // unicode count
    out.u16(0); // scriptcode code
    out.u8(0); // scriptcode count
    out.zeros(67);
}

void writeText(ByteWriter& out, std::string_view text)
{
    out.signature("text");
    out.zeros(4);
    out.signature(text);
    out.u8(0);
}

void writeSrgbCurve(ByteWriter& out)
{
    out.signature("curv");
    out.zeros(4);
    out.u32(kCurveEntries);
    for (int i = 0; i < kCurveEntries; ++i) {
        const double c = static_cast<double>(i) / (kCurveEntries - 1);
        const double linear = c <= 0.04045 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
        out.u16(static_cast<std::uint16_t>(std::lround(linear * 65535.0)));
    }
}

std::vector<std::uint8_t> buildProfile()
{
    ByteWriter out;

    // Header; size is patched at the end.
    out.u32(0);
    out.zeros(4); // preferred CMM
    out.u32(0x02100000); // version 2.1
    out.signature("mntr");
    out.signature("RGB ");
    out.signature("XYZ ");
    // 2024-01-01 00:00:00
    out.u16(2024);
    out.u16(1);
    out.u16(1);
    out.zeros(6);
    out.signature("acsp");
    out.zeros(4); // platform
    out.zeros(4); // flags
    out.zeros(4); // manufacturer
    out.zeros(4); // model
    out.zeros(8); // attributes
    out.u32(0); // perceptual intent
    out.s15Fixed16(0.9642);
    out.s15Fixed16(1.0);
    out.s15Fixed16(0.8249);
    out.zeros(4); // creator
    out.zeros(kHeaderSize - out.size());

    constexpr std::array<std::string_view, 9> tagOrder { "desc", "cprt", "wtpt", "rXYZ", "gXYZ", "bXYZ", "rTRC", "gTRC", "bTRC" };
    const std::size_t tableOffset = out.size();
    out.u32(static_cast<std::uint32_t>(tagOrder.size()));
    out.zeros(tagOrder.size() * 12);

    std::array<TagEntry, tagOrder.size()> entries {};
    const auto beginTag = [&](std::size_t index) {
        out.align4();
        entries[index] = { tagOrder[index], out.size(), 0 };
    };
    const auto endTag = [&](std::size_t index) {
        entries[index].size = out.size() - entries[index].offset;
    };

    beginTag(0);
    writeDescription(out, "sRGB IEC61966-2.1");
    endTag(0);
    beginTag(1);
    writeText(out, "No copyright, use freely");
    endTag(1);
    beginTag(2);
    writeXyz(out, 0.9642, 1.0, 0.8249);
    endTag(2);
    beginTag(3);
    writeXyz(out, 0.4361, 0.2225, 0.0139);
    endTag(3);
    beginTag(4);
    writeXyz(out, 0.3851, 0.7169, 0.0971);
    endTag(4);
    beginTag(5);
    writeXyz(out, 0.1431, 0.0606, 0.7141);
    endTag(5);
    beginTag(6);
    writeSrgbCurve(out);
    endTag(6);
    // The three TRC tags share one curve.
    entries[7] = { tagOrder[7], entries[6].offset, entries[6].size };
    entries[8] = { tagOrder[8], entries[6].offset, entries[6].size };
    out.align4();

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::size_t slot = tableOffset + 4 + i * 12;
        const std::string_view sig = entries[i].signature;
        out.patchU32(slot, (static_cast<std::uint32_t>(sig[0]) << 24) | (static_cast<std::uint32_t>(sig[1]) << 16) | (static_cast<std::uint32_t>(sig[2]) << 8) | static_cast<std::uint32_t>(sig[3]));
        out.patchU32(slot + 4, static_cast<std::uint32_t>(entries[i].offset));
        out.patchU32(slot + 8, static_cast<std::uint32_t>(entries[i].size));
    }
    out.patchU32(0, static_cast<std::uint32_t>(out.size()));
    return std::move(out.bytes());
}

}

const std::vector<std::uint8_t>& srgbIccProfile()
{
    static const std::vector<std::uint8_t> s_profile = buildProfile();
    return s_profile;
}
