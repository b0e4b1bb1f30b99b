// SPDX-License-Identifier: MIT
#include "export/IccProfile.h"

#include <gtest/gtest.h>

#include <cstring>
#include <map>
#include <string>

namespace {

std::uint32_t u32be(const std::vector<std::uint8_t>& b, std::size_t at)
{
    return (static_cast<std::uint32_t>(b[at]) << 24) | (static_cast<std::uint32_t>(b[at + 1]) << 16) | (static_cast<std::uint32_t>(b[at + 2]) << 8) | b[at + 3];
}

std::string signatureAt(const std::vector<std::uint8_t>& b, std::size_t at)
{
    return std::string(reinterpret_cast<const char*>(&b[at]), 4);
}

}

TEST(IccProfile, HeaderDescribesAnRgbDisplayProfile)
{
    const auto& icc = srgbIccProfile();
    ASSERT_GT(icc.size(), 128u);
    EXPECT_EQ(u32be(icc, 0), icc.size());
    EXPECT_EQ(u32be(icc, 8), 0x02100000u);
    EXPECT_EQ(signatureAt(icc, 12), "mntr");
    EXPECT_EQ(signatureAt(icc, 16), "RGB ");
    EXPECT_EQ(signatureAt(icc, 20), "XYZ ");
    EXPECT_EQ(signatureAt(icc, 36), "acsp");
    EXPECT_EQ(icc.size() % 4, 0u);
}

TEST(IccProfile, TagTableIsConsistent)
{
    const auto& icc = srgbIccProfile();
    const std::uint32_t count = u32be(icc, 128);
    ASSERT_EQ(count, 9u);

    std::map<std::string, std::pair<std::uint32_t, std::uint32_t>> tags;
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::size_t slot = 132 + i * 12;
        const std::uint32_t offset = u32be(icc, slot + 4);
        const std::uint32_t size = u32be(icc, slot + 8);
        EXPECT_EQ(offset % 4, 0u);
        EXPECT_LE(offset + size, icc.size());
        tags[signatureAt(icc, slot)] = { offset, size };
    }

    for (const char* name : { "desc", "cprt", "wtpt", "rXYZ", "gXYZ", "bXYZ", "rTRC", "gTRC", "bTRC" })
        EXPECT_EQ(tags.count(name), 1u) << name;

    EXPECT_EQ(tags["rTRC"], tags["gTRC"]);
    EXPECT_EQ(tags["rTRC"], tags["bTRC"]);
    EXPECT_EQ(signatureAt(icc, tags["wtpt"].first), "XYZ ");
    EXPECT_EQ(signatureAt(icc, tags["desc"].first), "desc");
}

TEST(IccProfile, ToneCurveIsTheSrgbTransfer)
{
    const auto& icc = srgbIccProfile();
    std::uint32_t curveAt = 0;
    for (std::uint32_t i = 0; i < 9; ++i) {
        const std::size_t slot = 132 + i * 12;
        if (signatureAt(icc, slot) == "rTRC")
            curveAt = u32be(icc, slot + 4);
    }
    ASSERT_NE(curveAt, 0u);
    EXPECT_EQ(signatureAt(icc, curveAt), "curv");
    ASSERT_EQ(u32be(icc, curveAt + 8), 1024u);

    const auto entry = [&](int i) {
        const std::size_t at = curveAt + 12 + static_cast<std::size_t>(i) * 2;
        return (icc[at] << 8) | icc[at + 1];
    };
    EXPECT_EQ(entry(0), 0);
    EXPECT_EQ(entry(1023), 65535);
    // Mid grey decodes to about 21.5% linear.
    EXPECT_NEAR(entry(512) / 65535.0, 0.2145, 0.002);
    for (int i = 1; i < 1024; ++i)
        ASSERT_GT(entry(i), entry(i - 1)) << i;
}

TEST(IccProfile, IsBuiltOnce)
{
    EXPECT_EQ(&srgbIccProfile(), &srgbIccProfile());
}
