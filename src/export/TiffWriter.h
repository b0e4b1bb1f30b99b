// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// TIFF-flavored LZW (MSB-first codes, 9..12 bits, early code-width change,
// leading Clear and trailing EndOfInformation), as libtiff reads it.
[[nodiscard]] std::vector<std::uint8_t> lzwCompress(const std::uint8_t* data, std::size_t length);

// Little-endian baseline RGB TIFF in a single LZW strip. Alpha is dropped;
// resolution is stored in inches and the sRGB ICC profile in tag 34675.
[[nodiscard]] std::vector<std::uint8_t> encodeTiff(const std::uint8_t* rgba, int width, int height, int dpi);
