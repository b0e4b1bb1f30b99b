#include <framework/image.h>
#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <fmt/format.h>
DISABLE_WARNINGS_POP()
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

Image::Image(const std::filesystem::path& filePath, int forceChannels)
{
    if (!std::filesystem::exists(filePath))
        throw ImageLoadingException(fmt::format("Image file {} does not exist", filePath.string()));

    int w = 0;
    int h = 0;
    int fileChannels = 0;
    stbi_uc* decoded = stbi_load(filePath.string().c_str(), &w, &h, &fileChannels, forceChannels);
    if (!decoded)
        throw ImageLoadingException(fmt::format("Failed to decode {}: {}", filePath.string(), stbi_failure_reason()));

    width = w;
    height = h;
    channels = forceChannels > 0 ? forceChannels : fileChannels;
    m_pixels.assign(decoded, decoded + static_cast<size_t>(w) * static_cast<size_t>(h) * static_cast<size_t>(channels));
    stbi_image_free(decoded);

    std::cout << fmt::format("[Image] loaded {} ({}x{}, {} channels in file)", filePath.filename().string(), w, h, fileChannels) << std::endl;
}

Image::Image(int width_, int height_, int channels_, std::vector<std::uint8_t> pixels)
    : width(width_)
    , height(height_)
    , channels(channels_)
    , m_pixels(std::move(pixels))
{
    if (width <= 0 || height <= 0 || channels <= 0)
        throw ImageLoadingException(fmt::format("Invalid image dimensions {}x{}x{}", width, height, channels));
    if (m_pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels))
        throw ImageLoadingException("Pixel buffer size does not match image dimensions");
}

glm::ivec2 fitWithin(glm::ivec2 size, int maxDimension)
{
    const int longest = std::max(size.x, size.y);
    if (maxDimension <= 0 || longest <= maxDimension)
        return size;

    const double ratio = static_cast<double>(maxDimension) / static_cast<double>(longest);
    return {
        std::max(1, static_cast<int>(std::lround(size.x * ratio))),
        std::max(1, static_cast<int>(std::lround(size.y * ratio)))
    };
}

Image downsizeToFit(const Image& image, int maxDimension)
{
    const glm::ivec2 target = fitWithin(image.size(), maxDimension);
    if (target == image.size())
        return image;

    const int c = image.channels;
    std::vector<std::uint8_t> out(static_cast<size_t>(target.x) * static_cast<size_t>(target.y) * static_cast<size_t>(c));
    const double sx = static_cast<double>(image.width) / target.x;
    const double sy = static_cast<double>(image.height) / target.y;
    const std::uint8_t* src = image.get_data();

    std::vector<double> accum(static_cast<size_t>(c));
    for (int y = 0; y < target.y; ++y) {
        const double y0 = y * sy;
        const double y1 = (y + 1) * sy;
        for (int x = 0; x < target.x; ++x) {
            const double x0 = x * sx;
            const double x1 = (x + 1) * sx;
            std::fill(accum.begin(), accum.end(), 0.0);
            double area = 0.0;

            for (int iy = static_cast<int>(y0); iy < std::min(image.height, static_cast<int>(std::ceil(y1))); ++iy) {
                const double wy = std::min<double>(iy + 1, y1) - std::max<double>(iy, y0);
                if (wy <= 0.0)
                    continue;
                for (int ix = static_cast<int>(x0); ix < std::min(image.width, static_cast<int>(std::ceil(x1))); ++ix) {
                    const double wx = std::min<double>(ix + 1, x1) - std::max<double>(ix, x0);
                    if (wx <= 0.0)
                        continue;
                    const double w = wx * wy;
                    const std::uint8_t* p = src + (static_cast<size_t>(iy) * image.width + ix) * c;
                    for (int k = 0; k < c; ++k)
                        accum[k] += p[k] * w;
                    area += w;
                }
            }

            std::uint8_t* dst = out.data() + (static_cast<size_t>(y) * target.x + x) * c;
            for (int k = 0; k < c; ++k)
                dst[k] = static_cast<std::uint8_t>(std::clamp(std::lround(accum[k] / area), 0L, 255L));
        }
    }

    return Image(target.x, target.y, c, std::move(out));
}
