#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace RT {

/**
 * 8-bit RGBA pixel buffer, row-major, row 0 at the top, tightly packed.
 *
 * Buffers produced by the engine are published as BufferPtr and never
 * modified afterwards; operations that transform pixels always build a new
 * ImageBuffer.
 */
struct ImageBuffer {
    static constexpr std::uint32_t Channels = 4;

    ImageBuffer() = default;
    ImageBuffer(std::uint32_t widthIn, std::uint32_t heightIn)
        : width(widthIn), height(heightIn), pixels(byteCount(widthIn, heightIn), 0) {}

    [[nodiscard]] static auto byteCount(std::uint32_t w, std::uint32_t h) -> std::size_t {
        return static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * Channels;
    }

    [[nodiscard]] auto offset(std::uint32_t x, std::uint32_t y) const -> std::size_t {
        return (static_cast<std::size_t>(y) * width + x) * Channels;
    }

    [[nodiscard]] auto at(std::uint32_t x, std::uint32_t y) -> std::uint8_t* { return pixels.data() + offset(x, y); }
    [[nodiscard]] auto at(std::uint32_t x, std::uint32_t y) const -> std::uint8_t const* {
        return pixels.data() + offset(x, y);
    }

    [[nodiscard]] auto sameCanvas(ImageBuffer const& other) const -> bool {
        return width == other.width && height == other.height;
    }

    [[nodiscard]] auto valid() const -> bool {
        return width > 0 && height > 0 && pixels.size() == byteCount(width, height);
    }

    auto operator==(ImageBuffer const& other) const -> bool = default;

    std::uint32_t             width  = 0;
    std::uint32_t             height = 0;
    std::vector<std::uint8_t> pixels;
};

using BufferPtr = std::shared_ptr<ImageBuffer const>;

[[nodiscard]] inline auto makeSolidBuffer(std::uint32_t width,
                                          std::uint32_t height,
                                          std::uint8_t r,
                                          std::uint8_t g,
                                          std::uint8_t b,
                                          std::uint8_t a = 255) -> ImageBuffer {
    ImageBuffer buffer{width, height};
    for (std::size_t i = 0; i < buffer.pixels.size(); i += ImageBuffer::Channels) {
        buffer.pixels[i + 0] = r;
        buffer.pixels[i + 1] = g;
        buffer.pixels[i + 2] = b;
        buffer.pixels[i + 3] = a;
    }
    return buffer;
}

} // namespace RT
