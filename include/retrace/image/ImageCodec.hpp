#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/image/ImageBuffer.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace RT::Image {

inline constexpr std::size_t SignatureLength = 32;

// Decodes PNG/JPEG/BMP/GIF/TGA bytes into an RGBA8 buffer.
[[nodiscard]] auto decodeImage(std::span<const std::uint8_t> bytes) -> Expected<ImageBuffer>;

[[nodiscard]] auto encodePng(ImageBuffer const& buffer) -> Expected<std::vector<std::uint8_t>>;

// Short content fingerprint of uploaded bytes, used as the source-image part of cache keys.
[[nodiscard]] auto imageSignature(std::span<const std::uint8_t> bytes) -> std::string;

} // namespace RT::Image
