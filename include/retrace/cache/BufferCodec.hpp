#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/image/ImageBuffer.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace RT::Cache {

// 'RTBF' read as a little-endian u32.
inline constexpr std::uint32_t BufferMagic   = 0x46425452u;
inline constexpr std::uint16_t BufferVersion = 1;

/*
 * Layout (little endian):
 *   u32 magic, u16 version, u16 channels, u32 width, u32 height,
 *   u64 pixel byte count, pixel bytes
 */
[[nodiscard]] auto encodeBuffer(ImageBuffer const& buffer) -> Expected<std::vector<std::byte>>;
[[nodiscard]] auto decodeBuffer(std::span<const std::byte> bytes) -> Expected<ImageBuffer>;

} // namespace RT::Cache
