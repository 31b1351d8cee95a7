#include <retrace/cache/BufferCodec.hpp>

#include <cstring>
#include <optional>
#include <string>
#include <type_traits>

namespace {

using RT::Error;

template <typename T>
inline void appendScalar(std::vector<std::byte>& buffer, T value) {
    static_assert(std::is_trivially_copyable_v<T>, "appendScalar requires trivially copyable type");
    std::uint8_t local[sizeof(T)];
    std::memcpy(local, &value, sizeof(T));
    auto const base = reinterpret_cast<const std::byte*>(local);
    buffer.insert(buffer.end(), base, base + sizeof(T));
}

template <typename T>
inline auto readScalar(std::span<const std::byte>& bytes) -> std::optional<T> {
    if (bytes.size() < sizeof(T))
        return std::nullopt;
    T value{};
    std::memcpy(&value, bytes.data(), sizeof(T));
    bytes = bytes.subspan(sizeof(T));
    return value;
}

inline auto malformed(char const* what) -> Error {
    return Error{Error::Code::MalformedInput, std::string{"Cached buffer "} + what};
}

} // namespace

namespace RT::Cache {

auto encodeBuffer(ImageBuffer const& buffer) -> Expected<std::vector<std::byte>> {
    if (!buffer.valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "Cannot encode an empty or inconsistent buffer"});
    }

    std::vector<std::byte> out;
    out.reserve(24 + buffer.pixels.size());
    appendScalar<std::uint32_t>(out, BufferMagic);
    appendScalar<std::uint16_t>(out, BufferVersion);
    appendScalar<std::uint16_t>(out, static_cast<std::uint16_t>(ImageBuffer::Channels));
    appendScalar<std::uint32_t>(out, buffer.width);
    appendScalar<std::uint32_t>(out, buffer.height);
    appendScalar<std::uint64_t>(out, static_cast<std::uint64_t>(buffer.pixels.size()));
    auto const* pixels = reinterpret_cast<std::byte const*>(buffer.pixels.data());
    out.insert(out.end(), pixels, pixels + buffer.pixels.size());
    return out;
}

auto decodeBuffer(std::span<const std::byte> bytes) -> Expected<ImageBuffer> {
    auto data  = bytes;
    auto magic = readScalar<std::uint32_t>(data);
    if (!magic.has_value() || *magic != BufferMagic) {
        return std::unexpected(malformed("missing magic header"));
    }
    auto version = readScalar<std::uint16_t>(data);
    if (!version.has_value()) {
        return std::unexpected(malformed("missing version"));
    }
    if (*version < 1 || *version > BufferVersion) {
        return std::unexpected(malformed("has an unsupported version"));
    }
    auto channels = readScalar<std::uint16_t>(data);
    if (!channels.has_value() || *channels != ImageBuffer::Channels) {
        return std::unexpected(malformed("has an unsupported channel count"));
    }
    auto width  = readScalar<std::uint32_t>(data);
    auto height = readScalar<std::uint32_t>(data);
    if (!width.has_value() || !height.has_value()) {
        return std::unexpected(malformed("truncated (dimensions)"));
    }
    if (*width == 0 || *height == 0) {
        return std::unexpected(malformed("has a zero dimension"));
    }
    auto length = readScalar<std::uint64_t>(data);
    if (!length.has_value()) {
        return std::unexpected(malformed("truncated (pixel length)"));
    }
    if (*length != ImageBuffer::byteCount(*width, *height)) {
        return std::unexpected(malformed("pixel length does not match its dimensions"));
    }
    if (data.size() != *length) {
        return std::unexpected(malformed("truncated (pixel bytes)"));
    }

    ImageBuffer buffer{*width, *height};
    std::memcpy(buffer.pixels.data(), data.data(), buffer.pixels.size());
    return buffer;
}

} // namespace RT::Cache
