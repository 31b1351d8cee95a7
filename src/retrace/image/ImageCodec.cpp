#include <retrace/image/ImageCodec.hpp>

#include <retrace/core/Digest.hpp>

#include <cstring>
#include <limits>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STBI_WRITE_NO_STDIO
#include <stb_image_write.h>

namespace RT::Image {

namespace {

auto make_decode_error(std::string message) -> Error {
    return Error{Error::Code::DecodeError, std::move(message)};
}

void append_to_vector(void* context, void* data, int size) {
    auto* out   = static_cast<std::vector<std::uint8_t>*>(context);
    auto* bytes = static_cast<std::uint8_t const*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

auto decodeImage(std::span<const std::uint8_t> bytes) -> Expected<ImageBuffer> {
    if (bytes.empty()) {
        return std::unexpected(make_decode_error("empty image payload"));
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(make_decode_error("image payload too large"));
    }

    int width    = 0;
    int height   = 0;
    int channels = 0;

    unsigned char* decoded = stbi_load_from_memory(bytes.data(),
                                                   static_cast<int>(bytes.size()),
                                                   &width,
                                                   &height,
                                                   &channels,
                                                   STBI_rgb_alpha);

    if (!decoded || width <= 0 || height <= 0) {
        if (decoded) {
            stbi_image_free(decoded);
        }
        char const* reason = stbi_failure_reason();
        return std::unexpected(make_decode_error(std::string{"failed to decode image"}
                                                 + (reason ? std::string{": "} + reason : std::string{})));
    }

    std::unique_ptr<unsigned char, void (*)(void*)> pixels(decoded, stbi_image_free);
    ImageBuffer image{static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
    std::memcpy(image.pixels.data(), pixels.get(), image.pixels.size());
    return image;
}

auto encodePng(ImageBuffer const& buffer) -> Expected<std::vector<std::uint8_t>> {
    if (!buffer.valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "cannot encode an empty buffer"});
    }
    std::vector<std::uint8_t> encoded;
    auto const                stride = static_cast<int>(buffer.width * ImageBuffer::Channels);
    int const ok = stbi_write_png_to_func(&append_to_vector,
                                          &encoded,
                                          static_cast<int>(buffer.width),
                                          static_cast<int>(buffer.height),
                                          static_cast<int>(ImageBuffer::Channels),
                                          buffer.pixels.data(),
                                          stride);
    if (ok == 0) {
        return std::unexpected(Error{Error::Code::UnknownError, "png encoder failed"});
    }
    return encoded;
}

auto imageSignature(std::span<const std::uint8_t> bytes) -> std::string {
    return RT::sha256Hex(bytes).substr(0, SignatureLength);
}

} // namespace RT::Image
