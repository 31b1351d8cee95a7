#include <retrace/ops/PixelOperationAdapter.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace RT::Ops {

namespace {

struct Kernel {
    int                   size = 3; // 3 or 5
    std::array<int, 25>   weights{};
    int                   scale  = 1;
    int                   offset = 0;
};

auto kernelFor(FilterKind filter) -> Kernel const& {
    // clang-format off
    static Kernel const blur{5, {1, 1, 1, 1, 1,
                                 1, 0, 0, 0, 1,
                                 1, 0, 0, 0, 1,
                                 1, 0, 0, 0, 1,
                                 1, 1, 1, 1, 1}, 16, 0};
    static Kernel const contour{3, {-1, -1, -1,
                                    -1,  8, -1,
                                    -1, -1, -1}, 1, 255};
    static Kernel const detail{3, { 0, -1,  0,
                                   -1, 10, -1,
                                    0, -1,  0}, 6, 0};
    static Kernel const edgeEnhance{3, {-1, -1, -1,
                                        -1, 10, -1,
                                        -1, -1, -1}, 2, 0};
    static Kernel const edgeEnhanceMore{3, {-1, -1, -1,
                                            -1,  9, -1,
                                            -1, -1, -1}, 1, 0};
    static Kernel const emboss{3, {-1, 0, 0,
                                    0, 1, 0,
                                    0, 0, 0}, 1, 128};
    static Kernel const findEdges{3, {-1, -1, -1,
                                      -1,  8, -1,
                                      -1, -1, -1}, 1, 0};
    static Kernel const sharpen{3, {-2, -2, -2,
                                    -2, 32, -2,
                                    -2, -2, -2}, 16, 0};
    static Kernel const smooth{3, {1, 1, 1,
                                   1, 5, 1,
                                   1, 1, 1}, 13, 0};
    static Kernel const smoothMore{5, {1, 1,  1, 1, 1,
                                       1, 5,  5, 5, 1,
                                       1, 5, 44, 5, 1,
                                       1, 5,  5, 5, 1,
                                       1, 1,  1, 1, 1}, 100, 0};
    // clang-format on
    switch (filter) {
    case FilterKind::Blur:
        return blur;
    case FilterKind::Contour:
        return contour;
    case FilterKind::Detail:
        return detail;
    case FilterKind::EdgeEnhance:
        return edgeEnhance;
    case FilterKind::EdgeEnhanceMore:
        return edgeEnhanceMore;
    case FilterKind::Emboss:
        return emboss;
    case FilterKind::FindEdges:
        return findEdges;
    case FilterKind::Sharpen:
        return sharpen;
    case FilterKind::Smooth:
        return smooth;
    case FilterKind::SmoothMore:
        return smoothMore;
    }
    return smooth;
}

auto clamp8(double value) -> std::uint8_t {
    return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

auto convolve(ImageBuffer const& input, Kernel const& kernel) -> ImageBuffer {
    ImageBuffer out{input.width, input.height};
    auto const  radius = kernel.size / 2;
    auto const  maxX   = static_cast<std::int64_t>(input.width) - 1;
    auto const  maxY   = static_cast<std::int64_t>(input.height) - 1;

    for (std::uint32_t y = 0; y < input.height; ++y) {
        for (std::uint32_t x = 0; x < input.width; ++x) {
            int sums[3] = {0, 0, 0};
            for (int ky = 0; ky < kernel.size; ++ky) {
                auto const sy = static_cast<std::uint32_t>(
                    std::clamp<std::int64_t>(static_cast<std::int64_t>(y) + ky - radius, 0, maxY));
                for (int kx = 0; kx < kernel.size; ++kx) {
                    int const weight = kernel.weights[static_cast<std::size_t>(ky * kernel.size + kx)];
                    if (weight == 0)
                        continue;
                    auto const sx = static_cast<std::uint32_t>(
                        std::clamp<std::int64_t>(static_cast<std::int64_t>(x) + kx - radius, 0, maxX));
                    auto const* px = input.at(sx, sy);
                    sums[0] += weight * px[0];
                    sums[1] += weight * px[1];
                    sums[2] += weight * px[2];
                }
            }
            auto*       dst = out.at(x, y);
            auto const* src = input.at(x, y);
            for (int c = 0; c < 3; ++c) {
                dst[c] = clamp8(static_cast<double>(sums[c]) / kernel.scale + kernel.offset);
            }
            dst[3] = src[3];
        }
    }
    return out;
}

auto blend(ImageBuffer const& degenerate, ImageBuffer const& input, double factor) -> ImageBuffer {
    ImageBuffer out{input.width, input.height};
    for (std::size_t i = 0; i < input.pixels.size(); i += ImageBuffer::Channels) {
        for (std::size_t c = 0; c < 3; ++c) {
            double const base = degenerate.pixels[i + c];
            out.pixels[i + c] = clamp8(base + factor * (static_cast<double>(input.pixels[i + c]) - base));
        }
        out.pixels[i + 3] = input.pixels[i + 3];
    }
    return out;
}

template <typename Predicate>
auto meanLuma(ImageBuffer const& input, Predicate&& selected) -> std::uint8_t {
    std::uint64_t total = 0;
    std::uint64_t count = 0;
    for (std::uint32_t y = 0; y < input.height; ++y) {
        for (std::uint32_t x = 0; x < input.width; ++x) {
            if (!selected(x, y))
                continue;
            auto const* px = input.at(x, y);
            total += luma(px[0], px[1], px[2]);
            ++count;
        }
    }
    if (count == 0) {
        return 0;
    }
    return clamp8(static_cast<double>(total) / static_cast<double>(count));
}

auto enhance(ImageBuffer const& input, EnhanceOp const& op, std::uint8_t regionMean) -> ImageBuffer {
    ImageBuffer degenerate{input.width, input.height};
    switch (op.enhancement) {
    case EnhanceKind::Brightness:
        break;
    case EnhanceKind::Contrast:
        for (std::size_t i = 0; i < degenerate.pixels.size(); i += ImageBuffer::Channels) {
            degenerate.pixels[i + 0] = regionMean;
            degenerate.pixels[i + 1] = regionMean;
            degenerate.pixels[i + 2] = regionMean;
        }
        break;
    case EnhanceKind::Color:
        for (std::size_t i = 0; i < degenerate.pixels.size(); i += ImageBuffer::Channels) {
            auto const grey = luma(input.pixels[i], input.pixels[i + 1], input.pixels[i + 2]);
            degenerate.pixels[i + 0] = grey;
            degenerate.pixels[i + 1] = grey;
            degenerate.pixels[i + 2] = grey;
        }
        break;
    case EnhanceKind::Sharpness:
        degenerate = convolve(input, kernelFor(FilterKind::Smooth));
        break;
    }
    return blend(degenerate, input, op.factor);
}

// Transforms every pixel of `input`; `regionMean` feeds the contrast enhancement.
auto transform(ImageBuffer const& input, Operation const& operation, std::uint8_t regionMean) -> ImageBuffer {
    if (auto const* filter = std::get_if<FilterOp>(&operation)) {
        return convolve(input, kernelFor(filter->filter));
    }
    return enhance(input, std::get<EnhanceOp>(operation), regionMean);
}

auto crop(ImageBuffer const& input, Region::PixelRect const& rect) -> ImageBuffer {
    ImageBuffer out{rect.width(), rect.height()};
    auto const  rowBytes = static_cast<std::size_t>(rect.width()) * ImageBuffer::Channels;
    for (std::uint32_t y = 0; y < rect.height(); ++y) {
        auto const* src = input.at(rect.left, rect.top + y);
        std::copy(src, src + rowBytes, out.at(0, y));
    }
    return out;
}

void paste(ImageBuffer& target, ImageBuffer const& patch, Region::PixelRect const& rect) {
    auto const rowBytes = static_cast<std::size_t>(rect.width()) * ImageBuffer::Channels;
    for (std::uint32_t y = 0; y < rect.height(); ++y) {
        auto const* src = patch.at(0, y);
        std::copy(src, src + rowBytes, target.at(rect.left, rect.top + y));
    }
}

} // namespace

auto luma(std::uint8_t r, std::uint8_t g, std::uint8_t b) -> std::uint8_t {
    return static_cast<std::uint8_t>((r * 19595u + g * 38470u + b * 7471u + 0x8000u) >> 16);
}

auto applyFilter(ImageBuffer const& input, FilterKind filter) -> ImageBuffer {
    return convolve(input, kernelFor(filter));
}

auto PixelOperationAdapter::apply(ImageBuffer const& input,
                                  Region::ResolvedRegion const& region,
                                  Operation const& operation) -> Expected<ImageBuffer> {
    invocations_.fetch_add(1, std::memory_order_acq_rel);

    if (!input.valid()) {
        return std::unexpected(Error{Error::Code::ValidationError, "operation input buffer is empty or inconsistent"});
    }
    if (auto valid = validateOperation(operation); !valid) {
        return std::unexpected(valid.error());
    }
    if (region.empty()) {
        return input;
    }

    if (region.isMask()) {
        auto const& mask = region.mask();
        if (mask.width != input.width || mask.height != input.height) {
            return std::unexpected(Error{Error::Code::ValidationError,
                                         "selection mask " + std::to_string(mask.width) + "x"
                                             + std::to_string(mask.height) + " does not match the canvas"});
        }
        auto const  mean      = meanLuma(input, [&](std::uint32_t x, std::uint32_t y) { return mask.test(x, y); });
        auto const  processed = transform(input, operation, mean);
        ImageBuffer out       = input;
        for (std::uint32_t y = 0; y < input.height; ++y) {
            for (std::uint32_t x = 0; x < input.width; ++x) {
                if (mask.test(x, y)) {
                    std::copy_n(processed.at(x, y), ImageBuffer::Channels, out.at(x, y));
                }
            }
        }
        return out;
    }

    auto const& rect = region.rect();
    if (rect.right > input.width || rect.bottom > input.height) {
        return std::unexpected(Error{Error::Code::ValidationError, "selection rectangle extends past the canvas"});
    }
    auto const patch     = crop(input, rect);
    auto const mean      = meanLuma(patch, [](std::uint32_t, std::uint32_t) { return true; });
    auto const processed = transform(patch, operation, mean);
    ImageBuffer out      = input;
    paste(out, processed, rect);
    return out;
}

} // namespace RT::Ops
