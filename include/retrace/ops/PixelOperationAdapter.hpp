#pragma once

#include <retrace/ops/OperationAdapter.hpp>

#include <atomic>
#include <cstddef>

namespace RT::Ops {

/*
 * Reference implementation of the operation boundary.
 *
 * Filters are fixed 3x3 / 5x5 convolutions (kernel, scale, offset) on RGB with
 * edge samples replicated; alpha passes through. Rectangle regions are cropped,
 * filtered and pasted back, so samples never cross the rectangle border. Mask
 * regions filter the whole canvas and keep the result only under the mask.
 *
 * Enhancements blend the input away from a degenerate image:
 *   out = degenerate + factor * (in - degenerate)
 *   brightness -> black, contrast -> mean luma of the region,
 *   color -> per-pixel luma grey, sharpness -> the smooth filter's output.
 */
class PixelOperationAdapter final : public OperationAdapter {
public:
    [[nodiscard]] auto apply(ImageBuffer const& input,
                             Region::ResolvedRegion const& region,
                             Operation const& operation) -> Expected<ImageBuffer> override;

    // Number of apply() calls so far, including no-op ones.
    [[nodiscard]] auto invocations() const -> std::size_t { return invocations_.load(std::memory_order_acquire); }
    void resetInvocations() { invocations_.store(0, std::memory_order_release); }

private:
    std::atomic<std::size_t> invocations_{0};
};

// Runs `filter` over every pixel of `input`.
[[nodiscard]] auto applyFilter(ImageBuffer const& input, FilterKind filter) -> ImageBuffer;

// ITU-R 601 luma, rounded the way 8-bit greyscale conversion rounds it.
[[nodiscard]] auto luma(std::uint8_t r, std::uint8_t g, std::uint8_t b) -> std::uint8_t;

} // namespace RT::Ops
