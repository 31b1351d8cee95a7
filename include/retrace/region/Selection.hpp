#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace RT::Region {

// Display coordinates: origin bottom-left, y grows upwards.
struct DisplayPoint {
    double x = 0.0;
    double y = 0.0;

    auto operator==(DisplayPoint const&) const -> bool = default;
};

// Box selection in display coordinates: x in [x0, x1], y in [y0, y1].
struct RectDescriptor {
    double x0 = 0.0;
    double x1 = 0.0;
    double y0 = 0.0;
    double y1 = 0.0;

    auto operator==(RectDescriptor const&) const -> bool = default;
};

// Free-form selection, closed implicitly between the last and first vertex.
struct LassoDescriptor {
    std::vector<DisplayPoint> points;

    auto operator==(LassoDescriptor const&) const -> bool = default;
};

// std::monostate means "no selection": the whole canvas.
using SelectionDescriptor = std::variant<std::monostate, RectDescriptor, LassoDescriptor>;

// Half-open pixel rectangle [left, right) x [top, bottom) in buffer coordinates.
struct PixelRect {
    std::uint32_t left   = 0;
    std::uint32_t top    = 0;
    std::uint32_t right  = 0;
    std::uint32_t bottom = 0;

    [[nodiscard]] auto width() const -> std::uint32_t { return right > left ? right - left : 0; }
    [[nodiscard]] auto height() const -> std::uint32_t { return bottom > top ? bottom - top : 0; }
    [[nodiscard]] auto empty() const -> bool { return width() == 0 || height() == 0; }
    [[nodiscard]] auto area() const -> std::size_t {
        return static_cast<std::size_t>(width()) * static_cast<std::size_t>(height());
    }
    [[nodiscard]] auto contains(std::uint32_t x, std::uint32_t y) const -> bool {
        return x >= left && x < right && y >= top && y < bottom;
    }

    auto operator==(PixelRect const&) const -> bool = default;
};

struct SelectionMask {
    std::uint32_t             width  = 0;
    std::uint32_t             height = 0;
    std::vector<std::uint8_t> bits; // one byte per pixel, 0 or 1

    [[nodiscard]] auto test(std::uint32_t x, std::uint32_t y) const -> bool {
        return bits[static_cast<std::size_t>(y) * width + x] != 0;
    }

    auto operator==(SelectionMask const&) const -> bool = default;
};

class ResolvedRegion {
public:
    explicit ResolvedRegion(PixelRect rect);
    explicit ResolvedRegion(SelectionMask mask);

    [[nodiscard]] static auto fullCanvas(std::uint32_t width, std::uint32_t height) -> ResolvedRegion;

    [[nodiscard]] auto isRect() const -> bool { return std::holds_alternative<PixelRect>(shape_); }
    [[nodiscard]] auto isMask() const -> bool { return std::holds_alternative<SelectionMask>(shape_); }
    [[nodiscard]] auto rect() const -> PixelRect const& { return std::get<PixelRect>(shape_); }
    [[nodiscard]] auto mask() const -> SelectionMask const& { return std::get<SelectionMask>(shape_); }

    [[nodiscard]] auto contains(std::uint32_t x, std::uint32_t y) const -> bool;
    [[nodiscard]] auto empty() const -> bool { return pixelCount_ == 0; }
    [[nodiscard]] auto pixelCount() const -> std::size_t { return pixelCount_; }
    // Tight bounding rectangle of the selected pixels; empty when nothing is selected.
    [[nodiscard]] auto bounds() const -> PixelRect const& { return bounds_; }

private:
    std::variant<PixelRect, SelectionMask> shape_;
    PixelRect                              bounds_{};
    std::size_t                            pixelCount_ = 0;
};

} // namespace RT::Region
