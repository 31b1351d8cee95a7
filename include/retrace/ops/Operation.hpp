#pragma once

#include <retrace/core/Error.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <variant>

namespace RT::Ops {

enum class FilterKind : std::uint8_t {
    Blur = 0,
    Contour,
    Detail,
    EdgeEnhance,
    EdgeEnhanceMore,
    Emboss,
    FindEdges,
    Sharpen,
    Smooth,
    SmoothMore,
};

enum class EnhanceKind : std::uint8_t {
    Brightness = 0,
    Color,
    Contrast,
    Sharpness,
};

inline constexpr std::array<FilterKind, 10> AllFilters{FilterKind::Blur,
                                                       FilterKind::Contour,
                                                       FilterKind::Detail,
                                                       FilterKind::EdgeEnhance,
                                                       FilterKind::EdgeEnhanceMore,
                                                       FilterKind::Emboss,
                                                       FilterKind::FindEdges,
                                                       FilterKind::Sharpen,
                                                       FilterKind::Smooth,
                                                       FilterKind::SmoothMore};

inline constexpr std::array<EnhanceKind, 4> AllEnhancements{EnhanceKind::Brightness,
                                                            EnhanceKind::Color,
                                                            EnhanceKind::Contrast,
                                                            EnhanceKind::Sharpness};

inline constexpr double MinEnhanceFactor = 0.0;
inline constexpr double MaxEnhanceFactor = 10.0;

struct FilterOp {
    FilterKind filter = FilterKind::Blur;

    auto operator==(FilterOp const&) const -> bool = default;
};

struct EnhanceOp {
    EnhanceKind enhancement = EnhanceKind::Brightness;
    double      factor      = 1.0;

    auto operator==(EnhanceOp const&) const -> bool = default;
};

using Operation = std::variant<FilterOp, EnhanceOp>;

[[nodiscard]] auto filterName(FilterKind kind) -> std::string_view;
[[nodiscard]] auto enhanceName(EnhanceKind kind) -> std::string_view;

// Both fail with UnknownOperation.
[[nodiscard]] auto parseFilterKind(std::string_view name) -> Expected<FilterKind>;
[[nodiscard]] auto parseEnhanceKind(std::string_view name) -> Expected<EnhanceKind>;

[[nodiscard]] auto operationName(Operation const& operation) -> std::string_view;

// Rejects enhancement factors that are not finite or fall outside [MinEnhanceFactor, MaxEnhanceFactor].
[[nodiscard]] auto validateOperation(Operation const& operation) -> Expected<void>;

} // namespace RT::Ops
