#include <retrace/ops/Operation.hpp>

#include <cmath>
#include <string>

namespace RT::Ops {

auto filterName(FilterKind kind) -> std::string_view {
    switch (kind) {
    case FilterKind::Blur:
        return "blur";
    case FilterKind::Contour:
        return "contour";
    case FilterKind::Detail:
        return "detail";
    case FilterKind::EdgeEnhance:
        return "edge_enhance";
    case FilterKind::EdgeEnhanceMore:
        return "edge_enhance_more";
    case FilterKind::Emboss:
        return "emboss";
    case FilterKind::FindEdges:
        return "find_edges";
    case FilterKind::Sharpen:
        return "sharpen";
    case FilterKind::Smooth:
        return "smooth";
    case FilterKind::SmoothMore:
        return "smooth_more";
    }
    return "unknown";
}

auto enhanceName(EnhanceKind kind) -> std::string_view {
    switch (kind) {
    case EnhanceKind::Brightness:
        return "brightness";
    case EnhanceKind::Color:
        return "color";
    case EnhanceKind::Contrast:
        return "contrast";
    case EnhanceKind::Sharpness:
        return "sharpness";
    }
    return "unknown";
}

auto parseFilterKind(std::string_view name) -> Expected<FilterKind> {
    for (auto kind : AllFilters) {
        if (filterName(kind) == name) {
            return kind;
        }
    }
    return std::unexpected(Error{Error::Code::UnknownOperation, "unknown filter '" + std::string{name} + "'"});
}

auto parseEnhanceKind(std::string_view name) -> Expected<EnhanceKind> {
    for (auto kind : AllEnhancements) {
        if (enhanceName(kind) == name) {
            return kind;
        }
    }
    return std::unexpected(Error{Error::Code::UnknownOperation, "unknown enhancement '" + std::string{name} + "'"});
}

auto operationName(Operation const& operation) -> std::string_view {
    if (auto const* filter = std::get_if<FilterOp>(&operation)) {
        return filterName(filter->filter);
    }
    return enhanceName(std::get<EnhanceOp>(operation).enhancement);
}

auto validateOperation(Operation const& operation) -> Expected<void> {
    if (auto const* enhance = std::get_if<EnhanceOp>(&operation)) {
        if (!std::isfinite(enhance->factor)) {
            return std::unexpected(Error{Error::Code::ValidationError, "enhancement factor must be a finite number"});
        }
        if (enhance->factor < MinEnhanceFactor || enhance->factor > MaxEnhanceFactor) {
            return std::unexpected(Error{Error::Code::ValidationError,
                                         "enhancement factor " + std::to_string(enhance->factor)
                                             + " outside [0, 10]"});
        }
    }
    return {};
}

} // namespace RT::Ops
