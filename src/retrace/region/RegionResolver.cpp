#include <retrace/region/RegionResolver.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace RT::Region {

namespace {

using json = nlohmann::json;

// Coordinates beyond this are clamped before truncation so the integer math cannot overflow.
constexpr double kCoordinateLimit = 1.0e9;

auto make_selection_error(std::string message) -> Error {
    return Error{Error::Code::InvalidSelection, std::move(message)};
}

auto read_number_array(json const& parent, char const* key, char const* context) -> Expected<std::vector<double>> {
    auto it = parent.find(key);
    if (it == parent.end()) {
        return std::unexpected(make_selection_error(std::string{context} + " is missing '" + key + "'"));
    }
    if (!it->is_array()) {
        return std::unexpected(make_selection_error(std::string{context} + "." + key + " must be an array"));
    }
    std::vector<double> values;
    values.reserve(it->size());
    for (auto const& element : *it) {
        if (!element.is_number()) {
            return std::unexpected(
                make_selection_error(std::string{context} + "." + key + " must contain only numbers"));
        }
        values.push_back(element.get<double>());
    }
    return values;
}

auto parse_range(json const& range) -> Expected<SelectionDescriptor> {
    if (!range.is_object()) {
        return std::unexpected(make_selection_error("range must be an object"));
    }
    auto xs = read_number_array(range, "x", "range");
    if (!xs) {
        return std::unexpected(xs.error());
    }
    auto ys = read_number_array(range, "y", "range");
    if (!ys) {
        return std::unexpected(ys.error());
    }
    if (xs->size() != 2 || ys->size() != 2) {
        return std::unexpected(make_selection_error("range.x and range.y must hold exactly two bounds"));
    }
    RectDescriptor rect{(*xs)[0], (*xs)[1], (*ys)[0], (*ys)[1]};
    return SelectionDescriptor{rect};
}

auto parse_lasso(json const& points) -> Expected<SelectionDescriptor> {
    if (!points.is_object()) {
        return std::unexpected(make_selection_error("lassoPoints must be an object"));
    }
    auto xs = read_number_array(points, "x", "lassoPoints");
    if (!xs) {
        return std::unexpected(xs.error());
    }
    auto ys = read_number_array(points, "y", "lassoPoints");
    if (!ys) {
        return std::unexpected(ys.error());
    }
    if (xs->size() != ys->size()) {
        return std::unexpected(make_selection_error("lassoPoints.x and lassoPoints.y differ in length"));
    }
    LassoDescriptor lasso;
    lasso.points.reserve(xs->size());
    for (std::size_t i = 0; i < xs->size(); ++i) {
        lasso.points.push_back(DisplayPoint{(*xs)[i], (*ys)[i]});
    }
    return SelectionDescriptor{std::move(lasso)};
}

auto to_pixel(double value) -> std::int64_t {
    return static_cast<std::int64_t>(std::trunc(std::clamp(value, -kCoordinateLimit, kCoordinateLimit)));
}

auto clamp_to(std::int64_t value, std::uint32_t limit) -> std::uint32_t {
    return static_cast<std::uint32_t>(std::clamp<std::int64_t>(value, 0, static_cast<std::int64_t>(limit)));
}

auto validate_rect(RectDescriptor const& rect) -> Expected<void> {
    if (!std::isfinite(rect.x0) || !std::isfinite(rect.x1) || !std::isfinite(rect.y0) || !std::isfinite(rect.y1)) {
        return std::unexpected(make_selection_error("rectangle bounds must be finite numbers"));
    }
    return {};
}

auto validate_lasso(LassoDescriptor const& lasso) -> Expected<void> {
    for (auto const& point : lasso.points) {
        if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
            return std::unexpected(make_selection_error("lasso vertices must be finite numbers"));
        }
    }
    return {};
}

} // namespace

ResolvedRegion::ResolvedRegion(PixelRect rect)
    : shape_(rect) {
    if (!rect.empty()) {
        bounds_     = rect;
        pixelCount_ = rect.area();
    }
}

ResolvedRegion::ResolvedRegion(SelectionMask mask)
    : shape_(std::move(mask)) {
    auto const& stored = std::get<SelectionMask>(shape_);
    std::uint32_t minX = stored.width, minY = stored.height, maxX = 0, maxY = 0;
    for (std::uint32_t y = 0; y < stored.height; ++y) {
        for (std::uint32_t x = 0; x < stored.width; ++x) {
            if (!stored.test(x, y))
                continue;
            ++pixelCount_;
            minX = std::min(minX, x);
            minY = std::min(minY, y);
            maxX = std::max(maxX, x + 1);
            maxY = std::max(maxY, y + 1);
        }
    }
    if (pixelCount_ > 0) {
        bounds_ = PixelRect{minX, minY, maxX, maxY};
    }
}

auto ResolvedRegion::fullCanvas(std::uint32_t width, std::uint32_t height) -> ResolvedRegion {
    return ResolvedRegion{PixelRect{0, 0, width, height}};
}

auto ResolvedRegion::contains(std::uint32_t x, std::uint32_t y) const -> bool {
    if (auto const* rect = std::get_if<PixelRect>(&shape_)) {
        return rect->contains(x, y);
    }
    auto const& m = std::get<SelectionMask>(shape_);
    return x < m.width && y < m.height && m.test(x, y);
}

auto parseSelection(json const& payload) -> Expected<SelectionDescriptor> {
    if (payload.is_null()) {
        return SelectionDescriptor{};
    }
    if (!payload.is_object()) {
        return std::unexpected(make_selection_error("selection must be an object or null"));
    }
    if (auto it = payload.find("lassoPoints"); it != payload.end()) {
        return parse_lasso(*it);
    }
    if (auto it = payload.find("range"); it != payload.end()) {
        return parse_range(*it);
    }
    // Payloads without a shape (e.g. a click with no drag) select the whole canvas.
    return SelectionDescriptor{};
}

auto selectionToJson(SelectionDescriptor const& selection) -> json {
    return std::visit(
        [](auto const& shape) -> json {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, RectDescriptor>) {
                return json{{"range", {{"x", {shape.x0, shape.x1}}, {"y", {shape.y0, shape.y1}}}}};
            } else {
                json xs = json::array();
                json ys = json::array();
                for (auto const& point : shape.points) {
                    xs.push_back(point.x);
                    ys.push_back(point.y);
                }
                return json{{"lassoPoints", {{"x", std::move(xs)}, {"y", std::move(ys)}}}};
            }
        },
        selection);
}

auto validateSelection(SelectionDescriptor const& selection) -> Expected<void> {
    if (auto const* rect = std::get_if<RectDescriptor>(&selection)) {
        return validate_rect(*rect);
    }
    if (auto const* lasso = std::get_if<LassoDescriptor>(&selection)) {
        return validate_lasso(*lasso);
    }
    return {};
}

auto resolveRect(RectDescriptor const& rect, std::uint32_t width, std::uint32_t height) -> Expected<PixelRect> {
    if (auto valid = validate_rect(rect); !valid) {
        return std::unexpected(valid.error());
    }
    auto const xa = to_pixel(rect.x0);
    auto const xb = to_pixel(rect.x1);
    auto const ya = to_pixel(rect.y0);
    auto const yb = to_pixel(rect.y1);
    auto const h  = static_cast<std::int64_t>(height);

    PixelRect resolved;
    resolved.left   = clamp_to(std::min(xa, xb), width);
    resolved.right  = clamp_to(std::max(xa, xb), width);
    resolved.top    = clamp_to(h - std::max(ya, yb), height);
    resolved.bottom = clamp_to(h - std::min(ya, yb), height);
    return resolved;
}

auto rasterizeLasso(LassoDescriptor const& lasso, std::uint32_t width, std::uint32_t height)
    -> Expected<SelectionMask> {
    if (auto valid = validate_lasso(lasso); !valid) {
        return std::unexpected(valid.error());
    }
    SelectionMask mask;
    mask.width  = width;
    mask.height = height;
    mask.bits.assign(static_cast<std::size_t>(width) * height, 0);
    if (lasso.points.size() < 3 || width == 0 || height == 0) {
        return mask;
    }

    struct Vertex {
        double x;
        double y;
    };
    std::vector<Vertex> vertices;
    vertices.reserve(lasso.points.size());
    auto const h = static_cast<double>(height);
    for (auto const& point : lasso.points) {
        vertices.push_back(Vertex{std::clamp(point.x, -kCoordinateLimit, kCoordinateLimit),
                                  std::clamp(h - point.y, -kCoordinateLimit, kCoordinateLimit)});
    }

    std::vector<double> crossings;
    crossings.reserve(vertices.size());
    for (std::uint32_t row = 0; row < height; ++row) {
        double const cy = static_cast<double>(row) + 0.5;
        crossings.clear();
        for (std::size_t i = 0, j = vertices.size() - 1; i < vertices.size(); j = i++) {
            auto const& a = vertices[j];
            auto const& b = vertices[i];
            if ((a.y > cy) == (b.y > cy))
                continue;
            crossings.push_back(a.x + (cy - a.y) * (b.x - a.x) / (b.y - a.y));
        }
        std::sort(crossings.begin(), crossings.end());

        // Even-odd: pixel centres between crossing 2k and 2k+1 are inside.
        for (std::size_t k = 0; k + 1 < crossings.size(); k += 2) {
            auto const start = std::clamp(std::ceil(crossings[k] - 0.5), 0.0, static_cast<double>(width));
            auto const end   = std::clamp(std::ceil(crossings[k + 1] - 0.5), 0.0, static_cast<double>(width));
            auto*      base  = mask.bits.data() + static_cast<std::size_t>(row) * width;
            for (auto x = static_cast<std::uint32_t>(start); x < static_cast<std::uint32_t>(end); ++x) {
                base[x] = 1;
            }
        }
    }
    return mask;
}

auto resolveSelection(SelectionDescriptor const& selection, std::uint32_t width, std::uint32_t height)
    -> Expected<ResolvedRegion> {
    if (auto const* rect = std::get_if<RectDescriptor>(&selection)) {
        auto resolved = resolveRect(*rect, width, height);
        if (!resolved) {
            return std::unexpected(resolved.error());
        }
        return ResolvedRegion{*resolved};
    }
    if (auto const* lasso = std::get_if<LassoDescriptor>(&selection)) {
        auto mask = rasterizeLasso(*lasso, width, height);
        if (!mask) {
            return std::unexpected(mask.error());
        }
        return ResolvedRegion{std::move(*mask)};
    }
    return ResolvedRegion::fullCanvas(width, height);
}

} // namespace RT::Region
