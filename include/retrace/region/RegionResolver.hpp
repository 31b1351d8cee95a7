#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/region/Selection.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>

namespace RT::Region {

/*
 * Region resolution turns the selection a user drew in the viewer into the
 * pixels an action is allowed to touch.
 *
 * Wire shapes accepted by parseSelection (the viewer's selection payload):
 *   null / {}                                  -> whole canvas
 *   {"range": {"x": [x0, x1], "y": [y0, y1]}}  -> box selection
 *   {"lassoPoints": {"x": [...], "y": [...]}}  -> free-form polygon
 * A payload carrying both forms is treated as a lasso.
 *
 * Display coordinates have their vertical axis inverted relative to buffer
 * rows, so both shapes are flipped with y' = height - y when resolved.
 * Polygons are filled with the even-odd rule, sampling pixel centres.
 */

[[nodiscard]] auto parseSelection(nlohmann::json const& payload) -> Expected<SelectionDescriptor>;
[[nodiscard]] auto selectionToJson(SelectionDescriptor const& selection) -> nlohmann::json;

// Structural check only (finite coordinates, paired lasso vectors); never looks at a canvas.
[[nodiscard]] auto validateSelection(SelectionDescriptor const& selection) -> Expected<void>;

[[nodiscard]] auto resolveSelection(SelectionDescriptor const& selection,
                                    std::uint32_t width,
                                    std::uint32_t height) -> Expected<ResolvedRegion>;

[[nodiscard]] auto resolveRect(RectDescriptor const& rect, std::uint32_t width, std::uint32_t height)
    -> Expected<PixelRect>;
[[nodiscard]] auto rasterizeLasso(LassoDescriptor const& lasso, std::uint32_t width, std::uint32_t height)
    -> Expected<SelectionMask>;

} // namespace RT::Region
