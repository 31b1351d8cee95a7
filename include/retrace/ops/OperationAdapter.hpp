#pragma once

#include <retrace/core/Error.hpp>
#include <retrace/image/ImageBuffer.hpp>
#include <retrace/ops/Operation.hpp>
#include <retrace/region/Selection.hpp>

namespace RT::Ops {

/**
 * Applies one filter or enhancement to a buffer, restricted to a resolved
 * region. Implementations are pure: the result depends only on the
 * arguments, has the input's dimensions, equals the input outside the
 * region, and equals the input everywhere when the region is empty.
 *
 * Implementations must be callable from several threads at once.
 */
class OperationAdapter {
public:
    virtual ~OperationAdapter() = default;

    [[nodiscard]] virtual auto apply(ImageBuffer const& input,
                                     Region::ResolvedRegion const& region,
                                     Operation const& operation) -> Expected<ImageBuffer> = 0;
};

} // namespace RT::Ops
