#include <retrace/ops/PixelOperationAdapter.hpp>
#include <retrace/region/RegionResolver.hpp>

#include "unit/RetraceTestHelper.hpp"

#include <doctest/doctest.h>

#include <array>

using namespace RT;
using namespace RT::Ops;
using RT::Region::PixelRect;
using RT::Region::ResolvedRegion;

namespace {

auto rgb(ImageBuffer const& buffer, std::uint32_t x, std::uint32_t y) -> std::array<std::uint8_t, 4> {
    auto const* px = buffer.at(x, y);
    return {px[0], px[1], px[2], px[3]};
}

} // namespace

TEST_SUITE("ops.pixel") {
    TEST_CASE("Luma of grey is the grey level") {
        for (int c : {0, 1, 77, 128, 200, 255}) {
            auto const v = static_cast<std::uint8_t>(c);
            CHECK(luma(v, v, v) == v);
        }
        CHECK(luma(255, 0, 0) == 76);
    }

    TEST_CASE("Smoothing filters leave a solid colour unchanged") {
        auto solid = makeSolidBuffer(16, 16, 100, 150, 200);
        for (auto kind : {FilterKind::Blur, FilterKind::Smooth, FilterKind::SmoothMore, FilterKind::Sharpen,
                          FilterKind::Detail, FilterKind::EdgeEnhance, FilterKind::EdgeEnhanceMore}) {
            CHECK(applyFilter(solid, kind) == solid);
        }
        auto edges = applyFilter(solid, FilterKind::FindEdges);
        CHECK(rgb(edges, 8, 8) == std::array<std::uint8_t, 4>{0, 0, 0, 255});
        auto contour = applyFilter(solid, FilterKind::Contour);
        CHECK(rgb(contour, 3, 3) == std::array<std::uint8_t, 4>{255, 255, 255, 255});
    }

    TEST_CASE("Empty regions return the input unchanged") {
        PixelOperationAdapter adapter;
        auto                  input = Test::makePatternBuffer(12, 12);
        ResolvedRegion        empty{PixelRect{5, 0, 5, 12}};
        auto                  out = adapter.apply(input, empty, FilterOp{FilterKind::FindEdges});
        REQUIRE(out.has_value());
        CHECK(*out == input);
        CHECK(adapter.invocations() == 1);
    }

    TEST_CASE("Rectangle regions change only the selected pixels") {
        PixelOperationAdapter adapter;
        auto                  input  = Test::makePatternBuffer(20, 20);
        PixelRect const       rect{4, 6, 12, 14};
        auto                  out = adapter.apply(input, ResolvedRegion{rect}, FilterOp{FilterKind::Emboss});
        REQUIRE(out.has_value());
        REQUIRE(out->sameCanvas(input));

        bool anyChanged = false;
        for (std::uint32_t y = 0; y < 20; ++y) {
            for (std::uint32_t x = 0; x < 20; ++x) {
                if (!rect.contains(x, y)) {
                    CHECK(rgb(*out, x, y) == rgb(input, x, y));
                } else if (rgb(*out, x, y) != rgb(input, x, y)) {
                    anyChanged = true;
                }
            }
        }
        CHECK(anyChanged);
    }

    TEST_CASE("Mask regions composite through the mask") {
        PixelOperationAdapter adapter;
        auto                  input = Test::makePatternBuffer(10, 10);
        Region::LassoDescriptor lasso{{{2.0, 2.0}, {6.0, 2.0}, {6.0, 6.0}, {2.0, 6.0}}};
        auto                  region = Region::resolveSelection(lasso, 10, 10);
        REQUIRE(region.has_value());

        auto out = adapter.apply(input, *region, EnhanceOp{EnhanceKind::Brightness, 0.0});
        REQUIRE(out.has_value());
        for (std::uint32_t y = 0; y < 10; ++y) {
            for (std::uint32_t x = 0; x < 10; ++x) {
                if (region->contains(x, y)) {
                    CHECK(rgb(*out, x, y) == std::array<std::uint8_t, 4>{0, 0, 0, 255});
                } else {
                    CHECK(rgb(*out, x, y) == rgb(input, x, y));
                }
            }
        }
    }

    TEST_CASE("Enhancements") {
        PixelOperationAdapter adapter;
        auto                  full = ResolvedRegion::fullCanvas(4, 4);

        SUBCASE("Brightness scales towards black") {
            auto out = adapter.apply(makeSolidBuffer(4, 4, 100, 100, 100), full,
                                     EnhanceOp{EnhanceKind::Brightness, 1.5});
            REQUIRE(out.has_value());
            CHECK(*out == makeSolidBuffer(4, 4, 150, 150, 150));
        }
        SUBCASE("Factor one is the identity") {
            auto input = Test::makePatternBuffer(4, 4);
            for (auto kind : AllEnhancements) {
                auto out = adapter.apply(input, full, EnhanceOp{kind, 1.0});
                REQUIRE(out.has_value());
                CHECK(*out == input);
            }
        }
        SUBCASE("Color at zero produces grey") {
            auto out = adapter.apply(makeSolidBuffer(4, 4, 255, 0, 0), full, EnhanceOp{EnhanceKind::Color, 0.0});
            REQUIRE(out.has_value());
            CHECK(rgb(*out, 0, 0) == std::array<std::uint8_t, 4>{76, 76, 76, 255});
        }
        SUBCASE("Contrast at zero collapses to the mean luma") {
            ImageBuffer input = makeSolidBuffer(4, 4, 0, 0, 0);
            for (std::uint32_t x = 0; x < 4; ++x) {
                for (std::uint32_t y = 0; y < 2; ++y) {
                    auto* px = input.at(x, y);
                    px[0] = px[1] = px[2] = 200;
                }
            }
            auto out = adapter.apply(input, full, EnhanceOp{EnhanceKind::Contrast, 0.0});
            REQUIRE(out.has_value());
            CHECK(*out == makeSolidBuffer(4, 4, 100, 100, 100));
        }
    }

    TEST_CASE("Alpha passes through") {
        PixelOperationAdapter adapter;
        auto                  input = makeSolidBuffer(6, 6, 10, 20, 30, 77);
        auto out = adapter.apply(input, ResolvedRegion::fullCanvas(6, 6), FilterOp{FilterKind::FindEdges});
        REQUIRE(out.has_value());
        for (std::size_t i = 3; i < out->pixels.size(); i += ImageBuffer::Channels) {
            CHECK(out->pixels[i] == 77);
        }
    }

    TEST_CASE("Invalid inputs are rejected and still counted") {
        PixelOperationAdapter adapter;
        auto empty = adapter.apply(ImageBuffer{}, ResolvedRegion::fullCanvas(1, 1), FilterOp{FilterKind::Blur});
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::ValidationError);

        auto input    = makeSolidBuffer(4, 4, 1, 2, 3);
        auto tooLarge = adapter.apply(input, ResolvedRegion{PixelRect{0, 0, 8, 8}}, FilterOp{FilterKind::Blur});
        REQUIRE_FALSE(tooLarge.has_value());
        CHECK(tooLarge.error().code == Error::Code::ValidationError);

        auto badFactor = adapter.apply(input, ResolvedRegion::fullCanvas(4, 4), EnhanceOp{EnhanceKind::Color, 42.0});
        REQUIRE_FALSE(badFactor.has_value());
        CHECK(badFactor.error().code == Error::Code::ValidationError);

        CHECK(adapter.invocations() == 3);
        adapter.resetInvocations();
        CHECK(adapter.invocations() == 0);
    }

    TEST_CASE("Results are deterministic") {
        PixelOperationAdapter adapter;
        auto                  input  = Test::makePatternBuffer(16, 9);
        auto                  region = ResolvedRegion{PixelRect{1, 1, 15, 8}};
        for (auto kind : AllFilters) {
            auto a = adapter.apply(input, region, FilterOp{kind});
            auto b = adapter.apply(input, region, FilterOp{kind});
            REQUIRE(a.has_value());
            REQUIRE(b.has_value());
            CHECK(*a == *b);
        }
    }
}
