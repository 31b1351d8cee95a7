#include <retrace/region/RegionResolver.hpp>

#include <nlohmann/json.hpp>

#include <doctest/doctest.h>

#include <limits>

using namespace RT;
using namespace RT::Region;
using json = nlohmann::json;

namespace {

auto square_lasso() -> LassoDescriptor {
    return LassoDescriptor{{{2.0, 2.0}, {6.0, 2.0}, {6.0, 6.0}, {2.0, 6.0}}};
}

} // namespace

TEST_SUITE("region.resolver") {
    TEST_CASE("Rectangles flip from display to buffer rows") {
        auto rect = resolveRect(RectDescriptor{10, 50, 20, 80}, 100, 100);
        REQUIRE(rect.has_value());
        CHECK(rect->left == 10);
        CHECK(rect->right == 50);
        CHECK(rect->top == 20);
        CHECK(rect->bottom == 80);

        // A box hugging the bottom of the display is the last rows of the buffer.
        auto low = resolveRect(RectDescriptor{0, 100, 0, 10}, 100, 100);
        REQUIRE(low.has_value());
        CHECK(low->top == 90);
        CHECK(low->bottom == 100);
    }

    TEST_CASE("Rectangle bounds may arrive in either order and are clamped") {
        auto swapped = resolveRect(RectDescriptor{50, 10, 80, 20}, 100, 100);
        REQUIRE(swapped.has_value());
        CHECK(*swapped == PixelRect{10, 20, 50, 80});

        auto outside = resolveRect(RectDescriptor{-20, 500, -5, 1000}, 64, 32);
        REQUIRE(outside.has_value());
        CHECK(*outside == PixelRect{0, 0, 64, 32});

        auto fractional = resolveRect(RectDescriptor{1.9, 3.7, 0.0, 10.0}, 10, 10);
        REQUIRE(fractional.has_value());
        CHECK(fractional->left == 1);
        CHECK(fractional->right == 3);
    }

    TEST_CASE("Degenerate rectangles select nothing") {
        auto region = resolveSelection(RectDescriptor{5, 5, 0, 10}, 10, 10);
        REQUIRE(region.has_value());
        CHECK(region->empty());
        CHECK(region->pixelCount() == 0);

        auto offCanvas = resolveSelection(RectDescriptor{200, 300, 0, 10}, 10, 10);
        REQUIRE(offCanvas.has_value());
        CHECK(offCanvas->empty());
    }

    TEST_CASE("Lasso squares rasterize to the enclosed pixel centres") {
        auto mask = rasterizeLasso(square_lasso(), 10, 10);
        REQUIRE(mask.has_value());
        std::size_t count = 0;
        for (std::uint32_t y = 0; y < 10; ++y) {
            for (std::uint32_t x = 0; x < 10; ++x) {
                bool const expected = y >= 4 && y <= 7 && x >= 2 && x <= 5;
                CHECK(mask->test(x, y) == expected);
                count += mask->test(x, y) ? 1 : 0;
            }
        }
        CHECK(count == 16);

        auto region = resolveSelection(square_lasso(), 10, 10);
        REQUIRE(region.has_value());
        CHECK(region->isMask());
        CHECK(region->pixelCount() == 16);
        CHECK(region->bounds() == PixelRect{2, 4, 6, 8});
    }

    TEST_CASE("Lassos with fewer than three vertices select nothing") {
        for (auto points : {std::vector<DisplayPoint>{},
                            std::vector<DisplayPoint>{{1, 1}},
                            std::vector<DisplayPoint>{{1, 1}, {8, 8}}}) {
            auto region = resolveSelection(LassoDescriptor{points}, 10, 10);
            REQUIRE(region.has_value());
            CHECK(region->empty());
        }
    }

    TEST_CASE("Self-intersecting polygons use the even-odd rule") {
        // Outer square traversed, then an inner square: the ring between is inside, the hole is not.
        LassoDescriptor ring{{{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}, {3, 3}, {3, 7}, {7, 7}, {7, 3}, {3, 3}}};
        auto mask = rasterizeLasso(ring, 10, 10);
        REQUIRE(mask.has_value());
        CHECK(mask->test(1, 1));
        CHECK(mask->test(8, 5));
        CHECK_FALSE(mask->test(5, 5));
    }

    TEST_CASE("No selection means the whole canvas") {
        auto region = resolveSelection(SelectionDescriptor{}, 7, 3);
        REQUIRE(region.has_value());
        CHECK(region->isRect());
        CHECK(region->pixelCount() == 21);
        CHECK(region->contains(6, 2));
    }

    TEST_CASE("Non-finite coordinates are invalid selections") {
        auto const nan  = std::numeric_limits<double>::quiet_NaN();
        auto       rect = resolveSelection(RectDescriptor{0, nan, 0, 1}, 10, 10);
        REQUIRE_FALSE(rect.has_value());
        CHECK(rect.error().code == Error::Code::InvalidSelection);

        auto lasso = resolveSelection(LassoDescriptor{{{0, 0}, {nan, 1}, {2, 2}}}, 10, 10);
        REQUIRE_FALSE(lasso.has_value());
        CHECK(lasso.error().code == Error::Code::InvalidSelection);
    }

    TEST_CASE("Parsing viewer payloads") {
        SUBCASE("Null and shapeless payloads select everything") {
            CHECK(std::holds_alternative<std::monostate>(parseSelection(json(nullptr)).value()));
            CHECK(std::holds_alternative<std::monostate>(parseSelection(json::object()).value()));
        }
        SUBCASE("Range") {
            auto parsed = parseSelection(json::parse(R"({"range":{"x":[10,50],"y":[20,80]}})"));
            REQUIRE(parsed.has_value());
            CHECK(std::get<RectDescriptor>(*parsed) == RectDescriptor{10, 50, 20, 80});
        }
        SUBCASE("Lasso wins when both shapes are present") {
            auto parsed = parseSelection(json::parse(
                R"({"range":{"x":[0,1],"y":[0,1]},"lassoPoints":{"x":[2,6,6,2],"y":[2,2,6,6]}})"));
            REQUIRE(parsed.has_value());
            CHECK(std::get<LassoDescriptor>(*parsed) == square_lasso());
        }
        SUBCASE("Malformed payloads") {
            for (auto const* text : {R"({"range":{"x":[1,2,3],"y":[0,1]}})",
                                     R"({"range":{"x":[1,"a"],"y":[0,1]}})",
                                     R"({"lassoPoints":{"x":[1,2,3],"y":[1,2]}})",
                                     R"({"lassoPoints":{"x":[1,2,3]}})",
                                     R"([1,2])"}) {
                auto parsed = parseSelection(json::parse(text));
                REQUIRE_FALSE(parsed.has_value());
                CHECK(parsed.error().code == Error::Code::InvalidSelection);
            }
        }
        SUBCASE("Encoding is the inverse of parsing") {
            SelectionDescriptor selection = square_lasso();
            auto                reparsed  = parseSelection(selectionToJson(selection));
            REQUIRE(reparsed.has_value());
            CHECK(*reparsed == selection);
            CHECK(selectionToJson(SelectionDescriptor{}).is_null());
        }
    }
}
