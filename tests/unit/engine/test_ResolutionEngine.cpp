#include <retrace/cache/MemoryCacheBackend.hpp>
#include <retrace/engine/ResolutionEngine.hpp>
#include <retrace/history/ActionStack.hpp>
#include <retrace/ops/PixelOperationAdapter.hpp>

#include "unit/RetraceTestHelper.hpp"

#include <doctest/doctest.h>

#include <thread>
#include <vector>

using namespace RT;
using namespace RT::Engine;
using History::Action;
using namespace std::chrono_literals;

namespace {

auto make_action(Expected<Action> action) -> Action {
    REQUIRE(action.has_value());
    return *action;
}

// Adds latency in front of the pixel adapter so computations overlap.
class SlowAdapter final : public Ops::OperationAdapter {
public:
    auto apply(ImageBuffer const& input, Region::ResolvedRegion const& region, Ops::Operation const& operation)
        -> Expected<ImageBuffer> override {
        std::this_thread::sleep_for(delay);
        return inner.apply(input, region, operation);
    }

    std::chrono::milliseconds  delay{50};
    Ops::PixelOperationAdapter inner;
};

// Returns a buffer of the wrong size.
class ShrinkingAdapter final : public Ops::OperationAdapter {
public:
    auto apply(ImageBuffer const& input, Region::ResolvedRegion const&, Ops::Operation const&)
        -> Expected<ImageBuffer> override {
        return makeSolidBuffer(input.width / 2, input.height / 2, 0, 0, 0);
    }
};

struct Fixture {
    Fixture()
        : backend(std::make_shared<Cache::MemoryCacheBackend>()),
          cache(std::make_shared<Cache::ReplayCache>(backend)),
          adapter(std::make_shared<Ops::PixelOperationAdapter>()),
          engine(cache, adapter) {}

    auto source(BufferPtr buffer, std::string session = "s1") const -> SourceImage {
        return SourceImage{std::move(session), "sig", std::move(buffer)};
    }

    std::shared_ptr<Cache::MemoryCacheBackend>  backend;
    std::shared_ptr<Cache::ReplayCache>         cache;
    std::shared_ptr<Ops::PixelOperationAdapter> adapter;
    ResolutionEngine                            engine;
};

} // namespace

TEST_SUITE("engine.resolution") {
    TEST_CASE("The empty stack resolves to the source buffer") {
        Fixture f;
        auto    source = Test::share(Test::makePatternBuffer(8, 8));
        auto    result = f.engine.resolve(f.source(source), {});
        REQUIRE(result.has_value());
        CHECK(result->buffer == source);
        CHECK(result->prefixLength == 0);
        CHECK(result->computedPrefixes == 0);
        CHECK(f.adapter->invocations() == 0);
    }

    TEST_CASE("Filter then enhancement on a sub-rectangle") {
        Fixture f;
        auto    source  = Test::share(makeSolidBuffer(64, 64, 100, 100, 100));
        Region::RectDescriptor const topLeft{0, 32, 32, 64};
        std::vector<Action>    actions{make_action(Action::filter("blur", topLeft)),
                                    make_action(Action::enhance("brightness", 1.5, topLeft))};

        auto result = f.engine.resolve(f.source(source), actions);
        REQUIRE(result.has_value());
        CHECK(result->computedPrefixes == 2);
        auto const& out = *result->buffer;
        for (std::uint32_t y = 0; y < 64; ++y) {
            for (std::uint32_t x = 0; x < 64; ++x) {
                auto const* px       = out.at(x, y);
                auto const  expected = (x < 32 && y < 32) ? 150 : 100;
                CHECK(px[0] == expected);
                CHECK(px[3] == 255);
            }
        }
    }

    TEST_CASE("Resolving twice computes nothing the second time") {
        Fixture f;
        auto    source = Test::share(Test::makePatternBuffer(16, 16));
        std::vector<Action> actions{make_action(Action::filter("sharpen")),
                                    make_action(Action::filter("emboss")),
                                    make_action(Action::enhance("contrast", 0.5))};

        auto first = f.engine.resolve(f.source(source), actions);
        REQUIRE(first.has_value());
        CHECK(f.adapter->invocations() == 3);

        auto second = f.engine.resolve(f.source(source), actions);
        REQUIRE(second.has_value());
        CHECK(second->computedPrefixes == 0);
        CHECK(f.adapter->invocations() == 3);
        CHECK(*second->buffer == *first->buffer);
    }

    TEST_CASE("Clearing the cache does not change results") {
        Fixture f;
        auto    source = Test::share(Test::makePatternBuffer(20, 20));
        std::vector<Action> actions{make_action(Action::filter("edge_enhance_more")),
                                    make_action(Action::enhance("sharpness", 0.3, Region::RectDescriptor{3, 17, 2, 9}))};

        auto before = f.engine.resolve(f.source(source), actions);
        REQUIRE(before.has_value());
        REQUIRE(f.cache->clear().has_value());
        auto after = f.engine.resolve(f.source(source), actions);
        REQUIRE(after.has_value());
        CHECK(after->computedPrefixes == 2);
        CHECK(after->buffer != before->buffer);
        CHECK(*after->buffer == *before->buffer);
    }

    TEST_CASE("Caching is transparent") {
        auto source = Test::share(Test::makePatternBuffer(24, 12));
        std::vector<Action> actions{make_action(Action::filter("smooth_more", Region::RectDescriptor{2, 20, 1, 11})),
                                    make_action(Action::filter("find_edges")),
                                    make_action(Action::enhance("color", 0.2,
                                                                Region::LassoDescriptor{{{1, 1}, {20, 2}, {10, 11}}}))};

        Fixture warm;
        REQUIRE(warm.engine.resolvePrefix(warm.source(source), actions, 1).has_value());
        auto viaCache = warm.engine.resolve(warm.source(source), actions);
        REQUIRE(viaCache.has_value());
        CHECK(viaCache->computedPrefixes == 2);

        Fixture cold;
        auto    direct = cold.engine.resolve(cold.source(source), actions);
        REQUIRE(direct.has_value());
        CHECK(*viaCache->buffer == *direct->buffer);

        // Applying the actions by hand gives the same pixels.
        Ops::PixelOperationAdapter manual;
        ImageBuffer                current = *source;
        for (auto const& action : actions) {
            auto region = Region::resolveSelection(action.selection(), current.width, current.height);
            REQUIRE(region.has_value());
            auto next = manual.apply(current, *region, action.operation());
            REQUIRE(next.has_value());
            current = std::move(*next);
        }
        CHECK(current == *direct->buffer);
    }

    TEST_CASE("Undo is a prefix lookup") {
        Fixture f;
        auto    source = Test::share(Test::makePatternBuffer(16, 16));
        History::ActionStack stack;
        stack.append(make_action(Action::filter("detail")));
        stack.append(make_action(Action::filter("contour")));

        auto full = f.engine.resolve(f.source(source), stack.actions());
        REQUIRE(full.has_value());
        auto const calls = f.adapter->invocations();

        REQUIRE(stack.truncate(1).has_value());
        auto undone = f.engine.resolve(f.source(source), stack.actions());
        REQUIRE(undone.has_value());
        CHECK(undone->computedPrefixes == 0);
        CHECK(f.adapter->invocations() == calls);

        auto earlier = f.engine.resolvePrefix(f.source(source), stack.actions(), 1);
        REQUIRE(earlier.has_value());
        CHECK(earlier->buffer == undone->buffer);
    }

    TEST_CASE("Different sessions and signatures do not share entries") {
        Fixture f;
        auto    source  = Test::share(Test::makePatternBuffer(8, 8));
        std::vector<Action> actions{make_action(Action::filter("blur"))};

        REQUIRE(f.engine.resolve(f.source(source, "a"), actions).has_value());
        REQUIRE(f.engine.resolve(f.source(source, "b"), actions).has_value());
        CHECK(f.adapter->invocations() == 2);

        auto key = ResolutionEngine::keyFor(f.source(source, "a"), "digest");
        CHECK(key.str() == "a/sig/digest");
    }

    TEST_CASE("Out of range prefixes and missing sources") {
        Fixture f;
        auto    source = Test::share(Test::makePatternBuffer(8, 8));
        std::vector<Action> actions{make_action(Action::filter("blur"))};

        auto tooLong = f.engine.resolvePrefix(f.source(source), actions, 2);
        REQUIRE_FALSE(tooLong.has_value());
        CHECK(tooLong.error().code == Error::Code::OutOfRange);

        auto noSource = f.engine.resolve(f.source(nullptr), actions);
        REQUIRE_FALSE(noSource.has_value());
        CHECK(noSource.error().code == Error::Code::ValidationError);
    }

    TEST_CASE("Adapter errors carry the failing action index and are not cached") {
        auto backend = std::make_shared<Cache::MemoryCacheBackend>();
        auto cache   = std::make_shared<Cache::ReplayCache>(backend);
        ResolutionEngine engine{cache, std::make_shared<ShrinkingAdapter>()};
        auto             source = Test::share(Test::makePatternBuffer(8, 8));
        std::vector<Action> actions{make_action(Action::filter("blur", Region::RectDescriptor{0, 0, 0, 0})),
                                    make_action(Action::filter("blur"))};

        // The first action selects nothing but the adapter still returns a wrong size.
        auto result = engine.resolve(SourceImage{"s", "sig", source}, actions);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ValidationError);
        REQUIRE(result.error().actionIndex.has_value());
        CHECK(*result.error().actionIndex == 0);
        CHECK(backend->stats().entries == 0);
        CHECK(cache->stats().computeFailures >= 1);
    }

    TEST_CASE("Concurrent resolutions of one stack apply each action once") {
        auto backend = std::make_shared<Cache::MemoryCacheBackend>();
        auto cache   = std::make_shared<Cache::ReplayCache>(backend);
        auto slow    = std::make_shared<SlowAdapter>();
        ResolutionEngine engine{cache, slow};
        auto             source = Test::share(Test::makePatternBuffer(16, 16));
        std::vector<Action> actions{make_action(Action::filter("blur")),
                                    make_action(Action::filter("sharpen")),
                                    make_action(Action::enhance("sharpness", 2.0))};

        constexpr int            threads = 6;
        std::vector<std::thread> workers;
        std::vector<BufferPtr>   results(threads);
        for (int i = 0; i < threads; ++i) {
            workers.emplace_back([&, i] {
                auto result = engine.resolve(SourceImage{"s", "sig", source}, actions);
                if (result) {
                    results[static_cast<std::size_t>(i)] = result->buffer;
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        CHECK(slow->inner.invocations() == actions.size());
        for (auto const& result : results) {
            REQUIRE(result);
            CHECK(*result == *results.front());
        }
    }

    TEST_CASE("Failed cache writes surface as warnings") {
        auto backend = std::make_shared<Test::FlakyBackend>();
        backend->failWrites = true;
        auto cache   = std::make_shared<Cache::ReplayCache>(backend);
        ResolutionEngine engine{cache, std::make_shared<Ops::PixelOperationAdapter>()};
        auto             source = Test::share(Test::makePatternBuffer(8, 8));
        std::vector<Action> actions{make_action(Action::filter("blur")), make_action(Action::filter("detail"))};

        auto result = engine.resolve(SourceImage{"s", "sig", source}, actions);
        REQUIRE(result.has_value());
        REQUIRE(result->warnings.size() == 2);
        CHECK(result->warnings[0].code == Error::Code::CacheBackendError);
        CHECK(result->warnings.back().actionIndex.value_or(99) == 1);
    }
}
