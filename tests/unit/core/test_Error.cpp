#include <retrace/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace RT;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError); i <= static_cast<int>(Error::Code::MalformedInput);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::InvalidSelection, "bad"};
        CHECK(describeError(withMsg) == "invalid_selection:bad");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Action index annotation") {
        auto annotated = withActionIndex(Error{Error::Code::UnknownOperation, "nope"}, 3);
        REQUIRE(annotated.actionIndex.has_value());
        CHECK(*annotated.actionIndex == 3);
        CHECK(describeError(annotated) == "unknown_operation[action 3]:nope");

        // The innermost index wins.
        auto reannotated = withActionIndex(annotated, 7);
        CHECK(*reannotated.actionIndex == 3);
    }
}
