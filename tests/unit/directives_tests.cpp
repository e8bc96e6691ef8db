#include <doctest/doctest.h>
#include <dfy/directives.hpp>
#include <dfy/encoder.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace dfy;

TEST_CASE("stage directives follow declaration order") {
    std::vector<std::string> keywords;
    for (const auto& directive : stage_directives()) {
        keywords.push_back(directive.keyword);
    }

    std::vector<std::string> expected = {
        "FROM", "LABEL", "WORKDIR", "ENV", "ADD", "COPY",
        "RUN", "EXPOSE", "VOLUME", "ENTRYPOINT", "CMD"
    };
    CHECK(keywords == expected);
}

TEST_CASE("every stage directive is well formed") {
    for (const auto& directive : stage_directives()) {
        CAPTURE(directive.keyword);
        CHECK_NOTHROW(validate_directive(directive));
    }
}

TEST_CASE("directive flags per field") {
    REQUIRE(find_directive("from") != nullptr);
    CHECK(find_directive("from")->has_flag(FLAG_INLINE));
    CHECK(find_directive("label")->has_flag(FLAG_MULTI));
    CHECK(find_directive("env")->has_flag(FLAG_MULTI));
    CHECK(find_directive("add")->has_flag(FLAG_JOIN));
    CHECK(find_directive("copy")->flags == FLAG_NONE);
    CHECK(find_directive("run")->has_flag(FLAG_SCRIPT));
    CHECK(find_directive("expose")->flags == FLAG_NONE);
    CHECK(find_directive("volume")->has_flag(FLAG_ARRAY));
    CHECK(find_directive("entrypoint")->has_flag(FLAG_ARRAY));
    CHECK(find_directive("cmd")->has_flag(FLAG_ARRAY));
    CHECK(find_directive("workdir")->shape == FieldShape::Scalar);
}

TEST_CASE("find_directive returns nullptr for unknown fields") {
    CHECK(find_directive("ports") == nullptr);
    CHECK(find_directive("") == nullptr);
    CHECK(find_directive("FROM") == nullptr);
}

TEST_CASE("flags that do not fit the shape are a programming error") {
    DirectiveField bad{"run", "RUN", FieldShape::Sequence, FLAG_MULTI, nullptr, &Stage::run, nullptr};
    CHECK_THROWS_AS(validate_directive(bad), std::logic_error);

    Stage stage;
    stage.run = {"make"};
    CHECK_THROWS_AS(format_directive(bad, stage), std::logic_error);
}

TEST_CASE("accessor that does not match the shape is a programming error") {
    DirectiveField bad{"from", "FROM", FieldShape::Mapping, FLAG_NONE, &Stage::from, nullptr, nullptr};
    CHECK_THROWS_AS(validate_directive(bad), std::logic_error);
}

TEST_CASE("alternative renderings cannot be combined") {
    DirectiveField bad{"cmd", "CMD", FieldShape::Sequence, FLAG_ARRAY | FLAG_SCRIPT,
                       nullptr, &Stage::cmd, nullptr};
    CHECK_THROWS_AS(validate_directive(bad), std::logic_error);
}
