#include <doctest/doctest.h>
#include <dfy/resolver.hpp>

#include <map>
#include <string>
#include <vector>

using namespace dfy;

namespace {

Stage producer(const std::string& workdir = "/go/src") {
    Stage stage;
    stage.from = "busybox";
    stage.workdir = workdir;
    return stage;
}

Stage consumer(const Values& copy) {
    Stage stage;
    stage.from = "busybox";
    stage.copy = copy;
    return stage;
}

// Resolves every named stage then the final one; returns the first error
Result<void> resolve_all(const std::map<std::string, Stage>& stages,
                         const Stage& final_stage,
                         ResolutionTable& table) {
    for (const auto& [name, stage] : stages) {
        auto r = resolve_stage(name, stage, stages, table);
        if (r.isErr()) return r;
    }
    return resolve_stage(kFinalStage, final_stage, stages, table);
}

} // namespace

// ============================================================================
// Copy sources
// ============================================================================

TEST_CASE("parse_copy_source splits on the first colon") {
    auto ref = parse_copy_source("builder:./a.txt");
    REQUIRE(ref.has_value());
    CHECK(ref->stage == "builder");
    CHECK(ref->path == "./a.txt");

    auto nested = parse_copy_source("a:b:c");
    REQUIRE(nested.has_value());
    CHECK(nested->stage == "a");
    CHECK(nested->path == "b:c");
}

TEST_CASE("parse_copy_source ignores local sources") {
    CHECK_FALSE(parse_copy_source("local.txt").has_value());
    CHECK_FALSE(parse_copy_source("./dir/").has_value());
}

TEST_CASE("cross_stage_source joins the producer workdir") {
    CHECK(cross_stage_source("builder", "/go/src", "./a.txt") == "--from=builder /go/src/a.txt");
    CHECK(cross_stage_source("b", "/go/src/", "../bin/app") == "--from=b /go/bin/app");
}

// ============================================================================
// resolve_stage
// ============================================================================

TEST_CASE("resolve_stage records rewrite, dependents and dependencies") {
    std::map<std::string, Stage> stages = {{"builder", producer()}};
    Stage final_stage = consumer({{"builder:./a.txt", "./"}, {"local.txt", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());

    CHECK(table.final_stage.copy_rewrites.size() == 1);
    CHECK(table.final_stage.copy_rewrites.at("builder:./a.txt") == "--from=builder /go/src/a.txt");
    CHECK(table.final_stage.dependencies == std::set<std::string>{"builder"});
    CHECK(table.stages.at("builder").dependents == std::set<std::string>{kFinalStage});
    CHECK(table.stages.at("builder").copy_rewrites.empty());
}

TEST_CASE("repeated references from one consumer count once") {
    std::map<std::string, Stage> stages = {{"builder", producer()}};
    Stage final_stage = consumer({{"builder:./a.txt", "./"}, {"builder:./b.txt", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());

    CHECK(table.stages.at("builder").dependents.size() == 1);
    CHECK(table.final_stage.copy_rewrites.size() == 2);
}

TEST_CASE("reference to an unknown stage fails with MISSING_STAGE") {
    std::map<std::string, Stage> stages = {{"builder", producer()}};
    Stage final_stage = consumer({{"nosuch:./a.txt", "./"}});

    ResolutionTable table;
    auto result = resolve_all(stages, final_stage, table);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::MISSING_STAGE);
    CHECK(result.error().message() == "missing stage nosuch");
}

TEST_CASE("reference to a stage without workdir fails with MISSING_WORKDIR") {
    std::map<std::string, Stage> stages = {{"builder", producer("")}};
    Stage final_stage = consumer({{"builder:./a.txt", "./"}});

    ResolutionTable table;
    auto result = resolve_all(stages, final_stage, table);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::MISSING_WORKDIR);
    CHECK(result.error().message() == "stage builder must define workdir for copy file");
}

TEST_CASE("local copies leave other stages untouched") {
    std::map<std::string, Stage> stages = {{"builder", producer()}};
    Stage final_stage = consumer({{"local.txt", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());
    CHECK(table.stages.at("builder").dependents.empty());
    CHECK(table.final_stage.copy_rewrites.empty());
}

TEST_CASE("ResolutionTable::find distinguishes final and named stages") {
    ResolutionTable table;
    table.of("builder").dependents.insert("x");
    REQUIRE(table.find("builder") != nullptr);
    CHECK(table.find("builder")->dependents.size() == 1);
    CHECK(table.find(kFinalStage) == &table.final_stage);
    CHECK(table.find("other") == nullptr);
}

// ============================================================================
// order_stages
// ============================================================================

TEST_CASE("stages with more dependents come first") {
    std::map<std::string, Stage> stages = {
        {"alpha", producer()},
        {"beta", producer()},
        {"gamma", consumer({{"beta:./x", "./"}})},
    };
    stages["gamma"].workdir = "/g";
    Stage final_stage = consumer({{"alpha:./a", "./"}, {"beta:./b", "./"}, {"gamma:./c", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());

    auto order = order_stages(table);
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"beta", "alpha", "gamma"});
}

TEST_CASE("equal dependent counts fall back to name order") {
    std::map<std::string, Stage> stages = {
        {"zeta", producer()},
        {"eta", producer()},
        {"unused", producer()},
    };
    Stage final_stage = consumer({{"zeta:./z", "./"}, {"eta:./e", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());

    auto order = order_stages(table);
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"eta", "zeta", "unused"});
}

TEST_CASE("producers precede consumers along deeper chains") {
    std::map<std::string, Stage> stages = {
        {"a", consumer({{"b:./out", "./"}})},
        {"b", consumer({{"c:./out", "./"}})},
        {"c", producer()},
    };
    stages["a"].workdir = "/a";
    stages["b"].workdir = "/b";
    Stage final_stage = consumer({{"a:./out", "./"}});

    ResolutionTable table;
    REQUIRE(resolve_all(stages, final_stage, table).isOk());

    auto order = order_stages(table);
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("cyclic references fail with STAGE_CYCLE") {
    std::map<std::string, Stage> stages = {
        {"a", consumer({{"b:./out", "./"}})},
        {"b", consumer({{"a:./out", "./"}})},
        {"c", producer()},
    };
    stages["a"].workdir = "/a";
    stages["b"].workdir = "/b";

    ResolutionTable table;
    REQUIRE(resolve_all(stages, Stage{}, table).isOk());

    auto order = order_stages(table);
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::STAGE_CYCLE);
    const std::string& message = order.error().message();
    REQUIRE(message.size() > 4);
    CHECK(message.substr(message.size() - 4) == "a, b");
}

TEST_CASE("a stage copying from itself is a cycle") {
    std::map<std::string, Stage> stages = {{"self", consumer({{"self:./x", "./y"}})}};
    stages["self"].workdir = "/s";

    ResolutionTable table;
    REQUIRE(resolve_all(stages, Stage{}, table).isOk());
    CHECK(order_stages(table).isErr());
}
