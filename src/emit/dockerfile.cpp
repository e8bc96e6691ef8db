#include "dfy/dockerfile.hpp"
#include "dfy/encoder.hpp"

#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

namespace dfy {

namespace {

std::string describe_order(const std::vector<std::string>& order) {
    std::string result;
    for (const auto& name : order) {
        if (!result.empty()) result += ", ";
        result += name;
    }
    return result.empty() ? "(none)" : result;
}

} // namespace

Result<ResolutionTable> resolve_description(const BuildDescription& description,
                                            std::vector<std::string>& order) {
    ResolutionTable table;

    for (const auto& [name, stage] : description.stages) {
        if (name.empty()) {
            return Result<ResolutionTable>::err(Error(ErrorCode::INPUT_INVALID,
                "stage name must not be empty"));
        }

        auto resolved = resolve_stage(name, stage, description.stages, table);
        if (resolved.isErr()) {
            return Result<ResolutionTable>::err(resolved.error());
        }
    }

    auto resolved = resolve_stage(kFinalStage, description.stage, description.stages, table);
    if (resolved.isErr()) {
        return Result<ResolutionTable>::err(resolved.error());
    }

    auto ordered = order_stages(table);
    if (ordered.isErr()) {
        return Result<ResolutionTable>::err(ordered.error());
    }
    order = std::move(ordered.value());

    spdlog::debug("stage order: {}", describe_order(order));

    return Result<ResolutionTable>::ok(std::move(table));
}

Result<std::vector<StagePlan>> plan_stages(const BuildDescription& description) {
    std::vector<std::string> order;
    auto resolved = resolve_description(description, order);
    if (resolved.isErr()) {
        return Result<std::vector<StagePlan>>::err(resolved.error());
    }

    const ResolutionTable& table = resolved.value();

    auto plan_for = [](const std::string& name, const StageResolution& resolution) {
        StagePlan plan;
        plan.name = name;
        plan.dependents.assign(resolution.dependents.begin(), resolution.dependents.end());
        plan.dependencies.assign(resolution.dependencies.begin(), resolution.dependencies.end());
        return plan;
    };

    std::vector<StagePlan> plans;
    for (const auto& name : order) {
        plans.push_back(plan_for(name, table.stages.at(name)));
    }
    plans.push_back(plan_for(kFinalStage, table.final_stage));

    return Result<std::vector<StagePlan>>::ok(std::move(plans));
}

Result<void> write_dockerfile(std::ostream& out, const BuildDescription& description) {
    std::vector<std::string> order;
    auto resolved = resolve_description(description, order);
    if (resolved.isErr()) {
        return Result<void>::err(resolved.error());
    }

    const ResolutionTable& table = resolved.value();

    for (const auto& name : order) {
        auto encoded = encode_stage(out, name, description.stages.at(name), table.stages.at(name));
        if (encoded.isErr()) {
            return Result<void>::err(encoded.error().withContext("stage " + name));
        }
    }

    auto encoded = encode_stage(out, kFinalStage, description.stage, table.final_stage);
    if (encoded.isErr()) {
        return Result<void>::err(encoded.error().withContext("final stage"));
    }

    return Result<void>::ok();
}

Result<std::string> render_dockerfile(const BuildDescription& description) {
    std::ostringstream out;
    auto written = write_dockerfile(out, description);
    if (written.isErr()) {
        return Result<std::string>::err(written.error());
    }
    return Result<std::string>::ok(out.str());
}

} // namespace dfy
