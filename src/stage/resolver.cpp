#include "dfy/resolver.hpp"
#include "dfy/path_utils.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace dfy {

// ============================================================================
// ResolutionTable
// ============================================================================

StageResolution& ResolutionTable::of(const std::string& name) {
    if (name == kFinalStage) {
        return final_stage;
    }
    return stages[name];
}

const StageResolution* ResolutionTable::find(const std::string& name) const {
    if (name == kFinalStage) {
        return &final_stage;
    }
    auto it = stages.find(name);
    return it == stages.end() ? nullptr : &it->second;
}

// ============================================================================
// Copy Sources
// ============================================================================

std::optional<CopySource> parse_copy_source(const std::string& source) {
    auto colon = source.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return CopySource{source.substr(0, colon), source.substr(colon + 1)};
}

std::string cross_stage_source(const std::string& stage, const std::string& workdir,
                               const std::string& path) {
    return "--from=" + stage + " " + join_path(workdir, path);
}

Result<void> resolve_stage(const std::string& name,
                           const Stage& stage,
                           const std::map<std::string, Stage>& stages,
                           ResolutionTable& table) {
    // Register the stage even when it copies nothing so ordering sees it
    StageResolution& own = table.of(name);

    // Sorted so the first reported error does not depend on hashing
    std::vector<std::string> sources;
    for (const auto& [source, _] : stage.copy) {
        sources.push_back(source);
    }
    std::sort(sources.begin(), sources.end());

    for (const auto& source : sources) {
        auto ref = parse_copy_source(source);
        if (!ref) {
            continue;
        }

        auto it = stages.find(ref->stage);
        if (it == stages.end()) {
            return Result<void>::err(Error(ErrorCode::MISSING_STAGE,
                "missing stage " + ref->stage));
        }
        if (it->second.workdir.empty()) {
            return Result<void>::err(Error(ErrorCode::MISSING_WORKDIR,
                "stage " + ref->stage + " must define workdir for copy file"));
        }

        table.of(ref->stage).dependents.insert(name);
        own.dependencies.insert(ref->stage);
        own.copy_rewrites[source] = cross_stage_source(ref->stage, it->second.workdir, ref->path);

        spdlog::debug("stage '{}' copies '{}' from stage '{}'", name, ref->path, ref->stage);
    }

    return Result<void>::ok();
}

// ============================================================================
// Ordering
// ============================================================================

Result<std::vector<std::string>> order_stages(const ResolutionTable& table) {
    auto before = [&table](const std::string& a, const std::string& b) {
        size_t da = table.stages.at(a).dependents.size();
        size_t db = table.stages.at(b).dependents.size();
        if (da != db) return da > db;
        return a < b;
    };

    // Number of producers each stage still waits for
    std::map<std::string, size_t> pending;
    std::vector<std::string> ready;
    for (const auto& [name, resolution] : table.stages) {
        pending[name] = resolution.dependencies.size();
        if (resolution.dependencies.empty()) {
            ready.push_back(name);
        }
    }

    std::vector<std::string> order;
    order.reserve(table.stages.size());

    while (!ready.empty()) {
        auto next = std::min_element(ready.begin(), ready.end(), before);
        std::string name = *next;
        ready.erase(next);
        order.push_back(name);

        for (const auto& consumer : table.stages.at(name).dependents) {
            auto it = pending.find(consumer);
            if (it == pending.end()) {
                continue;  // final stage
            }
            if (--it->second == 0) {
                ready.push_back(consumer);
            }
        }
    }

    if (order.size() != table.stages.size()) {
        std::string cycle;
        for (const auto& [name, count] : pending) {
            if (count > 0) {
                if (!cycle.empty()) cycle += ", ";
                cycle += name;
            }
        }
        return Result<std::vector<std::string>>::err(Error(ErrorCode::STAGE_CYCLE,
            "cannot order stages with cyclic copy references: " + cycle));
    }

    return Result<std::vector<std::string>>::ok(std::move(order));
}

} // namespace dfy
