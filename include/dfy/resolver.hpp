#pragma once

#include "dfy/error.hpp"
#include "dfy/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dfy {

// ============================================================================
// Stage Resolution
// ============================================================================

// Name under which the final, unnamed stage appears in dependents sets
inline const std::string kFinalStage;

// Derived state for one stage, built during a single serialization call
struct StageResolution {
    std::set<std::string> dependents;    // stages copying from this one
    std::set<std::string> dependencies;  // stages this one copies from
    std::map<std::string, std::string> copy_rewrites;  // copy source -> "--from=..."
};

struct ResolutionTable {
    std::map<std::string, StageResolution> stages;  // named stages
    StageResolution final_stage;

    // Resolution of a named stage, or of the final stage for kFinalStage
    StageResolution& of(const std::string& name);
    const StageResolution* find(const std::string& name) const;
};

// A copy source of the form "<stage>:<path>"
struct CopySource {
    std::string stage;
    std::string path;
};

// Split a copy source on its first ':'. Returns nullopt for local sources.
std::optional<CopySource> parse_copy_source(const std::string& source);

// Builder-native cross-stage source, e.g. "--from=builder /go/src/a.txt"
std::string cross_stage_source(const std::string& stage, const std::string& workdir,
                               const std::string& path);

// Validate the stage's cross-stage copy sources against `stages` and record
// dependents, dependencies and rewrites in `table`.
// Errors: MISSING_STAGE, MISSING_WORKDIR
Result<void> resolve_stage(const std::string& name,
                           const Stage& stage,
                           const std::map<std::string, Stage>& stages,
                           ResolutionTable& table);

// Order named stages so every producer precedes its consumers. Among stages
// that are ready, more dependents go first, then ascending name.
// Errors: STAGE_CYCLE
Result<std::vector<std::string>> order_stages(const ResolutionTable& table);

} // namespace dfy
