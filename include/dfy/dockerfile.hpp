#pragma once

#include "dfy/error.hpp"
#include "dfy/resolver.hpp"
#include "dfy/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace dfy {

// ============================================================================
// Dockerfile Rendering
// ============================================================================

/**
 * @brief Position of one stage in the rendered Dockerfile
 */
struct StagePlan {
    std::string name;                       // empty for the final stage
    std::vector<std::string> dependents;    // sorted; "" marks the final stage
    std::vector<std::string> dependencies;  // sorted
};

/**
 * @brief Resolve every stage and return the ordered resolution table
 *
 * Named stages come first in emission order, the final stage last. The
 * description is only read.
 */
Result<ResolutionTable> resolve_description(const BuildDescription& description,
                                            std::vector<std::string>& order);

/**
 * @brief Resolve and order stages without emitting anything
 * @return One entry per named stage in emission order, then the final stage
 */
Result<std::vector<StagePlan>> plan_stages(const BuildDescription& description);

/**
 * @brief Write the Dockerfile for `description` to `out`
 *
 * All copy references are validated before the first line is written, so
 * resolution errors leave `out` untouched. A stream failure part-way through
 * may leave partial output; use render_dockerfile() when that matters.
 *
 * Errors: MISSING_STAGE, MISSING_WORKDIR, STAGE_CYCLE, INPUT_INVALID,
 * WRITE_FAILED
 */
Result<void> write_dockerfile(std::ostream& out, const BuildDescription& description);

/**
 * @brief Render the Dockerfile into a string (all-or-nothing)
 */
Result<std::string> render_dockerfile(const BuildDescription& description);

} // namespace dfy
