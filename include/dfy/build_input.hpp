#pragma once

#include "dfy/error.hpp"
#include "dfy/types.hpp"

#include <string>
#include <vector>

namespace dfy {

// ============================================================================
// Build Description Input
// ============================================================================

struct BuildInputParseResult {
    bool ok = false;
    std::string error;
    ErrorCode error_code = ErrorCode::INPUT_INVALID;
    BuildDescription description;
    std::vector<std::string> warnings;
};

// Parse a build description from JSON content.
// Top level: "image", "stages" and the final stage's fields; each entry of
// "stages" is an object of stage fields ("from", "workdir", "copy", ...).
BuildInputParseResult parse_build_input(const std::string& json_content);

} // namespace dfy
