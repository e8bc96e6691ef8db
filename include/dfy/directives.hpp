#pragma once

#include "dfy/types.hpp"

#include <string>
#include <vector>

namespace dfy {

// ============================================================================
// Directive Table
// ============================================================================

enum class FieldShape {
    Scalar,    // std::string
    Sequence,  // std::vector<std::string>
    Mapping    // Values
};

enum DirectiveFlag : unsigned {
    FLAG_NONE = 0,
    FLAG_INLINE = 1u << 0,  // scalar emitted verbatim, never quoted
    FLAG_ARRAY = 1u << 1,   // sequence emitted as one JSON array literal
    FLAG_SCRIPT = 1u << 2,  // sequence joined with " && "
    FLAG_MULTI = 1u << 3,   // mapping emitted as key=value pairs on one line
    FLAG_JOIN = 1u << 4,    // mapping grouped by destination value
};

// One Stage field and how it becomes a directive. Exactly one of the member
// pointers is set, matching `shape`.
struct DirectiveField {
    const char* field;    // input key, e.g. "workdir"
    const char* keyword;  // directive, e.g. "WORKDIR"
    FieldShape shape;
    unsigned flags;

    std::string Stage::*scalar;
    std::vector<std::string> Stage::*sequence;
    Values Stage::*mapping;

    bool has_flag(DirectiveFlag flag) const { return (flags & flag) != 0; }
};

// Stage fields in emission order
const std::vector<DirectiveField>& stage_directives();

// Look up a table entry by input key; nullptr if unknown
const DirectiveField* find_directive(const std::string& field);

// Throws std::logic_error if the entry's accessor or flags do not fit its shape
void validate_directive(const DirectiveField& directive);

const char* field_shape_to_string(FieldShape shape);

} // namespace dfy
