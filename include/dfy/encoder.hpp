#pragma once

#include "dfy/directives.hpp"
#include "dfy/error.hpp"
#include "dfy/resolver.hpp"
#include "dfy/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace dfy {

// ============================================================================
// Value Formatting
// ============================================================================

// Double-quote with escapes when the value is empty or contains a space,
// otherwise return it unchanged.
std::string may_quote(const std::string& value);

// Always double-quote with escapes
std::string quote(const std::string& value);

// Builder-native list literal, e.g. ["sh","-c"]
std::string format_array(const std::vector<std::string>& values);

// ============================================================================
// Stage Encoding
// ============================================================================

// Tokens of every directive the field produces, in emission order. Empty
// fields produce nothing. FROM/COPY post-processing is not applied here.
std::vector<std::vector<std::string>> format_directive(const DirectiveField& directive,
                                                       const Stage& stage);

// Write one directive line per non-empty field of `stage`, in table order.
// `name` is empty for the final stage.
// Errors: WRITE_FAILED when the stream goes bad
Result<void> encode_stage(std::ostream& out,
                          const std::string& name,
                          const Stage& stage,
                          const StageResolution& resolution);

} // namespace dfy
