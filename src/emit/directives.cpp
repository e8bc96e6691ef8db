#include "dfy/directives.hpp"

#include <stdexcept>

namespace dfy {

namespace {

DirectiveField scalar_field(const char* field, const char* keyword, unsigned flags,
                            std::string Stage::*member) {
    return {field, keyword, FieldShape::Scalar, flags, member, nullptr, nullptr};
}

DirectiveField sequence_field(const char* field, const char* keyword, unsigned flags,
                              std::vector<std::string> Stage::*member) {
    return {field, keyword, FieldShape::Sequence, flags, nullptr, member, nullptr};
}

DirectiveField mapping_field(const char* field, const char* keyword, unsigned flags,
                             Values Stage::*member) {
    return {field, keyword, FieldShape::Mapping, flags, nullptr, nullptr, member};
}

} // namespace

const std::vector<DirectiveField>& stage_directives() {
    static const std::vector<DirectiveField> table = {
        scalar_field("from", "FROM", FLAG_INLINE, &Stage::from),
        mapping_field("label", "LABEL", FLAG_MULTI, &Stage::label),
        scalar_field("workdir", "WORKDIR", FLAG_NONE, &Stage::workdir),

        mapping_field("env", "ENV", FLAG_MULTI, &Stage::env),
        mapping_field("add", "ADD", FLAG_JOIN, &Stage::add),
        mapping_field("copy", "COPY", FLAG_NONE, &Stage::copy),
        sequence_field("run", "RUN", FLAG_SCRIPT, &Stage::run),

        sequence_field("expose", "EXPOSE", FLAG_NONE, &Stage::expose),
        sequence_field("volume", "VOLUME", FLAG_ARRAY, &Stage::volume),

        sequence_field("entrypoint", "ENTRYPOINT", FLAG_ARRAY, &Stage::entrypoint),
        sequence_field("cmd", "CMD", FLAG_ARRAY, &Stage::cmd),
    };
    return table;
}

const DirectiveField* find_directive(const std::string& field) {
    for (const auto& directive : stage_directives()) {
        if (field == directive.field) {
            return &directive;
        }
    }
    return nullptr;
}

void validate_directive(const DirectiveField& directive) {
    unsigned allowed = FLAG_NONE;
    bool accessor_ok = false;

    switch (directive.shape) {
        case FieldShape::Scalar:
            allowed = FLAG_INLINE;
            accessor_ok = directive.scalar && !directive.sequence && !directive.mapping;
            break;
        case FieldShape::Sequence:
            allowed = FLAG_ARRAY | FLAG_SCRIPT;
            accessor_ok = directive.sequence && !directive.scalar && !directive.mapping;
            break;
        case FieldShape::Mapping:
            allowed = FLAG_MULTI | FLAG_JOIN;
            accessor_ok = directive.mapping && !directive.scalar && !directive.sequence;
            break;
    }

    std::string name = directive.keyword ? directive.keyword : "<unnamed>";

    if (!accessor_ok) {
        throw std::logic_error("directive " + name + ": accessor does not match " +
                               field_shape_to_string(directive.shape) + " shape");
    }
    if ((directive.flags & ~allowed) != 0) {
        throw std::logic_error("directive " + name + ": unsupported flags for " +
                               field_shape_to_string(directive.shape) + " shape");
    }
    // array and script are alternative renderings, as are multi and join
    if ((directive.has_flag(FLAG_ARRAY) && directive.has_flag(FLAG_SCRIPT)) ||
        (directive.has_flag(FLAG_MULTI) && directive.has_flag(FLAG_JOIN))) {
        throw std::logic_error("directive " + name + ": conflicting flags");
    }
}

const char* field_shape_to_string(FieldShape shape) {
    switch (shape) {
        case FieldShape::Scalar: return "scalar";
        case FieldShape::Sequence: return "sequence";
        case FieldShape::Mapping: return "mapping";
        default: return "unknown";
    }
}

} // namespace dfy
