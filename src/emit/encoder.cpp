#include "dfy/encoder.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace dfy {

namespace {

// JSON string escaping doubles as the builder's quoting: it escapes '"',
// '\' and control characters and leaves UTF-8 text untouched.
std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::vector<std::string> sorted_keys(const Values& values) {
    std::vector<std::string> keys;
    keys.reserve(values.size());
    for (const auto& [key, _] : values) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

std::vector<std::vector<std::string>> format_scalar(const DirectiveField& directive,
                                                    const std::string& value) {
    if (value.empty()) {
        return {};
    }
    if (directive.has_flag(FLAG_INLINE)) {
        return {{value}};
    }
    return {{may_quote(value)}};
}

std::vector<std::vector<std::string>> format_sequence(const DirectiveField& directive,
                                                      const std::vector<std::string>& values) {
    if (values.empty()) {
        return {};
    }
    if (directive.has_flag(FLAG_ARRAY)) {
        return {{format_array(values)}};
    }
    if (directive.has_flag(FLAG_SCRIPT)) {
        return {{join(values, " && ")}};
    }
    return {{join(values, "")}};
}

std::vector<std::vector<std::string>> format_mapping(const DirectiveField& directive,
                                                     const Values& values) {
    if (values.empty()) {
        return {};
    }

    if (directive.has_flag(FLAG_JOIN)) {
        // destination -> sources, both sorted
        std::map<std::string, std::vector<std::string>> by_dest;
        for (const auto& [source, dest] : values) {
            by_dest[dest].push_back(source);
        }

        std::vector<std::vector<std::string>> lines;
        for (auto& [dest, sources] : by_dest) {
            std::sort(sources.begin(), sources.end());
            sources.push_back(dest);
            lines.push_back(std::move(sources));
        }
        return lines;
    }

    auto keys = sorted_keys(values);

    if (directive.has_flag(FLAG_MULTI)) {
        std::vector<std::string> pairs;
        pairs.reserve(keys.size());
        for (const auto& key : keys) {
            pairs.push_back(key + "=" + may_quote(values.at(key)));
        }
        return {pairs};
    }

    std::vector<std::vector<std::string>> lines;
    for (const auto& key : keys) {
        lines.push_back({key, may_quote(values.at(key))});
    }
    return lines;
}

} // namespace

// ============================================================================
// Value Formatting
// ============================================================================

std::string quote(const std::string& value) {
    return dump_json(nlohmann::json(value));
}

std::string may_quote(const std::string& value) {
    if (value.empty() || value.find(' ') != std::string::npos) {
        return quote(value);
    }
    return value;
}

std::string format_array(const std::vector<std::string>& values) {
    return dump_json(nlohmann::json(values));
}

// ============================================================================
// Stage Encoding
// ============================================================================

std::vector<std::vector<std::string>> format_directive(const DirectiveField& directive,
                                                       const Stage& stage) {
    validate_directive(directive);

    switch (directive.shape) {
        case FieldShape::Scalar:
            return format_scalar(directive, stage.*directive.scalar);
        case FieldShape::Sequence:
            return format_sequence(directive, stage.*directive.sequence);
        case FieldShape::Mapping:
            return format_mapping(directive, stage.*directive.mapping);
    }
    throw std::logic_error(std::string("directive ") + directive.keyword + ": unknown field shape");
}

Result<void> encode_stage(std::ostream& out,
                          const std::string& name,
                          const Stage& stage,
                          const StageResolution& resolution) {
    auto write = [&](const std::string& keyword, const std::vector<std::string>& tokens) {
        if (tokens.empty()) {
            return;
        }

        out << keyword;

        for (auto token : tokens) {
            out << ' ';

            if (keyword == "FROM") {
                if (!name.empty()) {
                    token += " as " + name;
                }
            } else if (keyword == "COPY") {
                auto it = resolution.copy_rewrites.find(token);
                if (it != resolution.copy_rewrites.end()) {
                    token = it->second;
                }
            }

            out << token;
        }

        out << '\n';
    };

    for (const auto& directive : stage_directives()) {
        for (const auto& tokens : format_directive(directive, stage)) {
            write(directive.keyword, tokens);
        }
        if (!out) {
            return Result<void>::err(Error(ErrorCode::WRITE_FAILED,
                std::string("failed to write ") + directive.keyword + " directive"));
        }
    }

    return Result<void>::ok();
}

} // namespace dfy
