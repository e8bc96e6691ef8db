#include "dfy/build_input.hpp"
#include "dfy/directives.hpp"

#include <optional>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>

namespace dfy {

namespace {

std::string hint_for(const std::string& key) {
    if (key == "working_dir" || key == "workingDir" || key == "workdir_path") {
        return "\n  hint: Use 'workdir' for the working directory";
    }
    if (key == "command" || key == "cmds") {
        return "\n  hint: Use 'cmd' for the default command arguments";
    }
    if (key == "ports" || key == "port") {
        return "\n  hint: Use 'expose' for exposed ports";
    }
    if (key == "environment" || key == "envs") {
        return "\n  hint: Use 'env' for environment variables";
    }
    if (key == "image" || key == "base") {
        return "\n  hint: Use 'from' for a stage's base image";
    }
    return "";
}

// Entry text of a sequence or mapping. Only port lists take bare numbers.
std::optional<std::string> as_text(const nlohmann::json& j, bool allow_number) {
    if (j.is_string()) {
        return j.get<std::string>();
    }
    if (allow_number && j.is_number()) {
        return j.dump();
    }
    return std::nullopt;
}

// Fills `stage` from `obj`, skipping `reserved` keys. Returns an error
// message, or empty on success.
std::string parse_stage(const nlohmann::json& obj,
                        const std::string& path,
                        const std::set<std::string>& reserved,
                        Stage& stage,
                        std::vector<std::string>& warnings) {
    for (const auto& [key, val] : obj.items()) {
        if (reserved.count(key)) {
            continue;
        }

        std::string field_path = path.empty() ? key : path + "." + key;

        const DirectiveField* directive = find_directive(key);
        if (!directive) {
            warnings.push_back("unknown field '" + field_path + "' (ignored)" + hint_for(key));
            continue;
        }

        if (val.is_null()) {
            continue;
        }

        switch (directive->shape) {
            case FieldShape::Scalar: {
                if (!val.is_string()) {
                    return field_path + " must be a string";
                }
                stage.*directive->scalar = val.get<std::string>();
                break;
            }
            case FieldShape::Sequence: {
                if (!val.is_array()) {
                    return field_path + " must be an array of strings";
                }
                auto& target = stage.*directive->sequence;
                bool ports = std::string(directive->field) == "expose";
                for (const auto& item : val) {
                    auto text = as_text(item, ports);
                    if (!text) {
                        return field_path + " must be an array of strings";
                    }
                    target.push_back(*text);
                }
                break;
            }
            case FieldShape::Mapping: {
                if (!val.is_object()) {
                    return field_path + " must be an object of strings";
                }
                auto& target = stage.*directive->mapping;
                for (const auto& [entry_key, entry_val] : val.items()) {
                    auto text = as_text(entry_val, false);
                    if (!text) {
                        return field_path + "." + entry_key + " must be a string";
                    }
                    target[entry_key] = *text;
                }
                break;
            }
        }
    }
    return "";
}

} // anonymous namespace

BuildInputParseResult parse_build_input(const std::string& json_content) {
    BuildInputParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_content);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        result.error_code = ErrorCode::INPUT_PARSE_ERROR;
        return result;
    }

    if (!j.is_object()) {
        result.error = "build description must be a JSON object";
        return result;
    }

    BuildDescription& description = result.description;

    if (j.contains("image") && !j["image"].is_null()) {
        if (!j["image"].is_string()) {
            result.error = "image must be a string";
            return result;
        }
        description.image = j["image"].get<std::string>();
    }

    if (j.contains("stages") && !j["stages"].is_null()) {
        if (!j["stages"].is_object()) {
            result.error = "stages must be an object";
            return result;
        }

        for (const auto& [name, stage_json] : j["stages"].items()) {
            if (name.empty()) {
                result.error = "stage names must not be empty";
                return result;
            }
            if (name.find(':') != std::string::npos) {
                result.error = "stage name '" + name + "' must not contain ':'";
                return result;
            }
            if (!stage_json.is_object()) {
                result.error = "stages." + name + " must be an object";
                return result;
            }

            Stage stage;
            auto error = parse_stage(stage_json, "stages." + name, {}, stage, result.warnings);
            if (!error.empty()) {
                result.error = error;
                return result;
            }
            description.stages.emplace(name, std::move(stage));
        }
    }

    static const std::set<std::string> top_level = {"$schema", "image", "stages"};
    auto error = parse_stage(j, "", top_level, description.stage, result.warnings);
    if (!error.empty()) {
        result.error = error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace dfy
