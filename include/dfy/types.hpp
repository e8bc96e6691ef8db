#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dfy {

// ============================================================================
// Build Description
// ============================================================================

// Unordered key/value mapping. Emission always sorts keys.
using Values = std::unordered_map<std::string, std::string>;

// One build layer. Field order here is the order directives are emitted in
// (see stage_directives()).
struct Stage {
    std::string from;
    Values label;
    std::string workdir;

    Values env;
    Values add;   // source -> destination, sources sharing a destination are grouped
    Values copy;  // source -> destination, source may be "<stage>:<path>"
    std::vector<std::string> run;

    std::vector<std::string> expose;
    std::vector<std::string> volume;

    std::vector<std::string> entrypoint;
    std::vector<std::string> cmd;
};

// Named intermediate stages plus the final, unnamed stage.
// std::map keeps stage iteration independent of hashing.
struct BuildDescription {
    std::string image;  // optional output image reference
    std::map<std::string, Stage> stages;
    Stage stage;
};

inline bool operator==(const Stage& a, const Stage& b) {
    return a.from == b.from && a.label == b.label && a.workdir == b.workdir &&
           a.env == b.env && a.add == b.add && a.copy == b.copy && a.run == b.run &&
           a.expose == b.expose && a.volume == b.volume &&
           a.entrypoint == b.entrypoint && a.cmd == b.cmd;
}

inline bool operator!=(const Stage& a, const Stage& b) {
    return !(a == b);
}

// Convenience builders for list-valued fields
template<typename... Args>
std::vector<std::string> scripts(Args&&... args) {
    return {std::string(std::forward<Args>(args))...};
}

template<typename... Args>
std::vector<std::string> args(Args&&... values) {
    return {std::string(std::forward<Args>(values))...};
}

// Reference to a variable of the container environment, e.g. "$HOME"
inline std::string container_env_var(const std::string& name) {
    return "$" + name;
}

} // namespace dfy
