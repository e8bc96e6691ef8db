#include "dfy/path_utils.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace dfy {

namespace {

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

std::string clean_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    bool rooted = path[0] == '/';

    std::vector<std::string> normalized;
    for (const auto& part : split(path, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
            } else if (!rooted) {
                normalized.push_back(part);
            }
        } else {
            normalized.push_back(part);
        }
    }

    std::string result = rooted ? "/" : "";
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) result += "/";
        result += normalized[i];
    }

    if (result.empty()) {
        return ".";
    }
    return result;
}

std::string join_path(const std::string& base, const std::string& relative) {
    if (base.empty() && relative.empty()) {
        return "";
    }
    if (base.empty()) {
        return clean_path(relative);
    }
    if (relative.empty()) {
        return clean_path(base);
    }
    return clean_path(base + "/" + relative);
}

} // namespace dfy
