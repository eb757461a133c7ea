#include "deps/search_path.hpp"

#include <algorithm>
#include <cctype>

namespace lspack::deps {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_conflict_marker(const std::string& entry, const std::vector<std::string>& markers) {
    std::string lower = to_lower(entry);
    for (const auto& marker : markers) {
        if (!marker.empty() && lower.find(to_lower(marker)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static std::vector<std::string> split(const std::string& value, char separator) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(separator, start);
        if (end == std::string::npos)
            end = value.size();
        parts.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::string sanitize_search_path(const std::string& value, const std::vector<std::string>& markers,
                                 char separator) {
    std::string result;
    for (const auto& entry : split(value, separator)) {
        if (entry.empty() || contains_conflict_marker(entry, markers))
            continue;
        if (!result.empty())
            result += separator;
        result += entry;
    }
    return result;
}

SanitizedEnvironment sanitize_environment(const std::map<std::string, std::string>& env,
                                          const std::vector<std::string>& path_vars,
                                          const std::vector<std::string>& unset_vars,
                                          const std::vector<std::string>& markers, char separator) {
    SanitizedEnvironment out;

    for (const auto& var : path_vars) {
        auto it = env.find(var);
        if (it == env.end())
            continue;

        for (const auto& entry : split(it->second, separator)) {
            if (!entry.empty() && contains_conflict_marker(entry, markers)) {
                out.removed_entries.push_back(entry);
            }
        }
        out.overrides[var] = sanitize_search_path(it->second, markers, separator);
    }

    out.unset = unset_vars;
    return out;
}

} // namespace lspack::deps
