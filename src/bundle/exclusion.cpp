#include "bundle/exclusion.hpp"

#include <algorithm>
#include <cctype>

namespace lspack::bundle {

static std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

ExclusionRule ExclusionRule::parse(const std::string& text) {
    if (text.starts_with("prefix:"))
        return {RuleKind::Prefix, text.substr(7), text};
    if (text.starts_with("substr:"))
        return {RuleKind::Substring, text.substr(7), text};
    if (text.starts_with("glob:"))
        return {RuleKind::Glob, text.substr(5), text};
    return {RuleKind::Substring, text, text};
}

bool ExclusionRule::matches(std::string_view dest) const {
    if (pattern.empty())
        return false;

    switch (kind) {
    case RuleKind::Prefix: {
        size_t slash = dest.rfind('/');
        std::string_view name = slash == std::string_view::npos ? dest : dest.substr(slash + 1);
        return name.starts_with(pattern);
    }
    case RuleKind::Substring:
        return to_lower(dest).find(to_lower(pattern)) != std::string::npos;
    case RuleKind::Glob:
        return glob_match(pattern, dest);
    }
    return false;
}

bool glob_match(std::string_view pattern, std::string_view path) {
    size_t p = 0;
    size_t s = 0;

    while (p < pattern.size()) {
        if (pattern.substr(p, 2) == "**") {
            std::string_view rest = pattern.substr(p + 2);
            // "**/" may also match zero directories
            if (rest.starts_with("/") && glob_match(rest.substr(1), path.substr(s))) {
                return true;
            }
            for (size_t i = s; i <= path.size(); ++i) {
                if (glob_match(rest, path.substr(i))) {
                    return true;
                }
            }
            return false;
        }

        char pc = pattern[p];
        if (pc == '*') {
            std::string_view rest = pattern.substr(p + 1);
            for (size_t i = s; i <= path.size(); ++i) {
                if (glob_match(rest, path.substr(i))) {
                    return true;
                }
                if (i < path.size() && path[i] == '/') {
                    break;
                }
            }
            return false;
        }

        if (s >= path.size()) {
            return false;
        }
        if (pc == '?') {
            if (path[s] == '/')
                return false;
        } else if (pc != path[s]) {
            return false;
        }
        ++p;
        ++s;
    }

    return s == path.size();
}

bool in_module(std::string_view dest, std::string_view module) {
    if (module.empty())
        return false;

    std::string prefix(module);
    std::replace(prefix.begin(), prefix.end(), '.', '/');

    if (!dest.starts_with(prefix))
        return false;
    if (dest.size() == prefix.size())
        return true;

    char next = dest[prefix.size()];
    // "numpy/testing/x.py", or a single-file module "tkinter.py" / "_tkinter.so"
    return next == '/' || next == '.';
}

} // namespace lspack::bundle
