#include "common/error.hpp"

#include <sstream>

namespace lspack {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ProfileUnsupported:
        return "ProfileUnsupported";
    case ErrorKind::DependencyUnavailable:
        return "DependencyUnavailable";
    case ErrorKind::EnvironmentCreationFailed:
        return "EnvironmentCreationFailed";
    case ErrorKind::ManifestIncomplete:
        return "ManifestIncomplete";
    case ErrorKind::ManifestConflict:
        return "ManifestConflict";
    case ErrorKind::PackagingFailed:
        return "PackagingFailed";
    case ErrorKind::ConfigInvalid:
        return "ConfigInvalid";
    case ErrorKind::BuildLocked:
        return "BuildLocked";
    case ErrorKind::Interrupted:
        return "Interrupted";
    }
    return "Unknown";
}

PackError& PackError::with(std::string key, const std::string& value) {
    context.push_back(std::move(key) + ": " + value);
    return *this;
}

std::string PackError::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    if (!context.empty()) {
        oss << " (";
        for (size_t i = 0; i < context.size(); ++i) {
            if (i > 0)
                oss << "; ";
            oss << context[i];
        }
        oss << ")";
    }
    return oss.str();
}

} // namespace lspack
