//! # Windows Packager
//!
//! Publishes the frozen one-file `<Name>.exe` and optionally places a desktop
//! shortcut to it.

#ifndef LSPACK_PACKAGER_WINDOWS_PACKAGER_HPP
#define LSPACK_PACKAGER_WINDOWS_PACKAGER_HPP

#include "packager/packager.hpp"

#include <string>

namespace lspack::pkg {

/// PowerShell command creating `lnk` pointing at `exe`.
std::string shortcut_script(const fs::path& lnk, const fs::path& exe);

class WindowsPackager : public Packager {
public:
    using Packager::Packager;

    OsFamily os() const override {
        return OsFamily::Windows;
    }

protected:
    Result<Staged, PackError> stage(const PackageRequest& request) override;
    void after_publish(const PackageArtifact& artifact) override;

private:
    fs::path shortcut_dir() const;
};

} // namespace lspack::pkg

#endif // LSPACK_PACKAGER_WINDOWS_PACKAGER_HPP
