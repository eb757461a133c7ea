//! # macOS Packager
//!
//! Builds `<Name>.app` around the frozen executable, signs it on request and
//! wraps it in a compressed disk image with an `Applications` shortcut.

#ifndef LSPACK_PACKAGER_MACOS_PACKAGER_HPP
#define LSPACK_PACKAGER_MACOS_PACKAGER_HPP

#include "packager/packager.hpp"

#include <string>

namespace lspack::pkg {

/// Info.plist of the application bundle. `icon_file` may be empty.
std::string render_info_plist(const config::AppConfig& app, const std::string& icon_file);

class MacOsPackager : public Packager {
public:
    using Packager::Packager;

    OsFamily os() const override {
        return OsFamily::MacOS;
    }

protected:
    Result<Staged, PackError> stage(const PackageRequest& request) override;

private:
    Result<fs::path, PackError> build_app(const PackageRequest& request, const fs::path& exe);
    Result<fs::path, PackError> build_disk_image(const PackageRequest& request,
                                                 const fs::path& app);
};

} // namespace lspack::pkg

#endif // LSPACK_PACKAGER_MACOS_PACKAGER_HPP
