//! # Linux Packager
//!
//! Assembles an AppDir around the frozen executable and turns it into a
//! single-file AppImage.
//!
//! ```text
//! LocalLLM-Studio.AppDir/
//!   AppRun                      launcher script, mode 0755
//!   localllm-studio             frozen executable
//!   localllm-studio.desktop
//!   localllm-studio.png
//!   .DirIcon
//! ```

#ifndef LSPACK_PACKAGER_LINUX_PACKAGER_HPP
#define LSPACK_PACKAGER_LINUX_PACKAGER_HPP

#include "packager/packager.hpp"

#include <string>

namespace lspack::pkg {

/// The AppRun launcher that execs `executable` next to it.
std::string render_app_run(const std::string& executable);

/// The `.desktop` entry of the AppDir.
std::string render_desktop_entry(const config::AppConfig& app);

/// Architecture name as the image tool expects it in `ARCH`.
const char* appimage_arch(Arch arch);

class LinuxPackager : public Packager {
public:
    using Packager::Packager;

    OsFamily os() const override {
        return OsFamily::Linux;
    }

protected:
    Result<Staged, PackError> stage(const PackageRequest& request) override;

private:
    Result<Unit, PackError> install_icon(const fs::path& app_dir) const;
};

} // namespace lspack::pkg

#endif // LSPACK_PACKAGER_LINUX_PACKAGER_HPP
