//! # CLI Command Dispatcher
//!
//! Routes the first argument to a command handler.
//!
//! ```text
//! lspack_main()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   ├─ build           → run_build()
//!   ├─ detect          → run_detect()
//!   ├─ clean           → run_clean()
//!   ├─ manifest-check  → run_manifest_check()
//!   └─ container       → run_container()
//! ```

#include "commands/cmd_build.hpp"
#include "commands/cmd_container.hpp"
#include "commands/cmd_manifest.hpp"
#include "driver.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

namespace lspack::cli {

/// Main entry point for the lspack CLI.
///
/// | Code | Meaning                              |
/// |------|--------------------------------------|
/// | 0    | Success                              |
/// | 1    | Failure (the error is on stderr)     |
/// | 130  | Interrupted                          |
int lspack_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }
    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "build")
        return run_build(argc, argv);
    if (command == "detect")
        return run_detect(argc, argv);
    if (command == "clean")
        return run_clean(argc, argv);
    if (command == "manifest-check")
        return run_manifest_check(argc, argv);
    if (command == "container")
        return run_container(argc, argv);

    std::cerr << "error: unknown command '" << command << "'\n";
    std::cerr << "Run 'lspack --help' for usage.\n";
    return 1;
}

} // namespace lspack::cli
