//! # CLI Driver Interface
//!
//! Entry point called by `main()`. Parses the command line and dispatches to
//! the command handlers in `cli/commands/`.

#pragma once

namespace lspack::cli {

/// Runs the lspack CLI. Returns the process exit code.
int lspack_main(int argc, char* argv[]);

} // namespace lspack::cli
