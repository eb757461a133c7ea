//! # Build Commands Interface
//!
//! | Command  | Handler        | Description                              |
//! |----------|----------------|------------------------------------------|
//! | `build`  | `run_build()`  | Full pipeline for one target             |
//! | `detect` | `run_detect()` | Prints the resolved target               |
//! | `clean`  | `run_clean()`  | Removes a target's output and work trees |

#pragma once

namespace lspack::cli {

int run_build(int argc, char* argv[]);
int run_detect(int argc, char* argv[]);
int run_clean(int argc, char* argv[]);

} // namespace lspack::cli
