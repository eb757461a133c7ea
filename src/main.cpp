//! # lspack Entry Point
//!
//! Sets up logging and interrupt forwarding, then hands the command line to
//! the CLI driver.
//!
//! ```bash
//! lspack build                         # package for this machine
//! lspack build --target linux --accel none --offline
//! lspack container --flavor cuda --build
//! ```

#include "cli/driver.hpp"
#include "log/log.hpp"
#include "process/process.hpp"

int main(int argc, char* argv[]) {
    lspack::log::Logger::init(lspack::log::parse_log_options(argc, argv));

    // SIGINT/SIGTERM reach the running child; the pipeline then stops
    lspack::proc::InterruptGuard interrupt_guard;

    int code = lspack::cli::lspack_main(argc, argv);
    lspack::log::Logger::instance().flush();
    return code;
}
