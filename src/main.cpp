//! # cyforge Entry Point
//!
//! Delegates to the CLI driver, which parses arguments, loads the
//! configuration and runs the requested mode.
//!
//! ## Usage
//!
//! ```bash
//! cyforge -t mypkg                 # Annotate and compile mypkg/ into build_lib/
//! cyforge -t mypkg -i              # ...then build a wheel and install it
//! cyforge -l requests              # Rebuild an installed library
//! cyforge -c --keep data/          # Remove build artifacts, keeping data/
//! ```

#include "cli/driver.hpp"

/// Main entry point for cyforge.
///
/// @return Exit code: 0 on success, 1 if a unit or the run failed, 2 on
///         usage or configuration errors
int main(int argc, char* argv[]) {
    return cyforge_main(argc, argv);
}
