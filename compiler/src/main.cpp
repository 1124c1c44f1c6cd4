//! # tyfix Entry Point
//!
//! Delegates to the CLI dispatcher.
//!
//! ## Usage
//!
//! ```bash
//! tyfix check --expected String --actual '&str'   # Diagnose a mismatch
//! tyfix explain E0308                             # Explain an error code
//! tyfix codes                                     # List error codes
//! ```

#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    return tyfix::cli::tyfix_main(argc, argv);
}
