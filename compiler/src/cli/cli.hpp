//! # Command Line Interface
//!
//! Entry points of the `tyfix` executable.
//!
//! | Command                     | Handler        |
//! |-----------------------------|----------------|
//! | `tyfix check ...`           | `run_check()`  |
//! | `tyfix explain <code>`      | `run_explain()`|
//! | `tyfix codes`               | `run_codes()`  |
//! | `tyfix --help` / `-h`       | `print_usage()`|
//! | `tyfix --version` / `-V`    | `print_version()` |

#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tyfix::cli {

/// Options of `tyfix check`.
struct CheckOptions {
    std::string expected;
    std::string actual;
    std::string text = "expr";
    bool mutable_place = false;
    bool is_expression = true;
    std::optional<std::string> let_binding;
    std::optional<std::string> return_function;
    std::optional<std::string> return_type; ///< Declared type of `return_function`
};

/// Parses `check` arguments (everything after the command name).
auto parse_check_options(const std::vector<std::string>& args) -> Result<CheckOptions, std::string>;

int tyfix_main(int argc, char* argv[]);

int run_check(const CheckOptions& options);
int run_explain(const std::string& code);
int run_codes();

void print_usage();
void print_version();

} // namespace tyfix::cli
