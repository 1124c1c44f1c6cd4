//! # CLI Command Dispatcher
//!
//! Parses global flags, initializes logging and routes to the command
//! handlers.
//!
//! ```text
//! tyfix_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   ├─ explain        → run_explain()
//!   └─ codes          → run_codes()
//! ```
//!
//! ## Global Flags
//!
//! | Flag                      | Effect                                   |
//! |---------------------------|------------------------------------------|
//! | `--verbose`               | Print the bridged type of path fixes     |
//! | `--no-color`              | Disable ANSI colors                      |
//! | `--format=json`           | Print annotations as JSON                |
//! | `--max-deref-depth=<n>`   | Bound on deref chains (default 64)       |
//! | `--log-level=<lvl>`, `-v` | Logging (see `log::parse_log_options`)   |

#include "cli/cli.hpp"
#include "log/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tyfix::cli {

namespace {

auto parse_depth(const std::string& value) -> std::optional<size_t> {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

/// Main entry point for the `tyfix` executable.
///
/// | Code | Meaning                                     |
/// |------|---------------------------------------------|
/// | 0    | Success (or the types already match)        |
/// | 1    | A mismatch was reported                     |
/// | 2    | Usage error                                 |
int tyfix_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    // Everything that is not a global flag is positional.
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--verbose") {
            EngineOptions::verbose = true;
        } else if (arg == "--no-color") {
            EngineOptions::colors = false;
        } else if (arg == "--format=json") {
            EngineOptions::output_format = OutputFormat::JSON;
        } else if (arg == "--format=text") {
            EngineOptions::output_format = OutputFormat::Text;
        } else if (arg.rfind("--max-deref-depth=", 0) == 0) {
            auto depth = parse_depth(arg.substr(18));
            if (!depth || *depth == 0) {
                std::cerr << "error: invalid value for --max-deref-depth: `" << arg.substr(18)
                          << "`\n";
                return 2;
            }
            EngineOptions::max_deref_depth = *depth;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    const std::string& command = args[0];
    TYFIX_LOG_DEBUG("cli", "command `" << command << "`");

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "check") {
        auto options = parse_check_options({args.begin() + 1, args.end()});
        if (is_err(options)) {
            std::cerr << "error: " << unwrap_err(options) << "\n";
            std::cerr << "Usage: tyfix check --expected <type> --actual <type> [--mutable]"
                         " [--let <name>] [--return-of <fn>:<type>] [--text <expr>]\n";
            return 2;
        }
        return run_check(unwrap(options));
    }

    if (command == "explain") {
        if (args.size() < 2) {
            std::cerr << "Usage: tyfix explain <error-code>\n";
            std::cerr << "Example: tyfix explain E0308\n";
            return 2;
        }
        return run_explain(args[1]);
    }

    if (command == "codes") {
        return run_codes();
    }

    std::cerr << "error: unknown command `" << command << "`\n\n";
    print_usage();
    return 2;
}

void print_usage() {
    std::cout << "tyfix " << VERSION << "\n\n";
    std::cout << "Usage: tyfix <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Diagnose a type mismatch and list candidate fixes\n";
    std::cout << "  explain   Explain an error code\n";
    std::cout << "  codes     List every error code with its documentation link\n";
    std::cout << "\nCheck options:\n";
    std::cout << "  --expected <type>        Type the context requires\n";
    std::cout << "  --actual <type>          Type the expression has\n";
    std::cout << "  --text <expr>            Source text of the expression\n";
    std::cout << "  --mutable                The expression is a mutable place\n";
    std::cout << "  --pattern                The element is not an expression\n";
    std::cout << "  --let <name>             The expression initializes `let name: T`\n";
    std::cout << "  --return-of <fn>[:type]  The expression is returned from `fn`\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h               Show this help\n";
    std::cout << "  --version, -V            Show version\n";
    std::cout << "  --verbose                Show detailed output\n";
    std::cout << "  --no-color               Disable colored output\n";
    std::cout << "  --format=json            Print annotations as JSON\n";
    std::cout << "  --max-deref-depth=<n>    Bound on deref chains (default "
              << DEFAULT_MAX_DEREF_DEPTH << ")\n";
    std::cout << "  --log-level=<level>      trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>      e.g. coerce=trace,*=warn\n";
    std::cout << "  -v, -vv, -vvv, -q        Raise or lower log verbosity\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  TYFIX_LOG                Log level or filter when no flag is given\n";
}

void print_version() {
    std::cout << "tyfix " << VERSION << "\n";
}

} // namespace tyfix::cli
