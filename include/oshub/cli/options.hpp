#pragma once
#include "oshub/settings.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace oshub::cli
{

/// Process exit codes for the oshub-mcp command.
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;

struct Options
{
    bool help{false};
    bool version{false};
    std::optional<std::string> config_path;
    std::optional<std::string> env_file;
    std::optional<std::string> log_level;
};

/// Parse arguments (without argv[0]).
/// Throws UsageError for an unknown option or a flag missing its value.
Options parse_args(std::vector<std::string> args);

/**
 * Build the effective Settings for `options`.
 *
 * Layers, later wins: built-in defaults, the --config file, the environment
 * (after applying the env file, default ".env"), then command-line flags.
 * The result is not validated.
 */
Settings resolve_settings(const Options& options);

void print_usage(std::ostream& os);

/// Whole command: parse, configure, serve `in`/`out` until EOF. Logs go to `err`.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out,
        std::ostream& err);

} // namespace oshub::cli
