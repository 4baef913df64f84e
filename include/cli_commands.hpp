#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#ifndef PYLEX_VERSION
#define PYLEX_VERSION "0.1.0"
#endif

namespace pylex {
namespace cli {

// Settings read from pylex.json
struct CliConfig {
    std::string format = "text";  // "text" | "json"
    bool color = true;
    bool errors_only = false;
};

// Parsed command line. Flags left unset fall back to the config file.
struct CliOptions {
    std::string filename;  // empty: read stdin
    std::string config_path;
    std::optional<std::string> format;
    std::optional<bool> color;
    std::optional<bool> errors_only;
    bool show_help = false;
    bool show_version = false;
};

// Command result structure
struct CommandResult {
    int exit_code;
    std::string message;
};

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_LEX_ERRORS = 2;
constexpr int EXIT_FAULT = 3;

// Main command dispatcher
CommandResult execute_command(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

// Helper functions
CommandResult parse_cli_args(const std::vector<std::string>& args, CliOptions& opts);
std::optional<CliConfig> parse_config_json(const std::string& filepath, std::string& error);
CliConfig resolve_config(const CliOptions& opts, const CliConfig& file_config);
std::optional<std::string> read_source_file(const std::string& filepath);

// Lex `source` and print it per `config`; returns the exit code.
int run_lexer(const std::string& source, const std::string& filename, const CliConfig& config,
              std::ostream& out, std::ostream& err, bool use_color);

std::string usage_text();

}  // namespace cli
}  // namespace pylex

#endif  // CLI_COMMANDS_HPP
