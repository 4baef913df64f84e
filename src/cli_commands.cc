#include "cli_commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "SourceManager.hpp"
#include "colors.hpp"
#include "lexer.hpp"
#include "print_tokens.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pylex {
namespace cli {

static const char* DEFAULT_CONFIG_FILE = "pylex.json";

std::string usage_text() {
    std::ostringstream ss;
    ss << "Usage: pylex [options] [file]\n"
       << "Options:\n"
       << "  -v, --version        Print version and exit\n"
       << "  -h, --help           Show this help message\n"
       << "      --json           Print the token stream as JSON\n"
       << "      --no-color       Disable coloured output\n"
       << "      --errors-only    Print only lexical errors\n"
       << "      --config PATH    Read settings from PATH instead of ./pylex.json\n"
       << "\n"
       << "Without a file the source is read from standard input.\n"
       << "If a filename starts with '-', use `--` to end options:\n"
       << "  pylex -- -weird.py\n";
    return ss.str();
}

// Parse pylex.json with nlohmann/json
std::optional<CliConfig> parse_config_json(const std::string& filepath, std::string& error) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        error = "could not open config file " + filepath;
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error = "config file " + filepath + " must contain a JSON object";
            return std::nullopt;
        }

        CliConfig config;
        config.format = j.value("format", config.format);
        config.color = j.value("color", config.color);
        config.errors_only = j.value("show_errors_only", config.errors_only);

        if (config.format != "text" && config.format != "json") {
            error = "unknown format '" + config.format + "' in " + filepath;
            return std::nullopt;
        }
        return config;

    } catch (const json::parse_error& e) {
        error = "JSON parse error in " + filepath + ": " + e.what();
        return std::nullopt;
    } catch (const json::exception& e) {
        error = "JSON error in " + filepath + ": " + e.what();
        return std::nullopt;
    }
}

CommandResult parse_cli_args(const std::vector<std::string>& args, CliOptions& opts) {
    bool seen_double_dash = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (seen_double_dash) {
            if (!opts.filename.empty()) return {EXIT_USAGE, "pylex: unexpected argument '" + arg + "'"};
            opts.filename = arg;
            continue;
        }

        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-' && arg != "-") {
            if (arg == "-v" || arg == "--version") {
                opts.show_version = true;
            } else if (arg == "-h" || arg == "--help") {
                opts.show_help = true;
            } else if (arg == "--json") {
                opts.format = "json";
            } else if (arg == "--no-color") {
                opts.color = false;
            } else if (arg == "--errors-only") {
                opts.errors_only = true;
            } else if (arg == "--config") {
                if (i + 1 >= args.size()) return {EXIT_USAGE, "pylex: --config requires a path"};
                opts.config_path = args[++i];
            } else {
                return {EXIT_USAGE, "pylex: unknown option '" + arg + "'\nTry 'pylex --help' for more information."};
            }
            continue;
        }

        // "-" is an explicit request for stdin
        if (!opts.filename.empty()) return {EXIT_USAGE, "pylex: unexpected argument '" + arg + "'"};
        opts.filename = arg == "-" ? "" : arg;
    }
    return {EXIT_OK, ""};
}

CliConfig resolve_config(const CliOptions& opts, const CliConfig& file_config) {
    CliConfig config = file_config;
    if (opts.format) config.format = *opts.format;
    if (opts.color) config.color = *opts.color;
    if (opts.errors_only) config.errors_only = *opts.errors_only;
    return config;
}

std::optional<std::string> read_source_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int run_lexer(const std::string& source, const std::string& filename, const CliConfig& config,
              std::ostream& out, std::ostream& err, bool use_color) {
    Lexer lexer(source, filename);
    std::vector<LexResult> items = lexer.tokenize();

    bool has_errors = false;
    for (const auto& item : items) {
        if (!item.ok()) {
            has_errors = true;
            break;
        }
    }

    if (config.format == "json") {
        if (config.errors_only) {
            std::vector<LexResult> errors;
            for (const auto& item : items) {
                if (!item.ok()) errors.push_back(item);
            }
            out << tokens_to_json(errors).dump(2) << "\n";
        } else {
            out << tokens_to_json(items).dump(2) << "\n";
        }
    } else {
        if (!config.errors_only) print_tokens(items, out, use_color);
        SourceManager src_mgr(filename, source);
        print_lex_errors(items, src_mgr, err, use_color);
    }

    return has_errors ? EXIT_LEX_ERRORS : EXIT_OK;
}

CommandResult execute_command(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    CliOptions opts;
    CommandResult parsed = parse_cli_args(args, opts);
    if (parsed.exit_code != EXIT_OK) return parsed;

    if (opts.show_help) {
        out << usage_text();
        return {EXIT_OK, ""};
    }
    if (opts.show_version) {
        out << "pylex v" << PYLEX_VERSION << "\n";
        return {EXIT_OK, ""};
    }

    CliConfig file_config;
    std::string config_path = opts.config_path;
    if (config_path.empty() && fs::exists(DEFAULT_CONFIG_FILE)) config_path = DEFAULT_CONFIG_FILE;
    if (!config_path.empty()) {
        std::string error;
        auto loaded = parse_config_json(config_path, error);
        if (!loaded) return {EXIT_USAGE, "pylex: " + error};
        file_config = *loaded;
    }
    CliConfig config = resolve_config(opts, file_config);

    std::string source;
    if (opts.filename.empty()) {
        std::stringstream buffer;
        buffer << in.rdbuf();
        source = buffer.str();
    } else {
        auto loaded = read_source_file(opts.filename);
        if (!loaded) return {EXIT_USAGE, "pylex: could not open file " + opts.filename};
        source = *loaded;
    }

    bool use_color = config.color && Color::supports_color();
    int code = run_lexer(source, opts.filename, config, out, err, use_color);
    return {code, ""};
}

}  // namespace cli
}  // namespace pylex
