// minmlc - minml front-end command line interface
//
// Usage:
//   minmlc lex <file>
//   minmlc parse <file> [--expr | --decl] [--json] [--spans]
//   minmlc check [file | --project]
//
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "minml/ast/ast_context.hpp"
#include "minml/ast/ast_dumper.hpp"
#include "minml/ast/json_visitor.hpp"
#include "minml/basic/diagnostic_printer.hpp"
#include "minml/basic/source_manager.hpp"
#include "minml/project/project_config.hpp"
#include "minml/syntax/frontend.hpp"
#include "minml/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "minml front-end v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  lex <file>               Print the token stream\n"
            << "  parse <file>             Print the syntax tree\n"
            << "  check [file]             Check syntax of a file or project\n\n"
            << "Options:\n"
            << "  --expr                   Parse a single expression\n"
            << "  --decl                   Parse a single declaration\n"
            << "  --json                   Print the syntax tree as JSON\n"
            << "  --spans                  Show byte spans in the tree dump\n"
            << "  --project                Check sources listed in minml.yaml\n"
            << "  --color=<when>           auto | always | never\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void log_error(const std::string & message) { std::cerr << fmt::format("error: {}\n", message); }

bool stderr_wants_color(minml::ColorMode mode)
{
  switch (mode) {
    case minml::ColorMode::Always:
      return true;
    case minml::ColorMode::Never:
      return false;
    case minml::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<minml::ParseMode> mode;
  std::optional<minml::ColorMode> color;
  bool json = false;
  bool show_spans = false;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
  std::string bad_option;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--expr") {
      args.mode = minml::ParseMode::Expression;
    } else if (arg == "--decl") {
      args.mode = minml::ParseMode::Declaration;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--spans") {
      args.show_spans = true;
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg.rfind("--color=", 0) == 0) {
      args.color = minml::color_mode_from_string(arg.substr(8));
      if (!args.color) {
        args.bad_option = arg;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || (arg[0] != '-' && args.input_file.empty())) {
      args.input_file = arg;
    } else {
      args.bad_option = arg;
    }
  }

  return args;
}

// ============================================================================
// Helpers
// ============================================================================

/// Read a source file, or stdin for "-". Returns the registry path and text.
std::optional<std::pair<fs::path, std::string>> read_source(const std::string & input)
{
  std::stringstream buffer;

  if (input == "-") {
    buffer << std::cin.rdbuf();
    return std::make_pair(fs::path("<stdin>"), buffer.str());
  }

  const fs::path path = fs::absolute(input);
  if (!fs::exists(path)) {
    log_error(fmt::format("file not found: {}", path.string()));
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    log_error(fmt::format("failed to open file: {}", path.string()));
    return std::nullopt;
  }

  buffer << file.rdbuf();
  return std::make_pair(path, buffer.str());
}

/// Project config next to the working directory, if any. Load failures are
/// reported and yield nullopt.
std::optional<minml::ProjectConfig> find_config(bool required)
{
  const auto config_path = minml::find_project_config(fs::current_path());
  if (!config_path) {
    if (required) {
      log_error(fmt::format(
        "no {} found in current directory or parents", minml::k_project_config_file_name));
    }
    return std::nullopt;
  }

  auto loaded = minml::load_project_config(*config_path);
  if (!loaded.success) {
    log_error(loaded.error);
    return std::nullopt;
  }
  return std::move(loaded.config);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_lex(const CommandArgs & args, bool use_color)
{
  if (args.input_file.empty()) {
    log_error("input file required");
    std::cerr << "usage: minmlc lex <file>\n";
    return 1;
  }

  auto source = read_source(args.input_file);
  if (!source) return 1;

  minml::SourceRegistry sources;
  const minml::SourceId src = sources.register_file(source->first, std::move(source->second));
  const auto * file = sources.get_file(src);

  auto lexed = minml::syntax::lex(src, file->content());
  if (!lexed) {
    minml::DiagnosticBag diags;
    for (const auto & err : lexed.error()) {
      diags.add(minml::syntax::to_diagnostic(err));
    }
    minml::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, sources);
    return 1;
  }

  for (const auto & tok : lexed.value()) {
    std::cout << fmt::format(
      "{:<10} {:<24} [{}, {})\n", minml::syntax::to_string(tok->kind()),
      minml::syntax::to_display(tok.value()), tok.span().start(), tok.span().end());
  }
  return 0;
}

int cmd_parse(const CommandArgs & args, const minml::OutputConfig & output, bool use_color)
{
  if (args.input_file.empty()) {
    log_error("input file required");
    std::cerr << "usage: minmlc parse <file> [--expr | --decl] [--json]\n";
    return 1;
  }

  auto source = read_source(args.input_file);
  if (!source) return 1;

  minml::FrontendOptions options;
  options.mode = args.mode.value_or(minml::ParseMode::Program);

  if (args.verbose) {
    std::cerr << fmt::format(
      "Parsing {} as {}\n", source->first.string(), minml::to_string(options.mode));
  }

  minml::SourceRegistry sources;
  minml::AstContext ast;
  minml::DiagnosticBag diags;
  const auto parsed =
    minml::parse_source(sources, source->first, std::move(source->second), ast, diags, options);

  if (!diags.empty() || parsed.root == nullptr) {
    minml::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, sources);
    return 1;
  }

  if (args.json || output.format == minml::OutputFormat::Json) {
    std::cout << minml::to_json(parsed.root).dump(2) << "\n";
  } else {
    minml::dump(parsed.root, std::cout, args.show_spans || output.show_spans);
  }

  if (args.verbose) {
    std::cerr << fmt::format("{} tokens, {} nodes\n", parsed.tokens.size(), ast.node_count());
  }
  return 0;
}

int cmd_check(const CommandArgs & args, const std::optional<minml::ProjectConfig> & config,
              bool use_color)
{
  std::vector<fs::path> inputs;
  minml::FrontendOptions options;

  if (args.use_project || args.input_file.empty()) {
    if (!config) {
      return 1;  // find_config already reported why
    }
    if (config->frontend.sources.empty()) {
      log_error("frontend.sources is empty");
      return 1;
    }
    if (args.verbose) {
      std::cerr << fmt::format("Checking project: {}\n", config->package.name);
    }
    inputs = config->resolved_sources();
    options.mode = config->frontend.mode;
  } else {
    inputs.emplace_back(args.input_file);
    if (config) options.mode = config->frontend.mode;
  }
  if (args.mode) options.mode = *args.mode;

  minml::SourceRegistry sources;
  minml::AstContext ast;
  minml::DiagnosticBag diags;
  bool io_failed = false;

  for (const auto & input : inputs) {
    auto source = read_source(input.string());
    if (!source) {
      io_failed = true;
      continue;
    }

    if (args.verbose) {
      std::cerr << fmt::format("Checking: {}\n", source->first.string());
    }
    const auto parsed =
      minml::parse_source(sources, source->first, std::move(source->second), ast, diags, options);
    if (args.verbose && parsed.root != nullptr) {
      std::cerr << fmt::format("  {} tokens\n", parsed.tokens.size());
    }
  }

  if (!diags.empty()) {
    minml::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(diags, sources);
  }

  if (io_failed || !diags.empty()) {
    return 1;
  }

  std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.bad_option.empty()) {
    log_error(fmt::format("unknown option '{}'", args.bad_option));
    print_usage(argv[0]);
    return 1;
  }

  const bool project_required =
    args.command == "check" && (args.use_project || args.input_file.empty());
  const auto config = find_config(project_required);
  if (project_required && !config) {
    return 1;
  }

  minml::OutputConfig output;
  if (config) output = config->output;
  const bool use_color = stderr_wants_color(args.color.value_or(output.color));

  try {
    if (args.command == "lex") {
      return cmd_lex(args, use_color);
    }

    if (args.command == "parse") {
      return cmd_parse(args, output, use_color);
    }

    if (args.command == "check") {
      return cmd_check(args, config, use_color);
    }
  } catch (const std::exception & e) {
    log_error(e.what());
    return 1;
  }

  log_error(fmt::format("unknown command '{}'", args.command));
  print_usage(argv[0]);
  return 1;
}
