// minml/project/project_config.hpp - Project configuration (minml.yaml)
//
// Parses and validates minml.yaml project files for the minmlc host tool.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minml/syntax/frontend.hpp"

namespace minml
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Tree,    ///< indented AST dump
  Json,    ///< AST as JSON
  Tokens,  ///< token stream
};

enum class ColorMode : uint8_t {
  Auto,
  Always,
  Never,
};

[[nodiscard]] std::optional<OutputFormat> output_format_from_string(std::string_view text) noexcept;
[[nodiscard]] std::optional<ColorMode> color_mode_from_string(std::string_view text) noexcept;

struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Front-end section: how sources are parsed.
 */
struct FrontendConfig
{
  ParseMode mode = ParseMode::Program;

  /// Source files, relative to the project root
  std::vector<std::filesystem::path> sources;
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Tree;
  ColorMode color = ColorMode::Auto;
  bool show_spans = false;
};

/**
 * Complete project configuration (minml.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  FrontendConfig frontend;
  OutputConfig output;

  /// Directory containing minml.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// `frontend.sources` made absolute against project_root.
  [[nodiscard]] std::vector<std::filesystem::path> resolved_sources() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a minml.yaml file.
 *
 * @param config_path Path to minml.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find minml.yaml by searching upward from start_dir (or its parent when
 * start_dir is a file) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "minml.yaml";

}  // namespace minml
