// minml/project/project_config.cpp - Project configuration implementation
//
#include "minml/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace minml
{

namespace
{

ConfigLoadResult from_yaml(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of the configuration must be a map");
  }

  // Parse 'package' section
  if (const auto pkg = root["package"]) {
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'frontend' section
  if (const auto fe = root["frontend"]) {
    if (fe["mode"]) {
      const auto text = fe["mode"].as<std::string>();
      const auto mode = parse_mode_from_string(text);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid frontend.mode: '" + text +
          "' (must be 'expression', 'declaration' or 'program')");
      }
      config.frontend.mode = *mode;
    }

    if (fe["sources"]) {
      if (!fe["sources"].IsSequence()) {
        return ConfigLoadResult::fail("frontend.sources must be a list");
      }
      for (const auto & s : fe["sources"]) {
        config.frontend.sources.emplace_back(s.as<std::string>());
      }
    }
  }

  // Parse 'output' section
  if (const auto out = root["output"]) {
    if (out["format"]) {
      const auto text = out["format"].as<std::string>();
      const auto format = output_format_from_string(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + text + "' (must be 'tree', 'json' or 'tokens')");
      }
      config.output.format = *format;
    }

    if (out["color"]) {
      const auto text = out["color"].as<std::string>();
      const auto color = color_mode_from_string(text);
      if (!color) {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')");
      }
      config.output.color = *color;
    }

    if (out["spans"]) {
      config.output.show_spans = out["spans"].as<bool>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<OutputFormat> output_format_from_string(std::string_view text) noexcept
{
  if (text == "tree") return OutputFormat::Tree;
  if (text == "json") return OutputFormat::Json;
  if (text == "tokens") return OutputFormat::Tokens;
  return std::nullopt;
}

std::optional<ColorMode> color_mode_from_string(std::string_view text) noexcept
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

std::vector<std::filesystem::path> ProjectConfig::resolved_sources() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(frontend.sources.size());
  for (const auto & s : frontend.sources) {
    out.push_back(s.is_absolute() ? s : (project_root / s).lexically_normal());
  }
  return out;
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return from_yaml(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path project_root = fs::absolute(config_path).parent_path();
  try {
    return from_yaml(YAML::LoadFile(config_path.string()), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;  // filesystem root
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace minml
