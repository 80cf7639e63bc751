// circ_dsl/project/project_config.cpp - Project configuration implementation
//
#include "circ_dsl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace circ_dsl
{

namespace
{

ConfigLoadResult parse_config(const YAML::Node & root, ProjectConfig config)
{
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // 'package' section
  const YAML::Node pkg = root["package"];
  if (!pkg || !pkg["name"]) {
    return ConfigLoadResult::fail("package.name is required");
  }
  config.package.name = pkg["name"].as<std::string>();
  if (config.package.name.empty()) {
    return ConfigLoadResult::fail("package.name must not be empty");
  }
  if (pkg["version"]) {
    config.package.version = pkg["version"].as<std::string>();
  }

  // 'compiler' section
  if (const YAML::Node comp = root["compiler"]) {
    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (comp["search_root"]) {
      config.compiler.search_root = comp["search_root"].as<std::string>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::filesystem::path ProjectConfig::resolved_search_root() const
{
  return (project_root / compiler.search_root).lexically_normal();
}

std::vector<std::filesystem::path> ProjectConfig::resolved_entry_points() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(compiler.entry_points.size());
  for (const auto & ep : compiler.entry_points) {
    out.push_back((project_root / ep).lexically_normal());
  }
  return out;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_config(root, std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
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
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace circ_dsl
