#pragma once

#include <filesystem>
#include <optional>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/pcode/datatype_properties.hpp"

namespace pcodex::config {

struct ExportConfig {
  bool pretty = true;
  int indent = 2;
};

struct ProjectConfig {
  pcode::DatatypeProperties datatypes;
  ExportConfig output;

  // Directory where pcodex.toml was found; empty for built-in defaults
  std::filesystem::path root_dir;
};

// Search for pcodex.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a pcodex.toml file. Fields not present keep their defaults.
// Returns error Diagnostic on parse errors, unknown fields and bad values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace pcodex::config
