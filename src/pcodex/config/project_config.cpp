#include "pcodex/config/project_config.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.hpp>

namespace pcodex::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(
    const fs::path& path, const toml::source_region& where, std::string msg)
    -> Diagnostic {
  return Diagnostic::HostError(
      FileSpan{.path = path.string(), .line = where.begin.line},
      std::move(msg));
}

auto ReadDatatypes(
    const fs::path& path, const toml::table& section,
    pcode::DatatypeProperties& props) -> std::optional<Diagnostic> {
  for (const auto& [key, node] : section) {
    auto size = node.value<int64_t>();
    if (!size || *size <= 0 || *size > 1024) {
      return ConfigError(
          path, node.source(),
          std::format("datatypes.{} must be a positive integer", key.str()));
    }
    if (!pcode::SetDatatypeSize(props, key.str(), static_cast<uint32_t>(*size))) {
      return ConfigError(
          path, node.source(),
          std::format("unknown field 'datatypes.{}'", key.str()));
    }
  }
  return std::nullopt;
}

auto ReadExport(
    const fs::path& path, const toml::table& section, ExportConfig& output)
    -> std::optional<Diagnostic> {
  for (const auto& [key, node] : section) {
    if (key == "pretty") {
      auto pretty = node.value<bool>();
      if (!pretty) {
        return ConfigError(
            path, node.source(), "export.pretty must be a boolean");
      }
      output.pretty = *pretty;
    } else if (key == "indent") {
      auto indent = node.value<int64_t>();
      if (!indent || *indent < 0 || *indent > 16) {
        return ConfigError(
            path, node.source(), "export.indent must be between 0 and 16");
      }
      output.indent = static_cast<int>(*indent);
    } else {
      return ConfigError(
          path, node.source(),
          std::format("unknown field 'export.{}'", key.str()));
    }
  }
  return std::nullopt;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "pcodex.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(ConfigError(
        config_path, e.source(),
        std::format("failed to parse: {}", e.description())));
  }

  for (const auto& [key, node] : tbl) {
    const auto* section = node.as_table();
    bool known = key == "datatypes" || key == "export";
    if (known && section == nullptr) {
      return std::unexpected(ConfigError(
          config_path, node.source(),
          std::format("'{}' must be a table", key.str())));
    }
    if (key == "datatypes") {
      if (auto error = ReadDatatypes(config_path, *section, config.datatypes)) {
        return std::unexpected(std::move(*error));
      }
    } else if (key == "export") {
      if (auto error = ReadExport(config_path, *section, config.output)) {
        return std::unexpected(std::move(*error));
      }
    } else {
      return std::unexpected(ConfigError(
          config_path, node.source(),
          std::format("unknown section '{}'", key.str())));
    }
  }

  return config;
}

}  // namespace pcodex::config
