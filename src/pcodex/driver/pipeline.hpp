#pragma once

#include <optional>
#include <string>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/config/project_config.hpp"
#include "pcodex/exporter/program_record.hpp"
#include "pcodex/listing/listing.hpp"
#include "pcodex/pcode/datatype_properties.hpp"
#include "verbose_logger.hpp"

namespace pcodex::driver {

struct CommandOptions {
  std::optional<std::string> config_path;
  int verbosity = 0;
};

struct LoadedInput {
  config::ProjectConfig config;
  listing::Listing listing;
  // Defaults, then pcodex.toml, then the listing's own datatypes section
  pcode::DatatypeProperties datatypes;
};

// Loads configuration (explicit path, discovered pcodex.toml, or defaults)
// and the listing file.
auto LoadInput(
    const std::string& listing_path, const CommandOptions& options,
    VerboseLogger& logger) -> Result<LoadedInput>;

auto ExportInput(const LoadedInput& input, VerboseLogger& logger)
    -> Result<exporter::ProgramRecord>;

}  // namespace pcodex::driver
