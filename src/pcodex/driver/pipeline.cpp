#include "pipeline.hpp"

#include <filesystem>
#include <string>
#include <utility>

#include "pcodex/exporter/exporter.hpp"
#include "pcodex/listing/listing_loader.hpp"

namespace pcodex::driver {

namespace {

auto LoadProjectConfig(const CommandOptions& options, VerboseLogger& logger)
    -> Result<config::ProjectConfig> {
  if (options.config_path) {
    return config::LoadConfig(*options.config_path);
  }
  auto found = config::FindConfig();
  if (!found) {
    logger.logger().debug("no pcodex.toml found, using defaults");
    return config::ProjectConfig{};
  }
  logger.logger().debug("using configuration {}", found->string());
  return config::LoadConfig(*found);
}

}  // namespace

auto LoadInput(
    const std::string& listing_path, const CommandOptions& options,
    VerboseLogger& logger) -> Result<LoadedInput> {
  auto config = LoadProjectConfig(options, logger);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }

  Result<listing::Listing> listing;
  {
    PhaseTimer timer(logger, "load");
    listing = listing::LoadListing(listing_path);
  }
  if (!listing) {
    return std::unexpected(std::move(listing.error()));
  }

  auto datatypes = listing->ResolveDatatypes(config->datatypes);
  return LoadedInput{
      .config = std::move(*config),
      .listing = std::move(*listing),
      .datatypes = datatypes,
  };
}

auto ExportInput(const LoadedInput& input, VerboseLogger& logger)
    -> Result<exporter::ProgramRecord> {
  PhaseTimer timer(logger, "export");
  return exporter::ExportProgram(input.listing, input.datatypes);
}

}  // namespace pcodex::driver
