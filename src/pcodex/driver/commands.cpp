#include "commands.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "pcodex/exporter/dumper.hpp"
#include "pcodex/exporter/json_writer.hpp"
#include "pcodex/exporter/program_record.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace pcodex::driver {

namespace {

// Load and export; prints diagnostics and returns nullopt on failure
auto LoadAndExport(
    const argparse::ArgumentParser& cmd, const CommandOptions& options,
    VerboseLogger& logger, std::optional<LoadedInput>& input)
    -> std::optional<exporter::ProgramRecord> {
  auto loaded = LoadInput(cmd.get<std::string>("listing"), options, logger);
  if (!loaded) {
    PrintDiagnostic(loaded.error());
    return std::nullopt;
  }
  input = std::move(*loaded);

  auto program = ExportInput(*input, logger);
  if (!program) {
    PrintDiagnostic(program.error());
    return std::nullopt;
  }
  return std::move(*program);
}

}  // namespace

auto ExportCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options)
    -> int {
  VerboseLogger logger(options.verbosity);
  std::optional<LoadedInput> input;
  auto program = LoadAndExport(cmd, options, logger, input);
  if (!program) {
    return 1;
  }

  exporter::JsonOptions json_options{
      .pretty = input->config.output.pretty,
      .indent = input->config.output.indent,
  };
  if (cmd.get<bool>("--compact")) {
    json_options.pretty = false;
  }

  PhaseTimer timer(logger, "write");
  auto output_path = cmd.present("-o");
  if (!output_path) {
    exporter::WriteProgramJson(*program, std::cout, json_options);
    return 0;
  }
  auto written =
      exporter::WriteProgramJsonFile(*program, *output_path, json_options);
  if (!written) {
    PrintDiagnostic(written.error());
    return 1;
  }
  logger.logger().info("wrote {}", *output_path);
  return 0;
}

auto DumpCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options)
    -> int {
  VerboseLogger logger(options.verbosity);
  std::optional<LoadedInput> input;
  auto program = LoadAndExport(cmd, options, logger, input);
  if (!program) {
    return 1;
  }

  exporter::Dumper dumper(&std::cout);
  dumper.Dump(*program);
  return 0;
}

auto CheckCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options)
    -> int {
  VerboseLogger logger(options.verbosity);
  std::optional<LoadedInput> input;
  auto program = LoadAndExport(cmd, options, logger, input);
  if (!program) {
    return 1;
  }

  PrintStats(exporter::CollectStats(*program));
  return 0;
}

}  // namespace pcodex::driver
