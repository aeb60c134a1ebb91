#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "pipeline.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddCommonFlags(argparse::ArgumentParser& cmd, int& verbosity) {
  cmd.add_argument("listing").help(
      "Listing file exported by the analysis engine");
  cmd.add_argument("--config")
      .help("Configuration file (default: nearest pcodex.toml)")
      .metavar("path");
  cmd.add_argument("-v", "--verbose")
      .help("Log phases; repeat for debug output")
      .action([&verbosity](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("pcodex", "0.1.0");
  program.add_description("Export p-code operation listings as JSON");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  int verbosity = 0;

  // Subcommand: export
  argparse::ArgumentParser export_cmd("export");
  export_cmd.add_description("Write the program as JSON");
  AddCommonFlags(export_cmd, verbosity);
  export_cmd.add_argument("-o", "--output")
      .help("Output file (default: stdout)")
      .metavar("path");
  export_cmd.add_argument("--compact")
      .help("Single-line JSON regardless of configuration")
      .default_value(false)
      .implicit_value(true);

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print the p-code operations in readable form");
  AddCommonFlags(dump_cmd, verbosity);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Resolve every operand and report statistics");
  AddCommonFlags(check_cmd, verbosity);

  program.add_subparser(export_cmd);
  program.add_subparser(dump_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    pcodex::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      pcodex::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto options_for = [&verbosity](const argparse::ArgumentParser& cmd) {
    return pcodex::driver::CommandOptions{
        .config_path = cmd.present("--config"),
        .verbosity = verbosity,
    };
  };

  try {
    if (program.is_subcommand_used("export")) {
      return pcodex::driver::ExportCommand(export_cmd, options_for(export_cmd));
    }
    if (program.is_subcommand_used("dump")) {
      return pcodex::driver::DumpCommand(dump_cmd, options_for(dump_cmd));
    }
    if (program.is_subcommand_used("check")) {
      return pcodex::driver::CheckCommand(check_cmd, options_for(check_cmd));
    }
  } catch (const std::exception& e) {
    pcodex::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
