#pragma once

#include <argparse/argparse.hpp>

#include "pipeline.hpp"

namespace pcodex::driver {

auto ExportCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options) -> int;
auto DumpCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options) -> int;
auto CheckCommand(
    const argparse::ArgumentParser& cmd, const CommandOptions& options) -> int;

}  // namespace pcodex::driver
