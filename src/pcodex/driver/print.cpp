#include "print.hpp"

#include <cstdio>
#include <string>

#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>

namespace pcodex::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto UseColors() -> bool {
  return isatty(fileno(stderr)) != 0;
}

}  // namespace

void PrintError(const std::string& message) {
  if (UseColors()) {
    fmt::print(
        stderr, "{}: {}: {}\n", fmt::styled("pcodex", kToolStyle),
        fmt::styled(
            "error", fmt::fg(fmt::terminal_color::bright_red) |
                         fmt::emphasis::bold),
        message);
  } else {
    fmt::print(stderr, "pcodex: error: {}\n", message);
  }
}

void PrintDiagnostic(const Diagnostic& diag) {
  pcodex::PrintDiagnostic(diag, UseColors());
}

void PrintStats(const exporter::ExportStats& stats) {
  fmt::print(
      "{} functions, {} blocks, {} instructions, {} p-code operations\n",
      stats.functions, stats.blocks, stats.instructions, stats.operations);
}

}  // namespace pcodex::driver
