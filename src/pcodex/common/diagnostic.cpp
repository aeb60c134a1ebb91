#include "pcodex/common/diagnostic.hpp"

#include <format>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "pcodex/common/overloaded.hpp"

namespace pcodex {

namespace {

auto GetKindString(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "error";
}

auto GetKindStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// "path:line: " or "path: " or "" for unknown spans
auto FormatSpanPrefix(const DiagSpan& span) -> std::string {
  return std::visit(
      Overloaded{
          [](const FileSpan& file) -> std::string {
            if (file.line == 0) {
              return std::format("{}: ", file.path);
            }
            return std::format("{}:{}: ", file.path, file.line);
          },
          [](const UnknownSpan&) -> std::string { return ""; },
      },
      span);
}

void PrintItem(const DiagItem& item, bool colors) {
  auto prefix = FormatSpanPrefix(item.span);
  auto kind = GetKindString(item.kind);
  if (colors) {
    fmt::print(
        stderr, "{}{}: {}\n",
        fmt::styled(prefix, fmt::fg(fmt::terminal_color::cyan)),
        fmt::styled(kind, GetKindStyle(item.kind)),
        fmt::styled(item.message, fmt::emphasis::bold));
  } else {
    fmt::print(stderr, "{}{}: {}\n", prefix, kind, item.message);
  }
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = std::format(
      "{}{}: {}", FormatSpanPrefix(diag.primary.span),
      GetKindString(diag.primary.kind), diag.primary.message);
  for (const auto& note : diag.notes) {
    out += std::format(
        "\n{}{}: {}", FormatSpanPrefix(note.span), GetKindString(note.kind),
        note.message);
  }
  return out;
}

void PrintDiagnostic(const Diagnostic& diag, bool colors) {
  PrintItem(diag.primary, colors);
  for (const auto& note : diag.notes) {
    PrintItem(note, colors);
  }
}

}  // namespace pcodex
