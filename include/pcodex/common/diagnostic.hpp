#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace pcodex {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed program data (e.g., unresolvable operand)
  kHostError,  // I/O, malformed listing or configuration file
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Location inside an input file. line is 1-based; 0 means the whole file.
struct FileSpan {
  std::string path;
  uint32_t line = 0;

  auto operator==(const FileSpan&) const -> bool = default;
};

// Represents a missing location
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

using DiagSpan = std::variant<FileSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: error in the exported program data
  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = UnknownSpan{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without file location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error pointing into an input file
  static auto HostError(FileSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = std::move(span),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = UnknownSpan{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind == DiagKind::kError ||
           primary.kind == DiagKind::kHostError;
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Render a diagnostic as plain text ("path:line: error: message"), one line
// per item. Used by tests and by non-terminal output.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

// Print diagnostic to stderr
void PrintDiagnostic(const Diagnostic& diag, bool colors = true);

}  // namespace pcodex
