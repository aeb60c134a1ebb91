#pragma once

#include <string>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/exporter/program_record.hpp"

namespace pcodex::driver {

void PrintError(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintStats(const exporter::ExportStats& stats);

}  // namespace pcodex::driver
