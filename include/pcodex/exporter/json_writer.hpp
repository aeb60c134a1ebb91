#pragma once

#include <filesystem>
#include <ostream>

#include <nlohmann/json.hpp>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/exporter/program_record.hpp"

namespace pcodex::exporter {

struct JsonOptions {
  bool pretty = true;
  int indent = 2;
};

void to_json(nlohmann::json& j, const InstructionRecord& record);
void to_json(nlohmann::json& j, const BlockRecord& record);
void to_json(nlohmann::json& j, const FunctionRecord& record);
void to_json(nlohmann::json& j, const RegisterProperties& record);
void to_json(nlohmann::json& j, const ProgramRecord& record);

void WriteProgramJson(
    const ProgramRecord& program, std::ostream& out, const JsonOptions& options);

// Writes to a temporary sibling first and renames it into place, so a failed
// export never leaves a truncated file behind.
auto WriteProgramJsonFile(
    const ProgramRecord& program, const std::filesystem::path& path,
    const JsonOptions& options) -> Result<void>;

}  // namespace pcodex::exporter
