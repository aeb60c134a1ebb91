#include "pcodex/exporter/json_writer.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <ostream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "pcodex/pcode/json.hpp"

namespace pcodex::exporter {

namespace {

auto FormatAddress(uint64_t address) -> std::string {
  return std::format("0x{:x}", address);
}

}  // namespace

void to_json(nlohmann::json& j, const InstructionRecord& record) {
  j = nlohmann::json{
      {"address", FormatAddress(record.address)},
      {"assembly", record.assembly},
      {"pcode", record.pcode},
  };
}

void to_json(nlohmann::json& j, const BlockRecord& record) {
  j = nlohmann::json{
      {"address", FormatAddress(record.address)},
      {"instructions", record.instructions},
  };
}

void to_json(nlohmann::json& j, const FunctionRecord& record) {
  j = nlohmann::json{
      {"name", record.name},
      {"address", FormatAddress(record.address)},
      {"blocks", record.blocks},
  };
}

void to_json(nlohmann::json& j, const RegisterProperties& record) {
  j = nlohmann::json{
      {"register", record.register_name},
      {"base_register", record.base_register},
      {"lsb", record.lsb},
      {"size", record.size},
  };
}

void to_json(nlohmann::json& j, const ProgramRecord& record) {
  j = nlohmann::json{
      {"cpu_architecture", record.architecture},
      {"stack_pointer_register", record.stack_pointer},
      {"datatype_properties", record.datatype_properties},
      {"register_properties", record.register_properties},
      {"functions", record.functions},
  };
}

void WriteProgramJson(
    const ProgramRecord& program, std::ostream& out,
    const JsonOptions& options) {
  nlohmann::json j = program;
  // Listing strings are engine bytes; invalid UTF-8 becomes U+FFFD
  out << j.dump(
             options.pretty ? options.indent : -1, ' ', false,
             nlohmann::json::error_handler_t::replace)
      << '\n';
}

auto WriteProgramJsonFile(
    const ProgramRecord& program, const std::filesystem::path& path,
    const JsonOptions& options) -> Result<void> {
  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path);
    if (!out) {
      return std::unexpected(Diagnostic::HostError(
          std::format("cannot open '{}' for writing", tmp_path.string())));
    }
    WriteProgramJson(program, out, options);
    out.flush();
    if (!out) {
      return std::unexpected(Diagnostic::HostError(
          std::format("failed writing '{}'", tmp_path.string())));
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    auto reason = ec.message();
    std::filesystem::remove(tmp_path, ec);
    return std::unexpected(Diagnostic::HostError(
        std::format("cannot write '{}': {}", path.string(), reason)));
  }
  return {};
}

}  // namespace pcodex::exporter
