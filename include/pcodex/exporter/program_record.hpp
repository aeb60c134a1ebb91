#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/operand_record.hpp"
#include "pcodex/pcode/operation_record.hpp"

namespace pcodex::exporter {

struct InstructionRecord {
  uint64_t address = 0;
  std::string assembly;
  // pcode[i].index == i
  std::vector<pcode::OperationRecord> pcode;

  auto operator==(const InstructionRecord&) const -> bool = default;
};

struct BlockRecord {
  uint64_t address = 0;
  std::vector<InstructionRecord> instructions;

  auto operator==(const BlockRecord&) const -> bool = default;
};

struct FunctionRecord {
  std::string name;
  uint64_t address = 0;
  std::vector<BlockRecord> blocks;

  auto operator==(const FunctionRecord&) const -> bool = default;
};

// Position of a register inside its base register
struct RegisterProperties {
  std::string register_name;
  std::string base_register;
  // Byte offset of the register inside the base register
  uint64_t lsb = 0;
  uint32_t size = 0;

  auto operator==(const RegisterProperties&) const -> bool = default;
};

struct ProgramRecord {
  std::string architecture;
  pcode::OperandRecord stack_pointer;
  pcode::DatatypeProperties datatype_properties;
  std::vector<RegisterProperties> register_properties;
  std::vector<FunctionRecord> functions;

  auto operator==(const ProgramRecord&) const -> bool = default;
};

struct ExportStats {
  std::size_t functions = 0;
  std::size_t blocks = 0;
  std::size_t instructions = 0;
  std::size_t operations = 0;
};

auto CollectStats(const ProgramRecord& program) -> ExportStats;

}  // namespace pcodex::exporter
