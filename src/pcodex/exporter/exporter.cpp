#include "pcodex/exporter/exporter.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "pcodex/pcode/operand_record.hpp"
#include "pcodex/pcode/operation_record.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::exporter {

namespace {

auto CollectRegisterProperties(const listing::RegisterTable& registers)
    -> std::vector<RegisterProperties> {
  std::vector<RegisterProperties> properties;
  properties.reserve(registers.Entries().size());
  for (const auto& entry : registers.Entries()) {
    const auto& base = registers.BaseOf(entry);
    properties.push_back(
        RegisterProperties{
            .register_name = entry.name,
            .base_register = base.name,
            .lsb = entry.offset - base.offset,
            .size = entry.size,
        });
  }
  return properties;
}

auto ResolveStackPointer(
    const listing::Listing& listing,
    const pcode::DatatypeProperties& datatypes)
    -> Result<pcode::OperandRecord> {
  const auto* entry = listing.registers.Find(listing.stack_pointer);
  if (entry == nullptr) {
    return std::unexpected(Diagnostic::Error(
        std::format(
            "stack pointer '{}' is not a known register",
            listing.stack_pointer)));
  }
  pcode::RawVarnode varnode{
      .space = pcode::AddressSpace::Named("register"),
      .offset = entry->offset,
      .size = entry->size,
  };
  try {
    return pcode::BuildOperandRecord(varnode, listing.registers, datatypes);
  } catch (const pcode::ResolutionError& e) {
    return std::unexpected(Diagnostic::Error(e.what()).WithNote(
        "while resolving the stack pointer"));
  }
}

}  // namespace

auto BuildInstructionRecord(
    const listing::ListedInstruction& instruction,
    const pcode::NamingContext& naming,
    const pcode::DatatypeProperties& datatypes) -> Result<InstructionRecord> {
  InstructionRecord record{
      .address = instruction.address,
      .assembly = instruction.assembly,
      .pcode = {},
  };
  record.pcode.reserve(instruction.pcode.size());
  for (uint32_t index = 0; index < instruction.pcode.size(); ++index) {
    const auto& op = instruction.pcode[index];
    try {
      record.pcode.push_back(
          pcode::BuildOperationRecord(index, op, naming, datatypes));
    } catch (const pcode::ResolutionError& e) {
      return std::unexpected(
          Diagnostic::Error(e.what()).WithNote(
              std::format(
                  "at instruction 0x{:x} ({}), p-code #{} ({})",
                  instruction.address, instruction.assembly, index,
                  op.Mnemonic())));
    }
  }
  return record;
}

auto ExportProgram(
    const listing::Listing& listing,
    const pcode::DatatypeProperties& datatypes) -> Result<ProgramRecord> {
  auto stack_pointer = ResolveStackPointer(listing, datatypes);
  if (!stack_pointer) {
    return std::unexpected(std::move(stack_pointer.error()));
  }

  ProgramRecord program{
      .architecture = listing.architecture,
      .stack_pointer = std::move(*stack_pointer),
      .datatype_properties = datatypes,
      .register_properties = CollectRegisterProperties(listing.registers),
      .functions = {},
  };
  program.functions.reserve(listing.functions.size());

  for (const auto& function : listing.functions) {
    FunctionRecord function_record{
        .name = function.name,
        .address = function.address,
        .blocks = {},
    };
    for (const auto& block : function.blocks) {
      BlockRecord block_record{.address = block.address, .instructions = {}};
      for (const auto& instruction : block.instructions) {
        auto record =
            BuildInstructionRecord(instruction, listing.registers, datatypes);
        if (!record) {
          return std::unexpected(std::move(record.error()).WithNote(
              std::format("in function '{}'", function.name)));
        }
        block_record.instructions.push_back(std::move(*record));
      }
      function_record.blocks.push_back(std::move(block_record));
    }
    spdlog::debug(
        "exported function '{}' ({} blocks)", function_record.name,
        function_record.blocks.size());
    program.functions.push_back(std::move(function_record));
  }
  return program;
}

}  // namespace pcodex::exporter
