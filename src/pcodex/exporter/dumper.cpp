#include "pcodex/exporter/dumper.hpp"

#include <cstddef>
#include <ostream>
#include <string>

#include <fmt/core.h>

#include "pcodex/pcode/operation_record.hpp"

namespace pcodex::exporter {

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  *out_ << std::string(static_cast<std::size_t>(indent_) * 2, ' ');
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  --indent_;
}

void Dumper::Dump(const ProgramRecord& program) {
  PrintIndent();
  *out_ << fmt::format(
      "program {} (stack pointer {})\n", program.architecture,
      program.stack_pointer);
  for (const auto& function : program.functions) {
    Dump(function);
  }
}

void Dumper::Dump(const FunctionRecord& function) {
  PrintIndent();
  *out_ << fmt::format("function {} @ 0x{:x}\n", function.name, function.address);
  Indent();
  for (const auto& block : function.blocks) {
    Dump(block);
  }
  Dedent();
}

void Dumper::Dump(const BlockRecord& block) {
  PrintIndent();
  *out_ << fmt::format("block 0x{:x}\n", block.address);
  Indent();
  for (const auto& instruction : block.instructions) {
    Dump(instruction);
  }
  Dedent();
}

void Dumper::Dump(const InstructionRecord& instruction) {
  PrintIndent();
  *out_ << fmt::format(
      "0x{:x}: {}\n", instruction.address, instruction.assembly);
  Indent();
  for (const auto& op : instruction.pcode) {
    PrintIndent();
    *out_ << op << '\n';
  }
  Dedent();
}

}  // namespace pcodex::exporter
