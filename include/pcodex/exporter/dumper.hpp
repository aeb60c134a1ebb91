#pragma once

#include <ostream>

#include "pcodex/exporter/program_record.hpp"

namespace pcodex::exporter {

// Human-readable listing of an exported program, one p-code operation per
// line, indented under its function, block and instruction.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const ProgramRecord& program);
  void Dump(const FunctionRecord& function);
  void Dump(const BlockRecord& block);
  void Dump(const InstructionRecord& instruction);

 private:
  void PrintIndent();
  void Indent();
  void Dedent();

  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace pcodex::exporter
