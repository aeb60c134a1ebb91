#include "pcodex/exporter/program_record.hpp"

namespace pcodex::exporter {

auto CollectStats(const ProgramRecord& program) -> ExportStats {
  ExportStats stats;
  stats.functions = program.functions.size();
  for (const auto& function : program.functions) {
    stats.blocks += function.blocks.size();
    for (const auto& block : function.blocks) {
      stats.instructions += block.instructions.size();
      for (const auto& instruction : block.instructions) {
        stats.operations += instruction.pcode.size();
      }
    }
  }
  return stats;
}

}  // namespace pcodex::exporter
