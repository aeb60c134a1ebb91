#pragma once

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/exporter/program_record.hpp"
#include "pcodex/listing/listing.hpp"
#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/naming_context.hpp"

namespace pcodex::exporter {

// Builds the record of one instruction, numbering its operations 0..n-1 in
// listed order. An unresolvable operand yields an error noting the
// instruction address and p-code index.
auto BuildInstructionRecord(
    const listing::ListedInstruction& instruction,
    const pcode::NamingContext& naming,
    const pcode::DatatypeProperties& datatypes) -> Result<InstructionRecord>;

// Builds the record of a whole listing. Stops at the first operand that
// cannot be resolved and reports it with its function, instruction address
// and p-code index. `datatypes` is used as is; callers merge listing
// overrides beforehand (see Listing::ResolveDatatypes).
auto ExportProgram(
    const listing::Listing& listing,
    const pcode::DatatypeProperties& datatypes) -> Result<ProgramRecord>;

}  // namespace pcodex::exporter
