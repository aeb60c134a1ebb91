#pragma once

#include <nlohmann/json.hpp>

#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/operand_record.hpp"
#include "pcodex/pcode/operation_record.hpp"

namespace pcodex::pcode {

// nlohmann::json ADL hooks. Absent operand slots are omitted, never null.
void to_json(nlohmann::json& j, const OperandRecord& operand);
void to_json(nlohmann::json& j, const OperationRecord& record);
void to_json(nlohmann::json& j, const DatatypeProperties& props);

}  // namespace pcodex::pcode
