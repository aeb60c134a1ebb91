#include "pcodex/pcode/json.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pcodex::pcode {

namespace {

void PutIfPresent(
    nlohmann::json& j, const char* key,
    const std::optional<OperandRecord>& operand) {
  if (operand) {
    j[key] = *operand;
  }
}

}  // namespace

void to_json(nlohmann::json& j, const OperandRecord& operand) {
  j = nlohmann::json{
      {"size", operand.size},
      {"address_space", operand.address_space},
      {"id", operand.id},
  };
}

void to_json(nlohmann::json& j, const OperationRecord& record) {
  j = nlohmann::json{
      {"pcode_index", record.index},
      {"pcode_mnemonic", record.mnemonic},
  };
  PutIfPresent(j, "input0", record.input0);
  PutIfPresent(j, "input1", record.input1);
  PutIfPresent(j, "input2", record.input2);
  PutIfPresent(j, "output", record.output);
}

void to_json(nlohmann::json& j, const DatatypeProperties& props) {
  j = nlohmann::json{
      {"char_size", props.char_size},
      {"short_size", props.short_size},
      {"integer_size", props.integer_size},
      {"long_size", props.long_size},
      {"long_long_size", props.long_long_size},
      {"float_size", props.float_size},
      {"double_size", props.double_size},
      {"long_double_size", props.long_double_size},
      {"pointer_size", props.pointer_size},
  };
}

}  // namespace pcodex::pcode
