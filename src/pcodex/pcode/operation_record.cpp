#include "pcodex/pcode/operation_record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <fmt/core.h>

namespace pcodex::pcode {

namespace {

auto ResolveSlot(
    const RawVarnode* varnode, const NamingContext& naming,
    const DatatypeProperties& datatypes) -> std::optional<OperandRecord> {
  if (varnode == nullptr) {
    return std::nullopt;
  }
  return BuildOperandRecord(*varnode, naming, datatypes);
}

auto InputSlot(const RawOperation& op, std::size_t slot) -> const RawVarnode* {
  if (slot >= op.NumInputs()) {
    return nullptr;
  }
  return op.Input(slot);
}

}  // namespace

auto OperationRecord::ToString() const -> std::string {
  std::string out = fmt::format("#{} ", index);
  if (output) {
    out += fmt::format("{} = ", *output);
  }
  out += mnemonic;

  // Print up to the last present input so absent trailing slots vanish
  auto slots = Inputs();
  std::size_t last = 0;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (slots[i]->has_value()) {
      last = i + 1;
    }
  }
  for (std::size_t i = 0; i < last; ++i) {
    out += (i == 0) ? " " : ", ";
    out += slots[i]->has_value() ? (*slots[i])->ToString() : "_";
  }
  return out;
}

auto BuildOperationRecord(
    uint32_t index, const RawOperation& op, const NamingContext& naming,
    const DatatypeProperties& datatypes) -> OperationRecord {
  return OperationRecord{
      .index = index,
      .mnemonic = std::string(op.Mnemonic()),
      .input0 = ResolveSlot(InputSlot(op, 0), naming, datatypes),
      .input1 = ResolveSlot(InputSlot(op, 1), naming, datatypes),
      .input2 = ResolveSlot(InputSlot(op, 2), naming, datatypes),
      .output = ResolveSlot(op.Output(), naming, datatypes),
  };
}

}  // namespace pcodex::pcode
