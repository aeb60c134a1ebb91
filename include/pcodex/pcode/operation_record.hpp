#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include <fmt/core.h>

#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/naming_context.hpp"
#include "pcodex/pcode/operand_record.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::pcode {

inline constexpr std::size_t kMaxRecordedInputs = 3;

// Serializable snapshot of one raw operation. Owns copies of all resolved
// operands; absent slots are nullopt.
struct OperationRecord {
  uint32_t index = 0;
  std::string mnemonic;
  std::optional<OperandRecord> input0;
  std::optional<OperandRecord> input1;
  std::optional<OperandRecord> input2;
  std::optional<OperandRecord> output;

  auto operator==(const OperationRecord&) const -> bool = default;

  [[nodiscard]] auto Inputs() const
      -> std::array<const std::optional<OperandRecord>*, kMaxRecordedInputs> {
    return {&input0, &input1, &input2};
  }

  [[nodiscard]] auto NumPresentInputs() const -> std::size_t {
    std::size_t count = 0;
    for (const auto* slot : Inputs()) {
      if (slot->has_value()) {
        ++count;
      }
    }
    return count;
  }

  // "#3 EAX:4 = INT_ADD EAX:4, 0x1:4"; absent inputs print as "_"
  [[nodiscard]] auto ToString() const -> std::string;
};

// Builds the record for `op`. Only the first three input slots are recorded.
// Errors raised while resolving operands propagate unchanged.
auto BuildOperationRecord(
    uint32_t index, const RawOperation& op, const NamingContext& naming,
    const DatatypeProperties& datatypes) -> OperationRecord;

inline auto operator<<(std::ostream& os, const OperationRecord& record)
    -> std::ostream& {
  return os << record.ToString();
}

}  // namespace pcodex::pcode

template <>
struct fmt::formatter<pcodex::pcode::OperationRecord> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(
      const pcodex::pcode::OperationRecord& record, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", record.ToString());
  }
};
