#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/naming_context.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::pcode {

// Raised when a raw operand cannot be turned into an OperandRecord.
class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& detail)
      : std::runtime_error(detail) {
  }
};

// Resolved, serializable form of one operand.
struct OperandRecord {
  uint32_t size = 0;
  std::string address_space;
  // Register name, constant value, address or temporary name
  std::string id;

  auto operator==(const OperandRecord&) const -> bool = default;

  [[nodiscard]] auto ToString() const -> std::string {
    return fmt::format("{}:{}", id, size);
  }
};

// Throws ResolutionError for zero-sized varnodes and for register varnodes
// the naming context cannot name.
auto BuildOperandRecord(
    const RawVarnode& varnode, const NamingContext& naming,
    const DatatypeProperties& datatypes) -> OperandRecord;

inline auto operator<<(std::ostream& os, const OperandRecord& operand)
    -> std::ostream& {
  return os << operand.ToString();
}

}  // namespace pcodex::pcode

template <>
struct fmt::formatter<pcodex::pcode::OperandRecord> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(
      const pcodex::pcode::OperandRecord& operand, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", operand.ToString());
  }
};
