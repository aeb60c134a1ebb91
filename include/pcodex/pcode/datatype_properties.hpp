#pragma once

#include <cstdint>
#include <string_view>

namespace pcodex::pcode {

// Sizes (in bytes) of the C datatypes of the analysed program.
// Defaults describe an LP64 target.
struct DatatypeProperties {
  uint32_t char_size = 1;
  uint32_t short_size = 2;
  uint32_t integer_size = 4;
  uint32_t long_size = 8;
  uint32_t long_long_size = 8;
  uint32_t float_size = 4;
  uint32_t double_size = 8;
  uint32_t long_double_size = 16;
  uint32_t pointer_size = 8;

  auto operator==(const DatatypeProperties&) const -> bool = default;
};

// Set the size named by `field` ("pointer_size", "char_size", ...).
// Returns false if no such field exists.
auto SetDatatypeSize(
    DatatypeProperties& props, std::string_view field, uint32_t size) -> bool;

}  // namespace pcodex::pcode
