#include "pcodex/pcode/datatype_properties.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace pcodex::pcode {

auto SetDatatypeSize(
    DatatypeProperties& props, std::string_view field, uint32_t size) -> bool {
  const std::array<std::pair<std::string_view, uint32_t*>, 9> fields = {{
      {"char_size", &props.char_size},
      {"short_size", &props.short_size},
      {"integer_size", &props.integer_size},
      {"long_size", &props.long_size},
      {"long_long_size", &props.long_long_size},
      {"float_size", &props.float_size},
      {"double_size", &props.double_size},
      {"long_double_size", &props.long_double_size},
      {"pointer_size", &props.pointer_size},
  }};
  for (const auto& [name, slot] : fields) {
    if (name == field) {
      *slot = size;
      return true;
    }
  }
  return false;
}

}  // namespace pcodex::pcode
