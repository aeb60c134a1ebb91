#include "pcodex/pcode/raw_operation.hpp"

#include <string_view>

namespace pcodex::pcode {

auto SpaceKindFromName(std::string_view name) -> SpaceKind {
  if (name == "register") {
    return SpaceKind::kRegister;
  }
  if (name == "const") {
    return SpaceKind::kConstant;
  }
  if (name == "ram") {
    return SpaceKind::kRam;
  }
  if (name == "unique") {
    return SpaceKind::kUnique;
  }
  if (name == "stack") {
    return SpaceKind::kStack;
  }
  return SpaceKind::kOther;
}

}  // namespace pcodex::pcode
