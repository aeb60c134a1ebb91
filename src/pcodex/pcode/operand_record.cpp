#include "pcodex/pcode/operand_record.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "pcodex/common/internal_error.hpp"

namespace pcodex::pcode {

namespace {

auto TruncateToSize(uint64_t value, uint32_t size) -> uint64_t {
  if (size >= sizeof(uint64_t)) {
    return value;
  }
  return value & ((uint64_t{1} << (size * 8)) - 1);
}

auto DescribeVarnode(const RawVarnode& varnode) -> std::string {
  return fmt::format(
      "({}, 0x{:x}, {})", varnode.space.name, varnode.offset, varnode.size);
}

}  // namespace

auto BuildOperandRecord(
    const RawVarnode& varnode, const NamingContext& naming,
    const DatatypeProperties& datatypes) -> OperandRecord {
  if (varnode.size == 0) {
    throw ResolutionError(
        fmt::format("zero-sized operand {}", DescribeVarnode(varnode)));
  }

  OperandRecord record{
      .size = varnode.size,
      .address_space = varnode.space.name,
      .id = {},
  };

  switch (varnode.space.kind) {
    case SpaceKind::kRegister: {
      auto name = naming.RegisterName(varnode.offset, varnode.size);
      if (!name) {
        throw ResolutionError(
            fmt::format("no register named at {}", DescribeVarnode(varnode)));
      }
      record.id = std::move(*name);
      return record;
    }
    case SpaceKind::kConstant:
      record.id =
          fmt::format("0x{:x}", TruncateToSize(varnode.offset, varnode.size));
      return record;
    case SpaceKind::kRam:
    case SpaceKind::kStack:
      record.id = fmt::format(
          "0x{:0{}x}", varnode.offset, datatypes.pointer_size * 2);
      return record;
    case SpaceKind::kUnique:
      record.id = fmt::format("$U{:x}", varnode.offset);
      return record;
    case SpaceKind::kOther:
      record.id = fmt::format("{}:0x{:x}", varnode.space.name, varnode.offset);
      return record;
  }
  common::ThrowInternalError(
      "BuildOperandRecord", "unhandled address space kind");
}

}  // namespace pcodex::pcode
