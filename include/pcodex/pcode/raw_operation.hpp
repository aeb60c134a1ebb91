#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace pcodex::pcode {

enum class SpaceKind : uint8_t {
  kRegister,
  kConstant,
  kRam,
  kUnique,
  kStack,
  kOther,
};

// Maps an engine space name ("register", "const", "ram", "unique", "stack")
// to its kind. Unrecognized names map to kOther.
auto SpaceKindFromName(std::string_view name) -> SpaceKind;

struct AddressSpace {
  std::string name;
  SpaceKind kind = SpaceKind::kOther;

  static auto Named(std::string name) -> AddressSpace {
    auto kind = SpaceKindFromName(name);
    return AddressSpace{.name = std::move(name), .kind = kind};
  }

  auto operator==(const AddressSpace&) const -> bool = default;
};

// One operand as the analysis engine hands it over: a storage location of
// `size` bytes at `offset` in `space`.
struct RawVarnode {
  AddressSpace space;
  uint64_t offset = 0;
  uint32_t size = 0;

  auto operator==(const RawVarnode&) const -> bool = default;
};

// A single low-level operation produced by an external analysis engine.
// Input slots and the output may be absent, in which case the accessors
// return nullptr. Returned pointers stay valid as long as the operation does.
class RawOperation {
 public:
  RawOperation() = default;
  RawOperation(const RawOperation&) = default;
  RawOperation(RawOperation&&) = default;
  auto operator=(const RawOperation&) -> RawOperation& = default;
  auto operator=(RawOperation&&) -> RawOperation& = default;
  virtual ~RawOperation() = default;

  [[nodiscard]] virtual auto Mnemonic() const -> std::string_view = 0;
  [[nodiscard]] virtual auto NumInputs() const -> std::size_t = 0;
  [[nodiscard]] virtual auto Input(std::size_t slot) const
      -> const RawVarnode* = 0;
  [[nodiscard]] virtual auto Output() const -> const RawVarnode* = 0;
};

}  // namespace pcodex::pcode
