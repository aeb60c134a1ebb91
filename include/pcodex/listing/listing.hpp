#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/naming_context.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::listing {

// Raw operation as read from a listing file.
class ListedOperation final : public pcode::RawOperation {
 public:
  ListedOperation(
      std::string mnemonic, std::vector<std::optional<pcode::RawVarnode>> inputs,
      std::optional<pcode::RawVarnode> output)
      : mnemonic_(std::move(mnemonic)),
        inputs_(std::move(inputs)),
        output_(std::move(output)) {
  }

  [[nodiscard]] auto Mnemonic() const -> std::string_view override {
    return mnemonic_;
  }

  [[nodiscard]] auto NumInputs() const -> std::size_t override {
    return inputs_.size();
  }

  [[nodiscard]] auto Input(std::size_t slot) const
      -> const pcode::RawVarnode* override {
    if (slot >= inputs_.size() || !inputs_[slot]) {
      return nullptr;
    }
    return &*inputs_[slot];
  }

  [[nodiscard]] auto Output() const -> const pcode::RawVarnode* override {
    return output_ ? &*output_ : nullptr;
  }

 private:
  std::string mnemonic_;
  std::vector<std::optional<pcode::RawVarnode>> inputs_;
  std::optional<pcode::RawVarnode> output_;
};

struct ListedInstruction {
  uint64_t address = 0;
  std::string assembly;
  std::vector<ListedOperation> pcode;
};

struct ListedBlock {
  uint64_t address = 0;
  std::vector<ListedInstruction> instructions;
};

struct ListedFunction {
  std::string name;
  uint64_t address = 0;
  std::vector<ListedBlock> blocks;
};

struct RegisterEntry {
  std::string name;
  uint64_t offset = 0;
  uint32_t size = 0;
  // Name of the enclosing register; empty when this is a base register
  std::string base;
};

// Register naming context backed by the listing's register list.
// Lookups are exact on (offset, size).
class RegisterTable final : public pcode::NamingContext {
 public:
  // Returns false if the name or the (offset, size) location is already taken.
  auto Add(RegisterEntry entry) -> bool;

  [[nodiscard]] auto RegisterName(uint64_t offset, uint32_t size) const
      -> std::optional<std::string> override;

  [[nodiscard]] auto Find(std::string_view name) const -> const RegisterEntry*;

  // The outermost register containing `entry` (entry itself for base
  // registers). Follows `base` links; stops at unknown names.
  [[nodiscard]] auto BaseOf(const RegisterEntry& entry) const
      -> const RegisterEntry&;

  [[nodiscard]] auto Entries() const -> const std::vector<RegisterEntry>& {
    return entries_;
  }

 private:
  std::vector<RegisterEntry> entries_;
  absl::flat_hash_map<std::pair<uint64_t, uint32_t>, std::size_t> by_location_;
  absl::flat_hash_map<std::string, std::size_t> by_name_;
};

struct DatatypeOverride {
  std::string name;
  uint32_t size = 0;
};

// Everything an analysis engine exported about one program.
struct Listing {
  std::string path;
  std::string architecture;
  std::string stack_pointer;
  std::vector<DatatypeOverride> datatypes;
  RegisterTable registers;
  std::vector<ListedFunction> functions;

  // Apply the listing's datatype section on top of `base`
  [[nodiscard]] auto ResolveDatatypes(const pcode::DatatypeProperties& base)
      const -> pcode::DatatypeProperties;
};

}  // namespace pcodex::listing
