#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pcodex/pcode/naming_context.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::test {

inline auto Reg(uint64_t offset, uint32_t size) -> pcode::RawVarnode {
  return {
      .space = pcode::AddressSpace::Named("register"),
      .offset = offset,
      .size = size};
}

inline auto Const(uint64_t value, uint32_t size) -> pcode::RawVarnode {
  return {
      .space = pcode::AddressSpace::Named("const"),
      .offset = value,
      .size = size};
}

inline auto Ram(uint64_t address, uint32_t size) -> pcode::RawVarnode {
  return {
      .space = pcode::AddressSpace::Named("ram"),
      .offset = address,
      .size = size};
}

inline auto Unique(uint64_t offset, uint32_t size) -> pcode::RawVarnode {
  return {
      .space = pcode::AddressSpace::Named("unique"),
      .offset = offset,
      .size = size};
}

// Raw operation assembled slot by slot
class FakeOperation final : public pcode::RawOperation {
 public:
  explicit FakeOperation(std::string mnemonic)
      : mnemonic_(std::move(mnemonic)) {
  }

  auto WithInput(std::optional<pcode::RawVarnode> input) -> FakeOperation& {
    inputs_.push_back(std::move(input));
    return *this;
  }

  auto WithOutput(pcode::RawVarnode output) -> FakeOperation& {
    output_ = std::move(output);
    return *this;
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

// x86-like register names; counts lookups
class FakeNaming final : public pcode::NamingContext {
 public:
  FakeNaming() {
    names_[{0x0, 4}] = "EAX";
    names_[{0x4, 4}] = "ECX";
    names_[{0x8, 4}] = "EDX";
    names_[{0x10, 4}] = "ESP";
    names_[{0x0, 2}] = "AX";
  }

  [[nodiscard]] auto RegisterName(uint64_t offset, uint32_t size) const
      -> std::optional<std::string> override {
    lookups_.fetch_add(1, std::memory_order_relaxed);
    auto it = names_.find({offset, size});
    if (it == names_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] auto Lookups() const -> int {
    return lookups_.load(std::memory_order_relaxed);
  }

 private:
  std::map<std::pair<uint64_t, uint32_t>, std::string> names_;
  mutable std::atomic<int> lookups_{0};
};

}  // namespace pcodex::test
