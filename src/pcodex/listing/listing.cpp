#include "pcodex/listing/listing.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "pcodex/common/internal_error.hpp"

namespace pcodex::listing {

auto RegisterTable::Add(RegisterEntry entry) -> bool {
  auto location = std::make_pair(entry.offset, entry.size);
  if (by_name_.contains(entry.name) || by_location_.contains(location)) {
    return false;
  }
  std::size_t index = entries_.size();
  by_name_.emplace(entry.name, index);
  by_location_.emplace(location, index);
  entries_.push_back(std::move(entry));
  return true;
}

auto RegisterTable::RegisterName(uint64_t offset, uint32_t size) const
    -> std::optional<std::string> {
  auto it = by_location_.find(std::make_pair(offset, size));
  if (it == by_location_.end()) {
    return std::nullopt;
  }
  return entries_[it->second].name;
}

auto RegisterTable::Find(std::string_view name) const -> const RegisterEntry* {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

auto RegisterTable::BaseOf(const RegisterEntry& entry) const
    -> const RegisterEntry& {
  const RegisterEntry* current = &entry;
  // A chain longer than the table means the base links form a cycle
  for (std::size_t step = 0; step <= entries_.size(); ++step) {
    if (current->base.empty()) {
      return *current;
    }
    const RegisterEntry* parent = Find(current->base);
    if (parent == nullptr) {
      return *current;
    }
    current = parent;
  }
  common::ThrowInternalError(
      "RegisterTable::BaseOf", "cyclic base register chain at " + entry.name);
}

auto Listing::ResolveDatatypes(const pcode::DatatypeProperties& base) const
    -> pcode::DatatypeProperties {
  pcode::DatatypeProperties props = base;
  for (const auto& override_entry : datatypes) {
    if (!pcode::SetDatatypeSize(props, override_entry.name, override_entry.size)) {
      common::ThrowInternalError(
          "Listing::ResolveDatatypes",
          "unvalidated datatype field " + override_entry.name);
    }
  }
  return props;
}

}  // namespace pcodex::listing
