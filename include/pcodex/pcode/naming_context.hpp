#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pcodex::pcode {

// Resolves register storage locations to symbolic names within the program
// being exported. Implementations must be safe for concurrent const use.
class NamingContext {
 public:
  NamingContext() = default;
  NamingContext(const NamingContext&) = default;
  NamingContext(NamingContext&&) = default;
  auto operator=(const NamingContext&) -> NamingContext& = default;
  auto operator=(NamingContext&&) -> NamingContext& = default;
  virtual ~NamingContext() = default;

  // Name of the register occupying exactly [offset, offset + size) in the
  // register space, or nullopt if there is none.
  [[nodiscard]] virtual auto RegisterName(uint64_t offset, uint32_t size) const
      -> std::optional<std::string> = 0;
};

}  // namespace pcodex::pcode
