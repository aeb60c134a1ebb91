#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace pcodex::common {

// Exception type for internal pcodex errors (bugs, not malformed input)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace pcodex::common
