#pragma once

#include <filesystem>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/listing/listing.hpp"

namespace pcodex::listing {

// Parse a YAML listing file.
// Returns a host-error Diagnostic (with file and line where known) on I/O
// errors, unknown or missing fields and malformed values.
auto LoadListing(const std::filesystem::path& path) -> Result<Listing>;

}  // namespace pcodex::listing
