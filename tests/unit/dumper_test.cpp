#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pcodex/exporter/dumper.hpp"
#include "pcodex/exporter/exporter.hpp"
#include "pcodex/listing/listing_loader.hpp"
#include "pcodex/pcode/datatype_properties.hpp"
#include "tests/common/sample_listing.hpp"
#include "tests/common/temp_dir.hpp"

namespace pcodex::exporter {
namespace {

TEST(DumperTest, DumpsSampleProgram) {
  test::TempDir dir;
  auto listing =
      listing::LoadListing(dir.Write("listing.yaml", test::kSampleListing));
  ASSERT_TRUE(listing.has_value());
  auto program = ExportProgram(
      *listing, listing->ResolveDatatypes(pcode::DatatypeProperties{}));
  ASSERT_TRUE(program.has_value());

  std::ostringstream out;
  Dumper dumper(&out);
  dumper.Dump(*program);

  EXPECT_EQ(
      out.str(),
      "program x86:LE:32:default (stack pointer ESP:4)\n"
      "function main @ 0x401000\n"
      "  block 0x401000\n"
      "    0x401000: MOV EAX,0x1\n"
      "      #0 EAX:4 = COPY 0x1:4\n"
      "    0x401005: PUSH EBP\n"
      "      #0 $Ue80:4 = COPY EBP:4\n"
      "      #1 ESP:4 = INT_SUB ESP:4, 0x4:4\n"
      "      #2 STORE 0x1b1:8, ESP:4, $Ue80:4\n");
}

}  // namespace
}  // namespace pcodex::exporter
