#include <gtest/gtest.h>

#include <string>

#include "pcodex/common/diagnostic.hpp"
#include "pcodex/listing/listing_loader.hpp"
#include "pcodex/pcode/datatype_properties.hpp"
#include "tests/common/sample_listing.hpp"
#include "tests/common/temp_dir.hpp"

namespace pcodex::listing {
namespace {

class ListingLoaderTest : public ::testing::Test {
 protected:
  // Load `content` and return the diagnostic text; fails if loading succeeds
  auto LoadError(const std::string& content) -> std::string {
    auto path = dir_.Write("listing.yaml", content);
    auto result = LoadListing(path);
    EXPECT_FALSE(result.has_value());
    if (result) {
      return "";
    }
    return FormatDiagnostic(result.error());
  }

  test::TempDir dir_;
};

constexpr const char* kHeader = R"(architecture: test
stack_pointer: SP
registers:
  - {name: SP, offset: 0x8, size: 4}
)";

TEST_F(ListingLoaderTest, LoadsSampleListing) {
  auto path = dir_.Write("listing.yaml", test::kSampleListing);

  auto listing = LoadListing(path);

  ASSERT_TRUE(listing.has_value()) << FormatDiagnostic(listing.error());
  EXPECT_EQ(listing->architecture, "x86:LE:32:default");
  EXPECT_EQ(listing->stack_pointer, "ESP");
  EXPECT_EQ(listing->registers.Entries().size(), 5U);
  ASSERT_EQ(listing->functions.size(), 1U);

  const auto& function = listing->functions[0];
  EXPECT_EQ(function.name, "main");
  EXPECT_EQ(function.address, 0x401000U);
  ASSERT_EQ(function.blocks.size(), 1U);
  ASSERT_EQ(function.blocks[0].instructions.size(), 2U);

  const auto& push = function.blocks[0].instructions[1];
  EXPECT_EQ(push.assembly, "PUSH EBP");
  ASSERT_EQ(push.pcode.size(), 3U);
  const auto& store = push.pcode[2];
  EXPECT_EQ(store.Mnemonic(), "STORE");
  EXPECT_EQ(store.NumInputs(), 3U);
  EXPECT_EQ(store.Output(), nullptr);
  ASSERT_NE(store.Input(2), nullptr);
  EXPECT_EQ(store.Input(2)->space.kind, pcode::SpaceKind::kUnique);
  EXPECT_EQ(store.Input(2)->offset, 0xe80U);
}

TEST_F(ListingLoaderTest, DatatypeSectionOverridesBase) {
  auto path = dir_.Write("listing.yaml", test::kSampleListing);
  auto listing = LoadListing(path);
  ASSERT_TRUE(listing.has_value());

  pcode::DatatypeProperties base;
  base.char_size = 2;
  auto props = listing->ResolveDatatypes(base);

  EXPECT_EQ(props.pointer_size, 4U);
  EXPECT_EQ(props.long_size, 4U);
  EXPECT_EQ(props.char_size, 2U);
}

TEST_F(ListingLoaderTest, NullInputIsAbsentSlot) {
  auto path = dir_.Write(
      "listing.yaml", std::string(kHeader) + R"(functions:
  - name: f
    address: 16
    blocks:
      - address: 16
        instructions:
          - address: 16
            assembly: BR
            pcode:
              - mnemonic: CBRANCH
                inputs:
                  - {space: ram, offset: 0x20, size: 4}
                  - ~
                  - {space: const, offset: 0, size: 1}
)");

  auto listing = LoadListing(path);

  ASSERT_TRUE(listing.has_value()) << FormatDiagnostic(listing.error());
  const auto& op = listing->functions[0].blocks[0].instructions[0].pcode[0];
  EXPECT_EQ(op.NumInputs(), 3U);
  EXPECT_NE(op.Input(0), nullptr);
  EXPECT_EQ(op.Input(1), nullptr);
  EXPECT_NE(op.Input(2), nullptr);
  EXPECT_EQ(listing->functions[0].address, 16U);
}

TEST_F(ListingLoaderTest, MissingFileIsHostError) {
  auto result = LoadListing(dir_.Path() / "missing.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().primary.kind, DiagKind::kHostError);
  EXPECT_NE(
      result.error().primary.message.find("cannot open listing"),
      std::string::npos);
}

TEST_F(ListingLoaderTest, UnknownFieldReportsLine) {
  auto text = LoadError(std::string(kHeader) + "functions: []\nbogus: 1\n");

  EXPECT_NE(text.find("unknown field 'bogus'"), std::string::npos) << text;
  EXPECT_NE(text.find("listing.yaml:6:"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, EmptyMnemonicIsRejected) {
  auto text = LoadError(std::string(kHeader) + R"(functions:
  - name: f
    address: 0
    blocks:
      - address: 0
        instructions:
          - address: 0
            assembly: NOP
            pcode:
              - mnemonic: ""
)");

  EXPECT_NE(text.find("empty mnemonic"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, MalformedNumberIsRejected) {
  auto text = LoadError(std::string(kHeader) + R"(functions:
  - name: f
    address: 0x40zz
)");

  EXPECT_NE(text.find("malformed number '0x40zz'"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, OversizedVarnodeIsRejected) {
  auto text = LoadError(std::string(kHeader) + R"(functions:
  - name: f
    address: 0
    blocks:
      - address: 0
        instructions:
          - address: 0
            assembly: NOP
            pcode:
              - mnemonic: COPY
                inputs:
                  - {space: const, offset: 0x1, size: 0x100000004}
)");

  EXPECT_NE(text.find("listing.yaml:16:"), std::string::npos) << text;
  EXPECT_NE(text.find("size 0x100000004 is out of range"), std::string::npos)
      << text;
}

TEST_F(ListingLoaderTest, ZeroSizedVarnodeIsLoaded) {
  auto path = dir_.Write("listing.yaml", std::string(kHeader) + R"(functions:
  - name: f
    address: 0
    blocks:
      - address: 0
        instructions:
          - address: 0
            assembly: NOP
            pcode:
              - mnemonic: COPY
                inputs:
                  - {space: const, offset: 0x1, size: 0}
)");

  auto listing = LoadListing(path);

  ASSERT_TRUE(listing.has_value()) << FormatDiagnostic(listing.error());
  const auto& op = listing->functions[0].blocks[0].instructions[0].pcode[0];
  ASSERT_NE(op.Input(0), nullptr);
  EXPECT_EQ(op.Input(0)->size, 0U);
}

TEST_F(ListingLoaderTest, UnknownStackPointerIsRejected) {
  auto text = LoadError(R"(architecture: test
stack_pointer: RSP
functions: []
)");

  EXPECT_NE(text.find("stack pointer 'RSP'"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, BaseRegisterMustContainRegister) {
  auto text = LoadError(R"(architecture: test
stack_pointer: SP
registers:
  - {name: SP, offset: 0x8, size: 4}
  - {name: BAD, offset: 0x20, size: 2, base: SP}
functions: []
)");

  EXPECT_NE(text.find("does not lie inside"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, SelfBaseRegisterIsRejected) {
  auto text = LoadError(R"(architecture: test
stack_pointer: SP
registers:
  - {name: SP, offset: 0x8, size: 4, base: SP}
functions: []
)");

  EXPECT_NE(text.find("listing.yaml:4:"), std::string::npos) << text;
  EXPECT_NE(text.find("'SP' is its own base"), std::string::npos) << text;
}

TEST_F(ListingLoaderTest, UnknownDatatypeIsRejected) {
  auto text = LoadError(std::string(kHeader) + R"(datatypes:
  wchar_size: 2
functions: []
)");

  EXPECT_NE(text.find("unknown field 'wchar_size'"), std::string::npos)
      << text;
}

TEST_F(ListingLoaderTest, MalformedYamlIsHostError) {
  auto text = LoadError("architecture: [unclosed\n");

  EXPECT_NE(text.find("malformed YAML"), std::string::npos) << text;
}

}  // namespace
}  // namespace pcodex::listing
