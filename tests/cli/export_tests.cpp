#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "tests/cli/cli_test_fixture.hpp"
#include "tests/common/sample_listing.hpp"

namespace pcodex::test {
namespace {

class ExportCliTest : public CliTestFixture {
 protected:
  void SetUp() override {
    CliTestFixture::SetUp();
    WriteFile("listing.yaml", kSampleListing);
  }
};

TEST_F(ExportCliTest, WritesJsonFile) {
  auto result = Run({"export", "listing.yaml", "-o", "out.json"});

  ASSERT_TRUE(result.Success()) << result.output;
  ASSERT_TRUE(FileExists("out.json"));
  auto j = nlohmann::json::parse(ReadFile("out.json"));
  EXPECT_EQ(j["cpu_architecture"], "x86:LE:32:default");
  EXPECT_EQ(j["datatype_properties"]["pointer_size"], 4);
  const auto& store =
      j["functions"][0]["blocks"][0]["instructions"][1]["pcode"][2];
  EXPECT_EQ(store["pcode_mnemonic"], "STORE");
  EXPECT_EQ(store["pcode_index"], 2);
  EXPECT_FALSE(store.contains("output"));
}

TEST_F(ExportCliTest, CompactFlagOverridesConfig) {
  WriteFile("pcodex.toml", "[export]\npretty = true\nindent = 4\n");

  auto result = Run({"export", "listing.yaml", "--compact", "-o", "out.json"});

  ASSERT_TRUE(result.Success()) << result.output;
  auto text = ReadFile("out.json");
  EXPECT_EQ(text.find('\n'), text.size() - 1);
}

TEST_F(ExportCliTest, ConfigDatatypesYieldToListing) {
  WriteFile(
      "pcodex.toml", "[datatypes]\npointer_size = 2\nshort_size = 4\n");

  auto result = Run({"export", "listing.yaml", "-o", "out.json"});

  ASSERT_TRUE(result.Success()) << result.output;
  auto j = nlohmann::json::parse(ReadFile("out.json"));
  EXPECT_EQ(j["datatype_properties"]["pointer_size"], 4);
  EXPECT_EQ(j["datatype_properties"]["short_size"], 4);
}

TEST_F(ExportCliTest, MissingListingFails) {
  auto result = Run({"export", "nope.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.output.find("cannot open listing"), std::string::npos)
      << result.output;
}

TEST_F(ExportCliTest, BadConfigFails) {
  WriteFile("custom.toml", "[datatypes]\nptr = 4\n");

  auto result = Run({"export", "listing.yaml", "--config", "custom.toml"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.output.find("custom.toml:2:"), std::string::npos)
      << result.output;
}

}  // namespace
}  // namespace pcodex::test
