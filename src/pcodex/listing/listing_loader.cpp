#include "pcodex/listing/listing_loader.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

// NOLINTNEXTLINE(misc-include-cleaner): yaml.h is the public API
#include <yaml-cpp/yaml.h>

#include "pcodex/pcode/datatype_properties.hpp"
#include "pcodex/pcode/raw_operation.hpp"

namespace pcodex::listing {

namespace {

// Walks one listing document; every error throws DiagnosticException
class ListingReader {
 public:
  explicit ListingReader(std::string path) : path_(std::move(path)) {
  }

  auto Read(const YAML::Node& root) -> Listing {
    RequireMap(root, "listing");
    ValidateKeys(
        root,
        {"architecture", "stack_pointer", "datatypes", "registers",
         "functions"},
        "listing");

    Listing listing;
    listing.path = path_;
    listing.architecture = RequireString(root, "architecture", "listing");
    listing.stack_pointer = RequireString(root, "stack_pointer", "listing");

    if (auto datatypes = root["datatypes"]) {
      ReadDatatypes(datatypes, listing);
    }
    if (auto registers = root["registers"]) {
      ReadRegisters(registers, listing.registers);
    }
    if (listing.registers.Find(listing.stack_pointer) == nullptr) {
      throw Error(
          root["stack_pointer"],
          std::format(
              "stack pointer '{}' is not a listed register",
              listing.stack_pointer));
    }

    auto functions = root["functions"];
    if (!functions) {
      throw Error(root, "listing: missing required field 'functions'");
    }
    RequireSequence(functions, "functions");
    for (const auto& node : functions) {
      listing.functions.push_back(ReadFunction(node));
    }
    return listing;
  }

 private:
  [[nodiscard]] auto Error(const YAML::Node& node, std::string msg) const
      -> DiagnosticException {
    auto mark = node.Mark();
    uint32_t line = mark.is_null() ? 0 : static_cast<uint32_t>(mark.line + 1);
    return DiagnosticException(
        Diagnostic::HostError(
            FileSpan{.path = path_, .line = line}, std::move(msg)));
  }

  void RequireMap(const YAML::Node& node, std::string_view context) const {
    if (!node.IsMap()) {
      throw Error(node, std::format("{}: expected a mapping", context));
    }
  }

  void RequireSequence(const YAML::Node& node, std::string_view context) const {
    if (!node.IsSequence()) {
      throw Error(node, std::format("{}: expected a sequence", context));
    }
  }

  void ValidateKeys(
      const YAML::Node& node, std::initializer_list<std::string_view> allowed,
      std::string_view context) const {
    for (const auto& pair : node) {
      auto key = pair.first.as<std::string>();
      bool found = std::ranges::find(allowed, key) != allowed.end();
      if (!found) {
        throw Error(
            pair.first, std::format("unknown field '{}' in {}", key, context));
      }
    }
  }

  auto RequireString(
      const YAML::Node& node, const char* key, std::string_view context) const
      -> std::string {
    auto value = node[key];
    if (!value) {
      throw Error(
          node,
          std::format("{}: missing required field '{}'", context, key));
    }
    if (!value.IsScalar()) {
      throw Error(
          value, std::format("{}: field '{}' must be a string", context, key));
    }
    return value.as<std::string>();
  }

  // Accepts decimal or 0x-prefixed hexadecimal
  auto ParseNumber(const YAML::Node& node, std::string_view what) const
      -> uint64_t {
    if (!node.IsScalar()) {
      throw Error(node, std::format("{}: expected a number", what));
    }
    const auto& text = node.Scalar();
    std::string_view digits = text;
    int base = 10;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
      digits.remove_prefix(2);
      base = 16;
    }
    uint64_t value = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
    if (digits.empty() || ec != std::errc{} || ptr != end) {
      throw Error(
          node, std::format("{}: malformed number '{}'", what, text));
    }
    return value;
  }

  auto RequireNumber(
      const YAML::Node& node, const char* key, std::string_view context) const
      -> uint64_t {
    auto value = node[key];
    if (!value) {
      throw Error(
          node,
          std::format("{}: missing required field '{}'", context, key));
    }
    return ParseNumber(value, std::format("{}.{}", context, key));
  }

  auto RequireSize(
      const YAML::Node& node, const char* key, std::string_view context) const
      -> uint32_t {
    auto value = RequireNumber(node, key, context);
    if (value == 0 || value > std::numeric_limits<uint32_t>::max()) {
      throw Error(
          node[key],
          std::format("{}: field '{}' must be a positive size", context, key));
    }
    return static_cast<uint32_t>(value);
  }

  void ReadDatatypes(const YAML::Node& node, Listing& listing) const {
    RequireMap(node, "datatypes");
    pcode::DatatypeProperties probe;
    for (const auto& pair : node) {
      auto name = pair.first.as<std::string>();
      if (!pcode::SetDatatypeSize(probe, name, 1)) {
        throw Error(
            pair.first,
            std::format("unknown field '{}' in datatypes", name));
      }
      listing.datatypes.push_back(
          DatatypeOverride{
              .name = name, .size = RequireSize(node, name.c_str(), "datatypes")});
    }
  }

  void ReadRegisters(const YAML::Node& node, RegisterTable& table) const {
    RequireSequence(node, "registers");
    for (const auto& item : node) {
      RequireMap(item, "register");
      ValidateKeys(item, {"name", "offset", "size", "base"}, "register");
      RegisterEntry entry{
          .name = RequireString(item, "name", "register"),
          .offset = RequireNumber(item, "offset", "register"),
          .size = RequireSize(item, "size", "register"),
          .base = {},
      };
      if (auto base = item["base"]) {
        entry.base = base.as<std::string>();
        if (entry.base == entry.name) {
          throw Error(
              base, std::format("register '{}' is its own base", entry.name));
        }
      }
      if (!table.Add(entry)) {
        throw Error(
            item, std::format(
                      "register '{}' duplicates an earlier name or location",
                      entry.name));
      }
    }

    // Base registers may be listed after the registers they contain
    for (const auto& entry : table.Entries()) {
      if (entry.base.empty()) {
        continue;
      }
      const auto* base = table.Find(entry.base);
      if (base == nullptr) {
        throw Error(
            node, std::format(
                      "register '{}' names unknown base register '{}'",
                      entry.name, entry.base));
      }
      bool contained = base->offset <= entry.offset &&
                       entry.offset + entry.size <= base->offset + base->size;
      if (!contained) {
        throw Error(
            node, std::format(
                      "register '{}' does not lie inside base register '{}'",
                      entry.name, entry.base));
      }
    }
  }

  auto ReadVarnode(const YAML::Node& node, std::string_view context) const
      -> pcode::RawVarnode {
    RequireMap(node, context);
    ValidateKeys(node, {"space", "offset", "size"}, context);
    auto space = RequireString(node, "space", context);
    if (space.empty()) {
      throw Error(node, std::format("{}: empty address space name", context));
    }
    auto offset = RequireNumber(node, "offset", context);
    // Zero sizes are passed through; operand resolution rejects them
    auto size = RequireNumber(node, "size", context);
    if (size > std::numeric_limits<uint32_t>::max()) {
      throw Error(
          node["size"],
          std::format("{}: size 0x{:x} is out of range", context, size));
    }
    return pcode::RawVarnode{
        .space = pcode::AddressSpace::Named(std::move(space)),
        .offset = offset,
        .size = static_cast<uint32_t>(size),
    };
  }

  auto ReadOperation(const YAML::Node& node) const -> ListedOperation {
    RequireMap(node, "pcode");
    ValidateKeys(node, {"mnemonic", "inputs", "output"}, "pcode");
    auto mnemonic = RequireString(node, "mnemonic", "pcode");
    if (mnemonic.empty()) {
      throw Error(node, "pcode: empty mnemonic");
    }

    std::vector<std::optional<pcode::RawVarnode>> inputs;
    if (auto input_nodes = node["inputs"]) {
      RequireSequence(input_nodes, "pcode.inputs");
      for (const auto& input : input_nodes) {
        if (input.IsNull()) {
          inputs.emplace_back(std::nullopt);
        } else {
          inputs.emplace_back(ReadVarnode(input, "pcode.inputs"));
        }
      }
    }

    std::optional<pcode::RawVarnode> output;
    auto output_node = node["output"];
    if (output_node && !output_node.IsNull()) {
      output = ReadVarnode(output_node, "pcode.output");
    }
    return ListedOperation(
        std::move(mnemonic), std::move(inputs), std::move(output));
  }

  auto ReadInstruction(const YAML::Node& node) const -> ListedInstruction {
    RequireMap(node, "instruction");
    ValidateKeys(node, {"address", "assembly", "pcode"}, "instruction");
    ListedInstruction instruction{
        .address = RequireNumber(node, "address", "instruction"),
        .assembly = RequireString(node, "assembly", "instruction"),
        .pcode = {},
    };
    if (auto ops = node["pcode"]) {
      RequireSequence(ops, "instruction.pcode");
      for (const auto& op : ops) {
        instruction.pcode.push_back(ReadOperation(op));
      }
    }
    return instruction;
  }

  auto ReadBlock(const YAML::Node& node) const -> ListedBlock {
    RequireMap(node, "block");
    ValidateKeys(node, {"address", "instructions"}, "block");
    ListedBlock block{
        .address = RequireNumber(node, "address", "block"),
        .instructions = {},
    };
    if (auto instructions = node["instructions"]) {
      RequireSequence(instructions, "block.instructions");
      for (const auto& instruction : instructions) {
        block.instructions.push_back(ReadInstruction(instruction));
      }
    }
    return block;
  }

  auto ReadFunction(const YAML::Node& node) const -> ListedFunction {
    RequireMap(node, "function");
    ValidateKeys(node, {"name", "address", "blocks"}, "function");
    ListedFunction function{
        .name = RequireString(node, "name", "function"),
        .address = RequireNumber(node, "address", "function"),
        .blocks = {},
    };
    if (auto blocks = node["blocks"]) {
      RequireSequence(blocks, "function.blocks");
      for (const auto& block : blocks) {
        function.blocks.push_back(ReadBlock(block));
      }
    }
    return function;
  }

  std::string path_;
};

}  // namespace

auto LoadListing(const std::filesystem::path& path) -> Result<Listing> {
  YAML::Node root;
  try {
    // NOLINTNEXTLINE(misc-include-cleaner): LoadFile is provided by yaml.h
    root = YAML::LoadFile(path.string());
  } catch (const YAML::BadFile&) {
    return std::unexpected(Diagnostic::HostError(
        std::format("cannot open listing '{}'", path.string())));
  } catch (const YAML::ParserException& e) {
    return std::unexpected(Diagnostic::HostError(
        FileSpan{
            .path = path.string(),
            .line = static_cast<uint32_t>(e.mark.line + 1)},
        std::format("malformed YAML: {}", e.msg)));
  }

  try {
    return ListingReader(path.string()).Read(root);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  } catch (const YAML::Exception& e) {
    // Conversion failures (e.g. a mapping where a string was expected)
    return std::unexpected(Diagnostic::HostError(
        FileSpan{
            .path = path.string(),
            .line = static_cast<uint32_t>(e.mark.line + 1)},
        e.msg));
  }
}

}  // namespace pcodex::listing
