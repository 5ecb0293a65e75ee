// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <cctype>
#include <stdexcept>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop

#include "listing.hpp"

namespace fnsig {

namespace {

// Keeps the source name and the path of the node being read for error messages.
class ListingReader {
 public:
  ListingReader(std::string const & source_) : source(source_) {}

  void read(YAML::Node const & root, ListingBackend & listing) const;

 private:
  [[noreturn]] void error(YAML::Node const & node, std::string const & msg) const;
  YAML::Node require(YAML::Node const & map, char const * key) const;
  address_t address(YAML::Node const & node) const;
  std::vector<address_t> addresses(YAML::Node const & map, char const * key) const;
  OperandInfo operand(YAML::Node const & node) const;
  InstructionInfo instruction(YAML::Node const & node) const;
  BasicBlockInfo block(YAML::Node const & node) const;
  ListingFunction function(YAML::Node const & node) const;

  std::string source;
};

void ListingReader::error(YAML::Node const & node, std::string const & msg) const
{
  auto mark = node.Mark();
  std::string where = source;
  if (mark.line >= 0) {
    where += ":" + std::to_string(mark.line + 1);
  }
  throw ListingError(where + ": " + msg);
}

YAML::Node ListingReader::require(YAML::Node const & map, char const * key) const
{
  if (!map.IsMap()) {
    error(map, "expected a map");
  }
  YAML::Node value = map[key];
  if (!value) {
    error(map, std::string("missing required key '") + key + "'");
  }
  return value;
}

address_t ListingReader::address(YAML::Node const & node) const
{
  if (!node.IsScalar()) {
    error(node, "expected an address");
  }
  try {
    return parse_number(node.Scalar());
  } catch (std::logic_error const &) {
    error(node, "invalid address '" + node.Scalar() + "'");
  }
}

std::vector<address_t> ListingReader::addresses(YAML::Node const & map, char const * key) const
{
  std::vector<address_t> result;
  YAML::Node list = map[key];
  if (!list) {
    return result;
  }
  if (!list.IsSequence()) {
    error(list, std::string("expected a list of addresses for '") + key + "'");
  }
  for (auto const & item : list) {
    result.push_back(address(item));
  }
  return result;
}

OperandInfo ListingReader::operand(YAML::Node const & node) const
{
  if (node.IsMap()) {
    OperandInfo op(require(node, "text").as<std::string>());
    YAML::Node value = node["value"];
    if (value) {
      op.value = address(value);
      op.immediate = true;
    }
    YAML::Node imm = node["immediate"];
    if (imm) {
      op.immediate = imm.as<bool>();
    }
    return op;
  }
  if (!node.IsScalar()) {
    error(node, "expected an operand");
  }

  std::string const & text = node.Scalar();
  bool negative = !text.empty() && text[0] == '-';
  std::string digits = negative ? text.substr(1) : text;
  if (!digits.empty() && std::isdigit(static_cast<unsigned char>(digits[0]))) {
    try {
      std::uint64_t v = parse_number(digits);
      return OperandInfo(text, negative ? ~v + 1 : v);
    } catch (std::logic_error const &) {
      // Not a number after all (e.g. "4*ecx")
    }
  }
  return OperandInfo(text);
}

InstructionInfo ListingReader::instruction(YAML::Node const & node) const
{
  InstructionInfo insn;
  insn.address = address(require(node, "address"));
  insn.mnemonic = require(node, "mnemonic").as<std::string>();
  YAML::Node ops = node["operands"];
  if (ops) {
    if (!ops.IsSequence()) {
      error(ops, "expected a list of operands");
    }
    for (auto const & op : ops) {
      insn.operands.push_back(operand(op));
    }
  }
  YAML::Node call = node["call"];
  insn.is_call = call ? call.as<bool>() : false;
  insn.code_refs = addresses(node, "code_refs");
  insn.data_refs = addresses(node, "data_refs");
  return insn;
}

BasicBlockInfo ListingReader::block(YAML::Node const & node) const
{
  BasicBlockInfo bb;
  bb.address = address(require(node, "address"));
  YAML::Node insns = require(node, "instructions");
  if (!insns.IsSequence()) {
    error(insns, "expected a list of instructions");
  }
  for (auto const & insn : insns) {
    bb.instructions.push_back(instruction(insn));
  }
  return bb;
}

ListingFunction ListingReader::function(YAML::Node const & node) const
{
  ListingFunction func;
  func.address = address(require(node, "address"));
  YAML::Node name = node["name"];
  if (name) {
    func.name = name.as<std::string>();
  }
  YAML::Node blocks = node["blocks"];
  if (blocks) {
    if (!blocks.IsSequence()) {
      error(blocks, "expected a list of blocks");
    }
    for (auto const & bb : blocks) {
      func.blocks.push_back(block(bb));
    }
  }
  return func;
}

void ListingReader::read(YAML::Node const & root, ListingBackend & listing) const
{
  if (!root.IsMap()) {
    error(root, "a listing must be a map");
  }
  YAML::Node functions = root["functions"];
  if (functions) {
    if (!functions.IsSequence()) {
      error(functions, "expected a list of functions");
    }
    for (auto const & f : functions) {
      listing.add_function(function(f));
    }
  }
  YAML::Node strings = root["strings"];
  if (strings) {
    if (!strings.IsSequence()) {
      error(strings, "expected a list of strings");
    }
    for (auto const & s : strings) {
      auto xrefs = addresses(s, "xrefs");
      listing.add_string(address(require(s, "address")), require(s, "value").as<std::string>(),
                         AddrSet(xrefs.begin(), xrefs.end()));
    }
  }
  YAML::Node names = root["names"];
  if (names) {
    if (!names.IsMap()) {
      error(names, "expected a map of addresses to names");
    }
    for (auto const & n : names) {
      listing.add_name(address(n.first), n.second.as<std::string>());
    }
  }
  for (address_t addr : addresses(root, "known_locations")) {
    listing.add_known_location(addr);
  }
}

} // unnamed namespace

ListingBackend ListingBackend::parse(std::string const & yaml, std::string const & source)
{
  ListingBackend listing;
  try {
    ListingReader(source).read(YAML::Load(yaml), listing);
  } catch (YAML::Exception const & e) {
    throw ListingError(source + ": " + e.what());
  }
  return listing;
}

ListingBackend ListingBackend::load(std::string const & filename)
{
  std::string contents;
  try {
    contents = get_file_contents(filename);
  } catch (std::runtime_error const & e) {
    throw ListingError(e.what());
  }
  return parse(contents, filename);
}

void ListingBackend::add_function(ListingFunction func)
{
  address_t addr = func.address;
  if (!func.name.empty()) {
    add_name(addr, func.name);
  }
  funcs[addr] = std::move(func);
}

void ListingBackend::add_string(address_t addr, std::string value, AddrSet xrefs)
{
  StringRecord & record = strs[addr];
  record.address = addr;
  record.value = std::move(value);
  record.xrefs = std::move(xrefs);
}

void ListingBackend::add_name(address_t addr, std::string const & name)
{
  auto old = names.find(addr);
  if (old != names.end()) {
    name_index.erase(old->second);
  }
  names[addr] = name;
  name_index[name] = addr;
}

void ListingBackend::add_known_location(address_t addr)
{
  known.insert(addr);
}

std::vector<address_t> ListingBackend::functions() const
{
  std::vector<address_t> result;
  result.reserve(funcs.size());
  for (auto const & f : funcs) {
    result.push_back(f.first);
  }
  return result;
}

std::vector<BasicBlockInfo> ListingBackend::basic_blocks(address_t function) const
{
  auto found = funcs.find(function);
  if (found == funcs.end()) {
    return {};
  }
  return found->second.blocks;
}

boost::optional<address_t> ListingBackend::function_containing(address_t addr) const
{
  for (auto const & f : funcs) {
    if (f.first == addr) {
      return f.first;
    }
    for (auto const & bb : f.second.blocks) {
      for (auto const & insn : bb.instructions) {
        if (insn.address == addr) {
          return f.first;
        }
      }
    }
  }
  return boost::none;
}

std::vector<StringRecord> ListingBackend::strings() const
{
  std::vector<StringRecord> result;
  result.reserve(strs.size());
  for (auto const & s : strs) {
    result.push_back(s.second);
  }
  return result;
}

bool ListingBackend::is_known_location(address_t addr) const
{
  if (known.count(addr) || names.count(addr) || strs.count(addr)) {
    return true;
  }
  return function_containing(addr) || [&]() {
    for (auto const & f : funcs) {
      for (auto const & bb : f.second.blocks) {
        if (bb.address == addr) {
          return true;
        }
      }
    }
    return false;
  }();
}

boost::optional<std::string> ListingBackend::display_name(address_t addr) const
{
  auto found = names.find(addr);
  if (found == names.end()) {
    return boost::none;
  }
  return found->second;
}

boost::optional<address_t> ListingBackend::address_of_name(std::string const & name) const
{
  auto found = name_index.find(name);
  if (found == name_index.end()) {
    return boost::none;
  }
  return found->second;
}

bool ListingBackend::set_name(address_t addr, std::string const & name)
{
  auto existing = name_index.find(name);
  if (existing != name_index.end() && existing->second != addr) {
    return false;
  }
  add_name(addr, name);
  return true;
}

void ListingBackend::mark_library(address_t addr)
{
  library.insert(addr);
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
