// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Backend_H
#define Fnsig_Backend_H

// The interface between the signature engine and whatever understands the program being
// analyzed.  The engine only ever sees the program through an AnalysisBackend, so it can be
// driven by the ROSE partitioner or by a synthetic listing.

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "misc.hpp"

namespace fnsig {

struct OperandInfo {
  // The operand as the disassembler prints it.
  std::string text;
  bool immediate = false;
  // Only meaningful for immediates.
  std::uint64_t value = 0;

  OperandInfo() = default;
  OperandInfo(std::string t) : text(std::move(t)) {}
  OperandInfo(std::string t, std::uint64_t v) : text(std::move(t)), immediate(true), value(v) {}
};

struct InstructionInfo {
  address_t address = 0;
  std::string mnemonic;
  std::vector<OperandInfo> operands;
  bool is_call = false;
  // Control flow targets other than the fall through address.
  std::vector<address_t> code_refs;
  // Data addresses read, written or taken by the instruction.
  std::vector<address_t> data_refs;
};

struct BasicBlockInfo {
  address_t address = 0;
  std::vector<InstructionInfo> instructions;
};

// A string in the program and the addresses of the instructions that reference it.
struct StringRecord {
  address_t address = 0;
  std::string value;
  AddrSet xrefs;
};

using StringIndex = std::map<address_t, StringRecord>;

class AnalysisBackend {
 public:
  virtual ~AnalysisBackend() = default;

  // Entry addresses of every function, in a stable order.
  virtual std::vector<address_t> functions() const = 0;
  // The basic blocks of a function in a stable order.  Signature files record block order,
  // so two runs over the same program must return the same sequence.
  virtual std::vector<BasicBlockInfo> basic_blocks(address_t function) const = 0;
  // The entry address of the function containing the instruction at addr.
  virtual boost::optional<address_t> function_containing(address_t addr) const = 0;
  virtual std::vector<StringRecord> strings() const = 0;
  // Does addr name something the program defines (code, data, a label)?
  virtual bool is_known_location(address_t addr) const = 0;

  // The name currently displayed for addr, if there is one.
  virtual boost::optional<std::string> display_name(address_t addr) const = 0;
  virtual boost::optional<address_t> address_of_name(std::string const & name) const = 0;
  // Returns false if the name is already used by another address.
  virtual bool set_name(address_t addr, std::string const & name) = 0;
  // Record that the function at addr was identified as a known (library) function.
  virtual void mark_library(address_t addr) = 0;
  virtual bool is_library(address_t addr) const = 0;

  // Index the program's strings by address.
  StringIndex string_index() const;
};

} // namespace fnsig

#endif // Fnsig_Backend_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
