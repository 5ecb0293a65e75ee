// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_RoseBackend_H
#define Fnsig_RoseBackend_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backend.hpp"
#include "partitioner.hpp"

namespace fnsig {

// Strings shorter than this are not recorded at all.
#define FNSIG_ROSE_MIN_STRING_LENGTH 4
// How far to look for the terminating NUL of a string.
#define FNSIG_ROSE_MAX_STRING_LENGTH 1024

// An executable partitioned by ROSE.  Names start out as the partitioner's function names
// (sub_XXXX for functions without one) and renames are kept alongside the partitioner.
class RoseBackend : public AnalysisBackend {
 public:
  RoseBackend(ProgOptVarMap const & vm, std::vector<std::string> const & specimen_names);

  std::vector<address_t> functions() const override;
  std::vector<BasicBlockInfo> basic_blocks(address_t function) const override;
  boost::optional<address_t> function_containing(address_t addr) const override;
  std::vector<StringRecord> strings() const override;
  bool is_known_location(address_t addr) const override;
  boost::optional<std::string> display_name(address_t addr) const override;
  boost::optional<address_t> address_of_name(std::string const & name) const override;
  bool set_name(address_t addr, std::string const & name) override;
  void mark_library(address_t addr) override;

  bool is_library(address_t addr) const override { return library.count(addr) != 0; }

 private:
  void index();
  InstructionInfo instruction(SgAsmInstruction * insn) const;
  boost::optional<address_t> data_address(SgAsmExpression * expr) const;
  bool is_data(address_t addr) const;
  std::string read_string(address_t addr) const;
  void add_name(address_t addr, std::string const & name);

  std::unique_ptr<P2::Engine> engine;
  P2::Partitioner partitioner;

  std::map<address_t, std::string> names;
  std::map<std::string, address_t> name_index;
  std::map<address_t, address_t> insn_function;
  StringIndex strs;
  AddrSet library;
};

} // namespace fnsig

#endif // Fnsig_RoseBackend_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
