// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Listing_H
#define Fnsig_Listing_H

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "backend.hpp"

namespace fnsig {

// A malformed program listing.
class ListingError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ListingFunction {
  address_t address = 0;
  std::string name;
  std::vector<BasicBlockInfo> blocks;
};

// A program described entirely in memory, either built up by calls to the add_ methods or
// read from a YAML listing file:
//
//   functions:
//     - address: 0x1000
//       name: sub_1000
//       blocks:
//         - address: 0x1000
//           instructions:
//             - {address: 0x1000, mnemonic: push, operands: [ebp]}
//             - {address: 0x1001, mnemonic: call, call: true, code_refs: [0x2000]}
//             - {address: 0x1006, mnemonic: push, operands: [0x4000], data_refs: [0x4000]}
//   strings:
//     - {address: 0x4000, value: "a string", xrefs: [0x1006]}
//   names:
//     0x5000: a_global
//   known_locations: [0x6000]
//
// Operands are either plain text, or a map with "text", "value" and "immediate" keys.  Plain
// operands that read as numbers (0x10, 42, -1) are immediates.
class ListingBackend : public AnalysisBackend {
 public:
  ListingBackend() = default;

  // Throws ListingError.
  static ListingBackend load(std::string const & filename);
  static ListingBackend parse(std::string const & yaml,
                              std::string const & source = "<listing>");

  void add_function(ListingFunction func);
  void add_string(address_t addr, std::string value, AddrSet xrefs);
  void add_name(address_t addr, std::string const & name);
  void add_known_location(address_t addr);

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
  AddrSet const & library_functions() const { return library; }

 private:
  std::map<address_t, ListingFunction> funcs;
  std::map<address_t, StringRecord> strs;
  std::map<address_t, std::string> names;
  std::map<std::string, address_t> name_index;
  AddrSet known;
  AddrSet library;
};

} // namespace fnsig

#endif // Fnsig_Listing_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
