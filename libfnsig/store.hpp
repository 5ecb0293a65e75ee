// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Store_H
#define Fnsig_Store_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/serialization/map.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include "hash.hpp"
#include "util.hpp"

namespace fnsig {

// The signature of one basic block.
struct BlockSignature {
  SigHash formal = 0;
  SigHash fuzzy = 0;
  // Interesting immediate values, in instruction order.
  std::vector<std::uint64_t> immediates;
  // Names of called functions, in instruction order.
  std::vector<std::string> called_names;

  bool operator==(BlockSignature const & other) const {
    return formal == other.formal && fuzzy == other.fuzzy
      && immediates == other.immediates && called_names == other.called_names;
  }
  bool operator!=(BlockSignature const & other) const { return !(*this == other); }

  template <class Archive>
  void serialize(Archive & ar, const unsigned int) {
    ar & formal & fuzzy & immediates & called_names;
  }
};

// A function's name and its blocks in control flow graph order.  The order matters because
// blocks are paired up by position during renaming.
struct FunctionSignature {
  std::string name;
  std::vector<BlockSignature> blocks;

  bool operator==(FunctionSignature const & other) const {
    return name == other.name && blocks == other.blocks;
  }
  bool operator!=(FunctionSignature const & other) const { return !(*this == other); }

  template <class Archive>
  void serialize(Archive & ar, const unsigned int) {
    ar & name & blocks;
  }
};

using HashMap = std::map<SigHash, address_t>;
using ImmediateMap = std::map<std::uint64_t, address_t>;
using FunctionMap = std::map<address_t, FunctionSignature>;

// One category of signatures while it is being generated.  A key that is seen twice is
// removed and poisoned, so that every surviving key identifies exactly one function.
template <typename Key>
class SignatureCategory {
 public:
  using map_type = std::map<Key, address_t>;

  // Returns false if the key was (or now is) ambiguous.
  bool add(Key key, address_t addr) {
    auto found = active_.find(key);
    if (found != active_.end()) {
      active_.erase(found);
      poisoned_.insert(key);
      return false;
    }
    if (poisoned_.count(key)) {
      return false;
    }
    active_.emplace(key, addr);
    return true;
  }

  map_type const & active() const { return active_; }
  std::set<Key> const & poisoned() const { return poisoned_; }

  // Give up the surviving signatures.  The poison set is discarded.
  map_type release() {
    poisoned_.clear();
    return std::move(active_);
  }

 private:
  map_type active_;
  std::set<Key> poisoned_;
};

// All of the signatures of one program.  A store is immutable once it has been generated or
// loaded.
class SignatureStore {
 public:
  SignatureStore() = default;
  SignatureStore(HashMap formal, HashMap fuzzy, HashMap strings, ImmediateMap immediates,
                 FunctionMap functions)
    : formal_(std::move(formal)), fuzzy_(std::move(fuzzy)), strings_(std::move(strings)),
      immediates_(std::move(immediates)), functions_(std::move(functions)) {}

  HashMap const & formal() const { return formal_; }
  HashMap const & fuzzy() const { return fuzzy_; }
  HashMap const & strings() const { return strings_; }
  ImmediateMap const & immediates() const { return immediates_; }
  FunctionMap const & functions() const { return functions_; }

  // Returns nullptr if there is no function at addr.
  FunctionSignature const * function(address_t addr) const;

  bool operator==(SignatureStore const & other) const;
  bool operator!=(SignatureStore const & other) const { return !(*this == other); }

  // Report which of the named functions kept a formal and a fuzzy signature.
  void show(std::set<std::string> const & names, std::ostream & out) const;

  template <class Archive>
  void serialize(Archive & ar, const unsigned int) {
    ar & formal_ & fuzzy_ & strings_ & immediates_ & functions_;
  }

 private:
  HashMap formal_;
  HashMap fuzzy_;
  HashMap strings_;
  ImmediateMap immediates_;
  FunctionMap functions_;
};

std::ostream & operator<<(std::ostream & stream, SignatureStore const & store);

} // namespace fnsig

#endif // Fnsig_Store_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
