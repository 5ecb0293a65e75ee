// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Renamer_H
#define Fnsig_Renamer_H

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <Sawyer/Message.h>

#include "backend.hpp"
#include "matcher.hpp"
#include "store.hpp"

namespace fnsig {

class Config;

struct RenameSettings {
  // Only functions whose current name starts with one of these are renamed.
  std::vector<std::string> placeholder_prefixes = {"sub_"};
  // Names whose text before the first underscore is one of these are never applied.
  std::set<std::string> reserved_prefixes = {"sub", "loc", "unk", "dword", "word", "byte"};

  RenameSettings() = default;
  // Read fnsig.placeholder_prefixes and fnsig.reserved_prefixes.
  explicit RenameSettings(Config const & config);
};

// A rename that was applied to the local program.
struct RenameRecord {
  address_t address;
  std::string old_name;
  std::string new_name;
  MatchCategory category;
  // True when the name came from a call in a matched block rather than a function match.
  bool propagated;
};

// Applies the names of matched external functions to the local program.
class Renamer {
 public:
  Renamer(AnalysisBackend & backend_, SignatureStore const & local_,
          SignatureStore const & external_, RenameSettings const & settings_ = RenameSettings());

  // Apply every candidate set in order, returning the total number of functions renamed.
  std::size_t apply(std::vector<CandidateSet> const & candidates);
  // Apply one candidate set, returning the number of functions renamed.
  std::size_t apply(CandidateSet const & candidates);

  // Rename addr to name if the rename guard allows it.  Returns 1 if renamed, 0 otherwise.
  int rename(address_t addr, std::string const & name, MatchCategory category,
             bool propagated = false);

  // Can a function currently named 'current' be given 'proposed'?  This does not check
  // whether 'proposed' is already in use.
  bool allowed(std::string const & current, std::string const & proposed) const;

  // Two blocks match when their formal hashes are equal and they have the same number of
  // immediates and calls.  Fuzzy hashes are too permissive at the block level.
  static bool blocks_match(BlockSignature const & a, BlockSignature const & b);

  // Pair up the blocks of two functions by index (local, external).  A pairing is kept only
  // if neither block matches any other block of the other function.
  using BlockPairs = std::vector<std::pair<std::size_t, std::size_t>>;
  static BlockPairs pair_blocks(FunctionSignature const & local,
                                FunctionSignature const & external);

  std::vector<RenameRecord> const & renames() const { return records; }
  std::map<MatchCategory, std::size_t> const & category_counts() const { return counts; }

  static Sawyer::Message::Facility & initDiagnostics();

 private:
  // Candidate addresses for each proposed name, in the order the names were proposed.
  class Proposals {
   public:
    void add(std::string const & name, address_t addr, bool propagated);
    struct Candidate {
      address_t address;
      bool propagated;
    };
    std::vector<std::pair<std::string, std::vector<Candidate>>> const & entries() const {
      return list;
    }
   private:
    std::map<std::string, std::size_t> index;
    std::vector<std::pair<std::string, std::vector<Candidate>>> list;
  };

  void propose_calls(FunctionSignature const & lfunc, FunctionSignature const & efunc,
                     Proposals & proposals) const;

  AnalysisBackend & backend;
  SignatureStore const & local;
  SignatureStore const & external;
  RenameSettings settings;
  std::vector<RenameRecord> records;
  std::map<MatchCategory, std::size_t> counts;

  static Sawyer::Message::Facility mlog;
};

} // namespace fnsig

#endif // Fnsig_Renamer_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
