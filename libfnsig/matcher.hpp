// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Matcher_H
#define Fnsig_Matcher_H

#include <set>
#include <string>
#include <vector>

#include "enums.hpp"
#include "store.hpp"

namespace fnsig {

// The kinds of function matches, in the order they are applied (most trustworthy first).
enum class MatchCategory {
  FORMAL,
  STRINGS,
  IMMEDIATES,
  FUZZY
};

template<> char const* EnumStrings<MatchCategory>::data[];

using MatchCategorySet = std::set<MatchCategory>;

// Every category, in application order.
MatchCategorySet const & all_match_categories();

// Parse category labels ("formal", "strings", ...).  Throws std::invalid_argument on an
// unknown label.
MatchCategorySet parse_match_categories(std::vector<std::string> const & labels);

// A function in the local program that appears to be a function in the external program.
struct FunctionMatch {
  address_t local;
  address_t external;
};

struct CandidateSet {
  MatchCategory category;
  // Fuzzy candidates are less trustworthy.
  bool fuzzy;
  std::vector<FunctionMatch> matches;
};

// Finds the functions of two signature stores that share a unique signature.
class Matcher {
 public:
  Matcher(SignatureStore const & local_, SignatureStore const & external_)
    : local(local_), external(external_) {}

  // Returns one candidate set for each requested category, in application order.
  std::vector<CandidateSet> match(
    MatchCategorySet const & categories = all_match_categories()) const;

  CandidateSet match(MatchCategory category) const;

 private:
  template <typename Map>
  void match_map(Map const & lmap, Map const & emap, CandidateSet & result) const;

  SignatureStore const & local;
  SignatureStore const & external;
};

} // namespace fnsig

#endif // Fnsig_Matcher_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
