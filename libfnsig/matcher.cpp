// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <stdexcept>

#include "matcher.hpp"
#include "misc.hpp"

namespace fnsig {

template<> char const* EnumStrings<MatchCategory>::data[] = {
  "formal",
  "strings",
  "immediates",
  "fuzzy",
  nullptr
};

MatchCategorySet const & all_match_categories()
{
  static MatchCategorySet const all = {
    MatchCategory::FORMAL, MatchCategory::STRINGS,
    MatchCategory::IMMEDIATES, MatchCategory::FUZZY };
  return all;
}

MatchCategorySet parse_match_categories(std::vector<std::string> const & labels)
{
  MatchCategorySet result;
  for (auto const & label : labels) {
    // There's no invalid MatchCategory value, so look the label up twice with different
    // defaults to detect a miss.
    auto a = Str2Enum(label, MatchCategory::FORMAL);
    auto b = Str2Enum(label, MatchCategory::FUZZY);
    if (a != b) {
      throw std::invalid_argument("Unknown match category: " + label);
    }
    result.insert(a);
  }
  return result;
}

template <typename Map>
void
Matcher::match_map(Map const & lmap, Map const & emap, CandidateSet & result) const
{
  for (auto const & entry : emap) {
    auto lfound = lmap.find(entry.first);
    if (lfound == lmap.end()) {
      continue;
    }
    FunctionSignature const * lfunc = local.function(lfound->second);
    FunctionSignature const * efunc = external.function(entry.second);
    if (!lfunc || !efunc) {
      GDEBUG << "Signature match between " << addr_str(lfound->second) << " and "
             << addr_str(entry.second) << " has no function signature." << LEND;
      continue;
    }
    // Fuzzy hashes collide more often, so the functions must at least be the same size.
    if (result.fuzzy && lfunc->blocks.size() != efunc->blocks.size()) {
      GTRACE << "Fuzzy match of " << lfunc->name << " and " << efunc->name
             << " rejected, they have " << lfunc->blocks.size() << " and "
             << efunc->blocks.size() << " blocks." << LEND;
      continue;
    }
    // Every shared key is one more vote for the pair, so repeats are kept.
    result.matches.push_back(FunctionMatch{lfound->second, entry.second});
  }
}

CandidateSet
Matcher::match(MatchCategory category) const
{
  auto timer = make_timer();
  CandidateSet result{category, category == MatchCategory::FUZZY, {}};
  switch (category) {
   case MatchCategory::FORMAL:
    match_map(local.formal(), external.formal(), result);
    break;
   case MatchCategory::STRINGS:
    match_map(local.strings(), external.strings(), result);
    break;
   case MatchCategory::IMMEDIATES:
    match_map(local.immediates(), external.immediates(), result);
    break;
   case MatchCategory::FUZZY:
    match_map(local.fuzzy(), external.fuzzy(), result);
    break;
  }
  GINFO << "Found " << result.matches.size() << " " << Enum2Str(category)
        << " matches in " << timer << " seconds." << LEND;
  return result;
}

std::vector<CandidateSet>
Matcher::match(MatchCategorySet const & categories) const
{
  std::vector<CandidateSet> result;
  // std::set orders the categories by enum value, which is the application order.
  for (MatchCategory category : categories) {
    result.push_back(match(category));
  }
  return result;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
