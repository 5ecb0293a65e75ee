// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <algorithm>
#include <atomic>

#include "renamer.hpp"
#include "config.hpp"
#include "options.hpp"

namespace fnsig {

Sawyer::Message::Facility Renamer::mlog;

static std::atomic_flag mlog_initialized = ATOMIC_FLAG_INIT;

Sawyer::Message::Facility & Renamer::initDiagnostics()
{
  if (!mlog_initialized.test_and_set()) {
    mlog.initialize("RNAM");
    mlog.initStreams(get_logging_destination());
    Sawyer::Message::mfacilities.insert(mlog);
  }
  return mlog;
}

RenameSettings::RenameSettings(Config const & config)
{
  auto placeholders = config.path_get("fnsig.placeholder_prefixes");
  if (placeholders) {
    placeholder_prefixes = placeholders.expect<std::vector<std::string>>(
      "Expected a list of placeholder name prefixes");
  }
  auto reserved = config.path_get("fnsig.reserved_prefixes");
  if (reserved) {
    auto list = reserved.expect<std::vector<std::string>>(
      "Expected a list of reserved name prefixes");
    reserved_prefixes = std::set<std::string>(list.begin(), list.end());
  }
}

void
Renamer::Proposals::add(std::string const & name, address_t addr, bool propagated)
{
  auto found = index.find(name);
  if (found == index.end()) {
    found = index.emplace(name, list.size()).first;
    list.emplace_back(name, std::vector<Candidate>());
  }
  list[found->second].second.push_back(Candidate{addr, propagated});
}

Renamer::Renamer(AnalysisBackend & backend_, SignatureStore const & local_,
                 SignatureStore const & external_, RenameSettings const & settings_)
  : backend(backend_), local(local_), external(external_), settings(settings_)
{
  initDiagnostics();
}

bool
Renamer::blocks_match(BlockSignature const & a, BlockSignature const & b)
{
  return a.formal == b.formal
    && a.immediates.size() == b.immediates.size()
    && a.called_names.size() == b.called_names.size();
}

Renamer::BlockPairs
Renamer::pair_blocks(FunctionSignature const & lfunc, FunctionSignature const & efunc)
{
  std::vector<std::size_t> lcount(lfunc.blocks.size(), 0);
  std::vector<std::size_t> ecount(efunc.blocks.size(), 0);
  BlockPairs candidates;
  for (std::size_t e = 0; e < efunc.blocks.size(); ++e) {
    for (std::size_t l = 0; l < lfunc.blocks.size(); ++l) {
      if (blocks_match(lfunc.blocks[l], efunc.blocks[e])) {
        ++lcount[l];
        ++ecount[e];
        candidates.emplace_back(l, e);
      }
    }
  }
  BlockPairs result;
  for (auto const & p : candidates) {
    if (lcount[p.first] == 1 && ecount[p.second] == 1) {
      result.push_back(p);
    }
  }
  return result;
}

// Calls made from blocks that match one to one name the local callee the same way the
// external callee is named, even when the callee itself was never matched.
void
Renamer::propose_calls(FunctionSignature const & lfunc, FunctionSignature const & efunc,
                       Proposals & proposals) const
{
  for (auto const & p : pair_blocks(lfunc, efunc)) {
    BlockSignature const & lblock = lfunc.blocks[p.first];
    BlockSignature const & eblock = efunc.blocks[p.second];
    for (std::size_t n = 0; n < lblock.called_names.size(); ++n) {
      auto addr = backend.address_of_name(lblock.called_names[n]);
      if (!addr) {
        MTRACE << "Called function " << lblock.called_names[n] << " in " << lfunc.name
               << " no longer exists." << LEND;
        continue;
      }
      proposals.add(eblock.called_names[n], *addr, true);
    }
  }
}

bool
Renamer::allowed(std::string const & current, std::string const & proposed) const
{
  if (proposed.empty()) {
    return false;
  }
  bool placeholder = false;
  for (auto const & prefix : settings.placeholder_prefixes) {
    if (current.compare(0, prefix.size(), prefix) == 0) {
      placeholder = true;
      break;
    }
  }
  if (!placeholder) {
    return false;
  }
  std::string prefix = proposed.substr(0, proposed.find('_'));
  return settings.reserved_prefixes.count(prefix) == 0;
}

int
Renamer::rename(address_t addr, std::string const & name, MatchCategory category,
                bool propagated)
{
  // Read the current name from the backend, since an earlier pass may have renamed it.
  auto current = backend.display_name(addr);
  std::string current_name = current ? *current : std::string();
  if (!allowed(current_name, name)) {
    MTRACE << "Not renaming " << addr_str(addr) << " (" << current_name << ") to "
           << name << LEND;
    return 0;
  }
  if (backend.address_of_name(name)) {
    MTRACE << "Not renaming " << addr_str(addr) << " (" << current_name << ") to "
           << name << ", the name is already in use." << LEND;
    return 0;
  }
  if (!backend.set_name(addr, name)) {
    MTRACE << "Backend refused to rename " << addr_str(addr) << " to " << name << LEND;
    return 0;
  }
  backend.mark_library(addr);
  MDEBUG << "Renamed " << addr_str(addr) << " from " << current_name << " to " << name
         << (propagated ? " (from a call)" : "") << LEND;
  records.push_back(RenameRecord{addr, current_name, name, category, propagated});
  return 1;
}

std::size_t
Renamer::apply(CandidateSet const & candidates)
{
  Proposals proposals;
  for (FunctionMatch const & m : candidates.matches) {
    FunctionSignature const * lfunc = local.function(m.local);
    FunctionSignature const * efunc = external.function(m.external);
    if (!lfunc || !efunc) {
      continue;
    }
    proposals.add(efunc->name, m.local, false);
    propose_calls(*lfunc, *efunc, proposals);
  }

  std::size_t count = 0;
  for (auto const & entry : proposals.entries()) {
    auto const & name = entry.first;
    auto const & candidates_for_name = entry.second;
    if (candidates_for_name.empty()) {
      continue;
    }
    // The address proposed most often wins.  Ties go to the address proposed first.
    std::map<address_t, std::size_t> votes;
    std::size_t best = 0;
    for (auto const & c : candidates_for_name) {
      best = std::max(best, ++votes[c.address]);
    }
    address_t winner = candidates_for_name.front().address;
    for (auto const & c : candidates_for_name) {
      if (votes[c.address] == best) {
        winner = c.address;
        break;
      }
    }
    bool propagated = true;
    for (auto const & c : candidates_for_name) {
      if (c.address == winner && !c.propagated) {
        propagated = false;
        break;
      }
    }
    count += rename(winner, name, candidates.category, propagated);
  }

  counts[candidates.category] += count;
  return count;
}

std::size_t
Renamer::apply(std::vector<CandidateSet> const & candidates)
{
  auto timer = make_timer();
  std::size_t total = 0;
  for (CandidateSet const & set : candidates) {
    std::size_t count = apply(set);
    MINFO << "Renamed " << count << " functions from " << Enum2Str(set.category)
          << " matches." << LEND;
    total += count;
  }
  GINFO << "Renamed " << total << " functions in " << timer << " seconds." << LEND;
  return total;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
