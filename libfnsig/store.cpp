// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <ostream>

#include "store.hpp"

namespace fnsig {

FunctionSignature const *
SignatureStore::function(address_t addr) const
{
  auto found = functions_.find(addr);
  if (found == functions_.end()) {
    return nullptr;
  }
  return &found->second;
}

bool
SignatureStore::operator==(SignatureStore const & other) const
{
  return formal_ == other.formal_
    && fuzzy_ == other.fuzzy_
    && strings_ == other.strings_
    && immediates_ == other.immediates_
    && functions_ == other.functions_;
}

namespace {

void show_category(HashMap const & category, FunctionMap const & functions,
                   std::set<std::string> const & names, std::ostream & out)
{
  for (auto const & entry : category) {
    auto func = functions.find(entry.second);
    if (func != functions.end() && names.count(func->second.name)) {
      out << "  " << func->second.name << '\n';
    }
  }
}

} // unnamed namespace

void
SignatureStore::show(std::set<std::string> const & names, std::ostream & out) const
{
  if (names.empty()) {
    return;
  }
  out << "Generated formal signatures for:\n";
  show_category(formal_, functions_, names, out);
  out << "Generated fuzzy signatures for:\n";
  show_category(fuzzy_, functions_, names, out);
}

std::ostream &
operator<<(std::ostream & stream, SignatureStore const & store)
{
  return stream << store.formal().size() << " formal, "
                << store.fuzzy().size() << " fuzzy, "
                << store.strings().size() << " string and "
                << store.immediates().size() << " immediate signatures for "
                << store.functions().size() << " functions";
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
