// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include "backend.hpp"

namespace fnsig {

StringIndex AnalysisBackend::string_index() const
{
  StringIndex index;
  for (auto & record : strings()) {
    address_t addr = record.address;
    index.emplace(addr, std::move(record));
  }
  return index;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
