// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include "hash.hpp"

namespace fnsig {

constexpr SigHash FNV1a::offset_basis;
constexpr SigHash FNV1a::prime;

void FNV1a::update(void const * data, std::size_t size)
{
  auto bytes = static_cast<unsigned char const *>(data);
  for (std::size_t i = 0; i < size; ++i) {
    state_ ^= bytes[i];
    state_ *= prime;
  }
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
