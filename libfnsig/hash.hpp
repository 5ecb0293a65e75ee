// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Hash_H
#define Fnsig_Hash_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace fnsig {

// Signature hashes are 32-bit FNV-1a.  The algorithm is fixed so that signature files written
// by one build can be applied by another.
using SigHash = std::uint32_t;

class FNV1a {
 public:
  static constexpr SigHash offset_basis = 0x811c9dc5u;
  static constexpr SigHash prime = 0x01000193u;

  FNV1a() = default;
  FNV1a(void const *data, std::size_t size) : FNV1a() {
    update(data, size);
  }
  FNV1a(std::string const & str) : FNV1a(str.data(), str.size()) {}

  void update(void const * data, std::size_t size);
  void update(std::string const & str) {
    update(str.data(), str.size());
  }
  SigHash finalize() const { return state_; }

 private:
  SigHash state_ = offset_basis;
};

// Hash the text of a signature token sequence.
inline SigHash sighash(std::string const & value) {
  return FNV1a(value).finalize();
}

} // namespace fnsig

#endif // Fnsig_Hash_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
