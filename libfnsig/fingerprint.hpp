// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Fingerprint_H
#define Fnsig_Fingerprint_H

#include <cstdint>
#include <string>
#include <vector>

#include "backend.hpp"
#include "store.hpp"

namespace fnsig {

// Immediates must be larger than this to be considered interesting.
#define FNSIG_DEFAULT_IMMEDIATE_THRESHOLD 0xFFFF

// The token lists a block's hashes are computed from.  Kept for debugging and testing.
struct BlockTokens {
  std::vector<std::string> formal;
  std::vector<std::string> fuzzy;
};

// The signature of a whole function, along with the function level hashes.
struct FunctionFingerprint {
  FunctionSignature signature;
  SigHash formal = 0;
  SigHash fuzzy = 0;
};

// Computes block and function signatures from the instructions the backend reports.
class Fingerprinter {
 public:
  Fingerprinter(AnalysisBackend const & backend_, StringIndex const & strings_,
                std::uint64_t immediate_threshold_ = FNSIG_DEFAULT_IMMEDIATE_THRESHOLD)
    : backend(backend_), strings(strings_), immediate_threshold(immediate_threshold_) {}

  BlockSignature block(BasicBlockInfo const & bb, BlockTokens * tokens = nullptr) const;
  FunctionFingerprint function(address_t addr) const;

  // The function level hashes are computed over the decimal text of the block hashes.
  static SigHash combine_formal(std::vector<BlockSignature> const & blocks);
  static SigHash combine_fuzzy(std::vector<BlockSignature> const & blocks);

 private:
  bool interesting_immediate(OperandInfo const & op) const;

  AnalysisBackend const & backend;
  StringIndex const & strings;
  std::uint64_t immediate_threshold;
};

} // namespace fnsig

#endif // Fnsig_Fingerprint_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
