// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Generator_H
#define Fnsig_Generator_H

#include <cstddef>
#include <cstdint>

#include "backend.hpp"
#include "fingerprint.hpp"
#include "store.hpp"

namespace fnsig {

class Config;

struct GeneratorSettings {
  // Shorter strings are too common to identify a function.
  std::size_t min_string_length = 8;
  std::uint64_t immediate_threshold = FNSIG_DEFAULT_IMMEDIATE_THRESHOLD;

  GeneratorSettings() = default;
  // Read the fnsig.min_string_length and fnsig.immediate_threshold values.
  explicit GeneratorSettings(Config const & config);
};

// Builds the SignatureStore of the program behind a backend.
class SignatureGenerator {
 public:
  SignatureGenerator(AnalysisBackend const & backend_,
                     GeneratorSettings const & settings_ = GeneratorSettings())
    : backend(backend_), settings(settings_) {}

  SignatureStore generate() const;

 private:
  void string_pass(StringIndex const & strings, SignatureCategory<SigHash> & category) const;

  AnalysisBackend const & backend;
  GeneratorSettings settings;
};

} // namespace fnsig

#endif // Fnsig_Generator_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
