// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include "generator.hpp"
#include "config.hpp"

namespace fnsig {

GeneratorSettings::GeneratorSettings(Config const & config)
{
  min_string_length = config.path_get("fnsig.min_string_length")
                      .as_fallback<std::size_t>(min_string_length);
  immediate_threshold = config.path_get("fnsig.immediate_threshold")
                        .as_fallback<std::uint64_t>(immediate_threshold);
}

// Long strings referenced from exactly one place identify the function that references them.
void
SignatureGenerator::string_pass(StringIndex const & strings,
                                SignatureCategory<SigHash> & category) const
{
  for (auto const & entry : strings) {
    StringRecord const & str = entry.second;
    if (str.value.size() < settings.min_string_length || str.xrefs.size() != 1) {
      continue;
    }
    address_t xref = *str.xrefs.begin();
    auto func = backend.function_containing(xref);
    if (!func) {
      GDEBUG << "String at " << addr_str(str.address) << " is referenced from "
             << addr_str(xref) << ", which is not in a function." << LEND;
      continue;
    }
    if (!category.add(sighash(str.value), *func)) {
      GTRACE << "String signature for \"" << str.value << "\" is not unique." << LEND;
    }
  }
}

SignatureStore
SignatureGenerator::generate() const
{
  auto timer = make_timer();

  StringIndex strings = backend.string_index();
  Fingerprinter fingerprinter(backend, strings, settings.immediate_threshold);

  SignatureCategory<SigHash> formal;
  SignatureCategory<SigHash> fuzzy;
  SignatureCategory<SigHash> string_sigs;
  SignatureCategory<std::uint64_t> immediates;
  FunctionMap functions;

  string_pass(strings, string_sigs);

  for (address_t addr : backend.functions()) {
    FunctionFingerprint fp = fingerprinter.function(addr);
    GTRACE << "Function " << addr_str(addr) << " (" << fp.signature.name << ") has "
           << fp.signature.blocks.size() << " blocks, formal=" << fp.formal
           << " fuzzy=" << fp.fuzzy << LEND;

    formal.add(fp.formal, addr);
    fuzzy.add(fp.fuzzy, addr);
    for (BlockSignature const & b : fp.signature.blocks) {
      for (std::uint64_t imm : b.immediates) {
        immediates.add(imm, addr);
      }
    }
    functions[addr] = std::move(fp.signature);
  }

  GDEBUG << "Discarded " << formal.poisoned().size() << " formal, "
         << fuzzy.poisoned().size() << " fuzzy, " << string_sigs.poisoned().size()
         << " string and " << immediates.poisoned().size()
         << " immediate signatures that were not unique." << LEND;

  SignatureStore store(formal.release(), fuzzy.release(), string_sigs.release(),
                       immediates.release(), std::move(functions));

  GINFO << "Generated " << store.formal().size() << " formal signatures and "
        << store.fuzzy().size() << " fuzzy signatures for " << store.functions().size()
        << " functions in " << timer << " seconds." << LEND;
  return store;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
