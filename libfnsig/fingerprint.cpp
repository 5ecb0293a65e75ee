// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <boost/algorithm/string/join.hpp>

#include "fingerprint.hpp"

namespace fnsig {

// Immediates that look negative, are small, or are really addresses of something the program
// defines are not characteristic of the function, so they are left out of fuzzy signatures.
bool
Fingerprinter::interesting_immediate(OperandInfo const & op) const
{
  if (!op.immediate || (!op.text.empty() && op.text[0] == '-')) {
    return false;
  }
  if (op.value <= immediate_threshold) {
    return false;
  }
  return !backend.is_known_location(op.value);
}

BlockSignature
Fingerprinter::block(BasicBlockInfo const & bb, BlockTokens * tokens) const
{
  BlockSignature sig;
  BlockTokens local;
  BlockTokens & toks = tokens ? *tokens : local;
  toks.formal.clear();
  toks.fuzzy.clear();

  for (InstructionInfo const & insn : bb.instructions) {
    toks.formal.push_back(insn.mnemonic);

    if (insn.is_call) {
      // Fuzzy signatures only note that a call was made.  The formal signature already has
      // the call mnemonic, which is more specific.
      for (address_t target : insn.code_refs) {
        auto name = backend.display_name(target);
        if (!name || name->empty()) {
          GTRACE << "No name for call target " << addr_str(target) << " at "
                 << addr_str(insn.address) << LEND;
          continue;
        }
        sig.called_names.push_back(*name);
        toks.fuzzy.push_back("funcref");
      }
    }
    else if (!insn.data_refs.empty()) {
      // Strings are easy to identify, so their text is used in both signatures.  Other data
      // is only noted as having been referenced.
      for (address_t ref : insn.data_refs) {
        auto found = strings.find(ref);
        std::string const & token = (found != strings.end()) ? found->second.value : "dataref";
        toks.formal.push_back(token);
        toks.fuzzy.push_back(token);
      }
    }
    else if (insn.code_refs.empty()) {
      for (OperandInfo const & op : insn.operands) {
        toks.formal.push_back(op.text);
        if (interesting_immediate(op)) {
          toks.fuzzy.push_back(std::to_string(op.value));
          sig.immediates.push_back(op.value);
        }
      }
    }
  }

  sig.formal = sighash(boost::algorithm::join(toks.formal, ""));
  sig.fuzzy = sighash(boost::algorithm::join(toks.fuzzy, ""));
  return sig;
}

SigHash
Fingerprinter::combine_formal(std::vector<BlockSignature> const & blocks)
{
  FNV1a hash;
  for (auto const & b : blocks) {
    hash.update(std::to_string(b.formal));
  }
  return hash.finalize();
}

SigHash
Fingerprinter::combine_fuzzy(std::vector<BlockSignature> const & blocks)
{
  FNV1a hash;
  for (auto const & b : blocks) {
    hash.update(std::to_string(b.fuzzy));
  }
  return hash.finalize();
}

FunctionFingerprint
Fingerprinter::function(address_t addr) const
{
  FunctionFingerprint result;
  auto name = backend.display_name(addr);
  if (name) {
    result.signature.name = *name;
  }
  for (BasicBlockInfo const & bb : backend.basic_blocks(addr)) {
    result.signature.blocks.push_back(block(bb));
  }
  result.formal = combine_formal(result.signature.blocks);
  result.fuzzy = combine_fuzzy(result.signature.blocks);
  return result;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
