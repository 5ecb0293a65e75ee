// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <cstdlib>

#include "partitioner.hpp"
#include "misc.hpp"

namespace fnsig {

void
report_partitioner_statistics(P2::Partitioner const & partitioner)
{
  std::size_t num_insns = 0;
  std::size_t num_bytes = 0;
  for (P2::BasicBlock::Ptr const & bb : partitioner.basicBlocks()) {
    for (SgAsmInstruction const * insn : bb->instructions()) {
      ++num_insns;
      num_bytes += insn->get_size();
    }
  }

  OINFO << "Partitioned " << num_bytes << " bytes, " << num_insns << " instructions, "
        << partitioner.nBasicBlocks() << " basic blocks and "
        << partitioner.nFunctions() << " functions." << LEND;
}

P2::Partitioner
create_partitioner(ProgOptVarMap const & vm, P2::Engine * engine,
                   std::vector<std::string> const & specimen_names)
{
  // Windows loaders are free to change segment permissions after loading, so the packed code
  // may live in segments that are not marked executable.
  if (vm.count("mark-executable")) {
    GINFO << "Marking all sections as executable during function partitioning." << LEND;
    engine->memoryIsExecutable(true);
  }

  bool disable_semantics = vm.count("no-semantics");
  if (!disable_semantics) {
    auto v = vm.config().path_get("fnsig.partitioner_semantics");
    disable_semantics = v && (v.as<bool>() == false);
  }
  if (!disable_semantics) {
    GINFO << "Enabling semantic control flow analysis during function partitioning." << LEND;
    engine->usingSemantics(true);
  }
  else {
    GINFO << "Semantic control flow analysis disabled, analysis may be less correct." << LEND;
  }

  // Signatures only need the functions and their blocks.
  engine->doingPostAnalysis(false);
  engine->doingPostFunctionMayReturn(false);
  engine->functionReturnAnalysis(P2::MAYRETURN_ALWAYS_YES);
  engine->doingPostFunctionStackDelta(false);
  engine->doingPostCallingConvention(false);
  engine->doingPostFunctionNoop(false);
  engine->findingInterFunctionCalls(false);
  engine->exitOnError(false);
  engine->splittingThunks(true);
  // Mangled names are kept as is so that they survive a round trip through signature files.
  engine->demangleNames(false);

  if (specimen_names.empty()) {
    GFATAL << "no specimen specified; see --help" << LEND;
    std::exit(EXIT_FAILURE);
  }

  try {
    engine->loadSpecimens(specimen_names);
  } catch (SgAsmExecutableFileFormat::FormatError & e) {
    GFATAL << "Error while loading specimen: " << e.what() << LEND;
    std::exit(EXIT_FAILURE);
  } catch (std::exception const & e) {
    GFATAL << "Error while loading specimen: " << e.what() << LEND;
    std::exit(EXIT_FAILURE);
  }

  P2::Partitioner partitioner = engine->createPartitioner();

  std::size_t arch_bits = partitioner.instructionProvider().instructionPointerRegister().get_nbits();
  if (arch_bits != 32) {
    auto config_allow64 = vm.config().path_get("fnsig.allow-64bit");
    if (!config_allow64 || !config_allow64.as<bool>()) {
      OWARN << "Signatures for non 32-bit executables are experimental." << LEND;
      if (!vm.count("allow-64bit")) {
        GFATAL << "Please specify --allow-64bit to analyze " << arch_bits
               << "-bit executables." << LEND;
        std::exit(EXIT_FAILURE);
      }
    }
  }

  customize_message_facility(P2::mlog, "PRT2");
  P2::mlog[Sawyer::Message::FATAL].enable();
  P2::mlog[Sawyer::Message::ERROR].enable();
  P2::mlog[Sawyer::Message::MARCH].enable();
  if (vm.count("pdebug")) {
    ODEBUG << "Partitioner debugging enabled." << LEND;
    P2::mlog[Sawyer::Message::WARN].enable();
    P2::mlog[Sawyer::Message::INFO].enable();
    P2::mlog[Sawyer::Message::DEBUG].enable();
  }

  auto timer = make_timer();
  engine->runPartitioner(partitioner);
  OINFO << "Function partitioning took " << timer << " seconds." << LEND;

  report_partitioner_statistics(partitioner);

  if (interactive_logging()) {
    partitioner.progress(Rose::Progress::Ptr());
  }

  if (partitioner.functions().empty()) {
    GERROR << "No functions were found in " << specimen_names.front() << "." << LEND;
  }

  return partitioner;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
