// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Partitioner_H
#define Fnsig_Partitioner_H

#include <rose.h>
#include <Rose/BinaryAnalysis/MemoryMap.h>
#include <Rose/BinaryAnalysis/Partitioner2/Engine.h>
#include <Rose/BinaryAnalysis/Partitioner2/Partitioner.h>

#include <string>
#include <vector>

#include "options.hpp"

namespace fnsig {

using Rose::BinaryAnalysis::MemoryMap;
namespace P2 = Rose::BinaryAnalysis::Partitioner2;

// Load the specimens into the engine and partition them into functions, configured from the
// command line and the fnsig section of the configuration.  Exits on unrecoverable errors.
P2::Partitioner create_partitioner(ProgOptVarMap const & vm, P2::Engine * engine,
                                   std::vector<std::string> const & specimen_names);

void report_partitioner_statistics(P2::Partitioner const & partitioner);

} // namespace fnsig

#endif // Fnsig_Partitioner_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
