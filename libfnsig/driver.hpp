// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Driver_H
#define Fnsig_Driver_H

// The pieces shared by the fn2sig and sigapply programs.

#include <memory>
#include <ostream>
#include <string>

#include "backend.hpp"
#include "matcher.hpp"
#include "options.hpp"
#include "renamer.hpp"

namespace fnsig {

// A ListingBackend when --listing was given, otherwise a RoseBackend for the positional file.
// Throws ListingError for unreadable listings.
std::unique_ptr<AnalysisBackend> open_backend(ProgOptVarMap const & vm);

// The categories named by --categories (comma separated), or by fnsig.categories.  Throws
// std::invalid_argument for unknown category names.
MatchCategorySet requested_categories(ProgOptVarMap const & vm);

// The value of fnsig.compress.
bool compress_signatures(ProgOptVarMap const & vm);

// The signature path given by cli_option, or fnsig.signature_file.  When default_extension
// is set, fnsig.signature_extension is appended to a path without an extension.
std::string signature_path(ProgOptVarMap const & vm, std::string const & cli_option,
                           bool default_extension = true);

// Write the renames, whether each renamed function is now marked as a library function, and
// the per-category counts as a YAML document.
void write_rename_report(Renamer const & renamer, AnalysisBackend const & backend,
                         std::ostream & out);

} // namespace fnsig

#endif // Fnsig_Driver_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
