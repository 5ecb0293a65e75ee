// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Misc_H
#define Fnsig_Misc_H

// Logging facilities and small helpers that need Sawyer.  This header should not include
// anything from the signature engine itself.

#include <Sawyer/Message.h>

#include <set>
#include <string>

#include "util.hpp"

namespace fnsig {

using AddrSet = std::set<address_t>;

// Create a string from an address
std::string addr_str(address_t addr);
// The sub_XXXX name given to functions the disassembler could not name.
std::string placeholder_name(address_t addr);

// Rename a facility's streams and point it at our logging destination.
void customize_message_facility(Sawyer::Message::Facility & facility, std::string const & name);

} // namespace fnsig

// The main program need to provide a global logging facility.
namespace fnsig { extern Sawyer::Message::Facility glog; }
#define GCRAZY (fnsig::glog[Sawyer::Message::DEBUG]) && fnsig::glog[Sawyer::Message::DEBUG]
#define GTRACE (fnsig::glog[Sawyer::Message::TRACE]) && fnsig::glog[Sawyer::Message::TRACE]
#define GDEBUG (fnsig::glog[Sawyer::Message::WHERE]) && fnsig::glog[Sawyer::Message::WHERE]
#define GMARCH (fnsig::glog[Sawyer::Message::MARCH]) && fnsig::glog[Sawyer::Message::MARCH]
#define GINFO  (fnsig::glog[Sawyer::Message::INFO])  && fnsig::glog[Sawyer::Message::INFO]
#define GWARN  (fnsig::glog[Sawyer::Message::WARN])  && fnsig::glog[Sawyer::Message::WARN]
#define GERROR fnsig::glog[Sawyer::Message::ERROR]
#define GFATAL fnsig::glog[Sawyer::Message::FATAL]

// For local context logging
#define MCRAZY (mlog[Sawyer::Message::DEBUG]) && mlog[Sawyer::Message::DEBUG]
#define MTRACE (mlog[Sawyer::Message::TRACE]) && mlog[Sawyer::Message::TRACE]
#define MDEBUG (mlog[Sawyer::Message::WHERE]) && mlog[Sawyer::Message::WHERE]
#define MMARCH (mlog[Sawyer::Message::MARCH]) && mlog[Sawyer::Message::MARCH]
#define MINFO  (mlog[Sawyer::Message::INFO])  && mlog[Sawyer::Message::INFO]
#define MWARN  (mlog[Sawyer::Message::WARN])  && mlog[Sawyer::Message::WARN]
#define MERROR mlog[Sawyer::Message::ERROR]
#define MFATAL mlog[Sawyer::Message::FATAL]

#endif // Fnsig_Misc_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
