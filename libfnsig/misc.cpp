// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <boost/format.hpp>

#include "misc.hpp"
#include "options.hpp"

namespace fnsig {

Sawyer::Message::Facility glog;

// Keep every address we print in one format so that log output from the two programs being
// compared lines up.
std::string addr_str(address_t target_addr) {
  return boost::str(boost::format("0x%08X") % target_addr);
}

std::string placeholder_name(address_t addr) {
  return boost::str(boost::format("sub_%X") % addr);
}

void customize_message_facility(Sawyer::Message::Facility & facility, std::string const & name)
{
  facility.renameStreams(name);
  facility.initStreams(get_logging_destination());
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
