// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <cerrno>
#include <cctype>
#include <cstring>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

#include <boost/algorithm/string.hpp>

#include "util.hpp"

// Causes problem for sawyer/Message.h. :-(  For color_terminal() code.
#include <curses.h>
#include <term.h>

namespace fnsig {

// Return true if we're on a color terminal, and false if not.
bool color_terminal(int fd) {
  bool color = false;
  if (fd >= 0 && isatty(fd)) {
    int erret = 0;
    if (setupterm(NULL, fd, &erret) != ERR) {
      color = tigetnum((char *)"colors") > 0;
      restartterm(NULL, fd, NULL);
    }
  }
  return color;
}

// Parse numbers in C notation ("0x1000", "4096").  Listing files and --option values both come
// through here, so trailing blanks are tolerated but trailing garbage is not.
uint64_t parse_number(const std::string& str) {
  std::size_t pos;
  uint64_t retval = std::stoull(str, &pos, 0);
  if (pos != str.size()) {
    auto loc = std::find_if_not(std::begin(str) + pos, std::end(str),
                                [](char c){ return std::isblank(c);});
    if (loc != std::end(str)) {
      throw std::invalid_argument("Invalid number: " + str);
    }
  }
  return retval;
}

std::string to_lower(std::string input) {
  boost::algorithm::to_lower(input);
  return input;
}

// Read an entire file into a string.
std::string get_file_contents(const std::string & filename) {
  std::ifstream in(filename, std::ios::in | std::ios::binary);
  if (in) {
    std::string contents;
    in.seekg(0, std::ios::end);
    contents.resize(in.tellg());
    in.seekg(0, std::ios::beg);
    in.read(&contents[0], contents.size());
    in.close();
    return contents;
  }
  throw std::runtime_error("Could not read " + filename + ": " + std::strerror(errno));
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
