// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Sigfile_H
#define Fnsig_Sigfile_H

#include <stdexcept>
#include <string>

#include "store.hpp"

namespace fnsig {

// Written at the start of every signature file, ahead of the store itself.
#define FNSIG_SIGNATURE_FORMAT "fnsig signatures"
#define FNSIG_SIGNATURE_VERSION 1u

#define FNSIG_DEFAULT_SIGNATURE_FILE "signatures.fsig"
#define FNSIG_DEFAULT_SIGNATURE_EXTENSION ".fsig"

// A signature file could not be written or read.
class SignatureFileError : public std::runtime_error {
 public:
  SignatureFileError(std::string const & path, std::string const & msg)
    : std::runtime_error(path + ": " + msg), path_(path) {}
  std::string const & path() const { return path_; }
 private:
  std::string path_;
};

// Write a store to path, gzip compressed unless compress is false.  An incomplete file is
// removed before SignatureFileError is thrown.
void save_signatures(SignatureStore const & store, std::string const & path,
                     bool compress = true);

// Read a store written by save_signatures, compressed or not.  Throws SignatureFileError.
SignatureStore load_signatures(std::string const & path);

// Append extension to path if path does not already have an extension.
std::string add_default_extension(std::string const & path,
                                  std::string const & extension =
                                  FNSIG_DEFAULT_SIGNATURE_EXTENSION);

} // namespace fnsig

#endif // Fnsig_Sigfile_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
