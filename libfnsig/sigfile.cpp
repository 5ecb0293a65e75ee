// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <algorithm>
#include <string>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include "sigfile.hpp"
#include "misc.hpp"

namespace fnsig {

namespace bfs = boost::filesystem;
namespace bio = boost::iostreams;
namespace bar = boost::archive;

namespace {

// Two bytes that start every gzip stream
constexpr char gzip_magic[] = { '\x1f', '\x8b' };

void write_archive(SignatureStore const & store, std::ostream & stream, bool compress)
{
  bio::filtering_streambuf<bio::output> out;
  if (compress) {
    // The default gzip parameters leave the modification time zero, so identical stores
    // produce identical files.
    out.push(bio::gzip_compressor());
  }
  out.push(stream);
  {
    bar::binary_oarchive oa(out);
    oa << std::string{FNSIG_SIGNATURE_FORMAT} << unsigned{FNSIG_SIGNATURE_VERSION};
    oa << store;
  }
  // Flush the compressor and write the gzip trailer.
  out.reset();
}

} // unnamed namespace

void save_signatures(SignatureStore const & store, std::string const & path, bool compress)
{
  bfs::path p(path);
  bfs::ofstream file(p, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc);
  if (!file) {
    throw SignatureFileError(path, "could not open for writing");
  }
  // The inner try ensures that an incomplete file is removed, whatever went wrong.
  try {
    try {
      write_archive(store, file, compress);
      file.close();
      if (file.fail()) {
        throw SignatureFileError(path, "write failed");
      }
    } catch (...) {
      if (file.is_open()) {
        file.close();
      }
      boost::system::error_code ec;
      if (!bfs::remove(p, ec)) {
        GWARN << "Could not remove incomplete signature file " << p << LEND;
      }
      throw;
    }
  } catch (SignatureFileError const &) {
    throw;
  } catch (std::exception const & e) {
    throw SignatureFileError(path, std::string("could not write signatures: ") + e.what());
  }
  GDEBUG << "Wrote " << store << " to " << path << LEND;
}

SignatureStore load_signatures(std::string const & path)
{
  bfs::path p(path);
  bfs::ifstream file(p, std::ios_base::in | std::ios_base::binary);
  if (!file) {
    throw SignatureFileError(path, "could not open for reading");
  }

  char magic[sizeof(gzip_magic)] = { 0, 0 };
  file.read(magic, sizeof(magic));
  bool compressed = file.gcount() == sizeof(magic)
                    && std::equal(magic, magic + sizeof(magic), gzip_magic);
  file.clear();
  file.seekg(0, std::ios_base::beg);

  SignatureStore store;
  try {
    bio::filtering_streambuf<bio::input> in;
    if (compressed) {
      in.push(bio::gzip_decompressor());
    }
    in.push(file);
    bar::binary_iarchive ia(in);
    std::string format;
    unsigned version = 0;
    ia >> format;
    if (format != FNSIG_SIGNATURE_FORMAT) {
      throw SignatureFileError(path, "not a signature file");
    }
    ia >> version;
    if (version != FNSIG_SIGNATURE_VERSION) {
      throw SignatureFileError(
        path, "unsupported signature file version " + std::to_string(version)
        + " (expected " + std::to_string(FNSIG_SIGNATURE_VERSION) + ")");
    }
    ia >> store;
  } catch (SignatureFileError const &) {
    throw;
  } catch (bio::gzip_error const & e) {
    throw SignatureFileError(path, std::string("corrupt compressed data: ") + e.what());
  } catch (bar::archive_exception const & e) {
    throw SignatureFileError(path, std::string("corrupt or truncated file: ") + e.what());
  } catch (std::exception const & e) {
    throw SignatureFileError(path, std::string("could not read signatures: ") + e.what());
  }
  GDEBUG << "Read " << store << " from " << path << LEND;
  return store;
}

std::string add_default_extension(std::string const & path, std::string const & extension)
{
  bfs::path p(path);
  if (p.has_extension() || extension.empty()) {
    return path;
  }
  return path + extension;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
