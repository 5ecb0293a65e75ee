// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/generator.hpp>
#include <libfnsig/options.hpp>
#include <libfnsig/sigfile.hpp>
#include <gtest/gtest.h>

#include <boost/archive/binary_oarchive.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "listing_builder.hpp"

using namespace fnsig;
using namespace fnsig::test;

namespace bfs = boost::filesystem;

class SigfileTestFixture : public ::testing::Test {
 protected:
  bfs::path dir;
  SignatureStore store;

 public:
  SigfileTestFixture() {
    ListingBackend listing;
    listing.add_function(simple_function(0x1000, "sub_1000", {
          insn(0x1005, "mov", {OperandInfo("eax"), imm(0x11111111)}),
          dataref(0x100a, "push", 0x9000)}));
    listing.add_function(simple_function(0x2000, "helper", {call(0x2005, 0x1000)}));
    listing.add_string(0x9000, "unique_marker_string", {0x100a});
    store = SignatureGenerator(listing).generate();
  }
  virtual ~SigfileTestFixture() { /* Nothing to do here*/ }

  virtual void SetUp() {
    dir = bfs::temp_directory_path() / bfs::unique_path("fnsig-test-%%%%-%%%%-%%%%");
    bfs::create_directories(dir);
  }
  virtual void TearDown() {
    boost::system::error_code ec;
    bfs::remove_all(dir, ec);
  }

  std::string path(std::string const & name) const {
    return (dir / name).native();
  }

  void write_file(std::string const & name, std::string const & contents) const {
    bfs::ofstream file(dir / name, std::ios_base::out | std::ios_base::binary);
    file << contents;
  }
};

TEST_F(SigfileTestFixture, TEST_ROUND_TRIP) {
  ASSERT_FALSE(store.functions().empty());
  ASSERT_FALSE(store.strings().empty());
  ASSERT_FALSE(store.immediates().empty());
  save_signatures(store, path("a.fsig"));
  SignatureStore loaded = load_signatures(path("a.fsig"));
  ASSERT_TRUE(store == loaded);
  ASSERT_EQ(store.functions().at(0x2000).blocks[0].called_names,
            loaded.functions().at(0x2000).blocks[0].called_names);
}

TEST_F(SigfileTestFixture, TEST_EMPTY_ROUND_TRIP) {
  SignatureStore empty;
  save_signatures(empty, path("empty.fsig"));
  SignatureStore loaded = load_signatures(path("empty.fsig"));
  ASSERT_TRUE(loaded == empty);
  ASSERT_TRUE(loaded.functions().empty());
}

TEST_F(SigfileTestFixture, TEST_UNCOMPRESSED) {
  save_signatures(store, path("plain.fsig"), false);
  save_signatures(store, path("packed.fsig"), true);
  std::string plain = get_file_contents(path("plain.fsig"));
  std::string packed = get_file_contents(path("packed.fsig"));
  ASSERT_EQ('\x1f', packed[0]);
  ASSERT_EQ('\x8b', packed[1]);
  ASSERT_NE('\x1f', plain[0]);
  // Either kind loads.
  ASSERT_TRUE(load_signatures(path("plain.fsig")) == store);
  ASSERT_TRUE(load_signatures(path("packed.fsig")) == store);
}

TEST_F(SigfileTestFixture, TEST_BYTE_IDENTICAL) {
  save_signatures(store, path("one.fsig"));
  save_signatures(store, path("two.fsig"));
  ASSERT_EQ(get_file_contents(path("one.fsig")), get_file_contents(path("two.fsig")));
}

TEST_F(SigfileTestFixture, TEST_MISSING_FILE) {
  ASSERT_THROW(load_signatures(path("missing.fsig")), SignatureFileError);
  try {
    load_signatures(path("missing.fsig"));
  } catch (SignatureFileError const & e) {
    ASSERT_EQ(path("missing.fsig"), e.path());
  }
}

TEST_F(SigfileTestFixture, TEST_UNWRITABLE_FILE) {
  ASSERT_THROW(save_signatures(store, path("no/such/dir/out.fsig")), SignatureFileError);
}

TEST_F(SigfileTestFixture, TEST_CORRUPT_FILE) {
  write_file("empty.fsig", "");
  ASSERT_THROW(load_signatures(path("empty.fsig")), SignatureFileError);
  write_file("garbage.fsig", "this is not a signature file");
  ASSERT_THROW(load_signatures(path("garbage.fsig")), SignatureFileError);
  write_file("badgzip.fsig", std::string("\x1f\x8b\x08\x00garbage", 11));
  ASSERT_THROW(load_signatures(path("badgzip.fsig")), SignatureFileError);
}

TEST_F(SigfileTestFixture, TEST_TRUNCATED_FILE) {
  for (bool compress : {true, false}) {
    save_signatures(store, path("full.fsig"), compress);
    std::string contents = get_file_contents(path("full.fsig"));
    write_file("truncated.fsig", contents.substr(0, contents.size() / 2));
    ASSERT_THROW(load_signatures(path("truncated.fsig")), SignatureFileError);
  }
}

TEST_F(SigfileTestFixture, TEST_WRONG_FORMAT) {
  {
    bfs::ofstream file(dir / "other.fsig", std::ios_base::out | std::ios_base::binary);
    boost::archive::binary_oarchive oa(file);
    oa << std::string{"some other archive"} << unsigned{FNSIG_SIGNATURE_VERSION};
  }
  ASSERT_THROW(load_signatures(path("other.fsig")), SignatureFileError);

  {
    bfs::ofstream file(dir / "future.fsig", std::ios_base::out | std::ios_base::binary);
    boost::archive::binary_oarchive oa(file);
    oa << std::string{FNSIG_SIGNATURE_FORMAT} << unsigned{FNSIG_SIGNATURE_VERSION + 1};
    oa << store;
  }
  ASSERT_THROW(load_signatures(path("future.fsig")), SignatureFileError);
}

TEST_F(SigfileTestFixture, TEST_DEFAULT_EXTENSION) {
  ASSERT_EQ("sigs.fsig", add_default_extension("sigs"));
  ASSERT_EQ("sigs.db", add_default_extension("sigs.db"));
  ASSERT_EQ("dir.d/sigs.fsig", add_default_extension("dir.d/sigs"));
  ASSERT_EQ("sigs.x", add_default_extension("sigs", ".x"));
}

static int sigfile_test_main(int argc, char **argv) {
  olog.initialize("OINFO");
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

int main(int argc, char **argv) {
  return fnsig_main("SIGTEST", sigfile_test_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
