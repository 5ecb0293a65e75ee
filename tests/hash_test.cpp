// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/hash.hpp>
#include <libfnsig/options.hpp>
#include <gtest/gtest.h>

using namespace fnsig;

class HashTestFixture : public ::testing::Test {
 public:
  HashTestFixture() {}
  virtual ~HashTestFixture() { /* Nothing to do here*/ }
};

// Published FNV-1a 32-bit test vectors
TEST_F(HashTestFixture, TEST_FNV1A_VECTORS) {
  ASSERT_EQ(0x811c9dc5u, sighash(""));
  ASSERT_EQ(0xe40c292cu, sighash("a"));
  ASSERT_EQ(0xbf9cf968u, sighash("foobar"));
}

TEST_F(HashTestFixture, TEST_INCREMENTAL) {
  FNV1a hash;
  hash.update("foo");
  hash.update(std::string("bar"));
  ASSERT_EQ(sighash("foobar"), hash.finalize());
  // finalize() doesn't disturb the state
  ASSERT_EQ(sighash("foobar"), hash.finalize());
}

TEST_F(HashTestFixture, TEST_EMBEDDED_NUL) {
  std::string a("a\0b", 3);
  std::string b("a\0c", 3);
  ASSERT_NE(sighash(a), sighash(b));
  ASSERT_NE(sighash(a), sighash("a"));
}

static int hash_test_main(int argc, char **argv) {
  olog.initialize("OINFO");
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

int main(int argc, char **argv) {
  return fnsig_main("HASHTEST", hash_test_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
