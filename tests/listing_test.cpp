// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/listing.hpp>
#include <libfnsig/options.hpp>
#include <gtest/gtest.h>

#include "listing_builder.hpp"

using namespace fnsig;
using namespace fnsig::test;

namespace {

char const * const program = R"(
functions:
  - address: 0x1000
    name: sub_1000
    blocks:
      - address: 0x1000
        instructions:
          - {address: 0x1000, mnemonic: push, operands: [ebp]}
          - {address: 0x1001, mnemonic: call, call: true, code_refs: [0x2000]}
          - {address: 0x1006, mnemonic: push, operands: [0x4000], data_refs: [0x4000]}
          - {address: 0x100b, mnemonic: add, operands: [esp, -8]}
          - address: 0x100e
            mnemonic: mov
            operands:
              - eax
              - {text: "dword ptr [0x5000]", value: 0x5000, immediate: false}
      - address: 0x1020
        instructions:
          - {address: 0x1020, mnemonic: ret}
  - address: 0x2000
    blocks:
      - address: 0x2000
        instructions:
          - {address: 0x2000, mnemonic: lea, operands: ["eax", "[4*ecx]", 42]}
strings:
  - {address: 0x4000, value: "a string in the program", xrefs: [0x1006]}
names:
  0x5000: a_global
  0x2000: helper
known_locations: [0x6000, 24576]
)";

} // unnamed namespace

class ListingTestFixture : public ::testing::Test {
 protected:
  ListingBackend listing;

 public:
  ListingTestFixture() : listing(ListingBackend::parse(program, "program.yaml")) {}
  virtual ~ListingTestFixture() { /* Nothing to do here*/ }
};

TEST_F(ListingTestFixture, TEST_FUNCTIONS) {
  ASSERT_EQ((std::vector<address_t>{0x1000, 0x2000}), listing.functions());
  auto blocks = listing.basic_blocks(0x1000);
  ASSERT_EQ(2u, blocks.size());
  ASSERT_EQ(0x1020u, blocks[1].address);
  ASSERT_EQ(5u, blocks[0].instructions.size());
  ASSERT_TRUE(listing.basic_blocks(0x3000).empty());

  InstructionInfo const & call = blocks[0].instructions[1];
  ASSERT_TRUE(call.is_call);
  ASSERT_EQ(std::vector<address_t>{0x2000}, call.code_refs);
  ASSERT_TRUE(call.operands.empty());

  InstructionInfo const & push = blocks[0].instructions[2];
  ASSERT_FALSE(push.is_call);
  ASSERT_EQ(std::vector<address_t>{0x4000}, push.data_refs);
}

TEST_F(ListingTestFixture, TEST_OPERANDS) {
  auto blocks = listing.basic_blocks(0x1000);
  OperandInfo const & reg = blocks[0].instructions[0].operands.at(0);
  ASSERT_EQ("ebp", reg.text);
  ASSERT_FALSE(reg.immediate);

  OperandInfo const & number = blocks[0].instructions[2].operands.at(0);
  ASSERT_EQ("0x4000", number.text);
  ASSERT_TRUE(number.immediate);
  ASSERT_EQ(0x4000u, number.value);

  OperandInfo const & negative = blocks[0].instructions[3].operands.at(1);
  ASSERT_EQ("-8", negative.text);
  ASSERT_TRUE(negative.immediate);
  ASSERT_EQ(~std::uint64_t(7), negative.value);

  OperandInfo const & mem = blocks[0].instructions[4].operands.at(1);
  ASSERT_EQ("dword ptr [0x5000]", mem.text);
  ASSERT_FALSE(mem.immediate);
  ASSERT_EQ(0x5000u, mem.value);

  auto const & lea = listing.basic_blocks(0x2000)[0].instructions[0].operands;
  ASSERT_EQ(3u, lea.size());
  ASSERT_FALSE(lea[1].immediate);
  ASSERT_TRUE(lea[2].immediate);
  ASSERT_EQ(42u, lea[2].value);
}

TEST_F(ListingTestFixture, TEST_NAMES) {
  ASSERT_EQ("sub_1000", *listing.display_name(0x1000));
  // Named only by the names map
  ASSERT_EQ("helper", *listing.display_name(0x2000));
  ASSERT_EQ("a_global", *listing.display_name(0x5000));
  ASSERT_FALSE(listing.display_name(0x6000));
  ASSERT_EQ(0x5000u, *listing.address_of_name("a_global"));
  ASSERT_FALSE(listing.address_of_name("nothing"));
}

TEST_F(ListingTestFixture, TEST_SET_NAME) {
  ASSERT_TRUE(listing.set_name(0x1000, "parse_header"));
  ASSERT_EQ("parse_header", *listing.display_name(0x1000));
  ASSERT_FALSE(listing.address_of_name("sub_1000"));
  // Setting the same name again is fine
  ASSERT_TRUE(listing.set_name(0x1000, "parse_header"));
  // The name belongs to another address
  ASSERT_FALSE(listing.set_name(0x2000, "parse_header"));
  ASSERT_EQ("helper", *listing.display_name(0x2000));

  ASSERT_FALSE(listing.is_library(0x1000));
  listing.mark_library(0x1000);
  ASSERT_TRUE(listing.is_library(0x1000));
  ASSERT_EQ(1u, listing.library_functions().size());
}

TEST_F(ListingTestFixture, TEST_FUNCTION_CONTAINING) {
  ASSERT_EQ(0x1000u, *listing.function_containing(0x1000));
  ASSERT_EQ(0x1000u, *listing.function_containing(0x1006));
  ASSERT_EQ(0x1000u, *listing.function_containing(0x1020));
  ASSERT_EQ(0x2000u, *listing.function_containing(0x2000));
  // Not the address of an instruction
  ASSERT_FALSE(listing.function_containing(0x1007));
  ASSERT_FALSE(listing.function_containing(0x4000));
}

TEST_F(ListingTestFixture, TEST_KNOWN_LOCATIONS) {
  ASSERT_TRUE(listing.is_known_location(0x6000));
  ASSERT_TRUE(listing.is_known_location(0x4000));
  ASSERT_TRUE(listing.is_known_location(0x5000));
  ASSERT_TRUE(listing.is_known_location(0x1020));
  ASSERT_TRUE(listing.is_known_location(0x100b));
  ASSERT_FALSE(listing.is_known_location(0x7000));
  ASSERT_FALSE(listing.is_known_location(0x1007));
}

TEST_F(ListingTestFixture, TEST_STRINGS) {
  auto strings = listing.strings();
  ASSERT_EQ(1u, strings.size());
  ASSERT_EQ("a string in the program", strings[0].value);
  ASSERT_EQ(AddrSet{0x1006}, strings[0].xrefs);
  StringIndex index = listing.string_index();
  ASSERT_EQ(1u, index.count(0x4000));
}

TEST_F(ListingTestFixture, TEST_MALFORMED) {
  ASSERT_THROW(ListingBackend::parse("- 1\n- 2\n"), ListingError);
  ASSERT_THROW(ListingBackend::parse("functions: [1, 2"), ListingError);
  ASSERT_THROW(ListingBackend::parse("functions: {a: 1}"), ListingError);
  // Missing the function address
  ASSERT_THROW(ListingBackend::parse("functions:\n  - name: foo\n"), ListingError);
  // Missing the instruction mnemonic
  ASSERT_THROW(ListingBackend::parse(
                 "functions:\n  - address: 0x10\n    blocks:\n"
                 "      - address: 0x10\n        instructions:\n          - {address: 0x10}\n"),
               ListingError);
  ASSERT_THROW(ListingBackend::parse("known_locations: [0x10, bogus]"), ListingError);
  ASSERT_THROW(ListingBackend::parse("strings:\n  - {address: 0x10}\n"), ListingError);
  ASSERT_THROW(ListingBackend::parse("names: [a, b]"), ListingError);

  try {
    ListingBackend::parse("functions:\n  - name: foo\n", "bad.yaml");
    FAIL() << "Expected a ListingError";
  } catch (ListingError const & e) {
    ASSERT_EQ(0u, std::string(e.what()).find("bad.yaml:2: "));
  }
}

TEST_F(ListingTestFixture, TEST_EMPTY_LISTING) {
  ListingBackend empty = ListingBackend::parse("{}");
  ASSERT_TRUE(empty.functions().empty());
  ASSERT_TRUE(empty.strings().empty());
}

TEST_F(ListingTestFixture, TEST_LOAD_MISSING_FILE) {
  ASSERT_THROW(ListingBackend::load("/nonexistent/fnsig/listing.yaml"), ListingError);
}

TEST_F(ListingTestFixture, TEST_BUILT_IN_MEMORY) {
  ListingBackend built;
  built.add_function(simple_function(0x1000, "sub_1000", {call(0x1005, 0x2000)}));
  built.add_string(0x9000, "some text", {0x1005});
  built.add_known_location(0x9100);
  ASSERT_EQ(std::vector<address_t>{0x1000}, built.functions());
  ASSERT_EQ(0x1000u, *built.function_containing(0x1040));
  ASSERT_TRUE(built.is_known_location(0x9100));
  ASSERT_EQ(0x1000u, *built.address_of_name("sub_1000"));
}

static int listing_test_main(int argc, char **argv) {
  olog.initialize("OINFO");
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

int main(int argc, char **argv) {
  return fnsig_main("LISTTEST", listing_test_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
