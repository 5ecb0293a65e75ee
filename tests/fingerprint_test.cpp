// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/fingerprint.hpp>
#include <libfnsig/options.hpp>
#include <gtest/gtest.h>

#include "listing_builder.hpp"

using namespace fnsig;
using namespace fnsig::test;

using Tokens = std::vector<std::string>;

class FingerprintTestFixture : public ::testing::Test {
 protected:
  ListingBackend listing;
  StringIndex strings;

 public:
  FingerprintTestFixture() {
    listing.add_function(simple_function(0x2000, "foo", {}));
    listing.add_string(0x4000, "hello world!", {0x1003});
    listing.add_known_location(0x70000);
    strings = listing.string_index();
  }
  virtual ~FingerprintTestFixture() { /* Nothing to do here*/ }

  BlockSignature fingerprint(std::vector<InstructionInfo> insns, BlockTokens & tokens) {
    Fingerprinter fp(listing, strings);
    return fp.block(block(0x1000, std::move(insns)), &tokens);
  }
};

TEST_F(FingerprintTestFixture, TEST_MNEMONICS_AND_OPERANDS) {
  BlockTokens tokens;
  auto sig = fingerprint({
      insn(0x1000, "push", {OperandInfo("ebp")}),
      insn(0x1001, "mov", {OperandInfo("ebp"), OperandInfo("esp")}),
      insn(0x1003, "ret")}, tokens);
  ASSERT_EQ((Tokens{"push", "ebp", "mov", "ebp", "esp", "ret"}), tokens.formal);
  ASSERT_TRUE(tokens.fuzzy.empty());
  ASSERT_EQ(sighash("pushebpmovebpespret"), sig.formal);
  ASSERT_EQ(sighash(""), sig.fuzzy);
  ASSERT_TRUE(sig.immediates.empty());
  ASSERT_TRUE(sig.called_names.empty());
}

TEST_F(FingerprintTestFixture, TEST_CALL_NAMED_TARGET) {
  BlockTokens tokens;
  auto sig = fingerprint({call(0x1000, 0x2000)}, tokens);
  // The call's operand text is not part of the formal signature.
  ASSERT_EQ((Tokens{"call"}), tokens.formal);
  ASSERT_EQ((Tokens{"funcref"}), tokens.fuzzy);
  ASSERT_EQ((Tokens{"foo"}), sig.called_names);
  ASSERT_EQ(sighash("funcref"), sig.fuzzy);
}

TEST_F(FingerprintTestFixture, TEST_CALL_UNRESOLVED_TARGET) {
  BlockTokens tokens;
  auto sig = fingerprint({call(0x1000, 0x3000)}, tokens);
  ASSERT_EQ((Tokens{"call"}), tokens.formal);
  ASSERT_TRUE(tokens.fuzzy.empty());
  ASSERT_TRUE(sig.called_names.empty());
}

TEST_F(FingerprintTestFixture, TEST_STRING_REFERENCE) {
  BlockTokens tokens;
  fingerprint({dataref(0x1003, "push", 0x4000)}, tokens);
  ASSERT_EQ((Tokens{"push", "hello world!"}), tokens.formal);
  ASSERT_EQ((Tokens{"hello world!"}), tokens.fuzzy);
}

TEST_F(FingerprintTestFixture, TEST_DATA_REFERENCE) {
  BlockTokens tokens;
  auto sig = fingerprint({dataref(0x1000, "mov", 0x6000)}, tokens);
  ASSERT_EQ((Tokens{"mov", "dataref"}), tokens.formal);
  ASSERT_EQ((Tokens{"dataref"}), tokens.fuzzy);
  // The operand that held the address is not an immediate
  ASSERT_TRUE(sig.immediates.empty());
}

TEST_F(FingerprintTestFixture, TEST_MULTIPLE_DATA_REFERENCES) {
  InstructionInfo i = dataref(0x1000, "mov", 0x4000);
  i.data_refs.push_back(0x6000);
  BlockTokens tokens;
  fingerprint({i}, tokens);
  ASSERT_EQ((Tokens{"mov", "hello world!", "dataref"}), tokens.formal);
  ASSERT_EQ((Tokens{"hello world!", "dataref"}), tokens.fuzzy);
}

TEST_F(FingerprintTestFixture, TEST_JUMP_ONLY_MNEMONIC) {
  BlockTokens tokens;
  auto sig = fingerprint({jump(0x1000, "jz", 0x1234567)}, tokens);
  ASSERT_EQ((Tokens{"jz"}), tokens.formal);
  ASSERT_TRUE(tokens.fuzzy.empty());
  ASSERT_TRUE(sig.immediates.empty());
}

TEST_F(FingerprintTestFixture, TEST_LARGE_IMMEDIATE) {
  BlockTokens tokens;
  auto sig = fingerprint({insn(0x1000, "mov", {OperandInfo("eax"), imm(0x12345678)})}, tokens);
  ASSERT_EQ((Tokens{"mov", "eax", "0x12345678"}), tokens.formal);
  ASSERT_EQ((Tokens{"305419896"}), tokens.fuzzy);
  ASSERT_EQ((std::vector<std::uint64_t>{0x12345678}), sig.immediates);
}

TEST_F(FingerprintTestFixture, TEST_IMMEDIATE_THRESHOLD) {
  BlockTokens tokens;
  auto sig = fingerprint({
      insn(0x1000, "mov", {OperandInfo("eax"), imm(0xFFFF)}),
      insn(0x1005, "mov", {OperandInfo("ecx"), imm(0x10000)})}, tokens);
  ASSERT_EQ((Tokens{"mov", "eax", "0xFFFF", "mov", "ecx", "0x10000"}), tokens.formal);
  ASSERT_EQ((Tokens{"65536"}), tokens.fuzzy);
  ASSERT_EQ((std::vector<std::uint64_t>{0x10000}), sig.immediates);
}

TEST_F(FingerprintTestFixture, TEST_CONFIGURED_THRESHOLD) {
  Fingerprinter fp(listing, strings, 0x100);
  BlockTokens tokens;
  auto sig = fp.block(block(0x1000, {insn(0x1000, "push", {imm(0x1000)})}), &tokens);
  ASSERT_EQ((std::vector<std::uint64_t>{0x1000}), sig.immediates);
}

TEST_F(FingerprintTestFixture, TEST_NEGATIVE_IMMEDIATE) {
  BlockTokens tokens;
  auto sig = fingerprint({
      insn(0x1000, "add", {OperandInfo("esp"), OperandInfo("-0x100000", ~std::uint64_t(0xFFFFF))})},
    tokens);
  ASSERT_EQ((Tokens{"add", "esp", "-0x100000"}), tokens.formal);
  ASSERT_TRUE(tokens.fuzzy.empty());
  ASSERT_TRUE(sig.immediates.empty());
}

TEST_F(FingerprintTestFixture, TEST_KNOWN_LOCATION_IMMEDIATE) {
  BlockTokens tokens;
  auto sig = fingerprint({
      insn(0x1000, "push", {imm(0x70000)}),
      insn(0x1005, "push", {imm(0x4000 + 0x100000)}),
      insn(0x100a, "push", {imm(0x2000)})}, tokens);
  // 0x70000 is a known location and 0x2000 is too small.
  ASSERT_EQ((Tokens{"1064960"}), tokens.fuzzy);
  ASSERT_EQ((std::vector<std::uint64_t>{0x104000}), sig.immediates);
}

TEST_F(FingerprintTestFixture, TEST_FUNCTION_HASHES) {
  listing.add_function(function(0x8000, "sub_8000", {
        block(0x8000, {insn(0x8000, "push", {imm(0x123456)}), call(0x8005, 0x2000)}),
        block(0x800a, {insn(0x800a, "ret")})}));
  Fingerprinter fp(listing, strings);
  FunctionFingerprint f = fp.function(0x8000);
  ASSERT_EQ("sub_8000", f.signature.name);
  ASSERT_EQ(2u, f.signature.blocks.size());

  auto const & b0 = f.signature.blocks[0];
  auto const & b1 = f.signature.blocks[1];
  ASSERT_EQ(sighash("push0x123456call"), b0.formal);
  ASSERT_EQ(sighash("1193046funcref"), b0.fuzzy);
  ASSERT_EQ((Tokens{"foo"}), b0.called_names);
  ASSERT_EQ(sighash("ret"), b1.formal);

  ASSERT_EQ(sighash(std::to_string(b0.formal) + std::to_string(b1.formal)), f.formal);
  ASSERT_EQ(sighash(std::to_string(b0.fuzzy) + std::to_string(b1.fuzzy)), f.fuzzy);
  ASSERT_EQ(f.formal, Fingerprinter::combine_formal(f.signature.blocks));
}

TEST_F(FingerprintTestFixture, TEST_EMPTY_FUNCTION) {
  Fingerprinter fp(listing, strings);
  FunctionFingerprint f = fp.function(0x9000);
  ASSERT_TRUE(f.signature.name.empty());
  ASSERT_TRUE(f.signature.blocks.empty());
  ASSERT_EQ(sighash(""), f.formal);
}

static int fingerprint_test_main(int argc, char **argv) {
  olog.initialize("OINFO");
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

int main(int argc, char **argv) {
  return fnsig_main("FPTEST", fingerprint_test_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
