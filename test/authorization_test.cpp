#include "eip7702/authorization.hpp"
#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace Eip7702;

namespace {
  const std::string kDelegate = "0x0eacd1a7b4f2c9e8d7f6a5b4c3d2e1f0a9b894dd";
  constexpr unsigned long long kSepolia = 11155111;
}

TEST(authorization, preimage_layout) {
  auto pre = AuthorizationPreimage(kSepolia, kDelegate, 0);
  EXPECT_EQ(Hex::FromBytes(pre), "0x05da83aa36a794" + kDelegate.substr(2) + "80");
  EXPECT_EQ(AuthorizationHash(kSepolia, kDelegate, 0), Crypto::Keccak256(pre));
}

// Recorded with an independent keccak/secp256k1 implementation (RFC 6979, low-S).
TEST(authorization, sepolia_known_answer) {
  EXPECT_EQ(Hex::FromBytes(AuthorizationHash(kSepolia, kDelegate, 0)),
            "0x4d34e4545f5c245295d8c18f7758688d82078c2a3b305a3ff29066b486f87858");

  auto entry = SignAuthorization(testutil::Key(1), kSepolia, kDelegate, 0);
  EXPECT_EQ(Hex::FromBytes(entry.r), "0xb3656c19b1c8de9a8d1611db933b36b6ab582bac69081c8941c1f8156fe35a67");
  EXPECT_EQ(Hex::FromBytes(entry.s), "0x2de8358bc17b46bdf037a881dc0f37a9176a713d5c42dbd65751da5b40d441fa");
  EXPECT_EQ(entry.y_parity, 0);
  EXPECT_EQ(RecoverAuthority(entry), testutil::kAddressOfKey1);
}

TEST(authorization, chain_id_zero_and_small_values) {
  EXPECT_EQ(Hex::FromBytes(AuthorizationPreimage(0, kDelegate, 0)),
            "0x05d78094" + kDelegate.substr(2) + "80");
  EXPECT_EQ(Hex::FromBytes(AuthorizationPreimage(1, kDelegate, 1)),
            "0x05d70194" + kDelegate.substr(2) + "01");
  EXPECT_NE(AuthorizationHash(0, kDelegate, 0), AuthorizationHash(1, kDelegate, 0));
}

TEST(authorization, zero_address_hashes_like_any_other) {
  auto pre = AuthorizationPreimage(kSepolia, Hex::kZeroAddress, 3);
  EXPECT_EQ(Hex::FromBytes(pre), "0x05da83aa36a794" + testutil::Repeat("00", 20) + "03");
  EXPECT_EQ(AuthorizationHash(kSepolia, Hex::kZeroAddress, 3), Crypto::Keccak256(pre));
  EXPECT_NE(AuthorizationHash(kSepolia, Hex::kZeroAddress, 3), AuthorizationHash(kSepolia, kDelegate, 3));
}

TEST(authorization, hash_is_deterministic_and_case_insensitive) {
  std::string upper = "0x0EACD1A7B4F2C9E8D7F6A5B4C3D2E1F0A9B894DD";
  EXPECT_EQ(AuthorizationHash(kSepolia, kDelegate, 9), AuthorizationHash(kSepolia, kDelegate, 9));
  EXPECT_EQ(AuthorizationHash(kSepolia, kDelegate, 9), AuthorizationHash(kSepolia, upper, 9));
  EXPECT_THROW(AuthorizationHash(kSepolia, "0x0eac", 0), EncodingError);
}

TEST(authorization, sign_and_recover_authority) {
  auto entry = SignAuthorization(testutil::Key(1), kSepolia, kDelegate, 4);
  EXPECT_EQ(entry.chain_id, kSepolia);
  EXPECT_EQ(entry.address, kDelegate);
  EXPECT_EQ(entry.nonce, 4u);
  EXPECT_LE(entry.y_parity, 1);
  EXPECT_EQ(RecoverAuthority(entry), testutil::kAddressOfKey1);

  AuthorizationEntry tampered = entry;
  tampered.nonce = 5;
  EXPECT_NE(RecoverAuthority(tampered), testutil::kAddressOfKey1);
}

TEST(authorization, signer_matches_free_function) {
  Signer signer(testutil::KeyHex(2));
  auto a = signer.SignAuthorization(kSepolia, Hex::kZeroAddress, 0);
  auto b = SignAuthorization(testutil::Key(2), kSepolia, Hex::kZeroAddress, 0);
  EXPECT_EQ(a, b);
  EXPECT_EQ(RecoverAuthority(a), signer.Address());
}

TEST(authorization, assemble_validates_inputs) {
  auto sig = Crypto::SignDigest(testutil::Key(1), AuthorizationHash(kSepolia, kDelegate, 0));
  EXPECT_THROW(AssembleAuthorization(kSepolia, "0x" + testutil::Repeat("11", 19), 0, sig), ValidationError);
  Crypto::Signature bad = sig;
  bad.v = 35;
  EXPECT_THROW(AssembleAuthorization(kSepolia, kDelegate, 0, bad), ValidationError);
  Crypto::Signature short_r = sig;
  short_r.r.resize(31);
  EXPECT_THROW(AssembleAuthorization(kSepolia, kDelegate, 0, short_r), ValidationError);

  auto entry = AssembleAuthorization(kSepolia, kDelegate, 0, sig);
  EXPECT_EQ(entry.y_parity, sig.v - 27);
}

TEST(authorization, rlp_roundtrip_with_short_scalars) {
  AuthorizationEntry e;
  e.chain_id = 0;
  e.address = kDelegate;
  e.nonce = 77;
  e.y_parity = 1;
  e.r = Bytes(32, 0);
  e.r[1] = 0x42;
  e.r[31] = 0x01;
  e.s = Bytes(32, 0x33);
  auto enc = EncodeAuthorization(e);
  auto item = RLP::Decode(enc);
  ASSERT_TRUE(item.is_list);
  ASSERT_EQ(item.items.size(), 6u);
  EXPECT_EQ(item.items[4].bytes.size(), 31u);
  EXPECT_EQ(DecodeAuthorization(enc), e);
}

TEST(authorization, decode_rejects_bad_shapes) {
  EXPECT_THROW(DecodeAuthorization(RLP::EncodeList({RLP::EncodeUint(1)})), EncodingError);
  auto item = ToRlpItem(SignAuthorization(testutil::Key(1), kSepolia, kDelegate, 0));
  item.items[3] = RLP::Item::Uint(2);
  EXPECT_THROW(FromRlpItem(item), EncodingError);
}

TEST(authorization, describe_has_no_key_material) {
  auto entry = SignAuthorization(testutil::Key(1), kSepolia, kDelegate, 0);
  auto text = Describe(entry);
  EXPECT_NE(text.find("chainId: 11155111"), std::string::npos);
  EXPECT_NE(text.find(kDelegate), std::string::npos);
  EXPECT_EQ(text.find(testutil::KeyHex(1).substr(2)), std::string::npos);
}
