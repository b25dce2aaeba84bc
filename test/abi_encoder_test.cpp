#include "abi/abi_encoder.hpp"
#include "executor/executor_abi.hpp"
#include "protocols/erc20.hpp"
#include "crypto/keccak.hpp"
#include "common/errors.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

namespace {
  std::string Word(unsigned long long v) { return Hex::FromBytes(Abi::EncodeUint256(v)).substr(2); }
  const std::string kAlice = "0x" + testutil::Repeat("01", 20);
  const std::string kToken = "0x" + testutil::Repeat("70", 20);
}

TEST(abi, static_words) {
  EXPECT_EQ(Word(1), testutil::Repeat("00", 31) + "01");
  EXPECT_EQ(Hex::FromBytes(Abi::EncodeAddress(kAlice)), "0x" + testutil::Repeat("00", 12) + testutil::Repeat("01", 20));
  EXPECT_EQ(Abi::EncodeBool(true), Abi::EncodeUint256(1));
  EXPECT_THROW(Abi::EncodeAddress("0x1234"), EncodingError);
}

TEST(abi, selectors) {
  EXPECT_EQ(Hex::FromBytes(Abi::Selector("transfer(address,uint256)")), "0xa9059cbb");
  EXPECT_EQ(Hex::FromBytes(Abi::Selector("balanceOf(address)")), "0x70a08231");
}

TEST(abi, bytes_tail_is_padded) {
  auto tail = Abi::EncodeBytesTail(Hex::ToBytes("0x616263"));
  EXPECT_EQ(Hex::FromBytes(tail), "0x" + Word(3) + "616263" + testutil::Repeat("00", 29));
  EXPECT_EQ(Abi::EncodeBytesTail({}).size(), 32u);
  EXPECT_EQ(Abi::EncodeBytesTail(Bytes(32, 1)).size(), 64u);
}

TEST(abi, tuple_head_tail_layout) {
  // abi.encode(bytes("abc"), uint256(5))
  auto enc = Abi::TupleEncoder()
    .Dynamic(Abi::EncodeBytesTail(Hex::ToBytes("0x616263")))
    .Static(Abi::EncodeUint256(5))
    .Finish();
  EXPECT_EQ(Hex::FromBytes(enc), "0x" + Word(0x40) + Word(5) + Word(3) + "616263" + testutil::Repeat("00", 29));
  EXPECT_THROW(Abi::TupleEncoder().Static(Bytes(31, 0)), EncodingError);
}

TEST(abi, static_and_dynamic_arrays) {
  auto addrs = Abi::EncodeArray({Abi::EncodeUint256(7), Abi::EncodeUint256(8)}, false);
  EXPECT_EQ(Hex::FromBytes(addrs), "0x" + Word(2) + Word(7) + Word(8));
  EXPECT_EQ(Hex::FromBytes(Abi::EncodeArray({}, true)), "0x" + Word(0));
}

TEST(abi, call_array_layout) {
  Batch calls{Call{kToken, 9, Hex::ToBytes("0xdeadbeef")}};
  std::string expected = "0x" + Word(1) + Word(0x20)
    + testutil::Repeat("00", 12) + testutil::Repeat("70", 20) + Word(9) + Word(0x60)
    + Word(4) + "deadbeef" + testutil::Repeat("00", 28);
  EXPECT_EQ(Hex::FromBytes(ExecutorABI::EncodeCalls(calls)), expected);
}

TEST(abi, batch_hash_is_keccak_of_encoded_arguments) {
  Batch calls{Call{kToken, 0, ERC20::TransferCalldata(kAlice, 1)}};
  Bytes encoded = Abi::TupleEncoder()
    .Dynamic(ExecutorABI::EncodeCalls(calls))
    .Static(Abi::EncodeUint256(3))
    .Static(Abi::EncodeUint256(4))
    .Finish();
  EXPECT_EQ(ExecutorABI::BatchHash(calls, 3, 4), Crypto::Keccak256(encoded));
  Bytes admin = Abi::TupleEncoder().Static(Abi::EncodeAddress(kAlice)).Static(Abi::EncodeUint256(3)).Static(Abi::EncodeUint256(4)).Finish();
  EXPECT_EQ(ExecutorABI::AdminChangeHash(kAlice, 3, 4), Crypto::Keccak256(admin));
}

TEST(abi, executor_calldata_selectors) {
  SignedBatch batch;
  batch.calls = {Call{kToken, 0, {}}};
  batch.signature = Crypto::Signature::FromParts({0x01}, {0x02}, 0);
  auto data = ExecutorABI::BuildExecuteBatchCalldata(batch);
  EXPECT_EQ(Bytes(data.begin(), data.begin() + 4), Abi::Selector(ExecutorABI::kExecuteBatchSignature));
  // head: calls offset, nonce, deadline, signature offset
  EXPECT_EQ(Bytes(data.begin() + 4, data.begin() + 36), Abi::EncodeUint256(0x80));

  auto unsigned_data = ExecutorABI::BuildExecuteBatchUnsignedCalldata(batch.calls);
  EXPECT_EQ(Bytes(unsigned_data.begin(), unsigned_data.begin() + 4), Abi::Selector(ExecutorABI::kExecuteBatchUnsignedSignature));

  auto init = ExecutorABI::BuildInitializeCalldata(kAlice);
  EXPECT_EQ(init.size(), 36u);
  EXPECT_EQ(Bytes(init.begin() + 4, init.end()), Abi::EncodeAddress(kAlice));

  CallerUpdate mismatched;
  mismatched.callers = {kAlice};
  mismatched.signature = batch.signature;
  EXPECT_THROW(ExecutorABI::BuildUpdateCallersCalldata(mismatched), ValidationError);
}

TEST(abi, decoders) {
  EXPECT_TRUE(Abi::DecodeBool(Abi::EncodeBool(true)));
  EXPECT_FALSE(Abi::DecodeBool(Abi::EncodeBool(false)));
  EXPECT_THROW(Abi::DecodeBool(Abi::EncodeUint256(2)), EncodingError);
  EXPECT_THROW(Abi::DecodeBool({}), EncodingError);
  EXPECT_EQ(Abi::DecodeUint64(Abi::EncodeUint256(123456789)), 123456789u);
  EXPECT_THROW(Abi::DecodeUint64(Bytes(32, 0xff)), EncodingError);
}

TEST(erc20, transfer_calldata_roundtrip) {
  auto data = ERC20::TransferCalldata(kAlice, 1000);
  EXPECT_EQ(Hex::FromBytes(data), "0xa9059cbb" + Hex::FromBytes(Abi::EncodeAddress(kAlice)).substr(2) + Word(1000));
  auto t = ERC20::DecodeTransfer(data);
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->to, kAlice);
  EXPECT_EQ(t->amount, 1000u);
  EXPECT_FALSE(ERC20::DecodeTransfer(ERC20::BalanceOfCalldata(kAlice)).has_value());
  data.push_back(0);
  EXPECT_FALSE(ERC20::DecodeTransfer(data).has_value());
  EXPECT_EQ(ERC20::DecodeBalanceOf(ERC20::BalanceOfCalldata(kAlice)).value(), kAlice);
}
