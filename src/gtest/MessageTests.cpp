////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "TestUtils.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
class MessageTest : public ::testing::Test
{
protected:
   Pubkey program_;
   Pubkey authority_;
   Pubkey payer_;
   BinaryData blockhash_;

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
      program_ = Pubkey(BinaryData::fromString(
         "program_key_program_key_program_").getRef());
      authority_ = Pubkey(BinaryData::fromString(
         "authority_key_authority_key_auth").getRef());
      payer_ = Pubkey(BinaryData::fromString(
         "payer_key_payer_key_payer_key_pa").getRef());
      blockhash_ = BtcUtils::getSha256(BinaryData::fromString("blockhash"));
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, KeyOrder)
{
   auto instr = LoaderInstruction::write(
      program_, authority_, 0, READHEX("aabbcc"));
   auto msg = ArchMessage::compile(
      { instr }, { authority_ }, authority_, blockhash_);

   ASSERT_EQ(msg.accountKeys_.size(), 3ULL);
   EXPECT_EQ(msg.accountKeys_[0], authority_);
   EXPECT_EQ(msg.accountKeys_[1], program_);
   EXPECT_EQ(msg.accountKeys_[2], Pubkey::loaderProgram());

   EXPECT_EQ(msg.header_.numRequiredSignatures_, 1);
   EXPECT_EQ(msg.header_.numReadonlySignedAccounts_, 0);
   EXPECT_EQ(msg.header_.numReadonlyUnsignedAccounts_, 1);

   ASSERT_EQ(msg.instructions_.size(), 1ULL);
   auto& compiled = msg.instructions_[0];
   EXPECT_EQ(compiled.programIdIndex_, 2);
   ASSERT_EQ(compiled.accounts_.size(), 2ULL);
   EXPECT_EQ(compiled.accounts_[0], 1);
   EXPECT_EQ(compiled.accounts_[1], 0);
   EXPECT_EQ(compiled.data_, instr.data_);

   auto signers = msg.signerKeys();
   ASSERT_EQ(signers.size(), 1ULL);
   EXPECT_EQ(signers[0], authority_);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, SignerSlice)
{
   //the fee payer comes first even when listed last
   auto instr = SystemInstruction::createAccount(
      authority_, program_, 1000, 0, Pubkey::loaderProgram());
   auto msg = ArchMessage::compile(
      { instr }, { program_, authority_ }, authority_, blockhash_);

   ASSERT_EQ(msg.accountKeys_.size(), 3ULL);
   EXPECT_EQ(msg.accountKeys_[0], authority_);
   EXPECT_EQ(msg.accountKeys_[1], program_);
   EXPECT_EQ(msg.accountKeys_[2], Pubkey::systemProgram());

   EXPECT_EQ(msg.header_.numRequiredSignatures_, 2);
   EXPECT_EQ(msg.header_.numReadonlySignedAccounts_, 0);
   EXPECT_EQ(msg.header_.numReadonlyUnsignedAccounts_, 1);

   EXPECT_TRUE(msg.isSigner(0));
   EXPECT_TRUE(msg.isSigner(1));
   EXPECT_FALSE(msg.isSigner(2));
   EXPECT_TRUE(msg.isWritable(0));
   EXPECT_TRUE(msg.isWritable(1));
   EXPECT_FALSE(msg.isWritable(2));

   auto& compiled = msg.instructions_[0];
   EXPECT_EQ(compiled.programIdIndex_, 2);
   ASSERT_EQ(compiled.accounts_.size(), 2ULL);
   EXPECT_EQ(compiled.accounts_[0], 0);
   EXPECT_EQ(compiled.accounts_[1], 1);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, ReadonlyCounts)
{
   //authority signs without being writable, a third party pays
   auto write = LoaderInstruction::write(
      program_, authority_, 0, READHEX("00"));
   auto transfer = SystemInstruction::transfer(payer_, program_, 10);
   auto msg = ArchMessage::compile({ write, transfer },
      { payer_, authority_ }, payer_, blockhash_);

   ASSERT_EQ(msg.accountKeys_.size(), 5ULL);
   EXPECT_EQ(msg.accountKeys_[0], payer_);
   EXPECT_EQ(msg.accountKeys_[1], authority_);
   EXPECT_EQ(msg.accountKeys_[2], program_);
   EXPECT_EQ(msg.accountKeys_[3], Pubkey::loaderProgram());
   EXPECT_EQ(msg.accountKeys_[4], Pubkey::systemProgram());

   EXPECT_EQ(msg.header_.numRequiredSignatures_, 2);
   EXPECT_EQ(msg.header_.numReadonlySignedAccounts_, 1);
   EXPECT_EQ(msg.header_.numReadonlyUnsignedAccounts_, 2);

   EXPECT_TRUE(msg.isWritable(0));
   EXPECT_FALSE(msg.isWritable(1));
   EXPECT_TRUE(msg.isWritable(2));
   EXPECT_FALSE(msg.isWritable(3));
   EXPECT_FALSE(msg.isWritable(4));
   EXPECT_FALSE(msg.isWritable(5));

   //same program twice counts once
   auto deploy = LoaderInstruction::deploy(program_, authority_);
   auto msg2 = ArchMessage::compile({ write, deploy },
      { authority_ }, authority_, blockhash_);
   EXPECT_EQ(msg2.accountKeys_.size(), 3ULL);
   EXPECT_EQ(msg2.header_.numReadonlyUnsignedAccounts_, 1);
   ASSERT_EQ(msg2.instructions_.size(), 2ULL);
   EXPECT_EQ(msg2.instructions_[1].programIdIndex_, 2);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, CompileErrors)
{
   auto instr = LoaderInstruction::deploy(program_, authority_);

   EXPECT_THROW(ArchMessage::compile(
      { instr }, { authority_ }, authority_, READHEX("0011")),
      CompilationError);

   //program id in the fee payer slot
   Instruction selfCall;
   selfCall.programId_ = authority_;
   selfCall.data_ = READHEX("00");
   EXPECT_THROW(ArchMessage::compile(
      { selfCall }, { authority_ }, authority_, blockhash_),
      CompilationError);

   //too many keys
   vector<Instruction> instructions;
   for (unsigned i = 0; i < 300; i++)
   {
      auto keyBytes = BtcUtils::getSha256(
         BinaryData::fromString(to_string(i)));
      instructions.push_back(SystemInstruction::transfer(
         authority_, Pubkey(keyBytes.getRef()), 1));
   }
   EXPECT_THROW(ArchMessage::compile(
      instructions, { authority_ }, authority_, blockhash_),
      CompilationError);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, WireLayout)
{
   auto instr = LoaderInstruction::write(
      program_, authority_, 0, READHEX("aabbcc"));
   auto msg = ArchMessage::compile(
      { instr }, { authority_ }, authority_, blockhash_);

   BinaryWriter expected;
   expected.put_BinaryData(READHEX("010001"));
   expected.put_uint32_t(3);
   expected.put_BinaryData(authority_.getBytes());
   expected.put_BinaryData(program_.getBytes());
   expected.put_BinaryData(Pubkey::loaderProgram().getBytes());
   expected.put_BinaryData(blockhash_);
   expected.put_uint32_t(1);
   expected.put_uint8_t(2);
   expected.put_uint32_t(2);
   expected.put_BinaryData(READHEX("0100"));
   expected.put_uint32_t(19);
   expected.put_BinaryData(READHEX(
      "00000000" "00000000" "0300000000000000" "aabbcc"));

   auto serialized = msg.serialize();
   EXPECT_EQ(serialized, expected.getData());

   auto decoded = CompiledMessage::deserialize(serialized);
   EXPECT_EQ(decoded.serialize(), serialized);
   EXPECT_EQ(decoded.accountKeys_[1], program_);
   EXPECT_EQ(decoded.recentBlockhash_, blockhash_);

   //trailing and missing bytes
   BinaryWriter trailing;
   trailing.put_BinaryData(serialized);
   trailing.put_uint8_t(0);
   EXPECT_THROW(CompiledMessage::deserialize(trailing.getData()),
      runtime_error);
   EXPECT_THROW(CompiledMessage::deserialize(
      serialized.getSliceRef(0, serialized.getSize() - 1)), runtime_error);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, Hash)
{
   auto instr = LoaderInstruction::deploy(program_, authority_);
   auto msg = ArchMessage::compile(
      { instr }, { authority_ }, authority_, blockhash_);

   auto firstHex = BtcUtils::getSha256Hex(msg.serialize());
   auto expected = BtcUtils::getSha256Hex(BinaryData::fromString(firstHex));

   EXPECT_EQ(msg.hashHex(), expected);
   EXPECT_EQ(msg.hashHex().size(), 64ULL);
   EXPECT_EQ(msg.hash(), BinaryData::fromString(expected));

   //blockhash is part of the hashed payload
   auto other = ArchMessage::compile({ instr }, { authority_ }, authority_,
      BtcUtils::getSha256(BinaryData::fromString("other")));
   EXPECT_NE(other.hashHex(), msg.hashHex());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(MessageTest, Hash_KnownAnswer)
{
   Pubkey payer(READHEX(
      "0101010101010101010101010101010101010101010101010101010101010101"));
   Pubkey account(READHEX(
      "0202020202020202020202020202020202020202020202020202020202020202"));
   Pubkey program(READHEX(
      "0303030303030303030303030303030303030303030303030303030303030303"));
   auto blockhash = READHEX(
      "4444444444444444444444444444444444444444444444444444444444444444");

   Instruction instr;
   instr.programId_ = program;
   instr.accounts_.push_back(AccountMeta(payer, true, true));
   instr.accounts_.push_back(AccountMeta(account, false, true));
   instr.data_ = READHEX("deadbeef");

   auto msg = ArchMessage::compile({ instr }, { payer }, payer, blockhash);
   auto serialized = msg.serialize();
   ASSERT_EQ(serialized.getSize(), 154ULL);
   EXPECT_EQ(serialized.toHexStr(),
      "010001"
      "03000000"
      "0101010101010101010101010101010101010101010101010101010101010101"
      "0202020202020202020202020202020202020202020202020202020202020202"
      "0303030303030303030303030303030303030303030303030303030303030303"
      "4444444444444444444444444444444444444444444444444444444444444444"
      "01000000"
      "02" "02000000" "0001" "04000000" "deadbeef");

   //sha256 of the above is
   //a8a4e36543fe1d6bf3eb883a5f47254a618eea9d6b8d81055c8e6060dee041cf
   EXPECT_EQ(msg.hashHex(),
      "70bb9e76c359210ffa43c17e14b50765fbddff9eeaa6dd16d1da225736f1fbd1");
   EXPECT_EQ(msg.hash(), BinaryData::fromString(
      "70bb9e76c359210ffa43c17e14b50765fbddff9eeaa6dd16d1da225736f1fbd1"));

   //compiling again yields the same bytes
   auto again = ArchMessage::compile({ instr }, { payer }, payer, blockhash);
   EXPECT_EQ(again.serialize(), serialized);
   EXPECT_EQ(again.hashHex(), msg.hashHex());

   //one flipped data byte changes the payload
   auto flipped = serialized;
   flipped[flipped.getSize() - 1] ^= 0x01;
   auto flippedMsg = CompiledMessage::deserialize(flipped);
   EXPECT_EQ(flippedMsg.hashHex(),
      "cba524f99f2174c9f5d41f9fb753eca3b12af3981d2354e4b7ba4cb9b9890cd7");
   EXPECT_NE(flippedMsg.hash(), msg.hash());
}

////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////
class RuntimeTransactionTest : public MessageTest
{};

////////////////////////////////////////////////////////////////////////////////
TEST_F(RuntimeTransactionTest, JSONModel)
{
   RuntimeTransaction tx;
   tx.message_ = ArchMessage::compile(
      { LoaderInstruction::write(program_, authority_, 7, READHEX("ff01")) },
      { authority_ }, authority_, blockhash_);
   tx.signatures_.push_back(BinaryData(SIGNATURE_LENGTH));

   auto json = tx.toJSON();
   auto serialized = JSON_serialize(*json);
   EXPECT_NE(serialized.find("\"version\":0"), string::npos);
   EXPECT_NE(serialized.find("\"num_required_signatures\":1"), string::npos);
   EXPECT_NE(serialized.find("\"program_id_index\":2"), string::npos);
   EXPECT_NE(serialized.find("\"accounts\":[1,0]"), string::npos);

   //back through the text form
   auto decoded = RuntimeTransaction::fromJSON(JSON_parse(serialized));
   EXPECT_EQ(decoded.serialize(), tx.serialize());
   EXPECT_EQ(decoded.getTxid(), tx.message_.hashHex());

   //wire form: version, signature count, signatures, message
   auto raw = tx.serialize();
   EXPECT_EQ(raw.getSliceRef(0, 8).toHexStr(), "0000000001000000");
   EXPECT_EQ(raw.getSize(),
      8 + SIGNATURE_LENGTH + tx.message_.serialize().getSize());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(RuntimeTransactionTest, JSONErrors)
{
   EXPECT_THROW(RuntimeTransaction::fromJSON(JSON_parse("[]")),
      JSON_Exception);
   EXPECT_THROW(RuntimeTransaction::fromJSON(JSON_parse(
      "{\"version\":0,\"signatures\":[]}")), JSON_Exception);

   EXPECT_THROW(JSON_bytes::fromJSON(JSON_parse("[1,256]")), JSON_Exception);
   EXPECT_THROW(JSON_bytes::fromJSON(JSON_parse("[1,\"a\"]")),
      JSON_Exception);
   EXPECT_EQ(JSON_bytes::fromJSON(JSON_parse("[0,127,255]")),
      READHEX("007fff"));
   EXPECT_EQ(JSON_serialize(*JSON_bytes::toJSON(READHEX("007fff"))),
      "[0,127,255]");
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(RuntimeTransactionTest, AccountModel)
{
   auto json = JSON_parse("{\"lamports\":18446744073709551615,"
      "\"owner\":" + JSON_serialize(*JSON_bytes::toJSON(
         Pubkey::loaderProgram().getRef())) + ","
      "\"data\":[1,2,3],\"is_executable\":true,\"utxo\":\"abcd:0\"}");

   auto info = AccountInfo::fromJSON(json);
   EXPECT_EQ(info.lamports_, UINT64_MAX);
   EXPECT_EQ(info.owner_, Pubkey::loaderProgram());
   EXPECT_EQ(info.data_, READHEX("010203"));
   EXPECT_TRUE(info.isExecutable_);
   EXPECT_EQ(info.utxo_, "abcd:0");

   auto again = AccountInfo::fromJSON(info.toJSON());
   EXPECT_EQ(again.lamports_, UINT64_MAX);
   EXPECT_EQ(again.data_, info.data_);

   EXPECT_THROW(AccountInfo::fromJSON(JSON_parse(
      "{\"lamports\":1,\"owner\":[1],\"data\":[],\"is_executable\":false}")),
      JSON_Exception);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(RuntimeTransactionTest, ProcessedStatus)
{
   auto processed = ProcessedTransaction::fromJSON(JSON_parse(
      "{\"status\":\"Processed\",\"runtime_transaction\":null}"));
   EXPECT_EQ(processed.status_, TxStatus::Processed);
   EXPECT_EQ(processed.runtimeTx_, nullptr);

   auto queued = ProcessedTransaction::fromJSON(JSON_parse(
      "{\"status\":\"Queued\"}"));
   EXPECT_EQ(queued.status_, TxStatus::Queued);

   auto failed = ProcessedTransaction::fromJSON(JSON_parse(
      "{\"status\":{\"Failed\":\"account not found\"}}"));
   EXPECT_EQ(failed.status_, TxStatus::Failed);
   EXPECT_EQ(failed.failureMessage_, "account not found");

   EXPECT_THROW(ProcessedTransaction::fromJSON(JSON_parse(
      "{\"status\":\"Exploded\"}")), JSON_Exception);
   EXPECT_THROW(ProcessedTransaction::fromJSON(JSON_parse(
      "{\"status\":{\"Other\":1}}")), JSON_Exception);

   //with the runtime tx attached
   ProcessedTransaction ptx;
   ptx.status_ = TxStatus::Failed;
   ptx.failureMessage_ = "custom program error: 0x1";
   ptx.runtimeTx_ = make_shared<RuntimeTransaction>();
   ptx.runtimeTx_->message_ = ArchMessage::compile(
      { LoaderInstruction::deploy(program_, authority_) },
      { authority_ }, authority_, blockhash_);

   auto decoded = ProcessedTransaction::fromJSON(ptx.toJSON());
   EXPECT_EQ(decoded.status_, TxStatus::Failed);
   EXPECT_EQ(decoded.failureMessage_, ptx.failureMessage_);
   ASSERT_NE(decoded.runtimeTx_, nullptr);
   EXPECT_EQ(decoded.runtimeTx_->getTxid(), ptx.runtimeTx_->getTxid());
}

////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////
GTEST_API_ int main(int argc, char **argv)
{
   std::cout << "Running main() from gtest_main.cc\n";
   CryptoSchnorr::setupContext();

   testing::InitGoogleTest(&argc, argv);
   int exitCode = RUN_ALL_TESTS();

   CryptoSchnorr::shutdown();
   FLUSHLOG();
   CLEANUPLOG();

   return exitCode;
}
