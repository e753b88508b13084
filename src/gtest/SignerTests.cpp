////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "TestUtils.h"

using namespace std;
using namespace ArchDeploy::Signer;

////////////////////////////////////////////////////////////////////////////////
class BIP322Test : public ::testing::Test
{
protected:
   Keypair signer_;
   Keypair other_;

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
      signer_ = TestUtils::getKeypair("signer");
      other_ = TestUtils::getKeypair("other");
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, MessageHash)
{
   EXPECT_EQ(BIP322::getMessageHash(BinaryData()), READHEX(
      "c90c269c4f8fcbe6880f72a721ddfbf1914268a794cbb21cfafee13770ae19f1"));
   EXPECT_EQ(BIP322::getMessageHash(BinaryData::fromString("Hello World")),
      READHEX("f0eb03b1a75ac6d9847f55c624a99169b5dccba2a31f5b23bea77ba270de0a7a"));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, TaprootTweak)
{
   auto internalKey = READHEX(
      "cc8a4bc64d897bddc5fbc2f670f7a8ba0b386779106cf1223c6fc5d7cd6fc115");
   EXPECT_EQ(CryptoSchnorr::computeTaprootOutputKey(internalKey), READHEX(
      "a60869f0dbcf1dc659c9cecbaf8050135ea9e8cdc487053f1dc6880949dc684c"));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, ToSpendLayout)
{
   auto msgHash = BIP322::getMessageHash(BinaryData::fromString("payload"));
   auto outputKey = CryptoSchnorr::computeTaprootOutputKey(
      signer_.pubkey_.getRef());
   auto toSpend = BIP322::getToSpendTx(msgHash, outputKey);

   ASSERT_EQ(toSpend.getSize(), 128ULL);

   BinaryRefReader brr(toSpend);
   EXPECT_EQ(brr.get_uint32_t(), 0U);
   EXPECT_EQ(brr.get_var_int(), 1ULL);
   EXPECT_EQ(brr.get_BinaryData(32), BinaryData(32));
   EXPECT_EQ(brr.get_uint32_t(), 0xFFFFFFFFU);

   EXPECT_EQ(brr.get_var_int(), 34ULL);
   EXPECT_EQ(brr.get_BinaryData(2), READHEX("0020"));
   EXPECT_EQ(brr.get_BinaryData(32), msgHash);
   EXPECT_EQ(brr.get_uint32_t(), 0U);

   EXPECT_EQ(brr.get_var_int(), 1ULL);
   EXPECT_EQ(brr.get_uint64_t(), 0ULL);
   EXPECT_EQ(brr.get_var_int(), 34ULL);
   EXPECT_EQ(brr.get_BinaryData(2), READHEX("5120"));
   EXPECT_EQ(brr.get_BinaryData(32), outputKey);
   EXPECT_EQ(brr.get_uint32_t(), 0U);
   EXPECT_TRUE(brr.isEndOfStream());

   EXPECT_THROW(BIP322::getToSignSigHash(READHEX("00"), outputKey),
      SigningError);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, SignAndVerify)
{
   auto message = BinaryData::fromString("Hello World");
   auto witness = BIP322::signSimple(message, signer_.privKey_);

   //1 item, 65 bytes: signature then SIGHASH_ALL
   ASSERT_EQ(witness.getSize(), 67ULL);
   EXPECT_EQ(witness[0], 1);
   EXPECT_EQ(witness[1], 65);
   EXPECT_EQ(witness[66], SIGHASH_ALL);

   auto sig = BIP322::extractSignature(witness);
   ASSERT_EQ(sig.getSize(), (size_t)SIGNATURE_LENGTH);
   EXPECT_EQ(sig, witness.getSliceCopy(2, SIGNATURE_LENGTH));

   EXPECT_TRUE(BIP322::verifySimple(signer_.pubkey_, message, sig));
   EXPECT_FALSE(BIP322::verifySimple(other_.pubkey_, message, sig));
   EXPECT_FALSE(BIP322::verifySimple(signer_.pubkey_,
      BinaryData::fromString("Hello World!"), sig));

   auto tampered = sig;
   tampered[10] ^= 0x01;
   EXPECT_FALSE(BIP322::verifySimple(signer_.pubkey_, message, tampered));
   EXPECT_FALSE(BIP322::verifySimple(signer_.pubkey_, message,
      sig.getSliceRef(0, 63)));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, AuxRandomness)
{
   auto message = BinaryData::fromString("aux");
   SecureBinaryData aux(READHEX(
      "0000000000000000000000000000000000000000000000000000000000000001"));

   auto sig1 = BIP322::extractSignature(
      BIP322::signSimple(message, signer_.privKey_, aux));
   auto sig2 = BIP322::extractSignature(
      BIP322::signSimple(message, signer_.privKey_, aux));
   EXPECT_EQ(sig1, sig2);
   EXPECT_TRUE(BIP322::verifySimple(signer_.pubkey_, message, sig1));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(BIP322Test, MalformedWitness)
{
   EXPECT_THROW(BIP322::extractSignature(BinaryData()), SigningError);
   EXPECT_THROW(BIP322::extractSignature(READHEX("00")), SigningError);
   EXPECT_THROW(BIP322::extractSignature(READHEX("0141aabb")), SigningError);

   //63 byte item
   BinaryWriter bw;
   bw.put_var_int(1);
   bw.put_var_int(63);
   bw.put_BinaryData(BinaryData(63));
   EXPECT_THROW(BIP322::extractSignature(bw.getData()), SigningError);

   //bare 64 byte signature, no sighash byte
   BinaryWriter bwBare;
   bwBare.put_var_int(1);
   bwBare.put_var_int(64);
   bwBare.put_BinaryData(BinaryData(64));
   EXPECT_EQ(BIP322::extractSignature(bwBare.getData()).getSize(), 64ULL);
}

////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////
class TransactionSignerTest : public ::testing::Test
{
protected:
   Keypair authority_;
   Keypair program_;
   Keypair faucet_;
   BinaryData blockhash_;

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
      authority_ = TestUtils::getKeypair("authority");
      program_ = TestUtils::getKeypair("program");
      faucet_ = TestUtils::getKeypair("faucet");
      blockhash_ = BtcUtils::getSha256(BinaryData::fromString("block"));
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(TransactionSignerTest, BuildAndSign)
{
   auto instr = SystemInstruction::createAccount(authority_.pubkey_,
      program_.pubkey_, 1000, 0, Pubkey::loaderProgram());

   //keypair order does not matter, signatures follow the signer slice
   auto tx = TransactionSigner::buildAndSign({ instr },
      { program_, authority_ }, authority_.pubkey_, blockhash_);

   EXPECT_EQ(tx.version_, 0U);
   ASSERT_EQ(tx.signatures_.size(), 2ULL);

   auto payload = tx.message_.hash();
   EXPECT_TRUE(BIP322::verifySimple(
      authority_.pubkey_, payload, tx.signatures_[0]));
   EXPECT_TRUE(BIP322::verifySimple(
      program_.pubkey_, payload, tx.signatures_[1]));
   EXPECT_TRUE(TransactionSigner::verifyTransaction(tx));

   //swapped signatures
   auto swapped = tx;
   swap(swapped.signatures_[0], swapped.signatures_[1]);
   EXPECT_FALSE(TransactionSigner::verifyTransaction(swapped));

   //missing signature
   auto missing = tx;
   missing.signatures_.pop_back();
   EXPECT_FALSE(TransactionSigner::verifyTransaction(missing));

   //altered message
   auto altered = tx;
   altered.message_.recentBlockhash_ =
      BtcUtils::getSha256(BinaryData::fromString("other block"));
   EXPECT_FALSE(TransactionSigner::verifyTransaction(altered));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(TransactionSignerTest, MissingKeypair)
{
   auto instr = SystemInstruction::createAccount(authority_.pubkey_,
      program_.pubkey_, 1000, 0, Pubkey::loaderProgram());

   //program has to sign too
   EXPECT_THROW(TransactionSigner::buildAndSign({ instr },
      { authority_ }, authority_.pubkey_, blockhash_), SigningError);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(TransactionSignerTest, SignPayload)
{
   auto payload = BinaryData::fromString(
      "a3f1c2d4e5b6a7980f1e2d3c4b5a69788796a5b4c3d2e1f00f1e2d3c4b5a6978");
   auto sig = TransactionSigner::signPayload(payload, authority_);

   EXPECT_EQ(sig.getSize(), (size_t)SIGNATURE_LENGTH);
   EXPECT_TRUE(BIP322::verifySimple(authority_.pubkey_, payload, sig));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(TransactionSignerTest, CompletePartiallySigned)
{
   auto instr = SystemInstruction::createAccount(faucet_.pubkey_,
      authority_.pubkey_, 1000, 0, Pubkey::systemProgram());

   RuntimeTransaction tx;
   tx.message_ = ArchMessage::compile({ instr },
      { faucet_.pubkey_, authority_.pubkey_ }, faucet_.pubkey_, blockhash_);
   tx.signatures_.push_back(
      TransactionSigner::signPayload(tx.message_.hash(), faucet_));
   EXPECT_FALSE(TransactionSigner::verifyTransaction(tx));

   //not a signer
   auto notOurs = tx;
   EXPECT_THROW(TransactionSigner::completePartiallySigned(notOurs, program_),
      SigningError);

   //the faucet slot is missing
   auto unsignedTx = tx;
   unsignedTx.signatures_.clear();
   EXPECT_THROW(TransactionSigner::completePartiallySigned(
      unsignedTx, authority_), SigningError);

   TransactionSigner::completePartiallySigned(tx, authority_);
   ASSERT_EQ(tx.signatures_.size(), 2ULL);
   EXPECT_TRUE(TransactionSigner::verifyTransaction(tx));

   //already complete
   EXPECT_THROW(TransactionSigner::completePartiallySigned(tx, authority_),
      SigningError);
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
