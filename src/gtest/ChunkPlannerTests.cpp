////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "TestUtils.h"
#include "../ChunkPlanner.h"

using namespace std;
using namespace ArchDeploy::Signer;

////////////////////////////////////////////////////////////////////////////////
class ChunkPlannerTest : public ::testing::Test
{
protected:
   Keypair authority_;
   Keypair program_;

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
      authority_ = TestUtils::getKeypair("authority");
      program_ = TestUtils::getKeypair("program");
   }

   RuntimeTransaction getWriteTx(BinaryDataRef chunk)
   {
      auto instr = LoaderInstruction::write(
         program_.pubkey_, authority_.pubkey_, 0, chunk);
      return TransactionSigner::buildAndSign({ instr }, { authority_ },
         authority_.pubkey_,
         BtcUtils::getSha256(BinaryData::fromString("block")));
   }

   void checkPlan(const ChunkPlanner& planner, size_t len)
   {
      auto chunks = planner.plan(len);

      size_t expectedOffset = 0;
      for (auto& chunk : chunks)
      {
         EXPECT_EQ(chunk.offset_, expectedOffset);
         EXPECT_GT(chunk.length_, 0U);
         EXPECT_LE(chunk.length_, planner.maxChunkSize());
         expectedOffset += chunk.length_;
      }

      EXPECT_EQ(expectedOffset, len);
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(ChunkPlannerTest, Overhead)
{
   EXPECT_EQ(ChunkPlanner::fixedWriteTransactionOverhead(), 238ULL);

   //matches the wire size of a real empty write
   auto tx = getWriteTx(BinaryDataRef());
   EXPECT_EQ(tx.serialize().getSize(),
      ChunkPlanner::fixedWriteTransactionOverhead());

   //and grows 1:1 with the chunk
   auto chunk = TestUtils::getProgramBinary(1042, 3);
   auto txFull = getWriteTx(chunk);
   EXPECT_EQ(txFull.serialize().getSize(),
      ChunkPlanner::fixedWriteTransactionOverhead() + 1042);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ChunkPlannerTest, MaxChunkSize)
{
   //10240 / 8 - 238
   ChunkPlanner defaults;
   EXPECT_EQ(defaults.maxChunkSize(), 1042ULL);
   EXPECT_LE(defaults.estimateWriteTransactionSize(defaults.maxChunkSize()),
      (size_t)DEFAULT_TX_CEILING);

   //inclusive bound, a full chunk lands exactly on the ceiling
   EXPECT_EQ(defaults.estimateWriteTransactionSize(defaults.maxChunkSize()),
      (size_t)DEFAULT_TX_CEILING);
   EXPECT_GT(
      defaults.estimateWriteTransactionSize(defaults.maxChunkSize() + 1),
      (size_t)DEFAULT_TX_CEILING);

   //floor kicks in
   ChunkPlanner tight(10240, 16, 1000);
   EXPECT_EQ(tight.maxChunkSize(), 1000ULL);

   //budget smaller than the overhead
   ChunkPlanner tiny(1000, 8, 64);
   EXPECT_EQ(tiny.maxChunkSize(), 64ULL);

   ChunkPlanner loose(100000, 1, 10);
   EXPECT_EQ(loose.maxChunkSize(), 100000ULL - 238);
   EXPECT_EQ(loose.estimateWriteTransactionSize(100), 338ULL);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ChunkPlannerTest, Plan)
{
   ChunkPlanner planner;
   EXPECT_TRUE(planner.plan(0).empty());

   auto single = planner.plan(1);
   ASSERT_EQ(single.size(), 1ULL);
   EXPECT_EQ(single[0].offset_, 0U);
   EXPECT_EQ(single[0].length_, 1U);

   auto exact = planner.plan(1042 * 3);
   ASSERT_EQ(exact.size(), 3ULL);
   for (auto& chunk : exact)
      EXPECT_EQ(chunk.length_, 1042U);

   auto chunks = planner.plan(50000);
   ASSERT_EQ(chunks.size(), 48ULL);
   EXPECT_EQ(chunks.back().offset_, 47U * 1042);
   EXPECT_EQ(chunks.back().length_, 50000U - 47 * 1042);

   checkPlan(planner, 50000);
   checkPlan(planner, 80000);
   checkPlan(ChunkPlanner(10240, 16, 1000), 12345);
   checkPlan(ChunkPlanner(4096, 2, 1), 999);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ChunkPlannerTest, InvalidParams)
{
   EXPECT_THROW(ChunkPlanner(10240, 0, 1000), runtime_error);
   EXPECT_THROW(ChunkPlanner(10240, 8, 0), runtime_error);
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
