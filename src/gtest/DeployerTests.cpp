////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "TestUtils.h"
#include "../ProgramDeployer.h"
#include "../PaymentProviders.h"

using namespace std;
using namespace ArchDeploy;
using namespace ArchRPC;

////////////////////////////////////////////////////////////////////////////////
class ProgramDeployerTest : public ::testing::Test
{
protected:
   shared_ptr<LocalLedger> ledger_;
   Keypair programKey_;
   Keypair authorityKey_;
   DeployerParams params_;

   vector<pair<ProgressLevel, string>> progress_;
   unsigned sleepCount_ = 0;

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();

      ledger_ = make_shared<LocalLedger>();
      programKey_ = TestUtils::getKeypair("program");
      authorityKey_ = TestUtils::getKeypair("authority");

      params_ = DeployerParams();
      params_.pollIntervalMs_ = 1;
      params_.pollTimeoutMs_ = 3;

      progress_.clear();
      sleepCount_ = 0;
   }

   unique_ptr<ProgramDeployer> getDeployer(void)
   {
      unique_ptr<ProgramDeployer> deployer(new ProgramDeployer(
         ledger_, programKey_, authorityKey_, params_));

      deployer->setSleeper([this](unsigned)->void
      {
         ++sleepCount_;
      });

      deployer->setProgressCallback(
         [this](ProgressLevel level, const string& msg)->void
      {
         progress_.push_back(make_pair(level, msg));
      });

      return deployer;
   }

   size_t getChunkCount(size_t len) const
   {
      ChunkPlanner planner(
         params_.txCeiling_, params_.inflation_, params_.minChunk_);
      return planner.plan(len).size();
   }

   //loader owned program account holding this binary
   void setProgramAccount(BinaryDataRef program, bool executable)
   {
      AccountInfo info;
      info.owner_ = Pubkey::loaderProgram();
      info.data_ = TestUtils::getLoaderAccountData(
         authorityKey_.pubkey_, program, executable);
      info.lamports_ = SystemInstruction::minimumRent(info.data_.getSize());
      info.isExecutable_ = executable;
      ledger_->setAccount(programKey_.pubkey_, info);
   }

   void checkDeployed(BinaryDataRef binary)
   {
      ASSERT_TRUE(ledger_->hasAccount(programKey_.pubkey_));
      auto& info = ledger_->getAccount(programKey_.pubkey_);

      EXPECT_TRUE(info.isExecutable_);
      EXPECT_EQ(info.owner_, Pubkey::loaderProgram());
      EXPECT_EQ(ProgramDeployer::getProgramBytes(info), binary);
      EXPECT_EQ(info.data_.getSliceRef(0, PUBKEY_LENGTH),
         authorityKey_.pubkey_.getRef());

      BinaryRefReader brr(info.data_.getSliceRef(PUBKEY_LENGTH, 8));
      EXPECT_EQ(brr.get_uint64_t(), 1ULL);
   }

   bool hasProgress(ProgressLevel level) const
   {
      for (auto& entry : progress_)
      {
         if (entry.first == level)
            return true;
      }

      return false;
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FreshDeploy)
{
   auto binary = TestUtils::getProgramBinary(50000, 1);
   auto deployer = getDeployer();
   auto result = deployer->deploy(binary);

   EXPECT_EQ(result.programId_, programKey_.pubkey_.toHexStr());
   EXPECT_FALSE(result.alreadyDeployed_);
   EXPECT_EQ(result.confirmationTimeouts_, 0U);

   auto chunkCount = getChunkCount(binary.getSize());
   EXPECT_EQ(chunkCount, 48ULL);

   EXPECT_EQ(result.getCount("faucet"), 1U);
   EXPECT_EQ(result.getCount("create_account"), 1U);
   EXPECT_EQ(result.getCount("assign"), 0U);
   EXPECT_EQ(result.getCount("retract"), 0U);
   EXPECT_EQ(result.getCount("transfer"), 0U);
   EXPECT_EQ(result.getCount("truncate"), 1U);
   EXPECT_EQ(result.getCount("write"), chunkCount);
   EXPECT_EQ(result.getCount("deploy"), 1U);
   EXPECT_EQ(result.txids_.size(), chunkCount + 4);

   //faucet create then program create
   EXPECT_EQ(ledger_->countApplied("create_account"), 2U);
   EXPECT_EQ(ledger_->countApplied("write"), chunkCount);
   EXPECT_EQ(ledger_->getCallCount("create_account_with_faucet"), 1U);
   EXPECT_EQ(ledger_->getCallCount("request_airdrop"), 0U);

   //every tx is paid by the authority, the faucet tx aside
   auto& submitted = ledger_->getSubmitted();
   ASSERT_EQ(submitted.size(), result.txids_.size());
   for (size_t i = 1; i < submitted.size(); i++)
   {
      EXPECT_EQ(submitted[i].message_.accountKeys_[0], authorityKey_.pubkey_);
      EXPECT_EQ(submitted[i].getTxid(), result.txids_[i]);
   }

   //rent for header + binary
   EXPECT_EQ(ledger_->getAccount(programKey_.pubkey_).lamports_,
      SystemInstruction::minimumRent(LOADER_HEADER_SIZE + 50000));

   checkDeployed(binary);
   EXPECT_TRUE(hasProgress(ProgressLevel::Success));
   EXPECT_FALSE(hasProgress(ProgressLevel::Error));
   EXPECT_TRUE(result.explorerUrl_.empty());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_Identical)
{
   auto binary = TestUtils::getProgramBinary(5000, 2);
   getDeployer()->deploy(binary);
   auto submittedCount = ledger_->getSubmitted().size();

   auto result = getDeployer()->deploy(binary);
   EXPECT_TRUE(result.alreadyDeployed_);
   EXPECT_TRUE(result.txids_.empty());
   EXPECT_EQ(ledger_->getSubmitted().size(), submittedCount);

   //fee payer exists, topped up instead
   EXPECT_EQ(ledger_->getCallCount("request_airdrop"), 1U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_NotExecutable)
{
   auto binary = TestUtils::getProgramBinary(3000, 3);
   setProgramAccount(binary, false);

   auto result = getDeployer()->deploy(binary);
   EXPECT_FALSE(result.alreadyDeployed_);
   EXPECT_EQ(result.getCount("create_account"), 0U);
   EXPECT_EQ(result.getCount("truncate"), 0U);
   EXPECT_EQ(result.getCount("write"), 0U);
   EXPECT_EQ(result.getCount("deploy"), 1U);

   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_Shrink)
{
   auto oldBinary = TestUtils::getProgramBinary(80000, 4);
   setProgramAccount(oldBinary, true);
   auto lamportsBefore = ledger_->getAccount(programKey_.pubkey_).lamports_;

   auto binary = TestUtils::getProgramBinary(50000, 5);
   auto result = getDeployer()->deploy(binary);

   EXPECT_EQ(result.getCount("create_account"), 0U);
   EXPECT_EQ(result.getCount("retract"), 1U);
   EXPECT_EQ(result.getCount("transfer"), 0U);
   EXPECT_EQ(result.getCount("truncate"), 1U);
   EXPECT_EQ(result.getCount("write"), getChunkCount(50000));
   EXPECT_EQ(result.getCount("deploy"), 1U);

   auto& info = ledger_->getAccount(programKey_.pubkey_);
   EXPECT_EQ(info.data_.getSize(), LOADER_HEADER_SIZE + 50000ULL);
   EXPECT_EQ(info.lamports_, lamportsBefore);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_Grow)
{
   auto oldBinary = TestUtils::getProgramBinary(20000, 6);
   setProgramAccount(oldBinary, false);

   auto binary = TestUtils::getProgramBinary(30000, 7);
   auto result = getDeployer()->deploy(binary);

   EXPECT_EQ(result.getCount("retract"), 0U);
   EXPECT_EQ(result.getCount("transfer"), 1U);
   EXPECT_EQ(result.getCount("truncate"), 1U);
   EXPECT_EQ(result.getCount("deploy"), 1U);

   //only the shortfall is transferred
   EXPECT_EQ(ledger_->getAccount(programKey_.pubkey_).lamports_,
      SystemInstruction::minimumRent(LOADER_HEADER_SIZE + 30000));
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_SameSizeChangedBytes)
{
   auto oldBinary = TestUtils::getProgramBinary(4000, 8);
   setProgramAccount(oldBinary, true);

   auto binary = TestUtils::getProgramBinary(4000, 9);
   auto result = getDeployer()->deploy(binary);

   EXPECT_EQ(result.getCount("retract"), 1U);
   EXPECT_EQ(result.getCount("truncate"), 0U);
   EXPECT_EQ(result.getCount("write"), getChunkCount(4000));
   EXPECT_EQ(result.getCount("deploy"), 1U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Redeploy_SystemOwned)
{
   //left behind by an interrupted run
   AccountInfo info;
   info.owner_ = Pubkey::systemProgram();
   ledger_->setAccount(programKey_.pubkey_, info);

   auto binary = TestUtils::getProgramBinary(2000, 10);
   auto result = getDeployer()->deploy(binary);

   EXPECT_EQ(result.getCount("create_account"), 0U);
   EXPECT_EQ(result.getCount("assign"), 1U);
   EXPECT_EQ(result.getCount("transfer"), 1U);
   EXPECT_EQ(result.getCount("truncate"), 1U);
   EXPECT_EQ(result.getCount("deploy"), 1U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FeePayer_Misowned)
{
   AccountInfo info;
   info.owner_ = Pubkey::loaderProgram();
   info.lamports_ = 1000;
   ledger_->setAccount(authorityKey_.pubkey_, info);

   try
   {
      getDeployer()->deploy(TestUtils::getProgramBinary(100, 11));
      FAIL() << "expected a configuration error";
   }
   catch (ConfigurationError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::Config_FeePayer);
   }

   EXPECT_TRUE(ledger_->getSubmitted().empty());
   EXPECT_TRUE(hasProgress(ProgressLevel::Error));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FeePayer_Airdrop)
{
   ledger_->fundAccount(authorityKey_.pubkey_, 5000000);
   auto binary = TestUtils::getProgramBinary(1500, 12);

   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.getCount("faucet"), 0U);
   EXPECT_EQ(ledger_->getCallCount("request_airdrop"), 1U);
   EXPECT_EQ(ledger_->getCallCount("create_account_with_faucet"), 0U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FeePayer_AirdropFailure)
{
   ledger_->fundAccount(authorityKey_.pubkey_, 5000000);
   ledger_->failAirdrop_ = true;
   auto binary = TestUtils::getProgramBinary(1500, 13);

   //existing funds are enough
   auto result = getDeployer()->deploy(binary);
   EXPECT_FALSE(result.alreadyDeployed_);
   EXPECT_EQ(ledger_->getCallCount("request_airdrop"), 1U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FeePayer_Payment)
{
   params_.useFaucet_ = false;
   params_.fundingSats_ = 7000;

   string paidAddress;
   uint64_t paidSats = 0;
   auto ledgerPtr = ledger_;
   auto authority = authorityKey_.pubkey_;

   PaymentProvider unavailable;
   unavailable.name_ = "unavailable";
   unavailable.isAvailable_ = [](void)->bool { return false; };

   PaymentProvider provider;
   provider.name_ = "test";
   provider.isAvailable_ = [](void)->bool { return true; };
   provider.sendPayment_ = [&paidAddress, &paidSats, ledgerPtr, authority](
      const string& address, uint64_t sats)->string
   {
      paidAddress = address;
      paidSats = sats;
      ledgerPtr->fundAccount(authority, FAUCET_LAMPORTS);
      return "btctxid";
   };

   auto deployer = getDeployer();
   deployer->setPaymentProviders({ unavailable, provider });

   auto binary = TestUtils::getProgramBinary(2500, 14);
   auto result = deployer->deploy(binary);

   EXPECT_EQ(paidAddress, authorityKey_.pubkey_.toTaprootAddress(LEDGER_HRP));
   EXPECT_EQ(paidSats, 7000ULL);
   EXPECT_EQ(result.getCount("faucet"), 0U);
   EXPECT_EQ(ledger_->getCallCount("create_account_with_faucet"), 0U);
   EXPECT_EQ(ledger_->getCallCount("request_airdrop"), 0U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FeePayer_PaymentFailures)
{
   params_.useFaucet_ = false;
   auto binary = TestUtils::getProgramBinary(2500, 15);

   //no provider
   try
   {
      getDeployer()->deploy(binary);
      FAIL() << "expected a configuration error";
   }
   catch (ConfigurationError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::Config_FeePayer);
   }

   //provider throws
   PaymentProvider broken;
   broken.name_ = "broken";
   broken.isAvailable_ = [](void)->bool { return true; };
   broken.sendPayment_ = [](const string&, uint64_t)->string
   {
      throw runtime_error("wallet is locked");
   };

   auto deployer = getDeployer();
   deployer->setPaymentProviders({ broken });
   EXPECT_THROW(deployer->deploy(binary), ConfigurationError);

   //provider pays but the account never shows up
   PaymentProvider lost;
   lost.name_ = "lost";
   lost.isAvailable_ = [](void)->bool { return true; };
   lost.sendPayment_ = [](const string&, uint64_t)->string
   {
      return string();
   };

   deployer = getDeployer();
   deployer->setPaymentProviders({ lost });
   EXPECT_THROW(deployer->deploy(binary), ConfigurationError);
   EXPECT_GT(sleepCount_, 0U);

   EXPECT_TRUE(ledger_->getSubmitted().empty());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, FailedWrite)
{
   ledger_->failWrites_ = true;

   try
   {
      getDeployer()->deploy(TestUtils::getProgramBinary(3000, 16));
      FAIL() << "expected an rpc error";
   }
   catch (RpcError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::RPCFailure_TxFailed);
      EXPECT_NE(string(e.what()).find("write rejected"), string::npos);
   }

   //rerun resumes from the existing account
   ledger_->failWrites_ = false;
   auto binary = TestUtils::getProgramBinary(3000, 16);
   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.getCount("create_account"), 0U);
   EXPECT_EQ(result.getCount("truncate"), 0U);
   EXPECT_EQ(result.getCount("write"), getChunkCount(3000));
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, VerificationFailure)
{
   ledger_->corruptWrites_ = true;

   try
   {
      getDeployer()->deploy(TestUtils::getProgramBinary(3000, 17));
      FAIL() << "expected a verification error";
   }
   catch (VerificationError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::Deploy_VerifyMismatch);
   }

   EXPECT_TRUE(hasProgress(ProgressLevel::Error));
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, ConfirmationTimeouts)
{
   //state is applied but never reported as processed
   ledger_->neverConfirm_ = true;
   auto binary = TestUtils::getProgramBinary(2000, 18);

   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.confirmationTimeouts_, (unsigned)result.txids_.size());
   EXPECT_GT(sleepCount_, 0U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, ConfirmationTimeouts_ZeroInterval)
{
   //confirmation polling would never run out the clock
   ledger_->neverConfirm_ = true;
   params_.pollIntervalMs_ = 0;

   EXPECT_THROW(getDeployer(), ConfigurationError);
   EXPECT_TRUE(ledger_->getSubmitted().empty());
   EXPECT_EQ(sleepCount_, 0U);

   //smallest legal interval still times out and moves on
   params_.pollIntervalMs_ = 1;
   auto binary = TestUtils::getProgramBinary(1500, 23);
   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.confirmationTimeouts_, (unsigned)result.txids_.size());
   EXPECT_GT(sleepCount_, 0U);
   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, ConfirmationTimeouts_Escalate)
{
   ledger_->neverConfirm_ = true;
   params_.maxConsecutiveTimeouts_ = 3;

   try
   {
      getDeployer()->deploy(TestUtils::getProgramBinary(2000, 19));
      FAIL() << "expected an rpc error";
   }
   catch (RpcError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::RPCFailure_Timeout);
   }

   //faucet, create account, truncate
   EXPECT_EQ(ledger_->getSubmitted().size(), 3ULL);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Batching)
{
   params_.batchSize_ = 4;
   params_.blockhashRefresh_ = 2;
   params_.minChunk_ = 100;
   params_.inflation_ = 16;

   auto binary = TestUtils::getProgramBinary(4000, 20);
   auto chunkCount = getChunkCount(binary.getSize());
   ASSERT_GT(chunkCount, 4ULL);

   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.getCount("write"), chunkCount);
   EXPECT_EQ(ledger_->getCallCount("send_transactions"),
      (chunkCount + 3) / 4);

   //writes sharing a refresh window share a blockhash
   auto& submitted = ledger_->getSubmitted();
   vector<BinaryData> writeHashes;
   for (auto& tx : submitted)
   {
      auto& instr = tx.message_.instructions_[0];
      if (tx.message_.accountKeys_[instr.programIdIndex_] !=
         Pubkey::loaderProgram())
         continue;

      auto decoded = LoaderInstruction::decode(instr.data_);
      if (decoded.type_ == LoaderInstructionType::Write)
         writeHashes.push_back(tx.message_.recentBlockhash_);
   }

   ASSERT_EQ(writeHashes.size(), chunkCount);
   EXPECT_EQ(writeHashes[0], writeHashes[1]);
   EXPECT_NE(writeHashes[1], writeHashes[2]);

   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, Batching_RefreshPerBatch)
{
   //batch size not a multiple of the refresh window
   params_.batchSize_ = 3;
   params_.blockhashRefresh_ = 2;
   params_.minChunk_ = 100;
   params_.inflation_ = 16;

   auto binary = TestUtils::getProgramBinary(4000, 22);
   auto chunkCount = getChunkCount(binary.getSize());
   ASSERT_GE(chunkCount, 7ULL);

   getDeployer()->deploy(binary);

   vector<BinaryData> writeHashes;
   for (auto& tx : ledger_->getSubmitted())
   {
      auto& instr = tx.message_.instructions_[0];
      if (tx.message_.accountKeys_[instr.programIdIndex_] !=
         Pubkey::loaderProgram())
         continue;

      auto decoded = LoaderInstruction::decode(instr.data_);
      if (decoded.type_ == LoaderInstructionType::Write)
         writeHashes.push_back(tx.message_.recentBlockhash_);
   }
   ASSERT_EQ(writeHashes.size(), chunkCount);

   for (size_t i = 0; i < writeHashes.size(); i++)
   {
      auto posInBatch = i % params_.batchSize_;
      if (i == 0)
         continue;

      if (posInBatch % params_.blockhashRefresh_ == 0)
      {
         //first write of a batch or window gets a fresh hash
         EXPECT_NE(writeHashes[i], writeHashes[i - 1]) << "write #" << i;
      }
      else
      {
         EXPECT_EQ(writeHashes[i], writeHashes[i - 1]) << "write #" << i;
      }
   }

   //second batch opens on a fresh hash even though 3 % 2 != 0
   EXPECT_NE(writeHashes[3], writeHashes[2]);
   EXPECT_EQ(writeHashes[3], writeHashes[4]);
   EXPECT_NE(writeHashes[6], writeHashes[5]);

   checkDeployed(binary);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, ExplorerUrl)
{
   params_.explorerUrl_ = "https://explorer.test";
   auto binary = TestUtils::getProgramBinary(1000, 21);

   auto result = getDeployer()->deploy(binary);
   EXPECT_EQ(result.explorerUrl_,
      "https://explorer.test/programs/" + programKey_.pubkey_.toHexStr());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, InvalidInput)
{
   EXPECT_THROW(ProgramDeployer(nullptr, programKey_, authorityKey_),
      runtime_error);
   EXPECT_THROW(ProgramDeployer(ledger_, authorityKey_, authorityKey_),
      ConfigurationError);

   auto params = params_;
   params.batchSize_ = 0;
   EXPECT_THROW(ProgramDeployer(ledger_, programKey_, authorityKey_, params),
      ConfigurationError);

   params = params_;
   params.inflation_ = 0;
   EXPECT_THROW(ProgramDeployer(ledger_, programKey_, authorityKey_, params),
      runtime_error);

   params = params_;
   params.pollIntervalMs_ = 0;
   EXPECT_THROW(ProgramDeployer(ledger_, programKey_, authorityKey_, params),
      ConfigurationError);

   try
   {
      getDeployer()->deploy(BinaryData());
      FAIL() << "expected a configuration error";
   }
   catch (ConfigurationError& e)
   {
      EXPECT_EQ(e.code(), ArchErrorCodes::Config_ProgramFile);
   }
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ProgramDeployerTest, BitcoindAmounts)
{
   EXPECT_EQ(BitcoindPayment::satsToBtcStr(5000), "0.00005000");
   EXPECT_EQ(BitcoindPayment::satsToBtcStr(0), "0.00000000");
   EXPECT_EQ(BitcoindPayment::satsToBtcStr(123456789), "1.23456789");
   EXPECT_EQ(BitcoindPayment::satsToBtcStr(100000000), "1.00000000");
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
