////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_PROGRAM_DEPLOYER_
#define _H_PROGRAM_DEPLOYER_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "archRPC.h"
#include "ChunkPlanner.h"
#include "PaymentProviders.h"

namespace ArchDeploy
{
   ////
   enum class ProgressLevel
   {
      Info,
      Success,
      Error
   };

   typedef std::function<void(ProgressLevel, const std::string&)>
      ProgressCallback;

   //sleeps for that many milliseconds
   typedef std::function<void(unsigned)> SleepLambda;

   /////////////////////////////////////////////////////////////////////////////
   struct DeployerParams
   {
      size_t txCeiling_ = DEFAULT_TX_CEILING;
      size_t inflation_ = DEFAULT_TX_INFLATION;
      size_t minChunk_ = DEFAULT_MIN_CHUNK;

      unsigned batchSize_ = 100;
      unsigned blockhashRefresh_ = 5;
      unsigned pollIntervalMs_ = 1000;
      unsigned pollTimeoutMs_ = 30000;

      //0: confirmation timeouts are never fatal
      unsigned maxConsecutiveTimeouts_ = 0;

      bool useFaucet_ = true;
      uint64_t fundingSats_ = 5000;
      std::string explorerUrl_;

      static DeployerParams fromSettings(void);
   };

   /////////////////////////////////////////////////////////////////////////////
   struct DeploymentResult
   {
      std::string programId_;

      //in submission order
      std::vector<std::string> txids_;

      //tx count per instruction kind
      std::map<std::string, unsigned> counters_;

      bool alreadyDeployed_ = false;
      unsigned confirmationTimeouts_ = 0;

      //empty if the network has no explorer
      std::string explorerUrl_;

      unsigned getCount(const std::string& kind) const;
   };

   /////////////////////////////////////////////////////////////////////////////
   class ProgramDeployer
   {
   private:
      std::shared_ptr<ArchRPC::ArchRPCInterface> rpc_;
      const Keypair programKey_;
      const Keypair authorityKey_;
      const DeployerParams params_;
      const ChunkPlanner planner_;

      ProgressCallback progressLbd_;
      SleepLambda sleepLbd_;
      std::vector<PaymentProvider> paymentProviders_;

      DeploymentResult result_;
      unsigned consecutiveTimeouts_ = 0;

   private:
      void notify(ProgressLevel, const std::string&);
      void sleep(unsigned ms);

      std::shared_ptr<AccountInfo> readProgramAccount(void);

      //funding
      void fundFeePayer(void);
      void fundWithFaucet(std::shared_ptr<AccountInfo>);
      void fundWithPayment(void);

      //tx submission
      RuntimeTransaction signTx(const std::vector<Instruction>&,
         const std::vector<Keypair>& signers, const BinaryData& blockhash);
      std::string submit(const std::string& kind,
         const std::vector<Instruction>&, const std::vector<Keypair>& signers);
      void awaitConfirmation(const std::vector<std::string>& txids);
      bool awaitConfirmation(const std::string& txid);

      //steps
      std::shared_ptr<AccountInfo> createProgramAccount(size_t binaryLen);
      void assignToLoader(void);
      void retract(void);
      void resize(const AccountInfo&, size_t binaryLen);
      void upload(const BinaryData& binary);
      void makeExecutable(void);
      void verify(const BinaryData& binary);

   public:
      ProgramDeployer(std::shared_ptr<ArchRPC::ArchRPCInterface>,
         const Keypair& programKey, const Keypair& authorityKey,
         const DeployerParams& params = DeployerParams());

      void setProgressCallback(const ProgressCallback& lbd)
      { progressLbd_ = lbd; }

      void setSleeper(const SleepLambda& lbd) { sleepLbd_ = lbd; }

      void setPaymentProviders(const std::vector<PaymentProvider>& providers)
      { paymentProviders_ = providers; }

      /***
      Runs the deployment state machine for this binary. Every phase re-reads
      the chain, so rerunning after a failure resumes where it stopped.

      Throws ConfigurationError, CompilationError, SigningError,
      ArchRPC::RpcError or VerificationError. No partial result is returned
      on failure.
      ***/
      DeploymentResult deploy(const BinaryData& binary);

      //account data past the loader header, empty if too short
      static BinaryDataRef getProgramBytes(const AccountInfo&);
   };
}; //namespace ArchDeploy

#endif
