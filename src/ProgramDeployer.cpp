////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

#include "ProgramDeployer.h"
#include "ArchConfig.h"
#include "Signer/TransactionSigner.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy;
using namespace ArchDeploy::Signer;
using namespace ArchRPC;

#define TX_KIND_FAUCET     "faucet"
#define TX_KIND_CREATE     "create_account"
#define TX_KIND_ASSIGN     "assign"
#define TX_KIND_RETRACT    "retract"
#define TX_KIND_TRANSFER   "transfer"
#define TX_KIND_TRUNCATE   "truncate"
#define TX_KIND_WRITE      "write"
#define TX_KIND_DEPLOY     "deploy"

////////////////////////////////////////////////////////////////////////////////
////
//// DeployerParams
////
////////////////////////////////////////////////////////////////////////////////
DeployerParams DeployerParams::fromSettings()
{
   using namespace ArchDeploy::Config;

   DeployerParams params;
   params.txCeiling_ = DeploySettings::txCeiling();
   params.inflation_ = DeploySettings::inflation();
   params.minChunk_ = DeploySettings::minChunk();
   params.batchSize_ = DeploySettings::batchSize();
   params.blockhashRefresh_ = DeploySettings::blockhashRefresh();
   params.pollIntervalMs_ = DeploySettings::pollIntervalMs();
   params.pollTimeoutMs_ = DeploySettings::pollTimeoutMs();
   params.maxConsecutiveTimeouts_ = DeploySettings::maxTimeouts();

   params.useFaucet_ = NetworkSettings::useFaucet();
   params.fundingSats_ = NetworkSettings::fundingSats();
   params.explorerUrl_ = NetworkSettings::explorerUrl();

   return params;
}

////////////////////////////////////////////////////////////////////////////////
////
//// DeploymentResult
////
////////////////////////////////////////////////////////////////////////////////
unsigned DeploymentResult::getCount(const string& kind) const
{
   auto iter = counters_.find(kind);
   if (iter == counters_.end())
      return 0;

   return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
////
//// ProgramDeployer
////
////////////////////////////////////////////////////////////////////////////////
ProgramDeployer::ProgramDeployer(shared_ptr<ArchRPCInterface> rpc,
   const Keypair& programKey, const Keypair& authorityKey,
   const DeployerParams& params) :
   rpc_(rpc), programKey_(programKey), authorityKey_(authorityKey),
   params_(params),
   planner_(params.txCeiling_, params.inflation_, params.minChunk_)
{
   if (rpc_ == nullptr)
      throw runtime_error("null rpc interface");

   if (params_.batchSize_ == 0 || params_.blockhashRefresh_ == 0)
      throw ConfigurationError("batch size and blockhash refresh cannot be 0");

   //polling loops count time in intervals
   if (params_.pollIntervalMs_ == 0)
      throw ConfigurationError("poll interval cannot be 0");

   if (programKey_.pubkey_ == authorityKey_.pubkey_)
      throw ConfigurationError("program and authority keys must differ");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::notify(ProgressLevel level, const string& msg)
{
   switch (level)
   {
   case ProgressLevel::Error:
      LOGERR << msg;
      break;

   default:
      LOGINFO << msg;
   }

   if (progressLbd_)
      progressLbd_(level, msg);
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::sleep(unsigned ms)
{
   if (sleepLbd_)
   {
      sleepLbd_(ms);
      return;
   }

   this_thread::sleep_for(chrono::milliseconds(ms));
}

////////////////////////////////////////////////////////////////////////////////
BinaryDataRef ProgramDeployer::getProgramBytes(const AccountInfo& info)
{
   if (info.data_.getSize() < LOADER_HEADER_SIZE)
      return BinaryDataRef();

   return info.data_.getSliceRef(LOADER_HEADER_SIZE,
      info.data_.getSize() - LOADER_HEADER_SIZE);
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<AccountInfo> ProgramDeployer::readProgramAccount()
{
   return rpc_->readAccountInfo(programKey_.pubkey_);
}

////////////////////////////////////////////////////////////////////////////////
////
//// funding
////
////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::fundFeePayer()
{
   auto feePayer = rpc_->readAccountInfo(authorityKey_.pubkey_);
   if (feePayer != nullptr && !feePayer->owner_.isSystemProgram())
   {
      stringstream ss;
      ss << "fee payer " << authorityKey_.pubkey_.toHexStr() <<
         " is owned by " << feePayer->owner_.toHexStr() <<
         " instead of the system program, generate a different key";
      notify(ProgressLevel::Error, ss.str());
      throw ConfigurationError(ss.str(), ArchErrorCodes::Config_FeePayer);
   }

   if (params_.useFaucet_)
   {
      fundWithFaucet(feePayer);
      return;
   }

   if (feePayer == nullptr)
      fundWithPayment();
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::fundWithFaucet(shared_ptr<AccountInfo> feePayer)
{
   if (feePayer != nullptr)
   {
      //top up, the account may already hold enough
      try
      {
         rpc_->requestAirdrop(authorityKey_.pubkey_);
         notify(ProgressLevel::Success, "airdrop requested for fee payer");
      }
      catch (RpcError& e)
      {
         LOGWARN << "airdrop failed (account may already have funds): " <<
            e.what();
         notify(ProgressLevel::Info,
            "airdrop failed, continuing with existing funds");
      }

      return;
   }

   notify(ProgressLevel::Info, "creating fee payer account with the faucet");
   auto tx = rpc_->createAccountWithFaucet(authorityKey_.pubkey_);
   TransactionSigner::completePartiallySigned(tx, authorityKey_);

   auto txid = rpc_->sendTransaction(tx);
   result_.txids_.push_back(txid);
   ++result_.counters_[TX_KIND_FAUCET];

   awaitConfirmation(txid);
   notify(ProgressLevel::Success, "fee payer account created: " + txid);
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::fundWithPayment()
{
   auto address = rpc_->getAccountAddress(authorityKey_.pubkey_);
   notify(ProgressLevel::Info, "fee payer needs funding at " + address);

   auto provider = PaymentProviders::selectProvider(paymentProviders_);
   if (provider == nullptr)
   {
      throw ConfigurationError("no payment provider available to fund " +
         address, ArchErrorCodes::Config_FeePayer);
   }

   try
   {
      if (provider->connect_)
         provider->connect_();
      auto btcTxid = provider->sendPayment_(address, params_.fundingSats_);

      stringstream ss;
      ss << "sent " << params_.fundingSats_ << " sats to " << address;
      if (!btcTxid.empty())
         ss << " (" << btcTxid << ")";
      notify(ProgressLevel::Success, ss.str());
   }
   catch (ArchError&)
   {
      throw;
   }
   catch (runtime_error& e)
   {
      throw ConfigurationError(string("fee payer payment failed: ") +
         e.what(), ArchErrorCodes::Config_FeePayer);
   }

   //wait for the account to show up
   unsigned waited = 0;
   while (true)
   {
      if (rpc_->readAccountInfo(authorityKey_.pubkey_) != nullptr)
         return;

      if (waited >= params_.pollTimeoutMs_)
         break;

      sleep(params_.pollIntervalMs_);
      waited += params_.pollIntervalMs_;
   }

   throw ConfigurationError("fee payer account did not appear after payment",
      ArchErrorCodes::Config_FeePayer);
}

////////////////////////////////////////////////////////////////////////////////
////
//// submission
////
////////////////////////////////////////////////////////////////////////////////
RuntimeTransaction ProgramDeployer::signTx(
   const vector<Instruction>& instructions,
   const vector<Keypair>& signers, const BinaryData& blockhash)
{
   return TransactionSigner::buildAndSign(
      instructions, signers, authorityKey_.pubkey_, blockhash);
}

////////////////////////////////////////////////////////////////////////////////
string ProgramDeployer::submit(const string& kind,
   const vector<Instruction>& instructions, const vector<Keypair>& signers)
{
   auto blockhash = rpc_->getBestBlockHash();
   auto tx = signTx(instructions, signers, blockhash);

   auto txid = rpc_->sendTransaction(tx);
   result_.txids_.push_back(txid);
   ++result_.counters_[kind];
   LOGDEBUG << kind << " tx: " << txid;

   awaitConfirmation(txid);
   return txid;
}

////////////////////////////////////////////////////////////////////////////////
bool ProgramDeployer::awaitConfirmation(const string& txid)
{
   unsigned waited = 0;
   while (true)
   {
      auto processed = rpc_->getProcessedTransaction(txid);
      if (processed != nullptr)
      {
         switch (processed->status_)
         {
         case TxStatus::Processed:
            consecutiveTimeouts_ = 0;
            return true;

         case TxStatus::Failed:
         {
            stringstream ss;
            ss << "tx " << txid << " failed: " << processed->failureMessage_;
            notify(ProgressLevel::Error, ss.str());
            throw RpcError(ss.str(), ArchErrorCodes::RPCFailure_TxFailed);
         }

         default:
            break;
         }
      }

      if (waited >= params_.pollTimeoutMs_)
         break;

      sleep(params_.pollIntervalMs_);
      waited += params_.pollIntervalMs_;
   }

   ++consecutiveTimeouts_;
   ++result_.confirmationTimeouts_;
   LOGWARN << "tx " << txid << " not confirmed after " <<
      params_.pollTimeoutMs_ << "ms, moving on";

   if (params_.maxConsecutiveTimeouts_ > 0 &&
      consecutiveTimeouts_ >= params_.maxConsecutiveTimeouts_)
   {
      stringstream ss;
      ss << consecutiveTimeouts_ << " consecutive confirmation timeouts";
      notify(ProgressLevel::Error, ss.str());
      throw RpcError(ss.str(), ArchErrorCodes::RPCFailure_Timeout);
   }

   return false;
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::awaitConfirmation(const vector<string>& txids)
{
   for (auto& txid : txids)
      awaitConfirmation(txid);
}

////////////////////////////////////////////////////////////////////////////////
////
//// steps
////
////////////////////////////////////////////////////////////////////////////////
shared_ptr<AccountInfo> ProgramDeployer::createProgramAccount(size_t binaryLen)
{
   notify(ProgressLevel::Info, "creating program account");

   auto rent = SystemInstruction::minimumRent(LOADER_HEADER_SIZE + binaryLen);
   auto instr = SystemInstruction::createAccount(
      authorityKey_.pubkey_, programKey_.pubkey_,
      rent, 0, Pubkey::loaderProgram());

   auto txid = submit(TX_KIND_CREATE, { instr }, { authorityKey_, programKey_ });
   notify(ProgressLevel::Success, "program account created: " + txid);

   auto info = readProgramAccount();
   if (info == nullptr)
      throw RpcError("program account missing after creation");

   return info;
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::assignToLoader()
{
   notify(ProgressLevel::Info, "assigning program account to the loader");

   auto instr = SystemInstruction::assign(
      programKey_.pubkey_, Pubkey::loaderProgram());
   submit(TX_KIND_ASSIGN, { instr }, { authorityKey_, programKey_ });

   notify(ProgressLevel::Success, "program account assigned to the loader");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::retract()
{
   notify(ProgressLevel::Info, "retracting executable program");

   auto instr = LoaderInstruction::retract(
      programKey_.pubkey_, authorityKey_.pubkey_);
   submit(TX_KIND_RETRACT, { instr }, { authorityKey_ });

   notify(ProgressLevel::Success, "program retracted");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::resize(const AccountInfo& info, size_t binaryLen)
{
   auto requiredSize = LOADER_HEADER_SIZE + binaryLen;

   stringstream ss;
   ss << "resizing program account from " << info.data_.getSize() <<
      " to " << requiredSize << " bytes";
   notify(ProgressLevel::Info, ss.str());

   //only top up the rent shortfall
   auto rent = SystemInstruction::minimumRent(requiredSize);
   if (rent > info.lamports_)
   {
      auto missing = rent - info.lamports_;

      stringstream ssTransfer;
      ssTransfer << "transferring " << missing << " lamports for rent";
      notify(ProgressLevel::Info, ssTransfer.str());

      auto instr = SystemInstruction::transfer(
         authorityKey_.pubkey_, programKey_.pubkey_, missing);
      submit(TX_KIND_TRANSFER, { instr }, { authorityKey_ });
   }

   auto instr = LoaderInstruction::truncate(
      programKey_.pubkey_, authorityKey_.pubkey_, (uint32_t)binaryLen);
   submit(TX_KIND_TRUNCATE, { instr }, { programKey_, authorityKey_ });

   notify(ProgressLevel::Success, "program account resized");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::upload(const BinaryData& binary)
{
   auto chunks = planner_.plan(binary.getSize());

   stringstream ss;
   ss << "uploading " << binary.getSize() << " bytes in " <<
      chunks.size() << " chunks";
   notify(ProgressLevel::Info, ss.str());

   size_t sent = 0;
   BinaryData blockhash;
   while (sent < chunks.size())
   {
      auto batchEnd = min(chunks.size(), sent + params_.batchSize_);

      vector<RuntimeTransaction> batch;
      for (size_t i = sent; i < batchEnd; i++)
      {
         //refresh count restarts with each batch
         if ((i - sent) % params_.blockhashRefresh_ == 0 ||
            blockhash.empty())
            blockhash = rpc_->getBestBlockHash();

         auto& chunk = chunks[i];
         auto instr = LoaderInstruction::write(
            programKey_.pubkey_, authorityKey_.pubkey_, chunk.offset_,
            binary.getSliceRef(chunk.offset_, chunk.length_));

         batch.push_back(signTx({ instr }, { authorityKey_ }, blockhash));
      }

      auto txids = rpc_->sendTransactions(batch);
      for (auto& txid : txids)
         result_.txids_.push_back(txid);
      result_.counters_[TX_KIND_WRITE] += txids.size();

      awaitConfirmation(txids);
      sent = batchEnd;

      stringstream ssBatch;
      ssBatch << "uploaded " << sent << "/" << chunks.size() << " chunks";
      notify(ProgressLevel::Info, ssBatch.str());
   }

   notify(ProgressLevel::Success, "program binary uploaded");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::makeExecutable()
{
   notify(ProgressLevel::Info, "making program executable");

   auto instr = LoaderInstruction::deploy(
      programKey_.pubkey_, authorityKey_.pubkey_);
   submit(TX_KIND_DEPLOY, { instr }, { authorityKey_ });

   notify(ProgressLevel::Success, "program is executable");
}

////////////////////////////////////////////////////////////////////////////////
void ProgramDeployer::verify(const BinaryData& binary)
{
   notify(ProgressLevel::Info, "verifying deployed program");

   auto info = readProgramAccount();
   if (info == nullptr)
   {
      notify(ProgressLevel::Error, "program account missing after deployment");
      throw VerificationError("program account missing after deployment");
   }

   if (getProgramBytes(*info) != binary.getRef())
   {
      stringstream ss;
      ss << "deployed binary does not match: expected " <<
         binary.getSize() << " bytes, account holds " <<
         getProgramBytes(*info).getSize();
      notify(ProgressLevel::Error, ss.str());
      throw VerificationError(ss.str());
   }

   if (!info->isExecutable_)
   {
      notify(ProgressLevel::Error, "program is not executable after deploy");
      throw VerificationError("program is not executable after deploy");
   }

   notify(ProgressLevel::Success, "program verified");
}

////////////////////////////////////////////////////////////////////////////////
DeploymentResult ProgramDeployer::deploy(const BinaryData& binary)
{
   if (binary.empty())
   {
      throw ConfigurationError("empty program binary",
         ArchErrorCodes::Config_ProgramFile);
   }

   result_ = DeploymentResult();
   result_.programId_ = programKey_.pubkey_.toHexStr();
   consecutiveTimeouts_ = 0;

   notify(ProgressLevel::Info,
      "starting program deployment for " + result_.programId_);

   //funding
   fundFeePayer();

   //account
   auto info = readProgramAccount();
   if (info == nullptr)
   {
      info = createProgramAccount(binary.getSize());
   }
   else
   {
      notify(ProgressLevel::Info,
         "program account exists, checking for redeployment");
   }

   if (getProgramBytes(*info) == binary.getRef() &&
      info->owner_ == Pubkey::loaderProgram())
   {
      if (info->isExecutable_)
      {
         result_.alreadyDeployed_ = true;
         notify(ProgressLevel::Success, "same program already deployed");
      }
      else
      {
         notify(ProgressLevel::Info,
            "same program already uploaded, not executable yet");
         makeExecutable();
         verify(binary);
      }
   }
   else
   {
      //redeploy
      if (info->owner_ != Pubkey::loaderProgram())
         assignToLoader();

      if (info->isExecutable_)
         retract();

      if (info->data_.getSize() != LOADER_HEADER_SIZE + binary.getSize())
         resize(*info, binary.getSize());

      upload(binary);
      makeExecutable();
      verify(binary);
   }

   if (!params_.explorerUrl_.empty())
      result_.explorerUrl_ = params_.explorerUrl_ + "/programs/" +
         result_.programId_;

   notify(ProgressLevel::Success,
      "program deployed successfully: " + result_.programId_);
   return result_;
}
