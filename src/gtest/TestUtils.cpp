////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cstring>
#include <sstream>

#include "TestUtils.h"

using namespace std;
using namespace ArchDeploy::Signer;

#define FAUCET_BALANCE 1000000000000000ULL

#define KIND_CREATE        "create_account"
#define KIND_ASSIGN        "assign"
#define KIND_TRANSFER      "transfer"
#define KIND_WRITE         "write"
#define KIND_TRUNCATE      "truncate"
#define KIND_DEPLOY        "deploy"
#define KIND_RETRACT       "retract"
#define KIND_AUTHORITY     "transfer_authority"

////////////////////////////////////////////////////////////////////////////////
Keypair TestUtils::getKeypair(const string& seed)
{
   auto privKey = BtcUtils::getSha256(BinaryData::fromString(seed));
   return Keypair::fromPrivateKey(SecureBinaryData(privKey));
}

////////////////////////////////////////////////////////////////////////////////
BinaryData TestUtils::getProgramBinary(size_t len, uint8_t seed)
{
   BinaryData result(len);
   uint32_t state = 0x9E3779B9 ^ seed;
   for (size_t i = 0; i < len; i++)
   {
      state = state * 1103515245 + 12345;
      result[i] = (uint8_t)(state >> 16);
   }

   return result;
}

////////////////////////////////////////////////////////////////////////////////
BinaryData TestUtils::getLoaderAccountData(
   const Pubkey& authority, BinaryDataRef program, bool deployed)
{
   BinaryWriter bw;
   bw.put_BinaryData(authority.getBytes());
   bw.put_uint64_t(deployed ? 1 : 0);
   bw.put_BinaryDataRef(program);
   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
////
//// LocalLedger
////
////////////////////////////////////////////////////////////////////////////////
namespace
{
   ////
   const Pubkey& getAccountKey(const CompiledMessage& msg,
      const SanitizedInstruction& instr, size_t pos)
   {
      if (pos >= instr.accounts_.size())
         throw runtime_error("missing instruction account");

      auto index = instr.accounts_[pos];
      if (index >= msg.accountKeys_.size())
         throw runtime_error("account index out of range");

      return msg.accountKeys_[index];
   }

   ////
   void requireFlags(const CompiledMessage& msg,
      const SanitizedInstruction& instr, size_t pos,
      bool signer, bool writable)
   {
      getAccountKey(msg, instr, pos);
      auto index = instr.accounts_[pos];

      if (signer && !msg.isSigner(index))
         throw runtime_error("missing required signature");

      if (writable && !msg.isWritable(index))
         throw runtime_error("account is not writable");
   }

   ////
   AccountInfo& getExisting(map<Pubkey, AccountInfo>& accounts,
      const Pubkey& key)
   {
      auto iter = accounts.find(key);
      if (iter == accounts.end())
         throw runtime_error("account not found: " + key.toHexStr());

      return iter->second;
   }

   ////
   void checkAuthority(const AccountInfo& info, const Pubkey& authority)
   {
      if (info.data_.getSize() < LOADER_HEADER_SIZE)
         throw runtime_error("program account is not initialized");

      if (info.data_.getSliceRef(0, PUBKEY_LENGTH) != authority.getRef())
         throw runtime_error("authority mismatch");
   }

   ////
   void setStatus(AccountInfo& info, uint64_t status)
   {
      BinaryWriter bw;
      bw.put_uint64_t(status);
      memcpy(info.data_.getPtr() + PUBKEY_LENGTH,
         bw.getData().getPtr(), bw.getSize());
   }
}

////////////////////////////////////////////////////////////////////////////////
LocalLedger::LocalLedger() :
   faucetKey_(TestUtils::getKeypair("faucet"))
{
   AccountInfo faucet;
   faucet.lamports_ = FAUCET_BALANCE;
   faucet.owner_ = Pubkey::systemProgram();
   accounts_[faucetKey_.pubkey_] = faucet;
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::setAccount(const Pubkey& key, const AccountInfo& info)
{
   accounts_[key] = info;
}

////////////////////////////////////////////////////////////////////////////////
bool LocalLedger::hasAccount(const Pubkey& key) const
{
   return accounts_.find(key) != accounts_.end();
}

////////////////////////////////////////////////////////////////////////////////
const AccountInfo& LocalLedger::getAccount(const Pubkey& key) const
{
   auto iter = accounts_.find(key);
   if (iter == accounts_.end())
      throw runtime_error("unknown account");

   return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::fundAccount(const Pubkey& key, uint64_t lamports)
{
   auto iter = accounts_.find(key);
   if (iter == accounts_.end())
   {
      AccountInfo info;
      info.owner_ = Pubkey::systemProgram();
      iter = accounts_.insert(make_pair(key, info)).first;
   }

   iter->second.lamports_ += lamports;
}

////////////////////////////////////////////////////////////////////////////////
unsigned LocalLedger::countApplied(const string& kind) const
{
   unsigned count = 0;
   for (auto& applied : appliedKinds_)
   {
      if (applied == kind)
         ++count;
   }

   return count;
}

////////////////////////////////////////////////////////////////////////////////
unsigned LocalLedger::getCallCount(const string& method) const
{
   auto iter = callCounts_.find(method);
   if (iter == callCounts_.end())
      return 0;

   return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::applySystemInstruction(const CompiledMessage& msg,
   const SanitizedInstruction& instr,
   map<Pubkey, AccountInfo>& accounts, vector<string>& kinds)
{
   auto sysInstr = SystemInstruction::decode(instr.data_);
   switch (sysInstr.type_)
   {
   case SystemInstructionType::CreateAccount:
   {
      requireFlags(msg, instr, 0, true, true);
      requireFlags(msg, instr, 1, true, true);

      auto& fromKey = getAccountKey(msg, instr, 0);
      auto& toKey = getAccountKey(msg, instr, 1);
      if (accounts.find(toKey) != accounts.end())
         throw runtime_error("account already exists");

      auto& from = getExisting(accounts, fromKey);
      if (from.lamports_ < sysInstr.lamports_)
         throw runtime_error("insufficient funds");
      from.lamports_ -= sysInstr.lamports_;

      AccountInfo created;
      created.lamports_ = sysInstr.lamports_;
      created.owner_ = sysInstr.owner_;
      created.data_ = BinaryData(sysInstr.space_);
      created.utxo_ = toKey.toHexStr().substr(0, 16) + ":0";
      accounts[toKey] = created;

      kinds.push_back(KIND_CREATE);
      break;
   }

   case SystemInstructionType::Assign:
   {
      requireFlags(msg, instr, 0, true, true);

      auto& account = getExisting(accounts, getAccountKey(msg, instr, 0));
      if (!account.owner_.isSystemProgram())
         throw runtime_error("only system owned accounts can be assigned");
      account.owner_ = sysInstr.owner_;

      kinds.push_back(KIND_ASSIGN);
      break;
   }

   case SystemInstructionType::Transfer:
   {
      requireFlags(msg, instr, 0, true, true);
      requireFlags(msg, instr, 1, false, true);

      auto& from = getExisting(accounts, getAccountKey(msg, instr, 0));
      if (from.lamports_ < sysInstr.lamports_)
         throw runtime_error("insufficient funds");
      from.lamports_ -= sysInstr.lamports_;

      auto& to = getExisting(accounts, getAccountKey(msg, instr, 1));
      to.lamports_ += sysInstr.lamports_;

      kinds.push_back(KIND_TRANSFER);
      break;
   }

   default:
      throw runtime_error("unsupported system instruction");
   }
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::applyLoaderInstruction(const CompiledMessage& msg,
   const SanitizedInstruction& instr,
   map<Pubkey, AccountInfo>& accounts, vector<string>& kinds)
{
   auto loaderInstr = LoaderInstruction::decode(instr.data_);

   //every loader instruction: [program, authority]
   bool programSigns = loaderInstr.type_ == LoaderInstructionType::Truncate;
   requireFlags(msg, instr, 0, programSigns, true);
   requireFlags(msg, instr, 1, true, false);

   auto& program = getExisting(accounts, getAccountKey(msg, instr, 0));
   auto& authority = getAccountKey(msg, instr, 1);
   if (program.owner_ != Pubkey::loaderProgram())
      throw runtime_error("program account is not owned by the loader");

   switch (loaderInstr.type_)
   {
   case LoaderInstructionType::Write:
   {
      checkAuthority(program, authority);
      if (program.isExecutable_)
         throw runtime_error("cannot write to an executable program");

      if (failWrites_)
         throw runtime_error("write rejected");

      size_t end = LOADER_HEADER_SIZE + (size_t)loaderInstr.offset_ +
         loaderInstr.bytes_.getSize();
      if (end > program.data_.getSize())
         throw runtime_error("write out of bounds");

      if (loaderInstr.bytes_.empty())
         break;

      memcpy(program.data_.getPtr() + LOADER_HEADER_SIZE +
         loaderInstr.offset_,
         loaderInstr.bytes_.getPtr(), loaderInstr.bytes_.getSize());

      if (corruptWrites_)
         program.data_[LOADER_HEADER_SIZE + loaderInstr.offset_] ^= 0xFF;

      kinds.push_back(KIND_WRITE);
      break;
   }

   case LoaderInstructionType::Truncate:
   {
      if (program.isExecutable_)
         throw runtime_error("cannot truncate an executable program");

      if (program.data_.getSize() < LOADER_HEADER_SIZE)
      {
         //first truncate initializes the header
         program.data_ = TestUtils::getLoaderAccountData(
            authority, BinaryDataRef(), false);
      }
      else
      {
         checkAuthority(program, authority);
      }

      size_t newSize = LOADER_HEADER_SIZE + (size_t)loaderInstr.newSize_;
      if (program.lamports_ < SystemInstruction::minimumRent(newSize))
         throw runtime_error("insufficient lamports for rent");

      BinaryData resized(newSize);
      auto copyLen = min(newSize, program.data_.getSize());
      memcpy(resized.getPtr(), program.data_.getPtr(), copyLen);
      program.data_ = move(resized);

      kinds.push_back(KIND_TRUNCATE);
      break;
   }

   case LoaderInstructionType::Deploy:
   {
      checkAuthority(program, authority);
      if (program.isExecutable_)
         throw runtime_error("program is already deployed");

      setStatus(program, 1);
      program.isExecutable_ = true;

      kinds.push_back(KIND_DEPLOY);
      break;
   }

   case LoaderInstructionType::Retract:
   {
      checkAuthority(program, authority);
      if (!program.isExecutable_)
         throw runtime_error("program is not deployed");

      setStatus(program, 0);
      program.isExecutable_ = false;

      kinds.push_back(KIND_RETRACT);
      break;
   }

   case LoaderInstructionType::TransferAuthority:
   {
      checkAuthority(program, authority);
      memcpy(program.data_.getPtr(),
         loaderInstr.newAuthority_.getBytes().getPtr(), PUBKEY_LENGTH);

      kinds.push_back(KIND_AUTHORITY);
      break;
   }

   default:
      throw runtime_error("unsupported loader instruction");
   }
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::applyTransaction(const RuntimeTransaction& tx,
   map<Pubkey, AccountInfo>& accounts, vector<string>& kinds)
{
   auto& msg = tx.message_;
   if (msg.header_.numRequiredSignatures_ == 0 || msg.accountKeys_.empty())
      throw runtime_error("tx has no fee payer");

   if (!TransactionSigner::verifyTransaction(tx))
      throw runtime_error("signature verification failed");

   if (accounts.find(msg.accountKeys_[0]) == accounts.end())
      throw runtime_error("fee payer account not found");

   for (auto& instr : msg.instructions_)
   {
      if (instr.programIdIndex_ >= msg.accountKeys_.size())
         throw runtime_error("program id index out of range");

      auto& programId = msg.accountKeys_[instr.programIdIndex_];
      if (programId.isSystemProgram())
         applySystemInstruction(msg, instr, accounts, kinds);
      else if (programId == Pubkey::loaderProgram())
         applyLoaderInstruction(msg, instr, accounts, kinds);
      else
         throw runtime_error("unknown program " + programId.toHexStr());
   }
}

////////////////////////////////////////////////////////////////////////////////
string LocalLedger::processTransaction(const RuntimeTransaction& tx)
{
   //go through the wire encoding like a node would
   auto decoded = RuntimeTransaction::fromJSON(tx.toJSON());
   auto txid = decoded.getTxid();
   submitted_.push_back(decoded);

   auto accounts = accounts_;
   vector<string> kinds;

   ProcessedTransaction processed;
   processed.runtimeTx_ = make_shared<RuntimeTransaction>(decoded);
   try
   {
      applyTransaction(decoded, accounts, kinds);

      accounts_ = move(accounts);
      appliedKinds_.insert(appliedKinds_.end(), kinds.begin(), kinds.end());
      processed.status_ = TxStatus::Processed;
   }
   catch (runtime_error& e)
   {
      processed.status_ = TxStatus::Failed;
      processed.failureMessage_ = e.what();
   }

   processed_[txid] = processed;
   return txid;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<AccountInfo> LocalLedger::readAccountInfo(const Pubkey& key)
{
   ++callCounts_["read_account_info"];

   auto iter = accounts_.find(key);
   if (iter == accounts_.end())
      return nullptr;

   return make_shared<AccountInfo>(
      AccountInfo::fromJSON(iter->second.toJSON()));
}

////////////////////////////////////////////////////////////////////////////////
BinaryData LocalLedger::getBestBlockHash()
{
   ++callCounts_["get_best_block_hash"];

   stringstream ss;
   ss << "block" << blockhashCounter_++;
   return BtcUtils::getSha256(BinaryData::fromString(ss.str()));
}

////////////////////////////////////////////////////////////////////////////////
void LocalLedger::requestAirdrop(const Pubkey& key)
{
   ++callCounts_["request_airdrop"];

   if (failAirdrop_)
      throw ArchRPC::RpcError("request_airdrop failed: rate limited");

   fundAccount(key, AIRDROP_LAMPORTS);
}

////////////////////////////////////////////////////////////////////////////////
RuntimeTransaction LocalLedger::createAccountWithFaucet(const Pubkey& key)
{
   ++callCounts_["create_account_with_faucet"];

   if (hasAccount(key))
      throw ArchRPC::RpcError("create_account_with_faucet: account exists");

   auto instr = SystemInstruction::createAccount(faucetKey_.pubkey_, key,
      FAUCET_LAMPORTS, 0, Pubkey::systemProgram());

   RuntimeTransaction tx;
   tx.message_ = ArchMessage::compile({ instr },
      { faucetKey_.pubkey_, key }, faucetKey_.pubkey_, getBestBlockHash());

   //faucet slot only, the account key signs the rest
   tx.signatures_.push_back(
      TransactionSigner::signPayload(tx.message_.hash(), faucetKey_));

   return RuntimeTransaction::fromJSON(tx.toJSON());
}

////////////////////////////////////////////////////////////////////////////////
string LocalLedger::sendTransaction(const RuntimeTransaction& tx)
{
   ++callCounts_["send_transaction"];
   return processTransaction(tx);
}

////////////////////////////////////////////////////////////////////////////////
vector<string> LocalLedger::sendTransactions(
   const vector<RuntimeTransaction>& txs)
{
   ++callCounts_["send_transactions"];

   vector<string> txids;
   for (auto& tx : txs)
      txids.push_back(processTransaction(tx));

   return txids;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<ProcessedTransaction> LocalLedger::getProcessedTransaction(
   const string& txid)
{
   ++callCounts_["get_processed_transaction"];

   auto iter = processed_.find(txid);
   if (iter == processed_.end())
      return nullptr;

   if (neverConfirm_)
   {
      auto queued = make_shared<ProcessedTransaction>();
      queued->status_ = TxStatus::Queued;
      queued->runtimeTx_ = iter->second.runtimeTx_;
      return queued;
   }

   return make_shared<ProcessedTransaction>(
      ProcessedTransaction::fromJSON(iter->second.toJSON()));
}

////////////////////////////////////////////////////////////////////////////////
string LocalLedger::getAccountAddress(const Pubkey& key)
{
   ++callCounts_["get_account_address"];
   return key.toTaprootAddress(LEDGER_HRP);
}
