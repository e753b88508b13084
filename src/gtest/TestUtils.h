////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _TEST_UTILS_H
#define _TEST_UTILS_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../log.h"
#include "../BinaryData.h"
#include "../BtcUtils.h"
#include "../EncryptionUtils.h"
#include "../ArchErrors.h"
#include "../Pubkey.h"
#include "../Instructions.h"
#include "../ArchMessage.h"
#include "../RuntimeTransaction.h"
#include "../archRPC.h"
#include "../Signer/BIP322.h"
#include "../Signer/TransactionSigner.h"

#define READHEX BinaryData::CreateFromHex

#define LEDGER_HRP "bcrt"
#define FAUCET_LAMPORTS 1000000000ULL
#define AIRDROP_LAMPORTS 100000000ULL

namespace TestUtils
{
   //deterministic keypair, privkey = sha256(seed)
   Keypair getKeypair(const std::string& seed);

   //pseudo random program bytes
   BinaryData getProgramBinary(size_t len, uint8_t seed);

   //loader account data: 40 byte header followed by the program bytes
   BinaryData getLoaderAccountData(
      const Pubkey& authority, BinaryDataRef program, bool deployed);
}

////////////////////////////////////////////////////////////////////////////////
/***
In memory ledger behind the rpc interface. Applies the system and loader
instructions the deployer emits, checks every signature against the message
payload and enforces the signer and writable flags each instruction needs.
A tx that fails is recorded with a Failed status and leaves state untouched.

Loader account header: authority (32 bytes) | status (u64 LE, 1 = deployed)
***/
class LocalLedger : public ArchRPC::ArchRPCInterface
{
private:
   std::map<Pubkey, AccountInfo> accounts_;
   std::map<std::string, ProcessedTransaction> processed_;
   std::vector<RuntimeTransaction> submitted_;
   std::vector<std::string> appliedKinds_;

   const Keypair faucetKey_;
   unsigned blockhashCounter_ = 0;

private:
   //throws runtime_error with the failure reason
   void applyTransaction(const RuntimeTransaction&,
      std::map<Pubkey, AccountInfo>&, std::vector<std::string>&);
   void applySystemInstruction(const CompiledMessage&,
      const SanitizedInstruction&,
      std::map<Pubkey, AccountInfo>&, std::vector<std::string>&);
   void applyLoaderInstruction(const CompiledMessage&,
      const SanitizedInstruction&,
      std::map<Pubkey, AccountInfo>&, std::vector<std::string>&);

   std::string processTransaction(const RuntimeTransaction&);

public:
   //knobs
   bool failAirdrop_ = false;
   bool failWrites_ = false;
   bool corruptWrites_ = false;
   bool neverConfirm_ = false;

   std::map<std::string, unsigned> callCounts_;

public:
   LocalLedger(void);

   //test setup
   void setAccount(const Pubkey&, const AccountInfo&);
   bool hasAccount(const Pubkey&) const;
   const AccountInfo& getAccount(const Pubkey&) const;
   void fundAccount(const Pubkey&, uint64_t lamports);

   const std::vector<RuntimeTransaction>& getSubmitted(void) const
   { return submitted_; }

   //instruction kinds successfully applied, in order
   const std::vector<std::string>& getAppliedKinds(void) const
   { return appliedKinds_; }
   unsigned countApplied(const std::string&) const;

   unsigned getCallCount(const std::string&) const;

   //rpc interface
   std::shared_ptr<AccountInfo> readAccountInfo(const Pubkey&) override;
   BinaryData getBestBlockHash(void) override;
   void requestAirdrop(const Pubkey&) override;
   RuntimeTransaction createAccountWithFaucet(const Pubkey&) override;
   std::string sendTransaction(const RuntimeTransaction&) override;
   std::vector<std::string> sendTransactions(
      const std::vector<RuntimeTransaction>&) override;
   std::shared_ptr<ProcessedTransaction> getProcessedTransaction(
      const std::string& txid) override;
   std::string getAccountAddress(const Pubkey&) override;
};

#endif
