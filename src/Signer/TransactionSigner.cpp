////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2022, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cstdint>
#include <sstream>

#include "TransactionSigner.h"
#include "BIP322.h"
#include "ArchErrors.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy::Signer;

////////////////////////////////////////////////////////////////////////////////
BinaryData TransactionSigner::signPayload(
   BinaryDataRef payload, const Keypair& keypair)
{
   auto witness = BIP322::signSimple(payload, keypair.privKey_);
   return BIP322::extractSignature(witness);
}

////////////////////////////////////////////////////////////////////////////////
RuntimeTransaction TransactionSigner::buildAndSign(
   const vector<Instruction>& instructions,
   const vector<Keypair>& signers,
   const Pubkey& feePayer,
   const BinaryData& recentBlockhash)
{
   vector<Pubkey> signerKeys;
   for (auto& kp : signers)
      signerKeys.push_back(kp.pubkey_);

   RuntimeTransaction tx;
   tx.message_ = ArchMessage::compile(
      instructions, signerKeys, feePayer, recentBlockhash);

   auto payload = tx.message_.hash();
   for (auto& key : tx.message_.signerKeys())
   {
      const Keypair* kpPtr = nullptr;
      for (auto& kp : signers)
      {
         if (kp.pubkey_ == key)
         {
            kpPtr = &kp;
            break;
         }
      }

      if (kpPtr == nullptr)
      {
         stringstream ss;
         ss << "missing keypair for signer " << key.toHexStr();
         throw SigningError(ss.str());
      }

      tx.signatures_.push_back(signPayload(payload, *kpPtr));
   }

   return tx;
}

////////////////////////////////////////////////////////////////////////////////
void TransactionSigner::completePartiallySigned(
   RuntimeTransaction& tx, const Keypair& keypair)
{
   auto keys = tx.message_.signerKeys();

   size_t index = SIZE_MAX;
   for (size_t i = 0; i < keys.size(); i++)
   {
      if (keys[i] == keypair.pubkey_)
      {
         index = i;
         break;
      }
   }

   if (index == SIZE_MAX)
      throw SigningError("our key is not a signer of this transaction");

   if (tx.signatures_.size() != index)
   {
      stringstream ss;
      ss << "expected " << index << " signatures ahead of ours, got " <<
         tx.signatures_.size();
      throw SigningError(ss.str());
   }

   //the payload is always derived from the message as received
   auto payload = tx.message_.hash();
   LOGDEBUG << "co-signing tx " << tx.getTxid() << " at slot " << index;
   tx.signatures_.push_back(signPayload(payload, keypair));
}

////////////////////////////////////////////////////////////////////////////////
bool TransactionSigner::verifyTransaction(const RuntimeTransaction& tx)
{
   auto keys = tx.message_.signerKeys();
   if (keys.size() != tx.signatures_.size())
      return false;

   auto payload = tx.message_.hash();
   for (size_t i = 0; i < keys.size(); i++)
   {
      if (!BIP322::verifySimple(keys[i], payload, tx.signatures_[i]))
         return false;
   }

   return true;
}
