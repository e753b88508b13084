////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2022, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_TRANSACTION_SIGNER
#define _H_TRANSACTION_SIGNER

#include <vector>

#include "ArchMessage.h"
#include "RuntimeTransaction.h"

namespace ArchDeploy
{
   namespace Signer
   {
      class TransactionSigner
      {
      public:
         //64 byte BIP322 signature over a message payload
         static BinaryData signPayload(
            BinaryDataRef payload, const Keypair& keypair);

         /***
         Compiles the instructions, hashes the message and signs it with each
         keypair. Signatures are laid out in the order of the signer slice of
         the compiled message. Throws SigningError if a signer key has no
         matching keypair.
         ***/
         static RuntimeTransaction buildAndSign(
            const std::vector<Instruction>& instructions,
            const std::vector<Keypair>& signers,
            const Pubkey& feePayer,
            const BinaryData& recentBlockhash);

         //adds our signature to a tx that already carries the signatures
         //for the slots ahead of ours
         static void completePartiallySigned(
            RuntimeTransaction& tx, const Keypair& keypair);

         //checks every signature against its signer key
         static bool verifyTransaction(const RuntimeTransaction& tx);
      };
   }; //namespace Signer
}; //namespace ArchDeploy

#endif
