////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2022, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_BIP322
#define _H_BIP322

#include "BinaryData.h"
#include "SecureBinaryData.h"
#include "Pubkey.h"

#define BIP322_TAG "BIP0322-signed-message"
#define TAPSIGHASH_TAG "TapSighash"

namespace ArchDeploy
{
   namespace Signer
   {
      ////
      enum SIGHASH_TYPE
      {
         SIGHASH_DEFAULT = 0x00,
         SIGHASH_ALL     = 0x01
      };

      //////////////////////////////////////////////////////////////////////////
      // BIP322 "simple" message signatures for single key P2TR (BIP86) outputs.
      // The signed message is committed to in a virtual to_spend tx, the
      // signature is the key path witness of the virtual to_sign tx spending it.
      class BIP322
      {
      private:
         static BinaryData getTaprootScript(BinaryDataRef outputKey);

      public:
         //tagged hash of the message
         static BinaryData getMessageHash(BinaryDataRef message);

         //serialized to_spend tx, no witness
         static BinaryData getToSpendTx(
            BinaryDataRef msgHash, BinaryDataRef outputKey);

         //BIP341 key path sighash of to_sign input 0
         static BinaryData getToSignSigHash(BinaryDataRef toSpendTxid,
            BinaryDataRef outputKey, uint8_t hashType = SIGHASH_ALL);

         //sighash for a message and untweaked x-only key
         static BinaryData getSigHash(
            BinaryDataRef message, const Pubkey& pubkey);

         //serialized to_sign witness: item count, then each item
         static BinaryData signSimple(BinaryDataRef message,
            const SecureBinaryData& privKey,
            const SecureBinaryData& auxRand = SecureBinaryData());

         //first witness item, stripped of its sighash byte. Throws
         //SigningError unless 64 bytes remain.
         static BinaryData extractSignature(BinaryDataRef witness);

         static bool verifySimple(const Pubkey& pubkey,
            BinaryDataRef message, BinaryDataRef signature);
      };
   }; //namespace Signer
}; //namespace ArchDeploy

#endif
