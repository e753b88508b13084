////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2022, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <sstream>

#include "BIP322.h"
#include "ArchErrors.h"
#include "BtcUtils.h"
#include "EncryptionUtils.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy::Signer;

#define OP_0         0x00
#define OP_1         0x51
#define OP_RETURN    0x6a
#define OP_PUSH32    0x20

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::getTaprootScript(BinaryDataRef outputKey)
{
   if (outputKey.getSize() != 32)
      throw SigningError("invalid taproot output key length");

   BinaryWriter bw;
   bw.put_uint8_t(OP_1);
   bw.put_uint8_t(OP_PUSH32);
   bw.put_BinaryDataRef(outputKey);
   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::getMessageHash(BinaryDataRef message)
{
   return BtcUtils::getTaggedHash(BIP322_TAG, message);
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::getToSpendTx(BinaryDataRef msgHash, BinaryDataRef outputKey)
{
   BinaryWriter bw;

   //version
   bw.put_uint32_t(0);

   //single input, null outpoint
   bw.put_var_int(1);
   BinaryData nullHash(32);
   memset(nullHash.getPtr(), 0, 32);
   bw.put_BinaryData(nullHash);
   bw.put_uint32_t(0xFFFFFFFF);

   //scriptSig: OP_0 PUSH32 <msg hash>
   BinaryWriter bwScriptSig;
   bwScriptSig.put_uint8_t(OP_0);
   bwScriptSig.put_uint8_t(OP_PUSH32);
   bwScriptSig.put_BinaryDataRef(msgHash);
   bw.put_var_int(bwScriptSig.getSize());
   bw.put_BinaryDataRef(bwScriptSig.getDataRef());

   //sequence
   bw.put_uint32_t(0);

   //single 0 value output to the signer's script
   bw.put_var_int(1);
   bw.put_uint64_t(0);
   auto script = getTaprootScript(outputKey);
   bw.put_var_int(script.getSize());
   bw.put_BinaryData(script);

   //locktime
   bw.put_uint32_t(0);

   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::getToSignSigHash(BinaryDataRef toSpendTxid,
   BinaryDataRef outputKey, uint8_t hashType)
{
   if (toSpendTxid.getSize() != 32)
      throw SigningError("invalid to_spend txid length");

   //sha_prevouts: to_spend:0
   BinaryWriter bwPrevouts;
   bwPrevouts.put_BinaryDataRef(toSpendTxid);
   bwPrevouts.put_uint32_t(0);

   //sha_amounts
   BinaryWriter bwAmounts;
   bwAmounts.put_uint64_t(0);

   //sha_scriptpubkeys
   auto script = getTaprootScript(outputKey);
   BinaryWriter bwScripts;
   bwScripts.put_var_int(script.getSize());
   bwScripts.put_BinaryData(script);

   //sha_sequences
   BinaryWriter bwSequences;
   bwSequences.put_uint32_t(0);

   //sha_outputs: single 0 value OP_RETURN
   BinaryWriter bwOutputs;
   bwOutputs.put_uint64_t(0);
   bwOutputs.put_var_int(1);
   bwOutputs.put_uint8_t(OP_RETURN);

   BinaryWriter bwSigMsg;
   bwSigMsg.put_uint8_t(0); //epoch
   bwSigMsg.put_uint8_t(hashType);
   bwSigMsg.put_uint32_t(0); //version
   bwSigMsg.put_uint32_t(0); //locktime
   bwSigMsg.put_BinaryData(BtcUtils::getSha256(bwPrevouts.getDataRef()));
   bwSigMsg.put_BinaryData(BtcUtils::getSha256(bwAmounts.getDataRef()));
   bwSigMsg.put_BinaryData(BtcUtils::getSha256(bwScripts.getDataRef()));
   bwSigMsg.put_BinaryData(BtcUtils::getSha256(bwSequences.getDataRef()));
   bwSigMsg.put_BinaryData(BtcUtils::getSha256(bwOutputs.getDataRef()));
   bwSigMsg.put_uint8_t(0); //spend type: key path, no annex
   bwSigMsg.put_uint32_t(0); //input index

   return BtcUtils::getTaggedHash(TAPSIGHASH_TAG, bwSigMsg.getDataRef());
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::getSigHash(BinaryDataRef message, const Pubkey& pubkey)
{
   auto outputKey = CryptoSchnorr::computeTaprootOutputKey(pubkey.getRef());
   auto msgHash = getMessageHash(message);

   auto toSpend = getToSpendTx(msgHash, outputKey);
   auto toSpendTxid = BtcUtils::getHash256(toSpend);

   return getToSignSigHash(toSpendTxid, outputKey);
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::signSimple(BinaryDataRef message,
   const SecureBinaryData& privKey, const SecureBinaryData& auxRand)
{
   BinaryData sig;
   try
   {
      auto pubkey = Pubkey(CryptoSchnorr::computeXOnlyPubkey(privKey).getRef());
      auto sigHash = getSigHash(message, pubkey);
      sig = CryptoSchnorr::signTaprootKeyPath(sigHash, privKey, auxRand);
   }
   catch (const SchnorrException& e)
   {
      LOGERR << "bip322 signing failed: " << e.what();
      throw SigningError(e.what());
   }

   //witness stack: [sig | hash type]
   BinaryWriter bwItem;
   bwItem.put_BinaryData(sig);
   bwItem.put_uint8_t(SIGHASH_ALL);

   BinaryWriter bwWitness;
   bwWitness.put_var_int(1);
   bwWitness.put_var_int(bwItem.getSize());
   bwWitness.put_BinaryDataRef(bwItem.getDataRef());

   return bwWitness.getData();
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BIP322::extractSignature(BinaryDataRef witness)
{
   BinaryData sig;
   try
   {
      BinaryRefReader brr(witness);
      auto itemCount = brr.get_var_int();
      if (itemCount == 0)
         throw SigningError("empty witness");

      auto itemLen = brr.get_var_int();
      sig = brr.get_BinaryData(itemLen);
   }
   catch (const SigningError&)
   {
      throw;
   }
   catch (const runtime_error& e)
   {
      throw SigningError(string("malformed witness: ") + e.what());
   }

   //strip the sighash byte
   if (sig.getSize() == SIGNATURE_LENGTH + 1)
      sig.resize(SIGNATURE_LENGTH);

   if (sig.getSize() != SIGNATURE_LENGTH)
   {
      stringstream ss;
      ss << "unexpected signature length: " << sig.getSize();
      throw SigningError(ss.str());
   }

   return sig;
}

////////////////////////////////////////////////////////////////////////////////
bool BIP322::verifySimple(const Pubkey& pubkey,
   BinaryDataRef message, BinaryDataRef signature)
{
   if (signature.getSize() != SIGNATURE_LENGTH)
      return false;

   try
   {
      auto outputKey = CryptoSchnorr::computeTaprootOutputKey(pubkey.getRef());
      auto sigHash = getSigHash(message, pubkey);
      return CryptoSchnorr::verify(signature, sigHash, outputKey);
   }
   catch (const SchnorrException& e)
   {
      LOGWARN << "bip322 verification error: " << e.what();
      return false;
   }
}
