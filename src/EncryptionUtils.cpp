////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2019, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////
#include "EncryptionUtils.h"
#include "BtcUtils.h"
#include "log.h"
#include <algorithm>
#include <cstring>
#include <btc/ecc.h>
#include <btc/random.h>
#include <btc/sha2.h>
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

using namespace std;

#define TAPTWEAK_TAG "TapTweak"

static secp256k1_context* crypto_schnorr_ctx = nullptr;

////////////////////////////////////////////////////////////////////////////////
static secp256k1_context* getContext(void)
{
   if (crypto_schnorr_ctx == nullptr)
      throw SchnorrException("uninitialized secp256k1 context");
   return crypto_schnorr_ctx;
}

/////////////////////////////////////////////////////////////////////////////
//// CryptoPRNG
/////////////////////////////////////////////////////////////////////////////
SecureBinaryData CryptoPRNG::generateRandom(uint32_t numBytes,
   const SecureBinaryData& extraEntropy)
{
   SecureBinaryData sbd(numBytes);
   btc_random_init();
   if (!btc_random_bytes(sbd.getPtr(), numBytes, 0))
      throw runtime_error("failed to generate random value");

   if (extraEntropy.getSize() != 0)
   {
      auto len = min((size_t)numBytes, extraEntropy.getSize());
      for (size_t i = 0; i < len; i++)
         sbd[i] ^= extraEntropy[i];
   }

   return sbd;
}

/////////////////////////////////////////////////////////////////////////////
//// CryptoSHA2
////////////////////////////////////////////////////////////////////////////////
void CryptoSHA2::getHash256(BinaryDataRef bdr, uint8_t* digest)
{
   sha256_Raw(bdr.getPtr(), bdr.getSize(), digest);
   sha256_Raw(digest, 32, digest);
}

////////////////////////////////////////////////////////////////////////////////
void CryptoSHA2::getSha256(BinaryDataRef bdr, uint8_t* digest)
{
   sha256_Raw(bdr.getPtr(), bdr.getSize(), digest);
}

/////////////////////////////////////////////////////////////////////////////
//// CryptoSchnorr
/////////////////////////////////////////////////////////////////////////////
void CryptoSchnorr::setupContext()
{
   if (crypto_schnorr_ctx != nullptr)
      return;

   btc_ecc_start();
   crypto_schnorr_ctx = secp256k1_context_create(
      SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);

   auto rando = CryptoPRNG::generateRandom(32);
   if (!secp256k1_context_randomize(crypto_schnorr_ctx, rando.getPtr()))
      throw SchnorrException("[CryptoSchnorr::setupContext]");
}

/////////////////////////////////////////////////////////////////////////////
void CryptoSchnorr::shutdown()
{
   if (crypto_schnorr_ctx == nullptr)
      return;

   btc_ecc_stop();
   secp256k1_context_destroy(crypto_schnorr_ctx);
   crypto_schnorr_ctx = nullptr;
}

/////////////////////////////////////////////////////////////////////////////
bool CryptoSchnorr::checkPrivKeyIsValid(const SecureBinaryData& privKey)
{
   if (privKey.getSize() != 32)
      return false;

   return secp256k1_ec_seckey_verify(getContext(), privKey.getPtr()) == 1;
}

/////////////////////////////////////////////////////////////////////////////
BinaryData CryptoSchnorr::computeXOnlyPubkey(const SecureBinaryData& privKey)
{
   if (!checkPrivKeyIsValid(privKey))
      throw SchnorrException("invalid private key");

   auto ctx = getContext();
   secp256k1_keypair keypair;
   if (!secp256k1_keypair_create(ctx, &keypair, privKey.getPtr()))
      throw SchnorrException("failed to create keypair");

   secp256k1_xonly_pubkey xonly;
   if (!secp256k1_keypair_xonly_pub(ctx, &xonly, nullptr, &keypair))
      throw SchnorrException("failed to get xonly pubkey");

   BinaryData result(32);
   secp256k1_xonly_pubkey_serialize(ctx, result.getPtr(), &xonly);

   memset(&keypair, 0, sizeof(keypair));
   return result;
}

/////////////////////////////////////////////////////////////////////////////
BinaryData CryptoSchnorr::computeTaprootOutputKey(BinaryDataRef xonlyPubkey)
{
   if (xonlyPubkey.getSize() != 32)
      throw SchnorrException("invalid xonly pubkey size");

   auto ctx = getContext();
   secp256k1_xonly_pubkey internalKey;
   if (!secp256k1_xonly_pubkey_parse(ctx, &internalKey, xonlyPubkey.getPtr()))
      throw SchnorrException("invalid xonly pubkey");

   auto tweak = BtcUtils::getTaggedHash(TAPTWEAK_TAG, xonlyPubkey);

   secp256k1_pubkey tweakedKey;
   if (!secp256k1_xonly_pubkey_tweak_add(
      ctx, &tweakedKey, &internalKey, tweak.getPtr()))
      throw SchnorrException("failed to tweak pubkey");

   secp256k1_xonly_pubkey outputKey;
   if (!secp256k1_xonly_pubkey_from_pubkey(
      ctx, &outputKey, nullptr, &tweakedKey))
      throw SchnorrException("failed to convert tweaked pubkey");

   BinaryData result(32);
   secp256k1_xonly_pubkey_serialize(ctx, result.getPtr(), &outputKey);
   return result;
}

/////////////////////////////////////////////////////////////////////////////
BinaryData CryptoSchnorr::signTaprootKeyPath(BinaryDataRef hash,
   const SecureBinaryData& privKey, const SecureBinaryData& auxRand)
{
   if (hash.getSize() != 32)
      throw SchnorrException("can only sign 32 byte hashes");

   if (!checkPrivKeyIsValid(privKey))
      throw SchnorrException("invalid private key");

   auto ctx = getContext();
   secp256k1_keypair keypair;
   if (!secp256k1_keypair_create(ctx, &keypair, privKey.getPtr()))
      throw SchnorrException("failed to create keypair");

   //tweak the keypair with the hash of its own xonly pubkey
   secp256k1_xonly_pubkey internalKey;
   if (!secp256k1_keypair_xonly_pub(ctx, &internalKey, nullptr, &keypair))
      throw SchnorrException("failed to get xonly pubkey");

   BinaryData internalKeyBytes(32);
   secp256k1_xonly_pubkey_serialize(
      ctx, internalKeyBytes.getPtr(), &internalKey);
   auto tweak = BtcUtils::getTaggedHash(TAPTWEAK_TAG, internalKeyBytes);

   if (!secp256k1_keypair_xonly_tweak_add(ctx, &keypair, tweak.getPtr()))
      throw SchnorrException("failed to tweak keypair");

   SecureBinaryData aux = auxRand;
   if (aux.getSize() != 32)
      aux = CryptoPRNG::generateRandom(32);

   BinaryData sig(64);
   auto ret = secp256k1_schnorrsig_sign32(
      ctx, sig.getPtr(), hash.getPtr(), &keypair, aux.getPtr());
   memset(&keypair, 0, sizeof(keypair));

   if (ret != 1)
      throw SchnorrException("schnorr signature failed");

   return sig;
}

/////////////////////////////////////////////////////////////////////////////
bool CryptoSchnorr::verify(BinaryDataRef sig, BinaryDataRef hash,
   BinaryDataRef xonlyPubkey)
{
   if (sig.getSize() != 64 || xonlyPubkey.getSize() != 32)
      return false;

   auto ctx = getContext();
   secp256k1_xonly_pubkey pubkey;
   if (!secp256k1_xonly_pubkey_parse(ctx, &pubkey, xonlyPubkey.getPtr()))
      return false;

   return secp256k1_schnorrsig_verify(ctx, sig.getPtr(),
      hash.getPtr(), hash.getSize(), &pubkey) == 1;
}
