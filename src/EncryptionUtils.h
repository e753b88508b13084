////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2011-2015, Armory Technologies, Inc.                        //
//  Distributed under the GNU Affero General Public License (AGPL v3)         //
//  See LICENSE-ATI or http://www.gnu.org/licenses/agpl.html                  //
//                                                                            //
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_ENCRYPTION_UTILS_
#define _H_ENCRYPTION_UTILS_

#include <stdexcept>
#include "BinaryData.h"
#include "SecureBinaryData.h"

////////////////////////////////////////////////////////////////////////////////
class CryptoPRNG
{
public:
   static SecureBinaryData generateRandom(uint32_t numBytes,
      const SecureBinaryData& extraEntropy = SecureBinaryData());
};

////////////////////////////////////////////////////////////////////////////////
struct CryptoSHA2
{
   static void getHash256(BinaryDataRef bdr, uint8_t* digest);
   static void getSha256(BinaryDataRef bdr, uint8_t* digest);
};

////////////////////////////////////////////////////////////////////////////////
class SchnorrException : public std::runtime_error
{
public:
   SchnorrException(const std::string& err) :
      std::runtime_error(err)
   {}
};

////////////////////////////////////////////////////////////////////////////////
// BIP340 Schnorr signatures and BIP341 key path tweaks over libsecp256k1.
// setupContext() has to be called before any other method.
class CryptoSchnorr
{
public:
   static void setupContext(void);
   static void shutdown(void);

   static bool checkPrivKeyIsValid(const SecureBinaryData& privKey);

   //32 byte x-only public key for a 32 byte private key
   static BinaryData computeXOnlyPubkey(const SecureBinaryData& privKey);

   //BIP86 output key: P + hash_TapTweak(P)G, no script tree
   static BinaryData computeTaprootOutputKey(BinaryDataRef xonlyPubkey);

   //signs a 32 byte hash with the key path tweaked private key
   static BinaryData signTaprootKeyPath(BinaryDataRef hash,
      const SecureBinaryData& privKey,
      const SecureBinaryData& auxRand = SecureBinaryData());

   static bool verify(BinaryDataRef sig, BinaryDataRef hash,
      BinaryDataRef xonlyPubkey);
};

#endif
