////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_PUBKEY_
#define _H_PUBKEY_

#include <string>

#include "BinaryData.h"
#include "SecureBinaryData.h"

#define PUBKEY_LENGTH 32
#define PRIVKEY_LENGTH 32
#define BLOCKHASH_LENGTH 32
#define SIGNATURE_LENGTH 64

//account data of a loader owned program starts with this many header bytes
#define LOADER_HEADER_SIZE 40

#define LOADER_PROGRAM_ID "BpfLoader11111111111111111111111"

////////////////////////////////////////////////////////////////////////////////
class Pubkey
{
private:
   BinaryData bytes_;

public:
   //all zero key
   Pubkey(void);

   //throws runtime_error unless the buffer is 32 bytes
   explicit Pubkey(BinaryDataRef);

   static Pubkey fromHex(const std::string&);

   //31 zero bytes then 0x01
   static Pubkey systemProgram(void);

   //ascii bytes of the loader program id
   static Pubkey loaderProgram(void);

   const BinaryData& getBytes(void) const { return bytes_; }
   BinaryDataRef getRef(void) const { return bytes_.getRef(); }
   std::string toHexStr(void) const { return bytes_.toHexStr(); }

   bool isSystemProgram(void) const;

   //BIP86 key path taproot address for this x-only key
   std::string toTaprootAddress(const std::string& hrp) const;

   bool operator==(const Pubkey& rhs) const { return bytes_ == rhs.bytes_; }
   bool operator!=(const Pubkey& rhs) const { return !(*this == rhs); }
   bool operator<(const Pubkey& rhs) const { return bytes_ < rhs.bytes_; }
};

////////////////////////////////////////////////////////////////////////////////
// Caller held signing key. Nothing in the library persists it, the cli reads
// and writes keypair files as json: {"privkey", "pubkey", "address"}
struct Keypair
{
   SecureBinaryData privKey_;
   Pubkey pubkey_;

   static Keypair fromPrivateKey(const SecureBinaryData&);
   static Keypair generate(void);

   static Keypair fromFile(const std::string& path);
   void toFile(const std::string& path, const std::string& hrp) const;
};

#endif
