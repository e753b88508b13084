////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_ARCH_MESSAGE_
#define _H_ARCH_MESSAGE_

#include <string>
#include <vector>

#include "BinaryData.h"
#include "Instructions.h"
#include "Pubkey.h"

#define MAX_ACCOUNT_KEYS 255

////////////////////////////////////////////////////////////////////////////////
struct MessageHeader
{
   uint8_t numRequiredSignatures_ = 0;
   uint8_t numReadonlySignedAccounts_ = 0;
   uint8_t numReadonlyUnsignedAccounts_ = 0;
};

////////////////////////////////////////////////////////////////////////////////
struct SanitizedInstruction
{
   uint8_t programIdIndex_ = 0;
   std::vector<uint8_t> accounts_;
   BinaryData data_;
};

////////////////////////////////////////////////////////////////////////////////
class CompiledMessage
{
public:
   MessageHeader header_;
   std::vector<Pubkey> accountKeys_;
   BinaryData recentBlockhash_;
   std::vector<SanitizedInstruction> instructions_;

public:
   /***
   Wire layout:
      header (3 bytes)
      key count (u32 LE), keys (32 bytes each)
      recent blockhash (32 bytes)
      instruction count (u32 LE), for each instruction:
         program id index (1 byte)
         account count (u32 LE), account indices (1 byte each)
         data length (u32 LE), data
   ***/
   BinaryData serialize(void) const;
   static CompiledMessage deserialize(BinaryDataRef);

   //sha256 of the serialized message as lowercase hex, then sha256 of that
   //64 character string, again as lowercase hex
   std::string hashHex(void) const;

   //the ascii bytes of hashHex(), this is what gets signed
   BinaryData hash(void) const;

   bool isSigner(size_t index) const;
   bool isWritable(size_t index) const;
   std::vector<Pubkey> signerKeys(void) const;
};

////////////////////////////////////////////////////////////////////////////////
namespace ArchMessage
{
   /***
   Key order: fee payer, then the other signers in input order, then each
   instruction's accounts followed by its program id. First occurrence wins.

   Throws CompilationError if an account cannot be resolved, if a program id
   lands at index 0 or if there are more than 255 keys.
   ***/
   CompiledMessage compile(const std::vector<Instruction>& instructions,
      const std::vector<Pubkey>& signers, const Pubkey& feePayer,
      const BinaryData& recentBlockhash);
};

#endif
