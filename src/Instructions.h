////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

/***
Instruction payload codec for the system and loader programs.

Payload layout: 4 byte LE discriminant, fixed size fields in declaration
order (LE integers, raw 32 byte keys), then variable length byte vectors as
an 8 byte LE length followed by the raw bytes.

The builders return complete instructions carrying the account metas the
on-chain programs expect.
***/

#ifndef _H_INSTRUCTIONS_
#define _H_INSTRUCTIONS_

#include <vector>

#include "BinaryData.h"
#include "Pubkey.h"

////////////////////////////////////////////////////////////////////////////////
struct AccountMeta
{
   Pubkey pubkey_;
   bool isSigner_ = false;
   bool isWritable_ = false;

   AccountMeta(void) {}
   AccountMeta(const Pubkey& pubkey, bool isSigner, bool isWritable) :
      pubkey_(pubkey), isSigner_(isSigner), isWritable_(isWritable)
   {}
};

////////////////////////////////////////////////////////////////////////////////
struct Instruction
{
   Pubkey programId_;
   std::vector<AccountMeta> accounts_;
   BinaryData data_;
};

////////////////////////////////////////////////////////////////////////////////
enum class LoaderInstructionType : uint32_t
{
   Write             = 0,
   Truncate          = 1,
   Deploy            = 2,
   Retract           = 3,
   TransferAuthority = 4
};

////
struct LoaderInstruction
{
   LoaderInstructionType type_ = LoaderInstructionType::Deploy;

   //Write
   uint32_t offset_ = 0;
   BinaryData bytes_;

   //Truncate
   uint32_t newSize_ = 0;

   //TransferAuthority
   Pubkey newAuthority_;

   BinaryData serialize(void) const;

   //throws runtime_error on unknown discriminants and malformed payloads
   static LoaderInstruction decode(BinaryDataRef);

   static Instruction write(const Pubkey& program, const Pubkey& authority,
      uint32_t offset, BinaryDataRef bytes);
   static Instruction truncate(const Pubkey& program, const Pubkey& authority,
      uint32_t newSize);
   static Instruction deploy(const Pubkey& program, const Pubkey& authority);
   static Instruction retract(const Pubkey& program, const Pubkey& authority);
   static Instruction transferAuthority(const Pubkey& program,
      const Pubkey& authority, const Pubkey& newAuthority);
};

////////////////////////////////////////////////////////////////////////////////
enum class SystemInstructionType : uint32_t
{
   CreateAccount  = 0,
   Assign         = 2,
   Transfer       = 3
};

////
struct SystemInstruction
{
   SystemInstructionType type_ = SystemInstructionType::Transfer;

   uint64_t lamports_ = 0;
   uint64_t space_ = 0;
   Pubkey owner_;

   BinaryData serialize(void) const;
   static SystemInstruction decode(BinaryDataRef);

   static Instruction createAccount(const Pubkey& from, const Pubkey& to,
      uint64_t lamports, uint64_t space, const Pubkey& owner);
   static Instruction assign(const Pubkey& account, const Pubkey& owner);
   static Instruction transfer(const Pubkey& from, const Pubkey& to,
      uint64_t lamports);

   //lamports an account of this data size needs to be rent exempt
   static uint64_t minimumRent(size_t dataSize);
};

#endif
