////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <sstream>

#include "Instructions.h"

using namespace std;

#define RENT_ACCOUNT_OVERHEAD 128
#define RENT_LAMPORTS_PER_BYTE 2

////////////////////////////////////////////////////////////////////////////////
static void checkEndOfStream(const BinaryRefReader& brr, const char* name)
{
   if (brr.isEndOfStream())
      return;

   stringstream ss;
   ss << name << " payload has " << brr.getSizeRemaining() <<
      " trailing bytes";
   throw runtime_error(ss.str());
}

////////////////////////////////////////////////////////////////////////////////
////
//// LoaderInstruction
////
////////////////////////////////////////////////////////////////////////////////
BinaryData LoaderInstruction::serialize() const
{
   BinaryWriter bw;
   bw.put_uint32_t((uint32_t)type_);

   switch (type_)
   {
   case LoaderInstructionType::Write:
      bw.put_uint32_t(offset_);
      bw.put_uint64_t(bytes_.getSize());
      bw.put_BinaryData(bytes_);
      break;

   case LoaderInstructionType::Truncate:
      bw.put_uint32_t(newSize_);
      break;

   case LoaderInstructionType::TransferAuthority:
      bw.put_BinaryData(newAuthority_.getBytes());
      break;

   case LoaderInstructionType::Deploy:
   case LoaderInstructionType::Retract:
      break;

   default:
      throw runtime_error("unknown loader instruction type");
   }

   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
LoaderInstruction LoaderInstruction::decode(BinaryDataRef data)
{
   BinaryRefReader brr(data);
   LoaderInstruction result;

   auto type = brr.get_uint32_t();
   switch (type)
   {
   case (uint32_t)LoaderInstructionType::Write:
   {
      result.offset_ = brr.get_uint32_t();
      auto len = brr.get_uint64_t();
      if (len > brr.getSizeRemaining())
         throw runtime_error("write payload length exceeds instruction data");
      result.bytes_ = brr.get_BinaryData(len);
      break;
   }

   case (uint32_t)LoaderInstructionType::Truncate:
      result.newSize_ = brr.get_uint32_t();
      break;

   case (uint32_t)LoaderInstructionType::TransferAuthority:
      result.newAuthority_ = Pubkey(brr.get_BinaryDataRef(PUBKEY_LENGTH));
      break;

   case (uint32_t)LoaderInstructionType::Deploy:
   case (uint32_t)LoaderInstructionType::Retract:
      break;

   default:
   {
      stringstream ss;
      ss << "unknown loader instruction discriminant: " << type;
      throw runtime_error(ss.str());
   }
   }

   result.type_ = (LoaderInstructionType)type;
   checkEndOfStream(brr, "loader instruction");
   return result;
}

////////////////////////////////////////////////////////////////////////////////
Instruction LoaderInstruction::write(const Pubkey& program,
   const Pubkey& authority, uint32_t offset, BinaryDataRef bytes)
{
   LoaderInstruction li;
   li.type_ = LoaderInstructionType::Write;
   li.offset_ = offset;
   li.bytes_ = bytes.copy();

   Instruction instr;
   instr.programId_ = Pubkey::loaderProgram();
   instr.accounts_.emplace_back(program, false, true);
   instr.accounts_.emplace_back(authority, true, false);
   instr.data_ = li.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction LoaderInstruction::truncate(const Pubkey& program,
   const Pubkey& authority, uint32_t newSize)
{
   LoaderInstruction li;
   li.type_ = LoaderInstructionType::Truncate;
   li.newSize_ = newSize;

   //a resize may grow the account, the program key has to sign for it
   Instruction instr;
   instr.programId_ = Pubkey::loaderProgram();
   instr.accounts_.emplace_back(program, true, true);
   instr.accounts_.emplace_back(authority, true, false);
   instr.data_ = li.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction LoaderInstruction::deploy(const Pubkey& program,
   const Pubkey& authority)
{
   LoaderInstruction li;
   li.type_ = LoaderInstructionType::Deploy;

   Instruction instr;
   instr.programId_ = Pubkey::loaderProgram();
   instr.accounts_.emplace_back(program, false, true);
   instr.accounts_.emplace_back(authority, true, false);
   instr.data_ = li.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction LoaderInstruction::retract(const Pubkey& program,
   const Pubkey& authority)
{
   LoaderInstruction li;
   li.type_ = LoaderInstructionType::Retract;

   Instruction instr;
   instr.programId_ = Pubkey::loaderProgram();
   instr.accounts_.emplace_back(program, false, true);
   instr.accounts_.emplace_back(authority, true, false);
   instr.data_ = li.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction LoaderInstruction::transferAuthority(const Pubkey& program,
   const Pubkey& authority, const Pubkey& newAuthority)
{
   LoaderInstruction li;
   li.type_ = LoaderInstructionType::TransferAuthority;
   li.newAuthority_ = newAuthority;

   Instruction instr;
   instr.programId_ = Pubkey::loaderProgram();
   instr.accounts_.emplace_back(program, false, true);
   instr.accounts_.emplace_back(authority, true, false);
   instr.data_ = li.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
////
//// SystemInstruction
////
////////////////////////////////////////////////////////////////////////////////
BinaryData SystemInstruction::serialize() const
{
   BinaryWriter bw;
   bw.put_uint32_t((uint32_t)type_);

   switch (type_)
   {
   case SystemInstructionType::CreateAccount:
      bw.put_uint64_t(lamports_);
      bw.put_uint64_t(space_);
      bw.put_BinaryData(owner_.getBytes());
      break;

   case SystemInstructionType::Assign:
      bw.put_BinaryData(owner_.getBytes());
      break;

   case SystemInstructionType::Transfer:
      bw.put_uint64_t(lamports_);
      break;

   default:
      throw runtime_error("unknown system instruction type");
   }

   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
SystemInstruction SystemInstruction::decode(BinaryDataRef data)
{
   BinaryRefReader brr(data);
   SystemInstruction result;

   auto type = brr.get_uint32_t();
   switch (type)
   {
   case (uint32_t)SystemInstructionType::CreateAccount:
      result.lamports_ = brr.get_uint64_t();
      result.space_ = brr.get_uint64_t();
      result.owner_ = Pubkey(brr.get_BinaryDataRef(PUBKEY_LENGTH));
      break;

   case (uint32_t)SystemInstructionType::Assign:
      result.owner_ = Pubkey(brr.get_BinaryDataRef(PUBKEY_LENGTH));
      break;

   case (uint32_t)SystemInstructionType::Transfer:
      result.lamports_ = brr.get_uint64_t();
      break;

   default:
   {
      stringstream ss;
      ss << "unknown system instruction discriminant: " << type;
      throw runtime_error(ss.str());
   }
   }

   result.type_ = (SystemInstructionType)type;
   checkEndOfStream(brr, "system instruction");
   return result;
}

////////////////////////////////////////////////////////////////////////////////
Instruction SystemInstruction::createAccount(const Pubkey& from,
   const Pubkey& to, uint64_t lamports, uint64_t space, const Pubkey& owner)
{
   SystemInstruction si;
   si.type_ = SystemInstructionType::CreateAccount;
   si.lamports_ = lamports;
   si.space_ = space;
   si.owner_ = owner;

   Instruction instr;
   instr.programId_ = Pubkey::systemProgram();
   instr.accounts_.emplace_back(from, true, true);
   instr.accounts_.emplace_back(to, true, true);
   instr.data_ = si.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction SystemInstruction::assign(const Pubkey& account,
   const Pubkey& owner)
{
   SystemInstruction si;
   si.type_ = SystemInstructionType::Assign;
   si.owner_ = owner;

   Instruction instr;
   instr.programId_ = Pubkey::systemProgram();
   instr.accounts_.emplace_back(account, true, true);
   instr.data_ = si.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
Instruction SystemInstruction::transfer(const Pubkey& from,
   const Pubkey& to, uint64_t lamports)
{
   SystemInstruction si;
   si.type_ = SystemInstructionType::Transfer;
   si.lamports_ = lamports;

   Instruction instr;
   instr.programId_ = Pubkey::systemProgram();
   instr.accounts_.emplace_back(from, true, true);
   instr.accounts_.emplace_back(to, false, true);
   instr.data_ = si.serialize();
   return instr;
}

////////////////////////////////////////////////////////////////////////////////
uint64_t SystemInstruction::minimumRent(size_t dataSize)
{
   return (RENT_ACCOUNT_OVERHEAD + (uint64_t)dataSize) * RENT_LAMPORTS_PER_BYTE;
}
