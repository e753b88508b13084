////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <map>
#include <set>
#include <sstream>

#include "ArchMessage.h"
#include "ArchErrors.h"
#include "BtcUtils.h"
#include "log.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
////
//// CompiledMessage
////
////////////////////////////////////////////////////////////////////////////////
BinaryData CompiledMessage::serialize() const
{
   if (recentBlockhash_.getSize() != BLOCKHASH_LENGTH)
      throw runtime_error("invalid recent blockhash length");

   BinaryWriter bw;
   bw.put_uint8_t(header_.numRequiredSignatures_);
   bw.put_uint8_t(header_.numReadonlySignedAccounts_);
   bw.put_uint8_t(header_.numReadonlyUnsignedAccounts_);

   bw.put_uint32_t(accountKeys_.size());
   for (auto& key : accountKeys_)
      bw.put_BinaryData(key.getBytes());

   bw.put_BinaryData(recentBlockhash_);

   bw.put_uint32_t(instructions_.size());
   for (auto& instr : instructions_)
   {
      bw.put_uint8_t(instr.programIdIndex_);

      bw.put_uint32_t(instr.accounts_.size());
      for (auto& index : instr.accounts_)
         bw.put_uint8_t(index);

      bw.put_uint32_t(instr.data_.getSize());
      bw.put_BinaryData(instr.data_);
   }

   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
CompiledMessage CompiledMessage::deserialize(BinaryDataRef data)
{
   BinaryRefReader brr(data);
   CompiledMessage msg;

   msg.header_.numRequiredSignatures_ = brr.get_uint8_t();
   msg.header_.numReadonlySignedAccounts_ = brr.get_uint8_t();
   msg.header_.numReadonlyUnsignedAccounts_ = brr.get_uint8_t();

   auto keyCount = brr.get_uint32_t();
   if ((size_t)keyCount * PUBKEY_LENGTH > brr.getSizeRemaining())
      throw runtime_error("key count exceeds message size");

   for (uint32_t i = 0; i < keyCount; i++)
      msg.accountKeys_.emplace_back(brr.get_BinaryDataRef(PUBKEY_LENGTH));

   msg.recentBlockhash_ = brr.get_BinaryData(BLOCKHASH_LENGTH);

   auto instrCount = brr.get_uint32_t();
   for (uint32_t i = 0; i < instrCount; i++)
   {
      SanitizedInstruction instr;
      instr.programIdIndex_ = brr.get_uint8_t();

      auto accountCount = brr.get_uint32_t();
      if (accountCount > brr.getSizeRemaining())
         throw runtime_error("account count exceeds message size");
      for (uint32_t y = 0; y < accountCount; y++)
         instr.accounts_.push_back(brr.get_uint8_t());

      auto dataLen = brr.get_uint32_t();
      instr.data_ = brr.get_BinaryData(dataLen);
      msg.instructions_.push_back(move(instr));
   }

   if (!brr.isEndOfStream())
      throw runtime_error("trailing bytes after message");

   return msg;
}

////////////////////////////////////////////////////////////////////////////////
string CompiledMessage::hashHex() const
{
   auto firstHex = BtcUtils::getSha256Hex(serialize());
   return BtcUtils::getSha256Hex(BinaryData::fromString(firstHex));
}

////////////////////////////////////////////////////////////////////////////////
BinaryData CompiledMessage::hash() const
{
   return BinaryData::fromString(hashHex());
}

////////////////////////////////////////////////////////////////////////////////
bool CompiledMessage::isSigner(size_t index) const
{
   return index < header_.numRequiredSignatures_;
}

////////////////////////////////////////////////////////////////////////////////
bool CompiledMessage::isWritable(size_t index) const
{
   //the last readonly counts of each slice are readonly
   size_t required = header_.numRequiredSignatures_;
   size_t roSigned = header_.numReadonlySignedAccounts_;
   size_t roUnsigned = header_.numReadonlyUnsignedAccounts_;

   if (index < required)
      return roSigned <= required && index < required - roSigned;

   if (index >= accountKeys_.size() || roUnsigned > accountKeys_.size())
      return false;

   return index < accountKeys_.size() - roUnsigned;
}

////////////////////////////////////////////////////////////////////////////////
vector<Pubkey> CompiledMessage::signerKeys() const
{
   vector<Pubkey> result;
   for (size_t i = 0; i < header_.numRequiredSignatures_ &&
      i < accountKeys_.size(); i++)
   {
      result.push_back(accountKeys_[i]);
   }

   return result;
}

////////////////////////////////////////////////////////////////////////////////
////
//// ArchMessage
////
////////////////////////////////////////////////////////////////////////////////
CompiledMessage ArchMessage::compile(
   const vector<Instruction>& instructions, const vector<Pubkey>& signers,
   const Pubkey& feePayer, const BinaryData& recentBlockhash)
{
   if (recentBlockhash.getSize() != BLOCKHASH_LENGTH)
      throw CompilationError("invalid recent blockhash length");

   CompiledMessage msg;
   msg.recentBlockhash_ = recentBlockhash;

   map<Pubkey, size_t> keyIndexes;
   auto addKey = [&msg, &keyIndexes](const Pubkey& key)->void
   {
      if (keyIndexes.find(key) != keyIndexes.end())
         return;

      keyIndexes.insert(make_pair(key, msg.accountKeys_.size()));
      msg.accountKeys_.push_back(key);
   };

   //signers, fee payer first
   addKey(feePayer);
   for (auto& signer : signers)
      addKey(signer);
   auto signerCount = msg.accountKeys_.size();

   //accounts then program id, per instruction
   set<Pubkey> programIds;
   set<Pubkey> writableKeys;
   writableKeys.insert(feePayer);
   for (auto& instr : instructions)
   {
      for (auto& meta : instr.accounts_)
      {
         addKey(meta.pubkey_);
         if (meta.isWritable_)
            writableKeys.insert(meta.pubkey_);
      }

      addKey(instr.programId_);
      programIds.insert(instr.programId_);
   }

   if (msg.accountKeys_.size() > MAX_ACCOUNT_KEYS)
   {
      stringstream ss;
      ss << "too many account keys: " << msg.accountKeys_.size();
      throw CompilationError(ss.str());
   }

   //header
   unsigned readonlySigned = 0;
   for (size_t i = 0; i < signerCount; i++)
   {
      if (writableKeys.find(msg.accountKeys_[i]) == writableKeys.end())
         ++readonlySigned;
   }

   msg.header_.numRequiredSignatures_ = (uint8_t)signerCount;
   msg.header_.numReadonlySignedAccounts_ = (uint8_t)readonlySigned;
   msg.header_.numReadonlyUnsignedAccounts_ = (uint8_t)programIds.size();

   //resolve indexes
   auto resolve = [&keyIndexes](const Pubkey& key)->uint8_t
   {
      auto iter = keyIndexes.find(key);
      if (iter == keyIndexes.end())
         throw CompilationError("unresolved account key " + key.toHexStr());

      return (uint8_t)iter->second;
   };

   for (auto& instr : instructions)
   {
      SanitizedInstruction si;
      si.programIdIndex_ = resolve(instr.programId_);
      if (si.programIdIndex_ == 0)
      {
         throw CompilationError(
            "program id cannot be the fee payer: " + instr.programId_.toHexStr());
      }

      for (auto& meta : instr.accounts_)
         si.accounts_.push_back(resolve(meta.pubkey_));

      si.data_ = instr.data_;
      msg.instructions_.push_back(move(si));
   }

   return msg;
}
