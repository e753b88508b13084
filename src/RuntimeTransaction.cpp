////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "RuntimeTransaction.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
template<typename T> static shared_ptr<T> getField(
   const JSON_object& obj, const string& key)
{
   auto val = dynamic_pointer_cast<T>(obj.getValForKey(key));
   if (val == nullptr)
      throw JSON_Exception("missing or invalid field: " + key);

   return val;
}

////////////////////////////////////////////////////////////////////////////////
static uint64_t getUintField(const JSON_object& obj, const string& key)
{
   return getField<JSON_number>(obj, key)->getUint64();
}

////////////////////////////////////////////////////////////////////////////////
static uint8_t toByte(shared_ptr<JSON_value> val)
{
   auto numPtr = dynamic_pointer_cast<JSON_number>(val);
   if (numPtr == nullptr)
      throw JSON_Exception("expected a number");

   auto num = numPtr->getUint64();
   if (num > 255)
      throw JSON_Exception("byte value out of range");

   return (uint8_t)num;
}

////////////////////////////////////////////////////////////////////////////////
////
//// JSON_bytes
////
////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_array> JSON_bytes::toJSON(BinaryDataRef bdr)
{
   auto arr = make_shared<JSON_array>();
   arr->values_.reserve(bdr.getSize());
   for (size_t i = 0; i < bdr.getSize(); i++)
      arr->add_value((unsigned)bdr[i]);

   return arr;
}

////////////////////////////////////////////////////////////////////////////////
BinaryData JSON_bytes::fromJSON(shared_ptr<JSON_value> val)
{
   auto arr = dynamic_pointer_cast<JSON_array>(val);
   if (arr == nullptr)
      throw JSON_Exception("expected a byte array");

   BinaryData result(arr->size());
   for (size_t i = 0; i < arr->size(); i++)
      result[i] = toByte(arr->values_[i]);

   return result;
}

////////////////////////////////////////////////////////////////////////////////
////
//// RuntimeTransaction
////
////////////////////////////////////////////////////////////////////////////////
BinaryData RuntimeTransaction::serialize() const
{
   BinaryWriter bw;
   bw.put_uint32_t(version_);
   bw.put_uint32_t(signatures_.size());
   for (auto& sig : signatures_)
      bw.put_BinaryData(sig);
   bw.put_BinaryData(message_.serialize());

   return bw.getData();
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_object> RuntimeTransaction::toJSON() const
{
   //header
   auto header = make_shared<JSON_object>();
   header->add_pair("num_required_signatures",
      (unsigned)message_.header_.numRequiredSignatures_);
   header->add_pair("num_readonly_signed_accounts",
      (unsigned)message_.header_.numReadonlySignedAccounts_);
   header->add_pair("num_readonly_unsigned_accounts",
      (unsigned)message_.header_.numReadonlyUnsignedAccounts_);

   //keys
   auto keys = make_shared<JSON_array>();
   for (auto& key : message_.accountKeys_)
      keys->add_value(JSON_bytes::toJSON(key.getRef()));

   //instructions
   auto instructions = make_shared<JSON_array>();
   for (auto& instr : message_.instructions_)
   {
      auto instrObj = make_shared<JSON_object>();
      instrObj->add_pair("program_id_index", (unsigned)instr.programIdIndex_);

      auto accounts = make_shared<JSON_array>();
      for (auto& index : instr.accounts_)
         accounts->add_value((unsigned)index);
      instrObj->add_pair("accounts", accounts);

      instrObj->add_pair("data", JSON_bytes::toJSON(instr.data_.getRef()));
      instructions->add_value(instrObj);
   }

   auto message = make_shared<JSON_object>();
   message->add_pair("header", header);
   message->add_pair("account_keys", keys);
   message->add_pair("recent_blockhash",
      JSON_bytes::toJSON(message_.recentBlockhash_.getRef()));
   message->add_pair("instructions", instructions);

   //signatures
   auto sigs = make_shared<JSON_array>();
   for (auto& sig : signatures_)
      sigs->add_value(JSON_bytes::toJSON(sig.getRef()));

   auto tx = make_shared<JSON_object>();
   tx->add_pair("version", (unsigned)version_);
   tx->add_pair("signatures", sigs);
   tx->add_pair("message", message);

   return tx;
}

////////////////////////////////////////////////////////////////////////////////
RuntimeTransaction RuntimeTransaction::fromJSON(shared_ptr<JSON_value> val)
{
   auto txObj = dynamic_pointer_cast<JSON_object>(val);
   if (txObj == nullptr)
      throw JSON_Exception("expected a transaction object");

   RuntimeTransaction tx;
   tx.version_ = (uint32_t)getUintField(*txObj, "version");

   auto sigs = getField<JSON_array>(*txObj, "signatures");
   for (auto& sig : sigs->values_)
      tx.signatures_.push_back(JSON_bytes::fromJSON(sig));

   auto message = getField<JSON_object>(*txObj, "message");
   auto header = getField<JSON_object>(*message, "header");

   auto& hdr = tx.message_.header_;
   hdr.numRequiredSignatures_ = toByte(
      header->getValForKey("num_required_signatures"));
   hdr.numReadonlySignedAccounts_ = toByte(
      header->getValForKey("num_readonly_signed_accounts"));
   hdr.numReadonlyUnsignedAccounts_ = toByte(
      header->getValForKey("num_readonly_unsigned_accounts"));

   auto keys = getField<JSON_array>(*message, "account_keys");
   for (auto& key : keys->values_)
   {
      auto keyBytes = JSON_bytes::fromJSON(key);
      if (keyBytes.getSize() != PUBKEY_LENGTH)
         throw JSON_Exception("invalid account key length");
      tx.message_.accountKeys_.emplace_back(keyBytes.getRef());
   }

   tx.message_.recentBlockhash_ = JSON_bytes::fromJSON(
      message->getValForKey("recent_blockhash"));
   if (tx.message_.recentBlockhash_.getSize() != BLOCKHASH_LENGTH)
      throw JSON_Exception("invalid recent blockhash length");

   auto instructions = getField<JSON_array>(*message, "instructions");
   for (auto& instrVal : instructions->values_)
   {
      auto instrObj = dynamic_pointer_cast<JSON_object>(instrVal);
      if (instrObj == nullptr)
         throw JSON_Exception("expected an instruction object");

      SanitizedInstruction instr;
      instr.programIdIndex_ = toByte(
         instrObj->getValForKey("program_id_index"));

      auto accounts = getField<JSON_array>(*instrObj, "accounts");
      for (auto& index : accounts->values_)
         instr.accounts_.push_back(toByte(index));

      instr.data_ = JSON_bytes::fromJSON(instrObj->getValForKey("data"));
      tx.message_.instructions_.push_back(move(instr));
   }

   return tx;
}

////////////////////////////////////////////////////////////////////////////////
////
//// AccountInfo
////
////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_object> AccountInfo::toJSON() const
{
   auto obj = make_shared<JSON_object>();
   obj->add_pair("lamports", lamports_);
   obj->add_pair("owner", JSON_bytes::toJSON(owner_.getRef()));
   obj->add_pair("data", JSON_bytes::toJSON(data_.getRef()));
   obj->add_pair("is_executable", isExecutable_);
   obj->add_pair("utxo", utxo_);

   return obj;
}

////////////////////////////////////////////////////////////////////////////////
AccountInfo AccountInfo::fromJSON(shared_ptr<JSON_value> val)
{
   auto obj = dynamic_pointer_cast<JSON_object>(val);
   if (obj == nullptr)
      throw JSON_Exception("expected an account object");

   AccountInfo info;
   info.lamports_ = getUintField(*obj, "lamports");

   auto owner = JSON_bytes::fromJSON(obj->getValForKey("owner"));
   if (owner.getSize() != PUBKEY_LENGTH)
      throw JSON_Exception("invalid owner length");
   info.owner_ = Pubkey(owner.getRef());

   info.data_ = JSON_bytes::fromJSON(obj->getValForKey("data"));
   info.isExecutable_ = getField<JSON_bool>(*obj, "is_executable")->val_;

   auto utxo = dynamic_pointer_cast<JSON_string>(obj->getValForKey("utxo"));
   if (utxo != nullptr)
      info.utxo_ = utxo->val_;

   return info;
}

////////////////////////////////////////////////////////////////////////////////
////
//// ProcessedTransaction
////
////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_object> ProcessedTransaction::toJSON() const
{
   auto obj = make_shared<JSON_object>();
   switch (status_)
   {
   case TxStatus::Queued:
      obj->add_pair("status", "Queued");
      break;

   case TxStatus::Processed:
      obj->add_pair("status", "Processed");
      break;

   case TxStatus::Failed:
   {
      auto failed = make_shared<JSON_object>();
      failed->add_pair("Failed", failureMessage_);
      obj->add_pair("status", failed);
      break;
   }
   }

   if (runtimeTx_ != nullptr)
      obj->add_pair("runtime_transaction", runtimeTx_->toJSON());
   else
      obj->add_pair("runtime_transaction", make_shared<JSON_null>());

   return obj;
}

////////////////////////////////////////////////////////////////////////////////
ProcessedTransaction ProcessedTransaction::fromJSON(shared_ptr<JSON_value> val)
{
   auto obj = dynamic_pointer_cast<JSON_object>(val);
   if (obj == nullptr)
      throw JSON_Exception("expected a processed transaction object");

   ProcessedTransaction ptx;

   auto statusVal = obj->getValForKey("status");
   auto statusStr = dynamic_pointer_cast<JSON_string>(statusVal);
   if (statusStr != nullptr)
   {
      if (statusStr->val_ == "Processed")
         ptx.status_ = TxStatus::Processed;
      else if (statusStr->val_ == "Queued")
         ptx.status_ = TxStatus::Queued;
      else if (statusStr->val_ == "Failed")
         ptx.status_ = TxStatus::Failed;
      else
         throw JSON_Exception("unknown tx status: " + statusStr->val_);
   }
   else
   {
      //{"Failed": "reason"}
      auto statusObj = dynamic_pointer_cast<JSON_object>(statusVal);
      if (statusObj == nullptr)
         throw JSON_Exception("missing tx status");

      auto failed = statusObj->getValForKey("Failed");
      if (failed == nullptr)
         throw JSON_Exception("unknown tx status object");

      ptx.status_ = TxStatus::Failed;
      auto failedStr = dynamic_pointer_cast<JSON_string>(failed);
      if (failedStr != nullptr)
         ptx.failureMessage_ = failedStr->val_;
      else
         ptx.failureMessage_ = JSON_serialize(*failed);
   }

   auto rtx = obj->getValForKey("runtime_transaction");
   if (rtx != nullptr && rtx->type() == JSON_Type_Object)
   {
      ptx.runtimeTx_ = make_shared<RuntimeTransaction>(
         RuntimeTransaction::fromJSON(rtx));
   }

   return ptx;
}
