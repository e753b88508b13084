////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

/***
Runtime transaction and account wire models, with their json-rpc
representation. Byte buffers travel as json arrays of numbers.
***/

#ifndef _H_RUNTIME_TRANSACTION_
#define _H_RUNTIME_TRANSACTION_

#include <memory>
#include <string>
#include <vector>

#include "ArchMessage.h"
#include "JSON_codec.h"

////////////////////////////////////////////////////////////////////////////////
namespace JSON_bytes
{
   std::shared_ptr<JSON_array> toJSON(BinaryDataRef);

   //throws JSON_Exception unless the value is an array of bytes
   BinaryData fromJSON(std::shared_ptr<JSON_value>);
};

////////////////////////////////////////////////////////////////////////////////
struct RuntimeTransaction
{
   uint32_t version_ = 0;
   std::vector<BinaryData> signatures_;
   CompiledMessage message_;

   //version (u32), signature count (u32), signatures, message
   BinaryData serialize(void) const;

   std::shared_ptr<JSON_object> toJSON(void) const;
   static RuntimeTransaction fromJSON(std::shared_ptr<JSON_value>);

   std::string getTxid(void) const { return message_.hashHex(); }
};

////////////////////////////////////////////////////////////////////////////////
struct AccountInfo
{
   uint64_t lamports_ = 0;
   Pubkey owner_;
   BinaryData data_;
   bool isExecutable_ = false;
   std::string utxo_;

   std::shared_ptr<JSON_object> toJSON(void) const;
   static AccountInfo fromJSON(std::shared_ptr<JSON_value>);
};

////////////////////////////////////////////////////////////////////////////////
enum class TxStatus
{
   Queued,
   Processed,
   Failed
};

////
struct ProcessedTransaction
{
   TxStatus status_ = TxStatus::Queued;
   std::string failureMessage_;
   std::shared_ptr<RuntimeTransaction> runtimeTx_;

   std::shared_ptr<JSON_object> toJSON(void) const;
   static ProcessedTransaction fromJSON(std::shared_ptr<JSON_value>);
};

#endif
