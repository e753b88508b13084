////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <cctype>
#include <sstream>

#include "archRPC.h"
#include "log.h"

using namespace std;
using namespace ArchRPC;

#define NODE_NOT_FOUND_CODE 404

////////////////////////////////////////////////////////////////////////////////
////
//// ArchRPCInterface
////
////////////////////////////////////////////////////////////////////////////////
ArchRPCInterface::~ArchRPCInterface()
{}

////////////////////////////////////////////////////////////////////////////////
////
//// ArchNodeRPC
////
////////////////////////////////////////////////////////////////////////////////
ArchNodeRPC::ArchNodeRPC(const string& rpcUrl) :
   url_(HttpUrl::parse(rpcUrl))
{}

////////////////////////////////////////////////////////////////////////////////
bool ArchNodeRPC::setupConnection(HttpSocket& sock)
{
   //test the socket
   return sock.connectToRemote();
}

////////////////////////////////////////////////////////////////////////////////
string ArchNodeRPC::queryRPC(JSON_object& request)
{
   unique_lock<mutex> lock(mu_);

   HttpSocket sock(url_);
   if (!setupConnection(sock))
   {
      stringstream ss;
      ss << "node_down: " << url_.host_ << ":" << url_.port_;
      throw RpcError(ss.str());
   }

   HttpResponse response;
   try
   {
      response = sock.post(JSON_encode(request));
   }
   catch (SocketError& e)
   {
      throw RpcError(e.what());
   }

   if (!response.isSuccess())
   {
      stringstream ss;
      ss << "http error, status: " << response.status_;
      if (!response.body_.empty())
         ss << ", body: " << response.body_;
      throw RpcError(ss.str());
   }

   return response.body_;
}

////////////////////////////////////////////////////////////////////////////////
JSON_object ArchNodeRPC::decodeResponse(
   const string& response, const string& context)
{
   try
   {
      return JSON_decode(response);
   }
   catch (JSON_Exception& e)
   {
      stringstream ss;
      ss << context << ": malformed response (" << e.what() << ")";
      throw RpcError(ss.str(), ArchErrorCodes::RPCFailure_JSON);
   }
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> ArchNodeRPC::getResult(
   JSON_object& request, const string& context)
{
   auto&& response_obj = decodeResponse(queryRPC(request), context);
   if (!response_obj.isResponseValid(request.id_))
   {
      auto error_ptr = response_obj.getValForKey("error");
      stringstream ss;
      ss << context << " failed";
      if (error_ptr != nullptr && error_ptr->type() != JSON_Type_Null)
         ss << ": " << JSON_serialize(*error_ptr);

      throw RpcError(ss.str());
   }

   return response_obj.getValForKey("result");
}

////////////////////////////////////////////////////////////////////////////////
string ArchNodeRPC::describeTransaction(const RuntimeTransaction& tx)
{
   auto& hdr = tx.message_.header_;

   stringstream ss;
   ss << "{header: " << (unsigned)hdr.numRequiredSignatures_ << "/" <<
      (unsigned)hdr.numReadonlySignedAccounts_ << "/" <<
      (unsigned)hdr.numReadonlyUnsignedAccounts_ <<
      ", keys: " << tx.message_.accountKeys_.size() <<
      ", signatures: " << tx.signatures_.size() << "}";
   return ss.str();
}

////////////////////////////////////////////////////////////////////////////////
bool ArchNodeRPC::isNotFoundError(const JSON_value& error)
{
   auto errorObj = dynamic_cast<const JSON_object*>(&error);
   if (errorObj == nullptr)
      return false;

   auto codePtr = dynamic_pointer_cast<JSON_number>(
      errorObj->getValForKey("code"));
   if (codePtr != nullptr && codePtr->val_ == NODE_NOT_FOUND_CODE)
      return true;

   auto msgPtr = dynamic_pointer_cast<JSON_string>(
      errorObj->getValForKey("message"));
   if (msgPtr == nullptr)
      return false;

   auto msg = msgPtr->val_;
   transform(msg.begin(), msg.end(), msg.begin(), ::tolower);
   return msg.find("not found") != string::npos;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> ArchNodeRPC::getLookupResult(
   const JSON_object& response, unsigned id, const string& context)
{
   if (!response.isResponseValid(id))
   {
      auto error_ptr = response.getValForKey("error");
      if (error_ptr == nullptr || error_ptr->type() == JSON_Type_Null)
      {
         stringstream ss;
         ss << context << ": response carries neither result nor error" <<
            " for request " << id;
         throw RpcError(ss.str(), ArchErrorCodes::RPCFailure_JSON);
      }

      if (isNotFoundError(*error_ptr))
      {
         LOGDEBUG << context << " not found: " << JSON_serialize(*error_ptr);
         return nullptr;
      }

      stringstream ss;
      ss << context << " failed: " << JSON_serialize(*error_ptr);
      LOGERR << ss.str();
      throw RpcError(ss.str());
   }

   auto result = response.getValForKey("result");
   if (result == nullptr || result->type() == JSON_Type_Null)
      return nullptr;

   return result;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<AccountInfo> ArchNodeRPC::readAccountInfo(const Pubkey& pubkey)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "read_account_info");
   json_obj.add_pair("params", JSON_bytes::toJSON(pubkey.getRef()));

   auto&& response_obj = decodeResponse(
      queryRPC(json_obj), "read_account_info");

   auto result = getLookupResult(response_obj, json_obj.id_,
      "read_account_info(" + pubkey.toHexStr() + ")");
   if (result == nullptr)
      return nullptr;

   try
   {
      return make_shared<AccountInfo>(AccountInfo::fromJSON(result));
   }
   catch (JSON_Exception& e)
   {
      throw RpcError(string("read_account_info: ") + e.what(),
         ArchErrorCodes::RPCFailure_JSON);
   }
}

////////////////////////////////////////////////////////////////////////////////
BinaryData ArchNodeRPC::getBestBlockHash()
{
   JSON_object json_obj;
   json_obj.add_pair("method", "get_best_block_hash");

   auto result = getResult(json_obj, "get_best_block_hash");
   auto hashPtr = dynamic_pointer_cast<JSON_string>(result);
   if (hashPtr == nullptr)
   {
      throw RpcError("get_best_block_hash: expected a hex string",
         ArchErrorCodes::RPCFailure_JSON);
   }

   BinaryData hash;
   try
   {
      hash = BinaryData::CreateFromHex(hashPtr->val_);
   }
   catch (runtime_error& e)
   {
      throw RpcError(string("get_best_block_hash: ") + e.what(),
         ArchErrorCodes::RPCFailure_JSON);
   }

   if (hash.getSize() != BLOCKHASH_LENGTH)
   {
      throw RpcError("get_best_block_hash: invalid hash length",
         ArchErrorCodes::RPCFailure_JSON);
   }

   return hash;
}

////////////////////////////////////////////////////////////////////////////////
void ArchNodeRPC::requestAirdrop(const Pubkey& pubkey)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "request_airdrop");
   json_obj.add_pair("params", JSON_bytes::toJSON(pubkey.getRef()));

   getResult(json_obj, "request_airdrop");
   LOGINFO << "requested airdrop for " << pubkey.toHexStr();
}

////////////////////////////////////////////////////////////////////////////////
RuntimeTransaction ArchNodeRPC::createAccountWithFaucet(const Pubkey& pubkey)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "create_account_with_faucet");
   json_obj.add_pair("params", JSON_bytes::toJSON(pubkey.getRef()));

   auto result = getResult(json_obj, "create_account_with_faucet");
   try
   {
      return RuntimeTransaction::fromJSON(result);
   }
   catch (JSON_Exception& e)
   {
      throw RpcError(string("create_account_with_faucet: ") + e.what(),
         ArchErrorCodes::RPCFailure_JSON);
   }
}

////////////////////////////////////////////////////////////////////////////////
string ArchNodeRPC::sendTransaction(const RuntimeTransaction& tx)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "send_transaction");
   json_obj.add_pair("params", tx.toJSON());

   shared_ptr<JSON_value> result;
   try
   {
      result = getResult(json_obj, "send_transaction");
   }
   catch (RpcError& e)
   {
      stringstream ss;
      ss << e.what() << " " << describeTransaction(tx);
      LOGERR << ss.str();
      throw RpcError(ss.str(), e.code());
   }

   auto txidPtr = dynamic_pointer_cast<JSON_string>(result);
   if (txidPtr == nullptr)
   {
      throw RpcError("send_transaction: expected a txid",
         ArchErrorCodes::RPCFailure_JSON);
   }

   return txidPtr->val_;
}

////////////////////////////////////////////////////////////////////////////////
vector<string> ArchNodeRPC::sendTransactions(
   const vector<RuntimeTransaction>& txs)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "send_transactions");

   auto json_array = make_shared<JSON_array>();
   for (auto& tx : txs)
      json_array->add_value(tx.toJSON());
   json_obj.add_pair("params", json_array);

   shared_ptr<JSON_value> result;
   try
   {
      result = getResult(json_obj, "send_transactions");
   }
   catch (RpcError& e)
   {
      stringstream ss;
      ss << e.what() << " (batch of " << txs.size() << ")";
      if (!txs.empty())
         ss << " first tx: " << describeTransaction(txs.front());
      LOGERR << ss.str();
      throw RpcError(ss.str(), e.code());
   }

   auto txidArr = dynamic_pointer_cast<JSON_array>(result);
   if (txidArr == nullptr)
   {
      throw RpcError("send_transactions: expected a txid array",
         ArchErrorCodes::RPCFailure_JSON);
   }

   vector<string> txids;
   for (auto& val : txidArr->values_)
   {
      auto txidPtr = dynamic_pointer_cast<JSON_string>(val);
      if (txidPtr == nullptr)
      {
         throw RpcError("send_transactions: invalid txid entry",
            ArchErrorCodes::RPCFailure_JSON);
      }

      txids.push_back(txidPtr->val_);
   }

   if (txids.size() != txs.size())
   {
      stringstream ss;
      ss << "send_transactions: sent " << txs.size() <<
         " txs, got " << txids.size() << " txids";
      throw RpcError(ss.str(), ArchErrorCodes::RPCFailure_JSON);
   }

   return txids;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<ProcessedTransaction> ArchNodeRPC::getProcessedTransaction(
   const string& txid)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "get_processed_transaction");
   json_obj.add_pair("params", txid);

   auto&& response_obj = decodeResponse(
      queryRPC(json_obj), "get_processed_transaction");

   //not yet indexed is reported either as null or as a not found error
   auto result = getLookupResult(response_obj, json_obj.id_,
      "get_processed_transaction(" + txid + ")");
   if (result == nullptr)
      return nullptr;

   try
   {
      return make_shared<ProcessedTransaction>(
         ProcessedTransaction::fromJSON(result));
   }
   catch (JSON_Exception& e)
   {
      throw RpcError(string("get_processed_transaction: ") + e.what(),
         ArchErrorCodes::RPCFailure_JSON);
   }
}

////////////////////////////////////////////////////////////////////////////////
string ArchNodeRPC::getAccountAddress(const Pubkey& pubkey)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "get_account_address");
   json_obj.add_pair("params", JSON_bytes::toJSON(pubkey.getRef()));

   auto result = getResult(json_obj, "get_account_address");
   auto addrPtr = dynamic_pointer_cast<JSON_string>(result);
   if (addrPtr == nullptr)
   {
      throw RpcError("get_account_address: expected an address string",
         ArchErrorCodes::RPCFailure_JSON);
   }

   return addrPtr->val_;
}
