////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_ARCHRPC_
#define _H_ARCHRPC_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ArchErrors.h"
#include "JSON_codec.h"
#include "RuntimeTransaction.h"
#include "SocketObject.h"

namespace ArchRPC
{

////
class RpcError : public ArchError
{
public:
   RpcError(void) :
      ArchError("RpcError", ArchErrorCodes::RPCFailure_Unknown)
   {}

   RpcError(const std::string& err,
      ArchErrorCodes code = ArchErrorCodes::RPCFailure_Internal) :
      ArchError(err, code)
   {}
};

////////////////////////////////////////////////////////////////////////////////
class ArchRPCInterface
{
public:
   virtual ~ArchRPCInterface(void) = 0;

   //nullptr if the account does not exist
   virtual std::shared_ptr<AccountInfo> readAccountInfo(const Pubkey&) = 0;

   //32 byte hash
   virtual BinaryData getBestBlockHash(void) = 0;

   virtual void requestAirdrop(const Pubkey&) = 0;

   //faucet tx creating and funding the account, signed by the faucet
   virtual RuntimeTransaction createAccountWithFaucet(const Pubkey&) = 0;

   //returns the txid
   virtual std::string sendTransaction(const RuntimeTransaction&) = 0;
   virtual std::vector<std::string> sendTransactions(
      const std::vector<RuntimeTransaction>&) = 0;

   //nullptr while the node has not seen the tx
   virtual std::shared_ptr<ProcessedTransaction> getProcessedTransaction(
      const std::string& txid) = 0;

   //bitcoin address funding this account
   virtual std::string getAccountAddress(const Pubkey&) = 0;
};

////////////////////////////////////////////////////////////////////////////////
class ArchNodeRPC : public ArchRPCInterface
{
private:
   const HttpUrl url_;
   std::mutex mu_;

private:
   bool setupConnection(HttpSocket&);

   std::string queryRPC(JSON_object&);
   static JSON_object decodeResponse(
      const std::string& response, const std::string& context);
   std::shared_ptr<JSON_value> getResult(
      JSON_object& request, const std::string& context);

public:
   //rpcUrl is http://host:port[/path]
   ArchNodeRPC(const std::string& rpcUrl);

   //virtuals
   std::shared_ptr<AccountInfo> readAccountInfo(const Pubkey&) override;
   BinaryData getBestBlockHash(void) override;
   void requestAirdrop(const Pubkey&) override;
   RuntimeTransaction createAccountWithFaucet(const Pubkey&) override;
   std::string sendTransaction(const RuntimeTransaction&) override;
   std::vector<std::string> sendTransactions(
      const std::vector<RuntimeTransaction>&) override;
   std::shared_ptr<ProcessedTransaction> getProcessedTransaction(
      const std::string& txid) override;
   std::string getAccountAddress(const Pubkey&) override;

   //header counts, key count and signature count, for error reports
   static std::string describeTransaction(const RuntimeTransaction&);

   //node error for an unknown account or txid: code 404 or a
   //"not found" message
   static bool isNotFoundError(const JSON_value&);

   //result of a lookup: nullptr for a null result or a not found error,
   //throws RpcError on any other error
   static std::shared_ptr<JSON_value> getLookupResult(
      const JSON_object& response, unsigned id, const std::string& context);
};

}; //namespace ArchRPC

#endif
