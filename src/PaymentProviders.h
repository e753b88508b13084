////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_PAYMENT_PROVIDERS_
#define _H_PAYMENT_PROVIDERS_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "JSON_codec.h"
#include "SocketObject.h"

////////////////////////////////////////////////////////////////////////////////
struct PaymentProvider
{
   std::string name_;

   //availability check, must not prompt or spend
   std::function<bool(void)> isAvailable_;

   std::function<void(void)> connect_;

   //pays sats to a btc address, returns the txid (can be empty if the
   //provider cannot tell)
   std::function<std::string(const std::string&, uint64_t)> sendPayment_;
};

////////////////////////////////////////////////////////////////////////////////
class BitcoindPayment
{
private:
   const HttpUrl url_;
   const std::string wallet_;
   std::string basicAuthString64_;

private:
   BitcoindPayment(const std::string& url, const std::string& user,
      const std::string& pass, const std::string& wallet);

   bool setupConnection(HttpSocket&);
   std::shared_ptr<JSON_value> queryRPC(JSON_object&);

   bool testConnection(void);
   std::string sendToAddress(const std::string& address, uint64_t sats);

public:
   //bitcoind json-rpc with basic auth, /wallet/<name> when a wallet is set
   static PaymentProvider getProvider(const std::string& url,
      const std::string& user, const std::string& pass,
      const std::string& wallet);

   //sats as a fixed point btc amount string
   static std::string satsToBtcStr(uint64_t sats);
};

namespace PaymentProviders
{
   //providers for the configured network, in probing order
   std::vector<PaymentProvider> getDefaultProviders(void);

   //first available provider, nullptr if none
   const PaymentProvider* selectProvider(const std::vector<PaymentProvider>&);
};

#endif
