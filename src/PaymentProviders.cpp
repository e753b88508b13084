////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <iomanip>
#include <sstream>

#include "PaymentProviders.h"
#include "TerminalPaymentPrompt.h"
#include "ArchConfig.h"
#include "BtcUtils.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy::Config;

#define SATS_PER_BTC 100000000ULL

////////////////////////////////////////////////////////////////////////////////
////
//// BitcoindPayment
////
////////////////////////////////////////////////////////////////////////////////
BitcoindPayment::BitcoindPayment(const string& url, const string& user,
   const string& pass, const string& wallet) :
   url_(HttpUrl::parse(url)), wallet_(wallet)
{
   auto authString = user + ":" + pass;
   basicAuthString64_ = BtcUtils::base64_encode(authString);
}

////////////////////////////////////////////////////////////////////////////////
string BitcoindPayment::satsToBtcStr(uint64_t sats)
{
   stringstream ss;
   ss << sats / SATS_PER_BTC << "." <<
      setw(8) << setfill('0') << sats % SATS_PER_BTC;
   return ss.str();
}

////////////////////////////////////////////////////////////////////////////////
bool BitcoindPayment::setupConnection(HttpSocket& sock)
{
   if (!sock.connectToRemote())
      return false;

   stringstream auth_header;
   auth_header << "Authorization: Basic " << basicAuthString64_;
   sock.precacheHttpHeader(auth_header.str());
   return true;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> BitcoindPayment::queryRPC(JSON_object& request)
{
   auto path = url_.path_;
   if (!wallet_.empty())
   {
      if (path.empty() || path.back() != '/')
         path += "/";
      path += "wallet/" + wallet_;
   }

   HttpSocket sock(url_.host_, url_.port_, path);
   if (!setupConnection(sock))
      throw runtime_error("bitcoind is down");

   auto response = sock.post(JSON_encode(request));
   if (response.status_ == 401)
      throw runtime_error("bitcoind rejected the rpc credentials");

   //bitcoind reports rpc errors with http 500 and a json body
   auto&& response_obj = JSON_decode(response.body_);
   if (!response_obj.isResponseValid(request.id_))
   {
      stringstream ss;
      ss << "bitcoind rpc error";
      auto error_ptr = response_obj.getValForKey("error");
      if (error_ptr != nullptr && error_ptr->type() != JSON_Type_Null)
         ss << ": " << JSON_serialize(*error_ptr);
      throw runtime_error(ss.str());
   }

   return response_obj.getValForKey("result");
}

////////////////////////////////////////////////////////////////////////////////
bool BitcoindPayment::testConnection()
{
   JSON_object json_obj;
   json_obj.add_pair("method", "getblockcount");

   try
   {
      auto result = queryRPC(json_obj);
      return dynamic_pointer_cast<JSON_number>(result) != nullptr;
   }
   catch (SocketError& e)
   {
      LOGDEBUG << "bitcoind availability check failed: " << e.what();
   }
   catch (JSON_Exception& e)
   {
      LOGDEBUG << "bitcoind availability check failed: " << e.what();
   }
   catch (runtime_error& e)
   {
      LOGDEBUG << "bitcoind availability check failed: " << e.what();
   }

   return false;
}

////////////////////////////////////////////////////////////////////////////////
string BitcoindPayment::sendToAddress(const string& address, uint64_t sats)
{
   JSON_object json_obj;
   json_obj.add_pair("method", "sendtoaddress");

   auto json_array = make_shared<JSON_array>();
   json_array->add_value(address);
   json_array->add_value(satsToBtcStr(sats));
   json_obj.add_pair("params", json_array);

   auto result = queryRPC(json_obj);
   auto txidPtr = dynamic_pointer_cast<JSON_string>(result);
   if (txidPtr == nullptr)
      throw runtime_error("sendtoaddress did not return a txid");

   LOGINFO << "bitcoind paid " << sats << " sats to " << address <<
      ", txid: " << txidPtr->val_;
   return txidPtr->val_;
}

////////////////////////////////////////////////////////////////////////////////
PaymentProvider BitcoindPayment::getProvider(const string& url,
   const string& user, const string& pass, const string& wallet)
{
   auto ptr = new BitcoindPayment(url, user, pass, wallet);
   shared_ptr<BitcoindPayment> smartPtr(ptr);

   PaymentProvider provider;
   provider.name_ = "bitcoind";
   provider.isAvailable_ = [smartPtr](void)->bool
   {
      return smartPtr->testConnection();
   };

   provider.connect_ = [smartPtr](void)->void
   {
      if (!smartPtr->testConnection())
         throw runtime_error("failed to connect to bitcoind");
   };

   provider.sendPayment_ = [smartPtr](
      const string& address, uint64_t sats)->string
   {
      return smartPtr->sendToAddress(address, sats);
   };

   return provider;
}

////////////////////////////////////////////////////////////////////////////////
////
//// PaymentProviders
////
////////////////////////////////////////////////////////////////////////////////
vector<PaymentProvider> PaymentProviders::getDefaultProviders()
{
   vector<PaymentProvider> providers;

   //a local node can only pay on the regtest backed network
   if (NetworkSettings::mode() == ArchDeploy::NetworkMode::Localnet)
   {
      providers.push_back(BitcoindPayment::getProvider(
         NetworkSettings::btcRpcUrl(),
         NetworkSettings::btcRpcUser(),
         NetworkSettings::btcRpcPass(),
         NetworkSettings::btcWallet()));
   }

   providers.push_back(TerminalPaymentPrompt::getProvider("fee payer"));
   return providers;
}

////////////////////////////////////////////////////////////////////////////////
const PaymentProvider* PaymentProviders::selectProvider(
   const vector<PaymentProvider>& providers)
{
   for (auto& provider : providers)
   {
      if (!provider.isAvailable_)
         continue;

      if (provider.isAvailable_())
      {
         LOGINFO << "using payment provider: " << provider.name_;
         return &provider;
      }

      LOGDEBUG << "payment provider " << provider.name_ << " unavailable";
   }

   return nullptr;
}
