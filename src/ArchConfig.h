////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

/*general config for the deployment client*/

#ifndef _H_ARCHCONFIG_
#define _H_ARCHCONFIG_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>

#include "BinaryData.h"

#define ARCH_DEFAULT_RPC_URL     "http://localhost:9002"
#define BTC_DEFAULT_RPC_URL      "http://localhost:18443"
#define BTC_DEFAULT_RPC_USER     "bitcoin"
#define BTC_DEFAULT_RPC_PASS     "bitcoin"
#define DEFAULT_FUNDING_SATS     5000

#define DEFAULT_TX_CEILING       10240
#define DEFAULT_TX_INFLATION     8
#define DEFAULT_MIN_CHUNK        1000
#define DEFAULT_BATCH_SIZE       100
#define DEFAULT_BLOCKHASH_REFRESH 5
#define DEFAULT_POLL_INTERVAL_MS 1000
#define DEFAULT_POLL_TIMEOUT_MS  30000

#define CONFIG_FILE_NAME "archdeploy.conf"

namespace ArchDeploy
{
   ////
   enum class NetworkMode
   {
      Mainnet,
      Testnet,
      Devnet,
      Localnet
   };

   namespace Config
   {
      class Error : public std::runtime_error
      {
      public:
         Error(const std::string& err) :
            std::runtime_error(err)
         {}
      };

      //////////////////////////////////////////////////////////////////////////
      namespace SettingsUtils
      {
         std::vector<std::string> getLines(const std::string& path);
         std::map<std::string, std::string> getKeyValsFromLines(
            const std::vector<std::string>&, char delim);
         std::pair<std::string, std::string> getKeyValFromLine(
            const std::string&, char delim);

         std::string stripQuotes(const std::string& input);
         std::vector<std::string> keyValToArgv(
            const std::map<std::string, std::string>&);
         std::vector<std::string> tokenizeLine(
            const std::string&, const std::string&);

         bool fileExists(const std::string&, int);
         void expandPath(std::string&);
         void appendPath(std::string& base, const std::string& add);

         unsigned getUnsigned(const std::map<std::string, std::string>&,
            const std::string& key, unsigned defaultVal);
      };

      //////////////////////////////////////////////////////////////////////////
      void printHelp(void);
      void parseArgs(int, char**);
      void parseArgs(const std::vector<std::string>&);
      const std::string& getDataDir(void);
      void reset(void);

      //positional args and unrecognized --keys, for the cli commands
      const std::vector<std::string>& positionalArgs(void);
      std::string getArg(const std::string& key);

      //////////////////////////////////////////////////////////////////////////
      class BaseSettings
      {
         friend void Config::parseArgs(const std::vector<std::string>&);
         friend void Config::reset(void);
         friend const std::string& Config::getDataDir(void);
         friend const std::vector<std::string>& Config::positionalArgs(void);
         friend std::string Config::getArg(const std::string&);

      private:
         static std::mutex configMutex_;
         static std::string dataDir_;
         static unsigned initCount_;

         static std::vector<std::string> positional_;
         static std::map<std::string, std::string> args_;

      private:
         static void detectDataDir(std::map<std::string, std::string>&);
         static void reset(void);
      };

      //////////////////////////////////////////////////////////////////////////
      class NetworkSettings
      {
         friend void Config::parseArgs(const std::vector<std::string>&);
         friend void Config::reset(void);

      private:
         static NetworkMode mode_;
         static std::string rpcUrl_;

         static std::string btcRpcUrl_;
         static std::string btcRpcUser_;
         static std::string btcRpcPass_;
         static std::string btcWallet_;
         static uint64_t fundingSats_;

         static bool useFaucet_;

      private:
         static void processArgs(const std::map<std::string, std::string>&);
         static void reset(void);

      public:
         static void selectNetwork(NetworkMode);
         static NetworkMode mode(void) { return mode_; }
         static std::string modeStr(void);
         static NetworkMode modeFromStr(const std::string&);

         static const std::string& rpcUrl(void) { return rpcUrl_; }
         static const std::string& btcRpcUrl(void) { return btcRpcUrl_; }
         static const std::string& btcRpcUser(void) { return btcRpcUser_; }
         static const std::string& btcRpcPass(void) { return btcRpcPass_; }
         static const std::string& btcWallet(void) { return btcWallet_; }
         static uint64_t fundingSats(void) { return fundingSats_; }

         //faucet networks fund fee payers over the arch rpc,
         //mainnet requires an actual btc payment
         static bool isFaucetNetwork(void);
         static bool useFaucet(void) { return useFaucet_ && isFaucetNetwork(); }

         //bech32m hrp of the btc network backing the arch network
         static std::string addressHrp(void);
         static std::string explorerUrl(void);
      };

      //////////////////////////////////////////////////////////////////////////
      class DeploySettings
      {
         friend void Config::parseArgs(const std::vector<std::string>&);
         friend void Config::reset(void);

      private:
         static unsigned txCeiling_;
         static unsigned inflation_;
         static unsigned minChunk_;
         static unsigned batchSize_;
         static unsigned blockhashRefresh_;
         static unsigned pollIntervalMs_;
         static unsigned pollTimeoutMs_;
         static unsigned maxTimeouts_;

      private:
         static void processArgs(const std::map<std::string, std::string>&);
         static void reset(void);

      public:
         static unsigned txCeiling(void) { return txCeiling_; }
         static unsigned inflation(void) { return inflation_; }
         static unsigned minChunk(void) { return minChunk_; }
         static unsigned batchSize(void) { return batchSize_; }
         static unsigned blockhashRefresh(void) { return blockhashRefresh_; }
         static unsigned pollIntervalMs(void) { return pollIntervalMs_; }
         static unsigned pollTimeoutMs(void) { return pollTimeoutMs_; }
         static unsigned maxTimeouts(void) { return maxTimeouts_; }
      };

      //////////////////////////////////////////////////////////////////////////
      class Pathing
      {
         friend void Config::parseArgs(const std::vector<std::string>&);
         friend void Config::reset(void);

      private:
         static std::string logFilePath_;

      private:
         static void processArgs(const std::map<std::string, std::string>&);
         static void reset(void);

      public:
         static std::string logFilePath(const std::string&);
      };

      //////////////////////////////////////////////////////////////////////////
      struct File
      {
         std::map<std::string, std::string> keyvalMap_;

         File(const std::string& path);
      };
   }; //namespace Config
}; //namespace ArchDeploy

#endif
