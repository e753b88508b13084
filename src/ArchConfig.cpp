////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

#include "ArchConfig.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy;
using namespace ArchDeploy::Config;

////////////////////////////////////////////////////////////////////////////////
#define DEFAULT_DATADIR "~/.archdeploy"
#define DEFAULT_LOGFILE "archdeploy.log"

#define TESTNET_EXPLORER_URL "https://explorer-beta.test.arch.network"
#define MAINNET_EXPLORER_URL "https://explorer.arch.network"

////////////////////////////////////////////////////////////////////////////////
void ArchDeploy::Config::printHelp(void)
{
   static std::string helpMsg = R"(
usage: archdeploy <command> [options]

commands:
deploy                     deploy a program binary. Requires --program,
                           --program-key and --authority-key
keygen                     write a new keypair file to --out
address                    print the pubkey and taproot address of --key
account                    read and print the account of --key

options:
--help                     print help message and exit
--program                  path to the program binary to deploy
--program-key              keypair file of the program account
--authority-key            keypair file of the upgrade authority, which also
                           pays the fees
--key                      keypair file for address and account
--out                      keypair file written by keygen
--network                  mainnet, testnet, devnet or localnet.
                           Defaults to testnet
--rpc-url                  arch node json-rpc url.
                           Defaults to http://localhost:9002
--btc-rpc-url              bitcoin node rpc url, used to fund the fee payer
                           on networks without a faucet.
                           Defaults to http://localhost:18443
--btc-rpc-user             bitcoin node rpc user. Defaults to bitcoin
--btc-rpc-pass             bitcoin node rpc password. Defaults to bitcoin
--btc-wallet               bitcoin node wallet to pay from
--funding-sats             amount sent to fund a new fee payer. Defaults to 5000
--no-faucet                do not use the faucet to create or fund the fee payer
--tx-ceiling               maximum transaction size the node accepts.
                           Defaults to 10240
--inflation                size multiplier applied to the serialized tx by the
                           node's transport encoding. Defaults to 8
--min-chunk                lower bound on the upload chunk size. Defaults to 1000
--batch-size               maximum txs per send_transactions call.
                           Defaults to 100
--blockhash-refresh        fetch a new blockhash every N txs. Defaults to 5
--poll-interval-ms         delay between confirmation polls. Defaults to 1000
--poll-timeout-ms          confirmation timeout per tx. Defaults to 30000
--max-timeouts             fail after this many consecutive confirmation
                           timeouts. 0 never fails. Defaults to 0
--datadir                  path to the operation folder. Holds archdeploy.conf
                           and the log file. Defaults to ~/.archdeploy
--logfile                  path to the log file)";

   cerr << helpMsg << endl;
}

////////////////////////////////////////////////////////////////////////////////
const string& ArchDeploy::Config::getDataDir()
{
   return BaseSettings::dataDir_;
}

////////////////////////////////////////////////////////////////////////////////
const vector<string>& ArchDeploy::Config::positionalArgs()
{
   return BaseSettings::positional_;
}

////////////////////////////////////////////////////////////////////////////////
string ArchDeploy::Config::getArg(const string& key)
{
   auto iter = BaseSettings::args_.find(key);
   if (iter == BaseSettings::args_.end())
      return string();

   return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
void ArchDeploy::Config::parseArgs(int argc, char* argv[])
{
   vector<string> lines;
   lines.reserve(argc);
   for (int i=1; i<argc; i++)
      lines.emplace_back(argv[i], strlen(argv[i]));

   ArchDeploy::Config::parseArgs(lines);
}

////////////////////////////////////////////////////////////////////////////////
void ArchDeploy::Config::parseArgs(const vector<string>& lines)
{
   unique_lock<mutex> lock(BaseSettings::configMutex_);
   if (BaseSettings::initCount_++ > 0)
   {
      LOGERR << "Trying to override config";
      throw runtime_error("Trying to override config");
   }

   /*
   1. split positional args from --key=value args
   2. figure out the datadir
   3. grab the config file if any, command line args take precedence
   4. parse arg map for everything else
   */

   try
   {
      //parse command line args
      map<string, string> args;
      for (const auto& line : lines)
      {
         if (line == ("--help"))
         {
            ArchDeploy::Config::printHelp();
            exit(0);
         }

         if (line.compare(0, 2, "--") != 0)
         {
            BaseSettings::positional_.push_back(line);
            continue;
         }

         //string prefix and tokenize
         auto strings = SettingsUtils::tokenizeLine(line, "--");
         for (auto& token : strings)
         {
            auto keyVal = SettingsUtils::getKeyValFromLine(token, '=');

            args.insert(make_pair(
               keyVal.first, SettingsUtils::stripQuotes(keyVal.second)));
         }
      }

      //datadir
      BaseSettings::detectDataDir(args);

      //get config file
      auto configPath = ArchDeploy::Config::getDataDir();
      SettingsUtils::appendPath(configPath, CONFIG_FILE_NAME);

      if (SettingsUtils::fileExists(configPath, 2))
      {
         Config::File cf(configPath);
         auto mapIter = cf.keyvalMap_.find("datadir");
         if (mapIter != cf.keyvalMap_.end())
            throw Config::Error("datadir is illegal in .conf file");

         //merge, insert does not overwrite command line values
         args.insert(cf.keyvalMap_.begin(), cf.keyvalMap_.end());
      }

      NetworkSettings::processArgs(args);
      DeploySettings::processArgs(args);
      Pathing::processArgs(args);

      BaseSettings::args_ = move(args);
   }
   catch (const Config::Error& e)
   {
      cerr << e.what() << endl;
      throw;
   }
}

////////////////////////////////////////////////////////////////////////////////
void ArchDeploy::Config::reset()
{
   unique_lock<mutex> lock(BaseSettings::configMutex_);

   NetworkSettings::reset();
   DeploySettings::reset();
   Pathing::reset();
   BaseSettings::reset();
}

////////////////////////////////////////////////////////////////////////////////
//
// SettingsUtils
//
////////////////////////////////////////////////////////////////////////////////
vector<string> SettingsUtils::getLines(const string& path)
{
   vector<string> output;
   fstream fs(path, ios_base::in);

   while (fs.good())
   {
      string str;
      getline(fs, str);
      output.push_back(move(str));
   }

   return output;
}

////////////////////////////////////////////////////////////////////////////////
map<string, string> SettingsUtils::getKeyValsFromLines(
   const vector<string>& lines, char delim)
{
   map<string, string> output;
   for (auto& line : lines)
      output.insert(getKeyValFromLine(line, delim));

   return output;
}

////////////////////////////////////////////////////////////////////////////////
pair<string, string> SettingsUtils::getKeyValFromLine(
   const string& line, char delim)
{
   stringstream ss(line);
   pair<string, string> output;

   //key
   getline(ss, output.first, delim);

   //val
   if (ss.good())
      getline(ss, output.second);

   return output;
}

////////////////////////////////////////////////////////////////////////////////
vector<string> SettingsUtils::tokenizeLine(
   const string& line, const string& token)
{
   if (token.empty() || line.empty())
      return {};

   vector<string> result;

   unsigned i=0;
   unsigned tkId = 0;
   while (i < line.size())
   {
      if (line.c_str()[i] == token.c_str()[tkId])
      {
         ++tkId;
         if (tkId == token.size())
         {
            ++i;
            auto y = i;
            while (i < line.size() -1)
            {
               if (line.c_str()[i] == ' ')
                  break;
               ++i;
            }

            if (i >= y)
            {
               //keep last char in the line
               if (i==line.size() -1)
                  ++i;

               string str(line.c_str() + y, i-y);
               result.emplace_back(move(str));
            }

            tkId = 0;
         }
      }
      else
      {
         tkId = 0;
      }

      ++i;
   }

   return result;
}

////////////////////////////////////////////////////////////////////////////////
vector<string> SettingsUtils::keyValToArgv(
   const map<string, string>& keyValMap)
{
   vector<string> argv;

   for (auto& keyval : keyValMap)
   {
      stringstream ss;
      if (keyval.first.compare(0, 2, "--") != 0)
         ss << "--";
      ss << keyval.first;

      if (keyval.second.size() != 0)
         ss << "=" << keyval.second;

      argv.push_back(ss.str());
   }

   return argv;
}

////////////////////////////////////////////////////////////////////////////////
bool SettingsUtils::fileExists(const string& path, int mode)
{
   auto nixmode = F_OK;
   if (mode & 2)
      nixmode |= R_OK;
   if (mode & 4)
      nixmode |= W_OK;
   auto result = access(path.c_str(), nixmode);
   return result == 0;
}

////////////////////////////////////////////////////////////////////////////////
string SettingsUtils::stripQuotes(const string& input)
{
   if (input.empty())
      return input;

   size_t start = 0;
   size_t len = input.size();

   auto& first_char = input.c_str()[0];
   auto& last_char = input.c_str()[len - 1];

   if (first_char == '\"' || first_char == '\'')
   {
      start = 1;
      --len;
   }

   if (len > 0 && (last_char == '\"' || last_char == '\''))
      --len;

   return input.substr(start, len);
}

////////////////////////////////////////////////////////////////////////////////
void SettingsUtils::expandPath(string& path)
{
   if (path.size() == 0 || path.c_str()[0] != '~')
      return;

   auto home = getenv("HOME");
   if (home == nullptr)
      throw Config::Error("cannot expand ~, HOME is not set");

   string newPath(home);
   newPath.append(path.c_str() + 1, path.size() - 1);
   path = move(newPath);
}

////////////////////////////////////////////////////////////////////////////////
void SettingsUtils::appendPath(string& base, const string& add)
{
   if (add.size() == 0)
      return;

   if (base.size() > 0 && base.back() != '/')
      base.push_back('/');

   base.append(add);
}

////////////////////////////////////////////////////////////////////////////////
unsigned SettingsUtils::getUnsigned(const map<string, string>& args,
   const string& key, unsigned defaultVal)
{
   auto iter = args.find(key);
   if (iter == args.end())
      return defaultVal;

   auto& valStr = iter->second;
   if (valStr.empty() || valStr.find_first_not_of("0123456789") != string::npos)
   {
      stringstream ss;
      ss << "invalid value for --" << key << ": " << valStr;
      throw Config::Error(ss.str());
   }

   unsigned long val;
   try
   {
      val = stoul(valStr);
   }
   catch (const out_of_range&)
   {
      throw Config::Error("value out of range for --" + key);
   }

   if (val > UINT32_MAX)
      throw Config::Error("value out of range for --" + key);

   return (unsigned)val;
}

////////////////////////////////////////////////////////////////////////////////
//
// BaseSettings
//
////////////////////////////////////////////////////////////////////////////////
mutex BaseSettings::configMutex_;
string BaseSettings::dataDir_;
unsigned BaseSettings::initCount_ = 0;
vector<string> BaseSettings::positional_;
map<string, string> BaseSettings::args_;

////////////////////////////////////////////////////////////////////////////////
void BaseSettings::detectDataDir(map<string, string>& args)
{
   //figure out the datadir
   bool autoDir = false;
   auto argIter = args.find("datadir");
   if (argIter != args.end())
   {
      dataDir_ = argIter->second;
      args.erase(argIter);
   }
   else
   {
      dataDir_ = DEFAULT_DATADIR;
      autoDir = true;
   }

   SettingsUtils::expandPath(dataDir_);

   //create the datadir if set automatically
   if (autoDir && !SettingsUtils::fileExists(dataDir_, 0))
      mkdir(dataDir_.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
}

////////////////////////////////////////////////////////////////////////////////
void BaseSettings::reset()
{
   dataDir_.clear();
   positional_.clear();
   args_.clear();
   initCount_ = 0;
}

////////////////////////////////////////////////////////////////////////////////
//
// NetworkSettings
//
////////////////////////////////////////////////////////////////////////////////
NetworkMode NetworkSettings::mode_ = NetworkMode::Testnet;
string NetworkSettings::rpcUrl_ = ARCH_DEFAULT_RPC_URL;

string NetworkSettings::btcRpcUrl_ = BTC_DEFAULT_RPC_URL;
string NetworkSettings::btcRpcUser_ = BTC_DEFAULT_RPC_USER;
string NetworkSettings::btcRpcPass_ = BTC_DEFAULT_RPC_PASS;
string NetworkSettings::btcWallet_;
uint64_t NetworkSettings::fundingSats_ = DEFAULT_FUNDING_SATS;

bool NetworkSettings::useFaucet_ = true;

////////////////////////////////////////////////////////////////////////////////
void NetworkSettings::processArgs(const map<string, string>& args)
{
   //network type
   auto iter = args.find("network");
   if (iter != args.end())
      selectNetwork(modeFromStr(iter->second));

   iter = args.find("rpc-url");
   if (iter != args.end())
      rpcUrl_ = iter->second;

   iter = args.find("btc-rpc-url");
   if (iter != args.end())
      btcRpcUrl_ = iter->second;

   iter = args.find("btc-rpc-user");
   if (iter != args.end())
      btcRpcUser_ = iter->second;

   iter = args.find("btc-rpc-pass");
   if (iter != args.end())
      btcRpcPass_ = iter->second;

   iter = args.find("btc-wallet");
   if (iter != args.end())
      btcWallet_ = iter->second;

   fundingSats_ = SettingsUtils::getUnsigned(
      args, "funding-sats", DEFAULT_FUNDING_SATS);
   if (fundingSats_ == 0)
      throw Config::Error("--funding-sats cannot be 0");

   iter = args.find("no-faucet");
   if (iter != args.end())
      useFaucet_ = false;
}

////////////////////////////////////////////////////////////////////////////////
void NetworkSettings::selectNetwork(NetworkMode mode)
{
   mode_ = mode;
}

////////////////////////////////////////////////////////////////////////////////
string NetworkSettings::modeStr()
{
   switch (mode_)
   {
   case NetworkMode::Mainnet:
      return "mainnet";

   case NetworkMode::Testnet:
      return "testnet";

   case NetworkMode::Devnet:
      return "devnet";

   case NetworkMode::Localnet:
      return "localnet";

   default:
      throw Config::Error("invalid network mode");
   }
}

////////////////////////////////////////////////////////////////////////////////
NetworkMode NetworkSettings::modeFromStr(const string& str)
{
   if (str == "mainnet")
      return NetworkMode::Mainnet;
   else if (str == "testnet")
      return NetworkMode::Testnet;
   else if (str == "devnet")
      return NetworkMode::Devnet;
   else if (str == "localnet")
      return NetworkMode::Localnet;

   throw Config::Error("unexpected network: " + str);
}

////////////////////////////////////////////////////////////////////////////////
bool NetworkSettings::isFaucetNetwork()
{
   return mode_ != NetworkMode::Mainnet;
}

////////////////////////////////////////////////////////////////////////////////
string NetworkSettings::addressHrp()
{
   switch (mode_)
   {
   case NetworkMode::Mainnet:
      return "bc";

   case NetworkMode::Testnet:
   case NetworkMode::Devnet:
      return "tb";

   default:
      return "bcrt";
   }
}

////////////////////////////////////////////////////////////////////////////////
string NetworkSettings::explorerUrl()
{
   switch (mode_)
   {
   case NetworkMode::Mainnet:
      return MAINNET_EXPLORER_URL;

   case NetworkMode::Testnet:
      return TESTNET_EXPLORER_URL;

   default:
      return string();
   }
}

////////////////////////////////////////////////////////////////////////////////
void NetworkSettings::reset()
{
   mode_ = NetworkMode::Testnet;
   rpcUrl_ = ARCH_DEFAULT_RPC_URL;

   btcRpcUrl_ = BTC_DEFAULT_RPC_URL;
   btcRpcUser_ = BTC_DEFAULT_RPC_USER;
   btcRpcPass_ = BTC_DEFAULT_RPC_PASS;
   btcWallet_.clear();
   fundingSats_ = DEFAULT_FUNDING_SATS;

   useFaucet_ = true;
}

////////////////////////////////////////////////////////////////////////////////
//
// DeploySettings
//
////////////////////////////////////////////////////////////////////////////////
unsigned DeploySettings::txCeiling_ = DEFAULT_TX_CEILING;
unsigned DeploySettings::inflation_ = DEFAULT_TX_INFLATION;
unsigned DeploySettings::minChunk_ = DEFAULT_MIN_CHUNK;
unsigned DeploySettings::batchSize_ = DEFAULT_BATCH_SIZE;
unsigned DeploySettings::blockhashRefresh_ = DEFAULT_BLOCKHASH_REFRESH;
unsigned DeploySettings::pollIntervalMs_ = DEFAULT_POLL_INTERVAL_MS;
unsigned DeploySettings::pollTimeoutMs_ = DEFAULT_POLL_TIMEOUT_MS;
unsigned DeploySettings::maxTimeouts_ = 0;

////////////////////////////////////////////////////////////////////////////////
void DeploySettings::processArgs(const map<string, string>& args)
{
   txCeiling_ = SettingsUtils::getUnsigned(
      args, "tx-ceiling", DEFAULT_TX_CEILING);
   inflation_ = SettingsUtils::getUnsigned(
      args, "inflation", DEFAULT_TX_INFLATION);
   minChunk_ = SettingsUtils::getUnsigned(
      args, "min-chunk", DEFAULT_MIN_CHUNK);
   batchSize_ = SettingsUtils::getUnsigned(
      args, "batch-size", DEFAULT_BATCH_SIZE);
   blockhashRefresh_ = SettingsUtils::getUnsigned(
      args, "blockhash-refresh", DEFAULT_BLOCKHASH_REFRESH);
   pollIntervalMs_ = SettingsUtils::getUnsigned(
      args, "poll-interval-ms", DEFAULT_POLL_INTERVAL_MS);
   pollTimeoutMs_ = SettingsUtils::getUnsigned(
      args, "poll-timeout-ms", DEFAULT_POLL_TIMEOUT_MS);
   maxTimeouts_ = SettingsUtils::getUnsigned(args, "max-timeouts", 0);

   if (inflation_ == 0)
      throw Config::Error("--inflation cannot be 0");
   if (minChunk_ == 0)
      throw Config::Error("--min-chunk cannot be 0");
   if (batchSize_ == 0)
      throw Config::Error("--batch-size cannot be 0");
   if (blockhashRefresh_ == 0)
      throw Config::Error("--blockhash-refresh cannot be 0");
   if (pollIntervalMs_ == 0)
      throw Config::Error("--poll-interval-ms cannot be 0");
}

////////////////////////////////////////////////////////////////////////////////
void DeploySettings::reset()
{
   txCeiling_ = DEFAULT_TX_CEILING;
   inflation_ = DEFAULT_TX_INFLATION;
   minChunk_ = DEFAULT_MIN_CHUNK;
   batchSize_ = DEFAULT_BATCH_SIZE;
   blockhashRefresh_ = DEFAULT_BLOCKHASH_REFRESH;
   pollIntervalMs_ = DEFAULT_POLL_INTERVAL_MS;
   pollTimeoutMs_ = DEFAULT_POLL_TIMEOUT_MS;
   maxTimeouts_ = 0;
}

////////////////////////////////////////////////////////////////////////////////
//
// Pathing
//
////////////////////////////////////////////////////////////////////////////////
string Pathing::logFilePath_;

////////////////////////////////////////////////////////////////////////////////
void Pathing::processArgs(const map<string, string>& args)
{
   auto iter = args.find("logfile");
   if (iter != args.end())
   {
      logFilePath_ = iter->second;
      SettingsUtils::expandPath(logFilePath_);
   }
}

////////////////////////////////////////////////////////////////////////////////
string Pathing::logFilePath(const string& logName)
{
   if (logFilePath_.size() > 0)
      return logFilePath_;

   auto path = getDataDir();
   SettingsUtils::appendPath(path, logName.empty() ? DEFAULT_LOGFILE : logName);
   return path;
}

////////////////////////////////////////////////////////////////////////////////
void Pathing::reset()
{
   logFilePath_.clear();
}

////////////////////////////////////////////////////////////////////////////////
//
// Config::File
//
////////////////////////////////////////////////////////////////////////////////
Config::File::File(const string& path)
{
   auto&& lines = SettingsUtils::getLines(path);

   for (auto& line : lines)
   {
      auto&& keyval = SettingsUtils::getKeyValFromLine(line, '=');

      if (keyval.first.size() == 0)
         continue;

      if (keyval.first.compare(0, 1, "#") == 0)
         continue;

      //accept both "key=val" and "--key=val"
      auto key = keyval.first;
      if (key.compare(0, 2, "--") == 0)
         key = key.substr(2);

      keyvalMap_.insert(make_pair(
         key, SettingsUtils::stripQuotes(keyval.second)));
   }
}
