////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-19, goatpig.                                           //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>

#include "ArchConfig.h"
#include "ArchErrors.h"
#include "EncryptionUtils.h"
#include "PaymentProviders.h"
#include "ProgramDeployer.h"
#include "log.h"

using namespace std;
using namespace ArchDeploy;
using namespace ArchDeploy::Config;

#define LOG_FILE_NAME "archdeploy.log"

////////////////////////////////////////////////////////////////////////////////
static int getExitCode(ArchErrorCodes code)
{
   auto val = (int)code;
   //rpc failures: 40000 + n -> 40 + n
   if (val >= (int)ArchErrorCodes::RPCFailure_Unknown && val < 40010)
      return 40 + (val - (int)ArchErrorCodes::RPCFailure_Unknown);

   if (code == ArchErrorCodes::Deploy_VerifyMismatch)
      return 51;

   if (val <= 0 || val > 255)
      return 1;

   return val;
}

////////////////////////////////////////////////////////////////////////////////
static string getRequiredArg(const string& key)
{
   auto val = getArg(key);
   if (val.empty())
      throw ConfigurationError("missing --" + key);

   SettingsUtils::expandPath(val);
   return val;
}

////////////////////////////////////////////////////////////////////////////////
static BinaryData readProgramFile(const string& path)
{
   ifstream ifs(path, ios::binary | ios::ate);
   if (!ifs.is_open())
   {
      throw ConfigurationError("cannot open program binary " + path,
         ArchErrorCodes::Config_ProgramFile);
   }

   auto size = (size_t)ifs.tellg();
   ifs.seekg(0, ios::beg);

   BinaryData data(size);
   if (size > 0)
      ifs.read((char*)data.getPtr(), size);

   if (!ifs.good() && size > 0)
   {
      throw ConfigurationError("failed to read program binary " + path,
         ArchErrorCodes::Config_ProgramFile);
   }

   return data;
}

////////////////////////////////////////////////////////////////////////////////
static void printProgress(ProgressLevel level, const string& msg)
{
   switch (level)
   {
   case ProgressLevel::Success:
      cout << " [ok] ";
      break;

   case ProgressLevel::Error:
      cout << "[err] ";
      break;

   default:
      cout << "      ";
   }

   cout << msg << endl;
}

////////////////////////////////////////////////////////////////////////////////
static void runKeygen()
{
   auto path = getRequiredArg("out");
   if (SettingsUtils::fileExists(path, 0))
      throw ConfigurationError("refusing to overwrite " + path);

   auto keypair = Keypair::generate();
   keypair.toFile(path, NetworkSettings::addressHrp());

   cout << "wrote keypair to " << path << endl;
   cout << "pubkey:  " << keypair.pubkey_.toHexStr() << endl;
   cout << "address: " <<
      keypair.pubkey_.toTaprootAddress(NetworkSettings::addressHrp()) << endl;
}

////////////////////////////////////////////////////////////////////////////////
static void runAddress()
{
   auto keypair = Keypair::fromFile(getRequiredArg("key"));

   cout << "pubkey:  " << keypair.pubkey_.toHexStr() << endl;
   cout << "address: " <<
      keypair.pubkey_.toTaprootAddress(NetworkSettings::addressHrp()) << endl;
}

////////////////////////////////////////////////////////////////////////////////
static void runAccount()
{
   auto keypair = Keypair::fromFile(getRequiredArg("key"));
   ArchRPC::ArchNodeRPC rpc(NetworkSettings::rpcUrl());

   auto info = rpc.readAccountInfo(keypair.pubkey_);
   cout << "account: " << keypair.pubkey_.toHexStr() << endl;
   if (info == nullptr)
   {
      cout << "   does not exist" << endl;
      return;
   }

   cout << "   lamports:   " << info->lamports_ << endl;
   cout << "   owner:      " << info->owner_.toHexStr();
   if (info->owner_.isSystemProgram())
      cout << " (system)";
   else if (info->owner_ == Pubkey::loaderProgram())
      cout << " (loader)";
   cout << endl;
   cout << "   executable: " << (info->isExecutable_ ? "yes" : "no") << endl;
   cout << "   data size:  " << info->data_.getSize() << endl;
   if (!info->utxo_.empty())
      cout << "   utxo:       " << info->utxo_ << endl;
}

////////////////////////////////////////////////////////////////////////////////
static void runDeploy()
{
   auto binary = readProgramFile(getRequiredArg("program"));
   auto programKey = Keypair::fromFile(getRequiredArg("program-key"));
   auto authorityKey = Keypair::fromFile(getRequiredArg("authority-key"));

   LOGINFO << "network: " << NetworkSettings::modeStr() <<
      ", rpc: " << NetworkSettings::rpcUrl();

   auto rpc = make_shared<ArchRPC::ArchNodeRPC>(NetworkSettings::rpcUrl());
   ProgramDeployer deployer(rpc, programKey, authorityKey,
      DeployerParams::fromSettings());
   deployer.setProgressCallback(printProgress);
   deployer.setPaymentProviders(PaymentProviders::getDefaultProviders());

   auto result = deployer.deploy(binary);

   cout << endl;
   cout << "program id: " << result.programId_ << endl;
   if (result.alreadyDeployed_)
      cout << "already deployed, nothing to do" << endl;
   cout << "txs sent:   " << result.txids_.size() << endl;
   for (auto& counter : result.counters_)
      cout << "   " << counter.first << ": " << counter.second << endl;
   if (result.confirmationTimeouts_ > 0)
      cout << "unconfirmed txs: " << result.confirmationTimeouts_ << endl;
   if (!result.explorerUrl_.empty())
      cout << "explorer:   " << result.explorerUrl_ << endl;
}

////////////////////////////////////////////////////////////////////////////////
int main(int argc, char* argv[])
{
   CryptoSchnorr::setupContext();

   try
   {
      ArchDeploy::Config::parseArgs(argc, argv);
   }
   catch (const runtime_error& e)
   {
      cout << "Failed to setup with error:" << endl;
      cout << "   " << e.what() << endl;
      cout << "Aborting!" << endl;

      CryptoSchnorr::shutdown();
      return (int)ArchErrorCodes::Config_Invalid;
   }

   STARTLOGGING(Pathing::logFilePath(LOG_FILE_NAME), LogLvlDebug);
   LOGDISABLESTDOUT();

   auto& positional = positionalArgs();
   if (positional.empty())
   {
      printHelp();
      CLEANUPLOG();
      CryptoSchnorr::shutdown();
      return (int)ArchErrorCodes::Config_Invalid;
   }

   auto& command = positional[0];
   LOGINFO << "running " << command << ", datadir: " << getDataDir();

   int ret = 0;
   try
   {
      if (command == "deploy")
         runDeploy();
      else if (command == "keygen")
         runKeygen();
      else if (command == "address")
         runAddress();
      else if (command == "account")
         runAccount();
      else
         throw ConfigurationError("unknown command: " + command);
   }
   catch (const ArchError& e)
   {
      LOGERR << command << " failed: " << e.what();
      cerr << "error: " << e.what() << endl;
      ret = getExitCode(e.code());
   }
   catch (const JSON_Exception& e)
   {
      LOGERR << command << " failed, json error: " << e.what();
      cerr << "error: " << e.what() << endl;
      ret = getExitCode(ArchErrorCodes::RPCFailure_JSON);
   }
   catch (const runtime_error& e)
   {
      LOGERR << command << " failed: " << e.what();
      cerr << "error: " << e.what() << endl;
      ret = 1;
   }

   FLUSHLOG();
   CLEANUPLOG();
   CryptoSchnorr::shutdown();

   return ret;
}
