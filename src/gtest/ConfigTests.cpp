////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

#include "TestUtils.h"
#include "../ArchConfig.h"
#include "../ProgramDeployer.h"

using namespace std;
using namespace ArchDeploy;
using namespace ArchDeploy::Config;

////////////////////////////////////////////////////////////////////////////////
class SettingsUtilsTest : public ::testing::Test
{
protected:
   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(SettingsUtilsTest, KeyVals)
{
   auto keyval = SettingsUtils::getKeyValFromLine("rpc-url=http://a:1", '=');
   EXPECT_EQ(keyval.first, "rpc-url");
   EXPECT_EQ(keyval.second, "http://a:1");

   keyval = SettingsUtils::getKeyValFromLine("no-faucet", '=');
   EXPECT_EQ(keyval.first, "no-faucet");
   EXPECT_TRUE(keyval.second.empty());

   EXPECT_EQ(SettingsUtils::stripQuotes("\"quoted\""), "quoted");
   EXPECT_EQ(SettingsUtils::stripQuotes("'single'"), "single");
   EXPECT_EQ(SettingsUtils::stripQuotes("bare"), "bare");
   EXPECT_EQ(SettingsUtils::stripQuotes(""), "");

   auto tokens = SettingsUtils::tokenizeLine("--a=1 --b=2 --c", "--");
   ASSERT_EQ(tokens.size(), 3ULL);
   EXPECT_EQ(tokens[0], "a=1");
   EXPECT_EQ(tokens[1], "b=2");
   EXPECT_EQ(tokens[2], "c");
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(SettingsUtilsTest, Paths)
{
   string path = "/tmp";
   SettingsUtils::appendPath(path, "archdeploy.conf");
   EXPECT_EQ(path, "/tmp/archdeploy.conf");

   path = "/tmp/";
   SettingsUtils::appendPath(path, "archdeploy.conf");
   EXPECT_EQ(path, "/tmp/archdeploy.conf");

   string home = getenv("HOME") == nullptr ? "" : getenv("HOME");
   if (!home.empty())
   {
      path = "~/.archdeploy";
      SettingsUtils::expandPath(path);
      EXPECT_EQ(path, home + "/.archdeploy");
   }

   path = "relative/dir";
   SettingsUtils::expandPath(path);
   EXPECT_EQ(path, "relative/dir");
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(SettingsUtilsTest, Unsigned)
{
   map<string, string> args = {
      { "good", "42" },
      { "neg", "-1" },
      { "alpha", "12a" },
      { "huge", "99999999999" }
   };

   EXPECT_EQ(SettingsUtils::getUnsigned(args, "good", 7), 42U);
   EXPECT_EQ(SettingsUtils::getUnsigned(args, "missing", 7), 7U);
   EXPECT_THROW(SettingsUtils::getUnsigned(args, "neg", 7), Config::Error);
   EXPECT_THROW(SettingsUtils::getUnsigned(args, "alpha", 7), Config::Error);
   EXPECT_THROW(SettingsUtils::getUnsigned(args, "huge", 7), Config::Error);
}

////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////
class ConfigTest : public ::testing::Test
{
protected:
   string homedir_;
   string confPath_;

   void cleanUp(void)
   {
      unlink(confPath_.c_str());
      rmdir(homedir_.c_str());
   }

   void writeConf(const vector<string>& lines)
   {
      ofstream ofs(confPath_, ios::out | ios::trunc);
      for (auto& line : lines)
         ofs << line << endl;
   }

   virtual void SetUp(void)
   {
      LOGDISABLESTDOUT();
      homedir_ = "./configtestdir";
      confPath_ = homedir_ + "/" + CONFIG_FILE_NAME;

      cleanUp();
      mkdir(homedir_.c_str(), S_IRWXU);
   }

   virtual void TearDown(void)
   {
      Config::reset();
      cleanUp();
   }
};

////////////////////////////////////////////////////////////////////////////////
TEST_F(ConfigTest, Defaults)
{
   Config::parseArgs({ "--datadir=" + homedir_ });

   EXPECT_EQ(getDataDir(), homedir_);
   EXPECT_TRUE(positionalArgs().empty());

   EXPECT_EQ(NetworkSettings::mode(), NetworkMode::Testnet);
   EXPECT_EQ(NetworkSettings::modeStr(), "testnet");
   EXPECT_EQ(NetworkSettings::rpcUrl(), ARCH_DEFAULT_RPC_URL);
   EXPECT_EQ(NetworkSettings::addressHrp(), "tb");
   EXPECT_TRUE(NetworkSettings::useFaucet());
   EXPECT_FALSE(NetworkSettings::explorerUrl().empty());

   EXPECT_EQ(DeploySettings::txCeiling(), 10240U);
   EXPECT_EQ(DeploySettings::inflation(), 8U);
   EXPECT_EQ(DeploySettings::minChunk(), 1000U);
   EXPECT_EQ(DeploySettings::batchSize(), 100U);
   EXPECT_EQ(DeploySettings::blockhashRefresh(), 5U);
   EXPECT_EQ(DeploySettings::maxTimeouts(), 0U);

   EXPECT_EQ(Pathing::logFilePath("archdeploy.log"),
      homedir_ + "/archdeploy.log");
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ConfigTest, CommandLine)
{
   Config::parseArgs({
      "deploy",
      "--datadir=" + homedir_,
      "--network=localnet",
      "--rpc-url=http://127.0.0.1:9999",
      "--program=./prog.so",
      "--min-chunk=500",
      "--max-timeouts=3",
      "--no-faucet"
   });

   ASSERT_EQ(positionalArgs().size(), 1ULL);
   EXPECT_EQ(positionalArgs()[0], "deploy");
   EXPECT_EQ(getArg("program"), "./prog.so");
   EXPECT_TRUE(getArg("program-key").empty());

   EXPECT_EQ(NetworkSettings::mode(), NetworkMode::Localnet);
   EXPECT_EQ(NetworkSettings::rpcUrl(), "http://127.0.0.1:9999");
   EXPECT_EQ(NetworkSettings::addressHrp(), "bcrt");
   EXPECT_TRUE(NetworkSettings::explorerUrl().empty());
   EXPECT_FALSE(NetworkSettings::useFaucet());

   EXPECT_EQ(DeploySettings::minChunk(), 500U);
   EXPECT_EQ(DeploySettings::maxTimeouts(), 3U);

   auto params = DeployerParams::fromSettings();
   EXPECT_EQ(params.minChunk_, 500ULL);
   EXPECT_EQ(params.maxConsecutiveTimeouts_, 3U);
   EXPECT_FALSE(params.useFaucet_);
   EXPECT_TRUE(params.explorerUrl_.empty());
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ConfigTest, ConfigFile)
{
   writeConf({
      "# comment line",
      "network=mainnet",
      "--rpc-url=\"http://node:9002\"",
      "batch-size=10"
   });

   //command line wins over the file
   Config::parseArgs({ "--datadir=" + homedir_, "--batch-size=20" });

   EXPECT_EQ(NetworkSettings::mode(), NetworkMode::Mainnet);
   EXPECT_EQ(NetworkSettings::rpcUrl(), "http://node:9002");
   EXPECT_EQ(NetworkSettings::addressHrp(), "bc");
   EXPECT_FALSE(NetworkSettings::isFaucetNetwork());
   EXPECT_FALSE(NetworkSettings::useFaucet());
   EXPECT_EQ(DeploySettings::batchSize(), 20U);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ConfigTest, IllegalValues)
{
   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_,
      "--network=regtest" }), Config::Error);
   Config::reset();

   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_,
      "--inflation=0" }), Config::Error);
   Config::reset();

   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_,
      "--batch-size=abc" }), Config::Error);
   Config::reset();

   //a 0 interval never advances the confirmation timeout
   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_,
      "--poll-interval-ms=0" }), Config::Error);
   Config::reset();

   Config::parseArgs({ "--datadir=" + homedir_, "--poll-interval-ms=1" });
   EXPECT_EQ(DeploySettings::pollIntervalMs(), 1U);
   Config::reset();

   writeConf({ "datadir=/somewhere/else" });
   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_ }),
      Config::Error);
}

////////////////////////////////////////////////////////////////////////////////
TEST_F(ConfigTest, NoOverride)
{
   Config::parseArgs({ "--datadir=" + homedir_ });
   EXPECT_THROW(Config::parseArgs({ "--datadir=" + homedir_ }),
      runtime_error);

   Config::reset();
   Config::parseArgs({ "--datadir=" + homedir_, "--network=devnet" });
   EXPECT_EQ(NetworkSettings::mode(), NetworkMode::Devnet);
   EXPECT_TRUE(NetworkSettings::useFaucet());
}

////////////////////////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////////////////////////
GTEST_API_ int main(int argc, char **argv)
{
   std::cout << "Running main() from gtest_main.cc\n";
   CryptoSchnorr::setupContext();

   testing::InitGoogleTest(&argc, argv);
   int exitCode = RUN_ALL_TESTS();

   CryptoSchnorr::shutdown();
   FLUSHLOG();
   CLEANUPLOG();

   return exitCode;
}
