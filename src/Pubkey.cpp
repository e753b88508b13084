////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cstring>
#include <fstream>
#include <sstream>

#include "Pubkey.h"
#include "ArchErrors.h"
#include "BtcUtils.h"
#include "EncryptionUtils.h"
#include "JSON_codec.h"
#include "log.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
////
//// Pubkey
////
////////////////////////////////////////////////////////////////////////////////
Pubkey::Pubkey() :
   bytes_(PUBKEY_LENGTH)
{
   memset(bytes_.getPtr(), 0, PUBKEY_LENGTH);
}

////////////////////////////////////////////////////////////////////////////////
Pubkey::Pubkey(BinaryDataRef bdr)
{
   if (bdr.getSize() != PUBKEY_LENGTH)
   {
      stringstream ss;
      ss << "invalid pubkey length: " << bdr.getSize();
      throw runtime_error(ss.str());
   }

   bytes_ = bdr.copy();
}

////////////////////////////////////////////////////////////////////////////////
Pubkey Pubkey::fromHex(const string& hexStr)
{
   auto bd = BinaryData::CreateFromHex(hexStr);
   return Pubkey(bd.getRef());
}

////////////////////////////////////////////////////////////////////////////////
Pubkey Pubkey::systemProgram()
{
   Pubkey key;
   key.bytes_[PUBKEY_LENGTH - 1] = 1;
   return key;
}

////////////////////////////////////////////////////////////////////////////////
Pubkey Pubkey::loaderProgram()
{
   static_assert(sizeof(LOADER_PROGRAM_ID) - 1 == PUBKEY_LENGTH,
      "loader id has to be 32 characters");

   auto bd = BinaryData::fromString(LOADER_PROGRAM_ID);
   return Pubkey(bd.getRef());
}

////////////////////////////////////////////////////////////////////////////////
bool Pubkey::isSystemProgram() const
{
   return *this == systemProgram();
}

////////////////////////////////////////////////////////////////////////////////
string Pubkey::toTaprootAddress(const string& hrp) const
{
   auto outputKey = CryptoSchnorr::computeTaprootOutputKey(bytes_.getRef());
   return BtcUtils::scrAddrToSegWitAddress(outputKey.getRef(), 1, hrp);
}

////////////////////////////////////////////////////////////////////////////////
////
//// Keypair
////
////////////////////////////////////////////////////////////////////////////////
Keypair Keypair::fromPrivateKey(const SecureBinaryData& privKey)
{
   if (!CryptoSchnorr::checkPrivKeyIsValid(privKey))
      throw ConfigurationError("invalid private key",
         ArchErrorCodes::Config_KeyFile);

   Keypair kp;
   kp.privKey_ = privKey;
   kp.pubkey_ = Pubkey(CryptoSchnorr::computeXOnlyPubkey(privKey).getRef());
   return kp;
}

////////////////////////////////////////////////////////////////////////////////
Keypair Keypair::generate()
{
   while (true)
   {
      auto privKey = CryptoPRNG::generateRandom(PRIVKEY_LENGTH);
      if (CryptoSchnorr::checkPrivKeyIsValid(privKey))
         return fromPrivateKey(privKey);
   }
}

////////////////////////////////////////////////////////////////////////////////
Keypair Keypair::fromFile(const string& path)
{
   ifstream fs(path, ios::in);
   if (!fs.good())
      throw ConfigurationError("cannot open keypair file: " + path,
         ArchErrorCodes::Config_KeyFile);

   stringstream content;
   content << fs.rdbuf();

   try
   {
      auto obj = JSON_decode(content.str());
      auto privPtr = dynamic_pointer_cast<JSON_string>(
         obj.getValForKey("privkey"));
      if (privPtr == nullptr)
         throw JSON_Exception("missing privkey");

      auto privKey = SecureBinaryData::CreateFromHex(privPtr->val_);
      auto kp = fromPrivateKey(privKey);

      //pubkey is optional, but has to match when present
      auto pubPtr = dynamic_pointer_cast<JSON_string>(
         obj.getValForKey("pubkey"));
      if (pubPtr != nullptr && Pubkey::fromHex(pubPtr->val_) != kp.pubkey_)
      {
         throw ConfigurationError("pubkey mismatch in keypair file: " + path,
            ArchErrorCodes::Config_KeyFile);
      }

      return kp;
   }
   catch (const JSON_Exception& e)
   {
      LOGERR << "malformed keypair file " << path << ": " << e.what();
      throw ConfigurationError("malformed keypair file: " + path,
         ArchErrorCodes::Config_KeyFile);
   }
}

////////////////////////////////////////////////////////////////////////////////
void Keypair::toFile(const string& path, const string& hrp) const
{
   JSON_object obj;
   obj.add_pair("privkey", privKey_.toHexStr());
   obj.add_pair("pubkey", pubkey_.toHexStr());
   obj.add_pair("address", pubkey_.toTaprootAddress(hrp));

   ofstream fs(path, ios::out | ios::trunc);
   if (!fs.good())
      throw ConfigurationError("cannot write keypair file: " + path,
         ArchErrorCodes::Config_KeyFile);

   fs << JSON_serialize(obj) << endl;
}
