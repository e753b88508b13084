////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2011-2015, Armory Technologies, Inc.                        //
//  Distributed under the GNU Affero General Public License (AGPL v3)         //
//  See LICENSE-ATI or http://www.gnu.org/licenses/agpl.html                  //
//                                                                            //
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cctype>

#include "BtcUtils.h"
#include "EncryptionUtils.h"
#include "log.h"

using namespace std;

#define BECH32M_CONST 0x2bc830a3

static const char* bech32Charset_ = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
static const char* base64Chars_ =
   "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

////////////////////////////////////////////////////////////////////////////////
uint64_t BtcUtils::readVarInt(uint8_t const * strmPtr, size_t remaining,
   uint32_t* lenOutPtr)
{
   if (remaining < 1)
      throw runtime_error("[readVarInt] buffer overflow");

   uint8_t firstByte = strmPtr[0];
   uint32_t len = 1;
   uint64_t val = firstByte;

   switch (firstByte)
   {
   case 0xfd:
      len = 3;
      break;
   case 0xfe:
      len = 5;
      break;
   case 0xff:
      len = 9;
      break;
   default:
      break;
   }

   if (remaining < len)
      throw runtime_error("[readVarInt] buffer overflow");

   switch (len)
   {
   case 3:
      val = BinaryData::StrToIntLE<uint16_t>(strmPtr + 1);
      break;
   case 5:
      val = BinaryData::StrToIntLE<uint32_t>(strmPtr + 1);
      break;
   case 9:
      val = BinaryData::StrToIntLE<uint64_t>(strmPtr + 1);
      break;
   default:
      break;
   }

   if (lenOutPtr != nullptr)
      *lenOutPtr = len;
   return val;
}

////////////////////////////////////////////////////////////////////////////////
uint32_t BtcUtils::calcVarIntSize(uint64_t regularInteger)
{
   if (regularInteger < 0xfd)
      return 1;
   else if (regularInteger <= UINT16_MAX)
      return 3;
   else if (regularInteger <= UINT32_MAX)
      return 5;
   else
      return 9;
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BtcUtils::getSha256(BinaryDataRef strToHash)
{
   BinaryData digest(32);
   CryptoSHA2::getSha256(strToHash, digest.getPtr());
   return digest;
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BtcUtils::getHash256(BinaryDataRef strToHash)
{
   BinaryData digest(32);
   CryptoSHA2::getHash256(strToHash, digest.getPtr());
   return digest;
}

////////////////////////////////////////////////////////////////////////////////
BinaryData BtcUtils::getTaggedHash(const string& tag, BinaryDataRef msg)
{
   auto tagHash = getSha256(BinaryData::fromString(tag));

   BinaryWriter bw(64 + msg.getSize());
   bw.put_BinaryData(tagHash);
   bw.put_BinaryData(tagHash);
   bw.put_BinaryDataRef(msg);

   return getSha256(bw.getDataRef());
}

////////////////////////////////////////////////////////////////////////////////
string BtcUtils::getSha256Hex(BinaryDataRef strToHash)
{
   return getSha256(strToHash).toHexStr();
}

////////////////////////////////////////////////////////////////////////////////
string BtcUtils::base64_encode(const string& in)
{
   string out;
   out.reserve(((in.size() + 2) / 3) * 4);

   unsigned val = 0;
   int valb = -6;
   for (auto c : in)
   {
      val = (val << 8) + (uint8_t)c;
      valb += 8;
      while (valb >= 0)
      {
         out.push_back(base64Chars_[(val >> valb) & 0x3F]);
         valb -= 6;
      }
   }

   if (valb > -6)
      out.push_back(base64Chars_[((val << 8) >> (valb + 8)) & 0x3F]);

   while (out.size() % 4)
      out.push_back('=');

   return out;
}

////////////////////////////////////////////////////////////////////////////////
string BtcUtils::base64_decode(const string& in)
{
   int lookup[256];
   for (auto& val : lookup)
      val = -1;
   for (int i = 0; i < 64; i++)
      lookup[(uint8_t)base64Chars_[i]] = i;

   string out;
   unsigned val = 0;
   int valb = -8;
   for (auto c : in)
   {
      if (c == '=')
         break;

      auto decoded = lookup[(uint8_t)c];
      if (decoded == -1)
         throw runtime_error("invalid base64 character");

      val = (val << 6) + decoded;
      valb += 6;
      if (valb >= 0)
      {
         out.push_back(char((val >> valb) & 0xFF));
         valb -= 8;
      }
   }

   return out;
}

////////////////////////////////////////////////////////////////////////////////
uint32_t BtcUtils::bech32Polymod(const vector<uint8_t>& values)
{
   static const uint32_t gen[5] = {
      0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };

   uint32_t chk = 1;
   for (auto val : values)
   {
      uint32_t top = chk >> 25;
      chk = ((chk & 0x1ffffff) << 5) ^ val;
      for (unsigned i = 0; i < 5; i++)
      {
         if ((top >> i) & 1)
            chk ^= gen[i];
      }
   }

   return chk;
}

////////////////////////////////////////////////////////////////////////////////
vector<uint8_t> BtcUtils::bech32ExpandHrp(const string& hrp)
{
   vector<uint8_t> result;
   result.reserve(hrp.size() * 2 + 1);
   for (auto c : hrp)
      result.push_back((uint8_t)c >> 5);
   result.push_back(0);
   for (auto c : hrp)
      result.push_back((uint8_t)c & 0x1f);

   return result;
}

////////////////////////////////////////////////////////////////////////////////
vector<uint8_t> BtcUtils::convertBits(BinaryDataRef data,
   unsigned fromBits, unsigned toBits, bool pad)
{
   vector<uint8_t> result;
   uint32_t acc = 0;
   unsigned bits = 0;
   const uint32_t maxv = (1 << toBits) - 1;

   for (size_t i = 0; i < data.getSize(); i++)
   {
      uint32_t val = data[i];
      if ((val >> fromBits) != 0)
         throw runtime_error("[convertBits] invalid input value");

      acc = (acc << fromBits) | val;
      bits += fromBits;
      while (bits >= toBits)
      {
         bits -= toBits;
         result.push_back((acc >> bits) & maxv);
      }
   }

   if (pad)
   {
      if (bits > 0)
         result.push_back((acc << (toBits - bits)) & maxv);
   }
   else if (bits >= fromBits || ((acc << (toBits - bits)) & maxv) != 0)
   {
      throw runtime_error("[convertBits] invalid padding");
   }

   return result;
}

////////////////////////////////////////////////////////////////////////////////
string BtcUtils::scrAddrToSegWitAddress(BinaryDataRef witnessProgram,
   unsigned witnessVersion, const string& hrp)
{
   if (witnessVersion == 0 || witnessVersion > 16)
      throw runtime_error("bech32m only covers witness versions 1 to 16");

   if (witnessProgram.getSize() < 2 || witnessProgram.getSize() > 40)
      throw runtime_error("invalid witness program length");

   vector<uint8_t> data;
   data.push_back((uint8_t)witnessVersion);
   auto converted = convertBits(witnessProgram, 8, 5, true);
   data.insert(data.end(), converted.begin(), converted.end());

   //checksum
   auto values = bech32ExpandHrp(hrp);
   values.insert(values.end(), data.begin(), data.end());
   values.resize(values.size() + 6, 0);
   auto mod = bech32Polymod(values) ^ BECH32M_CONST;

   string result = hrp;
   result.push_back('1');
   for (auto val : data)
      result.push_back(bech32Charset_[val]);
   for (unsigned i = 0; i < 6; i++)
      result.push_back(bech32Charset_[(mod >> (5 * (5 - i))) & 31]);

   return result;
}

////////////////////////////////////////////////////////////////////////////////
pair<BinaryData, unsigned> BtcUtils::segWitAddressToScrAddr(
   const string& address, const string& hrp)
{
   string lowered;
   lowered.reserve(address.size());
   for (auto c : address)
      lowered.push_back((char)tolower(c));

   auto sepPos = lowered.rfind('1');
   if (sepPos == string::npos || sepPos + 7 > lowered.size())
      throw runtime_error("invalid bech32m address");

   if (lowered.substr(0, sepPos) != hrp)
      throw runtime_error("bech32m address hrp mismatch");

   vector<uint8_t> data;
   string charset(bech32Charset_);
   for (size_t i = sepPos + 1; i < lowered.size(); i++)
   {
      auto pos = charset.find(lowered[i]);
      if (pos == string::npos)
         throw runtime_error("invalid bech32m character");
      data.push_back((uint8_t)pos);
   }

   auto values = bech32ExpandHrp(hrp);
   values.insert(values.end(), data.begin(), data.end());
   if (bech32Polymod(values) != BECH32M_CONST)
      throw runtime_error("invalid bech32m checksum");

   unsigned version = data[0];
   BinaryData fiveBits(data.data() + 1, data.size() - 7);
   auto program = convertBits(fiveBits, 5, 8, false);
   if (version == 1 && program.size() != 32)
      throw runtime_error("invalid witness v1 program length");

   return make_pair(BinaryData(program.data(), program.size()), version);
}
