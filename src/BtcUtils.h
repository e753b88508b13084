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

#ifndef _H_BTCUTILS_
#define _H_BTCUTILS_

#include <string>
#include <vector>
#include <utility>

#include "BinaryData.h"

#define SEGWIT_ADDRESS_MAINNET_HEADER "bc"
#define SEGWIT_ADDRESS_TESTNET_HEADER "tb"
#define SEGWIT_ADDRESS_REGTEST_HEADER "bcrt"

////////////////////////////////////////////////////////////////////////////////
class BtcUtils
{
public:
   //var_int
   static uint64_t readVarInt(uint8_t const * strmPtr, size_t remaining,
      uint32_t* lenOutPtr = nullptr);
   static uint32_t calcVarIntSize(uint64_t regularInteger);

   //hashes
   static BinaryData getSha256(BinaryDataRef strToHash);
   static BinaryData getHash256(BinaryDataRef strToHash);

   //BIP340 tagged hash: sha256(sha256(tag) | sha256(tag) | msg)
   static BinaryData getTaggedHash(const std::string& tag, BinaryDataRef msg);

   //sha256 rendered as a lowercase hex string
   static std::string getSha256Hex(BinaryDataRef strToHash);

   //base64
   static std::string base64_encode(const std::string&);
   static std::string base64_decode(const std::string&);

   //bech32m (BIP350) segwit v1+ addresses
   static std::string scrAddrToSegWitAddress(BinaryDataRef witnessProgram,
      unsigned witnessVersion, const std::string& hrp);
   static std::pair<BinaryData, unsigned> segWitAddressToScrAddr(
      const std::string& address, const std::string& hrp);

private:
   static uint32_t bech32Polymod(const std::vector<uint8_t>&);
   static std::vector<uint8_t> bech32ExpandHrp(const std::string&);
   static std::vector<uint8_t> convertBits(BinaryDataRef data,
      unsigned fromBits, unsigned toBits, bool pad);
};

#endif
