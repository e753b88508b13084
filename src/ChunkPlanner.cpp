////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <stdexcept>

#include "ChunkPlanner.h"
#include "ArchConfig.h"
#include "Pubkey.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
ChunkPlanner::ChunkPlanner(size_t ceiling, size_t inflation, size_t minChunk) :
   ceiling_(ceiling), inflation_(inflation), minChunk_(minChunk)
{
   if (inflation_ == 0)
      throw runtime_error("tx size inflation factor cannot be 0");

   if (minChunk_ == 0)
      throw runtime_error("minimum chunk size cannot be 0");
}

////////////////////////////////////////////////////////////////////////////////
ChunkPlanner ChunkPlanner::fromSettings()
{
   using namespace ArchDeploy::Config;
   return ChunkPlanner(
      DeploySettings::txCeiling(),
      DeploySettings::inflation(),
      DeploySettings::minChunk());
}

////////////////////////////////////////////////////////////////////////////////
size_t ChunkPlanner::fixedWriteTransactionOverhead()
{
   size_t size = 0;

   //tx: version, signature count, 1 signature
   size += 4 + 4 + SIGNATURE_LENGTH;

   //message: header, key count, authority + program + loader keys, blockhash
   size += 3 + 4 + 3 * PUBKEY_LENGTH + BLOCKHASH_LENGTH;

   //single instruction: program id index, 2 account indices, data length
   size += 4 + 1 + (4 + 2) + 4;

   //write payload: discriminant, offset, byte vector length prefix
   size += 4 + 4 + 8;

   return size;
}

////////////////////////////////////////////////////////////////////////////////
size_t ChunkPlanner::maxChunkSize() const
{
   auto overhead = fixedWriteTransactionOverhead();
   auto budget = ceiling_ / inflation_;
   if (budget <= overhead)
      return minChunk_;

   return max(minChunk_, budget - overhead);
}

////////////////////////////////////////////////////////////////////////////////
size_t ChunkPlanner::estimateWriteTransactionSize(size_t chunkLen) const
{
   return (fixedWriteTransactionOverhead() + chunkLen) * inflation_;
}

////////////////////////////////////////////////////////////////////////////////
vector<ChunkDescriptor> ChunkPlanner::plan(size_t binaryLength) const
{
   if (binaryLength > UINT32_MAX)
      throw runtime_error("binary exceeds the loader offset range");

   vector<ChunkDescriptor> result;
   auto chunkSize = maxChunkSize();

   size_t offset = 0;
   while (offset < binaryLength)
   {
      auto len = min(chunkSize, binaryLength - offset);
      result.emplace_back((uint32_t)offset, (uint32_t)len);
      offset += len;
   }

   return result;
}
