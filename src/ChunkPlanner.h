////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016-2021, goatpig                                          //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_CHUNK_PLANNER_
#define _H_CHUNK_PLANNER_

#include <cstdint>
#include <cstddef>
#include <vector>

#define DEFAULT_TX_CEILING 10240
#define DEFAULT_TX_INFLATION 8
#define DEFAULT_MIN_CHUNK 1000

////
struct ChunkDescriptor
{
   uint32_t offset_;
   uint32_t length_;

   ChunkDescriptor(uint32_t offset, uint32_t length) :
      offset_(offset), length_(length)
   {}
};

////////////////////////////////////////////////////////////////////////////////
class ChunkPlanner
{
private:
   const size_t ceiling_;
   const size_t inflation_;
   const size_t minChunk_;

public:
   //throws runtime_error on a zero inflation factor or minimum chunk
   ChunkPlanner(size_t ceiling = DEFAULT_TX_CEILING,
      size_t inflation = DEFAULT_TX_INFLATION,
      size_t minChunk = DEFAULT_MIN_CHUNK);

   //planner built from DeploySettings
   static ChunkPlanner fromSettings(void);

   /***
   Serialized size of a signed Write tx carrying an empty chunk: one
   signature, 3 account keys (authority, program, loader), a single
   instruction with 2 account indices.
   ***/
   static size_t fixedWriteTransactionOverhead(void);

   /***
   Largest chunk whose estimated write transaction fits the ceiling. The
   bound is inclusive: estimateWriteTransactionSize(maxChunkSize()) may equal
   the ceiling exactly (1042 bytes -> 10240 with the defaults), one more byte
   goes over. Falls back to the minimum chunk when that floor is larger.
   ***/
   size_t maxChunkSize(void) const;

   //(fixed overhead + chunk) * inflation
   size_t estimateWriteTransactionSize(size_t chunkLen) const;

   //contiguous, gap free, in offset order. Empty for a 0 length binary.
   std::vector<ChunkDescriptor> plan(size_t binaryLength) const;
};

#endif
