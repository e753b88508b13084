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

#ifndef _H_SECUREBINARYDATA_
#define _H_SECUREBINARYDATA_

#include "BinaryData.h"

////////////////////////////////////////////////////////////////////////////////
// Key material container, wiped on destruction and before reallocation
class SecureBinaryData : public BinaryData
{
private:
   void wipe(void)
   {
      if (getSize() > 0)
      {
         volatile uint8_t* ptr = getPtr();
         for (size_t i = 0; i < getSize(); i++)
            ptr[i] = 0;
      }
   }

public:
   SecureBinaryData(void) {}
   explicit SecureBinaryData(size_t sz) : BinaryData(sz) {}
   SecureBinaryData(uint8_t const * inData, size_t sz) :
      BinaryData(inData, sz)
   {}
   SecureBinaryData(BinaryDataRef const & bdr) : BinaryData(bdr) {}
   SecureBinaryData(BinaryData const & bd) : BinaryData(bd) {}

   SecureBinaryData(const SecureBinaryData&) = default;
   SecureBinaryData(SecureBinaryData&&) = default;
   SecureBinaryData& operator=(const SecureBinaryData& rhs)
   {
      if (this == &rhs)
         return *this;

      wipe();
      BinaryData::operator=(rhs);
      return *this;
   }

   SecureBinaryData& operator=(SecureBinaryData&& rhs)
   {
      wipe();
      BinaryData::operator=(std::move(rhs));
      return *this;
   }

   ~SecureBinaryData(void) { wipe(); }

   static SecureBinaryData CreateFromHex(const std::string& str)
   {
      BinaryData bd = BinaryData::CreateFromHex(str);
      SecureBinaryData out(bd);
      auto ptr = bd.getPtr();
      for (size_t i = 0; i < bd.getSize(); i++)
         ptr[i] = 0;
      return out;
   }
};

#endif
