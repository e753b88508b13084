////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2011-2015, Armory Technologies, Inc.                        //
//  Distributed under the GNU Affero General Public License (AGPL v3)         //
//  See LICENSE-ATI or http://www.gnu.org/licenses/agpl.html                  //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include "BinaryData.h"
#include "BtcUtils.h"
#include "log.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
BinaryData::BinaryData(BinaryDataRef const & bdRef)
{
   copyFrom(bdRef.getPtr(), bdRef.getSize());
}

////////////////////////////////////////////////////////////////////////////////
void BinaryData::copyFrom(BinaryDataRef const & bdr)
{
   copyFrom(bdr.getPtr(), bdr.getSize());
}

////////////////////////////////////////////////////////////////////////////////
BinaryDataRef BinaryData::getRef(void) const
{
   return BinaryDataRef(getPtr(), getSize());
}

////////////////////////////////////////////////////////////////////////////////
BinaryData& BinaryData::append(BinaryDataRef const & bd2)
{
   if (bd2.getSize() == 0)
      return (*this);

   data_.insert(data_.end(), bd2.getPtr(), bd2.getPtr() + bd2.getSize());
   return (*this);
}

////////////////////////////////////////////////////////////////////////////////
BinaryData& BinaryData::append(BinaryData const & bd2)
{
   return append(bd2.getRef());
}

////////////////////////////////////////////////////////////////////////////////
BinaryData& BinaryData::append(uint8_t const * str, size_t sz)
{
   BinaryDataRef appStr(str, sz);
   return append(appStr);
}

////////////////////////////////////////////////////////////////////////////////
bool BinaryData::startsWith(BinaryDataRef const & matchStr) const
{
   if (matchStr.getSize() > getSize())
      return false;

   for (size_t i = 0; i < matchStr.getSize(); i++)
   {
      if (matchStr[i] != (*this)[i])
         return false;
   }

   return true;
}

/////////////////////////////////////////////////////////////////////////////
BinaryDataRef BinaryData::getSliceRef(size_t start_pos, size_t nChar) const
{
   if (start_pos + nChar > getSize())
   {
      LOGERR << "getSliceRef: Invalid BinaryData access";
      throw range_error("invalid BinaryData slice");
   }

   return BinaryDataRef(getPtr() + start_pos, nChar);
}

/////////////////////////////////////////////////////////////////////////////
BinaryData BinaryData::getSliceCopy(size_t start_pos, size_t nChar) const
{
   return BinaryData(getSliceRef(start_pos, nChar));
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryData::isZero() const
{
   for (auto& val : data_)
   {
      if (val != 0)
         return false;
   }

   return true;
}

/////////////////////////////////////////////////////////////////////////////
string BinaryData::toHexStr(bool bigEndian) const
{
   return getRef().toHexStr(bigEndian);
}

/////////////////////////////////////////////////////////////////////////////
string BinaryData::toBinStr(bool bigEndian) const
{
   if (getSize() == 0)
      return string();

   string out(getCharPtr(), getSize());
   if (bigEndian)
      reverse(out.begin(), out.end());
   return out;
}

/////////////////////////////////////////////////////////////////////////////
void BinaryData::createFromHex(const string& str)
{
   BinaryDataRef bdr((uint8_t*)str.c_str(), str.size());
   createFromHex(bdr);
}

/////////////////////////////////////////////////////////////////////////////
void BinaryData::createFromHex(BinaryDataRef const & bdr)
{
   auto hexitVal = [](uint8_t c)->int
   {
      if (c >= '0' && c <= '9')
         return c - '0';
      if (c >= 'a' && c <= 'f')
         return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
         return c - 'A' + 10;
      return -1;
   };

   if (bdr.getSize() % 2 != 0)
   {
      LOGERR << "odd hexit count";
      throw runtime_error("odd hexit count");
   }

   size_t newLen = bdr.getSize() / 2;
   alloc(newLen);

   auto ptr = bdr.getPtr();
   for (size_t i = 0; i < newLen; i++)
   {
      auto char1 = hexitVal(*(ptr + 2 * i));
      auto char2 = hexitVal(*(ptr + 2 * i + 1));
      if (char1 == -1 || char2 == -1)
      {
         LOGERR << "invalid hexit";
         throw runtime_error("invalid hexit");
      }

      data_[i] = (uint8_t)((char1 << 4) | char2);
   }
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryData::operator==(BinaryDataRef const & bd2) const
{
   return getRef() == bd2;
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryData::operator==(BinaryData const & bd2) const
{
   return data_ == bd2.data_;
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryData::operator<(BinaryData const & bd2) const
{
   return getRef() < bd2.getRef();
}

/////////////////////////////////////////////////////////////////////////////
//
////BinaryDataRef
//
/////////////////////////////////////////////////////////////////////////////
BinaryDataRef BinaryDataRef::getSliceRef(size_t start_pos, size_t nChar) const
{
   if (start_pos + nChar > nBytes_)
   {
      LOGERR << "getSliceRef: Invalid BinaryDataRef access";
      throw range_error("invalid BinaryDataRef slice");
   }

   return BinaryDataRef(ptr_ + start_pos, nChar);
}

/////////////////////////////////////////////////////////////////////////////
string BinaryDataRef::toHexStr(bool bigEndian) const
{
   static const char hexLookup[] = "0123456789abcdef";

   string out;
   out.resize(nBytes_ * 2);
   for (size_t i = 0; i < nBytes_; i++)
   {
      auto pos = bigEndian ? nBytes_ - 1 - i : i;
      auto val = ptr_[pos];
      out[2 * i] = hexLookup[val >> 4];
      out[2 * i + 1] = hexLookup[val & 0x0F];
   }

   return out;
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryDataRef::operator==(BinaryDataRef const & bd2) const
{
   if (nBytes_ != bd2.nBytes_)
      return false;

   if (nBytes_ == 0)
      return true;

   return memcmp(ptr_, bd2.ptr_, nBytes_) == 0;
}

/////////////////////////////////////////////////////////////////////////////
bool BinaryDataRef::operator<(BinaryDataRef const & bd2) const
{
   size_t minLen = min(nBytes_, bd2.nBytes_);
   for (size_t i = 0; i < minLen; i++)
   {
      if (ptr_[i] == bd2.ptr_[i])
         continue;
      return ptr_[i] < bd2.ptr_[i];
   }

   return nBytes_ < bd2.nBytes_;
}

/////////////////////////////////////////////////////////////////////////////
//
////BinaryWriter
//
/////////////////////////////////////////////////////////////////////////////
void BinaryWriter::put_var_int(uint64_t val)
{
   if (val < 0xfd)
   {
      put_uint8_t((uint8_t)val);
   }
   else if (val <= UINT16_MAX)
   {
      put_uint8_t(0xfd);
      put_uint16_t((uint16_t)val);
   }
   else if (val <= UINT32_MAX)
   {
      put_uint8_t(0xfe);
      put_uint32_t((uint32_t)val);
   }
   else
   {
      put_uint8_t(0xff);
      put_uint64_t(val);
   }
}

/////////////////////////////////////////////////////////////////////////////
//
////BinaryRefReader
//
/////////////////////////////////////////////////////////////////////////////
void BinaryRefReader::advance(size_t nBytes)
{
   if (getSizeRemaining() < nBytes)
      throw runtime_error("[advance] buffer overflow");

   pos_ += nBytes;
}

/////////////////////////////////////////////////////////////////////////////
void BinaryRefReader::resetPosition()
{
   pos_ = 0;
}

/////////////////////////////////////////////////////////////////////////////
uint8_t BinaryRefReader::get_uint8_t()
{
   if (getSizeRemaining() < 1)
   {
      LOGERR << "[get_uint8_t] buffer overflow";
      throw runtime_error("[get_uint8_t] buffer overflow");
   }

   uint8_t outVal = bdRef_[pos_];
   ++pos_;
   return outVal;
}

/////////////////////////////////////////////////////////////////////////////
uint16_t BinaryRefReader::get_uint16_t(ENDIAN e)
{
   if (getSizeRemaining() < 2)
   {
      LOGERR << "[get_uint16_t] buffer overflow";
      throw runtime_error("[get_uint16_t] buffer overflow");
   }

   uint16_t outVal = (e == LE ?
      BinaryData::StrToIntLE<uint16_t>(bdRef_.getPtr() + pos_) :
      BinaryData::StrToIntBE<uint16_t>(bdRef_.getPtr() + pos_));

   pos_ += 2;
   return outVal;
}

/////////////////////////////////////////////////////////////////////////////
uint32_t BinaryRefReader::get_uint32_t(ENDIAN e)
{
   if (getSizeRemaining() < 4)
   {
      LOGERR << "[get_uint32_t] buffer overflow";
      throw runtime_error("[get_uint32_t] buffer overflow");
   }

   uint32_t outVal = (e == LE ?
      BinaryData::StrToIntLE<uint32_t>(bdRef_.getPtr() + pos_) :
      BinaryData::StrToIntBE<uint32_t>(bdRef_.getPtr() + pos_));

   pos_ += 4;
   return outVal;
}

/////////////////////////////////////////////////////////////////////////////
uint64_t BinaryRefReader::get_uint64_t(ENDIAN e)
{
   if (getSizeRemaining() < 8)
   {
      LOGERR << "[get_uint64_t] buffer overflow";
      throw runtime_error("[get_uint64_t] buffer overflow");
   }

   uint64_t outVal = (e == LE ?
      BinaryData::StrToIntLE<uint64_t>(bdRef_.getPtr() + pos_) :
      BinaryData::StrToIntBE<uint64_t>(bdRef_.getPtr() + pos_));

   pos_ += 8;
   return outVal;
}

/////////////////////////////////////////////////////////////////////////////
uint64_t BinaryRefReader::get_var_int(uint8_t* nRead)
{
   uint32_t nBytes;
   uint64_t varInt = BtcUtils::readVarInt(
      bdRef_.getPtr() + pos_, getSizeRemaining(), &nBytes);
   if (nRead != nullptr)
      *nRead = (uint8_t)nBytes;
   pos_ += nBytes;
   return varInt;
}

/////////////////////////////////////////////////////////////////////////////
BinaryDataRef BinaryRefReader::get_BinaryDataRef(size_t nBytes)
{
   if (getSizeRemaining() < nBytes)
   {
      LOGERR << "[get_BinaryDataRef] buffer overflow";
      throw runtime_error("[get_BinaryDataRef] buffer overflow");
   }

   BinaryDataRef bdrefout(bdRef_.getPtr() + pos_, nBytes);
   pos_ += nBytes;
   return bdrefout;
}

/////////////////////////////////////////////////////////////////////////////
BinaryData BinaryRefReader::get_BinaryData(size_t nBytes)
{
   if (getSizeRemaining() < nBytes)
   {
      LOGERR << "[get_BinaryData] buffer overflow!";
      LOGERR << "grabbing " << nBytes <<
         " out of " << getSizeRemaining() << " bytes";
      throw runtime_error("[get_BinaryData] buffer overflow");
   }

   return BinaryData(get_BinaryDataRef(nBytes));
}

/////////////////////////////////////////////////////////////////////////////
string BinaryRefReader::get_String(size_t nBytes)
{
   auto bdr = get_BinaryDataRef(nBytes);
   return bdr.toBinStr();
}
