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

#ifndef _H_BINARYDATA_
#define _H_BINARYDATA_

#include <stdint.h>
#include <string.h>
#include <sys/types.h>
#include <algorithm>
#include <string>
#include <vector>
#include <stdexcept>

enum ENDIAN
{
   LE,
   BE
};

class BinaryDataRef;

////////////////////////////////////////////////////////////////////////////////
class BinaryData
{
protected:
   std::vector<uint8_t> data_;

private:
   void alloc(size_t sz)
   {
      if (sz != getSize())
      {
         data_.clear();
         data_.resize(sz);
      }
   }

public:
   BinaryData(void) {}
   explicit BinaryData(size_t sz) { alloc(sz); }
   BinaryData(uint8_t const * inData, size_t sz)
   { copyFrom(inData, sz); }
   BinaryData(uint8_t const * dstart, uint8_t const * dend)
   { copyFrom(dstart, dend); }
   explicit BinaryData(const std::string& str) { copyFrom(str); }
   BinaryData(BinaryDataRef const & bdRef);
   BinaryData(const BinaryData&) = default;
   BinaryData(BinaryData&&) = default;

   BinaryData& operator=(const BinaryData&) = default;
   BinaryData& operator=(BinaryData&&) = default;

   static BinaryData fromString(const std::string& str, size_t len = 0)
   {
      if (len == 0)
         len = str.size();

      BinaryData out(len);
      if (str.size() > 0)
         memcpy(out.getPtr(), str.c_str(), std::min(len, str.size()));
      return out;
   }

   static BinaryData CreateFromHex(const std::string& str)
   {
      BinaryData out;
      out.createFromHex(str);
      return out;
   }

   //accessors
   uint8_t const * getPtr(void) const
   {
      if (getSize() == 0)
         return nullptr;
      return &(data_[0]);
   }

   uint8_t* getPtr(void)
   {
      if (getSize() == 0)
         return nullptr;
      return &(data_[0]);
   }

   char const * getCharPtr(void) const
   { return reinterpret_cast<char const *>(getPtr()); }

   size_t getSize(void) const { return data_.size(); }
   bool empty(void) const { return data_.empty(); }
   BinaryDataRef getRef(void) const;

   const std::vector<uint8_t>& getDataVector(void) const { return data_; }

   //copy
   void copyFrom(uint8_t const * inData, size_t sz)
   {
      if (inData == nullptr || sz == 0)
      {
         data_.clear();
         return;
      }

      alloc(sz);
      memcpy(&(data_[0]), inData, sz);
   }

   void copyFrom(uint8_t const * start, uint8_t const * end)
   { copyFrom(start, (end - start)); }

   void copyFrom(const std::string& str)
   { copyFrom((uint8_t*)str.c_str(), str.size()); }

   void copyFrom(BinaryDataRef const & bdr);

   void copyTo(uint8_t* outData) const
   {
      if (getSize() > 0)
         memcpy(outData, &(data_[0]), getSize());
   }

   void copyTo(uint8_t* outData, size_t offset, size_t sz) const
   {
      if (sz > 0)
         memcpy(outData, &(data_[offset]), sz);
   }

   //append
   BinaryData& append(BinaryDataRef const & bd2);
   BinaryData& append(BinaryData const & bd2);
   BinaryData& append(uint8_t const * str, size_t sz);
   BinaryData& append(uint8_t byte)
   {
      data_.push_back(byte);
      return *this;
   }

   //slicing
   BinaryDataRef getSliceRef(size_t start_pos, size_t nChar) const;
   BinaryData getSliceCopy(size_t start_pos, size_t nChar) const;

   bool startsWith(BinaryDataRef const & matchStr) const;
   bool isZero(void) const;

   //sizing
   void resize(size_t sz) { data_.resize(sz); }
   void reserve(size_t sz) { data_.reserve(sz); }
   void clear(void) { data_.clear(); }

   //hex
   std::string toHexStr(bool bigEndian = false) const;
   std::string toBinStr(bool bigEndian = false) const;
   void createFromHex(const std::string& str);
   void createFromHex(BinaryDataRef const & bdr);

   //operators
   uint8_t& operator[](ssize_t i)
   { return (i < 0 ? data_[getSize() + i] : data_[i]); }
   uint8_t operator[](ssize_t i) const
   { return (i < 0 ? data_[getSize() + i] : data_[i]); }

   bool operator<(BinaryData const & bd2) const;
   bool operator==(BinaryData const & bd2) const;
   bool operator!=(BinaryData const & bd2) const { return !((*this) == bd2); }
   bool operator==(BinaryDataRef const & bd2) const;
   bool operator!=(BinaryDataRef const & bd2) const
   { return !((*this) == bd2); }

   //integer conversion
   template<typename T>
   static T StrToIntLE(uint8_t const * ptr)
   {
      T out = 0;
      for (unsigned i = 0; i < sizeof(T); i++)
         out |= ((T)ptr[i]) << (8 * i);
      return out;
   }

   template<typename T>
   static T StrToIntBE(uint8_t const * ptr)
   {
      T out = 0;
      for (unsigned i = 0; i < sizeof(T); i++)
         out = (out << 8) | (T)ptr[i];
      return out;
   }
};

////////////////////////////////////////////////////////////////////////////////
class BinaryDataRef
{
private:
   uint8_t const * ptr_ = nullptr;
   size_t nBytes_ = 0;

public:
   BinaryDataRef(void) {}
   BinaryDataRef(uint8_t const * inData, size_t sz) :
      ptr_(inData), nBytes_(sz)
   {}
   BinaryDataRef(uint8_t const * dstart, uint8_t const * dend) :
      ptr_(dstart), nBytes_(dend - dstart)
   {}
   BinaryDataRef(BinaryData const & bd) :
      ptr_(bd.getPtr()), nBytes_(bd.getSize())
   {}

   uint8_t const * getPtr(void) const { return ptr_; }
   char const * getCharPtr(void) const
   { return reinterpret_cast<char const *>(ptr_); }
   size_t getSize(void) const { return nBytes_; }
   bool empty(void) const { return nBytes_ == 0; }

   void copyTo(uint8_t* outData, size_t offset, size_t sz) const
   {
      if (sz > 0)
         memcpy(outData, ptr_ + offset, sz);
   }

   BinaryData copy(void) const { return BinaryData(ptr_, nBytes_); }
   BinaryDataRef getSliceRef(size_t start_pos, size_t nChar) const;

   std::string toHexStr(bool bigEndian = false) const;
   std::string toBinStr(void) const
   {
      if (nBytes_ == 0)
         return std::string();
      return std::string(getCharPtr(), nBytes_);
   }

   uint8_t operator[](size_t i) const { return ptr_[i]; }

   bool operator==(BinaryDataRef const & bd2) const;
   bool operator!=(BinaryDataRef const & bd2) const
   { return !((*this) == bd2); }
   bool operator==(BinaryData const & bd2) const
   { return (*this) == bd2.getRef(); }
   bool operator<(BinaryDataRef const & bd2) const;
};

////////////////////////////////////////////////////////////////////////////////
class BinaryWriter
{
private:
   BinaryData theString_;

public:
   BinaryWriter(void) {}
   explicit BinaryWriter(size_t reserveSize)
   {
      theString_.reserve(reserveSize);
   }

   void put_uint8_t(uint8_t val) { theString_.append(val); }

   void put_uint16_t(uint16_t val, ENDIAN e = LE)
   { putInt<uint16_t>(val, e); }

   void put_uint32_t(uint32_t val, ENDIAN e = LE)
   { putInt<uint32_t>(val, e); }

   void put_int32_t(int32_t val, ENDIAN e = LE)
   { putInt<uint32_t>((uint32_t)val, e); }

   void put_uint64_t(uint64_t val, ENDIAN e = LE)
   { putInt<uint64_t>(val, e); }

   void put_var_int(uint64_t val);

   void put_BinaryData(BinaryData const & bd)
   { theString_.append(bd); }

   void put_BinaryDataRef(BinaryDataRef const & bdr)
   { theString_.append(bdr); }

   void put_BinaryData(uint8_t const * ptr, size_t sz)
   { theString_.append(ptr, sz); }

   void put_String(const std::string& str)
   { theString_.append((uint8_t const*)str.c_str(), str.size()); }

   const BinaryData& getData(void) const { return theString_; }
   BinaryDataRef getDataRef(void) const { return theString_.getRef(); }
   size_t getSize(void) const { return theString_.getSize(); }
   void reset(void) { theString_.clear(); }

private:
   template<typename T> void putInt(T val, ENDIAN e)
   {
      uint8_t buf[sizeof(T)];
      for (unsigned i = 0; i < sizeof(T); i++)
      {
         auto shift = 8 * (e == LE ? i : sizeof(T) - 1 - i);
         buf[i] = (uint8_t)((val >> shift) & 0xFF);
      }

      theString_.append(buf, sizeof(T));
   }
};

////////////////////////////////////////////////////////////////////////////////
class BinaryRefReader
{
private:
   BinaryDataRef bdRef_;
   size_t totalSize_ = 0;
   size_t pos_ = 0;

public:
   BinaryRefReader(void) {}
   BinaryRefReader(BinaryDataRef const & bdr) :
      bdRef_(bdr), totalSize_(bdr.getSize())
   {}
   BinaryRefReader(BinaryData const & bd) :
      bdRef_(bd.getRef()), totalSize_(bd.getSize())
   {}
   BinaryRefReader(uint8_t const * ptr, size_t sz) :
      bdRef_(ptr, sz), totalSize_(sz)
   {}

   void advance(size_t nBytes);
   void resetPosition(void);

   uint8_t get_uint8_t(void);
   uint16_t get_uint16_t(ENDIAN e = LE);
   uint32_t get_uint32_t(ENDIAN e = LE);
   uint64_t get_uint64_t(ENDIAN e = LE);
   uint64_t get_var_int(uint8_t* nRead = nullptr);

   BinaryDataRef get_BinaryDataRef(size_t nBytes);
   BinaryData get_BinaryData(size_t nBytes);
   std::string get_String(size_t nBytes);

   size_t getPosition(void) const { return pos_; }
   size_t getSize(void) const { return totalSize_; }
   size_t getSizeRemaining(void) const { return totalSize_ - pos_; }
   bool isEndOfStream(void) const { return pos_ >= totalSize_; }
   BinaryDataRef getRawRef(void) const { return bdRef_; }
};

#endif
