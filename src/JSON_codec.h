////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_JSON_CODEC_
#define _H_JSON_CODEC_

#include <atomic>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////
class JSON_Exception : public std::runtime_error
{
public:
   JSON_Exception(const std::string& err) :
      std::runtime_error(err)
   {}
};

////
enum JSON_Type
{
   JSON_Type_Null,
   JSON_Type_Bool,
   JSON_Type_Number,
   JSON_Type_String,
   JSON_Type_Array,
   JSON_Type_Object
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_value
{
   virtual ~JSON_value(void) = 0;
   virtual JSON_Type type(void) const = 0;
   virtual void serialize(std::ostream&) const = 0;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_null : public JSON_value
{
   JSON_Type type(void) const override { return JSON_Type_Null; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_bool : public JSON_value
{
   bool val_ = false;

   JSON_bool(void) {}
   JSON_bool(bool val) : val_(val) {}

   JSON_Type type(void) const override { return JSON_Type_Bool; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_number : public JSON_value
{
   double val_ = 0;

   //exact value for integers that do not fit a double mantissa
   uint64_t uval_ = 0;
   bool isUnsigned_ = false;

   JSON_number(void) {}
   JSON_number(double val) : val_(val) {}
   JSON_number(uint64_t val) :
      val_((double)val), uval_(val), isUnsigned_(true)
   {}

   uint64_t getUint64(void) const;

   JSON_Type type(void) const override { return JSON_Type_Number; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_string : public JSON_value
{
   std::string val_;

   JSON_string(void) {}
   JSON_string(const std::string& val) : val_(val) {}

   JSON_Type type(void) const override { return JSON_Type_String; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_array : public JSON_value
{
   std::vector<std::shared_ptr<JSON_value>> values_;

   void add_value(const std::string&);
   void add_value(const char*);
   void add_value(double);
   void add_value(uint64_t);
   void add_value(unsigned);
   void add_value(int);
   void add_value(bool);
   void add_value(std::shared_ptr<JSON_value>);

   size_t size(void) const { return values_.size(); }
   std::shared_ptr<JSON_value> operator[](size_t) const;

   JSON_Type type(void) const override { return JSON_Type_Array; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
struct JSON_object : public JSON_value
{
private:
   static std::atomic<unsigned> idCounter_;

public:
   std::map<std::string, std::shared_ptr<JSON_value>> keyval_pairs_;
   const unsigned id_;

public:
   JSON_object(void);

   void add_pair(const std::string&, const std::string&);
   void add_pair(const std::string&, const char*);
   void add_pair(const std::string&, double);
   void add_pair(const std::string&, uint64_t);
   void add_pair(const std::string&, unsigned);
   void add_pair(const std::string&, int);
   void add_pair(const std::string&, bool);
   void add_pair(const std::string&, std::shared_ptr<JSON_value>);

   std::shared_ptr<JSON_value> getValForKey(const std::string&) const;

   //true if the id matches and the response carries a result and no error
   bool isResponseValid(unsigned id) const;

   JSON_Type type(void) const override { return JSON_Type_Object; }
   void serialize(std::ostream&) const override;
};

////////////////////////////////////////////////////////////////////////////////
//JSON-RPC 2.0 request envelope: adds "jsonrpc" and "id" to the object
std::string JSON_encode(const JSON_object&);

//parses a json object, throws JSON_Exception on malformed input
JSON_object JSON_decode(const std::string&);

//parses any json value
std::shared_ptr<JSON_value> JSON_parse(const std::string&);

//serializes any json value, no envelope
std::string JSON_serialize(const JSON_value&);

#endif
