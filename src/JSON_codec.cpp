////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cmath>
#include <cstdlib>
#include <iomanip>

#include "JSON_codec.h"

using namespace std;

atomic<unsigned> JSON_object::idCounter_ = { 1 };

////////////////////////////////////////////////////////////////////////////////
JSON_value::~JSON_value()
{}

////////////////////////////////////////////////////////////////////////////////
static void writeEscapedString(ostream& os, const string& str)
{
   os << '\"';
   for (auto c : str)
   {
      switch (c)
      {
      case '\"': os << "\\\""; break;
      case '\\': os << "\\\\"; break;
      case '\b': os << "\\b"; break;
      case '\f': os << "\\f"; break;
      case '\n': os << "\\n"; break;
      case '\r': os << "\\r"; break;
      case '\t': os << "\\t"; break;
      default:
         if ((uint8_t)c < 0x20)
         {
            os << "\\u" << hex << setw(4) << setfill('0') << (int)c << dec;
         }
         else
         {
            os << c;
         }
      }
   }
   os << '\"';
}

////////////////////////////////////////////////////////////////////////////////
////
//// serialization
////
////////////////////////////////////////////////////////////////////////////////
void JSON_null::serialize(ostream& os) const
{
   os << "null";
}

////////////////////////////////////////////////////////////////////////////////
void JSON_bool::serialize(ostream& os) const
{
   os << (val_ ? "true" : "false");
}

////////////////////////////////////////////////////////////////////////////////
uint64_t JSON_number::getUint64() const
{
   if (isUnsigned_)
      return uval_;

   if (val_ < 0 || floor(val_) != val_)
      throw JSON_Exception("number is not an unsigned integer");

   return (uint64_t)val_;
}

////////////////////////////////////////////////////////////////////////////////
void JSON_number::serialize(ostream& os) const
{
   if (isUnsigned_)
   {
      os << uval_;
      return;
   }

   //integers print without decimals
   if (floor(val_) == val_ && fabs(val_) < 9.0e15)
   {
      os << (int64_t)val_;
      return;
   }

   os << setprecision(17) << val_;
}

////////////////////////////////////////////////////////////////////////////////
void JSON_string::serialize(ostream& os) const
{
   writeEscapedString(os, val_);
}

////////////////////////////////////////////////////////////////////////////////
void JSON_array::serialize(ostream& os) const
{
   os << '[';
   for (size_t i = 0; i < values_.size(); i++)
   {
      if (i > 0)
         os << ',';
      values_[i]->serialize(os);
   }
   os << ']';
}

////////////////////////////////////////////////////////////////////////////////
void JSON_object::serialize(ostream& os) const
{
   os << '{';
   bool first = true;
   for (auto& keyval : keyval_pairs_)
   {
      if (!first)
         os << ',';
      first = false;

      writeEscapedString(os, keyval.first);
      os << ':';
      keyval.second->serialize(os);
   }
   os << '}';
}

////////////////////////////////////////////////////////////////////////////////
////
//// JSON_array
////
////////////////////////////////////////////////////////////////////////////////
void JSON_array::add_value(const string& val)
{
   values_.push_back(make_shared<JSON_string>(val));
}

void JSON_array::add_value(const char* val)
{
   values_.push_back(make_shared<JSON_string>(string(val)));
}

void JSON_array::add_value(double val)
{
   values_.push_back(make_shared<JSON_number>(val));
}

void JSON_array::add_value(uint64_t val)
{
   values_.push_back(make_shared<JSON_number>(val));
}

void JSON_array::add_value(unsigned val)
{
   values_.push_back(make_shared<JSON_number>((uint64_t)val));
}

void JSON_array::add_value(int val)
{
   values_.push_back(make_shared<JSON_number>((double)val));
}

void JSON_array::add_value(bool val)
{
   values_.push_back(make_shared<JSON_bool>(val));
}

void JSON_array::add_value(shared_ptr<JSON_value> val)
{
   if (val == nullptr)
      val = make_shared<JSON_null>();
   values_.push_back(val);
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> JSON_array::operator[](size_t i) const
{
   if (i >= values_.size())
      throw JSON_Exception("array index out of range");
   return values_[i];
}

////////////////////////////////////////////////////////////////////////////////
////
//// JSON_object
////
////////////////////////////////////////////////////////////////////////////////
JSON_object::JSON_object() :
   id_(idCounter_.fetch_add(1, memory_order_relaxed))
{}

void JSON_object::add_pair(const string& key, const string& val)
{
   keyval_pairs_[key] = make_shared<JSON_string>(val);
}

void JSON_object::add_pair(const string& key, const char* val)
{
   keyval_pairs_[key] = make_shared<JSON_string>(string(val));
}

void JSON_object::add_pair(const string& key, double val)
{
   keyval_pairs_[key] = make_shared<JSON_number>(val);
}

void JSON_object::add_pair(const string& key, uint64_t val)
{
   keyval_pairs_[key] = make_shared<JSON_number>(val);
}

void JSON_object::add_pair(const string& key, unsigned val)
{
   keyval_pairs_[key] = make_shared<JSON_number>((uint64_t)val);
}

void JSON_object::add_pair(const string& key, int val)
{
   keyval_pairs_[key] = make_shared<JSON_number>((double)val);
}

void JSON_object::add_pair(const string& key, bool val)
{
   keyval_pairs_[key] = make_shared<JSON_bool>(val);
}

void JSON_object::add_pair(const string& key, shared_ptr<JSON_value> val)
{
   if (val == nullptr)
      val = make_shared<JSON_null>();
   keyval_pairs_[key] = val;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> JSON_object::getValForKey(const string& key) const
{
   auto iter = keyval_pairs_.find(key);
   if (iter == keyval_pairs_.end())
      return nullptr;

   return iter->second;
}

////////////////////////////////////////////////////////////////////////////////
bool JSON_object::isResponseValid(unsigned id) const
{
   auto idPtr = dynamic_pointer_cast<JSON_number>(getValForKey("id"));
   if (idPtr == nullptr || idPtr->getUint64() != id)
      return false;

   auto errorPtr = getValForKey("error");
   if (errorPtr != nullptr && errorPtr->type() != JSON_Type_Null)
      return false;

   return getValForKey("result") != nullptr;
}

////////////////////////////////////////////////////////////////////////////////
////
//// parsing
////
////////////////////////////////////////////////////////////////////////////////
namespace
{
   class JSON_parser
   {
   private:
      const string& str_;
      size_t pos_ = 0;

   private:
      void skipWhitespace(void)
      {
         while (pos_ < str_.size())
         {
            auto c = str_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
               break;
            ++pos_;
         }
      }

      char peek(void)
      {
         skipWhitespace();
         if (pos_ >= str_.size())
            throw JSON_Exception("unexpected end of json");
         return str_[pos_];
      }

      void expect(char c)
      {
         if (peek() != c)
         {
            stringstream ss;
            ss << "expected '" << c << "' at position " << pos_;
            throw JSON_Exception(ss.str());
         }
         ++pos_;
      }

      void expectLiteral(const char* lit)
      {
         string literal(lit);
         if (str_.compare(pos_, literal.size(), literal) != 0)
            throw JSON_Exception("invalid json literal");
         pos_ += literal.size();
      }

      static void appendUtf8(string& out, unsigned cp)
      {
         if (cp < 0x80)
         {
            out.push_back((char)cp);
         }
         else if (cp < 0x800)
         {
            out.push_back((char)(0xC0 | (cp >> 6)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
         }
         else if (cp < 0x10000)
         {
            out.push_back((char)(0xE0 | (cp >> 12)));
            out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
         }
         else
         {
            out.push_back((char)(0xF0 | (cp >> 18)));
            out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back((char)(0x80 | (cp & 0x3F)));
         }
      }

      unsigned parseHex4(void)
      {
         if (pos_ + 4 > str_.size())
            throw JSON_Exception("truncated unicode escape");

         unsigned val = 0;
         for (unsigned i = 0; i < 4; i++)
         {
            auto c = str_[pos_++];
            val <<= 4;
            if (c >= '0' && c <= '9')
               val |= c - '0';
            else if (c >= 'a' && c <= 'f')
               val |= c - 'a' + 10;
            else if (c >= 'A' && c <= 'F')
               val |= c - 'A' + 10;
            else
               throw JSON_Exception("invalid unicode escape");
         }

         return val;
      }

      string parseString(void)
      {
         expect('\"');

         string result;
         while (true)
         {
            if (pos_ >= str_.size())
               throw JSON_Exception("unterminated json string");

            auto c = str_[pos_++];
            if (c == '\"')
               break;

            if (c != '\\')
            {
               result.push_back(c);
               continue;
            }

            if (pos_ >= str_.size())
               throw JSON_Exception("unterminated json string");

            c = str_[pos_++];
            switch (c)
            {
            case '\"': result.push_back('\"'); break;
            case '\\': result.push_back('\\'); break;
            case '/': result.push_back('/'); break;
            case 'b': result.push_back('\b'); break;
            case 'f': result.push_back('\f'); break;
            case 'n': result.push_back('\n'); break;
            case 'r': result.push_back('\r'); break;
            case 't': result.push_back('\t'); break;
            case 'u':
            {
               auto cp = parseHex4();

               //surrogate pair
               if (cp >= 0xD800 && cp <= 0xDBFF &&
                  str_.compare(pos_, 2, "\\u") == 0)
               {
                  pos_ += 2;
                  auto low = parseHex4();
                  cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
               }

               appendUtf8(result, cp);
               break;
            }

            default:
               throw JSON_Exception("invalid escape in json string");
            }
         }

         return result;
      }

      shared_ptr<JSON_value> parseNumber(void)
      {
         auto start = pos_;
         bool isInteger = true;
         bool negative = false;

         if (str_[pos_] == '-')
         {
            negative = true;
            ++pos_;
         }

         while (pos_ < str_.size())
         {
            auto c = str_[pos_];
            if (c >= '0' && c <= '9')
            {
               ++pos_;
               continue;
            }

            if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-')
            {
               isInteger = false;
               ++pos_;
               continue;
            }

            break;
         }

         string numStr = str_.substr(start, pos_ - start);
         if (numStr.empty() || numStr == "-")
            throw JSON_Exception("invalid json number");

         auto result = make_shared<JSON_number>();
         char* endPtr = nullptr;
         result->val_ = strtod(numStr.c_str(), &endPtr);
         if (endPtr != numStr.c_str() + numStr.size())
            throw JSON_Exception("invalid json number");

         if (isInteger && !negative)
         {
            result->uval_ = strtoull(numStr.c_str(), nullptr, 10);
            result->isUnsigned_ = true;
         }

         return result;
      }

      shared_ptr<JSON_array> parseArray(void)
      {
         expect('[');
         auto result = make_shared<JSON_array>();

         if (peek() == ']')
         {
            ++pos_;
            return result;
         }

         while (true)
         {
            result->values_.push_back(parseValue());

            auto c = peek();
            ++pos_;
            if (c == ']')
               break;
            if (c != ',')
               throw JSON_Exception("expected ',' or ']' in json array");
         }

         return result;
      }

   public:
      JSON_parser(const string& str) :
         str_(str)
      {}

      void parseObjectInto(JSON_object& obj)
      {
         expect('{');

         if (peek() == '}')
         {
            ++pos_;
            return;
         }

         while (true)
         {
            peek();
            auto key = parseString();
            expect(':');
            obj.keyval_pairs_[key] = parseValue();

            auto c = peek();
            ++pos_;
            if (c == '}')
               break;
            if (c != ',')
               throw JSON_Exception("expected ',' or '}' in json object");
         }
      }

      shared_ptr<JSON_value> parseValue(void)
      {
         auto c = peek();
         switch (c)
         {
         case '{':
         {
            auto obj = make_shared<JSON_object>();
            parseObjectInto(*obj);
            return obj;
         }

         case '[':
            return parseArray();

         case '\"':
            return make_shared<JSON_string>(parseString());

         case 't':
            expectLiteral("true");
            return make_shared<JSON_bool>(true);

         case 'f':
            expectLiteral("false");
            return make_shared<JSON_bool>(false);

         case 'n':
            expectLiteral("null");
            return make_shared<JSON_null>();

         default:
            if (c == '-' || (c >= '0' && c <= '9'))
               return parseNumber();
         }

         stringstream ss;
         ss << "unexpected character '" << c << "' at position " << pos_;
         throw JSON_Exception(ss.str());
      }

      void checkEnd(void)
      {
         skipWhitespace();
         if (pos_ != str_.size())
            throw JSON_Exception("trailing characters after json value");
      }
   };
};

////////////////////////////////////////////////////////////////////////////////
string JSON_encode(const JSON_object& obj)
{
   JSON_object envelope;
   envelope.keyval_pairs_ = obj.keyval_pairs_;
   envelope.add_pair("jsonrpc", "2.0");
   envelope.add_pair("id", obj.id_);

   stringstream ss;
   envelope.serialize(ss);
   return ss.str();
}

////////////////////////////////////////////////////////////////////////////////
JSON_object JSON_decode(const string& str)
{
   JSON_object obj;
   JSON_parser parser(str);
   parser.parseObjectInto(obj);
   parser.checkEnd();
   return obj;
}

////////////////////////////////////////////////////////////////////////////////
shared_ptr<JSON_value> JSON_parse(const string& str)
{
   JSON_parser parser(str);
   auto result = parser.parseValue();
   parser.checkEnd();
   return result;
}

////////////////////////////////////////////////////////////////////////////////
string JSON_serialize(const JSON_value& val)
{
   stringstream ss;
   val.serialize(ss);
   return ss.str();
}
