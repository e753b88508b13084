////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_HTTP_MESSAGE_
#define _H_HTTP_MESSAGE_

#include <stdint.h>
#include <cstdint>
#include <vector>
#include <string>

///////////////////////////////////////////////////////////////////////////////
struct HttpResponse
{
   int status_ = 0;
   std::string body_;

   bool isSuccess(void) const { return status_ >= 200 && status_ < 300; }
};

///////////////////////////////////////////////////////////////////////////////
class HttpMessage
{
private:
   std::vector<std::string> headers_;
   const std::string addr_;
   const std::string path_;

public:
   HttpMessage(const std::string& addr, const std::string& path,
      bool initHeaders = true) :
      addr_(addr), path_(path)
   {
      if(initHeaders)
         setupHeaders();
   }

   void setupHeaders(void);
   void addHeader(const std::string&);

   //full POST request: request line, headers, blank line, body
   std::string makeHttpPayload(const std::string& body) const;

   //returns true once the raw buffer holds a complete response.
   //Throws runtime_error on malformed headers or chunk framing.
   static bool parseResponse(const std::string& raw, HttpResponse& result);
};

#endif
