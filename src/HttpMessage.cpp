////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cctype>
#include <sstream>
#include <stdexcept>

#include "HttpMessage.h"

using namespace std;

///////////////////////////////////////////////////////////////////////////////
void HttpMessage::setupHeaders()
{
   stringstream ss;
   ss << "Host: " << addr_;
   headers_.push_back(ss.str());

   headers_.push_back("Content-Type: application/json");
   headers_.push_back("Accept: application/json");
   headers_.push_back("Connection: close");
}

///////////////////////////////////////////////////////////////////////////////
void HttpMessage::addHeader(const string& header)
{
   headers_.push_back(header);
}

///////////////////////////////////////////////////////////////////////////////
string HttpMessage::makeHttpPayload(const string& body) const
{
   stringstream ss;
   ss << "POST " << (path_.empty() ? "/" : path_) << " HTTP/1.1\r\n";
   for (auto& header : headers_)
      ss << header << "\r\n";
   ss << "Content-Length: " << body.size() << "\r\n";
   ss << "\r\n";
   ss << body;

   return ss.str();
}

///////////////////////////////////////////////////////////////////////////////
static string toLower(const string& str)
{
   string result;
   result.reserve(str.size());
   for (auto c : str)
      result.push_back((char)tolower(c));
   return result;
}

///////////////////////////////////////////////////////////////////////////////
bool HttpMessage::parseResponse(const string& raw, HttpResponse& result)
{
   auto headerEnd = raw.find("\r\n\r\n");
   if (headerEnd == string::npos)
      return false;

   //status line
   auto lineEnd = raw.find("\r\n");
   auto statusLine = raw.substr(0, lineEnd);
   if (statusLine.compare(0, 5, "HTTP/") != 0)
      throw runtime_error("invalid http status line");

   auto spacePos = statusLine.find(' ');
   if (spacePos == string::npos)
      throw runtime_error("invalid http status line");

   try
   {
      result.status_ = stoi(statusLine.substr(spacePos + 1, 3));
   }
   catch (const logic_error&)
   {
      throw runtime_error("invalid http status code");
   }

   //headers
   size_t contentLength = SIZE_MAX;
   bool chunked = false;

   size_t pos = lineEnd + 2;
   while (pos < headerEnd)
   {
      auto end = raw.find("\r\n", pos);
      auto line = raw.substr(pos, end - pos);
      pos = end + 2;

      auto colon = line.find(':');
      if (colon == string::npos)
         continue;

      auto key = toLower(line.substr(0, colon));
      auto val = line.substr(colon + 1);
      while (!val.empty() && val.front() == ' ')
         val.erase(0, 1);

      if (key == "content-length")
      {
         try
         {
            contentLength = stoul(val);
         }
         catch (const logic_error&)
         {
            throw runtime_error("invalid content-length header");
         }
      }
      else if (key == "transfer-encoding" &&
         toLower(val).find("chunked") != string::npos)
      {
         chunked = true;
      }
   }

   auto bodyStart = headerEnd + 4;
   if (chunked)
   {
      string body;
      size_t chunkPos = bodyStart;
      while (true)
      {
         auto sizeEnd = raw.find("\r\n", chunkPos);
         if (sizeEnd == string::npos)
            return false;

         size_t chunkSize;
         try
         {
            chunkSize = stoul(raw.substr(chunkPos, sizeEnd - chunkPos),
               nullptr, 16);
         }
         catch (const logic_error&)
         {
            throw runtime_error("invalid http chunk size");
         }

         if (chunkSize == 0)
            break;

         auto dataStart = sizeEnd + 2;
         if (raw.size() < dataStart + chunkSize + 2)
            return false;

         body.append(raw, dataStart, chunkSize);
         chunkPos = dataStart + chunkSize + 2;
      }

      result.body_ = move(body);
      return true;
   }

   if (contentLength == SIZE_MAX)
   {
      //no length, body runs until the socket closes
      result.body_ = raw.substr(bodyStart);
      return false;
   }

   if (raw.size() < bodyStart + contentLength)
      return false;

   result.body_ = raw.substr(bodyStart, contentLength);
   return true;
}
