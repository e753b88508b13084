////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <cerrno>
#include <cstring>
#include <sstream>

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "SocketObject.h"
#include "log.h"

using namespace std;

////////////////////////////////////////////////////////////////////////////////
////
//// HttpUrl
////
////////////////////////////////////////////////////////////////////////////////
HttpUrl HttpUrl::parse(const string& url)
{
   HttpUrl result;

   string rest;
   if (url.compare(0, 7, "http://") == 0)
      rest = url.substr(7);
   else if (url.compare(0, 8, "https://") == 0)
      throw SocketError("https is not supported: " + url);
   else if (url.find("://") != string::npos)
      throw SocketError("unsupported url scheme: " + url);
   else
      rest = url;

   auto slashPos = rest.find('/');
   string hostPort;
   if (slashPos == string::npos)
   {
      hostPort = rest;
      result.path_ = "/";
   }
   else
   {
      hostPort = rest.substr(0, slashPos);
      result.path_ = rest.substr(slashPos);
   }

   auto colonPos = hostPort.rfind(':');
   if (colonPos == string::npos)
   {
      result.host_ = hostPort;
      result.port_ = "80";
   }
   else
   {
      result.host_ = hostPort.substr(0, colonPos);
      result.port_ = hostPort.substr(colonPos + 1);
   }

   if (result.host_.empty() || result.port_.empty())
      throw SocketError("invalid url: " + url);

   return result;
}

////////////////////////////////////////////////////////////////////////////////
////
//// SimpleSocket
////
////////////////////////////////////////////////////////////////////////////////
SimpleSocket::SimpleSocket(const string& addr, const string& port) :
   addr_(addr), port_(port)
{}

////////////////////////////////////////////////////////////////////////////////
SimpleSocket::~SimpleSocket()
{
   closeSocket();
}

////////////////////////////////////////////////////////////////////////////////
bool SimpleSocket::connectToRemote()
{
   if (sockfd_ != -1)
      return true;

   struct addrinfo hints;
   memset(&hints, 0, sizeof(hints));
   hints.ai_family = AF_UNSPEC;
   hints.ai_socktype = SOCK_STREAM;
   hints.ai_protocol = IPPROTO_TCP;

   struct addrinfo* result = nullptr;
   auto status = getaddrinfo(addr_.c_str(), port_.c_str(), &hints, &result);
   if (status != 0 || result == nullptr)
   {
      LOGWARN << "failed to resolve " << addr_ << ":" << port_ <<
         ", " << gai_strerror(status);
      return false;
   }

   for (auto ptr = result; ptr != nullptr; ptr = ptr->ai_next)
   {
      auto sockfd = socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
      if (sockfd == -1)
         continue;

      if (connect(sockfd, ptr->ai_addr, ptr->ai_addrlen) == 0)
      {
         sockfd_ = sockfd;
         break;
      }

      close(sockfd);
   }

   freeaddrinfo(result);
   return sockfd_ != -1;
}

////////////////////////////////////////////////////////////////////////////////
bool SimpleSocket::testConnection()
{
   auto result = connectToRemote();
   closeSocket();
   return result;
}

////////////////////////////////////////////////////////////////////////////////
void SimpleSocket::closeSocket()
{
   if (sockfd_ == -1)
      return;

   close(sockfd_);
   sockfd_ = -1;
}

////////////////////////////////////////////////////////////////////////////////
void SimpleSocket::writeToSocket(const string& data)
{
   size_t total = 0;
   while (total < data.size())
   {
      auto sent = send(sockfd_, data.c_str() + total,
         data.size() - total, MSG_NOSIGNAL);

      if (sent < 0)
      {
         if (errno == EINTR)
            continue;

         stringstream ss;
         ss << "socket write failed: " << strerror(errno);
         throw SocketError(ss.str());
      }

      total += sent;
   }
}

////////////////////////////////////////////////////////////////////////////////
////
//// HttpSocket
////
////////////////////////////////////////////////////////////////////////////////
HttpSocket::HttpSocket(const string& addr, const string& port,
   const string& path) :
   SimpleSocket(addr, port), path_(path)
{}

////////////////////////////////////////////////////////////////////////////////
HttpSocket::HttpSocket(const HttpUrl& url) :
   SimpleSocket(url.host_, url.port_), path_(url.path_)
{}

////////////////////////////////////////////////////////////////////////////////
void HttpSocket::precacheHttpHeader(const string& header)
{
   precachedHeaders_.push_back(header);
}

////////////////////////////////////////////////////////////////////////////////
HttpResponse HttpSocket::post(const string& body)
{
   if (!connectToRemote())
   {
      stringstream ss;
      ss << "failed to connect to " << addr_ << ":" << port_;
      throw SocketError(ss.str());
   }

   stringstream hostSS;
   hostSS << addr_ << ":" << port_;
   HttpMessage msg(hostSS.str(), path_);
   for (auto& header : precachedHeaders_)
      msg.addHeader(header);

   try
   {
      writeToSocket(msg.makeHttpPayload(body));

      //read until the response is complete or the remote closes
      string raw;
      HttpResponse response;
      char buffer[8192];

      while (true)
      {
         struct pollfd pfd;
         pfd.fd = sockfd_;
         pfd.events = POLLIN;
         pfd.revents = 0;

         auto status = poll(&pfd, 1, timeoutSec_ * 1000);
         if (status == 0)
            throw SocketError("http read timed out");
         if (status < 0)
         {
            if (errno == EINTR)
               continue;
            throw SocketError(string("poll failed: ") + strerror(errno));
         }

         auto readAmt = recv(sockfd_, buffer, sizeof(buffer), 0);
         if (readAmt < 0)
         {
            if (errno == EINTR)
               continue;
            throw SocketError(string("socket read failed: ") + strerror(errno));
         }

         if (readAmt == 0)
         {
            //remote closed, whatever we have has to be a full response
            if (!HttpMessage::parseResponse(raw, response) &&
               raw.find("\r\n\r\n") == string::npos)
               throw SocketError("connection closed before http response");
            break;
         }

         raw.append(buffer, readAmt);
         if (HttpMessage::parseResponse(raw, response))
            break;
      }

      closeSocket();
      return response;
   }
   catch (const runtime_error&)
   {
      closeSocket();
      throw;
   }
}
