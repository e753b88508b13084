////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2016, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_SOCKETOBJ_
#define _H_SOCKETOBJ_

#include <string>
#include <vector>
#include <stdexcept>

#include "HttpMessage.h"

typedef int SOCKET;

////////////////////////////////////////////////////////////////////////////////
class SocketError : public std::runtime_error
{
public:
   SocketError(const std::string& e) : std::runtime_error(e)
   {}
};

////////////////////////////////////////////////////////////////////////////////
struct HttpUrl
{
   std::string host_;
   std::string port_;
   std::string path_;

   //http://host[:port][/path], https is rejected
   static HttpUrl parse(const std::string&);
};

////////////////////////////////////////////////////////////////////////////////
class SimpleSocket
{
protected:
   const std::string addr_;
   const std::string port_;
   SOCKET sockfd_ = -1;
   unsigned timeoutSec_ = 60;

protected:
   void writeToSocket(const std::string&);

public:
   SimpleSocket(const std::string& addr, const std::string& port);
   virtual ~SimpleSocket(void);

   SimpleSocket(const SimpleSocket&) = delete;
   SimpleSocket& operator=(const SimpleSocket&) = delete;

   bool connectToRemote(void);
   bool testConnection(void);
   void closeSocket(void);
   bool isOpen(void) const { return sockfd_ != -1; }
};

////////////////////////////////////////////////////////////////////////////////
// Blocking http POST client, one request per connection
class HttpSocket : public SimpleSocket
{
private:
   const std::string path_;
   std::vector<std::string> precachedHeaders_;

public:
   HttpSocket(const std::string& addr, const std::string& port,
      const std::string& path = "/");
   HttpSocket(const HttpUrl&);

   void precacheHttpHeader(const std::string&);

   //connects if needed, posts the body, reads the full response and
   //closes the connection. Throws SocketError on transport failures.
   HttpResponse post(const std::string& body);
};

#endif
