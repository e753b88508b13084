////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

/***
Stream based logger. Each LOGxxx macro instantiates a LoggingObj temporary
that writes the line prefix on construction and the line terminator on
destruction, so a full statement maps to a single log line:

   LOGINFO << "uploaded " << count << " chunks";

Lines below the configured level are routed to a NullStream.
***/

#ifndef _H_ARCHDEPLOY_LOG_
#define _H_ARCHDEPLOY_LOG_

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <atomic>
#include <ctime>
#include <cstdint>

#define FILEANDLINE "(" << __FILE__ << ":" << __LINE__ << ") "
#define DEFAULT_LOG_MAX_SIZE 1024 * 1024 * 8

#define LOGERR    (LoggingObj(LogLvlError).getLogStream() << FILEANDLINE)
#define LOGWARN   (LoggingObj(LogLvlWarn).getLogStream() << FILEANDLINE)
#define LOGINFO   (LoggingObj(LogLvlInfo).getLogStream() << FILEANDLINE)
#define LOGDEBUG  (LoggingObj(LogLvlDebug).getLogStream() << FILEANDLINE)

#define STARTLOGGING(LOGFILE, LOGLEVEL) \
   Log::SetLogFile(LOGFILE);            \
   Log::SetLogLevel(LOGLEVEL);
#define LOGDISABLESTDOUT()  Log::SuppressStdout(true)
#define LOGENABLESTDOUT()   Log::SuppressStdout(false)
#define SETLOGLEVEL(LOGLVL) Log::SetLogLevel(LOGLVL)
#define FLUSHLOG()          Log::FlushStreams()
#define CLEANUPLOG()        Log::CleanUp()

typedef enum
{
   LogLvlDisabled,
   LogLvlError,
   LogLvlWarn,
   LogLvlInfo,
   LogLvlDebug
} LogLevel;

////////////////////////////////////////////////////////////////////////////////
class LogStream
{
public:
   virtual ~LogStream(void) {}

   virtual LogStream& operator<<(const char* str) = 0;
   virtual LogStream& operator<<(const std::string& str) = 0;
   virtual LogStream& operator<<(int i) = 0;
   virtual LogStream& operator<<(unsigned int i) = 0;
   virtual LogStream& operator<<(long i) = 0;
   virtual LogStream& operator<<(unsigned long i) = 0;
   virtual LogStream& operator<<(long long i) = 0;
   virtual LogStream& operator<<(unsigned long long i) = 0;
   virtual LogStream& operator<<(float f) = 0;
   virtual LogStream& operator<<(double d) = 0;
};

////////////////////////////////////////////////////////////////////////////////
class DualStream : public LogStream
{
private:
   std::ofstream fout_;
   std::string fname_;
   bool noStdout_ = false;
   std::mutex mu_;

private:
   template<typename T> LogStream& write(const T& val)
   {
      std::unique_lock<std::mutex> lock(mu_);
      if (!noStdout_) std::cout << val;
      if (fout_.is_open()) fout_ << val;
      return *this;
   }

public:
   void enableStdOut(bool newbool) { noStdout_ = !newbool; }
   void setLogFile(const std::string& logfile,
      unsigned long long maxSz = DEFAULT_LOG_MAX_SIZE);
   void truncateFile(const std::string& logfile, unsigned long long maxSz);

   const std::string& filename(void) const { return fname_; }
   bool isOpen(void) const { return fout_.is_open(); }

   LogStream& operator<<(const char* str) override { return write(str); }
   LogStream& operator<<(const std::string& str) override { return write(str); }
   LogStream& operator<<(int i) override { return write(i); }
   LogStream& operator<<(unsigned int i) override { return write(i); }
   LogStream& operator<<(long i) override { return write(i); }
   LogStream& operator<<(unsigned long i) override { return write(i); }
   LogStream& operator<<(long long i) override { return write(i); }
   LogStream& operator<<(unsigned long long i) override { return write(i); }
   LogStream& operator<<(float f) override { return write(f); }
   LogStream& operator<<(double d) override { return write(d); }

   void newline(void);
   void flush(void);
   void close(void);
};

////////////////////////////////////////////////////////////////////////////////
class NullStream : public LogStream
{
public:
   LogStream& operator<<(const char*) override { return *this; }
   LogStream& operator<<(const std::string&) override { return *this; }
   LogStream& operator<<(int) override { return *this; }
   LogStream& operator<<(unsigned int) override { return *this; }
   LogStream& operator<<(long) override { return *this; }
   LogStream& operator<<(unsigned long) override { return *this; }
   LogStream& operator<<(long long) override { return *this; }
   LogStream& operator<<(unsigned long long) override { return *this; }
   LogStream& operator<<(float) override { return *this; }
   LogStream& operator<<(double) override { return *this; }
};

////////////////////////////////////////////////////////////////////////////////
class Log
{
private:
   DualStream ds_;
   NullStream ns_;
   LogLevel logLevel_ = LogLvlInfo;

   static std::atomic<Log*> theOneLog_;
   static std::mutex mu_;

private:
   static Log& GetInstance(void);

public:
   static LogStream& Get(LogLevel level = LogLvlInfo);
   static void EndLine(LogLevel level);

   static void SetLogFile(const std::string& logfile);
   static void SetLogLevel(LogLevel level);
   static void SuppressStdout(bool b = true);

   static std::string ToString(LogLevel level);
   static bool isOpen(void);
   static std::string filename(void);

   static void FlushStreams(void);
   static void CleanUp(void);
};

////////////////////////////////////////////////////////////////////////////////
class LoggingObj
{
private:
   const LogLevel logLevel_;

public:
   LoggingObj(LogLevel lvl);
   ~LoggingObj(void);

   LogStream& getLogStream(void) { return Log::Get(logLevel_); }
};

#endif
