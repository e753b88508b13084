////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2017, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <iomanip>
#include <vector>

#include "log.h"

std::atomic<Log*> Log::theOneLog_ = { nullptr };
std::mutex Log::mu_;

////////////////////////////////////////////////////////////////////////////////
//
// DualStream
//
////////////////////////////////////////////////////////////////////////////////
void DualStream::setLogFile(const std::string& logfile, unsigned long long maxSz)
{
   std::unique_lock<std::mutex> lock(mu_);
   if (fout_.is_open())
      fout_.close();

   fname_ = logfile;
   truncateFile(fname_, maxSz);
   fout_.open(fname_.c_str(), std::ios::app);
   if (fout_.is_open())
      fout_ << "\n\nLog file opened at " << time(0) << ": " << fname_ << "\n";
}

////////////////////////////////////////////////////////////////////////////////
void DualStream::truncateFile(const std::string& logfile, unsigned long long maxSz)
{
   std::ifstream is(logfile.c_str(), std::ios::in | std::ios::binary);
   if (!is.is_open())
      return;

   //get file size
   is.seekg(0, std::ios::end);
   unsigned long long fsize = (size_t)is.tellg();
   is.close();

   if (fsize < maxSz)
      return;

   //keep the tail end of the log
   std::vector<char> lastBytes(maxSz);
   is.open(logfile.c_str(), std::ios::in | std::ios::binary);
   is.seekg(fsize - maxSz);
   is.read(lastBytes.data(), maxSz);
   is.close();

   std::ofstream os(logfile.c_str(), std::ios::out | std::ios::binary);
   os.write(lastBytes.data(), maxSz);
   os.close();
}

////////////////////////////////////////////////////////////////////////////////
void DualStream::newline()
{
   std::unique_lock<std::mutex> lock(mu_);
   if (!noStdout_) std::cout << std::endl;
   if (fout_.is_open()) fout_ << std::endl;
}

////////////////////////////////////////////////////////////////////////////////
void DualStream::flush()
{
   std::unique_lock<std::mutex> lock(mu_);
   std::cout.flush();
   if (fout_.is_open())
      fout_.flush();
}

////////////////////////////////////////////////////////////////////////////////
void DualStream::close()
{
   std::unique_lock<std::mutex> lock(mu_);
   if (fout_.is_open())
   {
      fout_.flush();
      fout_.close();
   }
}

////////////////////////////////////////////////////////////////////////////////
//
// Log
//
////////////////////////////////////////////////////////////////////////////////
Log& Log::GetInstance()
{
   auto logPtr = theOneLog_.load(std::memory_order_acquire);
   if (logPtr != nullptr)
      return *logPtr;

   std::unique_lock<std::mutex> lock(mu_);
   logPtr = theOneLog_.load(std::memory_order_relaxed);
   if (logPtr == nullptr)
   {
      logPtr = new Log();
      theOneLog_.store(logPtr, std::memory_order_release);
   }

   return *logPtr;
}

////////////////////////////////////////////////////////////////////////////////
LogStream& Log::Get(LogLevel level)
{
   auto& theLog = GetInstance();
   if ((int)level > (int)theLog.logLevel_)
      return theLog.ns_;

   return theLog.ds_;
}

////////////////////////////////////////////////////////////////////////////////
void Log::EndLine(LogLevel level)
{
   auto& theLog = GetInstance();
   if ((int)level > (int)theLog.logLevel_)
      return;

   theLog.ds_.newline();
}

////////////////////////////////////////////////////////////////////////////////
void Log::SetLogFile(const std::string& logfile)
{
   GetInstance().ds_.setLogFile(logfile);
}

////////////////////////////////////////////////////////////////////////////////
void Log::SetLogLevel(LogLevel level)
{
   GetInstance().logLevel_ = level;
}

////////////////////////////////////////////////////////////////////////////////
void Log::SuppressStdout(bool b)
{
   GetInstance().ds_.enableStdOut(!b);
}

////////////////////////////////////////////////////////////////////////////////
std::string Log::ToString(LogLevel level)
{
   switch (level)
   {
   case LogLvlDisabled: return "NoLogging";
   case LogLvlError:    return "ERROR";
   case LogLvlWarn:     return "WARN";
   case LogLvlInfo:     return "INFO";
   case LogLvlDebug:    return "DEBUG";
   default:             return "UNKNOWN";
   }
}

////////////////////////////////////////////////////////////////////////////////
bool Log::isOpen()
{
   return GetInstance().ds_.isOpen();
}

////////////////////////////////////////////////////////////////////////////////
std::string Log::filename()
{
   return GetInstance().ds_.filename();
}

////////////////////////////////////////////////////////////////////////////////
void Log::FlushStreams()
{
   GetInstance().ds_.flush();
}

////////////////////////////////////////////////////////////////////////////////
void Log::CleanUp()
{
   std::unique_lock<std::mutex> lock(mu_);
   auto logPtr = theOneLog_.exchange(nullptr, std::memory_order_acq_rel);
   if (logPtr == nullptr)
      return;

   logPtr->ds_.close();
   delete logPtr;
}

////////////////////////////////////////////////////////////////////////////////
//
// LoggingObj
//
////////////////////////////////////////////////////////////////////////////////
LoggingObj::LoggingObj(LogLevel lvl) :
   logLevel_(lvl)
{
   auto now = std::chrono::system_clock::now();
   auto nowTime = std::chrono::system_clock::to_time_t(now);
   auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000;

   std::tm tmStruct;
   localtime_r(&nowTime, &tmStruct);

   std::stringstream ss;
   ss << "-" << std::setw(5) << std::left << Log::ToString(logLevel_) << "- " <<
      std::put_time(&tmStruct, "%Y-%m-%d %H:%M:%S") << "." <<
      std::setw(3) << std::setfill('0') << std::right << ms << ": ";

   Log::Get(logLevel_) << ss.str();
}

////////////////////////////////////////////////////////////////////////////////
LoggingObj::~LoggingObj()
{
   Log::EndLine(logLevel_);
}
