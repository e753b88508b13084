////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2020, goatpig                                               //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_ARCH_ERRORS
#define _H_ARCH_ERRORS

#include <stdexcept>
#include <string>

enum class ArchErrorCodes : int
{
   //common
   ErrorUnknown   = -1,
   Success        = 0,

   //setup
   Config_Invalid       = 10,
   Config_KeyFile       = 11, //missing or malformed keypair file
   Config_ProgramFile   = 12, //missing or empty program binary
   Config_FeePayer      = 13, //misowned or unfunded fee payer

   //local tx building
   Compilation_Failure  = 20,
   Signing_Failure      = 21,

   //rpc error codes
   RPCFailure_Unknown   = 40000,
   RPCFailure_JSON      = 40001, //node response is not JSON
   RPCFailure_Internal  = 40002, //socket or http failure
   RPCFailure_TxFailed  = 40003, //processed tx reports a Failed status
   RPCFailure_Timeout   = 40004, //too many confirmation timeouts

   //deployment
   Deploy_VerifyMismatch = 50001, //on chain bytes differ from the binary
};

////////////////////////////////////////////////////////////////////////////////
class ArchError : public std::runtime_error
{
private:
   const ArchErrorCodes code_;

public:
   ArchError(const std::string& err, ArchErrorCodes code) :
      std::runtime_error(err), code_(code)
   {}

   ArchErrorCodes code(void) const { return code_; }
};

////
class ConfigurationError : public ArchError
{
public:
   ConfigurationError(const std::string& err,
      ArchErrorCodes code = ArchErrorCodes::Config_Invalid) :
      ArchError(err, code)
   {}
};

////
class CompilationError : public ArchError
{
public:
   CompilationError(const std::string& err) :
      ArchError(err, ArchErrorCodes::Compilation_Failure)
   {}
};

////
class SigningError : public ArchError
{
public:
   SigningError(const std::string& err) :
      ArchError(err, ArchErrorCodes::Signing_Failure)
   {}
};

////
class VerificationError : public ArchError
{
public:
   VerificationError(const std::string& err) :
      ArchError(err, ArchErrorCodes::Deploy_VerifyMismatch)
   {}
};

#endif
