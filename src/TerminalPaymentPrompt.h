////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2019, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#ifndef _H_TERMINAL_PAYMENT_PROMPT_
#define _H_TERMINAL_PAYMENT_PROMPT_

#include <mutex>
#include <string>

#include "PaymentProviders.h"

#define MAX_PROMPT_ATTEMPTS 3

class TerminalPaymentPrompt
{
private:
   std::mutex mu_;
   const std::string verbose_;

private:
   TerminalPaymentPrompt(const std::string& verbose) :
      verbose_(verbose)
   {
      if (verbose_.size() == 0)
         throw std::runtime_error("empty verbose is not allowed");
   }

   std::string prompt(const std::string& address, uint64_t sats);

public:
   //asks the user to pay from an external wallet
   static PaymentProvider getProvider(const std::string&);
};

#endif
