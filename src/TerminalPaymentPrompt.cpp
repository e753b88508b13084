////////////////////////////////////////////////////////////////////////////////
//                                                                            //
//  Copyright (C) 2019, goatpig.                                              //
//  Distributed under the MIT license                                         //
//  See LICENSE-MIT or https://opensource.org/licenses/MIT                    //
//                                                                            //
////////////////////////////////////////////////////////////////////////////////

#include <iostream>

#include "TerminalPaymentPrompt.h"

#include <unistd.h>

using namespace std;

////////////////////////////////////////////////////////////////////////////////
string TerminalPaymentPrompt::prompt(const string& address, uint64_t sats)
{
   unique_lock<mutex> lock(mu_);

   cout << endl;
   cout << "The " << verbose_ << " account has to be funded with a btc " <<
      "payment." << endl;
   cout << "Send " << BitcoindPayment::satsToBtcStr(sats) <<
      " BTC (" << sats << " sats) to:" << endl;
   cout << "   " << address << endl << endl;

   for (unsigned i = 0; i < MAX_PROMPT_ATTEMPTS; i++)
   {
      string yn;
      cout << "Type Y once the payment is broadcast, n to abort: ";
      cin >> yn;

      if (!cin.good())
         break;

      if (yn == "n")
         throw runtime_error("payment aborted by user");

      if (yn != "Y")
         continue;

      string txid;
      cout << "Payment txid (optional, - to skip): ";
      cin >> txid;
      cout << endl;

      if (txid == "-")
         txid.clear();
      return txid;
   }

   throw runtime_error("no payment confirmation, aborting");
}

////////////////////////////////////////////////////////////////////////////////
PaymentProvider TerminalPaymentPrompt::getProvider(const string& verbose)
{
   auto ptr = new TerminalPaymentPrompt(verbose);
   shared_ptr<TerminalPaymentPrompt> smartPtr(ptr);

   PaymentProvider provider;
   provider.name_ = "terminal";

   //needs someone at the keyboard
   provider.isAvailable_ = [](void)->bool
   {
      return isatty(STDIN_FILENO) == 1;
   };

   provider.connect_ = [](void)->void {};

   provider.sendPayment_ = [smartPtr](
      const string& address, uint64_t sats)->string
   {
      return smartPtr->prompt(address, sats);
   };

   return provider;
}
