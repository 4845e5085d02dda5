#pragma once

#include <puzzlevault/chain/types.hpp>

namespace puzzlevault { namespace chain {

struct initialize {
   string                           solution;

   static action_name get_name() {
      return "initialize";
   }
};

struct guess {
   string                           solution;

   static action_name get_name() {
      return "guess";
   }
};

struct get_solution {
   static action_name get_name() {
      return "get_solution";
   }
};

} } /// namespace puzzlevault::chain

FC_REFLECT( puzzlevault::chain::initialize                 , (solution) )
FC_REFLECT( puzzlevault::chain::guess                      , (solution) )
FC_REFLECT( puzzlevault::chain::get_solution              , )
