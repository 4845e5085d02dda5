/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once

#include <puzzlevault/chain/action.hpp>

#include <exception>

namespace puzzlevault { namespace chain {

   struct action_trace {
      action_trace( uint64_t global_sequence, const action& act )
      :global_sequence(global_sequence), act(act)
      {}
      action_trace(){}

      uint64_t                        global_sequence = 0;
      action                          act;
      fc::microseconds                elapsed;
      string                          console;
      optional<variant>               return_value;
      optional<fc::exception>         except;
      std::exception_ptr              except_ptr;
   };

   using action_trace_ptr = std::shared_ptr<action_trace>;

} }  /// namespace puzzlevault::chain

FC_REFLECT( puzzlevault::chain::action_trace,
            (global_sequence)(act)(elapsed)(console)(return_value)(except) )
