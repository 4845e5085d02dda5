/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <puzzlevault/chain/trace.hpp>

#include <string_view>

namespace puzzlevault { namespace chain {

class controller;

/**
 *  Execution context of a single action.  It binds the action, the trace it fills in and the
 *  state database of the controller for the duration of one handler call.
 */
class apply_context {
   public:
      apply_context( controller& con, const action& a, action_trace& t );

      /// Runs the native handler registered for the action and finalizes the trace
      void exec();

      const action& get_action()const { return act; }

      /// @throws database_read_only_exception when the controller was opened read-only
      void require_write()const;

      void console_append( std::string_view val ) {
         _pending_console_output += val;
      }

      template<typename T>
      void set_return_value( const T& value ) {
         trace.return_value = variant( value );
      }

   public:
      controller&                   control;
      chainbase::database&          db;  ///< database where state is stored
      const action&                 act; ///< message being applied

   private:
      action_trace&                 trace;
      string                        _pending_console_output;
};

} } // namespace puzzlevault::chain
