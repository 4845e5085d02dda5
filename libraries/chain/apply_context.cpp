#include <puzzlevault/chain/apply_context.hpp>
#include <puzzlevault/chain/controller.hpp>
#include <puzzlevault/chain/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/scoped_exit.hpp>

namespace puzzlevault { namespace chain {

static inline void print_debug( const action_trace& ar ) {
   if( !ar.console.empty() ) {
      auto prefix = fc::format_string(
                                      "\n[(${a},${n})<-${r}]",
                                      fc::mutable_variant_object()
                                         ("a", ar.act.account)
                                         ("n", ar.act.name)
                                         ("r", ar.act.actor));
      dlog( prefix + ": CONSOLE OUTPUT BEGIN =====================\n"
            + ar.console
            + prefix + ": CONSOLE OUTPUT END   =====================" );
   }
}

apply_context::apply_context( controller& con, const action& a, action_trace& t )
:control(con)
,db(con.mutable_db())
,act(a)
,trace(t)
{
}

void apply_context::exec() {
   auto start = fc::time_point::now();
   {
      auto finalize = fc::make_scoped_exit( [&]() {
         trace.console = std::move( _pending_console_output );
         trace.elapsed = fc::time_point::now() - start;
      });

      const auto* native = control.find_apply_handler( act.account, act.name );
      PV_ASSERT( native != nullptr, unknown_action_exception,
                 "account ${a} has no handler for action ${n}", ("a", act.account)("n", act.name) );
      (*native)( *this );
   }

   if( control.contracts_console() ) {
      print_debug( trace );
   }
}

void apply_context::require_write()const {
   PV_ASSERT( !control.is_read_only(), database_read_only_exception,
              "action ${n} modifies state and the database was opened read-only", ("n", act.name) );
}

} } /// puzzlevault::chain
