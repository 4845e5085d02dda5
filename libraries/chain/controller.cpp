#include <puzzlevault/chain/controller.hpp>
#include <puzzlevault/chain/apply_context.hpp>
#include <puzzlevault/chain/committed_solution_object.hpp>
#include <puzzlevault/chain/database_utils.hpp>
#include <puzzlevault/chain/puzzle_vault.hpp>
#include <puzzlevault/chain/vault_contract.hpp>
#include <puzzlevault/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <boost/core/demangle.hpp>
#include <boost/preprocessor/cat.hpp>

#include <map>

namespace puzzlevault { namespace chain {

using controller_index_set = index_set<
   committed_solution_multi_index
>;

class maybe_session {
   public:
      maybe_session() = default;

      maybe_session( maybe_session&& other)
      :_session(std::move(other._session))
      {
      }

      explicit maybe_session(chainbase::database& db) {
         _session.emplace( db.start_undo_session(true) );
      }

      maybe_session(const maybe_session&) = delete;

      void push() {
         if (_session)
            _session->push();
      }

   private:
      optional<chainbase::database::session>     _session;
};

struct controller_impl {
   controller&                    self;
   controller::config             conf;
   optional<chainbase::database>  db;
   uint64_t                       next_global_sequence = 1;

   using handler_key = std::pair<account_name, action_name>;
   std::map< handler_key, apply_handler >   apply_handlers;

   controller_impl( const controller::config& cfg, controller& s )
   :self(s),
    conf(cfg)
   {
      PV_ASSERT( conf.state_size > 0, controller_config_exception, "state size must be greater than zero" );
      PV_ASSERT( !conf.vault_account.empty(), controller_config_exception, "vault account name cannot be empty" );

      try {
         db.emplace( conf.state_dir,
                     conf.read_only ? chainbase::database::read_only : chainbase::database::read_write,
                     conf.state_size );
         add_indices();
      } PV_RETHROW_EXCEPTIONS( database_exception, "unable to open state database in ${d}",
                               ("d", conf.state_dir.generic_string()) )

#define SET_APP_HANDLER( action ) \
   set_apply_handler( conf.vault_account, #action, &BOOST_PP_CAT(apply_vault_, action) )

   SET_APP_HANDLER( initialize );
   SET_APP_HANDLER( guess );
   SET_APP_HANDLER( get_solution );

#undef SET_APP_HANDLER

      ilog( "opened ${mode} puzzle vault state for ${a} in ${d}",
            ("mode", conf.read_only ? "read-only" : "writable")("a", conf.vault_account)
            ("d", conf.state_dir.generic_string()) );
      controller_index_set::walk_indices( [this]( auto utils ) {
         using value_t = typename decltype( utils )::index_t::value_type;
         dlog( "index ${i} holds ${n} rows",
               ("i", boost::core::demangle( typeid( value_t ).name() ))("n", utils.size( *db )) );
      });

      const auto* committed = db->find<committed_solution_object>();
      if( committed ) {
         ilog( "committed solution digest ${h}", ("h", committed->solution_hash) );
      } else {
         ilog( "no solution committed yet, waiting for initialize" );
      }
   }

   ~controller_impl() {
      if( db && !conf.read_only ) {
         db->flush();
      }
   }

   void add_indices() {
      controller_index_set::add_indices( *db );
   }

   void set_apply_handler( const account_name& receiver, const action_name& action, apply_handler v ) {
      apply_handlers[ std::make_pair( receiver, action ) ] = v;
   }

   const apply_handler* find_apply_handler( const account_name& receiver, const action_name& action )const {
      auto itr = apply_handlers.find( std::make_pair( receiver, action ) );
      if( itr == apply_handlers.end() )
         return nullptr;
      return &itr->second;
   }

   /**
    *  Observers run after the action has been committed, so an exception from one of them is
    *  logged and never reported as a failure of the action.  Allocation failures still propagate.
    */
   template<typename Signal, typename Arg>
   void emit( const Signal& s, Arg&& a ) {
      try {
         s( std::forward<Arg>( a ));
      } catch (std::bad_alloc& e) {
         wlog( "std::bad_alloc" );
         throw e;
      } catch (boost::interprocess::bad_alloc& e) {
         wlog( "boost::interprocess::bad alloc" );
         throw e;
      } catch ( fc::exception& e ) {
         wlog( "fc::exception: ${details}", ("details", e.to_detail_string()) );
      } catch ( std::exception& e ) {
         wlog( "std::exception: ${details}", ("details", e.what()) );
      }
   }

   action_trace_ptr push_action( const action& act ) {
      auto trace = std::make_shared<action_trace>( next_global_sequence++, act );

      try {
         maybe_session session = conf.read_only ? maybe_session() : maybe_session( *db );

         apply_context context( self, act, *trace );
         context.exec();

         session.push();
         if( !conf.read_only ) {
            db->commit( db->revision() );
         }
      } catch( const std::bad_alloc& ) {
         throw;
      } catch( const boost::interprocess::bad_alloc& ) {
         throw;
      } catch( const fc::exception& e ) {
         trace->except = e;
         trace->except_ptr = std::current_exception();
      } catch( const std::exception& e ) {
         trace->except = fc::std_exception_wrapper::from_current_exception( e );
         trace->except_ptr = std::current_exception();
      }

      if( trace->except ) {
         wlog( "action ${n} on ${a} from ${actor} failed: ${e}",
               ("n", act.name)("a", act.account)("actor", act.actor)("e", trace->except->top_message()) );
      } else {
         dlog( "applied action ${n} on ${a} from ${actor} in ${t}us",
               ("n", act.name)("a", act.account)("actor", act.actor)("t", trace->elapsed.count()) );
      }

      emit( self.applied_action, trace );
      return trace;
   }
};

controller::controller( const controller::config& cfg )
:my( new controller_impl( cfg, *this ) )
{
}

controller::~controller() {
}

action_trace_ptr controller::push_action( const action& act ) {
   return my->push_action( act );
}

chainbase::database& controller::mutable_db() { return *my->db; }

const account_name& controller::vault_account()const {
   return my->conf.vault_account;
}

bool controller::contracts_console()const {
   return my->conf.contracts_console;
}

bool controller::is_read_only()const {
   return my->conf.read_only;
}

optional<digest_type> controller::committed_solution()const {
   const auto* committed = my->db->find<committed_solution_object>();
   if( !committed )
      return {};
   return committed->solution_hash;
}

const apply_handler* controller::find_apply_handler( const account_name& receiver, const action_name& act )const {
   return my->find_apply_handler( receiver, act );
}

} } /// puzzlevault::chain
