/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once
#include <puzzlevault/chain/trace.hpp>
#include <puzzlevault/chain/config.hpp>

#include <boost/signals2/signal.hpp>

#include <functional>

namespace puzzlevault { namespace chain {

   class apply_context;
   class puzzle_vault;

   using apply_handler = std::function<void(apply_context&)>;
   using boost::signals2::signal;

   class controller_impl;

   /**
    *  @class controller
    *  @brief Hosts one deployed puzzle vault
    *
    *  The controller owns the state database, dispatches actions to the native handlers of the
    *  vault contract and applies each action atomically: an action either completes and its
    *  writes are committed, or it fails and every write it made is undone.
    *
    *  Actions are applied one at a time on the calling thread.
    */
   class controller {
      public:

         struct config {
            path                     state_dir              =  chain::config::default_state_dir_name;
            uint64_t                 state_size             =  chain::config::default_state_size;
            bool                     read_only              =  false;
            bool                     contracts_console      =  false;
            account_name             vault_account          =  chain::config::default_vault_account_name;
         };

         explicit controller( const config& cfg );
         ~controller();

         /**
          *  Applies an action.  Failures do not throw; they are reported through the
          *  `except` member of the returned trace.
          */
         action_trace_ptr push_action( const action& act );

         chainbase::database& mutable_db();

         const account_name&  vault_account()const;
         bool                 contracts_console()const;
         bool                 is_read_only()const;

         /// @return the committed digest, or an empty optional while the vault is uninitialized
         optional<digest_type> committed_solution()const;

         const apply_handler* find_apply_handler( const account_name& receiver, const action_name& act )const;

         signal<void(const action_trace_ptr&)>  applied_action;

      private:
         friend class controller_impl;
         std::unique_ptr<controller_impl> my;
   };

} }  /// puzzlevault::chain

FC_REFLECT( puzzlevault::chain::controller::config,
            (state_dir)(state_size)(read_only)(contracts_console)(vault_account) )
