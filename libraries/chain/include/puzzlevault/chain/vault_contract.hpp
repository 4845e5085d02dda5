/**
 *  @file
 *  @copyright defined in puzzlevault/LICENSE
 */
#pragma once

namespace puzzlevault { namespace chain {

   class apply_context;

   /**
    * @defgroup native_action_handlers Native Action Handlers
    */
   ///@{
   void apply_vault_initialize(apply_context&);
   void apply_vault_guess(apply_context&);
   void apply_vault_get_solution(apply_context&);
   ///@}  end action handlers

} } /// namespace puzzlevault::chain
